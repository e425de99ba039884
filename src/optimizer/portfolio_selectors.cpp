/**
 * @file portfolio_selectors.cpp
 * @brief Implementation of population selectors
 */

#include "optimizer/portfolio_selectors.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <string>

namespace explorer
{
    namespace optimizer
    {

        namespace
        {
            void require_non_empty(const FrontierPopulation &population, const char *selector)
            {
                if (population.empty())
                {
                    throw EmptyPopulationError(std::string(selector) +
                                               ": population contains no portfolios");
                }
            }
        } // namespace

        size_t max_sharpe_index(const FrontierPopulation &population)
        {
            require_non_empty(population, "max_sharpe");

            size_t best = 0;
            for (size_t i = 1; i < population.size(); ++i)
            {
                // Strict comparison keeps the first occurrence
                if (population[i].sharpe_ratio > population[best].sharpe_ratio)
                {
                    best = i;
                }
            }
            return best;
        }

        size_t min_risk_index(const FrontierPopulation &population)
        {
            require_non_empty(population, "min_risk");

            size_t best = 0;
            for (size_t i = 1; i < population.size(); ++i)
            {
                if (population[i].risk < population[best].risk)
                {
                    best = i;
                }
            }
            return best;
        }

        const PortfolioPoint &max_sharpe(const FrontierPopulation &population)
        {
            return population[max_sharpe_index(population)];
        }

        const PortfolioPoint &min_risk(const FrontierPopulation &population)
        {
            return population[min_risk_index(population)];
        }

        std::vector<size_t> near_min_risk_edge_indices(const FrontierPopulation &population,
                                                       double threshold)
        {
            require_non_empty(population, "near_min_risk_edge");

            if (!std::isfinite(threshold) || threshold < 0.0)
            {
                throw std::invalid_argument("Edge threshold must be a non-negative number, got: " +
                                            std::to_string(threshold));
            }

            const double floor_risk = population[min_risk_index(population)].risk;

            std::vector<size_t> indices;
            for (size_t i = 0; i < population.size(); ++i)
            {
                if (population[i].risk - floor_risk <= threshold)
                {
                    indices.push_back(i);
                }
            }
            return indices;
        }

        std::vector<PortfolioPoint> near_min_risk_edge(const FrontierPopulation &population,
                                                       double threshold)
        {
            std::vector<PortfolioPoint> edge;
            for (size_t index : near_min_risk_edge_indices(population, threshold))
            {
                edge.push_back(population[index]);
            }
            return edge;
        }

    } // namespace optimizer
} // namespace explorer

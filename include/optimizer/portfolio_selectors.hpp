/**
 * @file portfolio_selectors.hpp
 * @brief Pick notable portfolios out of a sampled population
 *
 * All selectors scan the population in generation order and break ties
 * toward the lowest index. Each raises EmptyPopulationError when the
 * population has no points.
 */

#pragma once

#include "optimizer/efficient_frontier.hpp"
#include <vector>

namespace explorer
{
    namespace optimizer
    {

        /// Default risk band for near_min_risk_edge
        constexpr double DEFAULT_EDGE_THRESHOLD = 0.001;

        /**
         * @brief Index of the highest Sharpe ratio (first occurrence on ties)
         * @throws EmptyPopulationError
         */
        size_t max_sharpe_index(const FrontierPopulation &population);

        /**
         * @brief Index of the lowest risk (first occurrence on ties)
         * @throws EmptyPopulationError
         */
        size_t min_risk_index(const FrontierPopulation &population);

        const PortfolioPoint &max_sharpe(const FrontierPopulation &population);

        const PortfolioPoint &min_risk(const FrontierPopulation &population);

        /**
         * @brief Indices of every point whose risk is within threshold of the minimum
         *
         * Approximates the left edge of the sampled cloud. This is not a Pareto
         * frontier: high-risk efficient points are never included and dominated
         * points inside the band are.
         *
         * @throws EmptyPopulationError
         * @throws std::invalid_argument if threshold is negative or not finite
         */
        std::vector<size_t> near_min_risk_edge_indices(const FrontierPopulation &population,
                                                       double threshold = DEFAULT_EDGE_THRESHOLD);

        /**
         * @brief Points selected by near_min_risk_edge_indices, in generation order
         */
        std::vector<PortfolioPoint> near_min_risk_edge(const FrontierPopulation &population,
                                                       double threshold = DEFAULT_EDGE_THRESHOLD);

    } // namespace optimizer
} // namespace explorer

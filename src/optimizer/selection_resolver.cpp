/**
 * @file selection_resolver.cpp
 * @brief Implementation of SelectionResolver
 */

#include "optimizer/selection_resolver.hpp"
#include "optimizer/portfolio_selectors.hpp"
#include "core/errors.hpp"
#include <stdexcept>

namespace explorer
{
    namespace optimizer
    {

        std::string to_string(SelectionTarget target)
        {
            switch (target)
            {
            case SelectionTarget::FRONTIER_POINT:
                return "frontier_point";
            case SelectionTarget::MAX_SHARPE:
                return "max_sharpe";
            case SelectionTarget::MIN_RISK:
                return "min_risk";
            }
            return "unknown";
        }

        Selection parse_selection(const std::string &text)
        {
            if (text == "max_sharpe")
            {
                return Selection::best_sharpe();
            }
            if (text == "min_risk")
            {
                return Selection::lowest_risk();
            }

            size_t consumed = 0;
            long long index = 0;
            try
            {
                index = std::stoll(text, &consumed);
            }
            catch (const std::invalid_argument &)
            {
                consumed = 0;
            }
            catch (const std::out_of_range &)
            {
                consumed = 0;
            }

            if (consumed == 0 || consumed != text.size())
            {
                throw std::invalid_argument("Invalid selection '" + text +
                                            "' (expected max_sharpe, min_risk or a portfolio index)");
            }
            return Selection::point(static_cast<std::int64_t>(index));
        }

        const PortfolioPoint &SelectionResolver::resolve(const FrontierPopulation &population,
                                                         std::int64_t index)
        {
            if (index < 0 || static_cast<std::uint64_t>(index) >= population.size())
            {
                throw IndexOutOfRangeError("Selected index " + std::to_string(index) +
                                           " is outside the population [0, " +
                                           std::to_string(population.size()) + ")");
            }
            return population[static_cast<size_t>(index)];
        }

        ResolvedSelection SelectionResolver::resolve(const FrontierPopulation &population,
                                                     const Selection &selection)
        {
            switch (selection.target)
            {
            case SelectionTarget::MAX_SHARPE:
            {
                size_t i = max_sharpe_index(population);
                return {i, population[i], "Max Sharpe Ratio"};
            }
            case SelectionTarget::MIN_RISK:
            {
                size_t i = min_risk_index(population);
                return {i, population[i], "Min Volatility"};
            }
            case SelectionTarget::FRONTIER_POINT:
                break;
            }

            const PortfolioPoint &point = resolve(population, selection.index);
            return {static_cast<size_t>(selection.index), point,
                    "Portfolio #" + std::to_string(selection.index)};
        }

    } // namespace optimizer
} // namespace explorer

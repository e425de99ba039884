/**
 * @file selection_resolver.hpp
 * @brief Map a user selection on the frontier chart to a portfolio
 *
 * The chart shows three clickable series: the sampled cloud, the
 * max-Sharpe marker and the min-risk marker. A click arrives as a
 * Selection and resolves to a reference into the population, so the
 * same index always yields the same object.
 */

#pragma once

#include "optimizer/efficient_frontier.hpp"
#include <cstdint>
#include <string>

namespace explorer
{
    namespace optimizer
    {

        enum class SelectionTarget
        {
            FRONTIER_POINT, ///< A point of the sampled cloud, addressed by index
            MAX_SHARPE,     ///< The max-Sharpe marker
            MIN_RISK        ///< The min-risk marker
        };

        std::string to_string(SelectionTarget target);

        struct Selection
        {
            SelectionTarget target = SelectionTarget::FRONTIER_POINT;
            std::int64_t index = 0; ///< Only read for FRONTIER_POINT

            static Selection point(std::int64_t index) { return {SelectionTarget::FRONTIER_POINT, index}; }
            static Selection best_sharpe() { return {SelectionTarget::MAX_SHARPE, 0}; }
            static Selection lowest_risk() { return {SelectionTarget::MIN_RISK, 0}; }
        };

        /**
         * @brief Parse "max_sharpe", "min_risk" or a point index
         * @throws std::invalid_argument for anything else
         */
        Selection parse_selection(const std::string &text);

        struct ResolvedSelection
        {
            size_t index;
            const PortfolioPoint &point;
            std::string label;
        };

        class SelectionResolver
        {
        public:
            /**
             * @brief Look up a point by its generation index
             * @throws IndexOutOfRangeError if index is negative or >= size
             */
            static const PortfolioPoint &resolve(const FrontierPopulation &population,
                                                 std::int64_t index);

            /**
             * @brief Resolve a chart selection
             * @throws IndexOutOfRangeError for a bad point index
             * @throws EmptyPopulationError for a marker on an empty population
             */
            static ResolvedSelection resolve(const FrontierPopulation &population,
                                             const Selection &selection);
        };

    } // namespace optimizer
} // namespace explorer

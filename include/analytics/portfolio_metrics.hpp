/**
 * @file portfolio_metrics.hpp
 * @brief Return, risk and Sharpe ratio for a caller-supplied allocation.
 *
 * Two return conventions are available and they are NOT interchangeable:
 *
 *   CAGR           per asset (final / initial)^(1 / years) - 1 with
 *                  years = rows / 252, weighted by the allocation. This is
 *                  what the "current portfolio" figures report.
 *   MEAN_PERIODIC  mean simple periodic return * 252, the quantity the
 *                  frontier sampler uses for every sampled point.
 *
 * Risk is always sqrt(w' Sigma w) with the annualized sample covariance.
 */

#ifndef EXPLORER_ANALYTICS_PORTFOLIO_METRICS_HPP
#define EXPLORER_ANALYTICS_PORTFOLIO_METRICS_HPP

#include "core/constants.hpp"
#include "data/price_table.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "risk/statistics_builder.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace explorer
{
    namespace analytics
    {

        enum class ReturnConvention
        {
            CAGR,         ///< Compound annual growth of each asset, weighted
            MEAN_PERIODIC ///< Annualized arithmetic mean of periodic returns
        };

        std::string to_string(ReturnConvention convention);

        /**
         * @class PortfolioMetricsCalculator
         * @brief Evaluates one allocation against a price table.
         *
         * Usage Example:
         * @code
         * PortfolioMetricsCalculator calc;
         * Eigen::VectorXd w(2);
         * w << 0.6, 0.4;
         * optimizer::PortfolioPoint p = calc.metrics(table, w, 0.03);
         * @endcode
         */
        class PortfolioMetricsCalculator
        {
        public:
            /**
             * @brief Compute return, risk and Sharpe ratio.
             * @param table Complete price table
             * @param weights One weight per column; re-normalized by their sum
             * @param risk_free_rate Annual risk-free rate
             * @param convention Return convention (CAGR unless told otherwise)
             * @throws InvalidWeightsError for a wrong length, a negative or
             *         non-finite entry, or a non-positive sum
             * @throws InsufficientDataError if an asset starts at price zero
             *         or the table is too short
             * @throws DegenerateRiskError if the portfolio risk is zero
             */
            optimizer::PortfolioPoint metrics(
                const PriceTable &table,
                const Eigen::VectorXd &weights,
                double risk_free_rate = DEFAULT_RISK_FREE_RATE,
                ReturnConvention convention = ReturnConvention::CAGR) const;

            /**
             * @brief Per-asset CAGR with years = rows / 252
             * @throws InsufficientDataError on an empty table or zero initial price
             */
            Eigen::VectorXd asset_cagr(const PriceTable &table) const;

            /**
             * @brief Divide weights by their sum
             * @throws InvalidWeightsError for a negative or non-finite entry or sum <= 0
             */
            static Eigen::VectorXd normalize_weights(const Eigen::VectorXd &weights);

        private:
            risk::StatisticsBuilder builder_;
        };

        /**
         * @brief Build the active weight vector for the table's surviving columns.
         *
         * Allocations for symbols not in @p tickers are ignored and tickers with
         * no allocation get zero. If any value exceeds 1 the allocations are read
         * as percentages and divided by 100 before normalizing.
         *
         * @throws InvalidWeightsError for a negative or non-finite allocation or
         *         if nothing is allocated to the surviving tickers
         */
        Eigen::VectorXd align_allocations(const std::vector<std::string> &tickers,
                                          const std::map<std::string, double> &allocations);

    } // namespace analytics
} // namespace explorer

#endif // EXPLORER_ANALYTICS_PORTFOLIO_METRICS_HPP

/**
 * @file statistics_builder.hpp
 * @brief Annualized return/risk statistics from a price table
 *
 * Converts a PriceTable into simple periodic returns, the annualized mean
 * return vector and the annualized covariance matrix that every frontier
 * computation consumes.
 *
 * Annualization (daily data, 252 trading days):
 *     mu    = mean(r) * 252
 *     Sigma = cov(r)  * 252   (unbiased, divide by N-1)
 */

#pragma once

#include "core/constants.hpp"
#include "data/price_table.hpp"
#include "risk/moment_estimator.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace explorer
{
    namespace risk
    {

        /**
         * @struct StatisticsBundle
         * @brief Annualized mean returns and covariance for a set of assets
         *
         * Produced once per PriceTable and never mutated; rebuild it when the
         * table changes.
         */
        struct StatisticsBundle
        {
            std::vector<std::string> tickers; ///< Asset order of every vector/matrix
            Eigen::VectorXd mean_returns;     ///< Annualized mean periodic returns
            Eigen::MatrixXd covariance;       ///< Annualized covariance (symmetric PSD)
            size_t num_observations = 0;      ///< Return rows used for estimation

            size_t num_assets() const { return tickers.size(); }

            /**
             * @brief Expected return w . mu
             * @throws std::invalid_argument on dimension mismatch
             */
            double expected_return(const Eigen::VectorXd &weights) const;

            /**
             * @brief Portfolio standard deviation sqrt(w' Sigma w)
             * @throws std::invalid_argument on dimension mismatch
             */
            double portfolio_risk(const Eigen::VectorXd &weights) const;

            void print_summary() const;
        };

        /**
         * @class StatisticsBuilder
         * @brief Pure function object: PriceTable -> StatisticsBundle
         *
         * Usage Example:
         * @code
         * StatisticsBuilder builder;
         * StatisticsBundle stats = builder.build(table);
         * double vol = std::sqrt(stats.covariance(0, 0));
         * @endcode
         */
        class StatisticsBuilder
        {
        public:
            /**
             * @param periods_per_year Annualization factor (default 252)
             * @param estimator Moment estimator; null selects unbiased SampleMoments
             * @throws std::invalid_argument if periods_per_year <= 0
             */
            explicit StatisticsBuilder(int periods_per_year = TRADING_DAYS_PER_YEAR,
                                       std::shared_ptr<const MomentEstimator> estimator = nullptr);

            /**
             * @brief Build annualized statistics
             * @param table Price table with >= 1 asset and >= 3 rows
             * @throws InsufficientDataError if the table has no assets or fewer
             *         than 2 return rows survive differencing
             */
            StatisticsBundle build(const PriceTable &table) const;

            /**
             * @brief Simple periodic returns with incomplete rows dropped
             * @throws InsufficientDataError if the table has fewer than 2 rows
             */
            Eigen::MatrixXd periodic_returns(const PriceTable &table) const;

            int get_periods_per_year() const { return periods_per_year_; }

            const MomentEstimator &get_estimator() const { return *estimator_; }

        private:
            int periods_per_year_;
            std::shared_ptr<const MomentEstimator> estimator_;
        };

    } // namespace risk
} // namespace explorer

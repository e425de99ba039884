/**
 * @file moment_estimator.hpp
 * @brief First and second moments of periodic returns
 *
 * StatisticsBuilder hands the cleaned return matrix to a MomentEstimator and
 * annualizes whatever comes back. Estimators work per period and know nothing
 * about trading calendars.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace explorer
{
    namespace risk
    {

        /**
         * @struct ReturnMoments
         * @brief Mean vector and covariance matrix of one return sample
         */
        struct ReturnMoments
        {
            Eigen::VectorXd mean;       ///< Column means (N)
            Eigen::MatrixXd covariance; ///< Symmetric (N x N)
            Eigen::Index observations = 0;

            /**
             * @brief Scale both moments by a number of periods per year
             * @throws std::invalid_argument if periods_per_year <= 0
             */
            ReturnMoments scaled(double periods_per_year) const;

            /// Per-asset standard deviations, sqrt of the diagonal
            Eigen::VectorXd volatilities() const;
        };

        /**
         * @class MomentEstimator
         * @brief Abstract estimator of return moments
         *
         * Usage Example:
         * @code
         * std::shared_ptr<const MomentEstimator> est = std::make_shared<SampleMoments>();
         * ReturnMoments m = est->estimate(returns);
         * double var0 = m.covariance(0, 0);
         * @endcode
         */
        class MomentEstimator
        {
        public:
            virtual ~MomentEstimator() = default;

            /**
             * @brief Estimate moments from a return matrix
             * @param returns T x N, rows are periods, columns are assets
             * @throws std::invalid_argument on an empty or non-finite matrix
             * @throws InsufficientDataError if there are too few rows
             */
            virtual ReturnMoments estimate(const Eigen::MatrixXd &returns) const = 0;

            virtual std::string get_name() const = 0;

        protected:
            static void check_returns(const Eigen::MatrixXd &returns, Eigen::Index min_rows);
        };

    } // namespace risk
} // namespace explorer

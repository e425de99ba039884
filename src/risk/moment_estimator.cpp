/**
 * @file moment_estimator.cpp
 * @brief ReturnMoments helpers and shared input checks
 */

#include "risk/moment_estimator.hpp"
#include "core/errors.hpp"
#include <stdexcept>

namespace explorer
{
    namespace risk
    {

        ReturnMoments ReturnMoments::scaled(double periods_per_year) const
        {
            if (!(periods_per_year > 0.0))
            {
                throw std::invalid_argument("periods_per_year must be positive");
            }

            ReturnMoments out;
            out.mean = mean * periods_per_year;
            out.covariance = covariance * periods_per_year;
            out.observations = observations;
            return out;
        }

        Eigen::VectorXd ReturnMoments::volatilities() const
        {
            return covariance.diagonal().cwiseMax(0.0).cwiseSqrt();
        }

        void MomentEstimator::check_returns(const Eigen::MatrixXd &returns, Eigen::Index min_rows)
        {
            if (returns.cols() == 0)
            {
                throw std::invalid_argument("Return matrix has no assets");
            }
            if (returns.rows() < min_rows)
            {
                throw InsufficientDataError("Need at least " + std::to_string(min_rows) +
                                            " return observations, got " +
                                            std::to_string(returns.rows()));
            }
            if (!returns.allFinite())
            {
                throw std::invalid_argument("Return matrix contains NaN or Inf values");
            }
        }

    } // namespace risk
} // namespace explorer

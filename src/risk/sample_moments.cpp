/**
 * @file sample_moments.cpp
 * @brief Implementation of SampleMoments
 */

#include "risk/sample_moments.hpp"

namespace explorer
{
    namespace risk
    {

        SampleMoments::SampleMoments(Normalization normalization)
            : normalization_(normalization)
        {
        }

        ReturnMoments SampleMoments::estimate(const Eigen::MatrixXd &returns) const
        {
            // T - 1 needs two rows, T needs one
            check_returns(returns, normalization_ == Normalization::UNBIASED ? 2 : 1);

            const Eigen::Index t = returns.rows();

            ReturnMoments moments;
            moments.observations = t;
            moments.mean = returns.colwise().mean().transpose();

            Eigen::MatrixXd demeaned = returns.rowwise() - moments.mean.transpose();
            const double divisor = normalization_ == Normalization::UNBIASED
                                       ? static_cast<double>(t - 1)
                                       : static_cast<double>(t);

            Eigen::MatrixXd cov = (demeaned.transpose() * demeaned) / divisor;
            moments.covariance = 0.5 * (cov + cov.transpose());
            return moments;
        }

        std::string SampleMoments::get_name() const
        {
            return normalization_ == Normalization::UNBIASED ? "SampleMoments(unbiased)"
                                                             : "SampleMoments(mle)";
        }

    } // namespace risk
} // namespace explorer

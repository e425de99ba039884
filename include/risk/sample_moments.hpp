/**
 * @file sample_moments.hpp
 * @brief Equal-weight sample mean and covariance
 */

#pragma once

#include "risk/moment_estimator.hpp"

namespace explorer
{
    namespace risk
    {

        /**
         * @class SampleMoments
         * @brief Column means and sample covariance of the return matrix
         *
         * Cov = C^T C / d, with C the demeaned returns and d = T - 1 (UNBIASED)
         * or d = T (MAXIMUM_LIKELIHOOD). The result is symmetrized exactly.
         */
        class SampleMoments : public MomentEstimator
        {
        public:
            enum class Normalization
            {
                UNBIASED,          ///< Divide by T - 1
                MAXIMUM_LIKELIHOOD ///< Divide by T
            };

            explicit SampleMoments(Normalization normalization = Normalization::UNBIASED);

            ReturnMoments estimate(const Eigen::MatrixXd &returns) const override;

            std::string get_name() const override;

            Normalization get_normalization() const { return normalization_; }

        private:
            Normalization normalization_;
        };

    } // namespace risk
} // namespace explorer

/**
 * @file statistics_builder.cpp
 * @brief Implementation of StatisticsBuilder
 */

#include "risk/statistics_builder.hpp"
#include "core/errors.hpp"
#include "risk/sample_moments.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace explorer
{
    namespace risk
    {

        // ============================================================================
        // StatisticsBundle
        // ============================================================================

        double StatisticsBundle::expected_return(const Eigen::VectorXd &weights) const
        {
            if (weights.size() != mean_returns.size())
            {
                throw std::invalid_argument("Weights size (" + std::to_string(weights.size()) +
                                            ") must match number of assets (" +
                                            std::to_string(mean_returns.size()) + ")");
            }
            return weights.dot(mean_returns);
        }

        double StatisticsBundle::portfolio_risk(const Eigen::VectorXd &weights) const
        {
            if (weights.size() != covariance.rows())
            {
                throw std::invalid_argument("Weights size (" + std::to_string(weights.size()) +
                                            ") must match covariance dimension (" +
                                            std::to_string(covariance.rows()) + ")");
            }

            double variance = weights.dot(covariance * weights);
            // Rounding can push a PSD quadratic form marginally below zero
            return std::sqrt(std::max(variance, 0.0));
        }

        void StatisticsBundle::print_summary() const
        {
            std::cout << "\n  Asset Statistics (Annualized):\n";
            std::cout << "  " << std::string(44, '-') << "\n";
            std::cout << "  " << std::setw(8) << std::left << "Ticker" << std::right
                      << std::setw(16) << "Mean Return"
                      << std::setw(16) << "Volatility" << "\n";
            std::cout << "  " << std::string(44, '-') << "\n";

            for (size_t i = 0; i < tickers.size(); ++i)
            {
                const auto idx = static_cast<Eigen::Index>(i);
                std::cout << "  " << std::setw(8) << std::left << tickers[i] << std::right
                          << std::setw(15) << std::fixed << std::setprecision(2)
                          << mean_returns(idx) * 100 << "%"
                          << std::setw(15) << std::sqrt(std::max(covariance(idx, idx), 0.0)) * 100
                          << "%\n";
            }
            std::cout << "  " << std::string(44, '-') << "\n";
            std::cout << "  Observations: " << num_observations << "\n";
        }

        // ============================================================================
        // StatisticsBuilder
        // ============================================================================

        StatisticsBuilder::StatisticsBuilder(int periods_per_year,
                                             std::shared_ptr<const MomentEstimator> estimator)
            : periods_per_year_(periods_per_year),
              estimator_(std::move(estimator))
        {
            if (!estimator_)
            {
                estimator_ = std::make_shared<SampleMoments>();
            }
            if (periods_per_year_ <= 0)
            {
                throw std::invalid_argument("Periods per year must be positive, got: " +
                                            std::to_string(periods_per_year_));
            }
        }

        Eigen::MatrixXd StatisticsBuilder::periodic_returns(const PriceTable &table) const
        {
            if (table.num_dates() < 2)
            {
                throw InsufficientDataError("Need at least 2 price rows to compute returns, got " +
                                            std::to_string(table.num_dates()));
            }
            return table.calculate_returns();
        }

        StatisticsBundle StatisticsBuilder::build(const PriceTable &table) const
        {
            if (table.num_assets() == 0)
            {
                throw InsufficientDataError("Price table has no assets");
            }

            Eigen::MatrixXd returns = periodic_returns(table);
            if (returns.rows() < 2)
            {
                throw InsufficientDataError("Need at least 2 return observations to estimate variance, got " +
                                            std::to_string(returns.rows()));
            }

            ReturnMoments annual = estimator_->estimate(returns)
                                       .scaled(static_cast<double>(periods_per_year_));

            StatisticsBundle bundle;
            bundle.tickers = table.get_tickers();
            bundle.num_observations = static_cast<size_t>(annual.observations);
            bundle.mean_returns = std::move(annual.mean);
            bundle.covariance = std::move(annual.covariance);

            return bundle;
        }

    } // namespace risk
} // namespace explorer

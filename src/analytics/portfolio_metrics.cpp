/**
 * @file portfolio_metrics.cpp
 * @brief Implementation of PortfolioMetricsCalculator and allocation alignment.
 */

#include "analytics/portfolio_metrics.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <sstream>

namespace explorer
{
    namespace analytics
    {

        std::string to_string(ReturnConvention convention)
        {
            switch (convention)
            {
            case ReturnConvention::CAGR:
                return "cagr";
            case ReturnConvention::MEAN_PERIODIC:
                return "mean_periodic";
            }
            return "unknown";
        }

        // ============================================================================
        // Weights
        // ============================================================================

        Eigen::VectorXd PortfolioMetricsCalculator::normalize_weights(const Eigen::VectorXd &weights)
        {
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                if (!std::isfinite(weights(i)) || weights(i) < 0.0)
                {
                    std::ostringstream oss;
                    oss << "Weight " << i << " is invalid (" << weights(i)
                        << "); weights must be finite and non-negative";
                    throw InvalidWeightsError(oss.str());
                }
            }

            const double total = weights.sum();
            if (!(total > 0.0))
            {
                throw InvalidWeightsError("Weights must have a positive sum");
            }
            return weights / total;
        }

        // ============================================================================
        // Returns
        // ============================================================================

        Eigen::VectorXd PortfolioMetricsCalculator::asset_cagr(const PriceTable &table) const
        {
            if (table.empty())
            {
                throw InsufficientDataError("Cannot compute CAGR on an empty price table");
            }

            const Eigen::MatrixXd &prices = table.get_prices();
            const Eigen::Index last = prices.rows() - 1;
            const double years = static_cast<double>(prices.rows()) / TRADING_DAYS_PER_YEAR;
            const auto &tickers = table.get_tickers();

            Eigen::VectorXd cagr(prices.cols());
            for (Eigen::Index a = 0; a < prices.cols(); ++a)
            {
                const double initial = prices(0, a);
                const double final_price = prices(last, a);
                const std::string &ticker = tickers[static_cast<size_t>(a)];

                if (!std::isfinite(initial) || !std::isfinite(final_price))
                {
                    throw InsufficientDataError("Missing first or last price for " + ticker);
                }
                if (initial == 0.0)
                {
                    throw InsufficientDataError("Initial price of " + ticker +
                                                " is zero; CAGR is undefined");
                }

                cagr(a) = std::pow(final_price / initial, 1.0 / years) - 1.0;
            }
            return cagr;
        }

        optimizer::PortfolioPoint PortfolioMetricsCalculator::metrics(
            const PriceTable &table,
            const Eigen::VectorXd &weights,
            double risk_free_rate,
            ReturnConvention convention) const
        {
            if (static_cast<size_t>(weights.size()) != table.num_assets())
            {
                throw InvalidWeightsError("Weights size (" + std::to_string(weights.size()) +
                                          ") must match number of assets (" +
                                          std::to_string(table.num_assets()) + ")");
            }

            Eigen::VectorXd w = normalize_weights(weights);
            risk::StatisticsBundle stats = builder_.build(table);

            double expected = convention == ReturnConvention::CAGR
                                  ? w.dot(asset_cagr(table))
                                  : stats.expected_return(w);
            double vol = stats.portfolio_risk(w);

            return optimizer::make_point(w, expected, vol, risk_free_rate);
        }

        // ============================================================================
        // Allocation alignment
        // ============================================================================

        Eigen::VectorXd align_allocations(const std::vector<std::string> &tickers,
                                          const std::map<std::string, double> &allocations)
        {
            Eigen::VectorXd w = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(tickers.size()));

            for (size_t i = 0; i < tickers.size(); ++i)
            {
                auto it = allocations.find(tickers[i]);
                if (it == allocations.end())
                {
                    continue;
                }
                if (!std::isfinite(it->second) || it->second < 0.0)
                {
                    throw InvalidWeightsError("Allocation for " + it->first +
                                              " must be finite and non-negative");
                }
                w(static_cast<Eigen::Index>(i)) = it->second;
            }

            // Percent inputs (e.g. 20 for 20%)
            if (w.size() > 0 && w.maxCoeff() > 1.0)
            {
                w /= 100.0;
            }

            if (!(w.sum() > 0.0))
            {
                throw InvalidWeightsError("No allocation remains for the available assets");
            }
            return w / w.sum();
        }

    } // namespace analytics
} // namespace explorer

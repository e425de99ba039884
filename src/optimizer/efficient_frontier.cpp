/**
 * @file efficient_frontier.cpp
 * @brief Implementation of Monte Carlo frontier sampling
 */

#include "optimizer/efficient_frontier.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace explorer
{
    namespace optimizer
    {

        // ============================================================================
        // WeightScheme
        // ============================================================================

        std::string to_string(WeightScheme scheme)
        {
            switch (scheme)
            {
            case WeightScheme::UNIFORM_NORMALIZED:
                return "uniform";
            case WeightScheme::DIRICHLET:
                return "dirichlet";
            }
            return "unknown";
        }

        WeightScheme weight_scheme_from_string(const std::string &name)
        {
            if (name == "uniform")
            {
                return WeightScheme::UNIFORM_NORMALIZED;
            }
            if (name == "dirichlet")
            {
                return WeightScheme::DIRICHLET;
            }
            throw std::invalid_argument("Unknown weight scheme: '" + name +
                                        "' (expected 'uniform' or 'dirichlet')");
        }

        // ============================================================================
        // SamplerConfig
        // ============================================================================

        void SamplerConfig::validate() const
        {
            if (num_portfolios < 0)
            {
                throw std::invalid_argument("num_portfolios must be non-negative, got: " +
                                            std::to_string(num_portfolios));
            }
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("risk_free_rate must be finite");
            }
        }

        SamplerConfig SamplerConfig::from_json(const nlohmann::json &j)
        {
            SamplerConfig config;

            config.num_portfolios = j.value("num_portfolios", config.num_portfolios);
            config.risk_free_rate = j.value("risk_free_rate", config.risk_free_rate);

            if (j.contains("seed") && !j["seed"].is_null())
            {
                if (!j["seed"].is_number_unsigned())
                {
                    throw std::invalid_argument("sampler.seed must be a non-negative integer");
                }
                config.seed = j["seed"].get<std::uint64_t>();
            }

            if (j.contains("weight_scheme"))
            {
                config.scheme = weight_scheme_from_string(j["weight_scheme"].get<std::string>());
            }

            config.validate();
            return config;
        }

        nlohmann::json SamplerConfig::to_json() const
        {
            nlohmann::json j;
            j["num_portfolios"] = num_portfolios;
            j["risk_free_rate"] = risk_free_rate;
            j["seed"] = seed ? nlohmann::json(*seed) : nlohmann::json(nullptr);
            j["weight_scheme"] = to_string(scheme);
            return j;
        }

        // ============================================================================
        // PortfolioPoint
        // ============================================================================

        nlohmann::json PortfolioPoint::to_json(const std::vector<std::string> &tickers,
                                               const AssetDirectory *assets) const
        {
            nlohmann::json j;
            j["expected_return"] = expected_return;
            j["risk"] = risk;
            j["sharpe_ratio"] = sharpe_ratio;

            nlohmann::json w = nlohmann::json::object();
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                const auto pos = static_cast<size_t>(i);
                const std::string key = pos < tickers.size() ? tickers[pos] : "asset_" + std::to_string(i);
                w[key] = weights(i);
            }
            j["weights"] = w;

            if (assets != nullptr)
            {
                nlohmann::json names = nlohmann::json::object();
                for (auto it = w.begin(); it != w.end(); ++it)
                {
                    names[it.key()] = assets->full_name(it.key());
                }
                j["names"] = std::move(names);
            }
            return j;
        }

        PortfolioPoint make_point(const Eigen::VectorXd &weights,
                                  double expected_return,
                                  double risk,
                                  double risk_free_rate)
        {
            if (!(risk > RISK_EPSILON))
            {
                std::ostringstream oss;
                oss << "Portfolio risk is numerically zero (" << risk
                    << "); Sharpe ratio is undefined";
                throw DegenerateRiskError(oss.str());
            }

            PortfolioPoint point;
            point.weights = weights;
            point.expected_return = expected_return;
            point.risk = risk;
            point.sharpe_ratio = (expected_return - risk_free_rate) / risk;
            return point;
        }

        // ============================================================================
        // FrontierPopulation
        // ============================================================================

        FrontierPopulation::FrontierPopulation(std::vector<PortfolioPoint> points,
                                               std::vector<std::string> tickers,
                                               double risk_free_rate)
            : points_(std::move(points)),
              tickers_(std::move(tickers)),
              risk_free_rate_(risk_free_rate)
        {
            for (const auto &point : points_)
            {
                if (static_cast<size_t>(point.weights.size()) != tickers_.size())
                {
                    throw std::invalid_argument("Portfolio weight count (" +
                                                std::to_string(point.weights.size()) +
                                                ") does not match ticker count (" +
                                                std::to_string(tickers_.size()) + ")");
                }
            }
        }

        const PortfolioPoint &FrontierPopulation::at(size_t index) const
        {
            if (index >= points_.size())
            {
                throw IndexOutOfRangeError("Portfolio index " + std::to_string(index) +
                                           " out of range [0, " + std::to_string(points_.size()) + ")");
            }
            return points_[index];
        }

        void FrontierPopulation::print_summary() const
        {
            std::cout << "\n=== Sampled Frontier Summary ===\n";
            std::cout << "Portfolios:      " << points_.size() << "\n";
            std::cout << "Assets:          " << tickers_.size() << "\n";
            std::cout << "Risk-free rate:  " << std::fixed << std::setprecision(2)
                      << risk_free_rate_ * 100 << "%\n";
            std::cout << std::string(40, '-') << "\n";

            if (!points_.empty())
            {
                double min_risk = std::numeric_limits<double>::max();
                double max_risk = -std::numeric_limits<double>::max();
                double min_ret = std::numeric_limits<double>::max();
                double max_ret = -std::numeric_limits<double>::max();
                double max_sharpe = -std::numeric_limits<double>::max();

                for (const auto &point : points_)
                {
                    min_risk = std::min(min_risk, point.risk);
                    max_risk = std::max(max_risk, point.risk);
                    min_ret = std::min(min_ret, point.expected_return);
                    max_ret = std::max(max_ret, point.expected_return);
                    max_sharpe = std::max(max_sharpe, point.sharpe_ratio);
                }

                std::cout << "Return range:    " << std::setprecision(4)
                          << min_ret * 100 << "% to " << max_ret * 100 << "%\n";
                std::cout << "Risk range:      "
                          << min_risk * 100 << "% to " << max_risk * 100 << "%\n";
                std::cout << "Best Sharpe:     " << std::setprecision(3) << max_sharpe << "\n";
            }

            std::cout << "================================\n"
                      << std::endl;
        }

        void FrontierPopulation::export_to_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "index,return,risk,sharpe_ratio";
            for (const auto &ticker : tickers_)
            {
                file << ",w_" << ticker;
            }
            file << "\n";

            file << std::fixed << std::setprecision(8);
            for (size_t i = 0; i < points_.size(); ++i)
            {
                const auto &point = points_[i];
                file << i << ","
                     << point.expected_return << ","
                     << point.risk << ","
                     << point.sharpe_ratio;
                for (Eigen::Index k = 0; k < point.weights.size(); ++k)
                {
                    file << "," << point.weights(k);
                }
                file << "\n";
            }

            if (!file)
            {
                throw std::runtime_error("Failed while writing file: " + filepath);
            }
        }

        nlohmann::json FrontierPopulation::to_json() const
        {
            nlohmann::json j;
            j["tickers"] = tickers_;
            j["risk_free_rate"] = risk_free_rate_;

            nlohmann::json portfolios = nlohmann::json::array();
            for (size_t i = 0; i < points_.size(); ++i)
            {
                nlohmann::json p = points_[i].to_json(tickers_);
                p["index"] = i;
                portfolios.push_back(std::move(p));
            }
            j["portfolios"] = std::move(portfolios);
            return j;
        }

        // ============================================================================
        // FrontierSampler
        // ============================================================================

        namespace
        {
            std::uint64_t entropy_seed()
            {
                std::random_device rd;
                return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
            }
        } // namespace

        FrontierSampler::FrontierSampler()
            : FrontierSampler(SamplerConfig())
        {
        }

        FrontierSampler::FrontierSampler(const SamplerConfig &config)
            : config_(config),
              rng_(config.seed ? *config.seed : entropy_seed())
        {
            config_.validate();
        }

        Eigen::VectorXd FrontierSampler::draw_weights(Eigen::Index num_assets)
        {
            if (num_assets <= 0)
            {
                throw std::invalid_argument("Cannot draw weights for " +
                                            std::to_string(num_assets) + " assets");
            }

            std::uniform_real_distribution<double> uniform(0.0, 1.0);
            std::exponential_distribution<double> exponential(1.0);

            Eigen::VectorXd raw(num_assets);
            double total = 0.0;
            do
            {
                for (Eigen::Index i = 0; i < num_assets; ++i)
                {
                    raw(i) = config_.scheme == WeightScheme::DIRICHLET
                                 ? exponential(rng_)
                                 : uniform(rng_);
                }
                total = raw.sum();
            } while (!(total > 0.0));

            return raw / total;
        }

        FrontierPopulation FrontierSampler::sample(const risk::StatisticsBundle &stats,
                                                   int num_portfolios,
                                                   double risk_free_rate)
        {
            if (num_portfolios < 0)
            {
                throw std::invalid_argument("num_portfolios must be non-negative, got: " +
                                            std::to_string(num_portfolios));
            }

            const Eigen::Index n = stats.mean_returns.size();
            if (n == 0 || stats.covariance.rows() != n || stats.covariance.cols() != n)
            {
                throw std::invalid_argument("Statistics must describe at least one asset "
                                            "with a matching covariance matrix");
            }

            std::vector<PortfolioPoint> points;
            points.reserve(static_cast<size_t>(num_portfolios));

            for (int k = 0; k < num_portfolios; ++k)
            {
                Eigen::VectorXd w = draw_weights(n);
                double ret = stats.expected_return(w);
                double vol = stats.portfolio_risk(w);
                points.push_back(make_point(w, ret, vol, risk_free_rate));
            }

            return FrontierPopulation(std::move(points), stats.tickers, risk_free_rate);
        }

        FrontierPopulation FrontierSampler::sample(const risk::StatisticsBundle &stats)
        {
            return sample(stats, config_.num_portfolios, config_.risk_free_rate);
        }

    } // namespace optimizer
} // namespace explorer

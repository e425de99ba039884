/**
 * @file efficient_frontier.hpp
 * @brief Monte Carlo sampling of the efficient frontier
 *
 * Approximates the Markowitz risk/return trade-off by drawing random
 * long-only, fully-invested weight vectors and evaluating each one
 * against annualized statistics:
 *
 *     For each sample k:
 *         w_k      ~ weight scheme, normalized so sum(w_k) = 1, w_k >= 0
 *         return_k = mu^T * w_k
 *         risk_k   = sqrt(w_k^T * Sigma * w_k)
 *         sharpe_k = (return_k - r_f) / risk_k
 *
 * The resulting cloud is bounded on the left by the frontier; no single
 * sample is guaranteed to lie on it.
 */

#pragma once

#include "core/constants.hpp"
#include "data/asset_info.hpp"
#include "risk/statistics_builder.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace explorer
{
    namespace optimizer
    {

        /**
         * @enum WeightScheme
         * @brief How raw random weights are drawn before normalization
         */
        enum class WeightScheme
        {
            UNIFORM_NORMALIZED, ///< U[0,1) per asset, divided by the sum (centroid-heavy)
            DIRICHLET           ///< Exp(1) per asset, divided by the sum (uniform on the simplex)
        };

        std::string to_string(WeightScheme scheme);

        /**
         * @brief Parse "uniform" / "dirichlet"
         * @throws std::invalid_argument for any other name
         */
        WeightScheme weight_scheme_from_string(const std::string &name);

        /**
         * @struct SamplerConfig
         * @brief Sampling parameters, loadable from the "sampler" config section
         */
        struct SamplerConfig
        {
            int num_portfolios = 1000;
            double risk_free_rate = DEFAULT_RISK_FREE_RATE;
            std::optional<std::uint64_t> seed; ///< Unset: seed from std::random_device
            WeightScheme scheme = WeightScheme::UNIFORM_NORMALIZED;

            /**
             * @throws std::invalid_argument on a negative sample count or a
             *         non-finite risk-free rate
             */
            void validate() const;

            static SamplerConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct PortfolioPoint
         * @brief One evaluated portfolio
         */
        struct PortfolioPoint
        {
            Eigen::VectorXd weights;     ///< Non-negative, sums to 1
            double expected_return = 0.0;
            double risk = 0.0;           ///< Annualized standard deviation
            double sharpe_ratio = 0.0;

            /**
             * @brief Metrics and weights keyed by ticker
             * @param assets Optional directory; when given, adds a "names" object
             *        mapping each ticker to its full name
             */
            nlohmann::json to_json(const std::vector<std::string> &tickers,
                                   const AssetDirectory *assets = nullptr) const;
        };

        /**
         * @brief Build a PortfolioPoint from weights, return and risk
         * @throws DegenerateRiskError if risk <= RISK_EPSILON
         */
        PortfolioPoint make_point(const Eigen::VectorXd &weights,
                                  double expected_return,
                                  double risk,
                                  double risk_free_rate);

        /**
         * @class FrontierPopulation
         * @brief Immutable, generation-ordered set of sampled portfolios
         *
         * Index i is the i-th portfolio drawn. Populations are regenerated
         * wholesale; there is no way to modify one after construction.
         */
        class FrontierPopulation
        {
        public:
            using const_iterator = std::vector<PortfolioPoint>::const_iterator;

            FrontierPopulation() = default;

            FrontierPopulation(std::vector<PortfolioPoint> points,
                               std::vector<std::string> tickers,
                               double risk_free_rate);

            size_t size() const { return points_.size(); }
            bool empty() const { return points_.empty(); }

            /**
             * @throws IndexOutOfRangeError if index >= size()
             */
            const PortfolioPoint &at(size_t index) const;

            const PortfolioPoint &operator[](size_t index) const { return points_[index]; }

            const_iterator begin() const { return points_.begin(); }
            const_iterator end() const { return points_.end(); }

            const std::vector<PortfolioPoint> &points() const { return points_; }
            const std::vector<std::string> &get_tickers() const { return tickers_; }
            double get_risk_free_rate() const { return risk_free_rate_; }

            void print_summary() const;

            /**
             * @brief Write index,return,risk,sharpe_ratio,w_<ticker>... rows
             * @throws std::runtime_error if the file cannot be opened
             */
            void export_to_csv(const std::string &filepath) const;

            nlohmann::json to_json() const;

        private:
            std::vector<PortfolioPoint> points_;
            std::vector<std::string> tickers_;
            double risk_free_rate_ = DEFAULT_RISK_FREE_RATE;
        };

        /**
         * @class FrontierSampler
         * @brief Draws a FrontierPopulation from annualized statistics
         *
         * Usage Example:
         * @code
         * SamplerConfig config;
         * config.seed = 42;
         * FrontierSampler sampler(config);
         *
         * auto population = sampler.sample(stats, 1000, 0.03);
         * population.print_summary();
         * population.export_to_csv("frontier.csv");
         * @endcode
         *
         * A fixed seed reproduces the population exactly. Each call to
         * sample() continues the sampler's random stream.
         */
        class FrontierSampler
        {
        public:
            FrontierSampler();

            explicit FrontierSampler(const SamplerConfig &config);

            /**
             * @brief Sample num_portfolios random portfolios
             * @param stats Annualized statistics
             * @param num_portfolios Number of samples (0 gives an empty population)
             * @param risk_free_rate Rate used for the Sharpe ratio
             * @throws std::invalid_argument if num_portfolios < 0 or stats has no assets
             * @throws DegenerateRiskError if a sampled portfolio has zero risk
             */
            FrontierPopulation sample(const risk::StatisticsBundle &stats,
                                      int num_portfolios,
                                      double risk_free_rate = DEFAULT_RISK_FREE_RATE);

            /**
             * @brief Sample using the configured count and rate
             */
            FrontierPopulation sample(const risk::StatisticsBundle &stats);

            /**
             * @brief Draw one normalized weight vector
             */
            Eigen::VectorXd draw_weights(Eigen::Index num_assets);

            const SamplerConfig &get_config() const { return config_; }

        private:
            SamplerConfig config_;
            std::mt19937_64 rng_;
        };

    } // namespace optimizer
} // namespace explorer

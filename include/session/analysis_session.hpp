/**
 * @file analysis_session.hpp
 * @brief One exploration session: prices, statistics, sampled frontier and
 *        the user's current allocation.
 *
 * A session is a snapshot. Changing the universe, the allocation or the
 * sampling parameters means creating a new session; nothing inside is
 * updated in place.
 */

#pragma once

#include "analytics/portfolio_metrics.hpp"
#include "data/asset_info.hpp"
#include "data/price_table.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "optimizer/portfolio_selectors.hpp"
#include "optimizer/selection_resolver.hpp"
#include "risk/statistics_builder.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace explorer
{

    /**
     * @struct SessionConfig
     * @brief Parameters for building a session
     */
    struct SessionConfig
    {
        optimizer::SamplerConfig sampler;
        double edge_threshold = optimizer::DEFAULT_EDGE_THRESHOLD;
        AssetDirectory assets = AssetDirectory::defaults(); ///< Names for printed and exported weights
    };

    /**
     * @class AnalysisSession
     * @brief Holds everything derived from one PriceTable
     *
     * Usage Example:
     * @code
     * SessionConfig config;
     * config.sampler.seed = 7;
     * auto session = AnalysisSession::create(table, {{"AAPL", 60}, {"BND", 40}}, config);
     * session.print_summary();
     *
     * auto picked = session.resolve(optimizer::Selection::best_sharpe());
     * std::cout << picked.label << ": " << picked.point.sharpe_ratio << "\n";
     * @endcode
     */
    class AnalysisSession
    {
    public:
        /**
         * @brief Build statistics, sample the frontier and score the allocation
         * @param table Complete price table (columns are the surviving assets)
         * @param allocations Requested allocation by ticker (fractions or percent)
         * @param config Sampler and selection parameters
         * @throws InsufficientDataError if the table cannot support statistics
         * @throws InvalidWeightsError if no allocation maps onto the table
         * @throws DegenerateRiskError if a portfolio has zero risk
         */
        static AnalysisSession create(PriceTable table,
                                      const std::map<std::string, double> &allocations,
                                      const SessionConfig &config = SessionConfig());

        const PriceTable &get_table() const { return table_; }
        const risk::StatisticsBundle &get_statistics() const { return stats_; }
        const optimizer::FrontierPopulation &get_population() const { return population_; }
        const SessionConfig &get_config() const { return config_; }

        /// Normalized weights of the user allocation over the table's columns
        const Eigen::VectorXd &get_current_weights() const { return current_.weights; }

        /// User allocation evaluated with the CAGR convention
        const optimizer::PortfolioPoint &get_current_portfolio() const { return current_; }

        /// Unset when the population is empty
        std::optional<size_t> get_max_sharpe_index() const { return max_sharpe_index_; }
        std::optional<size_t> get_min_risk_index() const { return min_risk_index_; }

        const std::vector<size_t> &get_edge_indices() const { return edge_indices_; }

        /**
         * @brief Resolve a chart selection against this session's population
         */
        optimizer::ResolvedSelection resolve(const optimizer::Selection &selection) const;

        /**
         * @throws std::runtime_error if the file cannot be written
         */
        void export_population_csv(const std::string &filepath) const;

        nlohmann::json to_json() const;

        void print_summary() const;

    private:
        AnalysisSession() = default;

        PriceTable table_;
        risk::StatisticsBundle stats_;
        optimizer::FrontierPopulation population_;
        optimizer::PortfolioPoint current_;
        SessionConfig config_;
        std::optional<size_t> max_sharpe_index_;
        std::optional<size_t> min_risk_index_;
        std::vector<size_t> edge_indices_;
    };

    /**
     * @brief Print a ticker/name/weight table, largest weight first,
     *        skipping weights below 0.1%
     */
    void print_allocation(const std::vector<std::string> &tickers,
                          const Eigen::VectorXd &weights,
                          const AssetDirectory &assets = AssetDirectory(),
                          std::ostream &out = std::cout);

} // namespace explorer

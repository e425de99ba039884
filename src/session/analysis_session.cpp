/**
 * @file analysis_session.cpp
 * @brief Implementation of AnalysisSession
 */

#include "session/analysis_session.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace explorer
{

    // Weights under this are hidden in printed allocations
    static constexpr double DISPLAY_WEIGHT_FLOOR = 0.001;

    void print_allocation(const std::vector<std::string> &tickers,
                          const Eigen::VectorXd &weights,
                          const AssetDirectory &assets,
                          std::ostream &out)
    {
        if (static_cast<Eigen::Index>(tickers.size()) != weights.size())
        {
            throw std::invalid_argument("print_allocation: " + std::to_string(tickers.size()) +
                                        " tickers for " + std::to_string(weights.size()) + " weights");
        }

        std::vector<size_t> order(tickers.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&weights](size_t a, size_t b)
                         { return weights(static_cast<Eigen::Index>(a)) > weights(static_cast<Eigen::Index>(b)); });

        for (size_t i : order)
        {
            double w = weights(static_cast<Eigen::Index>(i));
            if (w >= DISPLAY_WEIGHT_FLOOR)
            {
                out << "    " << std::setw(8) << std::left << tickers[i]
                    << std::setw(48) << assets.full_name(tickers[i]) << std::right
                    << std::setw(8) << std::fixed << std::setprecision(2)
                    << w * 100 << "%\n";
            }
        }
    }

    namespace
    {
        void print_point(const std::string &title, const optimizer::PortfolioPoint &point)
        {
            std::cout << "\n"
                      << title << ":\n";
            std::cout << "  Expected Return:  " << std::fixed << std::setprecision(2)
                      << point.expected_return * 100 << "%\n";
            std::cout << "  Volatility:       " << point.risk * 100 << "%\n";
            std::cout << "  Sharpe Ratio:     " << std::setprecision(3)
                      << point.sharpe_ratio << "\n";
        }
    } // namespace

    AnalysisSession AnalysisSession::create(PriceTable table,
                                            const std::map<std::string, double> &allocations,
                                            const SessionConfig &config)
    {
        config.sampler.validate();
        if (!(config.edge_threshold >= 0.0))
        {
            throw std::invalid_argument("edge_threshold must be non-negative");
        }

        AnalysisSession session;
        session.config_ = config;
        session.table_ = std::move(table);

        risk::StatisticsBuilder builder;
        session.stats_ = builder.build(session.table_);

        optimizer::FrontierSampler sampler(config.sampler);
        session.population_ = sampler.sample(session.stats_);

        Eigen::VectorXd weights = analytics::align_allocations(session.table_.get_tickers(), allocations);
        analytics::PortfolioMetricsCalculator calculator;
        session.current_ = calculator.metrics(session.table_, weights,
                                              config.sampler.risk_free_rate,
                                              analytics::ReturnConvention::CAGR);

        if (!session.population_.empty())
        {
            session.max_sharpe_index_ = optimizer::max_sharpe_index(session.population_);
            session.min_risk_index_ = optimizer::min_risk_index(session.population_);
            session.edge_indices_ = optimizer::near_min_risk_edge_indices(session.population_,
                                                                          config.edge_threshold);
        }

        return session;
    }

    optimizer::ResolvedSelection AnalysisSession::resolve(const optimizer::Selection &selection) const
    {
        return optimizer::SelectionResolver::resolve(population_, selection);
    }

    void AnalysisSession::export_population_csv(const std::string &filepath) const
    {
        population_.export_to_csv(filepath);
    }

    nlohmann::json AnalysisSession::to_json() const
    {
        const auto &tickers = table_.get_tickers();

        nlohmann::json j;
        j["tickers"] = tickers;
        j["asset_names"] = config_.assets.names_for(tickers);
        j["start_date"] = table_.get_dates().empty() ? "" : table_.get_dates().front();
        j["end_date"] = table_.get_dates().empty() ? "" : table_.get_dates().back();
        j["observations"] = stats_.num_observations;
        j["sampler"] = config_.sampler.to_json();
        j["edge_threshold"] = config_.edge_threshold;

        j["current_portfolio"] = current_.to_json(tickers, &config_.assets);
        j["current_portfolio"]["return_convention"] = analytics::to_string(analytics::ReturnConvention::CAGR);

        if (max_sharpe_index_)
        {
            j["max_sharpe"] = population_[*max_sharpe_index_].to_json(tickers, &config_.assets);
            j["max_sharpe"]["index"] = *max_sharpe_index_;
        }
        if (min_risk_index_)
        {
            j["min_risk"] = population_[*min_risk_index_].to_json(tickers, &config_.assets);
            j["min_risk"]["index"] = *min_risk_index_;
        }
        j["near_min_risk_edge"] = edge_indices_;
        j["population"] = population_.to_json();
        return j;
    }

    void AnalysisSession::print_summary() const
    {
        std::cout << "\n=== Portfolio Exploration Summary ===\n";
        std::cout << "Assets:        " << table_.num_assets() << "\n";
        if (!table_.get_dates().empty())
        {
            std::cout << "Period:        " << table_.get_dates().front()
                      << " to " << table_.get_dates().back() << "\n";
        }
        std::cout << "Portfolios:    " << population_.size() << "\n";
        std::cout << "Weight scheme: " << optimizer::to_string(config_.sampler.scheme) << "\n";
        std::cout << std::string(40, '-') << "\n";

        print_point("Current Portfolio (CAGR)", current_);
        print_allocation(table_.get_tickers(), current_.weights, config_.assets);

        if (max_sharpe_index_)
        {
            const auto &best = population_[*max_sharpe_index_];
            print_point("Max Sharpe Ratio Portfolio (#" + std::to_string(*max_sharpe_index_) + ")", best);
            print_allocation(table_.get_tickers(), best.weights, config_.assets);
        }

        if (min_risk_index_)
        {
            const auto &safest = population_[*min_risk_index_];
            print_point("Min Volatility Portfolio (#" + std::to_string(*min_risk_index_) + ")", safest);
            print_allocation(table_.get_tickers(), safest.weights, config_.assets);

            std::cout << "\nNear min-risk edge: " << edge_indices_.size()
                      << " portfolio(s) within " << std::setprecision(4)
                      << config_.edge_threshold * 100 << "% of the minimum risk\n";
        }

        std::cout << "=====================================\n"
                  << std::endl;
    }

} // namespace explorer

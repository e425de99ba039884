/**
 * @file test_analysis_session.cpp
 * @brief Integration tests for AnalysisSession
 *
 * Runs the full pipeline on synthetic data: statistics, sampled population,
 * current allocation, markers and exports.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "session/analysis_session.hpp"

#include <filesystem>
#include <fstream>

using namespace explorer;
using Catch::Matchers::WithinAbs;

class SessionTestFixture
{
protected:
    PriceTable table_;
    std::map<std::string, double> allocations_;
    SessionConfig config_;

    SessionTestFixture()
    {
        table_ = DataLoader::generate_synthetic_data({"AAPL", "GLD", "BND", "VNQ"}, 504, "2022-01-03");

        // Percent inputs; SLV is not in the table
        allocations_ = {{"AAPL", 40.0}, {"GLD", 30.0}, {"SLV", 20.0}, {"BND", 10.0}};

        config_.sampler.num_portfolios = 300;
        config_.sampler.seed = 42;
        config_.sampler.risk_free_rate = 0.03;
    }
};

TEST_CASE_METHOD(SessionTestFixture, "Session builds every artefact", "[AnalysisSession]")
{
    AnalysisSession session = AnalysisSession::create(table_, allocations_, config_);

    REQUIRE(session.get_table().num_assets() == 4);
    REQUIRE(session.get_statistics().tickers == table_.get_tickers());
    REQUIRE(session.get_statistics().num_observations == 503);
    REQUIRE(session.get_population().size() == 300);

    SECTION("Current allocation is aligned to the table")
    {
        const Eigen::VectorXd &w = session.get_current_weights();
        REQUIRE(w.size() == 4);
        REQUIRE_THAT(w.sum(), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(w(0), WithinAbs(0.50, 1e-12));
        REQUIRE_THAT(w(1), WithinAbs(0.375, 1e-12));
        REQUIRE_THAT(w(2), WithinAbs(0.125, 1e-12));
        REQUIRE(w(3) == 0.0);

        const auto &current = session.get_current_portfolio();
        REQUIRE(current.risk > 0.0);
        REQUIRE_THAT(current.sharpe_ratio,
                     WithinAbs((current.expected_return - 0.03) / current.risk, 1e-12));
    }

    SECTION("Markers agree with the selectors")
    {
        const auto &population = session.get_population();
        REQUIRE(session.get_max_sharpe_index().has_value());
        REQUIRE(*session.get_max_sharpe_index() == optimizer::max_sharpe_index(population));
        REQUIRE(*session.get_min_risk_index() == optimizer::min_risk_index(population));
        REQUIRE(session.get_edge_indices() == optimizer::near_min_risk_edge_indices(population));
        REQUIRE_FALSE(session.get_edge_indices().empty());
    }

    SECTION("Resolving selections")
    {
        auto best = session.resolve(optimizer::Selection::best_sharpe());
        REQUIRE(best.index == *session.get_max_sharpe_index());
        REQUIRE(&best.point == &session.get_population()[best.index]);

        auto pick = session.resolve(optimizer::Selection::point(299));
        REQUIRE(pick.label == "Portfolio #299");
        REQUIRE_THROWS_AS(session.resolve(optimizer::Selection::point(300)), IndexOutOfRangeError);
    }
}

TEST_CASE_METHOD(SessionTestFixture, "Session is reproducible with a seed", "[AnalysisSession]")
{
    AnalysisSession a = AnalysisSession::create(table_, allocations_, config_);
    AnalysisSession b = AnalysisSession::create(table_, allocations_, config_);

    REQUIRE(a.get_max_sharpe_index() == b.get_max_sharpe_index());
    REQUIRE(a.get_population()[17].weights == b.get_population()[17].weights);
}

TEST_CASE_METHOD(SessionTestFixture, "Session with no samples", "[AnalysisSession]")
{
    config_.sampler.num_portfolios = 0;
    AnalysisSession session = AnalysisSession::create(table_, allocations_, config_);

    REQUIRE(session.get_population().empty());
    REQUIRE_FALSE(session.get_max_sharpe_index().has_value());
    REQUIRE_FALSE(session.get_min_risk_index().has_value());
    REQUIRE(session.get_edge_indices().empty());
    REQUIRE(session.get_current_portfolio().risk > 0.0);

    REQUIRE_THROWS_AS(session.resolve(optimizer::Selection::lowest_risk()), EmptyPopulationError);

    nlohmann::json j = session.to_json();
    REQUIRE_FALSE(j.contains("max_sharpe"));
    REQUIRE(j["population"]["portfolios"].empty());
}

TEST_CASE_METHOD(SessionTestFixture, "Session rejects bad inputs", "[AnalysisSession]")
{
    SECTION("Negative edge threshold")
    {
        config_.edge_threshold = -0.01;
        REQUIRE_THROWS_AS(AnalysisSession::create(table_, allocations_, config_), std::invalid_argument);
    }

    SECTION("Negative sample count")
    {
        config_.sampler.num_portfolios = -1;
        REQUIRE_THROWS_AS(AnalysisSession::create(table_, allocations_, config_), std::invalid_argument);
    }

    SECTION("Allocation outside the table")
    {
        REQUIRE_THROWS_AS(AnalysisSession::create(table_, {{"SLV", 1.0}}, config_), InvalidWeightsError);
    }

    SECTION("Too little history")
    {
        PriceTable tiny = DataLoader::generate_synthetic_data({"AAPL"}, 1, "2022-01-03");
        REQUIRE_THROWS_AS(AnalysisSession::create(tiny, {{"AAPL", 1.0}}, config_), InsufficientDataError);
    }
}

TEST_CASE_METHOD(SessionTestFixture, "Session exports", "[AnalysisSession]")
{
    config_.sampler.num_portfolios = 20;
    AnalysisSession session = AnalysisSession::create(table_, allocations_, config_);

    SECTION("JSON document")
    {
        nlohmann::json j = session.to_json();
        REQUIRE(j["tickers"].size() == 4);
        REQUIRE(j["start_date"] == table_.get_dates().front());
        REQUIRE(j["end_date"] == table_.get_dates().back());
        REQUIRE(j["sampler"]["seed"] == 42);
        REQUIRE(j["current_portfolio"]["return_convention"] == "cagr");
        REQUIRE(j["max_sharpe"]["index"] == *session.get_max_sharpe_index());
        REQUIRE(j["min_risk"]["index"] == *session.get_min_risk_index());
        REQUIRE(j["population"]["portfolios"].size() == 20);
        REQUIRE(j["asset_names"]["AAPL"] == "Apple Inc. (Technology)");
        REQUIRE(j["max_sharpe"]["names"]["AAPL"] == "Apple Inc. (Technology)");
        REQUIRE(j["current_portfolio"]["names"].size() == 4);
    }

    SECTION("CSV population")
    {
        std::string path = (std::filesystem::temp_directory_path() / "explorer_session_frontier.csv").string();
        session.export_population_csv(path);

        std::ifstream in(path);
        std::string header;
        REQUIRE(std::getline(in, header));
        REQUIRE(header == "index,return,risk,sharpe_ratio,w_AAPL,w_GLD,w_BND,w_VNQ");

        int rows = 0;
        std::string line;
        while (std::getline(in, line))
        {
            ++rows;
        }
        REQUIRE(rows == 20);
        std::filesystem::remove(path);
    }
}

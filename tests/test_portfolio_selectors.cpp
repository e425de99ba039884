/**
 * @file test_portfolio_selectors.cpp
 * @brief Unit tests for max-Sharpe, min-risk and edge selection
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "optimizer/portfolio_selectors.hpp"

#include <limits>

using namespace explorer;
using namespace explorer::optimizer;
using Catch::Matchers::WithinAbs;

/**
 * @class SelectorTestFixture
 * @brief Hand-built population with known extremes and ties
 *
 * Index | Return | Risk  | Sharpe (rf = 0)
 *   0   | 0.05   | 0.10  | 0.5
 *   1   | 0.12   | 0.10  | 1.2   <- max Sharpe, first of a tie
 *   2   | 0.04   | 0.05  | 0.8   <- min risk, first of a tie
 *   3   | 0.24   | 0.20  | 1.2   (ties index 1)
 *   4   | 0.02   | 0.05  | 0.4   (ties index 2 on risk)
 *   5   | 0.03   | 0.0505| ~0.594
 */
class SelectorTestFixture
{
protected:
    FrontierPopulation population_;

    SelectorTestFixture()
    {
        std::vector<PortfolioPoint> points;
        add(points, 0.05, 0.10, 0.2);
        add(points, 0.12, 0.10, 0.4);
        add(points, 0.04, 0.05, 0.6);
        add(points, 0.24, 0.20, 0.8);
        add(points, 0.02, 0.05, 0.1);
        add(points, 0.03, 0.0505, 0.3);
        population_ = FrontierPopulation(std::move(points), {"X", "Y"}, 0.0);
    }

    static void add(std::vector<PortfolioPoint> &points, double ret, double risk, double wx)
    {
        Eigen::VectorXd w(2);
        w << wx, 1.0 - wx;
        points.push_back(make_point(w, ret, risk, 0.0));
    }
};

TEST_CASE_METHOD(SelectorTestFixture, "Max Sharpe selection", "[PortfolioSelectors]")
{
    SECTION("First of tied maxima wins")
    {
        REQUIRE(max_sharpe_index(population_) == 1);
        REQUIRE(&max_sharpe(population_) == &population_[1]);
    }

    SECTION("No point beats the selection")
    {
        const double best = max_sharpe(population_).sharpe_ratio;
        for (const auto &point : population_)
        {
            REQUIRE(point.sharpe_ratio <= best);
        }
    }
}

TEST_CASE_METHOD(SelectorTestFixture, "Min risk selection", "[PortfolioSelectors]")
{
    SECTION("First of tied minima wins")
    {
        REQUIRE(min_risk_index(population_) == 2);
        REQUIRE(&min_risk(population_) == &population_[2]);
    }

    SECTION("No point is below the selection")
    {
        const double floor_risk = min_risk(population_).risk;
        for (const auto &point : population_)
        {
            REQUIRE(point.risk >= floor_risk);
        }
    }
}

TEST_CASE_METHOD(SelectorTestFixture, "Near min-risk edge", "[PortfolioSelectors]")
{
    SECTION("Default threshold includes points within 0.001")
    {
        auto indices = near_min_risk_edge_indices(population_);
        REQUIRE(indices == std::vector<size_t>{2, 4, 5});

        auto edge = near_min_risk_edge(population_);
        REQUIRE(edge.size() == 3);
        REQUIRE_THAT(edge[2].risk, WithinAbs(0.0505, 1e-15));
    }

    SECTION("Zero threshold returns exactly the minima")
    {
        REQUIRE(near_min_risk_edge_indices(population_, 0.0) == std::vector<size_t>{2, 4});
    }

    SECTION("Wide threshold returns everything")
    {
        REQUIRE(near_min_risk_edge_indices(population_, 1.0).size() == population_.size());
    }

    SECTION("Invalid thresholds")
    {
        REQUIRE_THROWS_AS(near_min_risk_edge_indices(population_, -0.001), std::invalid_argument);
        REQUIRE_THROWS_AS(near_min_risk_edge(population_, std::numeric_limits<double>::quiet_NaN()),
                          std::invalid_argument);
    }
}

TEST_CASE("Selectors on an empty population", "[PortfolioSelectors]")
{
    FrontierPopulation empty;

    REQUIRE_THROWS_AS(max_sharpe_index(empty), EmptyPopulationError);
    REQUIRE_THROWS_AS(min_risk(empty), EmptyPopulationError);
    REQUIRE_THROWS_AS(near_min_risk_edge(empty), EmptyPopulationError);
}

TEST_CASE("Selectors on a zero-sample draw", "[PortfolioSelectors][FrontierSampler]")
{
    risk::StatisticsBundle stats;
    stats.tickers = {"A", "B"};
    stats.mean_returns = Eigen::Vector2d(0.08, 0.04);
    stats.covariance = Eigen::Matrix2d::Identity() * 0.04;
    stats.num_observations = 252;

    SamplerConfig config;
    config.seed = 42;
    FrontierPopulation drawn = FrontierSampler(config).sample(stats, 0);
    REQUIRE(drawn.empty());

    REQUIRE_THROWS_AS(max_sharpe(drawn), EmptyPopulationError);
    REQUIRE_THROWS_AS(min_risk(drawn), EmptyPopulationError);
    REQUIRE_THROWS_AS(near_min_risk_edge(drawn), EmptyPopulationError);
    REQUIRE_THROWS_AS(near_min_risk_edge_indices(drawn), EmptyPopulationError);
}

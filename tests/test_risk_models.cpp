/**
 * @file test_risk_models.cpp
 * @brief Unit tests for SampleMoments and StatisticsBuilder
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "risk/sample_moments.hpp"
#include "risk/statistics_builder.hpp"

#include <cmath>
#include <limits>
#include <memory>

using namespace explorer;
using namespace explorer::risk;
using Catch::Matchers::WithinAbs;

// Shared return and price data
class RiskModelTestFixture
{
protected:
    // Two observations of three assets
    Eigen::MatrixXd returns_2x3_;

    // Four dates, two assets, hand-checkable returns
    PriceTable small_table_;

    RiskModelTestFixture()
    {
        returns_2x3_ = Eigen::MatrixXd(2, 3);
        returns_2x3_ << 0.01, 0.02, -0.01,
            0.02, -0.01, 0.01;

        Eigen::MatrixXd prices(4, 2);
        prices << 100.0, 200.0,
            110.0, 210.0,
            99.0, 220.5,
            108.9, 220.5;
        small_table_ = PriceTable(prices,
                                  {"2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"},
                                  {"AAA", "BBB"});
    }
};

TEST_CASE_METHOD(RiskModelTestFixture, "SampleMoments estimates", "[RiskModel][SampleMoments]")
{
    SECTION("Defaults to the unbiased estimator")
    {
        SampleMoments est;
        REQUIRE(est.get_normalization() == SampleMoments::Normalization::UNBIASED);
        REQUIRE(est.get_name() == "SampleMoments(unbiased)");
    }

    SECTION("Unbiased moments")
    {
        ReturnMoments m = SampleMoments().estimate(returns_2x3_);

        REQUIRE(m.observations == 2);
        REQUIRE(m.mean.size() == 3);
        REQUIRE_THAT(m.mean(0), WithinAbs(0.015, 1e-15));
        REQUIRE_THAT(m.mean(1), WithinAbs(0.005, 1e-15));

        REQUIRE(m.covariance.rows() == 3);
        REQUIRE((m.covariance - m.covariance.transpose()).norm() == 0.0);

        // Variance of {0.01, 0.02} with T-1: 0.00005
        REQUIRE_THAT(m.covariance(0, 0), WithinAbs(0.00005, 1e-12));
        // Covariance of {0.01, 0.02} and {0.02, -0.01}: -0.00015
        REQUIRE_THAT(m.covariance(0, 1), WithinAbs(-0.00015, 1e-12));
        REQUIRE_THAT(m.volatilities()(0), WithinAbs(std::sqrt(0.00005), 1e-12));
    }

    SECTION("Maximum likelihood divides by T")
    {
        SampleMoments mle(SampleMoments::Normalization::MAXIMUM_LIKELIHOOD);
        ReturnMoments a = mle.estimate(returns_2x3_);
        ReturnMoments b = SampleMoments().estimate(returns_2x3_);

        REQUIRE_THAT(b.covariance(0, 0) / a.covariance(0, 0), WithinAbs(2.0, 1e-9));
        REQUIRE(a.mean == b.mean);
        REQUIRE(mle.get_name() == "SampleMoments(mle)");
    }

    SECTION("Scaling annualizes both moments")
    {
        ReturnMoments m = SampleMoments().estimate(returns_2x3_).scaled(252.0);
        REQUIRE_THAT(m.mean(0), WithinAbs(0.015 * 252.0, 1e-12));
        REQUIRE_THAT(m.covariance(0, 0), WithinAbs(0.00005 * 252.0, 1e-12));
        REQUIRE(m.observations == 2);
        REQUIRE_THROWS_AS(m.scaled(0.0), std::invalid_argument);
    }
}

TEST_CASE_METHOD(RiskModelTestFixture, "SampleMoments error handling", "[RiskModel][SampleMoments]")
{
    SampleMoments est;

    SECTION("No assets")
    {
        Eigen::MatrixXd empty(5, 0);
        REQUIRE_THROWS_AS(est.estimate(empty), std::invalid_argument);
    }

    SECTION("Single observation")
    {
        Eigen::MatrixXd single_obs(1, 3);
        single_obs << 0.01, 0.02, 0.03;
        REQUIRE_THROWS_AS(est.estimate(single_obs), InsufficientDataError);

        SampleMoments mle(SampleMoments::Normalization::MAXIMUM_LIKELIHOOD);
        REQUIRE(mle.estimate(single_obs).covariance.isZero());
    }

    SECTION("Non-finite returns")
    {
        Eigen::MatrixXd bad = returns_2x3_;
        bad(1, 2) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(est.estimate(bad), std::invalid_argument);
    }
}

TEST_CASE_METHOD(RiskModelTestFixture, "StatisticsBuilder accepts another estimator", "[RiskModel][StatisticsBuilder]")
{
    auto mle = std::make_shared<SampleMoments>(SampleMoments::Normalization::MAXIMUM_LIKELIHOOD);
    StatisticsBuilder builder(TRADING_DAYS_PER_YEAR, mle);
    REQUIRE(builder.get_estimator().get_name() == "SampleMoments(mle)");

    StatisticsBundle a = builder.build(small_table_);
    StatisticsBundle b = StatisticsBuilder().build(small_table_);

    // Three returns: T / (T - 1) = 1.5
    REQUIRE_THAT(b.covariance(1, 1) / a.covariance(1, 1), WithinAbs(1.5, 1e-9));
    REQUIRE(StatisticsBuilder().get_estimator().get_name() == "SampleMoments(unbiased)");
}

TEST_CASE_METHOD(RiskModelTestFixture, "StatisticsBuilder annualizes mean and covariance", "[RiskModel][StatisticsBuilder]")
{
    StatisticsBuilder builder;
    StatisticsBundle stats = builder.build(small_table_);

    REQUIRE(stats.tickers == small_table_.get_tickers());
    REQUIRE(stats.num_assets() == 2);
    REQUIRE(stats.num_observations == 3);

    SECTION("Periodic returns")
    {
        Eigen::MatrixXd r = builder.periodic_returns(small_table_);
        REQUIRE(r.rows() == 3);
        REQUIRE_THAT(r(0, 0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(r(1, 0), WithinAbs(-0.10, 1e-12));
        REQUIRE_THAT(r(2, 0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(r(0, 1), WithinAbs(0.05, 1e-12));
        REQUIRE_THAT(r(2, 1), WithinAbs(0.0, 1e-12));
    }

    SECTION("Mean return is column mean times 252")
    {
        // AAA: (0.1 - 0.1 + 0.1) / 3
        REQUIRE_THAT(stats.mean_returns(0), WithinAbs(0.1 / 3.0 * 252.0, 1e-9));
        // BBB: (0.05 + 0.05 + 0) / 3
        REQUIRE_THAT(stats.mean_returns(1), WithinAbs(0.1 / 3.0 * 252.0, 1e-9));
    }

    SECTION("Covariance is unbiased sample covariance times 252")
    {
        // AAA returns 0.1, -0.1, 0.1: mean 1/30, deviations 2/30, -4/30, 2/30
        double var_a = (4.0 + 16.0 + 4.0) / 900.0 / 2.0;
        REQUIRE_THAT(stats.covariance(0, 0), WithinAbs(var_a * 252.0, 1e-9));

        REQUIRE((stats.covariance - stats.covariance.transpose()).norm() == 0.0);
        for (Eigen::Index i = 0; i < stats.covariance.rows(); ++i)
        {
            REQUIRE(stats.covariance(i, i) >= 0.0);
        }
    }

    SECTION("Portfolio return and risk")
    {
        Eigen::VectorXd w(2);
        w << 1.0, 0.0;
        REQUIRE_THAT(stats.expected_return(w), WithinAbs(stats.mean_returns(0), 1e-12));
        REQUIRE_THAT(stats.portfolio_risk(w), WithinAbs(std::sqrt(stats.covariance(0, 0)), 1e-12));

        Eigen::VectorXd wrong(3);
        wrong << 0.2, 0.3, 0.5;
        REQUIRE_THROWS_AS(stats.portfolio_risk(wrong), std::invalid_argument);
        REQUIRE_THROWS_AS(stats.expected_return(wrong), std::invalid_argument);
    }
}

TEST_CASE("StatisticsBuilder on generated history", "[RiskModel][StatisticsBuilder]")
{
    auto table = DataLoader::generate_synthetic_data({"A", "B", "C", "D"}, 300);
    StatisticsBundle stats = StatisticsBuilder().build(table);

    REQUIRE(stats.mean_returns.size() == 4);
    REQUIRE(stats.covariance.rows() == 4);
    REQUIRE(stats.num_observations == 299);
    REQUIRE((stats.covariance - stats.covariance.transpose()).norm() == 0.0);

    // PSD: no materially negative eigenvalue
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(stats.covariance);
    REQUIRE(solver.eigenvalues().minCoeff() > -1e-12);
}

TEST_CASE("StatisticsBuilder error handling", "[RiskModel][StatisticsBuilder]")
{
    StatisticsBuilder builder;

    SECTION("Rejects non-positive annualization")
    {
        REQUIRE_THROWS_AS(StatisticsBuilder(0), std::invalid_argument);
    }

    SECTION("No assets")
    {
        PriceTable empty(Eigen::MatrixXd(3, 0), {"2024-01-02", "2024-01-03", "2024-01-04"}, {});
        REQUIRE_THROWS_AS(builder.build(empty), InsufficientDataError);
    }

    SECTION("Single price row")
    {
        Eigen::MatrixXd prices(1, 1);
        prices << 100.0;
        PriceTable table(prices, {"2024-01-02"}, {"AAA"});
        REQUIRE_THROWS_AS(builder.build(table), InsufficientDataError);
    }

    SECTION("Two price rows give only one return")
    {
        Eigen::MatrixXd prices(2, 1);
        prices << 100.0, 101.0;
        PriceTable table(prices, {"2024-01-02", "2024-01-03"}, {"AAA"});
        REQUIRE_THROWS_AS(builder.build(table), InsufficientDataError);
    }

    SECTION("Rows with missing prices are dropped before counting")
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        Eigen::MatrixXd prices(3, 2);
        prices << 100.0, 50.0,
            101.0, nan,
            102.0, 51.0;
        PriceTable table(prices, {"2024-01-02", "2024-01-03", "2024-01-04"}, {"AAA", "BBB"});
        REQUIRE_THROWS_AS(builder.build(table), InsufficientDataError);
    }

    SECTION("Engine errors share a catchable base")
    {
        Eigen::MatrixXd prices(1, 1);
        prices << 100.0;
        PriceTable table(prices, {"2024-01-02"}, {"AAA"});
        REQUIRE_THROWS_AS(builder.build(table), EngineError);
    }
}

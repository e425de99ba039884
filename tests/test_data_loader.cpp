/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader CSV handling and configuration
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>

using namespace explorer;
using Catch::Matchers::WithinAbs;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("explorer_loader_" + name)).string();
}

std::string write_file(const std::string& name, const std::string& content) {
    std::string path = temp_path(name);
    std::ofstream out(path);
    out << content;
    return path;
}

}  // namespace

TEST_CASE("Wide CSV loading", "[DataLoader]") {
    std::string path = write_file("wide.csv",
        "date,AAPL,MSFT\n"
        "2020-01-03,102.0,152.0\n"
        "2020-01-01,100.0,150.0\n"
        "2020-01-02,101.0,\n"
        "\n");

    auto table = DataLoader::load_csv(path);

    REQUIRE(table.num_dates() == 3);
    REQUIRE(table.get_tickers() == std::vector<std::string>{"AAPL", "MSFT"});

    SECTION("Rows are sorted by date") {
        REQUIRE(table.get_dates().front() == "2020-01-01");
        REQUIRE(table.get_dates().back() == "2020-01-03");
        REQUIRE_THAT(table.get_prices()(0, 0), WithinAbs(100.0, 1e-12));
    }

    SECTION("Empty cells become missing values") {
        REQUIRE(std::isnan(table.get_prices()(1, 1)));
        REQUIRE(table.count_missing() == 1);
    }

    std::filesystem::remove(path);
}

TEST_CASE("Long CSV loading", "[DataLoader]") {
    std::string path = write_file("long.csv",
        "date,ticker,price\n"
        "2020-01-01,MSFT,150.0\n"
        "2020-01-01,AAPL,100.0\n"
        "2020-01-02,AAPL,101.0\n");

    auto table = DataLoader::load_csv(path);

    REQUIRE(table.num_dates() == 2);
    REQUIRE(table.get_tickers() == std::vector<std::string>{"AAPL", "MSFT"});
    REQUIRE_THAT(table.get_prices("AAPL")(1), WithinAbs(101.0, 1e-12));
    REQUIRE(std::isnan(table.get_prices("MSFT")(1)));

    std::filesystem::remove(path);
}

TEST_CASE("CSV loading errors", "[DataLoader]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_csv(temp_path("does_not_exist.csv")), std::runtime_error);
    }

    SECTION("Header without date column") {
        std::string path = write_file("nodate.csv", "day,AAPL\n2020-01-01,1.0\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv_wide(path), std::runtime_error);
        std::filesystem::remove(path);
    }

    SECTION("Duplicate dates") {
        std::string path = write_file("dup.csv", "date,AAPL\n2020-01-01,1.0\n2020-01-01,2.0\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv_wide(path), std::runtime_error);
        std::filesystem::remove(path);
    }
}

TEST_CASE("Wide CSV export preserves prices", "[DataLoader]") {
    Eigen::MatrixXd prices(2, 2);
    prices << 100.123456789, 50.5,
              101.987654321, 51.25;
    PriceTable table(prices, {"2021-06-01", "2021-06-02"}, {"GLD", "BND"});

    std::string path = temp_path("export.csv");
    DataLoader::save_csv_wide(table, path);
    auto loaded = DataLoader::load_csv_wide(path);

    REQUIRE(loaded.get_tickers() == table.get_tickers());
    REQUIRE(loaded.get_dates() == table.get_dates());
    REQUIRE(loaded.get_prices()(0, 0) == prices(0, 0));
    REQUIRE(loaded.get_prices()(1, 0) == prices(1, 0));

    std::filesystem::remove(path);
}

TEST_CASE("DataLoader synthetic data", "[DataLoader]") {
    std::vector<std::string> tickers = {"AAPL", "MSFT", "GOOGL"};

    auto data = DataLoader::generate_synthetic_data(tickers, 100, "2020-01-01");

    REQUIRE(data.num_dates() == 100);
    REQUIRE(data.num_assets() == 3);
    REQUIRE(data.is_complete());
    REQUIRE_THAT(data.get_prices()(0, 0), WithinAbs(100.0, 1e-12));

    SECTION("Only business days") {
        for (const auto& date : data.get_dates()) {
            int dow = DataLoader::day_of_week(date);
            REQUIRE(dow != 0);
            REQUIRE(dow != 6);
        }
    }

    SECTION("Same seed, same prices") {
        auto again = DataLoader::generate_synthetic_data(tickers, 100, "2020-01-01");
        REQUIRE(again.get_prices() == data.get_prices());
    }
}

TEST_CASE("Date helpers", "[DataLoader]") {
    REQUIRE(DataLoader::day_of_week("2024-01-07") == 0);  // Sunday
    REQUIRE(DataLoader::day_of_week("2024-01-08") == 1);  // Monday
    REQUIRE(DataLoader::add_days("2024-02-28", 1) == "2024-02-29");
    REQUIRE(DataLoader::add_days("2023-02-28", 1) == "2023-03-01");
    REQUIRE(DataLoader::add_days("2024-12-31", 1) == "2025-01-01");
    REQUIRE(DataLoader::add_days("2024-01-01", -1) == "2023-12-31");
}

TEST_CASE("CSV field helpers", "[DataLoader]") {
    auto fields = DataLoader::parse_csv_line("2020-01-01,\"1,5\", 2.5 ");
    REQUIRE(fields.size() == 3);
    REQUIRE(fields[1] == "1,5");
    REQUIRE(DataLoader::trim(fields[2]) == "2.5");

    REQUIRE_THAT(DataLoader::safe_stod(" 3.25 "), WithinAbs(3.25, 1e-12));
    REQUIRE(std::isnan(DataLoader::safe_stod("")));
    REQUIRE(std::isnan(DataLoader::safe_stod("n/a")));
    REQUIRE(std::isnan(DataLoader::safe_stod("12abc")));
}

TEST_CASE("Count parsing respects the target range", "[DataLoader]") {
    const std::uint64_t int_max = static_cast<std::uint64_t>(std::numeric_limits<int>::max());

    SECTION("Plain counts parse") {
        REQUIRE(DataLoader::parse_count("0", int_max) == std::optional<std::uint64_t>(0));
        REQUIRE(DataLoader::parse_count("5000", int_max) == std::optional<std::uint64_t>(5000));
        REQUIRE(DataLoader::parse_count("2147483647", int_max) == std::optional<std::uint64_t>(int_max));
    }

    SECTION("Values past the maximum are rejected instead of wrapping") {
        // 2^32 + 1 would truncate to 1 as a 32-bit int
        REQUIRE_FALSE(DataLoader::parse_count("4294967297", int_max).has_value());
        REQUIRE_FALSE(DataLoader::parse_count("2147483648", int_max).has_value());
        REQUIRE_FALSE(DataLoader::parse_count("99999999999999999999999", UINT64_MAX).has_value());
    }

    SECTION("Full 64-bit range for seeds") {
        REQUIRE(DataLoader::parse_count("18446744073709551615", UINT64_MAX) ==
                std::optional<std::uint64_t>(UINT64_MAX));
    }

    SECTION("Signs, blanks and junk are rejected") {
        REQUIRE_FALSE(DataLoader::parse_count("-1", int_max).has_value());
        REQUIRE_FALSE(DataLoader::parse_count("+7", int_max).has_value());
        REQUIRE_FALSE(DataLoader::parse_count("", int_max).has_value());
        REQUIRE_FALSE(DataLoader::parse_count(" 7", int_max).has_value());
        REQUIRE_FALSE(DataLoader::parse_count("12abc", int_max).has_value());
    }
}

TEST_CASE("JSON configuration loading", "[DataLoader]") {
    SECTION("Missing file throws") {
        REQUIRE_THROWS(DataLoader::load_config("nonexistent_config.json"));
    }

    SECTION("Defaults are the sample portfolio") {
        DataConfig config = DataConfig::defaults();
        REQUIRE(config.universe.size() == 9);
        REQUIRE_THAT(config.allocations.at("AAPL"), WithinAbs(0.20, 1e-12));
        REQUIRE_THAT(config.allocations.at("BND"), WithinAbs(0.05, 1e-12));
        REQUIRE(config.lookback_years == 5);
        REQUIRE_THAT(config.min_coverage, WithinAbs(0.9, 1e-12));
        REQUIRE(config.max_attempts == 3);
    }

    SECTION("Full configuration file") {
        std::string path = write_file("config.json", R"({
            "data": {
                "universe": ["AAA", "BBB"],
                "data_file": "prices.csv",
                "cache_file": "",
                "end_date": "2024-06-28",
                "lookback_years": 2
            },
            "sampler": {
                "num_portfolios": 250,
                "risk_free_rate": 0.01,
                "seed": 99,
                "weight_scheme": "dirichlet"
            },
            "selection": { "edge_threshold": 0.002 }
        })");

        ExplorerConfig config = DataLoader::load_config(path);

        REQUIRE(config.data.universe == std::vector<std::string>{"AAA", "BBB"});
        // No allocations given: equal holdings of the custom universe
        REQUIRE(config.data.allocations.size() == 2);
        REQUIRE_THAT(config.data.allocations.at("AAA"), WithinAbs(1.0, 1e-12));
        REQUIRE(config.data.cache_file.empty());
        REQUIRE(config.data.end_date == "2024-06-28");
        REQUIRE(config.data.lookback_years == 2);
        REQUIRE(config.sampler.num_portfolios == 250);
        REQUIRE_THAT(config.sampler.risk_free_rate, WithinAbs(0.01, 1e-12));
        REQUIRE(config.sampler.seed.has_value());
        REQUIRE(*config.sampler.seed == 99u);
        REQUIRE(config.sampler.scheme == optimizer::WeightScheme::DIRICHLET);
        REQUIRE_THAT(config.edge_threshold, WithinAbs(0.002, 1e-12));

        std::filesystem::remove(path);
    }

    SECTION("Out-of-range values are rejected") {
        std::string bad_years = write_file("bad_years.json", R"({"data": {"lookback_years": 0}})");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad_years), std::invalid_argument);
        std::filesystem::remove(bad_years);

        std::string bad_samples = write_file("bad_samples.json", R"({"sampler": {"num_portfolios": -5}})");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad_samples), std::invalid_argument);
        std::filesystem::remove(bad_samples);

        std::string bad_scheme = write_file("bad_scheme.json", R"({"sampler": {"weight_scheme": "sobol"}})");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad_scheme), std::invalid_argument);
        std::filesystem::remove(bad_scheme);

        std::string bad_edge = write_file("bad_edge.json", R"({"selection": {"edge_threshold": -0.1}})");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad_edge), std::invalid_argument);
        std::filesystem::remove(bad_edge);
    }

    SECTION("Malformed JSON") {
        std::string path = write_file("broken.json", "{ \"data\": ");
        REQUIRE_THROWS_AS(DataLoader::load_config(path), std::runtime_error);
        std::filesystem::remove(path);
    }
}

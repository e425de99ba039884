/**
 * @file generate_synthetic_data.cpp
 * @brief Generate synthetic price history for the sample portfolio
 */

#include "data/data_loader.hpp"
#include "risk/statistics_builder.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

using namespace explorer;

namespace {

struct AssetProfile {
    const char* ticker;
    double volatility;  // daily
    double drift;       // daily
};

// Rough daily risk/return character of the sample portfolio's asset classes
const AssetProfile PROFILES[] = {
    {"AAPL", 0.019, 0.0009},   // Large-cap tech
    {"MSFT", 0.017, 0.0008},   // Large-cap tech
    {"JNJ",  0.011, 0.0003},   // Healthcare
    {"GLD",  0.009, 0.0003},   // Gold
    {"SLV",  0.018, 0.0003},   // Silver
    {"DBA",  0.010, 0.0002},   // Agriculture
    {"XOM",  0.017, 0.0005},   // Energy
    {"VTI",  0.012, 0.0005},   // Total market
    {"BND",  0.004, 0.0001}    // Bonds
};

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Data Generator ===\n" << std::endl;

    // 5 years of trading days, enough to pass the default coverage check
    size_t num_days = 5 * 252;
    std::string start_date = "2021-10-18";
    std::string output_file = "data/market/historical_prices.csv";
    double volatility_scale = 1.0;
    unsigned int seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "--start" && i + 1 < argc) {
            start_date = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            num_days = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--volatility-scale" && i + 1 < argc) {
            volatility_scale = std::stod(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output FILE            Output CSV file (default: data/market/historical_prices.csv)\n"
                      << "  --start DATE             First trading day (default: 2021-10-18)\n"
                      << "  --days N                 Trading days to generate (default: 1260)\n"
                      << "  --volatility-scale VAL   Multiplier on every asset's volatility (default: 1.0)\n"
                      << "  --seed N                 Random seed (default: 42)\n"
                      << "  --help                   Show this help\n";
            return 0;
        }
    }

    const size_t num_assets = sizeof(PROFILES) / sizeof(PROFILES[0]);

    std::cout << "Generating data for " << num_assets << " assets..." << std::endl;
    std::cout << "Start date: " << start_date << std::endl;
    std::cout << "Trading days: " << num_days << std::endl;

    try {
        // Each asset is an independent random walk with its own profile
        Eigen::MatrixXd prices(static_cast<Eigen::Index>(num_days), static_cast<Eigen::Index>(num_assets));
        std::vector<std::string> tickers;
        std::vector<std::string> dates;

        for (size_t a = 0; a < num_assets; ++a) {
            const AssetProfile& profile = PROFILES[a];
            PriceTable single = DataLoader::generate_synthetic_data(
                {profile.ticker},
                num_days,
                start_date,
                profile.volatility * volatility_scale,
                profile.drift,
                seed + static_cast<unsigned int>(a));

            prices.col(static_cast<Eigen::Index>(a)) = single.get_prices().col(0);
            tickers.push_back(profile.ticker);
            if (dates.empty()) {
                dates = single.get_dates();
            }
        }

        PriceTable data(prices, dates, tickers);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        std::filesystem::path parent = std::filesystem::path(output_file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        DataLoader::save_csv_wide(data, output_file);

        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << "Dates: " << data.num_dates() << " ("
                  << data.get_dates().front() << " to "
                  << data.get_dates().back() << ")\n";
        std::cout << "Assets: " << data.num_assets() << "\n";

        risk::StatisticsBuilder builder;
        risk::StatisticsBundle stats = builder.build(data);
        stats.print_summary();
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nData generation complete!\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/bin/portfolio_explorer --data " << output_file << " --verbose\n";
    std::cout << std::endl;

    return 0;
}

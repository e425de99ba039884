/**
 * @file data_loader.hpp
 * @brief Data loading, export and configuration utilities
 *
 * Provides functionality to load price history from CSV files, write price
 * tables back to CSV, and read the application configuration from JSON.
 */

#ifndef EXPLORER_DATA_DATA_LOADER_HPP
#define EXPLORER_DATA_DATA_LOADER_HPP

#include "data/asset_info.hpp"
#include "data/price_table.hpp"
#include "optimizer/efficient_frontier.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace explorer
{

    /**
     * @struct DataConfig
     * @brief Where price history comes from and which assets to analyse.
     */
    struct DataConfig
    {
        std::vector<std::string> universe;          ///< Requested ticker symbols
        std::map<std::string, double> allocations;  ///< User allocation per ticker (fraction or percent)
        std::string data_file;                      ///< CSV price source
        std::string cache_file;                     ///< Cached aligned price table (empty disables caching)
        std::string end_date;                       ///< Lookback window end (empty = latest available)
        int lookback_years;                         ///< Lookback window length in years
        double min_coverage;                        ///< Required fraction of 252 * years observations
        int max_attempts;                           ///< Fetch attempts per asset

        /**
         * @brief Default configuration: the sample nine-asset portfolio.
         */
        static DataConfig defaults();

        /**
         * @brief Load from JSON object, filling unspecified fields with defaults.
         * @throws std::invalid_argument if a value is out of range.
         */
        static DataConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct ExplorerConfig
     * @brief Complete application configuration
     */
    struct ExplorerConfig
    {
        DataConfig data = DataConfig::defaults();
        optimizer::SamplerConfig sampler;
        double edge_threshold = 0.001; ///< Risk band for the near-minimum-risk edge
        AssetDirectory assets = AssetDirectory::defaults(); ///< Built-ins plus "asset_names"

        /**
         * @brief Load complete configuration from JSON file
         */
        static ExplorerConfig load_from_file(const std::string &config_path);
    };

    /**
     * @class DataLoader
     * @brief Loads and writes price history and configuration files
     *
     * Supports CSV files with standard formats:
     * - Wide format: date, ticker1, ticker2, ...
     * - Long format: date, ticker, price
     */
    class DataLoader
    {
    public:
        DataLoader() = default;
        ~DataLoader() = default;

        // ========================================================================
        // CSV Loading Methods
        // ========================================================================

        /**
         * @brief Load price history from CSV file (wide format)
         *
         * Expected format:
         * date,AAPL,MSFT,JPM,...
         * 2020-01-02,150.0,200.0,120.0,...
         *
         * Empty or unparsable cells become NaN. Rows with an invalid date are
         * skipped. Rows are sorted by date; a repeated date is an error.
         *
         * @param filepath Path to CSV file
         * @return PriceTable (may contain missing cells)
         * @throws std::runtime_error if file cannot be loaded
         */
        static PriceTable load_csv_wide(const std::string &filepath);

        /**
         * @brief Load price history from CSV file (long format)
         *
         * Expected format:
         * date,ticker,price
         * 2020-01-02,AAPL,150.0
         *
         * @param filepath Path to CSV file
         * @return PriceTable with tickers in alphabetical order
         * @throws std::runtime_error if file cannot be loaded
         */
        static PriceTable load_csv_long(const std::string &filepath);

        /**
         * @brief Auto-detect CSV format and load
         */
        static PriceTable load_csv(const std::string &filepath);

        // ========================================================================
        // Export Methods
        // ========================================================================

        /**
         * @brief Save price table to CSV (wide format). Missing cells are written empty.
         * @throws std::runtime_error if the file cannot be written
         */
        static void save_csv_wide(const PriceTable &table, const std::string &filepath);

        // ========================================================================
        // Configuration Loading
        // ========================================================================

        /**
         * @brief Load JSON file
         * @throws std::runtime_error if file cannot be opened or parsed
         */
        static nlohmann::json load_json(const std::string &filepath);

        /**
         * @brief Load complete application configuration
         */
        static ExplorerConfig load_config(const std::string &config_path);

        // ========================================================================
        // Data Generation (for testing)
        // ========================================================================

        /**
         * @brief Generate synthetic price history on business days
         * @param tickers List of ticker symbols
         * @param num_days Number of trading days
         * @param start_date First date (YYYY-MM-DD); weekends are skipped
         * @param volatility Daily volatility (default 0.02)
         * @param drift Daily drift (default 0.0005)
         * @param seed Random seed
         * @return PriceTable with synthetic prices starting at 100
         */
        static PriceTable generate_synthetic_data(
            const std::vector<std::string> &tickers,
            size_t num_days,
            const std::string &start_date = "2020-01-01",
            double volatility = 0.02,
            double drift = 0.0005,
            unsigned int seed = 42);

        // ========================
        // Helpers
        // ========================

        /**
         * @brief Parse CSV line into tokens (double quotes group commas)
         */
        static std::vector<std::string> parse_csv_line(const std::string &line);

        /**
         * @brief Trim whitespace from string
         */
        static std::string trim(const std::string &str);

        /**
         * @brief Convert string to double, NaN if conversion fails
         */
        static double safe_stod(const std::string &str);

        /**
         * @brief Parse a non-negative decimal integer no larger than max_value
         * @return std::nullopt on signs, non-digits, an empty string or overflow
         */
        static std::optional<std::uint64_t> parse_count(const std::string &str,
                                                        std::uint64_t max_value);

        /**
         * @brief Shift a YYYY-MM-DD date by a number of calendar days
         */
        static std::string add_days(const std::string &date, int days_offset);

        /**
         * @brief Day of week for a YYYY-MM-DD date (0 = Sunday)
         */
        static int day_of_week(const std::string &date);
    };

} // namespace explorer

#endif // EXPLORER_DATA_DATA_LOADER_HPP

/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

namespace explorer
{

    namespace
    {
        // Civil-date conversions on the proleptic Gregorian calendar, day 0 = 1970-01-01
        long days_from_civil(int y, unsigned m, unsigned d)
        {
            y -= m <= 2;
            const long era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<long>(doe) - 719468;
        }

        std::string civil_from_days(long z)
        {
            z += 719468;
            const long era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            const unsigned d = doy - (153 * mp + 2) / 5 + 1;
            const unsigned m = mp < 10 ? mp + 3 : mp - 9;
            const long y = static_cast<long>(yoe) + era * 400 + (m <= 2);

            std::ostringstream out;
            out << std::setfill('0') << std::setw(4) << y << "-"
                << std::setw(2) << m << "-" << std::setw(2) << d;
            return out.str();
        }

        long to_day_number(const std::string &date)
        {
            if (!PriceTable::is_valid_date(date))
            {
                throw std::invalid_argument("Invalid date: '" + date + "'");
            }
            return days_from_civil(std::stoi(date.substr(0, 4)),
                                   static_cast<unsigned>(std::stoi(date.substr(5, 2))),
                                   static_cast<unsigned>(std::stoi(date.substr(8, 2))));
        }

        PriceTable build_sorted_table(std::vector<std::pair<std::string, std::vector<double>>> rows,
                                      const std::vector<std::string> &tickers)
        {
            std::stable_sort(rows.begin(), rows.end(),
                             [](const auto &a, const auto &b)
                             { return a.first < b.first; });

            Eigen::MatrixXd prices(static_cast<Eigen::Index>(rows.size()),
                                   static_cast<Eigen::Index>(tickers.size()));
            std::vector<std::string> dates;
            dates.reserve(rows.size());

            for (size_t i = 0; i < rows.size(); ++i)
            {
                if (i > 0 && rows[i].first == rows[i - 1].first)
                {
                    throw std::runtime_error("Duplicate date in CSV: " + rows[i].first);
                }
                dates.push_back(rows[i].first);
                for (size_t j = 0; j < tickers.size(); ++j)
                {
                    prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i].second[j];
                }
            }

            return PriceTable(prices, dates, tickers);
        }
    } // anonymous namespace

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::defaults()
    {
        DataConfig config;
        config.universe = {"AAPL", "MSFT", "JNJ", "GLD", "SLV", "DBA", "XOM", "VTI", "BND"};
        config.allocations = {
            {"AAPL", 0.20}, {"MSFT", 0.15}, {"JNJ", 0.10}, {"GLD", 0.15}, {"SLV", 0.08},
            {"DBA", 0.07}, {"XOM", 0.10}, {"VTI", 0.10}, {"BND", 0.05}};
        config.data_file = "data/market/historical_prices.csv";
        config.cache_file = "data/cache/price_cache.csv";
        config.end_date = "";
        config.lookback_years = 5;
        config.min_coverage = 0.9;
        config.max_attempts = 3;
        return config;
    }

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config = defaults();
        config.universe = j.value("universe", config.universe);
        config.data_file = j.value("data_file", config.data_file);
        config.cache_file = j.value("cache_file", config.cache_file);
        config.end_date = j.value("end_date", config.end_date);
        config.lookback_years = j.value("lookback_years", config.lookback_years);
        config.min_coverage = j.value("min_coverage", config.min_coverage);
        config.max_attempts = j.value("max_attempts", config.max_attempts);

        if (j.contains("allocations"))
        {
            config.allocations = j["allocations"].get<std::map<std::string, double>>();
        }
        else if (j.contains("universe"))
        {
            // A custom universe without allocations is held equally
            config.allocations.clear();
            for (const auto &ticker : config.universe)
            {
                config.allocations[ticker] = 1.0;
            }
        }

        if (config.universe.empty())
        {
            throw std::invalid_argument("Data configuration must list at least one ticker");
        }
        if (config.lookback_years <= 0)
        {
            throw std::invalid_argument("lookback_years must be positive, got: " +
                                        std::to_string(config.lookback_years));
        }
        if (config.min_coverage < 0.0 || config.min_coverage > 1.0)
        {
            throw std::invalid_argument("min_coverage must be in [0, 1]");
        }
        if (config.max_attempts < 1)
        {
            throw std::invalid_argument("max_attempts must be at least 1");
        }
        if (!config.end_date.empty() && !PriceTable::is_valid_date(config.end_date))
        {
            throw std::invalid_argument("Invalid end_date: '" + config.end_date + "'");
        }

        return config;
    }

    ExplorerConfig ExplorerConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading - Wide Format
    // ===========================

    PriceTable DataLoader::load_csv_wide(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.empty() || trim(header[0]) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        std::vector<std::string> tickers;
        for (size_t i = 1; i < header.size(); ++i)
        {
            tickers.push_back(trim(header[i]));
        }

        std::vector<std::pair<std::string, std::vector<double>>> rows;

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string date = trim(fields[0]);
            if (!PriceTable::is_valid_date(date))
            {
                continue; // Skip invalid dates
            }

            std::vector<double> row_prices;
            row_prices.reserve(tickers.size());
            for (size_t j = 0; j < tickers.size(); ++j)
            {
                if (j + 1 < fields.size())
                {
                    row_prices.push_back(safe_stod(fields[j + 1]));
                }
                else
                {
                    row_prices.push_back(std::numeric_limits<double>::quiet_NaN());
                }
            }

            rows.emplace_back(date, std::move(row_prices));
        }

        if (rows.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        return build_sorted_table(std::move(rows), tickers);
    }

    // ===========================
    // CSV Loading - Long Format
    // ===========================

    PriceTable DataLoader::load_csv_long(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::map<std::string, std::map<std::string, double>> data_map; // date -> ticker -> price
        std::set<std::string> all_tickers;

        // Skip header
        std::getline(file, line);

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 3)
                continue;

            std::string date = trim(fields[0]);
            std::string ticker = trim(fields[1]);
            if (!PriceTable::is_valid_date(date) || ticker.empty())
                continue;

            data_map[date][ticker] = safe_stod(fields[2]);
            all_tickers.insert(ticker);
        }

        if (data_map.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        std::vector<std::string> tickers(all_tickers.begin(), all_tickers.end());
        std::vector<std::pair<std::string, std::vector<double>>> rows;
        rows.reserve(data_map.size());

        for (const auto &entry : data_map)
        {
            std::vector<double> row_prices(tickers.size(), std::numeric_limits<double>::quiet_NaN());
            for (size_t j = 0; j < tickers.size(); ++j)
            {
                auto it = entry.second.find(tickers[j]);
                if (it != entry.second.end())
                {
                    row_prices[j] = it->second;
                }
            }
            rows.emplace_back(entry.first, std::move(row_prices));
        }

        return build_sorted_table(std::move(rows), tickers);
    }

    // ========================
    // Auto-detect CSV Format
    // ========================

    PriceTable DataLoader::load_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::getline(file, line);
        file.close();

        auto header = parse_csv_line(line);
        for (auto &field : header)
        {
            field = trim(field);
        }

        // Long format: date, ticker, price
        if (header.size() == 3 &&
            (header[1] == "ticker" || header[1] == "symbol"))
        {
            return load_csv_long(filepath);
        }
        return load_csv_wide(filepath);
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_csv_wide(const PriceTable &table, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &ticker : table.get_tickers())
        {
            file << "," << ticker;
        }
        file << "\n";

        const auto &prices = table.get_prices();
        const auto &dates = table.get_dates();

        file << std::setprecision(17);
        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i];
            for (Eigen::Index j = 0; j < prices.cols(); ++j)
            {
                file << ",";
                double p = prices(static_cast<Eigen::Index>(i), j);
                if (!std::isnan(p))
                {
                    file << p;
                }
            }
            file << "\n";
        }

        if (!file)
        {
            throw std::runtime_error("Failed writing file: " + filepath);
        }
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    ExplorerConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        ExplorerConfig config;

        try
        {
            if (j.contains("data"))
            {
                config.data = DataConfig::from_json(j["data"]);
            }

            if (j.contains("sampler"))
            {
                config.sampler = optimizer::SamplerConfig::from_json(j["sampler"]);
            }

            if (j.contains("selection"))
            {
                config.edge_threshold = j["selection"].value("edge_threshold", config.edge_threshold);
            }

            if (j.contains("asset_names"))
            {
                config.assets.merge(AssetDirectory::from_json(j["asset_names"]));
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Invalid configuration in " + config_path + ": " + e.what());
        }

        if (config.edge_threshold < 0.0)
        {
            throw std::invalid_argument("edge_threshold must be non-negative");
        }

        return config;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    PriceTable DataLoader::generate_synthetic_data(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        unsigned int seed)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);

        Eigen::MatrixXd prices(static_cast<Eigen::Index>(num_days),
                               static_cast<Eigen::Index>(tickers.size()));
        std::vector<std::string> dates;
        dates.reserve(num_days);

        std::string date = start_date;
        while (dates.size() < num_days)
        {
            int dow = day_of_week(date);
            if (dow != 0 && dow != 6)
            {
                dates.push_back(date);
            }
            date = add_days(date, 1);
        }

        // Geometric random walk from 100
        for (Eigen::Index j = 0; j < prices.cols(); ++j)
        {
            if (num_days == 0)
                break;

            prices(0, j) = 100.0;
            for (Eigen::Index i = 1; i < prices.rows(); ++i)
            {
                double return_val = dist(gen);
                prices(i, j) = prices(i - 1, j) * std::max(1.0 + return_val, 0.01);
            }
        }

        return PriceTable(prices, dates, tickers);
    }

    // =======================
    // Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            return consumed == trimmed.size() ? value : std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

    std::optional<std::uint64_t> DataLoader::parse_count(const std::string &str,
                                                         std::uint64_t max_value)
    {
        if (str.empty() ||
            !std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
        {
            return std::nullopt;
        }

        try
        {
            unsigned long long value = std::stoull(str);
            if (value > max_value)
            {
                return std::nullopt;
            }
            return static_cast<std::uint64_t>(value);
        }
        catch (const std::out_of_range &)
        {
            return std::nullopt;
        }
    }

    std::string DataLoader::add_days(const std::string &date, int days_offset)
    {
        return civil_from_days(to_day_number(date) + days_offset);
    }

    int DataLoader::day_of_week(const std::string &date)
    {
        long z = to_day_number(date);
        // 1970-01-01 was a Thursday
        return static_cast<int>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
    }

} // namespace explorer

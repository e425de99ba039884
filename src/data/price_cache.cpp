/**
 * @file price_cache.cpp
 * @brief Implementation of the validate-or-refetch price cache
 */

#include "data/price_cache.hpp"
#include "data/data_loader.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <utility>

namespace explorer
{

    std::string to_string(CacheState state)
    {
        switch (state)
        {
        case CacheState::ABSENT:
            return "absent";
        case CacheState::INVALID:
            return "invalid";
        case CacheState::VALID:
            return "valid";
        }
        return "unknown";
    }

    PriceCache::PriceCache(std::string path, std::string source)
        : path_(std::move(path)), source_(std::move(source))
    {
        if (path_.empty())
        {
            throw std::invalid_argument("Cache path must not be empty");
        }
    }

    std::optional<PriceTable> PriceCache::read_strict(std::string &reason) const
    {
        std::ifstream file(path_);
        if (!file.is_open())
        {
            reason = "cannot open " + path_;
            return std::nullopt;
        }

        std::string line;
        if (!std::getline(file, line))
        {
            reason = "empty file";
            return std::nullopt;
        }

        auto header = DataLoader::parse_csv_line(line);
        if (header.empty() || DataLoader::trim(header[0]) != "date")
        {
            reason = "header does not start with 'date'";
            return std::nullopt;
        }

        std::vector<std::string> tickers;
        for (size_t i = 1; i < header.size(); ++i)
        {
            tickers.push_back(DataLoader::trim(header[i]));
        }

        std::vector<std::string> dates;
        std::vector<std::vector<double>> rows;
        size_t line_number = 1;

        while (std::getline(file, line))
        {
            ++line_number;
            if (DataLoader::trim(line).empty())
                continue;

            auto fields = DataLoader::parse_csv_line(line);
            std::string date = DataLoader::trim(fields[0]);

            if (!PriceTable::is_valid_date(date))
            {
                reason = "invalid date on line " + std::to_string(line_number);
                return std::nullopt;
            }
            if (!dates.empty() && !(dates.back() < date))
            {
                reason = "dates not strictly ascending on line " + std::to_string(line_number);
                return std::nullopt;
            }
            if (fields.size() != tickers.size() + 1)
            {
                reason = "wrong number of cells on line " + std::to_string(line_number);
                return std::nullopt;
            }

            std::vector<double> row;
            row.reserve(tickers.size());
            for (size_t j = 0; j < tickers.size(); ++j)
            {
                double value = DataLoader::safe_stod(fields[j + 1]);
                if (std::isnan(value))
                {
                    reason = "missing value for " + tickers[j] + " on " + date;
                    return std::nullopt;
                }
                row.push_back(value);
            }

            dates.push_back(date);
            rows.push_back(std::move(row));
        }

        if (dates.empty())
        {
            reason = "no data rows";
            return std::nullopt;
        }

        Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                               static_cast<Eigen::Index>(tickers.size()));
        for (size_t i = 0; i < rows.size(); ++i)
        {
            for (size_t j = 0; j < tickers.size(); ++j)
            {
                prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
            }
        }

        try
        {
            return PriceTable(prices, dates, tickers);
        }
        catch (const std::invalid_argument &e)
        {
            reason = e.what();
            return std::nullopt;
        }
    }

    std::optional<std::string> PriceCache::read_source() const
    {
        std::ifstream file(source_path());
        if (!file.is_open())
        {
            return std::nullopt;
        }

        std::string line;
        std::getline(file, line);
        return DataLoader::trim(line);
    }

    CacheInspection PriceCache::inspect(const std::vector<std::string> &symbols) const
    {
        CacheInspection inspection;

        std::error_code ec;
        if (!std::filesystem::exists(path_, ec))
        {
            inspection.state = CacheState::ABSENT;
            inspection.reason = "no cache file at " + path_;
            return inspection;
        }

        std::string reason;
        auto table = read_strict(reason);
        if (!table)
        {
            inspection.state = CacheState::INVALID;
            inspection.reason = reason;
            return inspection;
        }

        for (const auto &symbol : symbols)
        {
            if (!table->has_ticker(symbol))
            {
                inspection.state = CacheState::INVALID;
                inspection.reason = "requested symbol " + symbol + " is not cached";
                return inspection;
            }
        }

        if (!source_.empty())
        {
            auto recorded = read_source();
            if (!recorded)
            {
                inspection.state = CacheState::INVALID;
                inspection.reason = "cache does not record its source";
                return inspection;
            }
            if (*recorded != source_)
            {
                inspection.state = CacheState::INVALID;
                inspection.reason = "cache was built from '" + *recorded + "', not '" + source_ + "'";
                return inspection;
            }
        }

        inspection.state = CacheState::VALID;
        return inspection;
    }

    PriceTable PriceCache::load(const std::vector<std::string> &symbols) const
    {
        CacheInspection inspection = inspect(symbols);
        if (inspection.state != CacheState::VALID)
        {
            throw std::runtime_error("Price cache is " + to_string(inspection.state) +
                                     ": " + inspection.reason);
        }

        std::string reason;
        auto table = read_strict(reason);
        if (!table)
        {
            throw std::runtime_error("Price cache changed while loading: " + reason);
        }

        std::vector<std::string> unique_symbols;
        std::set<std::string> seen;
        for (const auto &symbol : symbols)
        {
            if (seen.insert(symbol).second)
            {
                unique_symbols.push_back(symbol);
            }
        }

        return table->select_assets(unique_symbols);
    }

    void PriceCache::store(const PriceTable &table) const
    {
        if (!table.is_complete())
        {
            throw std::invalid_argument("Only a complete, non-empty price table can be cached");
        }

        std::filesystem::path target(path_);
        if (target.has_parent_path())
        {
            std::filesystem::create_directories(target.parent_path());
        }

        DataLoader::save_csv_wide(table, path_);

        if (source_.empty())
        {
            // An untagged store leaves no stale tag behind
            std::error_code ec;
            std::filesystem::remove(source_path(), ec);
            return;
        }

        std::ofstream out(source_path());
        if (!out.is_open())
        {
            throw std::runtime_error("Could not write cache source file: " + source_path());
        }
        out << source_ << "\n";
    }

    PriceTable PriceCache::load_or_fetch(const std::vector<std::string> &symbols,
                                         const HistoryAssembler &assembler,
                                         AssemblyReport *report,
                                         CacheState *state_out) const
    {
        CacheInspection inspection = inspect(symbols);
        if (state_out != nullptr)
        {
            *state_out = inspection.state;
        }

        if (inspection.state == CacheState::VALID)
        {
            return load(symbols);
        }

        PriceTable fresh = assembler.assemble(symbols, report);
        store(fresh);
        return fresh;
    }

} // namespace explorer

/**
 * @file price_history_provider.cpp
 * @brief Implementation of history assembly on top of a PriceHistoryProvider
 */

#include "data/price_history_provider.hpp"
#include "core/constants.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace explorer
{

    namespace
    {
        bool is_leap_year(int year)
        {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }
    } // anonymous namespace

    // ============================================================================
    // PriceHistoryProvider
    // ============================================================================

    std::string PriceHistoryProvider::latest_date() const
    {
        std::time_t now = std::time(nullptr);
        std::tm *utc = std::gmtime(&now);
        char buffer[11];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", utc);
        return std::string(buffer);
    }

    // ============================================================================
    // AssemblyOptions / AssemblyReport
    // ============================================================================

    void AssemblyOptions::validate() const
    {
        if (lookback_years <= 0)
        {
            throw std::invalid_argument("Lookback must be at least one year, got: " +
                                        std::to_string(lookback_years));
        }
        if (min_coverage < 0.0 || min_coverage > 1.0)
        {
            throw std::invalid_argument("Coverage fraction must be in [0, 1]");
        }
        if (max_attempts < 1)
        {
            throw std::invalid_argument("At least one fetch attempt is required");
        }
        if (!end_date.empty() && !PriceTable::is_valid_date(end_date))
        {
            throw std::invalid_argument("Invalid end date: '" + end_date + "'");
        }
    }

    void AssemblyReport::print_summary() const
    {
        std::cout << "\n=== Price History Assembly ===\n";
        std::cout << "Window: " << start_date << " to " << end_date << "\n";
        std::cout << "Required observations: " << required_observations << "\n";
        std::cout << "Included (" << included.size() << "): ";
        for (const auto &symbol : included)
        {
            std::cout << symbol << " ";
        }
        std::cout << "\n";

        for (const auto &entry : excluded)
        {
            std::cout << "  Excluded " << entry.first << ": " << entry.second << "\n";
        }
        std::cout << "==============================\n"
                  << std::endl;
    }

    // ============================================================================
    // HistoryAssembler
    // ============================================================================

    HistoryAssembler::HistoryAssembler(const PriceHistoryProvider &provider, AssemblyOptions options)
        : provider_(provider), options_(std::move(options))
    {
        options_.validate();
    }

    size_t HistoryAssembler::required_observations() const
    {
        double required = options_.min_coverage * TRADING_DAYS_PER_YEAR * options_.lookback_years;
        return static_cast<size_t>(std::ceil(required - 1e-9));
    }

    std::string HistoryAssembler::lookback_start(const std::string &end_date, int years)
    {
        if (!PriceTable::is_valid_date(end_date))
        {
            throw std::invalid_argument("Invalid end date: '" + end_date + "'");
        }

        int year = std::stoi(end_date.substr(0, 4)) - years;
        int month = std::stoi(end_date.substr(5, 2));
        int day = std::stoi(end_date.substr(8, 2));

        if (month == 2 && day == 29 && !is_leap_year(year))
        {
            day = 28;
        }

        std::ostringstream out;
        out << std::setfill('0') << std::setw(4) << year << "-"
            << std::setw(2) << month << "-" << std::setw(2) << day;
        return out.str();
    }

    PriceTable HistoryAssembler::assemble(const std::vector<std::string> &symbols,
                                          AssemblyReport *report) const
    {
        AssemblyReport local;
        local.end_date = options_.end_date.empty() ? provider_.latest_date() : options_.end_date;
        local.start_date = lookback_start(local.end_date, options_.lookback_years);
        local.required_observations = required_observations();

        std::vector<std::string> candidates;
        std::map<std::string, std::map<std::string, double>> closes; // symbol -> date -> close
        std::set<std::string> requested;

        for (const auto &symbol : symbols)
        {
            if (!requested.insert(symbol).second)
            {
                continue;
            }

            PriceSeries series;
            bool fetched = false;
            std::string last_error;

            for (int attempt = 1; attempt <= options_.max_attempts && !fetched; ++attempt)
            {
                try
                {
                    series = provider_.fetch(symbol, local.start_date, local.end_date);
                    fetched = true;
                }
                catch (const std::exception &e)
                {
                    last_error = e.what();
                }
            }

            if (!fetched)
            {
                local.excluded[symbol] = "fetch failed after " +
                                         std::to_string(options_.max_attempts) +
                                         " attempt(s): " + last_error;
                continue;
            }

            if (series.closes.size() != series.dates.size())
            {
                local.excluded[symbol] = "provider returned mismatched dates and prices";
                continue;
            }

            std::map<std::string, double> observations;
            for (size_t i = 0; i < series.size(); ++i)
            {
                const std::string &date = series.dates[i];
                double close = series.closes[i];
                if (date < local.start_date || date > local.end_date)
                    continue;
                if (!PriceTable::is_valid_date(date) || !std::isfinite(close) || close < 0.0)
                    continue;
                observations[date] = close;
            }

            if (observations.size() < local.required_observations)
            {
                local.excluded[symbol] = "insufficient history (" +
                                         std::to_string(observations.size()) + " of " +
                                         std::to_string(local.required_observations) +
                                         " observations)";
                continue;
            }

            candidates.push_back(symbol);
            closes[symbol] = std::move(observations);
        }

        // Common calendar: dates held by a strict majority of candidates. A date only
        // one symbol trades on never enters the index, so it cannot knock out the rest.
        std::map<std::string, size_t> date_counts;
        for (const auto &entry : closes)
        {
            for (const auto &obs : entry.second)
            {
                ++date_counts[obs.first];
            }
        }

        std::vector<std::string> dates;
        for (const auto &entry : date_counts)
        {
            if (entry.second * 2 > candidates.size())
            {
                dates.push_back(entry.first);
            }
        }

        // A column missing any calendar date is dropped
        Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                               static_cast<Eigen::Index>(candidates.size()));
        prices.setConstant(std::numeric_limits<double>::quiet_NaN());

        for (size_t j = 0; j < candidates.size(); ++j)
        {
            const auto &observations = closes[candidates[j]];
            for (size_t i = 0; i < dates.size(); ++i)
            {
                auto it = observations.find(dates[i]);
                if (it != observations.end())
                {
                    prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = it->second;
                }
            }
        }

        PriceTable aligned(prices, dates, candidates);
        PriceTable clean = aligned.drop_incomplete_assets();

        for (const auto &symbol : candidates)
        {
            if (!clean.has_ticker(symbol))
            {
                local.excluded[symbol] = "gaps in aligned history";
            }
        }
        local.included = clean.get_tickers();

        if (report != nullptr)
        {
            *report = local;
        }

        if (clean.num_assets() == 0)
        {
            throw InsufficientDataError("No requested asset has sufficient price history between " +
                                        local.start_date + " and " + local.end_date);
        }

        return clean;
    }

} // namespace explorer

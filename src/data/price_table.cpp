/**
 * @file price_table.cpp
 * @brief Implementation of PriceTable class
 */

#include "data/price_table.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>

namespace explorer
{

    // ============================================================================
    // Constructors
    // ============================================================================

    PriceTable::PriceTable(const Eigen::MatrixXd &prices,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        validate();
        build_index_map();
    }

    void PriceTable::validate() const
    {
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Price matrix columns must match tickers vector size");
        }

        std::set<std::string> seen;
        for (const auto &ticker : tickers_)
        {
            if (ticker.empty())
            {
                throw std::invalid_argument("Ticker symbols must not be empty");
            }
            if (!seen.insert(ticker).second)
            {
                throw std::invalid_argument("Duplicate ticker: " + ticker);
            }
        }

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            if (!is_valid_date(dates_[i]))
            {
                throw std::invalid_argument("Invalid date: '" + dates_[i] + "'");
            }
            // YYYY-MM-DD compares lexicographically in calendar order
            if (i > 0 && !(dates_[i - 1] < dates_[i]))
            {
                throw std::invalid_argument("Dates must be strictly ascending: " +
                                            dates_[i - 1] + " then " + dates_[i]);
            }
        }

        for (Eigen::Index i = 0; i < prices_.rows(); ++i)
        {
            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                double p = prices_(i, j);
                if (std::isnan(p))
                {
                    continue;
                }
                if (!std::isfinite(p) || p < 0.0)
                {
                    throw std::invalid_argument("Invalid price for " + tickers_[j] +
                                                " on " + dates_[i]);
                }
            }
        }
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    Eigen::VectorXd PriceTable::get_prices(const std::string &ticker) const
    {
        return prices_.col(static_cast<Eigen::Index>(ticker_index(ticker)));
    }

    bool PriceTable::has_ticker(const std::string &ticker) const
    {
        return ticker_index_.count(ticker) > 0;
    }

    size_t PriceTable::ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        if (it == ticker_index_.end())
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return it->second;
    }

    // ===========================
    // Return Calculation
    // ===========================

    Eigen::MatrixXd PriceTable::calculate_returns() const
    {
        if (prices_.rows() < 2)
        {
            throw std::runtime_error("Need at least 2 price observations to calculate returns");
        }

        Eigen::MatrixXd returns(prices_.rows() - 1, prices_.cols());
        Eigen::Index kept = 0;

        for (Eigen::Index i = 0; i < prices_.rows() - 1; ++i)
        {
            bool complete = true;
            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                double p_t = prices_(i + 1, j);
                double p_tm1 = prices_(i, j);
                double r = (p_t - p_tm1) / p_tm1;

                if (!std::isfinite(r))
                {
                    complete = false;
                    break;
                }
                returns(kept, j) = r;
            }

            if (complete)
            {
                ++kept;
            }
        }

        returns.conservativeResize(kept, Eigen::NoChange);
        return returns;
    }

    // ================================
    // Derived Tables
    // ================================

    PriceTable PriceTable::select_assets(const std::vector<std::string> &selected_tickers) const
    {
        Eigen::MatrixXd selected(prices_.rows(), static_cast<Eigen::Index>(selected_tickers.size()));

        for (size_t k = 0; k < selected_tickers.size(); ++k)
        {
            selected.col(static_cast<Eigen::Index>(k)) =
                prices_.col(static_cast<Eigen::Index>(ticker_index(selected_tickers[k])));
        }

        return PriceTable(selected, dates_, selected_tickers);
    }

    PriceTable PriceTable::drop_incomplete_assets() const
    {
        std::vector<std::string> complete;
        complete.reserve(tickers_.size());

        for (Eigen::Index j = 0; j < prices_.cols(); ++j)
        {
            if (!prices_.col(j).array().isNaN().any())
            {
                complete.push_back(tickers_[static_cast<size_t>(j)]);
            }
        }

        return select_assets(complete);
    }

    // ===================
    // Validation
    // ===================

    size_t PriceTable::count_missing() const
    {
        return static_cast<size_t>(prices_.array().isNaN().count());
    }

    bool PriceTable::is_complete() const
    {
        return !empty() && count_missing() == 0;
    }

    bool PriceTable::is_valid_date(const std::string &date)
    {
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        int month = std::stoi(date.substr(5, 2));
        int day = std::stoi(date.substr(8, 2));
        return month >= 1 && month <= 12 && day >= 1 && day <= 31;
    }

    void PriceTable::print_summary() const
    {
        std::cout << "\n=== Price Table Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " assets\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        std::cout << "Assets: ";
        for (const auto &ticker : tickers_)
        {
            std::cout << ticker << " ";
        }
        std::cout << "\nMissing values: " << count_missing() << "\n";
        std::cout << "===========================\n"
                  << std::endl;
    }

    // =========================
    // Private Helper Methods
    // =========================

    void PriceTable::build_index_map()
    {
        ticker_index_.clear();
        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            ticker_index_[tickers_[i]] = i;
        }
    }

} // namespace explorer

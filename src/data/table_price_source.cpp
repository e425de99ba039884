/**
 * @file table_price_source.cpp
 * @brief Implementation of TablePriceSource
 */

#include "data/table_price_source.hpp"
#include "data/data_loader.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace explorer
{

    TablePriceSource::TablePriceSource(PriceTable table, std::string name)
        : table_(std::move(table)), name_(std::move(name))
    {
    }

    TablePriceSource TablePriceSource::from_csv(const std::string &filepath)
    {
        return TablePriceSource(DataLoader::load_csv(filepath), "CSV:" + filepath);
    }

    PriceSeries TablePriceSource::fetch(const std::string &symbol,
                                        const std::string &start_date,
                                        const std::string &end_date) const
    {
        if (!table_.has_ticker(symbol))
        {
            throw std::runtime_error("No price history for " + symbol + " in " + name_);
        }

        const Eigen::VectorXd column = table_.get_prices(symbol);
        const auto &dates = table_.get_dates();

        PriceSeries series;
        series.symbol = symbol;

        for (size_t i = 0; i < dates.size(); ++i)
        {
            if (dates[i] < start_date || dates[i] > end_date)
                continue;

            double close = column(static_cast<Eigen::Index>(i));
            if (std::isnan(close))
                continue;

            series.dates.push_back(dates[i]);
            series.closes.push_back(close);
        }

        return series;
    }

    std::string TablePriceSource::latest_date() const
    {
        if (table_.num_dates() == 0)
        {
            return PriceHistoryProvider::latest_date();
        }
        return table_.get_dates().back();
    }

} // namespace explorer

/**
 * @file table_price_source.hpp
 * @brief PriceHistoryProvider backed by an in-memory PriceTable
 *
 * Serves per-symbol history out of a price table loaded once, typically from
 * a CSV export of a market data vendor. Missing cells in the source table are
 * skipped, so a symbol with gaps simply yields fewer observations.
 */

#pragma once

#include "data/price_history_provider.hpp"
#include "data/price_table.hpp"
#include <string>

namespace explorer
{

    /**
     * @class TablePriceSource
     * @brief Provider over a fixed PriceTable
     */
    class TablePriceSource : public PriceHistoryProvider
    {
    public:
        /**
         * @param table Source prices (may contain missing cells)
         */
        explicit TablePriceSource(PriceTable table, std::string name = "TablePriceSource");

        /**
         * @brief Load a wide or long format CSV through DataLoader
         * @throws std::runtime_error if the file cannot be loaded
         */
        static TablePriceSource from_csv(const std::string &filepath);

        /**
         * @throws std::runtime_error if the symbol is not in the table
         */
        PriceSeries fetch(const std::string &symbol,
                          const std::string &start_date,
                          const std::string &end_date) const override;

        /**
         * @brief Last date of the source table (today if the table is empty)
         */
        std::string latest_date() const override;

        std::string get_name() const override { return name_; }

        const PriceTable &get_table() const { return table_; }

    private:
        PriceTable table_;
        std::string name_;
    };

} // namespace explorer

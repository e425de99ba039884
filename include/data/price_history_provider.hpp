/**
 * @file price_history_provider.hpp
 * @brief Market data provider interface and history assembly
 *
 * A PriceHistoryProvider supplies the adjusted closing prices of one symbol
 * over a date range. The HistoryAssembler turns a list of requested symbols
 * into a clean PriceTable: it retries failed fetches, excludes symbols whose
 * history does not cover enough of the lookback window, aligns the survivors
 * on the dates a strict majority of them share and drops any column missing
 * one of those dates. A stray date held by a single symbol is left out of
 * the index rather than counted as a gap in every other column.
 *
 * Excluded symbols never fail the batch. Callers must re-derive their active
 * weight set from the columns of the returned table.
 */

#pragma once

#include "data/price_table.hpp"
#include <map>
#include <string>
#include <vector>

namespace explorer
{

    /**
     * @struct PriceSeries
     * @brief Adjusted closing prices of one symbol, ascending by date.
     */
    struct PriceSeries
    {
        std::string symbol;
        std::vector<std::string> dates;
        std::vector<double> closes;

        size_t size() const { return dates.size(); }
    };

    /**
     * @class PriceHistoryProvider
     * @brief Abstract source of historical prices.
     *
     * Implementations may hit the network or the disk. fetch() throws
     * (typically std::runtime_error) when the symbol cannot be served; the
     * assembler treats a throw as a failed attempt.
     */
    class PriceHistoryProvider
    {
    public:
        virtual ~PriceHistoryProvider() = default;

        /**
         * @brief Fetch adjusted closes for a symbol in [start_date, end_date].
         * @param symbol Ticker symbol
         * @param start_date First date (inclusive, YYYY-MM-DD)
         * @param end_date Last date (inclusive, YYYY-MM-DD)
         * @return Series in ascending date order
         */
        virtual PriceSeries fetch(const std::string &symbol,
                                  const std::string &start_date,
                                  const std::string &end_date) const = 0;

        /**
         * @brief Most recent date the provider can serve.
         *
         * Default implementation: today's date (UTC).
         */
        virtual std::string latest_date() const;

        /**
         * @brief Name of the provider, for diagnostics
         */
        virtual std::string get_name() const = 0;
    };

    /**
     * @struct AssemblyOptions
     * @brief Lookback window and coverage rules for history assembly
     */
    struct AssemblyOptions
    {
        int lookback_years = 5;      ///< Window length in years
        double min_coverage = 0.9;   ///< Fraction of 252 * years observations required
        int max_attempts = 3;        ///< Fetch attempts per symbol
        std::string end_date;        ///< Window end; empty means provider.latest_date()

        /**
         * @throws std::invalid_argument if any option is out of range
         */
        void validate() const;
    };

    /**
     * @struct AssemblyReport
     * @brief Outcome of an assembly run: which symbols made it and why others did not
     */
    struct AssemblyReport
    {
        std::string start_date;
        std::string end_date;
        size_t required_observations = 0;
        std::vector<std::string> included;
        std::map<std::string, std::string> excluded; ///< symbol -> reason

        void print_summary() const;
    };

    /**
     * @class HistoryAssembler
     * @brief Builds an aligned, gap-free PriceTable from a provider
     *
     * Usage Example:
     * @code
     * TablePriceSource source = TablePriceSource::from_csv("prices.csv");
     * HistoryAssembler assembler(source, options);
     * AssemblyReport report;
     * PriceTable table = assembler.assemble({"AAPL", "MSFT", "GLD"}, &report);
     * report.print_summary();
     * @endcode
     */
    class HistoryAssembler
    {
    public:
        /**
         * @param provider Source of prices; must outlive the assembler
         * @param options Lookback and coverage rules
         * @throws std::invalid_argument if options are invalid
         */
        HistoryAssembler(const PriceHistoryProvider &provider, AssemblyOptions options);

        /**
         * @brief Fetch, filter and align the requested symbols.
         * @param symbols Requested tickers (duplicates are ignored)
         * @param report Optional output describing included/excluded symbols
         * @return PriceTable with no missing cells
         * @throws InsufficientDataError if no symbol survives
         */
        PriceTable assemble(const std::vector<std::string> &symbols,
                            AssemblyReport *report = nullptr) const;

        /**
         * @brief Minimum observation count a symbol needs to be included.
         */
        size_t required_observations() const;

        /**
         * @brief Window start for a given end date: same calendar day, years earlier.
         *
         * February 29 maps to February 28 when the target year is not a leap year.
         */
        static std::string lookback_start(const std::string &end_date, int years);

        const AssemblyOptions &get_options() const { return options_; }

    private:
        const PriceHistoryProvider &provider_;
        AssemblyOptions options_;
    };

} // namespace explorer

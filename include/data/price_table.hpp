/**
 * @file price_table.hpp
 * @brief Time-aligned adjusted closing prices for a basket of assets.
 *
 * The PriceTable is the rectangular input every engine computation consumes.
 * Prices are stored as an Eigen matrix (dates x assets) with an ascending date
 * index and unique ticker columns. Missing cells are represented as NaN until
 * the table is cleaned by drop_incomplete_assets().
 */

#ifndef EXPLORER_DATA_PRICE_TABLE_HPP
#define EXPLORER_DATA_PRICE_TABLE_HPP

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace explorer
{
    /**
     * @class PriceTable
     * @brief Immutable multi-asset price history.
     *
     * Construction validates the shape and the index:
     * - rows match the dates vector, columns match the tickers vector
     * - tickers are unique and non-empty
     * - dates are valid YYYY-MM-DD strings in strictly ascending order
     * - no price is negative (NaN is accepted as "missing")
     *
     * All accessors are const; derived tables are returned by value.
     *
     * Usage Example:
     * @code
     * PriceTable table(prices, dates, {"AAPL", "MSFT"});
     * Eigen::MatrixXd returns = table.calculate_returns();
     * @endcode
     */
    class PriceTable
    {
    public:
        /**
         * @brief Empty table (no dates, no assets).
         */
        PriceTable() = default;

        /**
         * @brief Constructor with data.
         * @param prices Price matrix (dates x assets).
         * @param dates Vector of date strings (YYYY-MM-DD), ascending.
         * @param tickers Vector of unique asset ticker symbols.
         * @throws std::invalid_argument if any invariant is violated.
         */
        PriceTable(const Eigen::MatrixXd &prices,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        ~PriceTable() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        /**
         * @brief Get the full price matrix (dates x assets).
         */
        const Eigen::MatrixXd &get_prices() const
        {
            return prices_;
        }

        /**
         * @brief Get prices for a specific asset.
         * @throws std::invalid_argument if the ticker is unknown.
         */
        Eigen::VectorXd get_prices(const std::string &ticker) const;

        const std::vector<std::string> &get_dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &get_tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return static_cast<size_t>(prices_.rows());
        }

        size_t num_assets() const
        {
            return static_cast<size_t>(prices_.cols());
        }

        bool empty() const
        {
            return prices_.rows() == 0 || prices_.cols() == 0;
        }

        /**
         * @brief Check whether a ticker is one of the columns.
         */
        bool has_ticker(const std::string &ticker) const;

        /**
         * @brief Column index of a ticker.
         * @throws std::invalid_argument if the ticker is unknown.
         */
        size_t ticker_index(const std::string &ticker) const;

        /** ===========================================
         *  Return Calculation
         *  ===========================================
         */

        /**
         * @brief Simple periodic returns (P_t - P_{t-1}) / P_{t-1}.
         *
         * Rows containing any non-finite return (missing price, or division by a
         * zero price) are dropped, so the result may have fewer than
         * num_dates() - 1 rows.
         *
         * @return Matrix of returns (periods x assets)
         * @throws std::runtime_error if fewer than 2 price rows are available.
         */
        Eigen::MatrixXd calculate_returns() const;

        /** ===========================================
         *  Derived Tables
         *  ===========================================
         */

        /**
         * @brief Select a subset of assets, in the order given.
         * @throws std::invalid_argument if a ticker is not present.
         */
        PriceTable select_assets(const std::vector<std::string> &selected_tickers) const;

        /**
         * @brief Drop every asset column that contains a missing value.
         * @return New table holding only complete columns (possibly none).
         */
        PriceTable drop_incomplete_assets() const;

        /** ===========================================
         *  Validation
         *  ===========================================
         */

        /**
         * @brief Count missing (NaN) cells.
         */
        size_t count_missing() const;

        /**
         * @brief True when the table is non-empty and has no missing cell.
         */
        bool is_complete() const;

        /**
         * @brief Validate a YYYY-MM-DD date string (format and month/day ranges).
         */
        static bool is_valid_date(const std::string &date);

        /**
         * @brief Print summary to stdout.
         */
        void print_summary() const;

    private:
        void validate() const;
        void build_index_map();

        Eigen::MatrixXd prices_;                     ///< Price matrix (dates x assets)
        std::vector<std::string> dates_;             ///< Ascending date strings
        std::vector<std::string> tickers_;           ///< Asset tickers
        std::map<std::string, size_t> ticker_index_; ///< Ticker to column map
    };

} // namespace explorer

#endif // EXPLORER_DATA_PRICE_TABLE_HPP

/**
 * @file asset_info.hpp
 * @brief Ticker to full asset name lookup
 *
 * Allocation tables and exported portfolios label each ticker with a
 * readable name ("AAPL - Apple Inc. (Technology)"). Unknown tickers fall
 * back to the ticker itself.
 */

#ifndef EXPLORER_DATA_ASSET_INFO_HPP
#define EXPLORER_DATA_ASSET_INFO_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace explorer
{

    /**
     * @class AssetDirectory
     * @brief Maps tickers to full names for display and export
     *
     * Lookups are case-insensitive on the ticker. Instances are safe for
     * concurrent read-only access after construction.
     *
     * Usage example:
     * @code
     * AssetDirectory names = AssetDirectory::defaults();
     * names.merge(AssetDirectory::from_json({{"ACME", "Acme Corp. (Industrials)"}}));
     * std::cout << names.display_name("acme") << "\n"; // acme - Acme Corp. (Industrials)
     * @endcode
     */
    class AssetDirectory
    {
    public:
        /**
         * @brief Empty directory: every ticker names itself
         */
        AssetDirectory() = default;

        /**
         * @brief Construct from parallel vectors
         * @param tickers Asset identifiers
         * @param names Full names (same length)
         * @throws std::invalid_argument if sizes differ or an entry is blank
         */
        AssetDirectory(const std::vector<std::string> &tickers,
                       const std::vector<std::string> &names);

        /**
         * @brief Built-in names for common US stocks, ETFs and commodity funds
         */
        static AssetDirectory defaults();

        /**
         * @brief Factory: create from a JSON object {"TICKER": "Full name", ...}
         * @throws std::invalid_argument if j is not an object of strings
         */
        static AssetDirectory from_json(const nlohmann::json &j);

        /**
         * @brief Add or replace entries with those of another directory
         */
        void merge(const AssetDirectory &other);

        bool contains(const std::string &ticker) const;

        /**
         * @brief Full name of a ticker, or the ticker unchanged if unknown
         */
        std::string full_name(const std::string &ticker) const;

        /**
         * @brief "TICKER - Full name", or the ticker alone if unknown
         */
        std::string display_name(const std::string &ticker) const;

        /**
         * @brief {ticker: full name} for the given tickers, in the given spelling
         */
        nlohmann::json names_for(const std::vector<std::string> &tickers) const;

        /**
         * @brief Serialize to a JSON object keyed by upper-case ticker
         */
        nlohmann::json to_json() const;

        size_t size() const { return names_.size(); }

        bool empty() const { return names_.empty(); }

    private:
        static std::string normalize(const std::string &ticker);

        std::unordered_map<std::string, std::string> names_; ///< Upper-case ticker -> name
    };

} // namespace explorer

#endif // EXPLORER_DATA_ASSET_INFO_HPP

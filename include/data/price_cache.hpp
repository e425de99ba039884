/**
 * @file price_cache.hpp
 * @brief Validate-before-trust persistent cache of aligned price history
 *
 * The cache is a wide-format CSV (date, ticker1, ticker2, ...) holding the
 * last assembled PriceTable. It is modelled as a three-state machine:
 *
 *   ABSENT   no file on disk
 *   INVALID  file exists but fails validation for the requested symbols
 *   VALID    every requested symbol is a column, dates are a valid strictly
 *            ascending sequence and no cell is missing
 *
 * There is a single transition rule: anything other than VALID is replaced
 * wholesale by a fresh assembly. A partial cache is never patched.
 *
 * A cache opened with a source tag (typically the canonical path of the
 * price file) writes the tag to a sidecar file "<path>.source" on store.
 * A cache whose recorded tag differs from the current one is INVALID, so
 * pointing the application at another data file forces a refetch.
 */

#pragma once

#include "data/price_history_provider.hpp"
#include "data/price_table.hpp"
#include <optional>
#include <string>
#include <vector>

namespace explorer
{

    /**
     * @enum CacheState
     * @brief Classification of the cache file for a set of requested symbols
     */
    enum class CacheState
    {
        ABSENT,
        INVALID,
        VALID
    };

    /**
     * @brief Name of a cache state ("absent", "invalid", "valid")
     */
    std::string to_string(CacheState state);

    /**
     * @struct CacheInspection
     * @brief Result of inspecting the cache file
     */
    struct CacheInspection
    {
        CacheState state = CacheState::ABSENT;
        std::string reason; ///< Why the cache is not VALID (empty when VALID)
    };

    /**
     * @class PriceCache
     * @brief Persistent cache with a validate-or-refetch contract
     *
     * Usage Example:
     * @code
     * PriceCache cache("data/cache/price_cache.csv", "/data/market/prices.csv");
     * PriceTable table = cache.load_or_fetch(symbols, assembler);
     * @endcode
     */
    class PriceCache
    {
    public:
        /**
         * @param path Cache CSV file
         * @param source Tag of the data the cache is built from; empty disables the check
         * @throws std::invalid_argument if path is empty
         */
        explicit PriceCache(std::string path, std::string source = std::string());

        /**
         * @brief Classify the cache file for the requested symbols
         */
        CacheInspection inspect(const std::vector<std::string> &symbols) const;

        /**
         * @brief Load the requested columns from a VALID cache
         * @return Table restricted to the requested symbols, in request order
         * @throws std::runtime_error if the cache is not VALID
         */
        PriceTable load(const std::vector<std::string> &symbols) const;

        /**
         * @brief Replace the cache file with the given table and record the source tag
         * @throws std::invalid_argument if the table has missing cells or is empty
         * @throws std::runtime_error if the file cannot be written
         */
        void store(const PriceTable &table) const;

        /**
         * @brief Return cached history when VALID, otherwise assemble and overwrite.
         * @param symbols Requested tickers
         * @param assembler Source of fresh history
         * @param report Optional assembly report (left untouched on a cache hit)
         * @param state_out Optional output: the state found before any refetch
         */
        PriceTable load_or_fetch(const std::vector<std::string> &symbols,
                                 const HistoryAssembler &assembler,
                                 AssemblyReport *report = nullptr,
                                 CacheState *state_out = nullptr) const;

        const std::string &get_path() const { return path_; }
        const std::string &get_source() const { return source_; }

        /// Sidecar file holding the source tag
        std::string source_path() const { return path_ + ".source"; }

    private:
        /**
         * @brief Strict parse: any malformed row makes the whole file unusable
         */
        std::optional<PriceTable> read_strict(std::string &reason) const;

        std::optional<std::string> read_source() const;

        std::string path_;
        std::string source_;
    };

} // namespace explorer

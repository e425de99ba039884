/**
 * @file asset_info.cpp
 * @brief Implementation of AssetDirectory
 */

#include "data/asset_info.hpp"
#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace explorer
{

    AssetDirectory::AssetDirectory(const std::vector<std::string> &tickers,
                                   const std::vector<std::string> &names)
    {
        if (tickers.size() != names.size())
        {
            throw std::invalid_argument("AssetDirectory: tickers and names size mismatch");
        }

        for (size_t i = 0; i < tickers.size(); ++i)
        {
            const std::string ticker = normalize(tickers[i]);
            const std::string name = DataLoader::trim(names[i]);
            if (ticker.empty())
            {
                throw std::invalid_argument("AssetDirectory: empty ticker at index " + std::to_string(i));
            }
            if (name.empty())
            {
                throw std::invalid_argument("AssetDirectory: empty name for ticker '" + ticker + "'");
            }
            names_[ticker] = name;
        }
    }

    AssetDirectory AssetDirectory::defaults()
    {
        static const std::vector<std::pair<const char *, const char *>> known = {
            // US stocks
            {"AAPL", "Apple Inc. (Technology)"},
            {"MSFT", "Microsoft Corporation (Technology)"},
            {"GOOGL", "Alphabet Inc. Class A (Technology)"},
            {"AMZN", "Amazon.com Inc. (E-commerce/Cloud)"},
            {"TSLA", "Tesla Inc. (Electric Vehicles)"},
            {"META", "Meta Platforms Inc. (Social Media)"},
            {"NFLX", "Netflix Inc. (Streaming)"},
            {"NVDA", "NVIDIA Corporation (Semiconductors)"},
            {"JPM", "JPMorgan Chase & Co. (Banking)"},
            {"JNJ", "Johnson & Johnson (Healthcare)"},
            {"PG", "Procter & Gamble Co. (Consumer Goods)"},
            {"UNH", "UnitedHealth Group Inc. (Healthcare)"},
            {"HD", "The Home Depot Inc. (Retail)"},
            {"V", "Visa Inc. Class A (Financial Services)"},
            {"MA", "Mastercard Inc. Class A (Financial Services)"},
            {"DIS", "The Walt Disney Company (Entertainment)"},
            {"ADBE", "Adobe Inc. (Software)"},
            {"CRM", "Salesforce Inc. (Cloud Software)"},
            {"INTC", "Intel Corporation (Semiconductors)"},
            {"AMD", "Advanced Micro Devices (Semiconductors)"},
            {"XOM", "Exxon Mobil Corp. (Energy)"},

            // Broad ETFs
            {"SPY", "SPDR S&P 500 ETF Trust (US Large Cap)"},
            {"QQQ", "Invesco QQQ Trust ETF (NASDAQ-100)"},
            {"IWM", "iShares Russell 2000 ETF (US Small Cap)"},
            {"EFA", "iShares MSCI EAFE ETF (International Developed)"},
            {"EEM", "iShares MSCI Emerging Markets ETF"},
            {"VTI", "Vanguard Total Stock Market ETF"},
            {"VXUS", "Vanguard Total International Stock ETF"},
            {"BND", "Vanguard Total Bond Market ETF"},
            {"TLT", "iShares 20+ Year Treasury Bond ETF"},
            {"LQD", "iShares iBoxx Investment Grade Corporate Bond ETF"},
            {"HYG", "iShares iBoxx High Yield Corporate Bond ETF"},
            {"TIPS", "iShares TIPS Bond ETF (Inflation-Protected)"},
            {"VNQ", "Vanguard Real Estate Index Fund ETF"},

            // Commodities
            {"GLD", "SPDR Gold Shares ETF (Gold)"},
            {"SLV", "iShares Silver Trust ETF (Silver)"},
            {"DBA", "Invesco DB Agriculture Fund ETF"},
            {"DBC", "Invesco DB Commodity Index Tracking Fund"},
            {"USO", "United States Oil Fund LP ETF (Oil)"},
            {"UNG", "United States Natural Gas Fund LP ETF"},
            {"IAU", "iShares Gold Trust ETF (Gold Alternative)"},
            {"PPLT", "Aberdeen Standard Physical Platinum Shares ETF"},

            // International
            {"FXI", "iShares China Large-Cap ETF"},
            {"EWJ", "iShares MSCI Japan ETF"},
            {"EWG", "iShares MSCI Germany ETF"},
            {"EWU", "iShares MSCI United Kingdom ETF"},
            {"INDA", "iShares MSCI India ETF"},

            // Sector ETFs
            {"XLK", "Technology Select Sector SPDR Fund"},
            {"XLF", "Financial Select Sector SPDR Fund"},
            {"XLV", "Health Care Select Sector SPDR Fund"},
            {"XLE", "Energy Select Sector SPDR Fund"},
            {"XLU", "Utilities Select Sector SPDR Fund"},
            {"XLRE", "Real Estate Select Sector SPDR Fund"}};

        AssetDirectory directory;
        for (const auto &entry : known)
        {
            directory.names_[entry.first] = entry.second;
        }
        return directory;
    }

    AssetDirectory AssetDirectory::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw std::invalid_argument("AssetDirectory JSON must be an object of ticker: name");
        }

        std::vector<std::string> tickers;
        std::vector<std::string> names;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (!it.value().is_string())
            {
                throw std::invalid_argument("AssetDirectory: name for '" + it.key() + "' must be a string");
            }
            tickers.push_back(it.key());
            names.push_back(it.value().get<std::string>());
        }
        return AssetDirectory(tickers, names);
    }

    void AssetDirectory::merge(const AssetDirectory &other)
    {
        for (const auto &entry : other.names_)
        {
            names_[entry.first] = entry.second;
        }
    }

    bool AssetDirectory::contains(const std::string &ticker) const
    {
        return names_.count(normalize(ticker)) > 0;
    }

    std::string AssetDirectory::full_name(const std::string &ticker) const
    {
        auto it = names_.find(normalize(ticker));
        return it == names_.end() ? ticker : it->second;
    }

    std::string AssetDirectory::display_name(const std::string &ticker) const
    {
        auto it = names_.find(normalize(ticker));
        return it == names_.end() ? ticker : ticker + " - " + it->second;
    }

    nlohmann::json AssetDirectory::names_for(const std::vector<std::string> &tickers) const
    {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &ticker : tickers)
        {
            j[ticker] = full_name(ticker);
        }
        return j;
    }

    nlohmann::json AssetDirectory::to_json() const
    {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &entry : names_)
        {
            j[entry.first] = entry.second;
        }
        return j;
    }

    std::string AssetDirectory::normalize(const std::string &ticker)
    {
        std::string out = DataLoader::trim(ticker);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

} // namespace explorer

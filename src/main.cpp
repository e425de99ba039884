/**
 * @file main.cpp
 * @brief Main entry point for Portfolio Explorer
 *
 * Command-line application that loads configuration, assembles price
 * history (through the cache), samples the efficient frontier, scores the
 * user's allocation and reports the notable portfolios.
 */

#include "data/data_loader.hpp"
#include "data/price_cache.hpp"
#include "data/price_history_provider.hpp"
#include "data/table_price_source.hpp"
#include "optimizer/selection_resolver.hpp"
#include "session/analysis_session.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

using namespace explorer;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Portfolio Explorer v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (default: built-in sample portfolio)\n"
              << "  --data PATH           Price history CSV (overrides data.data_file)\n"
              << "  --samples N           Number of random portfolios (overrides sampler.num_portfolios)\n"
              << "  --seed N              Random seed for reproducible sampling\n"
              << "  --select SEL          Portfolio to inspect: max_sharpe, min_risk or an index\n"
              << "  --output PATH         Output directory for frontier.csv and session.json\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/explorer_config.json --verbose\n"
              << "  " << program_name << " --samples 5000 --seed 7 --select max_sharpe --output results\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Portfolio Explorer v1.0.0                                \n"
              << "       Monte Carlo Efficient Frontier Analysis                  \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string data_file;
    std::optional<int> samples;
    std::optional<std::uint64_t> seed;
    std::string selection;
    std::string output_dir;
    bool verbose = false;
    bool show_help = false;
    bool valid = true;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--data" && i + 1 < argc)
            {
                args.data_file = argv[++i];
            }
            else if (arg == "--samples" && i + 1 < argc)
            {
                args.samples = parse_number<int>(argv[++i], "--samples", args.valid);
            }
            else if (arg == "--seed" && i + 1 < argc)
            {
                args.seed = parse_number<std::uint64_t>(argv[++i], "--seed", args.valid);
            }
            else if (arg == "--select" && i + 1 < argc)
            {
                args.selection = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && valid;
    }

private:
    template <typename T>
    static T parse_number(const std::string &text, const char *flag, bool &valid)
    {
        auto value = DataLoader::parse_count(text, static_cast<std::uint64_t>(std::numeric_limits<T>::max()));
        if (value)
        {
            return static_cast<T>(*value);
        }

        std::cerr << "Error: " << flag << " expects an integer in [0, "
                  << std::numeric_limits<T>::max() << "], got '" << text << "'" << std::endl;
        valid = false;
        return T();
    }
};

/**
 * @brief Print a resolved selection
 */
void print_selection(const optimizer::ResolvedSelection &picked,
                     const std::vector<std::string> &tickers,
                     const AssetDirectory &assets)
{
    std::cout << "\nSELECTED: " << picked.label << " (index " << picked.index << ")\n";
    std::cout << std::string(60, '-') << "\n";
    std::cout << "  Expected Return:  " << std::fixed << std::setprecision(2)
              << picked.point.expected_return * 100 << "%\n";
    std::cout << "  Volatility:       " << picked.point.risk * 100 << "%\n";
    std::cout << "  Sharpe Ratio:     " << std::setprecision(3)
              << picked.point.sharpe_ratio << "\n\n";
    std::cout << "Asset Weights:\n";
    print_allocation(tickers, picked.point.weights, assets);
    std::cout << std::string(60, '-') << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        ExplorerConfig config;
        if (!args.config_path.empty())
        {
            config = DataLoader::load_config(args.config_path);
        }
        if (!args.data_file.empty())
        {
            config.data.data_file = args.data_file;
        }
        if (args.samples)
        {
            config.sampler.num_portfolios = *args.samples;
        }
        if (args.seed)
        {
            config.sampler.seed = *args.seed;
        }

        if (args.verbose)
        {
            std::cout << "  - Tickers: ";
            for (const auto &ticker : config.data.universe)
            {
                std::cout << ticker << " ";
            }
            std::cout << "\n  - Data file: " << config.data.data_file << "\n";
            std::cout << "  - Cache file: "
                      << (config.data.cache_file.empty() ? "(disabled)" : config.data.cache_file) << "\n";
            std::cout << "  - Lookback: " << config.data.lookback_years << " years\n";
            std::cout << "  - Portfolios: " << config.sampler.num_portfolios
                      << " (" << optimizer::to_string(config.sampler.scheme) << ")\n";
        }

        // ====================================================================
        // 2. Assemble Price History
        // ====================================================================
        std::cout << "[2/5] Assembling price history..." << std::endl;

        TablePriceSource source = TablePriceSource::from_csv(config.data.data_file);

        AssemblyOptions options;
        options.lookback_years = config.data.lookback_years;
        options.min_coverage = config.data.min_coverage;
        options.max_attempts = config.data.max_attempts;
        options.end_date = config.data.end_date;

        HistoryAssembler assembler(source, options);
        AssemblyReport report;
        PriceTable table;

        if (config.data.cache_file.empty())
        {
            table = assembler.assemble(config.data.universe, &report);
            report.print_summary();
        }
        else
        {
            // The cache is keyed to the price file it was built from
            std::string source_tag = std::filesystem::weakly_canonical(config.data.data_file).string();
            PriceCache cache(config.data.cache_file, source_tag);
            CacheState state = CacheState::ABSENT;
            table = cache.load_or_fetch(config.data.universe, assembler, &report, &state);

            std::cout << "  - Cache was " << to_string(state);
            if (state == CacheState::VALID)
            {
                std::cout << ", loaded from " << config.data.cache_file << "\n";
            }
            else
            {
                std::cout << ", refreshed " << config.data.cache_file << "\n";
                report.print_summary();
            }
        }

        std::cout << "  - Loaded " << table.num_dates() << " dates, "
                  << table.num_assets() << " assets" << std::endl;

        if (args.verbose)
        {
            table.print_summary();
        }

        // ====================================================================
        // 3. Build Session (statistics, frontier, current portfolio)
        // ====================================================================
        std::cout << "[3/5] Sampling " << config.sampler.num_portfolios
                  << " portfolios..." << std::endl;

        SessionConfig session_config;
        session_config.sampler = config.sampler;
        session_config.edge_threshold = config.edge_threshold;
        session_config.assets = config.assets;

        AnalysisSession session = AnalysisSession::create(table, config.data.allocations, session_config);

        if (args.verbose)
        {
            session.get_statistics().print_summary();
            session.get_population().print_summary();
        }

        // ====================================================================
        // 4. Report
        // ====================================================================
        std::cout << "[4/5] Summarizing results..." << std::endl;

        session.print_summary();

        if (!args.selection.empty())
        {
            auto picked = session.resolve(optimizer::parse_selection(args.selection));
            print_selection(picked, session.get_table().get_tickers(), session.get_config().assets);
        }

        // ====================================================================
        // 5. Export (Optional)
        // ====================================================================
        if (!args.output_dir.empty())
        {
            std::cout << "[5/5] Exporting results..." << std::endl;

            std::filesystem::create_directories(args.output_dir);

            std::string frontier_file = args.output_dir + "/frontier.csv";
            session.export_population_csv(frontier_file);
            std::cout << "  Frontier data exported to: " << frontier_file << "\n";

            std::string session_file = args.output_dir + "/session.json";
            std::ofstream out(session_file);
            if (!out.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + session_file);
            }
            out << session.to_json().dump(2) << "\n";
            std::cout << "  Session exported to: " << session_file << "\n";
        }
        else
        {
            std::cout << "[5/5] Skipping export (use --output to enable)\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Exploration completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}

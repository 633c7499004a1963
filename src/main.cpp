/**
 * @file main.cpp
 * @brief Main entry point for the Tail Risk Engine
 *
 * Command-line application that loads configuration and prices, runs the
 * marginal, portfolio and Monte Carlo risk models, backtests rolling
 * historical VaR and optionally exports the results as JSON.
 */

#include "analytics/risk_summary.hpp"
#include "backtest/var_backtest.hpp"
#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "data/return_panel.hpp"
#include <chrono>
#include <cmath>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace tailrisk;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Tail Risk Engine v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --prices PATH         Override data.prices_file\n"
              << "  --weights PATH        Override data.weights_file\n"
              << "  --output PATH         Write the full report as JSON\n"
              << "  --no-sweep            Skip the backtest window sweep\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/risk_config.json --verbose\n"
              << "  " << program_name << " --config data/config/risk_config.json --output results/report.json\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Tail Risk Engine v1.0.0                                 \n"
              << "       Student-t / GARCH-t / t-Copula VaR and ES               \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string prices_path;
    std::string weights_path;
    std::string output_path;
    bool run_sweep = true;
    bool verbose = false;
    bool show_help = false;

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
            else if (arg == "--prices" && i + 1 < argc)
            {
                args.prices_path = argv[++i];
            }
            else if (arg == "--weights" && i + 1 < argc)
            {
                args.weights_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--no-sweep")
            {
                args.run_sweep = false;
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
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Print one backtest result
 */
void print_backtest_result(const backtest::BacktestResult &result)
{
    auto p = [](double x)
    {
        std::ostringstream ss;
        if (std::isnan(x))
        {
            ss << "n/a";
        }
        else
        {
            ss << std::fixed << std::setprecision(4) << x;
        }
        return ss.str();
    };

    std::cout << "  Window " << std::setw(4) << result.window
              << " | obs " << std::setw(5) << result.observations
              << " | exceptions " << std::setw(4) << result.exceptions
              << " (expected " << std::fixed << std::setprecision(1) << result.expected_exceptions << ")"
              << " | Kupiec p " << p(result.kupiec.p_value)
              << " | Ind p " << p(result.independence.p_value)
              << " | CC p " << p(result.conditional_coverage.p_value)
              << " | " << backtest::to_string(result.zone) << "\n";
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
        std::cout << "[1/6] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);

        if (!args.prices_path.empty())
        {
            config.data.prices_file = args.prices_path;
        }
        if (!args.weights_path.empty())
        {
            config.data.weights_file = args.weights_path;
        }
        if (args.verbose)
        {
            config.verbose = true;
            config.summary.verbose = true;
            config.summary.garch.verbose = true;
            config.summary.monte_carlo.verbose = true;
            config.backtest.verbose = true;
        }

        if (config.verbose)
        {
            std::cout << "  - Prices: " << config.data.prices_file << "\n";
            std::cout << "  - Weights: "
                      << (config.data.weights_file.empty() ? "(equal)" : config.data.weights_file) << "\n";
            std::cout << "  - Dependence model: " << config.summary.dependence.type << "\n";
            std::cout << "  - Simulations: " << config.summary.monte_carlo.n_sims
                      << " (nu_copula=" << config.summary.monte_carlo.nu_copula
                      << ", nu_marginal=" << config.summary.monte_carlo.nu_marginal << ")\n";
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/6] Loading market data..." << std::endl;

        auto panel = DataLoader::load_returns_csv(config.data.prices_file, config.data.tickers);

        if (!config.data.start_date.empty() || !config.data.end_date.empty())
        {
            panel = panel.filter_by_date(config.data.start_date, config.data.end_date);
        }

        std::cout << "  - Loaded " << panel.num_dates() << " return dates, "
                  << panel.num_assets() << " assets" << std::endl;
        if (config.verbose)
        {
            std::cout << "  - Range: " << panel.dates().front() << " to "
                      << panel.dates().back() << "\n";
        }

        // ====================================================================
        // 3. Portfolio Weights
        // ====================================================================
        std::cout << "[3/6] Aligning portfolio weights..." << std::endl;

        Eigen::VectorXd weights;
        if (config.data.weights_file.empty())
        {
            weights = Eigen::VectorXd::Constant(panel.num_assets(), 1.0 / panel.num_assets());
        }
        else
        {
            weights = align_weights(DataLoader::load_weights_csv(config.data.weights_file),
                                    panel.tickers());
        }

        // ====================================================================
        // 4. Risk Models
        // ====================================================================
        std::cout << "[4/6] Running risk models..." << std::endl;

        analytics::RiskSummaryBuilder builder(config.summary);
        analytics::RiskSummary summary = builder.build(panel, weights);

        analytics::print_summary(summary, std::cout);

        // ====================================================================
        // 5. VaR Backtest
        // ====================================================================
        std::cout << "\n[5/6] Backtesting rolling historical VaR..." << std::endl;

        backtest::VaRBacktester backtester(config.backtest);
        Eigen::VectorXd portfolio_returns = panel.portfolio_returns(summary.weights);

        nlohmann::json backtest_json;
        if (static_cast<size_t>(config.backtest.window) < panel.num_dates())
        {
            auto result = backtester.run(portfolio_returns, panel.dates());
            std::cout << "\n  Confidence " << config.backtest.confidence << ":\n";
            print_backtest_result(result);
            backtest_json["main"] = result.to_json();
        }
        else
        {
            std::cout << "  Skipping: window " << config.backtest.window
                      << " leaves no observations to test\n";
        }

        if (args.run_sweep)
        {
            auto sweep = backtester.sweep(portfolio_returns, panel.dates());
            std::cout << "\n  Window sweep:\n";
            nlohmann::json sweep_json = nlohmann::json::array();
            for (const auto &result : sweep)
            {
                print_backtest_result(result);
                sweep_json.push_back(result.to_json());
            }
            backtest_json["sweep"] = sweep_json;
        }

        // ====================================================================
        // 6. Export (Optional)
        // ====================================================================
        if (!args.output_path.empty())
        {
            std::cout << "\n[6/6] Writing JSON report..." << std::endl;

            nlohmann::json report = summary.to_json();
            report["backtest"] = backtest_json;

            std::ofstream out(args.output_path);
            if (!out.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + args.output_path);
            }
            out << report.dump(2) << "\n";
            std::cout << "  Report exported to: " << args.output_path << "\n";
        }
        else
        {
            std::cout << "\n[6/6] Skipping JSON export (use --output to enable)\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Risk run completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const NumericalError &e)
    {
        std::cerr << "\n" << e.what() << std::endl;
        return 2;
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

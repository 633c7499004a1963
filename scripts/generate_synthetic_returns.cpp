/**
 * @file generate_synthetic_returns.cpp
 * @brief Generate fat-tailed synthetic prices and weights for the risk engine
 */

#include "data/data_loader.hpp"
#include "data/return_panel.hpp"
#include "risk/sample_covariance.hpp"
#include "stats/sample_statistics.hpp"
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <map>

using namespace tailrisk;

int main(int argc, char *argv[])
{
    std::cout << "\n=== Synthetic Data Generator ===\n"
              << std::endl;

    std::vector<std::string> tickers = {
        "AAPL", "MSFT", "JPM", "JNJ", "XOM",
        "WMT", "GOOGL", "BAC", "PFE", "CVX"};

    SyntheticConfig config;
    config.num_days = 756;
    config.start_date = "2021-01-04";

    std::string output_file = "data/market/prices.csv";
    std::string weights_file = "data/market/weights.csv";

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc)
            {
                output_file = argv[++i];
            }
            else if (arg == "--weights" && i + 1 < argc)
            {
                weights_file = argv[++i];
            }
            else if (arg == "--days" && i + 1 < argc)
            {
                config.num_days = std::stoul(argv[++i]);
            }
            else if (arg == "--volatility" && i + 1 < argc)
            {
                config.volatility = std::stod(argv[++i]);
            }
            else if (arg == "--drift" && i + 1 < argc)
            {
                config.drift = std::stod(argv[++i]);
            }
            else if (arg == "--correlation" && i + 1 < argc)
            {
                config.correlation = std::stod(argv[++i]);
            }
            else if (arg == "--nu" && i + 1 < argc)
            {
                config.nu = std::stod(argv[++i]);
            }
            else if (arg == "--seed" && i + 1 < argc)
            {
                config.seed = std::stoull(argv[++i]);
            }
            else if (arg == "--help")
            {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE        Prices CSV (default: data/market/prices.csv)\n"
                          << "  --weights FILE       Weights CSV (default: data/market/weights.csv)\n"
                          << "  --days N             Number of price dates (default: 756)\n"
                          << "  --volatility VAL     Daily volatility (default: 0.015)\n"
                          << "  --drift VAL          Daily drift (default: 0.0002)\n"
                          << "  --correlation VAL    Pairwise correlation (default: 0.3)\n"
                          << "  --nu VAL             Student-t degrees of freedom (default: 4)\n"
                          << "  --seed N             Generator seed (default: 42)\n"
                          << "  --help               Show this help\n";
                return 0;
            }
        }

        std::cout << "Generating " << config.num_days << " days for "
                  << tickers.size() << " assets (nu = " << config.nu << ")..." << std::endl;

        auto table = DataLoader::generate_synthetic_prices(tickers, config);

        std::cout << "Saving prices to " << output_file << "..." << std::endl;
        DataLoader::save_csv_wide(table, output_file);

        std::map<std::string, double> weights;
        for (const auto &ticker : tickers)
        {
            weights[ticker] = 1.0 / tickers.size();
        }
        std::cout << "Saving equal weights to " << weights_file << "..." << std::endl;
        DataLoader::save_weights_csv(weights, weights_file);

        // Summary statistics of the generated returns
        ReturnPanel panel = table.to_returns();

        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << "Dates: " << panel.num_dates() << " returns ("
                  << panel.dates().front() << " to "
                  << panel.dates().back() << ")\n";

        std::cout << "\nAsset Statistics (Daily):\n";
        std::cout << std::string(44, '-') << "\n";
        std::cout << std::setw(8) << "Ticker"
                  << std::setw(12) << "Mean"
                  << std::setw(12) << "Std"
                  << std::setw(12) << "1% quantile\n";
        std::cout << std::string(44, '-') << "\n";

        for (size_t j = 0; j < panel.num_assets(); ++j)
        {
            Eigen::VectorXd r = panel.returns().col(j);
            std::cout << std::setw(8) << panel.tickers()[j]
                      << std::setw(11) << std::fixed << std::setprecision(3)
                      << stats::mean(r) * 100 << "%"
                      << std::setw(11) << stats::sample_std(r) * 100 << "%"
                      << std::setw(11) << stats::quantile(r, 0.01) * 100 << "%\n";
        }
        std::cout << std::string(44, '-') << "\n";

        risk::SampleCovariance sample;
        Eigen::MatrixXd corr = sample.estimate_correlation(panel.returns());
        double avg_corr = 0.0;
        int count = 0;
        for (int i = 0; i < corr.rows(); ++i)
        {
            for (int j = i + 1; j < corr.cols(); ++j)
            {
                avg_corr += corr(i, j);
                ++count;
            }
        }
        if (count > 0)
        {
            avg_corr /= count;
        }

        std::cout << "\nAverage pairwise correlation: "
                  << std::fixed << std::setprecision(3) << avg_corr << "\n";

        std::cout << "\nData generation complete.\n"
                  << std::endl;
        std::cout << "You can now run:\n";
        std::cout << "  ./build/bin/tailrisk --config data/config/risk_config.json --verbose\n";
        std::cout << std::endl;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

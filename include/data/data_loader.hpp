/**
 * @file data_loader.hpp
 * @brief Loading of prices, weights and engine configuration
 *
 * Prices come from wide CSV files (date,<ticker>,...), weights from
 * ticker,weight CSV files and the configuration from JSON. A seeded
 * generator of correlated fat-tailed prices is provided for tests and demos.
 */

#ifndef TAILRISK_DATA_DATA_LOADER_HPP
#define TAILRISK_DATA_DATA_LOADER_HPP

#include "analytics/risk_summary.hpp"
#include "backtest/var_backtest.hpp"
#include "data/return_panel.hpp"

#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tailrisk
{

    /**
     * @struct DataConfig
     * @brief Input files and filters
     */
    struct DataConfig
    {
        std::string prices_file = "data/market/prices.csv";
        std::string weights_file;          ///< Equal weights when empty
        std::string start_date;            ///< Inclusive, YYYY-MM-DD
        std::string end_date;              ///< Inclusive, YYYY-MM-DD
        std::vector<std::string> tickers;  ///< Columns to load (all if empty)

        static DataConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct RiskEngineConfig
     * @brief Complete engine configuration
     */
    struct RiskEngineConfig
    {
        DataConfig data;
        analytics::RiskSummaryConfig summary;
        backtest::BacktestParams backtest;
        bool verbose = false;

        /**
         * @brief Build from a parsed JSON document.
         *
         * Missing sections keep their defaults. A top-level "verbose": true
         * switches on the verbose flag of every section.
         */
        static RiskEngineConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct PriceTable
     * @brief Raw price matrix as read from disk (NaN marks a missing quote)
     */
    struct PriceTable
    {
        Eigen::MatrixXd prices;
        std::vector<std::string> dates;
        std::vector<std::string> tickers;

        /**
         * @brief Log returns via ReturnPanel::from_prices
         */
        ReturnPanel to_returns() const;
    };

    /**
     * @struct SyntheticConfig
     * @brief Parameters of the synthetic price generator
     *
     * Daily log returns are drawn from an equicorrelated multivariate
     * Student-t with the given per-asset volatility.
     */
    struct SyntheticConfig
    {
        size_t num_days = 750;
        std::string start_date = "2020-01-01";
        double volatility = 0.015;  ///< Daily standard deviation
        double drift = 0.0002;      ///< Daily mean log return
        double correlation = 0.3;   ///< Pairwise correlation in [0, 1)
        double nu = 4.0;            ///< Degrees of freedom (> 2)
        std::uint64_t seed = 42;
    };

    /**
     * @class DataLoader
     * @brief Static helpers for file input and output
     */
    class DataLoader
    {
    public:
        DataLoader() = default;

        ~DataLoader() = default;

        // ========================================================================
        // CSV Loading Methods
        // ========================================================================

        /**
         * @brief Load prices from a wide CSV file
         *
         * Expected format:
         * date,AAPL,MSFT,JPM,...
         * 2020-01-02,150.0,200.0,120.0,...
         *
         * Rows with an invalid date are skipped and the remaining rows are
         * sorted by date. Empty or unparsable cells become NaN.
         *
         * @param filepath Path to CSV file
         * @param tickers Columns to load (all if empty)
         * @throws std::runtime_error if the file cannot be read or has no data
         */
        static PriceTable load_prices_csv(const std::string &filepath,
                                          const std::vector<std::string> &tickers = {});

        /**
         * @brief Load prices and convert them to a return panel
         */
        static ReturnPanel load_returns_csv(const std::string &filepath,
                                            const std::vector<std::string> &tickers = {});

        /**
         * @brief Load a ticker,weight CSV file
         * @throws std::runtime_error if the file cannot be read
         * @throws std::invalid_argument on a non-numeric or duplicate entry
         */
        static std::map<std::string, double> load_weights_csv(const std::string &filepath);

        // ========================================================================
        // Configuration Loading
        // ========================================================================

        /**
         * @brief Load JSON file
         * @throws std::runtime_error if the file cannot be opened or parsed
         */
        static nlohmann::json load_json(const std::string &filepath);

        /**
         * @brief Load complete engine configuration
         */
        static RiskEngineConfig load_config(const std::string &config_path);

        // ========================================================================
        // Data Generation
        // ========================================================================

        /**
         * @brief Generate synthetic prices starting at 100
         * @throws std::invalid_argument on bad parameters
         */
        static PriceTable generate_synthetic_prices(const std::vector<std::string> &tickers,
                                                    const SyntheticConfig &config = SyntheticConfig());

        // ========================================================================
        // Export Methods
        // ========================================================================

        /**
         * @brief Save prices to CSV (wide format)
         */
        static void save_csv_wide(const PriceTable &table, const std::string &filepath);

        /**
         * @brief Save a ticker,weight CSV file
         */
        static void save_weights_csv(const std::map<std::string, double> &weights,
                                     const std::string &filepath);

    private:
        static std::vector<std::string> parse_csv_line(const std::string &line);

        static bool is_valid_date_format(const std::string &date);

        static std::string trim(const std::string &str);

        /**
         * @brief Convert string to double, NaN if conversion fails
         */
        static double safe_stod(const std::string &str);

        static std::string add_days(const std::string &start_date, int days_offset);
    };

} // namespace tailrisk

#endif // TAILRISK_DATA_DATA_LOADER_HPP

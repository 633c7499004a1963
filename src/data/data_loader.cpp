/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and configuration structures
 */

#include "data/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace tailrisk
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.prices_file = j.value("prices_file", config.prices_file);
        config.weights_file = j.value("weights_file", "");
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        config.tickers = j.value("tickers", std::vector<std::string>{});
        return config;
    }

    RiskEngineConfig RiskEngineConfig::from_json(const nlohmann::json &j)
    {
        RiskEngineConfig config;

        if (j.contains("data"))
        {
            config.data = DataConfig::from_json(j["data"]);
        }

        if (j.contains("marginal"))
        {
            const auto &m = j["marginal"];
            config.summary.student_t = marginal::StudentTFitConfig::from_json(m);
            config.summary.seed = m.value("seed", config.summary.seed);
        }

        if (j.contains("garch"))
        {
            config.summary.garch = marginal::GarchConfig::from_json(j["garch"]);
        }

        if (j.contains("dependence"))
        {
            config.summary.dependence = risk::RiskModelConfig::from_json(j["dependence"]);
        }

        if (j.contains("monte_carlo"))
        {
            config.summary.monte_carlo = simulation::MonteCarloConfig::from_json(j["monte_carlo"]);
        }

        if (j.contains("summary"))
        {
            config.summary.top_n = j["summary"].value("top_n", config.summary.top_n);
        }

        if (j.contains("backtest"))
        {
            config.backtest = backtest::BacktestParams::from_json(j["backtest"]);
        }

        config.verbose = j.value("verbose", false);
        if (config.verbose)
        {
            config.summary.verbose = true;
            config.summary.garch.verbose = true;
            config.summary.monte_carlo.verbose = true;
            config.backtest.verbose = true;
        }

        return config;
    }

    ReturnPanel PriceTable::to_returns() const
    {
        return ReturnPanel::from_prices(prices, dates, tickers);
    }

    // ===========================
    // CSV Loading
    // ===========================

    PriceTable DataLoader::load_prices_csv(const std::string &filepath,
                                           const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;

        // Read header line
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.empty() || trim(header[0]) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        std::vector<std::string> all_tickers;
        for (size_t i = 1; i < header.size(); ++i)
        {
            all_tickers.push_back(trim(header[i]));
        }

        // Determine which columns to load
        std::vector<size_t> column_indices;
        std::vector<std::string> selected_tickers;

        if (tickers.empty())
        {
            for (size_t i = 0; i < all_tickers.size(); ++i)
            {
                column_indices.push_back(i);
                selected_tickers.push_back(all_tickers[i]);
            }
        }
        else
        {
            for (const auto &ticker : tickers)
            {
                auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
                if (it != all_tickers.end())
                {
                    column_indices.push_back(std::distance(all_tickers.begin(), it));
                    selected_tickers.push_back(ticker);
                }
            }
        }

        if (column_indices.empty())
        {
            throw std::runtime_error("No ticker columns to load from " + filepath);
        }

        std::vector<std::pair<std::string, std::vector<double>>> rows;

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            std::string date = trim(fields[0]);
            if (!is_valid_date_format(date))
            {
                continue;
            }

            std::vector<double> row_prices;
            row_prices.reserve(column_indices.size());

            for (size_t idx : column_indices)
            {
                if (idx + 1 < fields.size())
                {
                    row_prices.push_back(safe_stod(fields[idx + 1]));
                }
                else
                {
                    row_prices.push_back(std::numeric_limits<double>::quiet_NaN());
                }
            }

            rows.emplace_back(date, row_prices);
        }

        if (rows.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        // ISO dates sort lexicographically
        std::stable_sort(rows.begin(), rows.end(),
                         [](const auto &a, const auto &b)
                         { return a.first < b.first; });

        PriceTable table;
        table.tickers = selected_tickers;
        table.prices.resize(rows.size(), selected_tickers.size());
        table.dates.reserve(rows.size());

        for (size_t i = 0; i < rows.size(); ++i)
        {
            table.dates.push_back(rows[i].first);
            for (size_t j = 0; j < selected_tickers.size(); ++j)
            {
                table.prices(i, j) = rows[i].second[j];
            }
        }

        return table;
    }

    ReturnPanel DataLoader::load_returns_csv(const std::string &filepath,
                                             const std::vector<std::string> &tickers)
    {
        return load_prices_csv(filepath, tickers).to_returns();
    }

    std::map<std::string, double> DataLoader::load_weights_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty weights file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.size() < 2 || trim(header[0]) != "ticker" || trim(header[1]) != "weight")
        {
            throw std::runtime_error("Weights CSV must have a 'ticker,weight' header");
        }

        std::map<std::string, double> weights;
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 2)
            {
                throw std::invalid_argument("Malformed weights row: " + line);
            }

            std::string ticker = trim(fields[0]);
            double weight = safe_stod(fields[1]);
            if (!std::isfinite(weight))
            {
                throw std::invalid_argument("Invalid weight for " + ticker + ": " + trim(fields[1]));
            }
            if (!weights.emplace(ticker, weight).second)
            {
                throw std::invalid_argument("Duplicate ticker in weights file: " + ticker);
            }
        }

        if (weights.empty())
        {
            throw std::runtime_error("No weights found in " + filepath);
        }
        return weights;
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    RiskEngineConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);
        try
        {
            return RiskEngineConfig::from_json(j);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid configuration in " + config_path + ": " + e.what());
        }
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    PriceTable DataLoader::generate_synthetic_prices(const std::vector<std::string> &tickers,
                                                     const SyntheticConfig &config)
    {
        if (tickers.empty())
        {
            throw std::invalid_argument("At least one ticker is required");
        }
        if (config.num_days < 2)
        {
            throw std::invalid_argument("At least 2 days are required");
        }
        if (!(config.nu > 2.0))
        {
            throw std::invalid_argument("Degrees of freedom must exceed 2 for a finite variance");
        }
        if (!(config.correlation >= 0.0 && config.correlation < 1.0))
        {
            throw std::invalid_argument("Correlation must be in [0, 1)");
        }
        if (!(config.volatility > 0.0))
        {
            throw std::invalid_argument("Volatility must be positive");
        }

        const size_t n = tickers.size();
        std::mt19937_64 gen(config.seed);
        std::normal_distribution<double> normal(0.0, 1.0);
        std::chi_squared_distribution<double> chi2(config.nu);

        // Scale the t draw to unit variance
        const double t_scale = std::sqrt((config.nu - 2.0) / config.nu);
        const double common = std::sqrt(config.correlation);
        const double idio = std::sqrt(1.0 - config.correlation);

        PriceTable table;
        table.tickers = tickers;
        table.prices.resize(config.num_days, n);
        table.dates.reserve(config.num_days);

        for (size_t i = 0; i < config.num_days; ++i)
        {
            table.dates.push_back(add_days(config.start_date, static_cast<int>(i)));
        }

        table.prices.row(0).setConstant(100.0);
        for (size_t i = 1; i < config.num_days; ++i)
        {
            const double factor = normal(gen);
            const double mix = std::sqrt(config.nu / chi2(gen));

            for (size_t j = 0; j < n; ++j)
            {
                double z = common * factor + idio * normal(gen);
                double r = config.drift + config.volatility * t_scale * mix * z;
                table.prices(i, j) = table.prices(i - 1, j) * std::exp(r);
            }
        }

        return table;
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_csv_wide(const PriceTable &table, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &ticker : table.tickers)
        {
            file << "," << ticker;
        }
        file << "\n";

        for (size_t i = 0; i < table.dates.size(); ++i)
        {
            file << table.dates[i];
            for (int j = 0; j < table.prices.cols(); ++j)
            {
                file << ",";
                if (!std::isnan(table.prices(i, j)))
                {
                    file << std::fixed << std::setprecision(6) << table.prices(i, j);
                }
            }
            file << "\n";
        }
    }

    void DataLoader::save_weights_csv(const std::map<std::string, double> &weights,
                                      const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "ticker,weight\n";
        for (const auto &entry : weights)
        {
            file << entry.first << "," << std::setprecision(10) << entry.second << "\n";
        }
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    bool DataLoader::is_valid_date_format(const std::string &date)
    {
        // YYYY-MM-DD
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            return consumed == trimmed.size() ? value : std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

    std::string DataLoader::add_days(const std::string &start_date, int days_offset)
    {
        std::tm tm = {};
        std::istringstream ss(start_date);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail())
        {
            throw std::invalid_argument("Invalid start date: " + start_date);
        }

        // Noon keeps mktime clear of daylight-saving boundaries
        tm.tm_mday += days_offset;
        tm.tm_hour = 12;
        tm.tm_isdst = -1;
        std::mktime(&tm);

        char buffer[11];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
        return std::string(buffer);
    }

} // namespace tailrisk

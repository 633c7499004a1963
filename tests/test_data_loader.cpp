/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and the engine configuration
 */

#include <catch2/catch.hpp>
#include "data/data_loader.hpp"
#include "risk/sample_covariance.hpp"
#include "stats/sample_statistics.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>

using namespace tailrisk;
using Catch::Matchers::WithinAbs;

namespace
{
    // Writes a file on construction and removes it on destruction
    class TempFile
    {
    public:
        TempFile(const std::string &name, const std::string &contents)
            : path_(name)
        {
            std::ofstream out(path_);
            out << contents;
        }

        ~TempFile() { std::remove(path_.c_str()); }

        const std::string &path() const { return path_; }

    private:
        std::string path_;
    };
}

TEST_CASE("Load prices CSV", "[DataLoader]")
{
    SECTION("Rows are sorted by date and gaps become NaN")
    {
        TempFile csv("test_prices_unsorted.csv",
                     "date,AAPL,MSFT\n"
                     "2020-01-03,105.0,220.0\n"
                     "2020-01-01,100.0,200.0\n"
                     "2020-01-02,,210.0\n"
                     "not-a-date,1.0,1.0\n");

        PriceTable table = DataLoader::load_prices_csv(csv.path());

        REQUIRE(table.dates.size() == 3);
        REQUIRE(table.dates[0] == "2020-01-01");
        REQUIRE(table.dates[2] == "2020-01-03");
        REQUIRE(std::isnan(table.prices(1, 0)));
        REQUIRE_THAT(table.prices(2, 1), WithinAbs(220.0, 1e-12));
    }

    SECTION("Ticker selection")
    {
        TempFile csv("test_prices_select.csv",
                     "date,AAPL,MSFT,JPM\n"
                     "2020-01-01,100.0,200.0,50.0\n"
                     "2020-01-02,101.0,202.0,51.0\n");

        PriceTable table = DataLoader::load_prices_csv(csv.path(), {"JPM", "AAPL", "TSLA"});
        REQUIRE(table.tickers == std::vector<std::string>{"JPM", "AAPL"});
        REQUIRE_THAT(table.prices(0, 0), WithinAbs(50.0, 1e-12));

        REQUIRE_THROWS_AS(DataLoader::load_prices_csv(csv.path(), {"TSLA"}), std::runtime_error);
    }

    SECTION("Returns via the panel")
    {
        TempFile csv("test_prices_returns.csv",
                     "date,AAPL,MSFT\n"
                     "2020-01-01,100.0,200.0\n"
                     "2020-01-02,110.0,210.0\n"
                     "2020-01-03,105.0,220.0\n");

        ReturnPanel panel = DataLoader::load_returns_csv(csv.path());
        REQUIRE(panel.num_dates() == 2);
        REQUIRE_THAT(panel.returns()(0, 0), WithinAbs(std::log(1.1), 1e-12));
    }

    SECTION("Missing file and bad header")
    {
        REQUIRE_THROWS_AS(DataLoader::load_prices_csv("does_not_exist.csv"), std::runtime_error);

        TempFile csv("test_prices_header.csv", "day,AAPL\n2020-01-01,1.0\n");
        REQUIRE_THROWS_AS(DataLoader::load_prices_csv(csv.path()), std::runtime_error);
    }
}

TEST_CASE("Load weights CSV", "[DataLoader]")
{
    SECTION("Valid file")
    {
        TempFile csv("test_weights.csv", "ticker,weight\nAAPL,0.6\n MSFT , 0.4\n");
        auto weights = DataLoader::load_weights_csv(csv.path());
        REQUIRE(weights.size() == 2);
        REQUIRE_THAT(weights.at("MSFT"), WithinAbs(0.4, 1e-12));
    }

    SECTION("Non-numeric weight")
    {
        TempFile csv("test_weights_bad.csv", "ticker,weight\nAAPL,abc\n");
        REQUIRE_THROWS_AS(DataLoader::load_weights_csv(csv.path()), std::invalid_argument);
    }

    SECTION("Duplicate ticker")
    {
        TempFile csv("test_weights_dup.csv", "ticker,weight\nAAPL,0.5\nAAPL,0.5\n");
        REQUIRE_THROWS_AS(DataLoader::load_weights_csv(csv.path()), std::invalid_argument);
    }

    SECTION("Save and reload")
    {
        std::map<std::string, double> weights = {{"AAPL", 0.25}, {"JPM", 0.75}};
        DataLoader::save_weights_csv(weights, "test_weights_roundtrip.csv");
        auto loaded = DataLoader::load_weights_csv("test_weights_roundtrip.csv");
        std::remove("test_weights_roundtrip.csv");
        REQUIRE(loaded == weights);
    }
}

TEST_CASE("Engine configuration", "[DataLoader][Config]")
{
    SECTION("Sections override defaults")
    {
        TempFile json("test_config.json", R"({
            "data": { "prices_file": "p.csv", "start_date": "2021-01-01" },
            "marginal": { "min_df": 4, "max_df": 30, "seed": 7 },
            "garch": { "order_policy": "bic", "max_order": 2 },
            "dependence": { "type": "sample" },
            "monte_carlo": { "n_sims": 5000, "horizons": [1, 5, 10] },
            "backtest": { "confidence": 0.95, "window": 250 },
            "summary": { "top_n": 3 }
        })");

        RiskEngineConfig config = DataLoader::load_config(json.path());

        REQUIRE(config.data.prices_file == "p.csv");
        REQUIRE(config.data.weights_file.empty());
        REQUIRE(config.summary.student_t.min_df == 4);
        REQUIRE(config.summary.seed == 7);
        REQUIRE(config.summary.garch.order_policy == marginal::OrderPolicy::BIC);
        REQUIRE(config.summary.dependence.type == "sample");
        REQUIRE(config.summary.monte_carlo.n_sims == 5000);
        REQUIRE(config.summary.monte_carlo.horizons.size() == 3);
        REQUIRE(config.summary.top_n == 3);
        REQUIRE_THAT(config.backtest.confidence, WithinAbs(0.95, 1e-12));
        REQUIRE(config.backtest.window == 250);
        REQUIRE_FALSE(config.verbose);
    }

    SECTION("Defaults when sections are absent")
    {
        RiskEngineConfig config = RiskEngineConfig::from_json(nlohmann::json::object());
        REQUIRE(config.summary.student_t.min_df == 3);
        REQUIRE(config.summary.student_t.max_df == 99);
        REQUIRE(config.summary.dependence.type == "ewma");
        REQUIRE(config.summary.monte_carlo.n_sims == 100000);
        REQUIRE(config.backtest.window == 60);
    }

    SECTION("Top-level verbose reaches every section")
    {
        RiskEngineConfig config = RiskEngineConfig::from_json(nlohmann::json{{"verbose", true}});
        REQUIRE(config.summary.verbose);
        REQUIRE(config.summary.garch.verbose);
        REQUIRE(config.summary.monte_carlo.verbose);
        REQUIRE(config.backtest.verbose);
    }

    SECTION("Malformed JSON")
    {
        TempFile json("test_config_bad.json", "{ \"data\": ");
        REQUIRE_THROWS_AS(DataLoader::load_json(json.path()), std::runtime_error);
    }

    SECTION("Wrong value type")
    {
        TempFile json("test_config_type.json", R"({ "monte_carlo": { "n_sims": "many" } })");
        REQUIRE_THROWS_AS(DataLoader::load_config(json.path()), std::invalid_argument);
    }

    SECTION("Unknown GARCH order policy")
    {
        nlohmann::json j = {{"garch", {{"order_policy", "aic"}}}};
        REQUIRE_THROWS_AS(RiskEngineConfig::from_json(j), std::invalid_argument);
    }
}

TEST_CASE("Synthetic prices", "[DataLoader][Synthetic]")
{
    std::vector<std::string> tickers = {"A", "B", "C"};

    SECTION("Shape, dates and reproducibility")
    {
        SyntheticConfig config;
        config.num_days = 10;
        config.start_date = "2020-02-27";

        PriceTable a = DataLoader::generate_synthetic_prices(tickers, config);
        PriceTable b = DataLoader::generate_synthetic_prices(tickers, config);

        REQUIRE(a.prices.rows() == 10);
        REQUIRE(a.prices.cols() == 3);
        REQUIRE(a.dates[0] == "2020-02-27");
        REQUIRE(a.dates[2] == "2020-02-29");
        REQUIRE(a.dates[3] == "2020-03-01");
        REQUIRE_THAT(a.prices(0, 0), WithinAbs(100.0, 1e-12));
        REQUIRE(a.prices == b.prices);
    }

    SECTION("Moments match the configuration")
    {
        SyntheticConfig config;
        config.num_days = 20001;
        config.volatility = 0.01;
        config.correlation = 0.5;
        config.nu = 6.0;

        ReturnPanel panel = DataLoader::generate_synthetic_prices(tickers, config).to_returns();

        REQUIRE_THAT(stats::sample_std(panel.returns().col(0)), WithinAbs(0.01, 0.0005));

        risk::SampleCovariance sample;
        Eigen::MatrixXd corr = sample.estimate_correlation(panel.returns());
        REQUIRE_THAT(corr(0, 1), WithinAbs(0.5, 0.05));
    }

    SECTION("Invalid parameters")
    {
        SyntheticConfig config;
        config.nu = 2.0;
        REQUIRE_THROWS_AS(DataLoader::generate_synthetic_prices(tickers, config), std::invalid_argument);
        REQUIRE_THROWS_AS(DataLoader::generate_synthetic_prices({}, SyntheticConfig()), std::invalid_argument);
    }

    SECTION("CSV round trip")
    {
        SyntheticConfig config;
        config.num_days = 5;
        PriceTable table = DataLoader::generate_synthetic_prices(tickers, config);

        DataLoader::save_csv_wide(table, "test_synthetic_roundtrip.csv");
        PriceTable loaded = DataLoader::load_prices_csv("test_synthetic_roundtrip.csv");
        std::remove("test_synthetic_roundtrip.csv");

        REQUIRE(loaded.dates == table.dates);
        REQUIRE((loaded.prices - table.prices).cwiseAbs().maxCoeff() < 1e-6);
    }
}

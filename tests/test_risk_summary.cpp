/**
 * @file test_risk_summary.cpp
 * @brief Integration tests for the portfolio risk summary
 */

#include <catch2/catch.hpp>
#include "analytics/risk_summary.hpp"
#include <cmath>
#include <random>
#include <sstream>

using namespace tailrisk;
using namespace tailrisk::analytics;
using Catch::Matchers::WithinAbs;

class RiskSummaryTestFixture
{
protected:
    // Three active assets of increasing volatility and one flat series
    ReturnPanel generate_panel(int num_days = 300, unsigned seed = 42)
    {
        std::mt19937_64 rng(seed);
        std::student_t_distribution<double> dist(5.0);

        const double vols[3] = {0.005, 0.01, 0.03};
        Eigen::MatrixXd returns = Eigen::MatrixXd::Zero(num_days, 4);
        for (int i = 0; i < num_days; ++i)
        {
            const double common = dist(rng);
            for (int j = 0; j < 3; ++j)
            {
                returns(i, j) = vols[j] * (0.4 * common + 0.6 * dist(rng));
            }
        }

        std::vector<std::string> dates;
        for (int i = 0; i < num_days; ++i)
        {
            dates.push_back("D" + std::to_string(100000 + i));
        }
        return ReturnPanel(returns, dates, {"LOW", "MID", "HIGH", "FLAT"});
    }

    RiskSummaryConfig small_config()
    {
        RiskSummaryConfig config;
        config.monte_carlo.n_sims = 2000;
        config.top_n = 2;
        return config;
    }

    Eigen::VectorXd weights()
    {
        Eigen::VectorXd w(4);
        w << 2.0, 1.0, 1.0, 0.0;
        return w;
    }
};

TEST_CASE_METHOD(RiskSummaryTestFixture, "Per-asset table isolates failures", "[Analytics][RiskSummary]")
{
    RiskSummaryBuilder builder(small_config());
    std::vector<AssetRiskRow> rows = builder.asset_table(generate_panel());

    REQUIRE(rows.size() == 4);
    for (int j = 0; j < 3; ++j)
    {
        INFO("asset " << rows[j].ticker);
        REQUIRE(rows[j].ok);
        REQUIRE(rows[j].nu >= 3.0);
        REQUIRE(rows[j].es95 < rows[j].var95);
        REQUIRE(rows[j].es99 < rows[j].var99);
    }

    REQUIRE(rows[3].ticker == "FLAT");
    REQUIRE_FALSE(rows[3].ok);
    REQUIRE_FALSE(rows[3].error.empty());
    REQUIRE(std::isnan(rows[3].es95));

    nlohmann::json failed = rows[3].to_json();
    REQUIRE(failed["ok"] == false);
    REQUIRE(failed.contains("error"));
}

TEST_CASE_METHOD(RiskSummaryTestFixture, "Full risk summary", "[Analytics][RiskSummary]")
{
    ReturnPanel panel = generate_panel();
    RiskSummaryBuilder builder(small_config());
    RiskSummary summary = builder.build(panel, weights());

    SECTION("Weights are normalized")
    {
        REQUIRE_THAT(summary.weights.sum(), WithinAbs(1.0, 1e-15));
        REQUIRE_THAT(summary.weights(0), WithinAbs(0.5, 1e-15));
        REQUIRE(summary.notional == 1000000.0);
    }

    SECTION("Worst and best lists exclude failed assets")
    {
        REQUIRE(summary.worst.size() == 2);
        REQUIRE(summary.best.size() == 2);
        REQUIRE(summary.worst.front().ticker == "HIGH");
        REQUIRE(summary.best.back().ticker == "LOW");
        REQUIRE(summary.worst[0].es95 <= summary.worst[1].es95);
        REQUIRE(summary.best[0].es95 <= summary.best[1].es95);
        for (const auto &row : summary.worst)
        {
            REQUIRE(row.ticker != "FLAT");
        }
    }

    SECTION("Parametric and historical measures")
    {
        REQUIRE(summary.static_nu >= 3.0);
        REQUIRE(summary.static_t.es95 < summary.static_t.var95);
        REQUIRE(summary.garch_t.es99 < summary.garch_t.var99);
        REQUIRE(summary.garch_fallbacks >= 1);
        REQUIRE(summary.garch_nu > 2.0);
        REQUIRE(summary.historical.es95 <= summary.historical.var95);
    }

    SECTION("Monte Carlo per horizon")
    {
        REQUIRE(summary.monte_carlo.size() == 2);
        REQUIRE(summary.monte_carlo[0].horizon_days == 1);
        REQUIRE(summary.monte_carlo[1].horizon_days == 10);
        REQUIRE(summary.monte_carlo[1].pnl.var99 < summary.monte_carlo[0].pnl.var99);
        REQUIRE(summary.monte_carlo[0].pnl.es99 <= summary.monte_carlo[0].pnl.var99);
    }

    SECTION("Contributions")
    {
        REQUIRE(summary.component_es.tickers == panel.tickers());
        REQUIRE_THAT(summary.component_es.share.sum(), WithinAbs(1.0, 1e-10));
        REQUIRE_THAT(summary.component_var.share.sum(), WithinAbs(1.0, 1e-10));
        REQUIRE_THAT(summary.component_es.share(3), WithinAbs(0.0, 1e-15));
    }

    SECTION("JSON layout")
    {
        nlohmann::json j = summary.to_json();
        REQUIRE(j["weights"].contains("HIGH"));
        REQUIRE(j["per_asset_static"].size() == 4);
        REQUIRE(j["worst_static"].size() == 2);
        REQUIRE(j["static_t"].contains("nu_p"));
        REQUIRE(j["garch_t"].contains("fallbacks"));
        REQUIRE(j["historical"].contains("ES99"));
        REQUIRE(j["monte_carlo"].contains("1d"));
        REQUIRE(j["monte_carlo"].contains("10d"));
        REQUIRE(j["component_es"]["measure"] == "ES");
        REQUIRE(j["component_var"]["measure"] == "VaR");
    }

    SECTION("Report")
    {
        std::ostringstream out;
        print_summary(summary, out);
        const std::string text = out.str();
        REQUIRE(text.find("PORTFOLIO RESULTS") != std::string::npos);
        REQUIRE(text.find("HIGH") != std::string::npos);
        REQUIRE(text.find("Monte Carlo") != std::string::npos);
    }
}

TEST_CASE_METHOD(RiskSummaryTestFixture, "Risk summary configuration", "[Analytics][RiskSummary]")
{
    ReturnPanel panel = generate_panel(200);

    SECTION("Horizons without a one-day entry still give contributions")
    {
        RiskSummaryConfig config = small_config();
        config.monte_carlo.horizons = {5};
        RiskSummaryBuilder builder(config);

        RiskSummary summary = builder.build(panel, weights());
        REQUIRE(summary.monte_carlo.size() == 1);
        REQUIRE(summary.monte_carlo[0].horizon_days == 5);
        REQUIRE(summary.component_es.component.size() == 4);
    }

    SECTION("Same seed gives the same summary")
    {
        RiskSummaryBuilder builder(small_config());
        RiskSummary a = builder.build(panel, weights());
        RiskSummary b = builder.build(panel, weights());
        REQUIRE(a.static_nu == b.static_nu);
        REQUIRE(a.monte_carlo[0].pnl.var99 == b.monte_carlo[0].pnl.var99);
    }

    SECTION("Invalid settings")
    {
        RiskSummaryConfig config = small_config();
        config.top_n = 0;
        REQUIRE_THROWS_AS(RiskSummaryBuilder(config), std::invalid_argument);

        RiskSummaryBuilder builder(small_config());
        REQUIRE_THROWS_AS(builder.build(panel, Eigen::VectorXd::Ones(3)), std::invalid_argument);
    }
}

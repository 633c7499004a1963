/**
 * @file test_return_panel.cpp
 * @brief Unit tests for ReturnPanel and weight alignment
 */

#include <catch2/catch.hpp>
#include "data/return_panel.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>

using namespace tailrisk;
using Catch::Matchers::WithinAbs;

namespace
{
    const double kNaN = std::numeric_limits<double>::quiet_NaN();

    ReturnPanel make_panel()
    {
        Eigen::MatrixXd r(4, 2);
        r << 0.01, -0.02,
            0.02, 0.01,
            -0.01, 0.00,
            0.03, 0.02;
        return ReturnPanel(r, {"2020-01-02", "2020-01-03", "2020-01-06", "2020-01-07"}, {"AAPL", "MSFT"});
    }
}

TEST_CASE("ReturnPanel construction", "[ReturnPanel]")
{
    SECTION("Valid panel")
    {
        ReturnPanel panel = make_panel();
        REQUIRE(panel.num_dates() == 4);
        REQUIRE(panel.num_assets() == 2);
        REQUIRE(panel.find_ticker_index("MSFT") == 1);
        REQUIRE(panel.find_ticker_index("IBM") == -1);
    }

    SECTION("Dimension mismatch")
    {
        Eigen::MatrixXd r(2, 2);
        r.setZero();
        REQUIRE_THROWS_AS(ReturnPanel(r, {"2020-01-02"}, {"A", "B"}), std::invalid_argument);
        REQUIRE_THROWS_AS(ReturnPanel(r, {"2020-01-02", "2020-01-03"}, {"A"}), std::invalid_argument);
    }

    SECTION("Missing values are rejected")
    {
        Eigen::MatrixXd r(2, 2);
        r << 0.01, kNaN,
            0.02, 0.01;
        REQUIRE_THROWS_AS(ReturnPanel(r, {"2020-01-02", "2020-01-03"}, {"A", "B"}), std::invalid_argument);
    }

    SECTION("Duplicate tickers are rejected")
    {
        Eigen::MatrixXd r(1, 2);
        r << 0.01, 0.02;
        REQUIRE_THROWS_AS(ReturnPanel(r, {"2020-01-02"}, {"A", "A"}), std::invalid_argument);
    }
}

TEST_CASE("ReturnPanel access and slicing", "[ReturnPanel]")
{
    ReturnPanel panel = make_panel();

    SECTION("Asset returns by ticker")
    {
        Eigen::VectorXd msft = panel.asset_returns("MSFT");
        REQUIRE_THAT(msft(0), WithinAbs(-0.02, 1e-15));
        REQUIRE_THROWS_AS(panel.asset_returns("IBM"), std::invalid_argument);
    }

    SECTION("Portfolio returns")
    {
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        Eigen::VectorXd p = panel.portfolio_returns(w);
        REQUIRE_THAT(p(0), WithinAbs(-0.005, 1e-15));
        REQUIRE_THAT(p(3), WithinAbs(0.025, 1e-15));

        Eigen::VectorXd bad(3);
        bad.setConstant(1.0 / 3.0);
        REQUIRE_THROWS_AS(panel.portfolio_returns(bad), std::invalid_argument);
    }

    SECTION("Filter by date range is inclusive")
    {
        ReturnPanel filtered = panel.filter_by_date("2020-01-03", "2020-01-06");
        REQUIRE(filtered.num_dates() == 2);
        REQUIRE(filtered.dates().front() == "2020-01-03");
        REQUIRE(filtered.dates().back() == "2020-01-06");

        REQUIRE(panel.filter_by_date("2020-01-06", "").num_dates() == 2);
        REQUIRE_THROWS_AS(panel.filter_by_date("2021-01-01", "2021-12-31"), std::invalid_argument);
    }

    SECTION("Tail keeps the most recent dates")
    {
        ReturnPanel last = panel.tail(3);
        REQUIRE(last.num_dates() == 3);
        REQUIRE(last.dates().front() == "2020-01-03");
        REQUIRE(panel.tail(10).num_dates() == 4);
    }
}

TEST_CASE("Returns from prices", "[ReturnPanel]")
{
    std::vector<std::string> dates = {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-04"};
    std::vector<std::string> tickers = {"AAPL", "MSFT"};

    SECTION("Log returns drop the first date")
    {
        Eigen::MatrixXd prices(4, 2);
        prices << 100.0, 200.0,
            110.0, 210.0,
            105.0, 220.0,
            115.0, 215.0;

        ReturnPanel panel = ReturnPanel::from_prices(prices, dates, tickers);
        REQUIRE(panel.num_dates() == 3);
        REQUIRE(panel.dates().front() == "2020-01-02");
        REQUIRE_THAT(panel.returns()(0, 0), WithinAbs(std::log(1.1), 1e-12));
        REQUIRE_THAT(panel.returns()(2, 1), WithinAbs(std::log(215.0 / 220.0), 1e-12));
    }

    SECTION("Interior gaps are forward filled")
    {
        Eigen::MatrixXd prices(4, 2);
        prices << 100.0, 200.0,
            kNaN, 210.0,
            105.0, 220.0,
            115.0, 215.0;

        ReturnPanel panel = ReturnPanel::from_prices(prices, dates, tickers);
        REQUIRE(panel.num_dates() == 3);
        REQUIRE_THAT(panel.returns()(0, 0), WithinAbs(0.0, 1e-15));
        REQUIRE_THAT(panel.returns()(1, 0), WithinAbs(std::log(1.05), 1e-12));
    }

    SECTION("Leading gaps drop the affected dates")
    {
        Eigen::MatrixXd prices(4, 2);
        prices << 100.0, kNaN,
            110.0, kNaN,
            105.0, 220.0,
            115.0, 215.0;

        ReturnPanel panel = ReturnPanel::from_prices(prices, dates, tickers);
        REQUIRE(panel.num_dates() == 1);
        REQUIRE(panel.dates().front() == "2020-01-04");
    }

    SECTION("Too few prices")
    {
        Eigen::MatrixXd prices(1, 2);
        prices << 100.0, 200.0;
        REQUIRE_THROWS_AS(ReturnPanel::from_prices(prices, {"2020-01-01"}, tickers), std::invalid_argument);
    }
}

TEST_CASE("Weight alignment", "[ReturnPanel][Weights]")
{
    std::vector<std::string> tickers = {"AAPL", "MSFT", "JPM"};

    SECTION("Missing assets get zero, extras are dropped, sum renormalized")
    {
        std::map<std::string, double> weights = {{"AAPL", 0.2}, {"JPM", 0.2}, {"TSLA", 0.6}};
        Eigen::VectorXd w = align_weights(weights, tickers);

        REQUIRE(w.size() == 3);
        REQUIRE_THAT(w(0), WithinAbs(0.5, 1e-15));
        REQUIRE_THAT(w(1), WithinAbs(0.0, 1e-15));
        REQUIRE_THAT(w(2), WithinAbs(0.5, 1e-15));
    }

    SECTION("No overlap is an input error")
    {
        std::map<std::string, double> weights = {{"TSLA", 1.0}};
        REQUIRE_THROWS_AS(align_weights(weights, tickers), std::invalid_argument);
    }

    SECTION("Offsetting weights sum to zero")
    {
        std::map<std::string, double> weights = {{"AAPL", 0.5}, {"MSFT", -0.5}};
        REQUIRE_THROWS_AS(align_weights(weights, tickers), std::invalid_argument);
    }

    SECTION("Normalization keeps signs")
    {
        Eigen::VectorXd raw(3);
        raw << 2.0, -1.0, 1.0;
        Eigen::VectorXd w = normalize_weights(raw);
        REQUIRE_THAT(w.sum(), WithinAbs(1.0, 1e-15));
        REQUIRE_THAT(w(1), WithinAbs(-0.5, 1e-15));
    }
}

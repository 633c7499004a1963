/**
 * @file test_portfolio_models.cpp
 * @brief Unit tests for the parametric and historical portfolio VaR models
 */

#include <catch2/catch.hpp>
#include "portfolio/garch_t_portfolio.hpp"
#include "portfolio/historical_portfolio.hpp"
#include "portfolio/static_t_portfolio.hpp"
#include "stats/distributions.hpp"
#include "stats/sample_statistics.hpp"
#include <cmath>
#include <memory>
#include <random>
#include <vector>

using namespace tailrisk;
using namespace tailrisk::portfolio;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

class PortfolioModelTestFixture
{
protected:
    ReturnPanel generate_panel(int num_days, int num_assets, unsigned seed = 42)
    {
        std::mt19937_64 rng(seed);
        std::normal_distribution<double> dist(0.0, 0.01);

        Eigen::MatrixXd returns(num_days, num_assets);
        for (int i = 0; i < num_days; ++i)
        {
            for (int j = 0; j < num_assets; ++j)
            {
                returns(i, j) = dist(rng);
            }
        }

        std::vector<std::string> dates;
        for (int i = 0; i < num_days; ++i)
        {
            dates.push_back("D" + std::to_string(100000 + i));
        }

        std::vector<std::string> tickers;
        for (int j = 0; j < num_assets; ++j)
        {
            tickers.push_back("ASSET" + std::to_string(j));
        }

        return ReturnPanel(returns, dates, tickers);
    }

    // Independent Student-t(nu) columns rescaled to standard deviation stdev
    ReturnPanel generate_t_panel(int num_days, int num_assets, double nu, double stdev, unsigned seed = 42)
    {
        std::mt19937_64 rng(seed);
        std::student_t_distribution<double> dist(nu);
        const double scale = stdev * std::sqrt((nu - 2.0) / nu);

        Eigen::MatrixXd returns(num_days, num_assets);
        for (int i = 0; i < num_days; ++i)
        {
            for (int j = 0; j < num_assets; ++j)
            {
                returns(i, j) = scale * dist(rng);
            }
        }

        std::vector<std::string> dates;
        for (int i = 0; i < num_days; ++i)
        {
            dates.push_back("D" + std::to_string(100000 + i));
        }

        std::vector<std::string> tickers;
        for (int j = 0; j < num_assets; ++j)
        {
            tickers.push_back("T" + std::to_string(j));
        }

        return ReturnPanel(returns, dates, tickers);
    }
};

TEST_CASE("TailRiskMeasures", "[Portfolio]")
{
    marginal::MarginalModel model;
    model.nu = 5.0;
    model.mu = 0.0;
    model.sigma = 0.01;

    TailRiskMeasures m = TailRiskMeasures::from_marginal(model);
    REQUIRE_THAT(m.var95, WithinAbs(0.01 * stats::student_t_quantile(0.05, 5.0), 1e-12));
    REQUIRE(m.es99 < m.var99);
    REQUIRE(m.var99 < m.var95);

    nlohmann::json j = m.to_json();
    REQUIRE(j.contains("VaR95"));
    REQUIRE(j.contains("ES99"));
    REQUIRE_THAT(j["ES95"].get<double>(), WithinAbs(m.es95, 1e-15));
}

TEST_CASE_METHOD(PortfolioModelTestFixture, "StaticTPortfolio", "[Portfolio][StaticT]")
{
    ReturnPanel panel = generate_panel(750, 2);

    SECTION("Scale follows the sample covariance")
    {
        marginal::StudentTFitConfig config;
        config.min_df = 8;
        config.max_df = 8;
        StaticTPortfolio model(config);

        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        marginal::MarginalModel fitted = model.fit_portfolio(panel, w);

        const Eigen::MatrixXd &r = panel.returns();
        Eigen::MatrixXd centered = r.rowwise() - r.colwise().mean();
        Eigen::MatrixXd cov = centered.transpose() * centered / (r.rows() - 1.0);

        REQUIRE(fitted.nu == 8.0);
        REQUIRE_THAT(fitted.sigma, WithinRel(std::sqrt(w.dot(cov * w)), 1e-10));
        REQUIRE_THAT(fitted.mu, WithinAbs(w.dot(r.colwise().mean().transpose()), 1e-15));
    }

    SECTION("Diversification for nearly independent assets")
    {
        StaticTPortfolio model;
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        marginal::MarginalModel fitted = model.fit_portfolio(panel, w);

        const double single = stats::sample_std(panel.returns().col(0));
        // Equal weights on two uncorrelated unit-scale assets shrink sigma by sqrt(0.5)
        REQUIRE_THAT(fitted.sigma / single, WithinAbs(std::sqrt(0.5), 0.06));
    }

    SECTION("Equal-weighted independent t(5) assets")
    {
        ReturnPanel t_panel = generate_t_panel(20000, 2, 5.0, 0.01);

        marginal::StudentTFitConfig config;
        config.min_df = 5;
        config.max_df = 5;
        StaticTPortfolio model(config);

        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        TailRiskMeasures measures = model.compute(t_panel, w);

        const double single_var95 = 0.01 * stats::student_t_quantile(0.05, 5.0);
        REQUIRE_THAT(measures.var95, WithinRel(std::sqrt(0.5) * single_var95, 0.05));

        Eigen::VectorXd first(2);
        first << 1.0, 0.0;
        TailRiskMeasures single = model.compute(t_panel, first);
        REQUIRE_THAT(single.var95, WithinRel(single_var95, 0.05));
        REQUIRE_THAT(measures.var95 / single.var95, WithinAbs(std::sqrt(0.5), 0.05));
    }

    SECTION("Measures are ordered and reproducible")
    {
        StaticTPortfolio model;
        Eigen::VectorXd w(2);
        w << 0.7, 0.3;

        TailRiskMeasures a = model.compute(panel, w);
        TailRiskMeasures b = model.compute(panel, w);

        REQUIRE(a.es95 < a.var95);
        REQUIRE(a.es99 < a.var99);
        REQUIRE(a.var95 == b.var95);
        REQUIRE(model.get_name() == "StaticStudentT");
    }

    SECTION("Weight size mismatch")
    {
        StaticTPortfolio model;
        REQUIRE_THROWS_AS(model.compute(panel, Eigen::VectorXd::Ones(3)), std::invalid_argument);
    }
}

TEST_CASE("GarchTPortfolio aggregation", "[Portfolio][GARCH]")
{
    std::vector<marginal::MarginalModel> marginals(2);
    marginals[0].nu = 4.0;
    marginals[0].mu = 0.001;
    marginals[0].sigma = 0.02;
    marginals[1].nu = 10.0;
    marginals[1].mu = -0.001;
    marginals[1].sigma = 0.01;

    Eigen::MatrixXd corr(2, 2);
    corr << 1.0, 0.5,
        0.5, 1.0;

    SECTION("Scale combines forecasts through the correlation")
    {
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        marginal::MarginalModel agg = GarchTPortfolio::aggregate(marginals, corr, w);

        const double expected_var = 0.25 * 0.0004 + 0.25 * 0.0001 + 2.0 * 0.25 * 0.5 * 0.02 * 0.01;
        REQUIRE_THAT(agg.sigma, WithinRel(std::sqrt(expected_var), 1e-12));
        REQUIRE_THAT(agg.mu, WithinAbs(0.0, 1e-15));
        REQUIRE_THAT(agg.nu, WithinAbs(7.0, 1e-12));
        REQUIRE(agg.kind == marginal::MarginalKind::CONDITIONAL);
    }

    SECTION("Degrees of freedom average uses absolute weights")
    {
        Eigen::VectorXd w(2);
        w << 1.5, -0.5;
        marginal::MarginalModel agg = GarchTPortfolio::aggregate(marginals, corr, w);
        REQUIRE_THAT(agg.nu, WithinAbs((1.5 * 4.0 + 0.5 * 10.0) / 2.0, 1e-12));
    }

    SECTION("Fallback status propagates")
    {
        marginals[1].diagnostics.used_fallback = true;
        marginals[1].diagnostics.converged = false;

        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        marginal::MarginalModel agg = GarchTPortfolio::aggregate(marginals, corr, w);
        REQUIRE(agg.diagnostics.used_fallback);
        REQUIRE_FALSE(agg.diagnostics.converged);
    }

    SECTION("Dimension checks")
    {
        REQUIRE_THROWS_AS(GarchTPortfolio::aggregate(marginals, corr, Eigen::VectorXd::Ones(3)),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(GarchTPortfolio::aggregate(marginals, corr, Eigen::VectorXd::Zero(2)),
                          std::invalid_argument);
    }
}

TEST_CASE_METHOD(PortfolioModelTestFixture, "GarchTPortfolio on short history", "[Portfolio][GARCH]")
{
    // Below the minimum sample every asset uses the fallback moments
    ReturnPanel panel = generate_panel(40, 3);
    GarchTPortfolio model;

    std::vector<marginal::MarginalModel> marginals = model.fit_assets(panel);
    REQUIRE(marginals.size() == 3);
    for (const auto &m : marginals)
    {
        REQUIRE(m.diagnostics.used_fallback);
        REQUIRE(m.nu == 30.0);
    }

    TailRiskMeasures measures = model.compute(panel, Eigen::VectorXd::Constant(3, 1.0 / 3.0));
    REQUIRE(measures.es99 < measures.var99);
    REQUIRE(model.get_name() == "GarchStudentT");
}

TEST_CASE_METHOD(PortfolioModelTestFixture, "HistoricalPortfolio", "[Portfolio][Historical]")
{
    SECTION("Empirical quantile and tail mean")
    {
        Eigen::VectorXd r(10);
        r << -0.05, -0.03, -0.02, -0.01, 0.0, 0.01, 0.02, 0.03, 0.04, 0.05;

        std::pair<double, double> result = HistoricalPortfolio::var_es(r, 0.1);
        // index 0.1 * 9 = 0.9 between -0.05 and -0.03
        REQUIRE_THAT(result.first, WithinAbs(-0.032, 1e-12));
        REQUIRE_THAT(result.second, WithinAbs(-0.05, 1e-12));
    }

    SECTION("Invalid series and tail probability")
    {
        REQUIRE_THROWS_AS(HistoricalPortfolio::var_es(Eigen::VectorXd(), 0.05), std::invalid_argument);
        REQUIRE_THROWS_AS(HistoricalPortfolio::from_series(Eigen::VectorXd()), std::invalid_argument);
        REQUIRE_THROWS_AS(HistoricalPortfolio::var_es(Eigen::VectorXd::Ones(3), 0.0), std::invalid_argument);
    }

    SECTION("Portfolio series through the model interface")
    {
        ReturnPanel panel = generate_panel(500, 2);
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;

        std::unique_ptr<PortfolioVaRModel> model = std::make_unique<HistoricalPortfolio>();
        TailRiskMeasures m = model->compute(panel, w);

        TailRiskMeasures direct = HistoricalPortfolio::from_series(panel.portfolio_returns(w));
        REQUIRE(m.var95 == direct.var95);
        REQUIRE(m.es95 <= m.var95);
        REQUIRE(m.es99 <= m.var99);
        REQUIRE(model->get_name() == "Historical");
    }
}

TEST_CASE_METHOD(PortfolioModelTestFixture, "Portfolio models renormalize weights", "[Portfolio]")
{
    ReturnPanel panel = generate_panel(300, 2, 11);

    Eigen::VectorXd raw(2);
    raw << 1.0, 1.0;
    Eigen::VectorXd unit(2);
    unit << 0.5, 0.5;

    std::vector<std::unique_ptr<PortfolioVaRModel>> models;
    models.push_back(std::make_unique<StaticTPortfolio>());
    models.push_back(std::make_unique<GarchTPortfolio>());
    models.push_back(std::make_unique<HistoricalPortfolio>());

    for (const auto &model : models)
    {
        INFO("model " << model->get_name());
        TailRiskMeasures a = model->compute(panel, raw);
        TailRiskMeasures b = model->compute(panel, unit);
        REQUIRE(a.var95 == b.var95);
        REQUIRE(a.es95 == b.es95);
        REQUIRE(a.var99 == b.var99);
        REQUIRE(a.es99 == b.es99);

        Eigen::VectorXd offsetting(2);
        offsetting << 1.0, -1.0;
        REQUIRE_THROWS_AS(model->compute(panel, offsetting), std::invalid_argument);
    }
}

/**
 * @file risk_summary.cpp
 * @brief Implementation of the one-shot risk summary
 */

#include "analytics/risk_summary.hpp"
#include "portfolio/garch_t_portfolio.hpp"
#include "portfolio/historical_portfolio.hpp"
#include "portfolio/static_t_portfolio.hpp"
#include "risk/sample_covariance.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace tailrisk
{
    namespace analytics
    {

        namespace
        {
            nlohmann::json nullable(double x)
            {
                if (std::isnan(x))
                {
                    return nullptr;
                }
                return x;
            }

            nlohmann::json measures_json(const portfolio::TailRiskMeasures &m)
            {
                return nlohmann::json{
                    {"VaR95", nullable(m.var95)},
                    {"ES95", nullable(m.es95)},
                    {"VaR99", nullable(m.var99)},
                    {"ES99", nullable(m.es99)}};
            }

            std::string pct(double x)
            {
                if (std::isnan(x))
                {
                    return "n/a";
                }
                std::ostringstream ss;
                ss << std::fixed << std::setprecision(2) << x * 100.0 << "%";
                return ss.str();
            }

            std::string money(double x, int digits = 0)
            {
                if (std::isnan(x))
                {
                    return "n/a";
                }
                std::ostringstream ss;
                ss << std::fixed << std::setprecision(digits) << x;
                return ss.str();
            }

            void print_asset_rows(std::ostream &os, const std::vector<AssetRiskRow> &rows)
            {
                os << "  " << std::left << std::setw(10) << "Ticker"
                   << std::right << std::setw(10) << "Mean"
                   << std::setw(10) << "Std"
                   << std::setw(6) << "nu"
                   << std::setw(10) << "VaR95"
                   << std::setw(10) << "ES95"
                   << std::setw(10) << "VaR99"
                   << std::setw(10) << "ES99" << "\n";
                os << "  " << std::string(76, '-') << "\n";

                for (const auto &row : rows)
                {
                    os << "  " << std::left << std::setw(10) << row.ticker << std::right;
                    if (!row.ok)
                    {
                        os << "  failed: " << row.error << "\n";
                        continue;
                    }
                    os << std::setw(10) << pct(row.mean)
                       << std::setw(10) << pct(row.stdev)
                       << std::setw(6) << static_cast<int>(row.nu)
                       << std::setw(10) << pct(row.var95)
                       << std::setw(10) << pct(row.es95)
                       << std::setw(10) << pct(row.var99)
                       << std::setw(10) << pct(row.es99) << "\n";
                }
            }

            void print_measures(std::ostream &os, const std::string &title,
                                const portfolio::TailRiskMeasures &m)
            {
                os << "\n"
                   << title << ":\n";
                os << "  VaR95 = " << pct(m.var95) << ", ES95 = " << pct(m.es95) << "\n";
                os << "  VaR99 = " << pct(m.var99) << ", ES99 = " << pct(m.es99) << "\n";
            }

            void print_contribution(std::ostream &os, const RiskContribution &c)
            {
                if (c.component.size() == 0)
                {
                    return;
                }
                os << "\nComponent " << c.measure << " (tail " << pct(c.alpha)
                   << ", total " << pct(c.total) << "):\n";
                for (int i : c.ranking())
                {
                    const std::string label = i < static_cast<int>(c.tickers.size()) ? c.tickers[i] : std::to_string(i);
                    os << "  " << std::left << std::setw(10) << label << std::right
                       << " w " << std::setw(8) << pct(c.weights(i))
                       << "  component " << std::setw(9) << pct(c.component(i))
                       << "  share " << std::setw(8) << pct(c.share(i)) << "\n";
                }
            }
        } // anonymous namespace

        // ============================================================================
        // Serialization
        // ============================================================================

        nlohmann::json AssetRiskRow::to_json() const
        {
            nlohmann::json j;
            j["ticker"] = ticker;
            j["ok"] = ok;
            if (!ok)
            {
                j["error"] = error;
                return j;
            }
            j["mean"] = mean;
            j["std"] = stdev;
            j["nu"] = nu;
            j["VaR95"] = var95;
            j["ES95"] = es95;
            j["VaR99"] = var99;
            j["ES99"] = es99;
            return j;
        }

        nlohmann::json RiskSummary::to_json() const
        {
            nlohmann::json j;
            j["notional"] = notional;

            nlohmann::json w = nlohmann::json::object();
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                w[tickers[i]] = weights(i);
            }
            j["weights"] = w;

            auto rows_json = [](const std::vector<AssetRiskRow> &rows)
            {
                nlohmann::json arr = nlohmann::json::array();
                for (const auto &row : rows)
                {
                    arr.push_back(row.to_json());
                }
                return arr;
            };
            j["per_asset_static"] = rows_json(assets);
            j["worst_static"] = rows_json(worst);
            j["best_static"] = rows_json(best);

            j["static_t"] = measures_json(static_t);
            j["static_t"]["nu_p"] = nullable(static_nu);

            j["garch_t"] = measures_json(garch_t);
            j["garch_t"]["nu_p"] = nullable(garch_nu);
            j["garch_t"]["converged"] = garch_converged;
            j["garch_t"]["fallbacks"] = garch_fallbacks;

            j["historical"] = measures_json(historical);

            nlohmann::json mc = nlohmann::json::object();
            for (const auto &h : monte_carlo)
            {
                mc[std::to_string(h.horizon_days) + "d"] = measures_json(h.pnl);
            }
            j["monte_carlo"] = mc;

            j["component_es"] = component_es.to_json();
            j["component_var"] = component_var.to_json();
            return j;
        }

        // ============================================================================
        // RiskSummaryConfig
        // ============================================================================

        void RiskSummaryConfig::validate() const
        {
            student_t.validate();
            garch.validate();
            monte_carlo.validate();
            if (top_n < 1)
            {
                throw std::invalid_argument("top_n must be at least 1, got: " + std::to_string(top_n));
            }
        }

        // ============================================================================
        // RiskSummaryBuilder
        // ============================================================================

        RiskSummaryBuilder::RiskSummaryBuilder(const RiskSummaryConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        std::vector<AssetRiskRow> RiskSummaryBuilder::asset_table(const ReturnPanel &panel) const
        {
            marginal::StudentTFitter fitter(config_.student_t);
            std::mt19937_64 rng(config_.seed);

            std::vector<AssetRiskRow> rows;
            rows.reserve(panel.num_assets());

            for (size_t j = 0; j < panel.num_assets(); ++j)
            {
                AssetRiskRow row;
                row.ticker = panel.tickers()[j];

                try
                {
                    marginal::MarginalModel model = fitter.fit(panel.returns().col(j), rng);
                    row.mean = model.mu;
                    row.stdev = model.sigma;
                    row.nu = model.nu;
                    row.var95 = model.value_at_risk(0.05);
                    row.es95 = model.expected_shortfall(0.05);
                    row.var99 = model.value_at_risk(0.01);
                    row.es99 = model.expected_shortfall(0.01);
                    row.ok = true;
                }
                catch (const std::exception &e)
                {
                    row.ok = false;
                    row.error = e.what();
                    if (config_.verbose)
                    {
                        std::cerr << "Warning: static Student-t fit failed for "
                                  << row.ticker << ": " << e.what() << std::endl;
                    }
                }

                rows.push_back(row);
            }

            return rows;
        }

        void RiskSummaryBuilder::rank_assets(RiskSummary &summary) const
        {
            std::vector<AssetRiskRow> ranked;
            for (const auto &row : summary.assets)
            {
                if (row.ok)
                {
                    ranked.push_back(row);
                }
            }

            // More negative ES95 is riskier
            std::stable_sort(ranked.begin(), ranked.end(),
                             [](const AssetRiskRow &a, const AssetRiskRow &b)
                             { return a.es95 < b.es95; });

            const size_t k = std::min(static_cast<size_t>(config_.top_n), ranked.size());
            summary.worst.assign(ranked.begin(), ranked.begin() + k);
            summary.best.assign(ranked.end() - k, ranked.end());
        }

        RiskSummary RiskSummaryBuilder::build(const ReturnPanel &panel,
                                              const Eigen::VectorXd &weights) const
        {
            if (weights.size() != static_cast<int>(panel.num_assets()))
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) + ") does not match number of assets (" + std::to_string(panel.num_assets()) + ")");
            }

            RiskSummary summary;
            summary.notional = config_.monte_carlo.notional;
            summary.tickers = panel.tickers();
            summary.weights = normalize_weights(weights);
            const Eigen::VectorXd &w = summary.weights;

            // Per-asset static Student-t
            summary.assets = asset_table(panel);
            rank_assets(summary);

            // Static-t portfolio
            portfolio::StaticTPortfolio static_model(config_.student_t, config_.seed);
            marginal::MarginalModel static_fit = static_model.fit_portfolio(panel, w);
            summary.static_nu = static_fit.nu;
            summary.static_t = portfolio::TailRiskMeasures::from_marginal(static_fit);

            // GARCH-t portfolio
            portfolio::GarchTPortfolio garch_model(config_.garch);
            std::vector<marginal::MarginalModel> garch_fits = garch_model.fit_assets(panel);
            for (const auto &fit : garch_fits)
            {
                if (fit.diagnostics.used_fallback)
                {
                    ++summary.garch_fallbacks;
                }
            }
            risk::SampleCovariance sample(true);
            marginal::MarginalModel garch_fit = portfolio::GarchTPortfolio::aggregate(
                garch_fits, sample.estimate_correlation(panel.returns()), w);
            summary.garch_nu = garch_fit.nu;
            summary.garch_converged = garch_fit.diagnostics.converged;
            summary.garch_t = portfolio::TailRiskMeasures::from_marginal(garch_fit);

            // Historical
            summary.historical = portfolio::HistoricalPortfolio::from_series(panel.portfolio_returns(w));

            // Monte Carlo t-copula
            simulation::TCopulaEngine engine(config_.monte_carlo,
                                             risk::RiskModelFactory::create(config_.dependence));

            Eigen::MatrixXd one_day_scenarios;
            for (int h : config_.monte_carlo.horizons)
            {
                simulation::SimulationResult sim = engine.simulate(panel, w, h);
                summary.monte_carlo.push_back({h, simulation::TCopulaEngine::measures(sim.pnl)});
                if (h == 1)
                {
                    one_day_scenarios = sim.asset_returns;
                }

                if (config_.verbose)
                {
                    std::cout << "  - Simulated " << config_.monte_carlo.n_sims
                              << " scenarios at " << h << "d horizon" << std::endl;
                }
            }
            if (one_day_scenarios.size() == 0)
            {
                one_day_scenarios = engine.simulate(panel, w, 1).asset_returns;
            }

            // Contributions
            summary.component_es = component_es(one_day_scenarios, w, 0.05);
            summary.component_es.tickers = summary.tickers;
            summary.component_var = component_var(panel.returns(), w, 0.01);
            summary.component_var.tickers = summary.tickers;

            return summary;
        }

        // ============================================================================
        // Printing
        // ============================================================================

        void print_summary(const RiskSummary &summary, std::ostream &os)
        {
            os << "\n=== Per-asset static Student-t ===\n";
            print_asset_rows(os, summary.assets);

            os << "\n--- Worst " << summary.worst.size() << " assets by ES 95% (static Student-t) ---\n";
            print_asset_rows(os, summary.worst);

            os << "\n--- Best " << summary.best.size() << " assets by ES 95% (static Student-t) ---\n";
            print_asset_rows(os, summary.best);

            os << "\n--- PORTFOLIO RESULTS ---\n";
            print_measures(os, "Static Student-t (unconditional, nu_p = " + money(summary.static_nu, 0) + ")",
                           summary.static_t);
            print_measures(os, "GARCH-t (conditional, nu_p ~ " + money(summary.garch_nu, 1) + ")",
                           summary.garch_t);
            if (!summary.garch_converged || summary.garch_fallbacks > 0)
            {
                os << "  note: " << summary.garch_fallbacks
                   << " asset(s) used the sample-moment fallback or did not converge\n";
            }
            print_measures(os, "Historical (non-parametric)", summary.historical);

            os << "\nMonte Carlo t-copula (notional " << money(summary.notional) << "):\n";
            for (const auto &h : summary.monte_carlo)
            {
                os << "  " << std::setw(3) << h.horizon_days << "d  VaR95 = " << money(h.pnl.var95)
                   << ", ES95 = " << money(h.pnl.es95)
                   << ", VaR99 = " << money(h.pnl.var99)
                   << ", ES99 = " << money(h.pnl.es99) << "\n";
            }

            print_contribution(os, summary.component_es);
            print_contribution(os, summary.component_var);
        }

    } // namespace analytics
} // namespace tailrisk

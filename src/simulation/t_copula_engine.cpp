/**
 * @file t_copula_engine.cpp
 * @brief Implementation of the t-copula Monte Carlo simulator
 */

#include "simulation/t_copula_engine.hpp"
#include "core/errors.hpp"
#include "risk/ewma_covariance.hpp"
#include "stats/distributions.hpp"
#include "stats/sample_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace tailrisk
{
    namespace simulation
    {

        // ============================================================================
        // MonteCarloConfig Implementation
        // ============================================================================

        void MonteCarloConfig::validate() const
        {
            if (n_sims <= 0)
            {
                throw std::invalid_argument(
                    "Number of simulations must be positive, got: " + std::to_string(n_sims));
            }
            if (!std::isfinite(notional))
            {
                throw std::invalid_argument("Notional must be finite");
            }
            for (int h : horizons)
            {
                if (h < 1)
                {
                    throw std::invalid_argument(
                        "Simulation horizons must be at least 1 day, got: " + std::to_string(h));
                }
            }
            if (!(nu_copula > 0.0))
            {
                throw std::invalid_argument(
                    "Copula degrees of freedom must be positive, got: " + std::to_string(nu_copula));
            }
            if (!(nu_marginal > 2.0))
            {
                throw NumericalError(
                    "Marginal degrees of freedom must exceed 2 for a unit-variance rescale, got: " + std::to_string(nu_marginal));
            }
        }

        MonteCarloConfig MonteCarloConfig::from_json(const nlohmann::json &j)
        {
            MonteCarloConfig config;
            config.notional = j.value("notional", config.notional);
            config.n_sims = j.value("n_sims", config.n_sims);
            config.horizons = j.value("horizons", config.horizons);
            config.nu_copula = j.value("nu_copula", config.nu_copula);
            config.nu_marginal = j.value("nu_marginal", config.nu_marginal);
            config.seed = j.value("seed", config.seed);
            config.verbose = j.value("verbose", config.verbose);
            return config;
        }

        // ============================================================================
        // TCopulaEngine Implementation
        // ============================================================================

        TCopulaEngine::TCopulaEngine(const MonteCarloConfig &config,
                                     std::unique_ptr<risk::RiskModel> dependence_model)
            : config_(config), dependence_model_(std::move(dependence_model))
        {
            config_.validate();

            if (!dependence_model_)
            {
                dependence_model_ = std::make_unique<risk::EWMACovariance>(0.94);
            }
        }

        Eigen::MatrixXd TCopulaEngine::transform_margins(const Eigen::MatrixXd &z) const
        {
            const double nu_c = config_.nu_copula;
            const double nu_m = config_.nu_marginal;
            const double unit_scale = 1.0 / std::sqrt(nu_m / (nu_m - 2.0));

            // The t(nu_c) -> t(nu_m) map is the identity when both agree
            if (nu_c == nu_m)
            {
                return z * unit_scale;
            }

            Eigen::MatrixXd x(z.rows(), z.cols());
            const double smallest = std::numeric_limits<double>::min();

            for (int j = 0; j < z.cols(); ++j)
            {
                for (int i = 0; i < z.rows(); ++i)
                {
                    const double v = z(i, j);
                    if (v == 0.0)
                    {
                        x(i, j) = 0.0;
                        continue;
                    }

                    // Work in the lower tail for precision, then restore the sign
                    double u = std::max(stats::student_t_cdf(-std::abs(v), nu_c), smallest);
                    double q = u >= 0.5 ? 0.0 : stats::student_t_quantile(u, nu_m);
                    x(i, j) = v < 0.0 ? q : -q;
                }
            }

            return x * unit_scale;
        }

        Eigen::MatrixXd TCopulaEngine::simulate_asset_returns(const ReturnPanel &panel,
                                                              int horizon_days,
                                                              std::mt19937_64 &rng) const
        {
            if (horizon_days < 1)
            {
                throw std::invalid_argument(
                    "Horizon must be at least 1 day, got: " + std::to_string(horizon_days));
            }

            const Eigen::MatrixXd &returns = panel.returns();
            const int n = config_.n_sims;
            const int d = returns.cols();

            // 1) Dependence and Cholesky factor
            risk::DependenceMatrix dep = dependence_model_->estimate_dependence(returns);
            Eigen::MatrixXd L = dep.cholesky_factor();

            if (config_.verbose)
            {
                std::cout << "  Simulating " << n << " scenarios, " << d << " assets, horizon "
                          << horizon_days << "d using " << dependence_model_->get_name() << "\n";
            }

            // 2) Batched draws: normals and chi-squared mixing variables
            std::normal_distribution<double> normal(0.0, 1.0);
            std::chi_squared_distribution<double> chi2(config_.nu_copula);

            Eigen::MatrixXd normals(n, d);
            for (int i = 0; i < n; ++i)
            {
                for (int j = 0; j < d; ++j)
                {
                    normals(i, j) = normal(rng);
                }
            }

            Eigen::VectorXd mixing(n);
            for (int i = 0; i < n; ++i)
            {
                mixing(i) = std::sqrt(chi2(rng) / config_.nu_copula);
            }

            Eigen::MatrixXd z = normals * L.transpose();
            z = z.array().colwise() / mixing.array();

            // 3-4) Margins, unit variance, horizon scaling and drift
            Eigen::MatrixXd x = transform_margins(z);

            const double sqrt_h = std::sqrt(static_cast<double>(horizon_days));
            Eigen::RowVectorXd drift = returns.colwise().mean() * static_cast<double>(horizon_days);
            Eigen::VectorXd scale = dep.vols * sqrt_h;

            Eigen::MatrixXd simulated = x * scale.asDiagonal();
            simulated.rowwise() += drift;

            return simulated;
        }

        SimulationResult TCopulaEngine::simulate(const ReturnPanel &panel,
                                                 const Eigen::VectorXd &weights,
                                                 int horizon_days) const
        {
            if (weights.size() != static_cast<int>(panel.num_assets()))
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) + ") does not match number of assets (" + std::to_string(panel.num_assets()) + ")");
            }

            SimulationResult result;
            result.weights = normalize_weights(weights);
            result.horizon_days = horizon_days;

            std::mt19937_64 rng(config_.seed);
            result.asset_returns = simulate_asset_returns(panel, horizon_days, rng);
            result.portfolio_returns = result.asset_returns * result.weights;
            result.pnl = config_.notional * result.portfolio_returns;

            return result;
        }

        Eigen::VectorXd TCopulaEngine::simulate_pnl(const ReturnPanel &panel,
                                                    const Eigen::VectorXd &weights,
                                                    int horizon_days) const
        {
            return simulate(panel, weights, horizon_days).pnl;
        }

        std::pair<double, double> TCopulaEngine::var_cvar(const Eigen::VectorXd &pnl, double confidence)
        {
            if (pnl.size() == 0)
            {
                throw std::invalid_argument("Cannot compute VaR of an empty PnL sample");
            }
            if (!(confidence > 0.0 && confidence < 1.0))
            {
                throw std::invalid_argument(
                    "Confidence level must be in the range (0, 1), got: " + std::to_string(confidence));
            }

            const double var = stats::quantile(pnl, 1.0 - confidence);
            double cvar = stats::tail_mean(pnl, var);
            if (std::isnan(cvar))
            {
                cvar = var;
            }
            return {var, cvar};
        }

        portfolio::TailRiskMeasures TCopulaEngine::measures(const Eigen::VectorXd &pnl)
        {
            portfolio::TailRiskMeasures m;
            std::pair<double, double> r95 = var_cvar(pnl, 0.95);
            std::pair<double, double> r99 = var_cvar(pnl, 0.99);
            m.var95 = r95.first;
            m.es95 = r95.second;
            m.var99 = r99.first;
            m.es99 = r99.second;
            return m;
        }

    } // namespace simulation
} // namespace tailrisk

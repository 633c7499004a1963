/**
 * @file garch_fitter.cpp
 * @brief Implementation of the GARCH(p,q)-t conditional estimator
 */

#include "marginal/garch_fitter.hpp"
#include "optimizer/nelder_mead_solver.hpp"
#include "stats/sample_statistics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace tailrisk
{
    namespace marginal
    {

        namespace
        {
            constexpr double kPi = 3.14159265358979323846;
            constexpr double kBackcastDecay = 0.94;
            constexpr int kBackcastLength = 75;
            constexpr double kNuLower = 2.05;
            constexpr double kNuRange = 497.95;

            constexpr double kStartAlpha = 0.05;
            constexpr double kStartBeta = 0.90;
            constexpr double kStartNu = 8.0;

            double backcast(const Eigen::VectorXd &resid)
            {
                const int m = std::min<int>(kBackcastLength, resid.size());
                double weighted = 0.0;
                double total = 0.0;
                double w = 1.0;
                for (int i = 0; i < m; ++i)
                {
                    weighted += w * resid(i) * resid(i);
                    total += w;
                    w *= kBackcastDecay;
                }
                return weighted / total;
            }

            /**
             * @brief Conditional variance path and the one-step-ahead forecast
             * @return false if any variance is non-positive or non-finite
             */
            bool variance_path(const Eigen::VectorXd &resid,
                               double omega,
                               const Eigen::VectorXd &alpha,
                               const Eigen::VectorXd &beta,
                               std::vector<double> &sigma2,
                               double &next_variance)
            {
                const int n = resid.size();
                const int p = alpha.size();
                const int q = beta.size();
                const double bc = backcast(resid);

                sigma2.assign(n, 0.0);

                for (int t = 0; t <= n; ++t)
                {
                    double s2 = omega;
                    for (int i = 1; i <= p; ++i)
                    {
                        s2 += alpha(i - 1) * (t - i >= 0 ? resid(t - i) * resid(t - i) : bc);
                    }
                    for (int j = 1; j <= q; ++j)
                    {
                        s2 += beta(j - 1) * (t - j >= 0 ? sigma2[t - j] : bc);
                    }

                    if (!(s2 > 0.0) || !std::isfinite(s2))
                    {
                        return false;
                    }

                    if (t < n)
                    {
                        sigma2[t] = s2;
                    }
                    else
                    {
                        next_variance = s2;
                    }
                }
                return true;
            }

            // theta = [mu, log(omega), a_1..a_p, b_1..b_q, logit((nu - 2.05) / 497.95)]
            struct DecodedParams
            {
                double mu;
                double omega;
                Eigen::VectorXd alpha;
                Eigen::VectorXd beta;
                double nu;
            };

            DecodedParams decode(const Eigen::VectorXd &theta, int p, int q)
            {
                DecodedParams d;
                d.mu = theta(0);
                d.omega = std::exp(theta(1));

                Eigen::VectorXd e = theta.segment(2, p + q).array().exp();
                const double denom = 1.0 + e.sum();
                d.alpha = e.head(p) / denom;
                d.beta = e.tail(q) / denom;

                d.nu = kNuLower + kNuRange / (1.0 + std::exp(-theta(2 + p + q)));
                return d;
            }

            Eigen::VectorXd encode(double mu, double omega, const Eigen::VectorXd &alpha,
                                   const Eigen::VectorXd &beta, double nu)
            {
                const int p = alpha.size();
                const int q = beta.size();
                const double slack = 1.0 - alpha.sum() - beta.sum();

                Eigen::VectorXd theta(3 + p + q);
                theta(0) = mu;
                theta(1) = std::log(omega);
                for (int i = 0; i < p; ++i)
                {
                    theta(2 + i) = std::log(alpha(i) / slack);
                }
                for (int j = 0; j < q; ++j)
                {
                    theta(2 + p + j) = std::log(beta(j) / slack);
                }
                theta(2 + p + q) = std::log((nu - kNuLower) / (kNuLower + kNuRange - nu));
                return theta;
            }

            std::string to_lower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return std::tolower(c); });
                return s;
            }
        } // anonymous namespace

        // ============================================================================
        // GarchConfig Implementation
        // ============================================================================

        void GarchConfig::validate() const
        {
            if (min_observations < 2)
            {
                throw std::invalid_argument(
                    "GARCH min_observations must be at least 2, got: " + std::to_string(min_observations));
            }
            if (!(fallback_df > 2.0))
            {
                throw std::invalid_argument(
                    "GARCH fallback_df must exceed 2, got: " + std::to_string(fallback_df));
            }
            if (max_iterations <= 0)
            {
                throw std::invalid_argument("GARCH max_iterations must be positive");
            }
            if (max_order < 1)
            {
                throw std::invalid_argument("GARCH max_order must be at least 1");
            }
        }

        GarchConfig GarchConfig::from_json(const nlohmann::json &j)
        {
            GarchConfig config;
            config.min_observations = j.value("min_observations", config.min_observations);
            config.fallback_df = j.value("fallback_df", config.fallback_df);
            config.max_iterations = j.value("max_iterations", config.max_iterations);
            config.max_order = j.value("max_order", config.max_order);
            config.verbose = j.value("verbose", config.verbose);

            std::string policy = to_lower(j.value("order_policy", std::string("fixed")));
            if (policy == "fixed")
            {
                config.order_policy = OrderPolicy::FIXED;
            }
            else if (policy == "bic")
            {
                config.order_policy = OrderPolicy::BIC;
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown GARCH order_policy: '" + policy + "'. Valid options: fixed, bic");
            }

            return config;
        }

        // ============================================================================
        // GarchEstimate Implementation
        // ============================================================================

        double GarchEstimate::bic(int n) const
        {
            return -2.0 * log_likelihood + num_parameters() * std::log(static_cast<double>(n));
        }

        bool GarchEstimate::is_valid() const
        {
            if (!std::isfinite(mu) || !std::isfinite(omega) || !std::isfinite(nu) ||
                !std::isfinite(log_likelihood) || !std::isfinite(next_variance))
            {
                return false;
            }
            if (!alpha.allFinite() || !beta.allFinite())
            {
                return false;
            }
            return omega > 0.0 && nu > 2.0 && next_variance > 0.0 &&
                   (alpha.array() >= 0.0).all() && (beta.array() >= 0.0).all() &&
                   alpha.sum() + beta.sum() < 1.0;
        }

        // ============================================================================
        // GarchFitter Implementation
        // ============================================================================

        GarchFitter::GarchFitter(const GarchConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        double GarchFitter::rescale_factor(double std_dev)
        {
            if (std_dev < 1e-4)
            {
                return 1000.0;
            }
            if (std_dev < 1e-3)
            {
                return 100.0;
            }
            return 1.0;
        }

        double GarchFitter::negative_log_likelihood(const Eigen::VectorXd &returns,
                                                    double mu, double omega,
                                                    const Eigen::VectorXd &alpha,
                                                    const Eigen::VectorXd &beta,
                                                    double nu)
        {
            const double inf = std::numeric_limits<double>::infinity();

            if (!(omega > 0.0) || !(nu > 2.0) ||
                (alpha.array() < 0.0).any() || (beta.array() < 0.0).any() ||
                !(alpha.sum() + beta.sum() < 1.0))
            {
                return inf;
            }

            Eigen::VectorXd resid = returns.array() - mu;

            std::vector<double> sigma2;
            double next_variance = 0.0;
            if (!variance_path(resid, omega, alpha, beta, sigma2, next_variance))
            {
                return inf;
            }

            const double log_const = std::lgamma(0.5 * (nu + 1.0)) - std::lgamma(0.5 * nu) - 0.5 * std::log(kPi * (nu - 2.0));

            double ll = 0.0;
            for (int t = 0; t < resid.size(); ++t)
            {
                const double s2 = sigma2[t];
                ll += log_const - 0.5 * std::log(s2) - 0.5 * (nu + 1.0) * std::log1p(resid(t) * resid(t) / (s2 * (nu - 2.0)));
            }

            return std::isfinite(ll) ? -ll : inf;
        }

        GarchEstimate GarchFitter::fit_order(const Eigen::VectorXd &scaled, int p, int q) const
        {
            if (p < 1 || q < 1)
            {
                throw std::invalid_argument("GARCH orders must be at least 1");
            }

            const int n = scaled.size();
            if (n <= 3 + p + q)
            {
                throw std::invalid_argument(
                    "Series of length " + std::to_string(n) + " is too short for GARCH(" + std::to_string(p) + "," + std::to_string(q) + ")");
            }

            const double mean = stats::mean(scaled);
            const double var = std::pow(stats::sample_std(scaled), 2);

            Eigen::VectorXd alpha0 = Eigen::VectorXd::Constant(p, kStartAlpha / p);
            Eigen::VectorXd beta0 = Eigen::VectorXd::Constant(q, kStartBeta / q);
            double omega0 = var * (1.0 - kStartAlpha - kStartBeta);

            Eigen::VectorXd theta0 = encode(mean, omega0, alpha0, beta0, kStartNu);

            auto objective = [&scaled, p, q](const Eigen::VectorXd &theta)
            {
                DecodedParams d = decode(theta, p, q);
                return negative_log_likelihood(scaled, d.mu, d.omega, d.alpha, d.beta, d.nu);
            };

            optimizer::SolverOptions options;
            options.max_iterations = config_.max_iterations;
            options.tolerance = 1e-7;
            options.x_tolerance = 1e-6;
            options.verbose = false;

            optimizer::NelderMeadSolver solver(options);
            optimizer::SolverResult first = solver.minimize(objective, theta0);

            // Restart from the best vertex to escape a collapsed simplex
            optimizer::SolverResult result = solver.minimize(objective, first.solution);

            GarchEstimate est;
            est.p = p;
            est.q = q;

            DecodedParams d = decode(result.solution, p, q);
            est.mu = d.mu;
            est.omega = d.omega;
            est.alpha = d.alpha;
            est.beta = d.beta;
            est.nu = d.nu;
            est.log_likelihood = -result.objective_value;
            est.converged = result.success;
            est.iterations = first.iterations + result.iterations;
            est.message = result.message;

            Eigen::VectorXd resid = scaled.array() - d.mu;
            std::vector<double> sigma2;
            double next_variance = std::numeric_limits<double>::quiet_NaN();
            if (!variance_path(resid, d.omega, d.alpha, d.beta, sigma2, next_variance))
            {
                next_variance = std::numeric_limits<double>::quiet_NaN();
            }
            est.next_variance = next_variance;

            return est;
        }

        MarginalModel GarchFitter::fallback(const Eigen::VectorXd &returns, const std::string &reason) const
        {
            if (config_.verbose)
            {
                std::cerr << "GARCH fallback to sample moments: " << reason << std::endl;
            }

            MarginalModel model;
            model.nu = config_.fallback_df;
            model.mu = stats::mean(returns);
            model.sigma = stats::sample_std(returns);
            model.kind = MarginalKind::CONDITIONAL;
            model.diagnostics.converged = false;
            model.diagnostics.used_fallback = true;
            model.diagnostics.message = reason;
            return model;
        }

        MarginalModel GarchFitter::fit(const Eigen::VectorXd &returns) const
        {
            const int n = returns.size();

            if (n < 2)
            {
                throw std::invalid_argument(
                    "Need at least 2 observations for a conditional fit, got: " + std::to_string(n));
            }
            if (!returns.allFinite())
            {
                throw std::invalid_argument("Return series contains NaN or Inf values");
            }

            if (n < config_.min_observations)
            {
                return fallback(returns, "insufficient observations (" + std::to_string(n) + " < " + std::to_string(config_.min_observations) + ")");
            }

            const double std_dev = stats::sample_std(returns);
            if (!(std_dev > 0.0))
            {
                return fallback(returns, "zero variance series");
            }

            const double scale = rescale_factor(std_dev);
            Eigen::VectorXd scaled = returns * scale;

            GarchEstimate best;
            bool have_estimate = false;

            try
            {
                if (config_.order_policy == OrderPolicy::FIXED)
                {
                    best = fit_order(scaled, 1, 1);
                    have_estimate = true;
                }
                else
                {
                    double best_bic = std::numeric_limits<double>::infinity();
                    for (int p = 1; p <= config_.max_order; ++p)
                    {
                        for (int q = 1; q <= config_.max_order; ++q)
                        {
                            GarchEstimate est = fit_order(scaled, p, q);
                            if (!est.is_valid())
                            {
                                continue;
                            }

                            double bic = est.bic(n);
                            if (config_.verbose)
                            {
                                std::cout << "  GARCH(" << p << "," << q << ") BIC = " << bic << "\n";
                            }
                            if (bic < best_bic)
                            {
                                best_bic = bic;
                                best = est;
                                have_estimate = true;
                            }
                        }
                    }
                }
            }
            catch (const std::exception &e)
            {
                return fallback(returns, std::string("fit failed: ") + e.what());
            }

            if (!have_estimate || !best.is_valid())
            {
                return fallback(returns, "non-finite or inadmissible estimate");
            }

            if (!best.converged && config_.verbose)
            {
                std::cerr << "Warning: GARCH(" << best.p << "," << best.q << ") optimizer did not converge ("
                          << best.message << "), using best estimate" << std::endl;
            }

            MarginalModel model;
            model.nu = best.nu;
            model.mu = best.mu / scale;
            model.sigma = std::sqrt(best.next_variance) / scale;
            model.kind = MarginalKind::CONDITIONAL;

            model.diagnostics.converged = best.converged;
            model.diagnostics.used_fallback = false;
            model.diagnostics.iterations = best.iterations;
            model.diagnostics.log_likelihood = best.log_likelihood;
            model.diagnostics.omega = best.omega;
            model.diagnostics.alpha = best.alpha;
            model.diagnostics.beta = best.beta;
            model.diagnostics.scale = scale;
            model.diagnostics.p = best.p;
            model.diagnostics.q = best.q;
            model.diagnostics.message = best.message;

            return model;
        }

    } // namespace marginal
} // namespace tailrisk

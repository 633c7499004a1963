/**
 * @file garch_fitter.hpp
 * @brief Conditional marginal estimator: GARCH(p,q) with Student-t innovations
 *
 * Model (constant mean):
 *
 *     r_t       = mu + e_t,   e_t = sigma_t * z_t,   z_t ~ standardized t(nu)
 *     sigma_t^2 = omega + sum_i alpha_i * e_{t-i}^2 + sum_j beta_j * sigma_{t-j}^2
 *
 * Parameters are estimated by maximum likelihood with a Nelder-Mead search
 * over an unconstrained reparameterization:
 *
 *     omega   = exp(w)
 *     alpha_i = exp(a_i) / (1 + S),  beta_j = exp(b_j) / (1 + S),
 *               S = sum exp(a_i) + sum exp(b_j)
 *     nu      = 2.05 + 497.95 * logistic(v)
 *
 * so every trial point satisfies omega > 0, alpha, beta >= 0,
 * sum(alpha) + sum(beta) < 1 and nu > 2. Pre-sample squared residuals and
 * variances are backcast with an exponentially weighted mean (0.94) of the
 * first 75 squared residuals.
 *
 * Robustness rules:
 * - series with fewer than min_observations points are not fitted; the
 *   sample mean and standard deviation are returned with nu = fallback_df
 * - returns are rescaled by 1000 (std < 1e-4) or 100 (std < 1e-3) before
 *   fitting and all outputs are rescaled back
 * - optimizer non-convergence returns the best finite estimate flagged
 *   converged = false; a non-finite estimate or a numerical exception
 *   inside the fit is replaced by the fallback
 */

#ifndef TAILRISK_MARGINAL_GARCH_FITTER_HPP
#define TAILRISK_MARGINAL_GARCH_FITTER_HPP

#include "marginal/marginal_model.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>

namespace tailrisk
{
    namespace marginal
    {

        /**
         * @brief How the (p, q) order is chosen
         */
        enum class OrderPolicy
        {
            FIXED, ///< Always GARCH(1,1)
            BIC    ///< Grid over [1, max_order]^2, lowest BIC wins
        };

        /**
         * @struct GarchConfig
         * @brief Settings of the conditional estimator
         */
        struct GarchConfig
        {
            int min_observations = 50;   ///< Shorter series use the fallback
            double fallback_df = 30.0;   ///< nu reported by the fallback
            int max_iterations = 2000;   ///< Nelder-Mead iteration cap per start
            OrderPolicy order_policy = OrderPolicy::FIXED;
            int max_order = 2;           ///< Largest p and q in the BIC grid
            bool verbose = false;        ///< Report fallbacks and non-convergence

            /**
             * @throws std::invalid_argument on non-positive counts or fallback_df <= 2
             */
            void validate() const;

            /**
             * @throws std::invalid_argument if order_policy is not "fixed" or "bic"
             */
            static GarchConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct GarchEstimate
         * @brief Parameters of one GARCH(p,q)-t fit on the rescaled series
         */
        struct GarchEstimate
        {
            int p = 1;                ///< ARCH order
            int q = 1;                ///< GARCH order
            double mu = 0.0;          ///< Constant mean
            double omega = 0.0;       ///< Variance intercept
            Eigen::VectorXd alpha;    ///< ARCH coefficients (p)
            Eigen::VectorXd beta;     ///< GARCH coefficients (q)
            double nu = 0.0;          ///< Innovation degrees of freedom
            double log_likelihood = 0.0;
            double next_variance = 0.0; ///< One-step-ahead sigma^2
            bool converged = false;
            int iterations = 0;
            std::string message;

            /// Number of free parameters (mu, omega, nu, alphas, betas)
            int num_parameters() const { return 3 + p + q; }

            /// Bayesian information criterion for n observations
            double bic(int n) const;

            /// True when every field is finite and inside the admissible region
            bool is_valid() const;
        };

        /**
         * @class GarchFitter
         * @brief Fits the conditional marginal model of one return series
         *
         * Usage Example:
         * @code
         * GarchFitter fitter;
         * MarginalModel m = fitter.fit(returns);
         * if (!m.diagnostics.converged) { ... }
         * double var99 = m.value_at_risk(0.01);
         * @endcode
         */
        class GarchFitter
        {
        public:
            /**
             * @throws std::invalid_argument if the config is invalid
             */
            explicit GarchFitter(const GarchConfig &config = GarchConfig());

            /**
             * @brief Fit and forecast one step ahead
             * @param returns Return series
             * @return Conditional model (kind CONDITIONAL) in the original units
             * @throws std::invalid_argument if fewer than 2 observations or non-finite data
             */
            MarginalModel fit(const Eigen::VectorXd &returns) const;

            /**
             * @brief Maximum-likelihood fit of a fixed order on an already scaled series
             * @throws std::invalid_argument if p or q < 1 or the series is too short
             */
            GarchEstimate fit_order(const Eigen::VectorXd &scaled, int p, int q) const;

            /**
             * @brief Negative log-likelihood of GARCH(p,q)-t at explicit parameters
             *
             * Returns +infinity outside the admissible region.
             */
            static double negative_log_likelihood(const Eigen::VectorXd &returns,
                                                  double mu, double omega,
                                                  const Eigen::VectorXd &alpha,
                                                  const Eigen::VectorXd &beta,
                                                  double nu);

            /**
             * @brief Rescale factor applied before fitting (1, 100 or 1000)
             */
            static double rescale_factor(double std_dev);

            const GarchConfig &get_config() const { return config_; }

        private:
            GarchConfig config_;

            MarginalModel fallback(const Eigen::VectorXd &returns, const std::string &reason) const;
        };

    } // namespace marginal
} // namespace tailrisk

#endif // TAILRISK_MARGINAL_GARCH_FITTER_HPP

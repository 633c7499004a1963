/**
 * @file marginal_model.hpp
 * @brief Location-scale Student-t model of one return series
 *
 * A marginal model is the triple (nu, mu, sigma) with
 *
 *     VaR(a) = mu + sigma * t^{-1}(a; nu)
 *     ES(a)  = mu + sigma * ES_factor(a; nu)
 *
 * where a is the tail probability (0.05 for 95% VaR). Models are
 * recomputed on every request and never cached.
 */

#ifndef TAILRISK_MARGINAL_MARGINAL_MODEL_HPP
#define TAILRISK_MARGINAL_MARGINAL_MODEL_HPP

#include <Eigen/Dense>
#include <limits>
#include <string>

namespace tailrisk
{
    namespace marginal
    {

        /**
         * @brief Origin of the scale estimate
         */
        enum class MarginalKind
        {
            STATIC,     ///< Unconditional sample moments
            CONDITIONAL ///< One-step-ahead GARCH forecast
        };

        std::string to_string(MarginalKind kind);

        /**
         * @struct FitDiagnostics
         * @brief Record of how a conditional model was obtained
         *
         * Static fits leave the GARCH fields at their defaults.
         */
        struct FitDiagnostics
        {
            bool converged = true;      ///< Optimizer reached its tolerance
            bool used_fallback = false; ///< Sample moments substituted for the fit
            int iterations = 0;         ///< Optimizer iterations
            double log_likelihood = std::numeric_limits<double>::quiet_NaN();
            double omega = std::numeric_limits<double>::quiet_NaN(); ///< On the rescaled series
            Eigen::VectorXd alpha;      ///< ARCH coefficients
            Eigen::VectorXd beta;       ///< GARCH coefficients
            double scale = 1.0;         ///< Factor applied to returns before fitting
            int p = 0;                  ///< ARCH order
            int q = 0;                  ///< GARCH order
            std::string message;        ///< Optimizer status or fallback reason
        };

        /**
         * @struct MarginalModel
         * @brief Fitted (nu, mu, sigma) of one asset or portfolio
         */
        struct MarginalModel
        {
            double nu = std::numeric_limits<double>::quiet_NaN();    ///< Degrees of freedom
            double mu = std::numeric_limits<double>::quiet_NaN();    ///< Location (mean return)
            double sigma = std::numeric_limits<double>::quiet_NaN(); ///< Scale (standard deviation)
            MarginalKind kind = MarginalKind::STATIC;
            FitDiagnostics diagnostics;

            /**
             * @brief Signed VaR threshold at tail probability alpha
             * @param alpha Tail probability in (0, 1), e.g. 0.05
             * @throws std::invalid_argument if alpha or nu are out of range
             */
            double value_at_risk(double alpha) const;

            /**
             * @brief Signed expected shortfall at tail probability alpha
             * @throws tailrisk::NumericalError if nu <= 1
             */
            double expected_shortfall(double alpha) const;

            /**
             * @brief Check the model can drive a unit-variance simulation
             * @throws tailrisk::NumericalError if nu <= 2 (variance undefined)
             */
            void validate_for_simulation() const;
        };

    } // namespace marginal
} // namespace tailrisk

#endif // TAILRISK_MARGINAL_MARGINAL_MODEL_HPP

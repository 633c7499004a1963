/**
 * @file ewma_covariance.hpp
 * @brief Exponentially Weighted Moving Average covariance estimator
 *
 * The EWMA covariance is computed recursively as:
 *
 *     S_t = λ * S_{t-1} + (1-λ) * r_t * r_t^T
 *
 * where:
 * - λ is the decay factor (0 < λ < 1)
 * - r_t is the raw return vector at time t (not demeaned)
 * - S is seeded with the Bessel-corrected sample covariance of the first
 *   min(seed_window, T) observations, and the recursion runs over the
 *   remaining dates
 *
 * Effective Window:
 *     N_eff = 1 / (1 - λ)
 *
 * - λ = 0.94 → N_eff ≈ 17 days (RiskMetrics standard)
 * - λ = 0.97 → N_eff ≈ 33 days
 * - λ = 0.99 → N_eff ≈ 100 days
 *
 * As λ → 1 the estimate converges to the seed covariance.
 *
 * References:
 * - J.P. Morgan (1996), "RiskMetrics Technical Document"
 */

#pragma once

#include "risk/risk_model.hpp"

namespace tailrisk
{
    namespace risk
    {

        /**
         * @class EWMACovariance
         * @brief Exponentially weighted moving average covariance estimator
         *
         * Default dependence estimator of the Monte Carlo engine.
         *
         * Usage Example:
         * @code
         * EWMACovariance ewma(0.94);
         * DependenceMatrix dep = ewma.estimate_dependence(returns);
         * std::cout << "Effective window: "
         *           << ewma.get_effective_window() << " days\n";
         * @endcode
         */
        class EWMACovariance : public RiskModel
        {
        public:
            /**
             * @brief Construct EWMA covariance estimator
             * @param lambda Decay factor (0 < λ < 1)
             * @param seed_window Observations used for the seed covariance (>= 2)
             * @throws std::invalid_argument if lambda not in (0, 1) or seed_window < 2
             */
            explicit EWMACovariance(double lambda = 0.94, int seed_window = 30);

            ~EWMACovariance() override = default;

            /**
             * @brief Estimate EWMA covariance matrix
             * @param returns Matrix of returns (T x N: observations x assets)
             * @return EWMA covariance matrix (N x N)
             * @throws std::invalid_argument if returns is empty, has < 2 rows or
             *         contains non-finite values
             *
             * Algorithm:
             * 1. Seed S with the sample covariance (ddof = 1) of rows [0, k),
             *    k = min(seed_window, T)
             * 2. For t = k .. T-1: S = λ*S + (1-λ)*r_t*r_t^T
             * 3. Ensure symmetry
             */
            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            /**
             * @brief Get model name
             * @return "EWMACovariance"
             */
            std::string get_name() const override;

            double get_lambda() const { return lambda_; }

            int get_seed_window() const { return seed_window_; }

            /**
             * @brief Get effective window size, N_eff = 1 / (1 - λ)
             */
            double get_effective_window() const { return 1.0 / (1.0 - lambda_); }

            /**
             * @brief Get weight for observation i periods ago
             * @param i Number of periods in the past (0 = current)
             * @return w_i = (1-λ) * λ^i
             * @throws std::invalid_argument if i < 0
             */
            double get_weight(int i) const;

        private:
            double lambda_;   ///< Decay factor (0 < λ < 1)
            int seed_window_; ///< Length of the seeding sample

            static void validate_lambda(double lambda);
        };

    } // namespace risk
} // namespace tailrisk

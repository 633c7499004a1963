/**
 * @file sample_covariance.hpp
 * @brief Classical sample covariance estimator
 *
 * Formula (with bias correction):
 *     Cov = (1/(n-1)) * (X - mean(X))^T * (X - mean(X))
 *
 * Used for the static-t portfolio volatility, the GARCH-t portfolio
 * correlation and to seed the EWMA recursion.
 */

#pragma once

#include "risk/risk_model.hpp"

namespace tailrisk
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance matrix estimator
         *
         * Supports Bessel's correction (dividing by n-1 instead of n).
         *
         * Usage Example:
         * @code
         * SampleCovariance estimator(true);
         * Eigen::MatrixXd cov = estimator.estimate_covariance(returns);
         * double sigma_p = std::sqrt(w.dot(cov * w));
         * @endcode
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @brief Construct sample covariance estimator
             * @param bias_correction Apply Bessel's correction (divide by n-1 vs n)
             */
            explicit SampleCovariance(bool bias_correction = true);

            ~SampleCovariance() override = default;

            /**
             * @brief Estimate covariance matrix
             * @param returns Matrix of returns (T x N: observations x assets)
             * @return Covariance matrix (N x N)
             * @throws std::invalid_argument if returns is empty or has < 2 observations
             */
            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            /**
             * @brief Get model name
             * @return "SampleCovariance"
             */
            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_; ///< Whether to apply Bessel's correction
        };

    } // namespace risk
} // namespace tailrisk

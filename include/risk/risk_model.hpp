/**
 * @file risk_model.hpp
 * @brief Abstract interface for covariance and dependence estimation
 *
 * Provides a common interface for the covariance estimators consumed by the
 * portfolio aggregators and the Monte Carlo engine. Any implementation of
 * RiskModel can be plugged into the copula simulation, which makes this the
 * place to add regularized or shrinkage estimators when an EWMA correlation
 * turns out not to be positive definite.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include "risk/dependence_matrix.hpp"

#include <Eigen/Dense>
#include <memory>
#include <string>

namespace tailrisk
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Abstract base class for covariance estimation
         *
         * Usage Example:
         * @code
         * auto risk_model = std::make_unique<EWMACovariance>(0.94);
         * DependenceMatrix dep = risk_model->estimate_dependence(returns);
         * Eigen::MatrixXd L = dep.cholesky_factor();
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Estimate covariance matrix from return data
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Covariance matrix (n_assets x n_assets)
             * @throws std::invalid_argument if returns matrix is empty or has < 2 rows
             *
             * @note The returned matrix is guaranteed to be symmetric
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Estimate correlation matrix from return data
             *
             * Default implementation: convert the covariance to a correlation.
             */
            virtual Eigen::MatrixXd estimate_correlation(
                const Eigen::MatrixXd &returns) const;

            /**
             * @brief Estimate covariance, correlation and volatilities together
             */
            DependenceMatrix estimate_dependence(const Eigen::MatrixXd &returns) const;

            /**
             * @brief Get the name of the risk model
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Convert covariance matrix to correlation matrix
             *
             * corr(i,j) = cov(i,j) / (std(i) * std(j)). Standard deviations
             * below 1e-12 (zero-variance assets) are floored at 1e-12 so the
             * conversion never divides by zero. The diagonal is set to exactly
             * one and off-diagonal entries are clamped to [-1, 1].
             *
             * @throws std::invalid_argument if the matrix is not square or is empty
             */
            static Eigen::MatrixXd covariance_to_correlation(
                const Eigen::MatrixXd &covariance);

        protected:
            /**
             * @brief Validate input returns matrix
             * @throws std::invalid_argument if validation fails
             */
            static void validate_returns(const Eigen::MatrixXd &returns);

            /**
             * @brief Enforce exact symmetry: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace tailrisk

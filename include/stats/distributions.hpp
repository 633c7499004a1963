/**
 * @file distributions.hpp
 * @brief Student-t and chi-squared distribution helpers
 *
 * Thin wrappers over Boost.Math used by the marginal estimators, the copula
 * engine and the likelihood-ratio tests. All functions accept real-valued
 * degrees of freedom so that blended portfolio tail parameters can be used
 * directly.
 *
 * Expected shortfall factor of the standard Student-t at tail probability a:
 *
 *     q  = t^{-1}(a; v)
 *     ES = -((v + q^2) / (v - 1)) * pdf_t(q; v) / a
 *
 * The factor is finite only for v > 1.
 */

#pragma once

namespace tailrisk
{
    namespace stats
    {

        /**
         * @brief Inverse CDF of the standard Student-t distribution
         * @param p Probability in (0, 1)
         * @param nu Degrees of freedom (> 0)
         * @throws std::invalid_argument if p or nu are out of range
         */
        double student_t_quantile(double p, double nu);

        /**
         * @brief CDF of the standard Student-t distribution
         * @throws std::invalid_argument if nu <= 0
         */
        double student_t_cdf(double x, double nu);

        /**
         * @brief Density of the standard Student-t distribution
         * @throws std::invalid_argument if nu <= 0
         */
        double student_t_pdf(double x, double nu);

        /**
         * @brief Expected shortfall factor of the standard Student-t
         * @param alpha Tail probability in (0, 1), e.g. 0.05 for 95% ES
         * @param nu Degrees of freedom
         * @return ES factor (negative, at least as extreme as the quantile)
         * @throws tailrisk::NumericalError if nu <= 1 (ES undefined)
         * @throws std::invalid_argument if alpha is not in (0, 1)
         */
        double es_factor_t(double alpha, double nu);

        /**
         * @brief Upper tail probability of the chi-squared distribution
         *
         * Returns 1 - CDF(x; df), the p-value of a likelihood-ratio statistic.
         * A NaN statistic yields NaN.
         */
        double chi_squared_sf(double x, double df);

        /// Inverse CDF of the standard normal distribution
        double normal_quantile(double p);

    } // namespace stats
} // namespace tailrisk

/**
 * @file sample_statistics.hpp
 * @brief Descriptive statistics and goodness-of-fit helpers on return series
 *
 * Quantiles use linear interpolation between order statistics
 * (index = p * (n - 1)), the same convention as the historical VaR in the
 * analytics layer, so rolling, historical and simulated VaR all agree on a
 * given sample.
 */

#pragma once

#include <Eigen/Dense>

namespace tailrisk
{
    namespace stats
    {

        /**
         * @brief Arithmetic mean
         * @throws std::invalid_argument if the series is empty
         */
        double mean(const Eigen::VectorXd &x);

        /**
         * @brief Sample standard deviation with Bessel's correction (n - 1)
         * @throws std::invalid_argument if fewer than 2 observations
         */
        double sample_std(const Eigen::VectorXd &x);

        /**
         * @brief Mean-centre and scale to unit sample variance
         * @throws std::invalid_argument if fewer than 2 observations or zero variance
         */
        Eigen::VectorXd standardize(const Eigen::VectorXd &x);

        /**
         * @brief Empirical p-quantile with linear interpolation
         * @param x Sample (need not be sorted)
         * @param p Probability in [0, 1]
         * @throws std::invalid_argument if x is empty or p outside [0, 1]
         */
        double quantile(const Eigen::VectorXd &x, double p);

        /**
         * @brief Mean of all values at or below a threshold
         * @return NaN when no value lies at or below the threshold
         */
        double tail_mean(const Eigen::VectorXd &x, double threshold);

        /**
         * @brief Two-sample Kolmogorov-Smirnov statistic
         *
         * D = sup_x |F_a(x) - F_b(x)| over the pooled sample, with ties
         * handled by advancing both empirical CDFs past equal values.
         *
         * @throws std::invalid_argument if either sample is empty
         */
        double ks_statistic(const Eigen::VectorXd &a, const Eigen::VectorXd &b);

    } // namespace stats
} // namespace tailrisk

/**
 * @file sample_statistics.cpp
 * @brief Implementation of descriptive statistics helpers
 */

#include "stats/sample_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace tailrisk
{
    namespace stats
    {

        double mean(const Eigen::VectorXd &x)
        {
            if (x.size() == 0)
            {
                throw std::invalid_argument("Cannot compute the mean of an empty series");
            }
            return x.mean();
        }

        double sample_std(const Eigen::VectorXd &x)
        {
            const int n = x.size();
            if (n < 2)
            {
                throw std::invalid_argument(
                    "Need at least 2 observations for a sample standard deviation, got: " + std::to_string(n));
            }
            // Constant input gives exactly zero
            if ((x.array() == x(0)).all())
            {
                return 0.0;
            }
            const double m = x.mean();
            const double ss = (x.array() - m).square().sum();
            return std::sqrt(ss / static_cast<double>(n - 1));
        }

        Eigen::VectorXd standardize(const Eigen::VectorXd &x)
        {
            const double s = sample_std(x);
            if (!(s > 0.0))
            {
                throw std::invalid_argument("Cannot standardize a series with zero variance");
            }
            return (x.array() - x.mean()) / s;
        }

        double quantile(const Eigen::VectorXd &x, double p)
        {
            const int n = x.size();
            if (n == 0)
            {
                throw std::invalid_argument("Cannot compute a quantile of an empty series");
            }
            if (p < 0.0 || p > 1.0)
            {
                throw std::invalid_argument(
                    "Quantile probability must be in [0, 1], got: " + std::to_string(p));
            }

            std::vector<double> sorted(x.data(), x.data() + n);
            std::sort(sorted.begin(), sorted.end());

            double index = p * static_cast<double>(n - 1);
            int lower = static_cast<int>(std::floor(index));
            int upper = static_cast<int>(std::ceil(index));

            if (lower == upper || upper >= n)
            {
                return sorted[lower];
            }

            double frac = index - static_cast<double>(lower);
            return sorted[lower] * (1.0 - frac) + sorted[upper] * frac;
        }

        double tail_mean(const Eigen::VectorXd &x, double threshold)
        {
            double sum = 0.0;
            int count = 0;
            for (int i = 0; i < x.size(); ++i)
            {
                if (x(i) <= threshold)
                {
                    sum += x(i);
                    ++count;
                }
            }
            if (count == 0)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return sum / static_cast<double>(count);
        }

        double ks_statistic(const Eigen::VectorXd &a, const Eigen::VectorXd &b)
        {
            const int n = a.size();
            const int m = b.size();
            if (n == 0 || m == 0)
            {
                throw std::invalid_argument("KS statistic requires two non-empty samples");
            }

            std::vector<double> sa(a.data(), a.data() + n);
            std::vector<double> sb(b.data(), b.data() + m);
            std::sort(sa.begin(), sa.end());
            std::sort(sb.begin(), sb.end());

            int i = 0;
            int j = 0;
            double d = 0.0;

            while (i < n && j < m)
            {
                const double x = std::min(sa[i], sb[j]);
                while (i < n && sa[i] <= x)
                {
                    ++i;
                }
                while (j < m && sb[j] <= x)
                {
                    ++j;
                }
                const double diff = std::abs(static_cast<double>(i) / n - static_cast<double>(j) / m);
                d = std::max(d, diff);
            }

            return d;
        }

    } // namespace stats
} // namespace tailrisk

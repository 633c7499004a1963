/**
 * @file coverage_tests.cpp
 * @brief Implementation of the VaR exception tests.
 */

#include "backtest/coverage_tests.hpp"
#include "stats/distributions.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tailrisk
{
    namespace backtest
    {

        namespace
        {
            constexpr double kEps = 1e-10;
            constexpr int kMinBaselObservations = 80;

            double clip(double p)
            {
                return std::min(std::max(p, kEps), 1.0 - kEps);
            }
        } // anonymous namespace

        // ============================================================================
        // Kupiec POF
        // ============================================================================

        KupiecResult kupiec_pof(const std::vector<bool> &exceptions, double confidence)
        {
            if (!(confidence > 0.0 && confidence < 1.0))
            {
                throw std::invalid_argument(
                    "Confidence level must be in the range (0, 1), got: " + std::to_string(confidence));
            }

            KupiecResult result;
            const int n = static_cast<int>(exceptions.size());
            const int x = static_cast<int>(std::count(exceptions.begin(), exceptions.end(), true));

            result.observations = n;
            result.exceptions = x;

            if (n == 0)
            {
                return result;
            }

            result.pi_hat = static_cast<double>(x) / n;

            const double p0 = 1.0 - confidence;
            const double pi = clip(result.pi_hat);

            const double log_l0 = x * std::log(p0) + (n - x) * std::log(1.0 - p0);
            const double log_l1 = x * std::log(pi) + (n - x) * std::log(1.0 - pi);

            result.lr = -2.0 * (log_l0 - log_l1);
            result.p_value = stats::chi_squared_sf(result.lr, 1.0);
            return result;
        }

        // ============================================================================
        // Christoffersen independence
        // ============================================================================

        IndependenceResult christoffersen_independence(const std::vector<bool> &exceptions)
        {
            IndependenceResult result;

            if (exceptions.size() < 2)
            {
                return result;
            }

            for (size_t t = 1; t < exceptions.size(); ++t)
            {
                const bool prev = exceptions[t - 1];
                const bool curr = exceptions[t];

                if (!prev && !curr)
                    ++result.n00;
                else if (!prev && curr)
                    ++result.n01;
                else if (prev && !curr)
                    ++result.n10;
                else
                    ++result.n11;
            }

            const int n0 = result.n00 + result.n01;
            const int n1 = result.n10 + result.n11;

            if (n0 == 0 || n1 == 0)
            {
                return result;
            }

            result.pi01 = static_cast<double>(result.n01) / n0;
            result.pi11 = static_cast<double>(result.n11) / n1;
            const double pi = static_cast<double>(result.n01 + result.n11) / (n0 + n1);

            const double pi01 = clip(result.pi01);
            const double pi11 = clip(result.pi11);
            const double pi_c = clip(pi);

            const double log_restricted = n0 * std::log(1.0 - pi_c) + n1 * std::log(pi_c);
            const double log_unrestricted = result.n00 * std::log(1.0 - pi01) + result.n01 * std::log(pi01) + result.n10 * std::log(1.0 - pi11) + result.n11 * std::log(pi11);

            result.lr = -2.0 * (log_restricted - log_unrestricted);
            result.p_value = stats::chi_squared_sf(result.lr, 1.0);
            return result;
        }

        ConditionalCoverageResult conditional_coverage(const KupiecResult &pof,
                                                       const IndependenceResult &independence)
        {
            ConditionalCoverageResult result;

            if (std::isnan(pof.lr) || std::isnan(independence.lr))
            {
                return result;
            }

            result.lr = pof.lr + independence.lr;
            result.p_value = stats::chi_squared_sf(result.lr, 2.0);
            return result;
        }

        // ============================================================================
        // Basel traffic light
        // ============================================================================

        BaselThresholds basel_thresholds_99(int observations)
        {
            BaselThresholds thresholds;

            if (observations < kMinBaselObservations)
            {
                return thresholds;
            }

            // Exception counts are integers, so the scaled bound is floored
            int green = static_cast<int>(std::floor(4.0 * observations / 250.0 + 1e-9));
            int yellow = static_cast<int>(std::floor(9.0 * observations / 250.0 + 1e-9));

            green = std::max(green, 0);
            yellow = std::max(yellow, green);

            thresholds.green_max = green;
            thresholds.yellow_max = yellow;
            return thresholds;
        }

        TrafficLight basel_traffic_light_99(int observations, int exceptions)
        {
            BaselThresholds thresholds = basel_thresholds_99(observations);

            if (!thresholds.green_max || !thresholds.yellow_max)
            {
                return TrafficLight::UNDEFINED;
            }

            if (exceptions <= *thresholds.green_max)
            {
                return TrafficLight::GREEN;
            }
            if (exceptions <= *thresholds.yellow_max)
            {
                return TrafficLight::YELLOW;
            }
            return TrafficLight::RED;
        }

    } // namespace backtest
} // namespace tailrisk

/**
 * @file backtest_result.cpp
 * @brief Serialization of backtest results.
 */

#include "backtest/backtest_result.hpp"

#include <cmath>

namespace tailrisk
{
    namespace backtest
    {

        namespace
        {
            nlohmann::json nullable(double x)
            {
                if (std::isnan(x))
                {
                    return nullptr;
                }
                return x;
            }

            nlohmann::json nullable(const std::optional<int> &x)
            {
                if (!x)
                {
                    return nullptr;
                }
                return *x;
            }
        } // anonymous namespace

        std::string to_string(TrafficLight zone)
        {
            switch (zone)
            {
            case TrafficLight::GREEN:
                return "GREEN";
            case TrafficLight::YELLOW:
                return "YELLOW";
            case TrafficLight::RED:
                return "RED";
            case TrafficLight::UNDEFINED:
                return "UNDEFINED";
            case TrafficLight::NOT_APPLICABLE:
                return "N/A";
            }
            return "UNDEFINED";
        }

        nlohmann::json BacktestResult::to_json() const
        {
            nlohmann::json j;
            j["confidence"] = confidence;
            j["window"] = window;
            j["observations"] = observations;
            j["exceptions"] = exceptions;
            j["exception_rate"] = exception_rate;
            j["expected_exceptions"] = expected_exceptions;

            j["kupiec"] = {
                {"pi_hat", nullable(kupiec.pi_hat)},
                {"lr", nullable(kupiec.lr)},
                {"p_value", nullable(kupiec.p_value)}};

            j["christoffersen"] = {
                {"n00", independence.n00},
                {"n01", independence.n01},
                {"n10", independence.n10},
                {"n11", independence.n11},
                {"pi01", nullable(independence.pi01)},
                {"pi11", nullable(independence.pi11)},
                {"lr", nullable(independence.lr)},
                {"p_value", nullable(independence.p_value)}};

            j["conditional_coverage"] = {
                {"lr", nullable(conditional_coverage.lr)},
                {"p_value", nullable(conditional_coverage.p_value)}};

            j["zone"] = to_string(zone);
            j["green_max"] = nullable(thresholds.green_max);
            j["yellow_max"] = nullable(thresholds.yellow_max);

            return j;
        }

    } // namespace backtest
} // namespace tailrisk

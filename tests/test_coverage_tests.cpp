/**
 * @file test_coverage_tests.cpp
 * @brief Unit tests for Kupiec, Christoffersen and Basel traffic light tests
 */

#include <catch2/catch.hpp>
#include "backtest/coverage_tests.hpp"
#include <cmath>
#include <vector>

using namespace tailrisk::backtest;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace
{
    std::vector<bool> mask_with(int n, const std::vector<int> &positions)
    {
        std::vector<bool> mask(n, false);
        for (int p : positions)
        {
            mask[p] = true;
        }
        return mask;
    }
}

TEST_CASE("Kupiec proportion of failures", "[Backtest][Kupiec]")
{
    SECTION("Nominal exception rate gives zero statistic")
    {
        KupiecResult r = kupiec_pof(mask_with(100, {50}), 0.99);
        REQUIRE(r.observations == 100);
        REQUIRE(r.exceptions == 1);
        REQUIRE_THAT(r.pi_hat, WithinAbs(0.01, 1e-15));
        REQUIRE_THAT(r.lr, WithinAbs(0.0, 1e-10));
        REQUIRE_THAT(r.p_value, WithinAbs(1.0, 1e-9));
    }

    SECTION("Too many exceptions are rejected")
    {
        KupiecResult r = kupiec_pof(mask_with(250, {1, 20, 40, 60, 80, 100, 120, 140, 160, 180}), 0.99);
        REQUIRE(r.exceptions == 10);
        REQUIRE_THAT(r.lr, WithinAbs(12.955491062356018, 1e-9));
        REQUIRE_THAT(r.p_value, WithinRel(0.0003189845082133835, 1e-6));
    }

    SECTION("No exceptions stay finite")
    {
        KupiecResult r = kupiec_pof(std::vector<bool>(250, false), 0.99);
        REQUIRE(r.exceptions == 0);
        REQUIRE_THAT(r.lr, WithinAbs(-500.0 * std::log(0.99), 1e-6));
        REQUIRE(std::isfinite(r.p_value));
    }

    SECTION("Empty input and invalid confidence")
    {
        KupiecResult r = kupiec_pof({}, 0.99);
        REQUIRE(r.observations == 0);
        REQUIRE(std::isnan(r.lr));
        REQUIRE(std::isnan(r.p_value));

        REQUIRE_THROWS_AS(kupiec_pof(mask_with(10, {}), 1.0), std::invalid_argument);
    }
}

TEST_CASE("Christoffersen independence", "[Backtest][Christoffersen]")
{
    SECTION("Clustered exceptions")
    {
        std::vector<bool> mask(20, false);
        for (bool b : {true, true, false, false, false, true, true, false, false, false})
        {
            mask.push_back(b);
        }

        IndependenceResult r = christoffersen_independence(mask);
        REQUIRE(r.n00 == 23);
        REQUIRE(r.n01 == 2);
        REQUIRE(r.n10 == 2);
        REQUIRE(r.n11 == 2);
        REQUIRE_THAT(r.pi01, WithinAbs(0.08, 1e-15));
        REQUIRE_THAT(r.pi11, WithinAbs(0.5, 1e-15));
        REQUIRE_THAT(r.lr, WithinAbs(3.785365973937399, 1e-9));
        REQUIRE_THAT(r.p_value, WithinRel(0.051702602689734284, 1e-6));
    }

    SECTION("Transition counts cover every consecutive pair")
    {
        std::vector<bool> mask = mask_with(50, {3, 17, 30});
        IndependenceResult r = christoffersen_independence(mask);
        REQUIRE(r.n00 + r.n01 + r.n10 + r.n11 == 49);
        REQUIRE(r.n11 == 0);
        REQUIRE(std::isfinite(r.lr));
    }

    SECTION("Undefined without exceptions")
    {
        IndependenceResult r = christoffersen_independence(std::vector<bool>(100, false));
        REQUIRE(r.n00 == 99);
        REQUIRE(std::isnan(r.lr));
        REQUIRE(std::isnan(r.p_value));

        REQUIRE(std::isnan(christoffersen_independence({true}).lr));
    }
}

TEST_CASE("Conditional coverage", "[Backtest][ConditionalCoverage]")
{
    SECTION("Sum of both statistics with two degrees of freedom")
    {
        KupiecResult pof;
        pof.lr = 12.955491062356018;
        IndependenceResult ind;
        ind.lr = 3.785365973937399;

        ConditionalCoverageResult r = conditional_coverage(pof, ind);
        REQUIRE_THAT(r.lr, WithinAbs(16.740857036293417, 1e-9));
        REQUIRE_THAT(r.p_value, WithinRel(0.00023161628069010855, 1e-6));
    }

    SECTION("Undefined component propagates")
    {
        KupiecResult pof = kupiec_pof(std::vector<bool>(100, false), 0.99);
        IndependenceResult ind = christoffersen_independence(std::vector<bool>(100, false));

        ConditionalCoverageResult r = conditional_coverage(pof, ind);
        REQUIRE(std::isnan(r.lr));
        REQUIRE(std::isnan(r.p_value));
    }
}

TEST_CASE("Basel traffic light", "[Backtest][Basel]")
{
    SECTION("Standard 250-day thresholds")
    {
        BaselThresholds t = basel_thresholds_99(250);
        REQUIRE(t.green_max.has_value());
        REQUIRE(*t.green_max == 4);
        REQUIRE(*t.yellow_max == 9);
    }

    SECTION("Scaled thresholds never exceed the proportional bound")
    {
        BaselThresholds t = basel_thresholds_99(125);
        REQUIRE(*t.green_max == 2);
        REQUIRE(*t.yellow_max == 4);

        BaselThresholds t500 = basel_thresholds_99(500);
        REQUIRE(*t500.green_max == 8);
        REQUIRE(*t500.yellow_max == 18);

        BaselThresholds t100 = basel_thresholds_99(100);
        REQUIRE(*t100.green_max == 1);
        REQUIRE(*t100.yellow_max == 3);

        BaselThresholds t300 = basel_thresholds_99(300);
        REQUIRE(*t300.green_max == 4);
        REQUIRE(*t300.yellow_max == 10);
    }

    SECTION("Borderline counts fall in the stricter zone")
    {
        // 2 > 4/250 * 100 = 1.6
        REQUIRE(basel_traffic_light_99(100, 1) == TrafficLight::GREEN);
        REQUIRE(basel_traffic_light_99(100, 2) == TrafficLight::YELLOW);
        REQUIRE(basel_traffic_light_99(100, 4) == TrafficLight::RED);

        // 5 > 4.8 and 11 > 10.8
        REQUIRE(basel_traffic_light_99(300, 5) == TrafficLight::YELLOW);
        REQUIRE(basel_traffic_light_99(300, 10) == TrafficLight::YELLOW);
        REQUIRE(basel_traffic_light_99(300, 11) == TrafficLight::RED);
    }

    SECTION("Short samples are undefined")
    {
        BaselThresholds t = basel_thresholds_99(79);
        REQUIRE_FALSE(t.green_max.has_value());
        REQUIRE_FALSE(t.yellow_max.has_value());
        REQUIRE(basel_traffic_light_99(79, 0) == TrafficLight::UNDEFINED);
        REQUIRE(basel_thresholds_99(80).green_max.has_value());
    }

    SECTION("Zones")
    {
        REQUIRE(basel_traffic_light_99(250, 0) == TrafficLight::GREEN);
        REQUIRE(basel_traffic_light_99(250, 4) == TrafficLight::GREEN);
        REQUIRE(basel_traffic_light_99(250, 5) == TrafficLight::YELLOW);
        REQUIRE(basel_traffic_light_99(250, 9) == TrafficLight::YELLOW);
        REQUIRE(basel_traffic_light_99(250, 10) == TrafficLight::RED);
    }

    SECTION("Labels")
    {
        REQUIRE(to_string(TrafficLight::GREEN) == "GREEN");
        REQUIRE(to_string(TrafficLight::RED) == "RED");
        REQUIRE(to_string(TrafficLight::NOT_APPLICABLE) == "N/A");
    }
}

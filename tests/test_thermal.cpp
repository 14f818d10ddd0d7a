#include <doctest/doctest.h>

#include "suf/Math.hpp"
#include "suf/Thermal.hpp"

#include <cmath>

using namespace suf;

TEST_CASE("coolingEqK follows Newtonian cooling")
{
    CHECK(roundTo(coolingEqK(0.01, 25.0, 10.0, 60.0), 2) == doctest::Approx(18.23));
    CHECK(coolingEqK(0.01, 10.0, 25.0, 60.0) == doctest::Approx(25.0 - 15.0 * std::exp(-0.6)));
}

TEST_CASE("coolingEqK leaves a body at ambient temperature unchanged")
{
    CHECK(coolingEqK(0.05, 21.5, 21.5, 60.0) == doctest::Approx(21.5));
    CHECK(coolingEqK(0.05, 30.0, 10.0, 0.0) == doctest::Approx(30.0));
}

TEST_CASE("coolingEqK converges on ambient for large k")
{
    CHECK(coolingEqK(10.0, 40.0, 12.0, 60.0) == doctest::Approx(12.0));
}

TEST_CASE("selectThermoregulationMicrohabitat moves toward t_opt")
{
    SUBCASE("too hot, burrow cooler")
    {
        CHECK(selectThermoregulationMicrohabitat(32.0, 26.0, 22.0, 35.0) == Microhabitat::Burrow);
    }
    SUBCASE("too hot, open cooler")
    {
        CHECK(selectThermoregulationMicrohabitat(32.0, 26.0, 22.0, 15.0) == Microhabitat::Open);
    }
    SUBCASE("too cold, burrow warmer")
    {
        CHECK(selectThermoregulationMicrohabitat(15.0, 26.0, 22.0, 12.0) == Microhabitat::Burrow);
    }
    SUBCASE("too cold, open warmer")
    {
        CHECK(selectThermoregulationMicrohabitat(15.0, 26.0, 22.0, 30.0) == Microhabitat::Open);
    }
    SUBCASE("ties default to open")
    {
        CHECK(selectThermoregulationMicrohabitat(26.0, 26.0, 22.0, 30.0) == Microhabitat::Open);
        CHECK(selectThermoregulationMicrohabitat(30.0, 26.0, 22.0, 22.0) == Microhabitat::Open);
    }
}

TEST_CASE("the cooler microhabitat wins for a hot body even when the other sits nearer t_opt")
{
    CHECK(selectThermoregulationMicrohabitat(30.0, 29.0, 10.0, 30.0) == Microhabitat::Burrow);
    CHECK(selectThermoregulationMicrohabitat(20.0, 21.0, 40.0, 20.5) == Microhabitat::Burrow);
}

TEST_CASE("ambientTemperature resolves each microhabitat")
{
    CHECK(ambientTemperature(Microhabitat::Burrow, 20.0, 31.0, 6.0) == 20.0);
    CHECK(ambientTemperature(Microhabitat::Open, 20.0, 31.0, 6.0) == 31.0);
    CHECK(ambientTemperature(Microhabitat::WinterBurrow, 20.0, 31.0, 6.0) == 6.0);
}

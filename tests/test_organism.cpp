#include <doctest/doctest.h>

#include "TestHelpers.hpp"
#include "suf/Random.hpp"
#include "suf/Thermal.hpp"

#include <stdexcept>

using namespace suf;
using namespace suf::test;

TEST_CASE("body temperature below the critical minimum kills after max_steps ticks")
{
    Organism snake = makeOrganism();
    snake.setBodyTemperature(3.0);

    snake.checkCtOutOfBounds();
    CHECK(snake.alive());
    CHECK(snake.ctOutOfBoundsCounter() == 1);

    snake.checkCtOutOfBounds();
    CHECK_FALSE(snake.alive());
    REQUIRE(snake.causeOfDeath().has_value());
    CHECK(*snake.causeOfDeath() == CauseOfDeath::Cold);
}

TEST_CASE("body temperature above the critical maximum kills with heat")
{
    Organism snake = makeOrganism();
    snake.setBodyTemperature(42.0);
    snake.checkCtOutOfBounds();
    snake.checkCtOutOfBounds();
    CHECK_FALSE(snake.alive());
    CHECK(snake.causeOfDeath() == CauseOfDeath::Heat);
}

TEST_CASE("critical bounds are inclusive and reset the counter")
{
    Organism snake = makeOrganism();

    snake.setCtOutOfBoundsCounter(1);
    snake.setBodyTemperature(5.0);
    snake.checkCtOutOfBounds();
    CHECK(snake.ctOutOfBoundsCounter() == 0);
    CHECK(snake.alive());

    snake.setCtOutOfBoundsCounter(1);
    snake.setBodyTemperature(40.0);
    snake.checkCtOutOfBounds();
    CHECK(snake.ctOutOfBoundsCounter() == 0);
    CHECK(snake.alive());
}

TEST_CASE("starvation floors the reserve and kills")
{
    SUBCASE("negative reserve")
    {
        Organism snake = makeOrganism(defaultTraits(), -3.5);
        CHECK(snake.checkStarvation());
        CHECK_FALSE(snake.alive());
        CHECK(snake.causeOfDeath() == CauseOfDeath::Starved);
        CHECK(snake.metabolism().metabolicState() == 0.0);
    }
    SUBCASE("exactly empty")
    {
        Organism snake = makeOrganism(defaultTraits(), 0.0);
        CHECK(snake.checkStarvation());
        CHECK(snake.causeOfDeath() == CauseOfDeath::Starved);
    }
    SUBCASE("any reserve left")
    {
        Organism snake = makeOrganism(defaultTraits(), 0.5);
        CHECK_FALSE(snake.checkStarvation());
        CHECK(snake.alive());
        CHECK_FALSE(snake.causeOfDeath().has_value());
    }
}

TEST_CASE("a dead organism cannot die again")
{
    Organism snake = makeOrganism();
    snake.kill(CauseOfDeath::Heat);
    CHECK_THROWS_AS(snake.kill(CauseOfDeath::Cold), std::logic_error);

    snake.metabolism().setMetabolicState(-10.0);
    snake.setBodyTemperature(-20.0);
    CHECK_NOTHROW(snake.checkMortality());
    CHECK(snake.causeOfDeath() == CauseOfDeath::Heat);
}

TEST_CASE("active is derived from behavior and microhabitat")
{
    Organism snake = makeOrganism();

    snake.setMicrohabitat(Microhabitat::Open);
    for (const Behavior b : {Behavior::Thermoregulate, Behavior::Forage, Behavior::Search})
    {
        snake.setBehavior(b);
        CHECK(snake.active());
    }
    snake.setBehavior(Behavior::Rest);
    CHECK_FALSE(snake.active());

    snake.setBehavior(Behavior::Thermoregulate);
    snake.setMicrohabitat(Microhabitat::Burrow);
    CHECK_FALSE(snake.active());

    snake.setMicrohabitat(Microhabitat::Open);
    snake.kill(CauseOfDeath::Starved);
    CHECK_FALSE(snake.active());
}

TEST_CASE("body temperature is pinned while bruminating")
{
    auto calendar =
        std::make_shared<const BrumationCalendar>("TestSite", std::set<std::pair<int, int>>{{12, 24}});
    Organism snake = makeOrganism(defaultTraits(), 200.0, 400.0, 25.0, defaultForaging(), calendar);

    snake.beginTick(makeContext(3, 10.0, 2.0, 12, 24));
    snake.setBodyTemperature(30.0);
    CHECK(snake.bodyTemperature() == 8.0);

    snake.beginTick(makeContext(3, 10.0, 2.0, 12, 25));
    snake.setBodyTemperature(30.0);
    CHECK(snake.bodyTemperature() == 30.0);
}

TEST_CASE("one tick at rest cools toward the burrow and burns calories")
{
    Organism   snake = makeOrganism(defaultTraits(), 200.0, 400.0, 25.0);
    const Rng  rng(1);
    const auto ctx = makeContext(2, 22.0, 15.0);
    snake.step(ctx, rng);

    const double expectedT = coolingEqK(0.01, 25.0, 22.0, 60.0);
    CHECK(snake.behavior() == Behavior::Rest);
    CHECK(snake.microhabitat() == Microhabitat::Burrow);
    CHECK(snake.tEnv() == 22.0);
    CHECK(snake.bodyTemperature() == doctest::Approx(expectedT));
    CHECK(snake.metabolism().metabolicState() ==
          doctest::Approx(200.0 - snake.metabolism().tickCost(370.0, expectedT, Behavior::Rest, 60.0)));
    CHECK(snake.thermalAccuracy() == doctest::Approx(26.0 - expectedT));
    CHECK(snake.thermalQuality() == doctest::Approx(4.0));
    CHECK(snake.age() == 1);
    CHECK(snake.alive());
}

TEST_CASE("a bruminating tick stays at the brumation temperature")
{
    auto calendar =
        std::make_shared<const BrumationCalendar>("TestSite", std::set<std::pair<int, int>>{{1, 10}});
    Organism  snake = makeOrganism(defaultTraits(), 200.0, 400.0, 25.0, defaultForaging(), calendar);
    const Rng rng(1);
    snake.step(makeContext(12, 10.0, 3.0, 1, 10), rng);

    CHECK(snake.behavior() == Behavior::Brumation);
    CHECK(snake.microhabitat() == Microhabitat::WinterBurrow);
    CHECK(snake.tEnv() == 8.0);
    CHECK(snake.bodyTemperature() == 8.0);
    CHECK(snake.alive());
    CHECK_FALSE(snake.active());
}

TEST_CASE("starving during a tick records the death step")
{
    Organism  snake = makeOrganism(defaultTraits(), 0.0001, 400.0, 25.0);
    const Rng rng(1);
    auto      ctx = makeContext(2);
    ctx.step      = 7;
    snake.step(ctx, rng);

    CHECK_FALSE(snake.alive());
    CHECK(snake.causeOfDeath() == CauseOfDeath::Starved);
    CHECK(snake.deathStep() == 7);
    CHECK(snake.metabolism().metabolicState() == 0.0);
}

TEST_CASE("stepping a dead organism changes nothing")
{
    Organism  snake = makeOrganism();
    const Rng rng(1);
    snake.kill(CauseOfDeath::Cold);
    const double t = snake.bodyTemperature();
    snake.step(makeContext(10), rng);
    CHECK(snake.age() == 0);
    CHECK(snake.bodyTemperature() == t);
    CHECK(snake.causeOfDeath() == CauseOfDeath::Cold);
}

TEST_CASE("snapshot reflects the organism state")
{
    Organism  snake = makeOrganism(defaultTraits(), 200.0, 400.0, 25.0);
    const Rng rng(1);
    snake.step(makeContext(3), rng);

    const OrganismRecord r = snake.snapshot();
    CHECK(r.id == 1U);
    CHECK(r.alive);
    CHECK_FALSE(r.active);
    CHECK(r.mass == 370.0);
    CHECK(r.behavior == Behavior::Rest);
    CHECK(r.microhabitat == Microhabitat::Burrow);
    CHECK(r.bodyTemperature == snake.bodyTemperature());
    CHECK(r.metabolicState == snake.metabolism().metabolicState());
    CHECK(r.attackRate == 0.5);
    CHECK(r.preyDensity == 10.0);
    CHECK(r.preyConsumed == 0);
    CHECK_FALSE(r.causeOfDeath.has_value());
}

TEST_CASE("create samples organisms from the configuration")
{
    const Config cfg      = loadConfig(dataDir() / "config.yaml");
    const auto   calendar = std::make_shared<const BrumationCalendar>(
        BrumationCalendar::fromFile(cfg.rattlesnake.brumation.filePath));
    const Rng rng(42);

    for (uint64_t id = 1; id <= 25; ++id)
    {
        const Organism o = Organism::create(id, cfg, calendar, rng);
        CHECK(o.id() == id);
        CHECK(o.mass() >= 200.0);
        CHECK(o.mass() <= 600.0);
        CHECK(o.behaviorModule().attackRate() >= 0.01);
        CHECK(o.behaviorModule().attackRate() <= 0.05);
        CHECK(o.behaviorModule().params().preyDensity >= 5.0);
        CHECK(o.behaviorModule().params().preyDensity <= 20.0);
        CHECK(o.bodyTemperature() == 25.0);
        CHECK(o.metabolism().metabolicState() == 300.0);
        CHECK(o.metabolism().maxMetabolicState() == doctest::Approx(386.4));
        CHECK(o.traits().voluntaryCt.maxSteps == 3);
        CHECK(o.traits().brumationTemperature == 8.0);
    }
}

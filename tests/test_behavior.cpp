#include <doctest/doctest.h>

#include "TestHelpers.hpp"
#include "suf/Random.hpp"

#include <cmath>

using namespace suf;
using namespace suf::test;

namespace
{
    std::shared_ptr<const BrumationCalendar> juneFirstCalendar()
    {
        return std::make_shared<const BrumationCalendar>("TestSite", std::set<std::pair<int, int>>{{6, 1}});
    }
} // namespace

TEST_CASE("utilities outside active hours are rest only")
{
    const Organism snake = makeOrganism();
    const auto     ctx   = makeContext(2);
    const auto    &b     = snake.behaviorModule();

    const Utilities u = b.computeUtilities(snake, ctx);
    CHECK(u.rest == 1.0);
    CHECK(u.thermoregulate == 0.0);
    CHECK(u.forage == 0.0);

    const auto p = b.behavioralWeights(snake, ctx);
    CHECK(p[0] == doctest::Approx(1.0));
    CHECK(p[1] == 0.0);
    CHECK(p[2] == 0.0);
}

TEST_CASE("a full reserve gives rest utility one and forage utility zero")
{
    const Organism  snake = makeOrganism(defaultTraits(), 400.0, 400.0);
    const Utilities u     = snake.behaviorModule().computeUtilities(snake, makeContext(10));
    CHECK(u.rest == doctest::Approx(1.0));
    CHECK(u.forage == doctest::Approx(0.0));

    const Organism  overfed = makeOrganism(defaultTraits(), 500.0, 400.0);
    const Utilities v       = overfed.behaviorModule().computeUtilities(overfed, makeContext(10));
    CHECK(v.rest == doctest::Approx(1.0));
    CHECK(v.forage == doctest::Approx(0.0));
}

TEST_CASE("rest and forage utilities are complementary")
{
    const Organism  snake = makeOrganism(defaultTraits(), 100.0, 400.0);
    const Utilities u     = snake.behaviorModule().computeUtilities(snake, makeContext(10));
    CHECK(u.rest == doctest::Approx(0.25));
    CHECK(u.forage == doctest::Approx(0.75));
}

TEST_CASE("a zero reserve ceiling makes rest fully satisfied")
{
    const Organism  snake = makeOrganism(defaultTraits(), 0.0, 0.0);
    const Utilities u     = snake.behaviorModule().computeUtilities(snake, makeContext(10));
    CHECK(u.rest == 1.0);
    CHECK(u.forage == 0.0);
}

TEST_CASE("thermoregulation utility scales with the distance from t_opt")
{
    const auto traits = defaultTraits();

    SUBCASE("at t_opt")
    {
        const Organism snake = makeOrganism(traits, 200.0, 400.0, 26.0);
        CHECK(snake.behaviorModule().thermoregulationUtility(snake) == 0.0);
        CHECK(snake.behaviorModule().thermalAccuracy(snake) == 0.0);
    }
    SUBCASE("below t_opt uses the lower margin")
    {
        const Organism snake = makeOrganism(traits, 200.0, 400.0, 20.0);
        CHECK(snake.behaviorModule().thermoregulationUtility(snake) == doctest::Approx(6.0 / 7.0));
    }
    SUBCASE("above t_opt uses the upper margin")
    {
        const Organism snake = makeOrganism(traits, 200.0, 400.0, 27.5);
        CHECK(snake.behaviorModule().thermoregulationUtility(snake) == doctest::Approx(0.5));
    }
    SUBCASE("saturates outside the preferred range")
    {
        const Organism snake = makeOrganism(traits, 200.0, 400.0, 35.0);
        CHECK(snake.behaviorModule().thermoregulationUtility(snake) == 1.0);
    }
    SUBCASE("collapsed margin")
    {
        auto t         = traits;
        t.thermal.tOpt = t.thermal.tPrefMax;
        const Organism snake = makeOrganism(t, 200.0, 400.0, 35.0);
        CHECK(snake.behaviorModule().thermoregulationUtility(snake) == 1.0);
    }
}

TEST_CASE("inactive hours always rest in the burrow")
{
    Organism  snake = makeOrganism(defaultTraits(), 0.0, 400.0, 30.0);
    const Rng rng(3);
    for (const int hour : {0, 1, 2, 3, 4, 5, 21, 22, 23})
    {
        CAPTURE(hour);
        const auto ctx = makeContext(hour);
        snake.beginTick(ctx);
        snake.behaviorModule().step(snake, ctx, rng);
        CHECK(snake.behavior() == Behavior::Rest);
        CHECK(snake.microhabitat() == Microhabitat::Burrow);
        CHECK_FALSE(snake.active());
    }
}

TEST_CASE("brumation days override every other rule")
{
    Organism  snake = makeOrganism(defaultTraits(), 0.0, 400.0, 30.0, defaultForaging(), juneFirstCalendar());
    const Rng rng(5);
    snake.setCtOutOfBoundsCounter(1);
    snake.behaviorModule().setSearchCounter(2);

    const auto ctx = makeContext(12, 22.0, 30.0, 6, 1);
    snake.beginTick(ctx);
    snake.behaviorModule().step(snake, ctx, rng);

    CHECK(snake.isBruminatingToday());
    CHECK(snake.behavior() == Behavior::Brumation);
    CHECK(snake.microhabitat() == Microhabitat::WinterBurrow);
    CHECK(snake.bodyTemperature() == 8.0);
    CHECK(snake.behaviorModule().searchCounter() == 2);
    CHECK_FALSE(snake.active());
}

TEST_CASE("a non-brumation day falls through to the normal rules")
{
    Organism   snake = makeOrganism(defaultTraits(), 200.0, 400.0, 25.0, defaultForaging(), juneFirstCalendar());
    const Rng  rng(5);
    const auto ctx = makeContext(2, 22.0, 30.0, 6, 2);
    snake.beginTick(ctx);
    snake.behaviorModule().step(snake, ctx, rng);

    CHECK_FALSE(snake.isBruminatingToday());
    CHECK(snake.behavior() == Behavior::Rest);
}

TEST_CASE("thermal stress forces thermoregulation")
{
    Organism  snake = makeOrganism(defaultTraits(), 0.0, 400.0, 30.0);
    const Rng rng(9);
    snake.setCtOutOfBoundsCounter(1);
    snake.behaviorModule().setSearchCounter(3);

    const auto ctx = makeContext(10, 22.0, 30.0);
    snake.beginTick(ctx);
    snake.behaviorModule().step(snake, ctx, rng);

    CHECK(snake.behavior() == Behavior::Thermoregulate);
    CHECK(snake.microhabitat() == Microhabitat::Burrow);
    CHECK(snake.behaviorModule().searchCounter() == 3);
}

TEST_CASE("a pending search runs before the utility draw")
{
    Organism  snake = makeOrganism(defaultTraits(), 400.0, 400.0, 26.0);
    const Rng rng(9);
    snake.behaviorModule().setSearchCounter(2);

    const auto ctx = makeContext(10);
    snake.beginTick(ctx);
    snake.behaviorModule().step(snake, ctx, rng);
    CHECK(snake.behavior() == Behavior::Search);
    CHECK(snake.microhabitat() == Microhabitat::Open);
    CHECK(snake.behaviorModule().searchCounter() == 1);
    CHECK(snake.active());

    snake.behaviorModule().step(snake, ctx, rng);
    CHECK(snake.behavior() == Behavior::Search);
    CHECK(snake.behaviorModule().searchCounter() == 0);

    snake.behaviorModule().step(snake, ctx, rng);
    CHECK(snake.behavior() == Behavior::Rest);
}

TEST_CASE("an empty reserve at t_opt always forages")
{
    Organism  snake = makeOrganism(defaultTraits(), 0.0, 400.0, 26.0);
    const Rng rng(17);
    const auto ctx = makeContext(14);

    const auto p = snake.behaviorModule().behavioralWeights(snake, ctx);
    CHECK(p[0] == 0.0);
    CHECK(p[1] == 0.0);
    CHECK(p[2] == doctest::Approx(1.0));

    for (int i = 0; i < 20; ++i)
    {
        snake.beginTick(ctx);
        snake.behaviorModule().step(snake, ctx, rng);
        CHECK(snake.behavior() == Behavior::Forage);
        CHECK(snake.microhabitat() == Microhabitat::Open);
    }
}

TEST_CASE("prey density is zero outside prey active hours")
{
    const EctothermBehavior b(defaultForaging());
    CHECK(b.preyDensity(10) == 10.0);
    CHECK(b.preyDensity(12) == 10.0);
    CHECK(b.preyDensity(14) == 0.0);
    CHECK(b.preyDensity(0) == 0.0);
}

TEST_CASE("foraging outside prey hours catches nothing")
{
    Organism   snake = makeOrganism(defaultTraits(), 100.0, 400.0, 26.0);
    const Rng  rng(1);
    const auto ctx = makeContext(14);
    snake.behaviorModule().forage(snake, ctx, rng);

    CHECK(snake.behaviorModule().preyEncountered() == 0.0);
    CHECK(snake.behaviorModule().preyConsumed() == 0);
    CHECK(snake.metabolism().metabolicState() == 100.0);
    CHECK(snake.totalPreyConsumed() == 0);
}

TEST_CASE("a successful strike credits one prey item")
{
    auto f         = defaultForaging();
    f.attackRate   = 100.0;
    f.preyDensity  = 100.0;
    f.handlingTime = 0.1;

    Organism   snake = makeOrganism(defaultTraits(), 200.0, 400.0, 26.0, f);
    const Rng  rng(2);
    const auto ctx = makeContext(10);
    snake.behaviorModule().forage(snake, ctx, rng);

    const auto &b = snake.behaviorModule();
    CHECK(b.preyEncountered() == doctest::Approx(10000.0 / 1001.0));
    REQUIRE(b.preyConsumed() > 0);
    CHECK(snake.totalPreyConsumed() == b.preyConsumed());
    CHECK(snake.metabolism().metabolicState() == doctest::Approx(200.0 + 77.28));
    CHECK(b.searchCounter() == 0);
}

TEST_CASE("a capture starts a search lasting the remaining handling time")
{
    auto f         = defaultForaging();
    f.attackRate   = 1000.0;
    f.preyDensity  = 1000.0;
    f.handlingTime = 2.5;

    Organism   snake = makeOrganism(defaultTraits(), 200.0, 400.0, 26.0, f);
    const Rng  rng(4);
    const auto ctx = makeContext(11);
    for (int i = 0; i < 500 && snake.behaviorModule().preyConsumed() == 0; ++i)
        snake.behaviorModule().forage(snake, ctx, rng);

    REQUIRE(snake.behaviorModule().preyConsumed() > 0);
    CHECK(snake.behaviorModule().searchCounter() == 2);
}

TEST_CASE("no search follows a capture when searching is disabled")
{
    auto f              = defaultForaging();
    f.attackRate        = 100.0;
    f.preyDensity       = 100.0;
    f.handlingTime      = 0.1;
    f.searchingBehavior = false;

    Organism  snake = makeOrganism(defaultTraits(), 200.0, 400.0, 26.0, f);
    const Rng rng(6);
    snake.behaviorModule().forage(snake, makeContext(10), rng);
    REQUIRE(snake.behaviorModule().preyConsumed() > 0);
    CHECK(snake.behaviorModule().searchCounter() == 0);
}

TEST_CASE("sampled foraging parameters are rounded")
{
    InteractionParameters cfg;
    cfg.caloriesPerGram      = 1.38;
    cfg.digestionEfficiency  = 0.8;
    cfg.expectedPreyBodySize = 70.0;
    cfg.handlingTime         = 2.0;
    cfg.attackRate.range     = Range{0.01, 0.05};
    cfg.preyDensity.range    = Range{5.0, 20.0};
    cfg.preyActiveHours      = makeHourSet({18, 24});

    const Rng rng(21);
    for (int i = 0; i < 50; ++i)
    {
        const auto p = ForagingParameters::sample(cfg, rng);
        CHECK(p.attackRate >= 0.01);
        CHECK(p.attackRate <= 0.05);
        CHECK(p.attackRate * 1000.0 == doctest::Approx(std::round(p.attackRate * 1000.0)));
        CHECK(p.preyDensity >= 5.0);
        CHECK(p.preyDensity <= 20.0);
        CHECK(p.preyDensity == std::round(p.preyDensity));
        CHECK(p.preyActiveHours.test(0));
        CHECK(p.handlingTime == 2.0);
    }

    cfg.attackRate.range.reset();
    cfg.attackRate.value = 0.0123;
    CHECK(ForagingParameters::sample(cfg, rng).attackRate == doctest::Approx(0.012));
}

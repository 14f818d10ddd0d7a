#pragma once

namespace suf
{
    class Rng;

    /**
     * Holling Type II functional response.
     *
     * @param preyDensity    prey per hectare
     * @param attackRate     area searched per predator per time unit
     * @param handlingTime   handling time per prey item
     * @param strikeSuccess  1 yields expected encounters; below 1 yields expected captures
     * @throws std::invalid_argument if strikeSuccess > 1
     */
    [[nodiscard]] double hollingType2(double preyDensity, double attackRate, double handlingTime,
                                      double strikeSuccess = 1.0);

    // Realized captures for one tick: Poisson draw around the expected value.
    [[nodiscard]] int sampleCaptures(double expectedCaptures, const Rng &rng);
} // namespace suf

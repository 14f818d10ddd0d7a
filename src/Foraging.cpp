#include "suf/Foraging.hpp"
#include "suf/Random.hpp"
#include <stdexcept>

namespace suf
{
    double hollingType2(const double preyDensity, const double attackRate, const double handlingTime,
                        const double strikeSuccess)
    {
        if (strikeSuccess > 1.0)
            throw std::invalid_argument("strike success is a probability and cannot exceed 1");

        const double a = strikeSuccess * attackRate;
        return (a * preyDensity) / (1.0 + a * handlingTime * preyDensity);
    }

    int sampleCaptures(const double expectedCaptures, const Rng &rng)
    {
        return rng.poisson(expectedCaptures);
    }
} // namespace suf

#pragma once
#include <algorithm>
#include <cmath>
#include <vector>

namespace suf
{
    inline double clampd(const double x, const double a, const double b)
    {
        return std::max(a, std::min(b, x));
    }

    inline double lerpd(const double a, const double b, const double t)
    {
        return a + (b - a) * t;
    }

    // Normalizes value against maxValue, saturating at 1.
    inline double scaleValue(const double value, const double maxValue)
    {
        const double x = value / maxValue;
        return std::min(x, 1.0);
    }

    inline bool isClose(const double a, const double b, const double absTol = 1e-8)
    {
        return std::abs(a - b) <= absTol;
    }

    inline bool allClose(const std::vector<double> &v, const double target, const double absTol = 1e-8)
    {
        return std::all_of(v.begin(), v.end(), [&](const double x)
        {
            return isClose(x, target, absTol);
        });
    }

    inline double roundTo(const double value, const int decimals)
    {
        const double f = std::pow(10.0, decimals);
        return std::round(value * f) / f;
    }
} // namespace suf

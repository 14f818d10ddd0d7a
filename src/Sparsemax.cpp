#include "suf/Sparsemax.hpp"
#include "suf/Math.hpp"
#include <algorithm>
#include <functional>
#include <numeric>

namespace suf
{
    std::vector<double> uniformDistribution(const size_t n)
    {
        if (n == 0)
            return {};
        return std::vector<double>(n, 1.0 / static_cast<double>(n));
    }

    std::vector<double> sparsemax(const std::vector<double> &z)
    {
        const size_t n = z.size();
        if (n == 0)
            return {};

        std::vector<double> sorted = z;
        std::ranges::sort(sorted, std::greater<>());

        std::vector<double> cumsum(n);
        std::partial_sum(sorted.begin(), sorted.end(), cumsum.begin());

        // largest k (1-based) with 1 + k*z_(k) > sum_{j<=k} z_(j)
        size_t kz = 0;
        for (size_t k = 1; k <= n; ++k)
        {
            if (1.0 + static_cast<double>(k) * sorted[k - 1] > cumsum[k - 1])
                kz = k;
        }
        if (kz == 0)
            return uniformDistribution(n);

        const double tau = (cumsum[kz - 1] - 1.0) / static_cast<double>(kz);

        std::vector<double> p(n);
        double              total = 0.0;
        for (size_t i = 0; i < n; ++i)
        {
            p[i] = std::max(z[i] - tau, 0.0);
            total += p[i];
        }
        if (!(total > 0.0))
            return uniformDistribution(n);

        for (auto &x : p)
            x /= total;
        return p;
    }

    std::vector<double> behaviorWeights(const std::vector<double> &utilities)
    {
        if (allClose(utilities, 0.0))
            return uniformDistribution(utilities.size());
        return sparsemax(utilities);
    }
} // namespace suf

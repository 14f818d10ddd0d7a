#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace suf
{
    class Rng
    {
        public:
            explicit Rng(const uint64_t seed = 42ULL): m_rng(seed)
            {
            }

            void reseed(const uint64_t seed)
            {
                m_rng.seed(seed);
            }

            double uniform(const double a = 0.0, const double b = 1.0) const
            {
                std::uniform_real_distribution d(a, b);
                return d(m_rng);
            }

            int uniformInt(const int a, const int b) const
            {
                std::uniform_int_distribution d(a, b);
                return d(m_rng);
            }

            double normal(const double mean, const double sd) const
            {
                std::normal_distribution d(mean, sd);
                return d(m_rng);
            }

            // Rejection sampling inside [lo, hi]; falls back to clamping after maxTries.
            double truncatedNormal(const double mean, const double sd, const double lo, const double hi,
                                   const int maxTries = 1000) const
            {
                if (sd <= 0.0)
                    return std::clamp(mean, lo, hi);
                for (int i = 0; i < maxTries; ++i)
                {
                    if (const double x = normal(mean, sd); x >= lo && x <= hi)
                        return x;
                }
                return std::clamp(normal(mean, sd), lo, hi);
            }

            int poisson(const double mean) const
            {
                if (!(mean > 0.0))
                    return 0;
                std::poisson_distribution<int> d(mean);
                return d(m_rng);
            }

            // Index drawn with the given weights. Zero-weight entries are never drawn.
            size_t categorical(const std::vector<double> &probabilities) const
            {
                std::discrete_distribution<size_t> d(probabilities.begin(), probabilities.end());
                return d(m_rng);
            }

            template <typename It>
            void shuffle(It first, It last) const
            {
                std::shuffle(first, last, m_rng);
            }

        private:
            mutable std::mt19937_64 m_rng;
    };
} // namespace suf

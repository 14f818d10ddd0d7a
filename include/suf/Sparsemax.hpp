#pragma once
#include <cstddef>
#include <vector>

namespace suf
{
    /**
     * Euclidean projection of z onto the probability simplex (Martins & Astudillo, 2016).
     * The result sums to 1 and may contain exact zeros. Returns the uniform
     * distribution when no support size satisfies the threshold condition.
     */
    [[nodiscard]] std::vector<double> sparsemax(const std::vector<double> &z);

    [[nodiscard]] std::vector<double> uniformDistribution(size_t n);

    // Sparsemax with an all-zero guard: utilities that are all ~0 map to uniform.
    [[nodiscard]] std::vector<double> behaviorWeights(const std::vector<double> &utilities);
} // namespace suf

#pragma once
#include <cstdint>
#include <random>
#include <vector>

/**
 * Seedable pseudo-random stream shared by the randomizer and the sampler.
 *
 * The engine is MT19937 seeded with the 32-bit seed directly, and every
 * derived draw follows the legacy numpy RandomState algorithms:
 *   - uniform doubles use 53 bits built from two consecutive 32-bit words,
 *   - Gaussian deviates use the Marsaglia polar method; the second deviate of
 *     each accepted pair is cached and returned by the next call,
 *   - bounded integers use masked rejection on 32-bit words,
 *   - permutations are Fisher-Yates walks from the last index down.
 * Output for a given seed is therefore identical across platforms and equal
 * to RandomState(seed) for the same sequence of calls.
 */
class RandomStream {
public:
    explicit RandomStream(uint32_t seed = 0) { reseed(seed); }

    // Resets the engine and discards any cached Gaussian deviate.
    void reseed(uint32_t seed);

    uint32_t nextUInt32() { return static_cast<uint32_t>(engine_()); }
    double nextDouble();
    double gauss();
    double normal(double mean, double stddev) { return mean + stddev * gauss(); }

    // Uniform integer in [0, maxInclusive].
    uint64_t interval(uint64_t maxInclusive);

    std::vector<size_t> permutation(size_t n);

private:
    std::mt19937 engine_;
    bool hasSpare_ = false;
    double spare_ = 0.0;
};

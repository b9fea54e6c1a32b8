/**
 * Pokemon Battle Arena Engine - Random Source
 *
 * Every random draw in the engine (spawn placement, obstacle layout, damage
 * jitter, tie-breaks) goes through this interface so that matches can be
 * replayed from a seed.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace arena {

/**
 * RandomSource - Injectable randomness capability.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * Uniform real in [lo, hi).
     */
    virtual double uniform(double lo, double hi) = 0;

    /**
     * Uniform integer in [lo, hi).
     */
    virtual int range(int lo, int hi) = 0;

    /**
     * Uniform index in [0, n). n must be positive.
     */
    virtual size_t pick(size_t n) = 0;
};

/**
 * SeededRandom - Mersenne Twister backed source.
 */
class SeededRandom : public RandomSource {
public:
    explicit SeededRandom(uint64_t seed = 0) : seed_(seed), rng_(seed) {}

    double uniform(double lo, double hi) override;
    int range(int lo, int hi) override;
    size_t pick(size_t n) override;

    void reseed(uint64_t seed) {
        seed_ = seed;
        rng_.seed(seed);
    }

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 rng_;
};

} // namespace arena

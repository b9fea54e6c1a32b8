/**
 * Pokemon Battle Arena Engine - Random Source Implementation
 */

#include "random_source.hpp"

namespace arena {

double SeededRandom::uniform(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

int SeededRandom::range(int lo, int hi) {
    if (hi <= lo + 1) {
        return lo;
    }
    std::uniform_int_distribution<int> dist(lo, hi - 1);
    return dist(rng_);
}

size_t SeededRandom::pick(size_t n) {
    if (n <= 1) {
        return 0;
    }
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(rng_);
}

} // namespace arena

#include "Fuzz.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <sodium.h>

SodiumFuzzSource::SodiumFuzzSource() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

int SodiumFuzzSource::uniform(int lo, int hi) {
    if (hi <= lo) return lo;
    auto span = static_cast<uint32_t>(hi - lo) + 1;
    return lo + static_cast<int>(randombytes_uniform(span));
}

SeededFuzzSource::SeededFuzzSource(unsigned int seed)
    : engine(seed) {}

int SeededFuzzSource::uniform(int lo, int hi) {
    if (hi <= lo) return lo;
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(engine);
}

int applyFuzz(int interval, FuzzSource& source, double min_interval, double factor, int maximum_interval) {
    if (interval < min_interval) return interval;

    int range = std::max(1, static_cast<int>(std::lround(interval * factor)));
    int fuzzed = interval + source.uniform(-range, range);
    return std::clamp(fuzzed, 1, maximum_interval);
}

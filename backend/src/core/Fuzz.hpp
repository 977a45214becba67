#pragma once
#include <random>

// Source of the uniform integers used to fuzz review intervals. The
// scheduler only ever draws through this interface so tests can pin it.
class FuzzSource {
public:
    virtual ~FuzzSource() = default;

    // Uniform integer in [lo, hi].
    virtual int uniform(int lo, int hi) = 0;
};

// libsodium CSPRNG. Calls sodium_init() on construction and throws
// std::runtime_error if the library cannot be initialized.
class SodiumFuzzSource : public FuzzSource {
public:
    SodiumFuzzSource();
    int uniform(int lo, int hi) override;
};

class SeededFuzzSource : public FuzzSource {
public:
    explicit SeededFuzzSource(unsigned int seed);
    int uniform(int lo, int hi) override;

private:
    std::mt19937 engine;
};

// Interval perturbation: intervals >= min_interval move by up to
// max(1, round(interval * factor)) days either way, clamped to
// [1, maximum_interval].
int applyFuzz(int interval, FuzzSource& source, double min_interval, double factor, int maximum_interval);

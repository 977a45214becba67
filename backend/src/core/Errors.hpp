#pragma once
#include <stdexcept>
#include <string>

// Rating outside 1..4. Callers validate user input with parseRating() before
// it reaches the scheduler.
class InvalidRatingError : public std::invalid_argument {
public:
    explicit InvalidRatingError(int value)
        : std::invalid_argument("Rating must be 1-4, got " + std::to_string(value)),
        rating(value) {}

    int rating;
};

// A scheduling record that cannot have been produced by the scheduler
// (e.g. negative stability read back from storage).
class CorruptRecordError : public std::runtime_error {
public:
    explicit CorruptRecordError(const std::string& what)
        : std::runtime_error("Corrupt scheduling record: " + what) {}
};

class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument("Invalid scheduler config: " + what) {}
};

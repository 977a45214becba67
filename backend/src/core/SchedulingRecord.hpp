#pragma once
#include <chrono>
#include <optional>
#include <string>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class CardState {
    New = 0,
    Learning = 1,
    Review = 2,
    Relearning = 3
};

enum class Rating {
    Again = 1,
    Hard = 2,
    Good = 3,
    Easy = 4
};

// Per-card scheduling state. Stability is in days, difficulty in [1, 10]
// once the card has been rated at least once.
struct SchedulingRecord {
    CardState state = CardState::New;
    double stability = 0.0;
    double difficulty = 0.0;
    int scheduled_days = 0;
    TimePoint due_date{};
    std::optional<TimePoint> last_review;
    int reps = 0;
    int lapses = 0;
    int step = 0;

    // Throws CorruptRecordError if the fields could not have come out of a
    // scheduler transition.
    void validate() const;
};

// Rejects anything outside 1..4 with InvalidRatingError.
Rating parseRating(int value);

std::string ratingName(Rating rating);
std::string stateToString(CardState state);
CardState stateFromString(const std::string& name); // unknown -> New

double elapsedDays(TimePoint from, TimePoint to);

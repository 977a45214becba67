#include "SchedulingRecord.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

void SchedulingRecord::validate() const {
    switch (state) {
    case CardState::New:
    case CardState::Learning:
    case CardState::Review:
    case CardState::Relearning:
        break;
    default:
        throw CorruptRecordError("unknown state " + std::to_string(static_cast<int>(state)));
    }

    if (!std::isfinite(stability) || stability < 0.0)
        throw CorruptRecordError("stability " + std::to_string(stability));
    if (reps < 0 || lapses < 0 || step < 0 || scheduled_days < 0)
        throw CorruptRecordError("negative counter");

    // New cards carry no memory state yet
    if (state == CardState::New) {
        if (last_review)
            throw CorruptRecordError("new card with a last review");
        return;
    }

    if (!std::isfinite(difficulty) || difficulty < 1.0 || difficulty > 10.0)
        throw CorruptRecordError("difficulty " + std::to_string(difficulty));
    if (!last_review)
        throw CorruptRecordError(stateToString(state) + " card without last review");
    if ((state == CardState::Review || state == CardState::Relearning) && stability <= 0.0)
        throw CorruptRecordError(stateToString(state) + " card without stability");
}

Rating parseRating(int value) {
    if (value < 1 || value > 4) {
        throw InvalidRatingError(value);
    }
    return static_cast<Rating>(value);
}

std::string ratingName(Rating rating) {
    switch (rating) {
    case Rating::Again: return "again";
    case Rating::Hard:  return "hard";
    case Rating::Good:  return "good";
    case Rating::Easy:  return "easy";
    }
    return "unknown";
}

std::string stateToString(CardState state) {
    switch (state) {
    case CardState::New:        return "new";
    case CardState::Learning:   return "learning";
    case CardState::Review:     return "review";
    case CardState::Relearning: return "relearning";
    }
    return "unknown";
}

CardState stateFromString(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "learning") return CardState::Learning;
    if (s == "review") return CardState::Review;
    if (s == "relearning") return CardState::Relearning;
    return CardState::New;
}

double elapsedDays(TimePoint from, TimePoint to) {
    using days_d = std::chrono::duration<double, std::ratio<86400>>;
    return std::chrono::duration_cast<days_d>(to - from).count();
}

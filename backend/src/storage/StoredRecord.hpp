#pragma once
#include <ctime>
#include "../core/SchedulingRecord.hpp"

// Storage form of a SchedulingRecord. Stability and difficulty are kept as
// integers scaled by 100 (2.5 days -> 250) and times as Unix seconds, with
// last_review == 0 meaning "never reviewed".
struct StoredRecord {
    int state = 0;
    int stability = 0;
    int difficulty = 0;
    int scheduled_days = 0;
    std::time_t due_date = 0;
    std::time_t last_review = 0;
    int reps = 0;
    int lapses = 0;
    int step = 0;
};

int toStorageScale(double value);
double fromStorageScale(int stored);

StoredRecord encodeRecord(const SchedulingRecord& record);

// No validation here: a corrupt row decodes as-is and is rejected by the
// scheduler when the card is next reviewed.
SchedulingRecord decodeRecord(const StoredRecord& stored);

// SM-2 ease factor (x100, 130..400) to a scaled difficulty (100..1000).
// Higher ease means lower difficulty; a missing ease maps to 500.
int legacyEaseToDifficulty(int ease_x100);

// Schedule row of the SM-2 format that decks used before FSRS.
struct LegacyRecord {
    int ease = 0;        // x100
    int interval = 0;    // days
    std::time_t due_date = 0;
    std::time_t last_review = 0;
    int reps = 0;
    int lapses = 0;
};

// Cards never reviewed come back New. Reviewed cards become Review cards
// whose stability is their last interval, i.e. the interval they were
// expected to be recalled at with 90% probability.
StoredRecord migrateLegacyRecord(const LegacyRecord& legacy);

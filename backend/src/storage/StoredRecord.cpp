#include "StoredRecord.hpp"
#include <algorithm>
#include <cmath>

int toStorageScale(double value) {
    return static_cast<int>(std::lround(value * 100.0));
}

double fromStorageScale(int stored) {
    return stored / 100.0;
}

StoredRecord encodeRecord(const SchedulingRecord& record) {
    StoredRecord s;
    s.state = static_cast<int>(record.state);
    s.stability = toStorageScale(record.stability);
    s.difficulty = toStorageScale(record.difficulty);
    s.scheduled_days = record.scheduled_days;
    s.due_date = Clock::to_time_t(record.due_date);
    s.last_review = record.last_review ? Clock::to_time_t(*record.last_review) : 0;
    s.reps = record.reps;
    s.lapses = record.lapses;
    s.step = record.step;
    return s;
}

SchedulingRecord decodeRecord(const StoredRecord& s) {
    SchedulingRecord r;
    r.state = static_cast<CardState>(s.state);
    r.stability = fromStorageScale(s.stability);
    r.difficulty = fromStorageScale(s.difficulty);
    r.scheduled_days = s.scheduled_days;
    r.due_date = Clock::from_time_t(s.due_date);
    if (s.last_review != 0) r.last_review = Clock::from_time_t(s.last_review);
    r.reps = s.reps;
    r.lapses = s.lapses;
    r.step = s.step;
    return r;
}

int legacyEaseToDifficulty(int ease_x100) {
    if (ease_x100 <= 0) return 500;
    return std::clamp((400 - ease_x100) * 10 / 3 + 100, 100, 1000);
}

StoredRecord migrateLegacyRecord(const LegacyRecord& legacy) {
    StoredRecord s;
    s.due_date = legacy.due_date;
    s.lapses = std::max(0, legacy.lapses);
    if (legacy.reps <= 0 || legacy.last_review == 0) return s;

    int days = std::max(1, legacy.interval);
    s.state = static_cast<int>(CardState::Review);
    s.stability = toStorageScale(days);
    s.difficulty = legacyEaseToDifficulty(legacy.ease);
    s.scheduled_days = days;
    s.last_review = legacy.last_review;
    s.reps = legacy.reps;
    return s;
}

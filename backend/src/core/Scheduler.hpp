#pragma once
#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "Fuzz.hpp"
#include "SchedulerConfig.hpp"
#include "SchedulingRecord.hpp"

struct ReviewOutcome {
    SchedulingRecord record;
    double retrievability = 0.0; // at the moment of rating
};

// What one rating button would do, for display before the learner picks.
struct PreviewEntry {
    Rating rating = Rating::Again;
    CardState state = CardState::New;
    int step = 0;
    int scheduled_days = 0;
    TimePoint due_date{};
    std::chrono::minutes delay{ 0 };
    std::string label; // "10m", "3d", "1.5mo", "2.1y"
};

struct IntervalPreview {
    double retrievability = 0.0;
    std::array<PreviewEntry, 4> entries;

    const PreviewEntry& operator[](Rating rating) const {
        return entries[static_cast<int>(rating) - 1];
    }
};

/*
  FSRS scheduler for a single card.

  The card lifecycle is a closed set of four phases (New, Learning, Review,
  Relearning); every rating runs exactly one per-phase transition. The
  scheduler holds no per-card state: review() takes the prior record and
  returns the next one, so the caller owns persistence and must serialize
  concurrent reviews of the same card.

  Fuzz is the only non-deterministic part. It draws from the FuzzSource given
  at construction (a SodiumFuzzSource when none is given) and can be turned
  off with SchedulerConfig::enable_fuzz.
*/
class Scheduler {
public:
    explicit Scheduler(const SchedulerConfig& config, FuzzSource* fuzz = nullptr);

    ReviewOutcome review(const SchedulingRecord& record, Rating rating, TimePoint now);

    // Outcome of each rating with fuzz disabled. Does not touch `record`.
    IntervalPreview preview(const SchedulingRecord& record, TimePoint now) const;

    const SchedulerConfig& config() const { return cfg; }

private:
    SchedulerConfig cfg;
    std::unique_ptr<FuzzSource> owned_fuzz;
    FuzzSource* fuzz_source;

    ReviewOutcome transition(const SchedulingRecord& prior, Rating rating, TimePoint now, FuzzSource* fuzz) const;

    // One transition per phase
    void fromNew(SchedulingRecord& next, Rating rating, TimePoint now) const;
    void fromLearning(SchedulingRecord& next, Rating rating, TimePoint now) const;
    void fromReview(const SchedulingRecord& prior, SchedulingRecord& next, Rating rating,
        double retrievability, TimePoint now, FuzzSource* fuzz) const;
    void fromRelearning(SchedulingRecord& next, Rating rating, TimePoint now) const;

    int plannedInterval(double stability) const;
    static void dueInMinutes(SchedulingRecord& next, TimePoint now, int minutes);
    static void dueInDays(SchedulingRecord& next, TimePoint now, int days);
};

// Display label for a delay: minutes below a day, then days, months, years.
std::string formatInterval(std::chrono::minutes delay);

// Local "YYYY-MM-DD HH:MM", or "unknown" when the time cannot be converted.
std::string formatDueDate(TimePoint due);

// Recall probability right now, for display. Never-reviewed cards report 1.
double currentRetrievability(const SchedulingRecord& record, TimePoint now);

#include "Scheduler.hpp"
#include "Errors.hpp"
#include "ForgettingCurve.hpp"
#include "MemoryModel.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <ratio>
#include <spdlog/fmt/fmt.h>

Scheduler::Scheduler(const SchedulerConfig& config, FuzzSource* fuzz)
    : cfg(config),
    fuzz_source(fuzz)
{
    cfg.validate();
    if (!fuzz_source) {
        owned_fuzz = std::make_unique<SodiumFuzzSource>();
        fuzz_source = owned_fuzz.get();
    }
    spdlog::info("Scheduler (FSRS) initialized: retention={} max_interval={} fuzz={}",
        cfg.request_retention, cfg.maximum_interval, cfg.enable_fuzz);
}

/*
  Public API:
    - review(record, rating, now)
    - preview(record, now)
*/

ReviewOutcome Scheduler::review(const SchedulingRecord& record, Rating rating, TimePoint now) {
    ReviewOutcome out = transition(record, rating, now, cfg.enable_fuzz ? fuzz_source : nullptr);

    const SchedulingRecord& next = out.record;
    spdlog::debug("Review {} -> {} | rating={} R={:.3f} S={:.2f}->{:.2f} D={:.2f}->{:.2f} days={} step={}",
        stateToString(record.state), stateToString(next.state), ratingName(rating),
        out.retrievability, record.stability, next.stability, record.difficulty, next.difficulty,
        next.scheduled_days, next.step);

    if (next.lapses > record.lapses) {
        spdlog::warn("Card lapsed. lapses={}, stability {:.2f} -> {:.2f}",
            next.lapses, record.stability, next.stability);
    }
    return out;
}

IntervalPreview Scheduler::preview(const SchedulingRecord& record, TimePoint now) const {
    IntervalPreview result;

    for (int g = 1; g <= 4; ++g) {
        Rating rating = static_cast<Rating>(g);
        ReviewOutcome out = transition(record, rating, now, nullptr);

        PreviewEntry& e = result.entries[g - 1];
        e.rating = rating;
        e.state = out.record.state;
        e.step = out.record.step;
        e.scheduled_days = out.record.scheduled_days;
        e.due_date = out.record.due_date;
        e.delay = std::chrono::duration_cast<std::chrono::minutes>(out.record.due_date - now);
        e.label = formatInterval(e.delay);
        result.retrievability = out.retrievability;
    }
    return result;
}

/* -------------------------
   Transition core
   -------------------------
   Shared by review() and preview(). A null `fuzz` disables fuzzing.
*/
ReviewOutcome Scheduler::transition(const SchedulingRecord& prior, Rating rating, TimePoint now, FuzzSource* fuzz) const {
    int g = static_cast<int>(rating);
    if (g < 1 || g > 4) {
        throw InvalidRatingError(g);
    }
    prior.validate();

    double retrievability = 0.0;
    if (prior.last_review && prior.stability > 0.0) {
        retrievability = Forgetting::retrievability(elapsedDays(*prior.last_review, now), prior.stability);
    }

    SchedulingRecord next = prior;
    next.scheduled_days = 0;
    next.last_review = now;

    switch (prior.state) {
    case CardState::New:
        fromNew(next, rating, now);
        break;
    case CardState::Learning:
        fromLearning(next, rating, now);
        break;
    case CardState::Review:
        fromReview(prior, next, rating, retrievability, now, fuzz);
        break;
    case CardState::Relearning:
        fromRelearning(next, rating, now);
        break;
    }

    return { next, retrievability };
}

void Scheduler::fromNew(SchedulingRecord& next, Rating rating, TimePoint now) const {
    next.difficulty = Memory::initDifficulty(cfg.weights, rating);
    next.stability = Memory::initStability(cfg.weights, rating);
    next.step = 0;

    switch (rating) {
    case Rating::Again:
    case Rating::Hard:
        next.state = CardState::Learning;
        dueInMinutes(next, now, cfg.learning_steps[0]);
        break;
    case Rating::Good:
        next.state = CardState::Review;
        next.reps = 1;
        dueInDays(next, now, cfg.graduating_interval);
        break;
    case Rating::Easy:
        next.state = CardState::Review;
        next.reps = 1;
        dueInDays(next, now, cfg.easy_interval);
        break;
    }
}

void Scheduler::fromLearning(SchedulingRecord& next, Rating rating, TimePoint now) const {
    const auto& steps = cfg.learning_steps;
    const int last = static_cast<int>(steps.size()) - 1;

    if (rating == Rating::Again) {
        next.step = 0;
        next.stability = Memory::initStability(cfg.weights, rating);
        dueInMinutes(next, now, steps[0]);
        return;
    }

    // cold start: a Learning card that never got an initial stability
    double base = next.stability > 0.0 ? next.stability : Memory::initStability(cfg.weights, rating);
    next.stability = Memory::nextShortTermStability(cfg.weights, base, rating);

    switch (rating) {
    case Rating::Hard:
        dueInMinutes(next, now, steps[std::min(next.step, last)]);
        break;
    case Rating::Good:
        next.step += 1;
        if (next.step > last) {
            next.state = CardState::Review;
            next.step = 0;
            next.reps = 1;
            dueInDays(next, now, std::max(cfg.graduating_interval, plannedInterval(next.stability)));
        }
        else {
            dueInMinutes(next, now, steps[next.step]);
        }
        break;
    case Rating::Easy:
        next.state = CardState::Review;
        next.step = 0;
        next.reps = 1;
        dueInDays(next, now, std::max(cfg.easy_interval, plannedInterval(next.stability)));
        break;
    case Rating::Again:
        break;
    }
}

void Scheduler::fromReview(const SchedulingRecord& prior, SchedulingRecord& next, Rating rating,
    double retrievability, TimePoint now, FuzzSource* fuzz) const {
    const auto& w = cfg.weights;
    next.difficulty = Memory::nextDifficulty(w, prior.difficulty, rating);

    if (rating == Rating::Again) {
        next.state = CardState::Relearning;
        next.step = 0;
        next.lapses += 1;
        next.stability = Memory::nextForgetStability(w, prior.difficulty, prior.stability, retrievability);
        dueInMinutes(next, now, cfg.relearning_steps[0]);
        return;
    }

    next.reps += 1;
    next.stability = Memory::nextRecallStability(w, prior.difficulty, prior.stability, retrievability, rating);

    int interval = plannedInterval(next.stability);
    if (fuzz) {
        interval = applyFuzz(interval, *fuzz, cfg.fuzz_min_interval, cfg.fuzz_factor, cfg.maximum_interval);
    }

    // Keep Hard <= Good < Easy. Good is not floored against Hard.
    if (rating == Rating::Hard) {
        interval = std::max(1, std::min(interval, prior.scheduled_days + 1));
    }
    else if (rating == Rating::Easy) {
        double good_stability = Memory::nextRecallStability(w, prior.difficulty, prior.stability, retrievability, Rating::Good);
        int good_interval = plannedInterval(good_stability);
        interval = std::min(cfg.maximum_interval, std::max(interval, good_interval + 1));
    }

    dueInDays(next, now, interval);
}

void Scheduler::fromRelearning(SchedulingRecord& next, Rating rating, TimePoint now) const {
    const auto& steps = cfg.relearning_steps;
    const int last = static_cast<int>(steps.size()) - 1;

    switch (rating) {
    case Rating::Again:
        // stability stays where the lapse left it
        next.step = 0;
        dueInMinutes(next, now, steps[0]);
        break;
    case Rating::Hard:
        dueInMinutes(next, now, steps[std::min(next.step, last)]);
        break;
    case Rating::Good:
        next.step += 1;
        if (next.step > last) {
            next.state = CardState::Review;
            next.step = 0;
            dueInDays(next, now, std::max(1, plannedInterval(next.stability)));
        }
        else {
            dueInMinutes(next, now, steps[next.step]);
        }
        break;
    case Rating::Easy:
        next.state = CardState::Review;
        next.step = 0;
        next.stability = Memory::nextRecallStability(cfg.weights, next.difficulty, next.stability, 0.0, Rating::Easy);
        dueInDays(next, now, std::max(1, plannedInterval(next.stability)));
        break;
    }
}

int Scheduler::plannedInterval(double stability) const {
    return Forgetting::plannedInterval(stability, cfg.request_retention, cfg.maximum_interval);
}

void Scheduler::dueInMinutes(SchedulingRecord& next, TimePoint now, int minutes) {
    next.scheduled_days = 0;
    next.due_date = now + std::chrono::minutes(minutes);
}

void Scheduler::dueInDays(SchedulingRecord& next, TimePoint now, int days) {
    next.scheduled_days = days;
    next.due_date = now + std::chrono::duration<std::int64_t, std::ratio<86400>>(days);
}

/* -------------------------
   Display helpers
   ------------------------- */

std::string formatInterval(std::chrono::minutes delay) {
    long long minutes = delay.count();
    if (minutes <= 0) return "now";
    if (minutes < 24 * 60) return fmt::format("{}m", minutes);

    long long days = minutes / (24 * 60);
    if (days < 30) return fmt::format("{}d", days);
    if (days < 365) return fmt::format("{:.1f}mo", days / 30.0);
    return fmt::format("{:.1f}y", days / 365.0);
}

std::string formatDueDate(TimePoint due) {
    std::time_t tt = Clock::to_time_t(due);
    const std::tm* local = std::localtime(&tt);
    if (!local) return "unknown";
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", local) == 0) return "unknown";
    return buf;
}

double currentRetrievability(const SchedulingRecord& record, TimePoint now) {
    if (!record.last_review || record.stability <= 0.0) return 1.0;
    return Forgetting::retrievability(elapsedDays(*record.last_review, now), record.stability);
}

#include <gtest/gtest.h>
#include <random>
#include "core/Errors.hpp"
#include "core/Scheduler.hpp"

using std::chrono::hours;
using std::chrono::minutes;

namespace {

const TimePoint T0 = Clock::from_time_t(1700000000);

SchedulingRecord reviewCard(double difficulty, double stability, int scheduled_days, TimePoint last) {
    SchedulingRecord r;
    r.state = CardState::Review;
    r.difficulty = difficulty;
    r.stability = stability;
    r.scheduled_days = scheduled_days;
    r.last_review = last;
    r.due_date = last + hours(24 * scheduled_days);
    r.reps = 3;
    return r;
}

class SchedulerTest : public ::testing::Test {
protected:
    SchedulerTest()
        : fuzz(42),
        scheduler(noFuzzConfig(), &fuzz) {}

    static SchedulerConfig noFuzzConfig() {
        SchedulerConfig cfg = SchedulerConfig::defaults();
        cfg.enable_fuzz = false;
        return cfg;
    }

    SeededFuzzSource fuzz;
    Scheduler scheduler;
    SchedulingRecord fresh;
};

}

TEST_F(SchedulerTest, NewGoodGraduatesAfterOneDay) {
    ReviewOutcome out = scheduler.review(fresh, Rating::Good, T0);
    const SchedulingRecord& r = out.record;

    EXPECT_EQ(CardState::Review, r.state);
    EXPECT_EQ(1, r.scheduled_days);
    EXPECT_EQ(1, r.reps);
    EXPECT_EQ(0, r.lapses);
    EXPECT_EQ(T0 + hours(24), r.due_date);
    ASSERT_TRUE(r.last_review.has_value());
    EXPECT_EQ(T0, *r.last_review);
    EXPECT_NEAR(3.1262, r.stability, 1e-9);
    EXPECT_NEAR(5.3146, r.difficulty, 1e-4);
    EXPECT_DOUBLE_EQ(0.0, out.retrievability);
}

TEST_F(SchedulerTest, NewEasyGraduatesAfterFourDays) {
    const SchedulingRecord r = scheduler.review(fresh, Rating::Easy, T0).record;
    EXPECT_EQ(CardState::Review, r.state);
    EXPECT_EQ(4, r.scheduled_days);
    EXPECT_EQ(1, r.reps);
    EXPECT_EQ(T0 + hours(96), r.due_date);
}

TEST_F(SchedulerTest, LongestEasyIntervalStaysInFuture) {
    SchedulerConfig cfg = noFuzzConfig();
    cfg.easy_interval = SchedulerConfig::MAX_INTERVAL_LIMIT;
    cfg.maximum_interval = SchedulerConfig::MAX_INTERVAL_LIMIT;
    Scheduler longest(cfg, &fuzz);

    const SchedulingRecord r = longest.review(fresh, Rating::Easy, T0).record;
    EXPECT_EQ(36500, r.scheduled_days);
    EXPECT_GT(r.due_date, T0);
    EXPECT_EQ(std::chrono::duration_cast<hours>(r.due_date - T0).count(), 36500LL * 24);
}

TEST_F(SchedulerTest, NewAgainOrHardEntersLearning) {
    for (Rating g : { Rating::Again, Rating::Hard }) {
        const SchedulingRecord r = scheduler.review(fresh, g, T0).record;
        EXPECT_EQ(CardState::Learning, r.state);
        EXPECT_EQ(0, r.step);
        EXPECT_EQ(0, r.scheduled_days);
        EXPECT_EQ(0, r.reps);
        EXPECT_EQ(T0 + minutes(1), r.due_date);
    }
}

TEST_F(SchedulerTest, LearningStepsThenGraduation) {
    SchedulingRecord r = scheduler.review(fresh, Rating::Hard, T0).record;
    ASSERT_NEAR(1.1829, r.stability, 1e-9);

    TimePoint t1 = T0 + minutes(1);
    r = scheduler.review(r, Rating::Good, t1).record;
    EXPECT_EQ(CardState::Learning, r.state);
    EXPECT_EQ(1, r.step);
    EXPECT_EQ(t1 + minutes(10), r.due_date);
    EXPECT_NEAR(2.0882, r.stability, 1e-3);

    TimePoint t2 = t1 + minutes(10);
    r = scheduler.review(r, Rating::Good, t2).record;
    EXPECT_EQ(CardState::Review, r.state);
    EXPECT_EQ(0, r.step);
    EXPECT_EQ(1, r.reps);
    EXPECT_NEAR(3.6863, r.stability, 1e-3);
    EXPECT_EQ(4, r.scheduled_days);
    EXPECT_EQ(t2 + hours(24 * 4), r.due_date);
}

TEST_F(SchedulerTest, LearningAgainRestartsSteps) {
    SchedulingRecord r = scheduler.review(fresh, Rating::Hard, T0).record;
    r = scheduler.review(r, Rating::Good, T0 + minutes(1)).record;
    ASSERT_EQ(1, r.step);

    TimePoint t = T0 + minutes(11);
    r = scheduler.review(r, Rating::Again, t).record;
    EXPECT_EQ(CardState::Learning, r.state);
    EXPECT_EQ(0, r.step);
    EXPECT_DOUBLE_EQ(0.4072, r.stability);
    EXPECT_EQ(t + minutes(1), r.due_date);
}

TEST_F(SchedulerTest, LearningHardRepeatsClampedStep) {
    SchedulingRecord r = scheduler.review(fresh, Rating::Again, T0).record;
    r.step = 7;

    TimePoint t = T0 + minutes(1);
    SchedulingRecord next = scheduler.review(r, Rating::Hard, t).record;
    EXPECT_EQ(CardState::Learning, next.state);
    EXPECT_EQ(7, next.step);
    EXPECT_EQ(t + minutes(10), next.due_date);
    EXPECT_LT(next.stability, r.stability);
    EXPECT_GE(next.stability, 0.1);
}

TEST_F(SchedulerTest, LearningEasyGraduatesImmediately) {
    SchedulingRecord r = scheduler.review(fresh, Rating::Hard, T0).record;
    TimePoint t = T0 + minutes(1);
    r = scheduler.review(r, Rating::Easy, t).record;

    EXPECT_EQ(CardState::Review, r.state);
    EXPECT_EQ(1, r.reps);
    EXPECT_NEAR(19.3442, r.stability, 1e-3);
    EXPECT_EQ(19, r.scheduled_days);
}

TEST_F(SchedulerTest, LearningEasyNeverBelowEasyInterval) {
    SchedulingRecord r = scheduler.review(fresh, Rating::Again, T0).record;
    r = scheduler.review(r, Rating::Easy, T0 + minutes(1)).record;
    // 0.4072 grows to about 6.7 days, planned 7
    EXPECT_GE(r.scheduled_days, 4);
}

TEST_F(SchedulerTest, ReviewAgainLapsesIntoRelearning) {
    SchedulingRecord prior = reviewCard(5.0, 10.0, 10, T0 - hours(240));
    ReviewOutcome out = scheduler.review(prior, Rating::Again, T0);
    const SchedulingRecord& r = out.record;

    EXPECT_EQ(CardState::Relearning, r.state);
    EXPECT_EQ(1, r.lapses);
    EXPECT_EQ(3, r.reps);
    EXPECT_EQ(0, r.step);
    EXPECT_EQ(0, r.scheduled_days);
    EXPECT_LT(r.stability, 10.0);
    EXPECT_NEAR(2.2101, r.stability, 1e-3);
    EXPECT_EQ(T0 + minutes(10), r.due_date);
    EXPECT_NEAR(0.9, out.retrievability, 1e-9);
}

TEST_F(SchedulerTest, ReviewSuccessIntervalsAreTiered) {
    SchedulingRecord prior = reviewCard(5.0, 10.0, 10, T0 - hours(240));

    SchedulingRecord hard = scheduler.review(prior, Rating::Hard, T0).record;
    SchedulingRecord good = scheduler.review(prior, Rating::Good, T0).record;
    SchedulingRecord easy = scheduler.review(prior, Rating::Easy, T0).record;

    // Hard: planned 16, capped at previous + 1
    EXPECT_EQ(11, hard.scheduled_days);
    EXPECT_EQ(34, good.scheduled_days);
    // Easy: planned 10, floored at Good + 1
    EXPECT_EQ(35, easy.scheduled_days);

    EXPECT_NEAR(5.3351, good.difficulty, 1e-3);
    for (const auto& r : { hard, good, easy }) {
        EXPECT_EQ(CardState::Review, r.state);
        EXPECT_EQ(4, r.reps);
        EXPECT_EQ(0, r.lapses);
        EXPECT_GE(r.stability, 10.0);
    }
}

TEST_F(SchedulerTest, RelearningAgainKeepsStability) {
    SchedulingRecord r = scheduler.review(reviewCard(5.0, 10.0, 10, T0 - hours(240)), Rating::Again, T0).record;
    double lapsed = r.stability;

    TimePoint t = T0 + minutes(10);
    r = scheduler.review(r, Rating::Again, t).record;
    EXPECT_EQ(CardState::Relearning, r.state);
    EXPECT_EQ(0, r.step);
    EXPECT_EQ(1, r.lapses);
    EXPECT_DOUBLE_EQ(lapsed, r.stability);
    EXPECT_EQ(t + minutes(10), r.due_date);
}

TEST_F(SchedulerTest, RelearningHardRepeatsStep) {
    SchedulingRecord r = scheduler.review(reviewCard(5.0, 10.0, 10, T0 - hours(240)), Rating::Again, T0).record;
    TimePoint t = T0 + minutes(10);
    SchedulingRecord next = scheduler.review(r, Rating::Hard, t).record;
    EXPECT_EQ(CardState::Relearning, next.state);
    EXPECT_EQ(0, next.step);
    EXPECT_EQ(t + minutes(10), next.due_date);
}

TEST_F(SchedulerTest, RelearningGoodGraduatesBackToReview) {
    SchedulingRecord r = scheduler.review(reviewCard(5.0, 10.0, 10, T0 - hours(240)), Rating::Again, T0).record;
    TimePoint t = T0 + minutes(10);
    SchedulingRecord next = scheduler.review(r, Rating::Good, t).record;

    EXPECT_EQ(CardState::Review, next.state);
    EXPECT_EQ(0, next.step);
    EXPECT_EQ(2, next.scheduled_days); // stability ~2.21
    EXPECT_EQ(3, next.reps);
    EXPECT_EQ(t + hours(48), next.due_date);
}

TEST_F(SchedulerTest, RelearningEasyReturnsToReview) {
    SchedulingRecord r = scheduler.review(reviewCard(5.0, 10.0, 10, T0 - hours(240)), Rating::Again, T0).record;
    SchedulingRecord next = scheduler.review(r, Rating::Easy, T0 + minutes(10)).record;

    EXPECT_EQ(CardState::Review, next.state);
    EXPECT_GE(next.stability, r.stability);
    EXPECT_GE(next.scheduled_days, 1);
}

TEST_F(SchedulerTest, FourGoodReviewsGrowIntervals) {
    SchedulingRecord r = scheduler.review(fresh, Rating::Good, T0).record;
    std::vector<int> days = { r.scheduled_days };

    for (int i = 0; i < 3; ++i) {
        r = scheduler.review(r, Rating::Good, r.due_date).record;
        days.push_back(r.scheduled_days);
    }

    EXPECT_EQ((std::vector<int>{ 1, 6, 21, 64 }), days);
}

TEST_F(SchedulerTest, FourGoodReviewsGrowIntervalsWithFuzz) {
    SchedulerConfig cfg = SchedulerConfig::defaults();
    SeededFuzzSource seeded(7);
    Scheduler fuzzy(cfg, &seeded);

    SchedulingRecord r = fuzzy.review(fresh, Rating::Good, T0).record;
    int prev = r.scheduled_days;
    for (int i = 0; i < 3; ++i) {
        r = fuzzy.review(r, Rating::Good, r.due_date).record;
        EXPECT_GT(r.scheduled_days, prev);
        prev = r.scheduled_days;
    }
}

TEST_F(SchedulerTest, FuzzStaysWithinBounds) {
    SchedulerConfig cfg = SchedulerConfig::defaults();
    SeededFuzzSource seeded(3);
    Scheduler fuzzy(cfg, &seeded);
    SchedulingRecord prior = reviewCard(5.0, 10.0, 10, T0 - hours(240));

    for (int i = 0; i < 200; ++i) {
        int days = fuzzy.review(prior, Rating::Good, T0).record.scheduled_days;
        EXPECT_GE(days, 32);
        EXPECT_LE(days, 36);
    }
}

TEST_F(SchedulerTest, FuzzIgnoresTrailingWeights) {
    SchedulerConfig plain = SchedulerConfig::defaults();
    SchedulerConfig odd = plain;
    odd.weights[17] = 100.0;
    odd.weights[18] = 0.9;

    SeededFuzzSource a(7), b(7);
    Scheduler left(plain, &a), right(odd, &b);
    SchedulingRecord prior = reviewCard(5.0, 10.0, 10, T0 - hours(240));

    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(left.review(prior, Rating::Good, T0).record.scheduled_days,
            right.review(prior, Rating::Good, T0).record.scheduled_days);
    }
}

TEST(Fuzz, OnlyLongIntervalsMove) {
    SeededFuzzSource seeded(1);
    EXPECT_EQ(1, applyFuzz(1, seeded, 2.5, 0.05, 36500));
    EXPECT_EQ(2, applyFuzz(2, seeded, 2.5, 0.05, 36500));

    for (int i = 0; i < 100; ++i) {
        int three = applyFuzz(3, seeded, 2.5, 0.05, 36500);
        EXPECT_GE(three, 2);
        EXPECT_LE(three, 4);

        int hundred = applyFuzz(100, seeded, 2.5, 0.05, 36500);
        EXPECT_GE(hundred, 95);
        EXPECT_LE(hundred, 105);

        EXPECT_LE(applyFuzz(36500, seeded, 2.5, 0.05, 36500), 36500);
    }
}

TEST_F(SchedulerTest, InvariantsHoldOverRandomSession) {
    // short cap keeps the simulated clock well inside system_clock's range
    SchedulerConfig cfg = SchedulerConfig::defaults();
    cfg.maximum_interval = 365;
    SeededFuzzSource seeded(11);
    Scheduler fuzzy(cfg, &seeded);
    std::mt19937 rng(2024);
    std::uniform_int_distribution<int> pick(1, 4);
    std::uniform_int_distribution<int> late(0, 72);

    SchedulingRecord r;
    TimePoint now = T0;
    for (int i = 0; i < 200; ++i) {
        Rating g = parseRating(pick(rng));
        SchedulingRecord next = fuzzy.review(r, g, now).record;

        EXPECT_GE(next.difficulty, 1.0);
        EXPECT_LE(next.difficulty, 10.0);
        EXPECT_GE(next.stability, 0.1);
        EXPECT_GT(next.due_date, now);
        EXPECT_NE(CardState::New, next.state);
        EXPECT_LE(next.scheduled_days, cfg.maximum_interval);
        if (r.state == CardState::Review && g == Rating::Again) {
            EXPECT_EQ(r.lapses + 1, next.lapses);
            EXPECT_LE(next.stability, r.stability);
        }
        else {
            EXPECT_EQ(r.lapses, next.lapses);
        }

        r = next;
        now = r.due_date + hours(late(rng));
    }
}

TEST_F(SchedulerTest, ReviewDoesNotTouchInput) {
    SchedulingRecord prior = reviewCard(5.0, 10.0, 10, T0 - hours(240));
    SchedulingRecord copy = prior;
    scheduler.review(prior, Rating::Again, T0);

    EXPECT_EQ(copy.state, prior.state);
    EXPECT_EQ(copy.stability, prior.stability);
    EXPECT_EQ(copy.lapses, prior.lapses);
    EXPECT_EQ(copy.due_date, prior.due_date);
}

TEST(RatingValidation, RejectsOutOfRange) {
    EXPECT_EQ(Rating::Again, parseRating(1));
    EXPECT_EQ(Rating::Easy, parseRating(4));
    EXPECT_THROW(parseRating(0), InvalidRatingError);
    EXPECT_THROW(parseRating(5), InvalidRatingError);
    EXPECT_THROW(parseRating(-3), InvalidRatingError);
}

TEST_F(SchedulerTest, RejectsInvalidRatingEnum) {
    EXPECT_THROW(scheduler.review(fresh, static_cast<Rating>(0), T0), InvalidRatingError);
    EXPECT_THROW(scheduler.review(fresh, static_cast<Rating>(9), T0), InvalidRatingError);
}

TEST_F(SchedulerTest, RejectsCorruptRecords) {
    SchedulingRecord negative = reviewCard(5.0, -1.0, 10, T0 - hours(24));
    EXPECT_THROW(scheduler.review(negative, Rating::Good, T0), CorruptRecordError);

    SchedulingRecord zero = reviewCard(5.0, 0.0, 10, T0 - hours(24));
    EXPECT_THROW(scheduler.review(zero, Rating::Good, T0), CorruptRecordError);

    SchedulingRecord hard = reviewCard(11.0, 3.0, 10, T0 - hours(24));
    EXPECT_THROW(scheduler.review(hard, Rating::Good, T0), CorruptRecordError);

    SchedulingRecord unseen = reviewCard(5.0, 3.0, 10, T0);
    unseen.last_review.reset();
    EXPECT_THROW(scheduler.review(unseen, Rating::Good, T0), CorruptRecordError);

    SchedulingRecord counters = reviewCard(5.0, 3.0, 10, T0 - hours(24));
    counters.lapses = -1;
    EXPECT_THROW(scheduler.preview(counters, T0), CorruptRecordError);
}

TEST_F(SchedulerTest, NewCardWithLastReviewRejected) {
    SchedulingRecord r;
    r.due_date = T0;
    r.last_review = T0 - hours(24);
    EXPECT_THROW(r.validate(), CorruptRecordError);
    EXPECT_THROW(scheduler.review(r, Rating::Good, T0), CorruptRecordError);
    EXPECT_THROW(scheduler.preview(r, T0), CorruptRecordError);
}

TEST(StateNames, RoundTrip) {
    for (CardState s : { CardState::New, CardState::Learning, CardState::Review, CardState::Relearning }) {
        EXPECT_EQ(s, stateFromString(stateToString(s)));
    }
    EXPECT_EQ(CardState::Review, stateFromString("REVIEW"));
    EXPECT_EQ(CardState::New, stateFromString("bogus"));
}

#pragma once
#include <vector>
#include "SchedulingRecord.hpp"

/*
  FSRS stability / difficulty updates. All functions are pure and take the
  weight table explicitly; w must hold SchedulerConfig::WEIGHT_COUNT values.
*/
namespace Memory {

constexpr double MIN_DIFFICULTY = 1.0;
constexpr double MAX_DIFFICULTY = 10.0;
constexpr double MIN_STABILITY = 0.1;

using Weights = std::vector<double>;

double initDifficulty(const Weights& w, Rating rating);
double initStability(const Weights& w, Rating rating);

// Mean reversion toward initDifficulty(Good).
double nextDifficulty(const Weights& w, double difficulty, Rating rating);

// Successful recall (Hard/Good/Easy). Never below MIN_STABILITY.
double nextRecallStability(const Weights& w, double difficulty, double stability,
    double retrievability, Rating rating);

// Lapse. Result lies in [MIN_STABILITY, stability].
double nextForgetStability(const Weights& w, double difficulty, double stability,
    double retrievability);

// Drift inside the Learning / Relearning step tables.
double nextShortTermStability(const Weights& w, double stability, Rating rating);

}

#pragma once

// Power-law forgetting curve: R(t, S) = (1 + FACTOR * t / S) ^ DECAY.
// FACTOR is chosen so that R(S, S) == 0.9.
namespace Forgetting {

constexpr double DECAY = -0.5;
constexpr double FACTOR = 19.0 / 81.0;

// Probability of recall after elapsed_days. 0 for stability <= 0, 1 for
// elapsed_days <= 0.
double retrievability(double elapsed_days, double stability);

// Whole-day interval after which recall drops to `retention`, clamped to
// [1, maximum_interval].
int plannedInterval(double stability, double retention, int maximum_interval);

}

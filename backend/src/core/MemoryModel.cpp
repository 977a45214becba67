#include "MemoryModel.hpp"
#include <algorithm>
#include <cmath>

namespace Memory {

static double clampDifficulty(double d) {
    return std::clamp(d, MIN_DIFFICULTY, MAX_DIFFICULTY);
}

static double grade(Rating rating) {
    return static_cast<double>(static_cast<int>(rating));
}

double initDifficulty(const Weights& w, Rating rating) {
    return clampDifficulty(w[4] - std::exp(w[5] * (grade(rating) - 1.0)) + 1.0);
}

double initStability(const Weights& w, Rating rating) {
    return std::max(MIN_STABILITY, w[static_cast<int>(rating) - 1]);
}

double nextDifficulty(const Weights& w, double difficulty, Rating rating) {
    double delta = -(w[7] * (grade(rating) - 3.0));
    double reverted = w[6] * initDifficulty(w, Rating::Good) + (1.0 - w[6]) * (difficulty + delta);
    return clampDifficulty(reverted);
}

double nextRecallStability(const Weights& w, double difficulty, double stability,
    double retrievability, Rating rating) {
    double hard_penalty = (rating == Rating::Hard) ? w[15] : 1.0;
    double easy_bonus = (rating == Rating::Easy) ? w[16] : 1.0;

    double growth = std::exp(w[8])
        * (11.0 - difficulty)
        * std::pow(stability, -w[9])
        * (std::exp(w[10] * (1.0 - retrievability)) - 1.0)
        * hard_penalty
        * easy_bonus;

    return std::max(MIN_STABILITY, stability * (growth + 1.0));
}

double nextForgetStability(const Weights& w, double difficulty, double stability,
    double retrievability) {
    double s = w[11]
        * std::pow(difficulty, -w[12])
        * (std::pow(stability + 1.0, w[13]) - 1.0)
        * std::exp(w[14] * (1.0 - retrievability));

    // a lapse never raises stability
    return std::max(MIN_STABILITY, std::min(stability, s));
}

double nextShortTermStability(const Weights& w, double stability, Rating rating) {
    return std::max(MIN_STABILITY, stability * std::exp(w[14] * (grade(rating) - 3.0 + w[15])));
}

}

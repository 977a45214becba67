#include "ForgettingCurve.hpp"
#include <algorithm>
#include <cmath>

namespace Forgetting {

double retrievability(double elapsed_days, double stability) {
    if (stability <= 0.0) return 0.0;
    if (elapsed_days <= 0.0) return 1.0;
    return std::pow(1.0 + FACTOR * elapsed_days / stability, DECAY);
}

int plannedInterval(double stability, double retention, int maximum_interval) {
    if (stability <= 0.0) return 1;

    double interval = stability / FACTOR * (std::pow(retention, 1.0 / DECAY) - 1.0);
    double rounded = std::round(interval);
    return static_cast<int>(std::clamp(rounded, 1.0, static_cast<double>(maximum_interval)));
}

}

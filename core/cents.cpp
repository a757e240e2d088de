#include "harp/cents.hpp"

#include <cmath>

namespace harp {

double get_cents(double f1, double f2) {
    return 1200.0 * std::log2(f1 / f2);
}

double add_cents_to_frequency(double cents, double frequency) {
    return std::pow(2.0, cents / 1200.0) * frequency;
}

double round3(double value) {
    const double scaled = value * 1000.0;
    // Values already on the 0.001 grid (261.626) scale to just below the integer.
    const double nearest = std::round(scaled);
    if (std::fabs(scaled - nearest) < 1e-6) return nearest / 1000.0;
    return std::floor(scaled) / 1000.0;
}

} // namespace harp

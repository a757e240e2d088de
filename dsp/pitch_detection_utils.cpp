#include "pitch_detection_utils.hpp"

#include <cmath>

namespace harp::dsp {

static constexpr int kMinSamples = 4;

double parabolic_interpolation(const double* values, int size, int peak) {
    if (peak <= 0 || peak >= size - 1) return static_cast<double>(peak);
    const double x0 = values[peak - 1];
    const double x1 = values[peak];
    const double x2 = values[peak + 1];
    const double denominator = x0 - 2.0 * x1 + x2;
    if (std::fabs(denominator) < 1e-10) return static_cast<double>(peak);
    double adjustment = 0.5 * (x0 - x2) / denominator;
    if (std::fabs(adjustment) > 1.0) adjustment = 0.0;
    return peak + adjustment;
}

double compute_rms(const float* samples, int num_samples) {
    if (!samples || num_samples <= 0) return 0.0;
    double sum = 0.0;
    for (int i = 0; i < num_samples; ++i) {
        const double s = samples[i];
        sum += s * s;
    }
    return std::sqrt(sum / num_samples);
}

bool is_analyzable(const float* samples, int num_samples, int sample_rate) {
    if (!samples || num_samples < kMinSamples || sample_rate <= 0) return false;
    bool any_signal = false;
    for (int i = 0; i < num_samples; ++i) {
        if (!std::isfinite(samples[i])) return false;
        if (samples[i] != 0.0f) any_signal = true;
    }
    return any_signal;
}

} // namespace harp::dsp

#include "mpm_pitch_detector.hpp"
#include "pitch_detection_utils.hpp"

#include <algorithm>

namespace harp::dsp {

MpmPitchDetector::MpmPitchDetector(const DetectorConfig& config)
    : range_{config.min_frequency, config.max_frequency},
      peak_threshold_(config.mpm_peak_threshold) {}

PitchResult MpmPitchDetector::detect_pitch(const float* samples, int num_samples, int sample_rate) {
    if (!is_analyzable(samples, num_samples, sample_rate)) return {};
    if (range_.min_hz <= 0.0 || range_.max_hz <= range_.min_hz) return {};

    // Lag window widened by 10% on both ends
    const int min_lag = std::max(1, static_cast<int>(sample_rate / (range_.max_hz * 1.1)));
    const int max_lag = std::min(num_samples / 2, static_cast<int>(sample_rate / (range_.min_hz * 0.9)));
    const int count = max_lag - min_lag;
    if (count < 3) return {};

    nsdf_.assign(count, 0.0);
    for (int lag = min_lag; lag < max_lag; ++lag) {
        double acf = 0.0;
        double energy = 0.0;
        for (int i = 0; i < num_samples - lag; ++i) {
            const double a = samples[i];
            const double b = samples[i + lag];
            acf += a * b;
            energy += a * a + b * b;
        }
        nsdf_[lag - min_lag] = energy == 0.0 ? 0.0 : 2.0 * acf / energy;
    }

    int peak = -1;
    for (int i = 1; i < count - 1; ++i) {
        if (nsdf_[i] > peak_threshold_ && nsdf_[i] > nsdf_[i - 1] && nsdf_[i] > nsdf_[i + 1]) {
            peak = i;
            break;
        }
    }
    if (peak < 0) return {};

    const double refined = parabolic_interpolation(nsdf_.data(), count, peak) + min_lag;
    if (refined <= 0.0) return {};
    PitchResult r;
    r.pitch = sample_rate / refined;
    r.confidence = std::clamp(nsdf_[peak], 0.0, 1.0);
    return r;
}

} // namespace harp::dsp

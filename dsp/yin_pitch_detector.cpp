#include "yin_pitch_detector.hpp"
#include "pitch_detection_utils.hpp"
#include "harp/cents.hpp"

#include <algorithm>

namespace harp::dsp {

// Lag bounds are taken a quarter tone beyond the configured range.
static constexpr double kRangeMarginCents = 25.0;

YinPitchDetector::YinPitchDetector(const DetectorConfig& config)
    : range_{config.min_frequency, config.max_frequency},
      threshold_(config.yin_threshold) {}

PitchResult YinPitchDetector::detect_pitch(const float* samples, int num_samples, int sample_rate) {
    if (!is_analyzable(samples, num_samples, sample_rate)) return {};
    if (range_.min_hz <= 0.0 || range_.max_hz <= range_.min_hz) return {};

    const int half = num_samples / 2;
    const int max_tau = static_cast<int>(sample_rate / add_cents_to_frequency(-kRangeMarginCents, range_.min_hz));
    const int min_tau = static_cast<int>(sample_rate / add_cents_to_frequency(kRangeMarginCents, range_.max_hz));

    // d(tau) over the whole half buffer
    difference_.assign(half, 0.0);
    for (int tau = 0; tau < half; ++tau) {
        double sum = 0.0;
        for (int j = 0; j < half; ++j) {
            const double delta = static_cast<double>(samples[j]) - samples[j + tau];
            sum += delta * delta;
        }
        difference_[tau] = sum;
    }

    // Cumulative mean normalized difference over all lags; the range only limits the scan.
    cmndf_.assign(half, 1.0);
    double running = 0.0;
    for (int tau = 1; tau < half; ++tau) {
        running += difference_[tau];
        cmndf_[tau] = difference_[tau] / (running / tau + 1e-10);
    }

    const int first = std::max(2, min_tau);
    const int last = std::min(max_tau, half - 2);
    for (int tau = first; tau <= last; ++tau) {
        const double v = cmndf_[tau];
        if (v < threshold_ && v < cmndf_[tau - 1] && v < cmndf_[tau + 1]) {
            const double refined = parabolic_interpolation(cmndf_.data(), half, tau);
            if (refined <= 0.0) break;
            PitchResult r;
            r.pitch = sample_rate / refined;
            r.confidence = std::max(0.0, 1.0 - v / threshold_);
            return r;
        }
    }
    return {};
}

} // namespace harp::dsp

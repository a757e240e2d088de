#include "hybrid_pitch_detector.hpp"
#include "pitch_detection_utils.hpp"

namespace harp::dsp {

HybridPitchDetector::HybridPitchDetector(const DetectorConfig& config)
    : range_{config.min_frequency, config.max_frequency},
      noise_rms_(config.noise_rms),
      yin_(config), mpm_(config), fft_(config) {}

void HybridPitchDetector::set_frequency_range(const FrequencyRange& range) {
    range_ = range;
    yin_.set_frequency_range(range);
    mpm_.set_frequency_range(range);
    fft_.set_frequency_range(range);
}

PitchResult HybridPitchDetector::detect_pitch(const float* samples, int num_samples, int sample_rate) {
    if (!is_analyzable(samples, num_samples, sample_rate)) return {};
    if (compute_rms(samples, num_samples) < noise_rms_) return {};

    const PitchResult rough = fft_.detect_pitch(samples, num_samples, sample_rate);
    if (rough.detected()) {
        if (rough.pitch < kLowBandHz) {
            const PitchResult r = yin_.detect_pitch(samples, num_samples, sample_rate);
            if (r.detected()) return r;
        } else if (rough.pitch < kHighBandHz) {
            const PitchResult r = mpm_.detect_pitch(samples, num_samples, sample_rate);
            if (r.detected()) return r;
        } else {
            return rough;
        }
    }

    // No usable estimate: choose by the register the range starts in.
    if (range_.min_hz < kLowBandHz) {
        return yin_.detect_pitch(samples, num_samples, sample_rate);
    }
    if (range_.min_hz < kHighBandHz) {
        return mpm_.detect_pitch(samples, num_samples, sample_rate);
    }
    return rough;
}

} // namespace harp::dsp

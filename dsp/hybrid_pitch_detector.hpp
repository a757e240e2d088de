#pragma once

#include "fft_pitch_detector.hpp"
#include "mpm_pitch_detector.hpp"
#include "yin_pitch_detector.hpp"

namespace harp::dsp {

// Picks YIN, MPM or the FFT estimate by register after a rough FFT pass.
class HybridPitchDetector : public IPitchDetector {
public:
    static constexpr double kLowBandHz = 300.0;
    static constexpr double kHighBandHz = 1000.0;

    explicit HybridPitchDetector(const DetectorConfig& config = DetectorConfig{});

    using IPitchDetector::detect_pitch;
    PitchResult detect_pitch(const float* samples, int num_samples, int sample_rate) override;

    void set_frequency_range(const FrequencyRange& range) override;
    FrequencyRange frequency_range() const override { return range_; }
    PitchAlgorithm algorithm() const override { return PitchAlgorithm::Hybrid; }

private:
    FrequencyRange range_;
    double noise_rms_;
    YinPitchDetector yin_;
    MpmPitchDetector mpm_;
    FftPitchDetector fft_;
};

} // namespace harp::dsp

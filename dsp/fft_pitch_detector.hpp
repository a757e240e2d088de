#pragma once

#include <complex>
#include <vector>

#include "harp/pitch_detector.hpp"

namespace harp::dsp {

// Strongest spectral peak in range with harmonic validation for low notes.
// Coarse but cheap; the hybrid detector uses it as a first estimate.
class FftPitchDetector : public IPitchDetector {
public:
    static constexpr int kMinFftSize = 2048;

    explicit FftPitchDetector(const DetectorConfig& config = DetectorConfig{});

    using IPitchDetector::detect_pitch;
    PitchResult detect_pitch(const float* samples, int num_samples, int sample_rate) override;

    void set_frequency_range(const FrequencyRange& range) override { range_ = range; }
    FrequencyRange frequency_range() const override { return range_; }
    PitchAlgorithm algorithm() const override { return PitchAlgorithm::Fft; }

private:
    int find_peak_bin(double threshold, double bin_hz) const;
    bool validate_harmonics(int peak_bin, double bin_hz) const;

    FrequencyRange range_;
    std::vector<std::complex<double>> work_;
    std::vector<double> spectrum_;
};

} // namespace harp::dsp

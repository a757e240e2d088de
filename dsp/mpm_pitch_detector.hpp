#pragma once

#include <vector>

#include "harp/pitch_detector.hpp"

namespace harp::dsp {

// McLeod pitch method over the band-limited lag window only.
class MpmPitchDetector : public IPitchDetector {
public:
    explicit MpmPitchDetector(const DetectorConfig& config = DetectorConfig{});

    using IPitchDetector::detect_pitch;
    PitchResult detect_pitch(const float* samples, int num_samples, int sample_rate) override;

    void set_frequency_range(const FrequencyRange& range) override { range_ = range; }
    FrequencyRange frequency_range() const override { return range_; }
    PitchAlgorithm algorithm() const override { return PitchAlgorithm::Mpm; }

    void set_peak_threshold(double threshold) { peak_threshold_ = threshold; }
    double peak_threshold() const { return peak_threshold_; }

private:
    FrequencyRange range_;
    double peak_threshold_;
    std::vector<double> nsdf_;
};

} // namespace harp::dsp

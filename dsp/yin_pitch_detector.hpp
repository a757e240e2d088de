#pragma once

#include <vector>

#include "harp/pitch_detector.hpp"

namespace harp::dsp {

// YIN (de Cheveigne & Kawahara): difference function, cumulative mean
// normalization, first dip below an absolute threshold.
class YinPitchDetector : public IPitchDetector {
public:
    explicit YinPitchDetector(const DetectorConfig& config = DetectorConfig{});

    using IPitchDetector::detect_pitch;
    PitchResult detect_pitch(const float* samples, int num_samples, int sample_rate) override;

    void set_frequency_range(const FrequencyRange& range) override { range_ = range; }
    FrequencyRange frequency_range() const override { return range_; }
    PitchAlgorithm algorithm() const override { return PitchAlgorithm::Yin; }

    void set_threshold(double threshold) { threshold_ = threshold; }
    double threshold() const { return threshold_; }

private:
    FrequencyRange range_;
    double threshold_;
    std::vector<double> difference_;
    std::vector<double> cmndf_;
};

} // namespace harp::dsp

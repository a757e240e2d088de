#pragma once

#include <memory>
#include <string>
#include <vector>

#include "harp/harmonica.hpp"

namespace harp {

// Sentinel pitch reported when nothing was detected.
constexpr double kNoDetectedPitch = -1.0;

constexpr double kDefaultMinFrequency = 80.0;
constexpr double kDefaultMaxFrequency = 4835.0;

struct PitchResult {
    double pitch = kNoDetectedPitch; // Hz
    double confidence = 0.0;         // 0..1

    bool detected() const { return pitch != kNoDetectedPitch; }
};

enum class PitchAlgorithm { Yin, Mpm, Fft, Hybrid };

struct DetectorConfig {
    double min_frequency = kDefaultMinFrequency;
    double max_frequency = kDefaultMaxFrequency;
    double yin_threshold = 0.4;      // absolute CMNDF threshold
    double mpm_peak_threshold = 0.5; // minimum NSDF peak
    double noise_rms = 0.01;         // hybrid noise gate
};

class IPitchDetector {
public:
    virtual ~IPitchDetector() = default;

    // Never throws; degenerate input yields {kNoDetectedPitch, 0}.
    virtual PitchResult detect_pitch(const float* samples, int num_samples, int sample_rate) = 0;

    PitchResult detect_pitch(const std::vector<float>& samples, int sample_rate) {
        return detect_pitch(samples.data(), static_cast<int>(samples.size()), sample_rate);
    }

    virtual void set_frequency_range(const FrequencyRange& range) = 0;
    virtual FrequencyRange frequency_range() const = 0;

    virtual PitchAlgorithm algorithm() const = 0;
};

std::unique_ptr<IPitchDetector> createPitchDetector(PitchAlgorithm algorithm,
                                                    const DetectorConfig& config = DetectorConfig{});

// Case-insensitive; unknown names resolve to Yin.
PitchAlgorithm pitch_algorithm_from_name(const std::string& name);
const char* pitch_algorithm_name(PitchAlgorithm algorithm);
const std::vector<std::string>& supported_pitch_algorithms();

} // namespace harp

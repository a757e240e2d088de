#include "harp/pitch_detector.hpp"

#include "fft_pitch_detector.hpp"
#include "hybrid_pitch_detector.hpp"
#include "mpm_pitch_detector.hpp"
#include "yin_pitch_detector.hpp"

#include <algorithm>
#include <cctype>

namespace harp {

std::unique_ptr<IPitchDetector> createPitchDetector(PitchAlgorithm algorithm, const DetectorConfig& config) {
    switch (algorithm) {
        case PitchAlgorithm::Mpm:
            return std::make_unique<dsp::MpmPitchDetector>(config);
        case PitchAlgorithm::Fft:
            return std::make_unique<dsp::FftPitchDetector>(config);
        case PitchAlgorithm::Hybrid:
            return std::make_unique<dsp::HybridPitchDetector>(config);
        case PitchAlgorithm::Yin:
        default:
            return std::make_unique<dsp::YinPitchDetector>(config);
    }
}

const char* pitch_algorithm_name(PitchAlgorithm algorithm) {
    switch (algorithm) {
        case PitchAlgorithm::Mpm: return "MPM";
        case PitchAlgorithm::Fft: return "FFT";
        case PitchAlgorithm::Hybrid: return "HYBRID";
        case PitchAlgorithm::Yin:
        default: return "YIN";
    }
}

PitchAlgorithm pitch_algorithm_from_name(const std::string& name) {
    std::string up = name;
    std::transform(up.begin(), up.end(), up.begin(), [](unsigned char c){ return (char)std::toupper(c); });
    if (up == "MPM") return PitchAlgorithm::Mpm;
    if (up == "FFT") return PitchAlgorithm::Fft;
    if (up == "HYBRID") return PitchAlgorithm::Hybrid;
    return PitchAlgorithm::Yin;
}

const std::vector<std::string>& supported_pitch_algorithms() {
    static const std::vector<std::string> names = {"YIN", "MPM", "FFT", "HYBRID"};
    return names;
}

} // namespace harp

#include "fft_pitch_detector.hpp"
#include "pitch_detection_utils.hpp"
#include "harp/fft/fft_utils.hpp"

#include <algorithm>
#include <cmath>

namespace harp::dsp {

static constexpr double kMinPeakThreshold = 0.1;
// Split between low notes (harmonic validation) and high notes (relaxed threshold)
static constexpr double kHighFrequencyHz = 300.0;
static constexpr double kTransitionHalfWidthHz = 25.0;

FftPitchDetector::FftPitchDetector(const DetectorConfig& config)
    : range_{config.min_frequency, config.max_frequency} {}

PitchResult FftPitchDetector::detect_pitch(const float* samples, int num_samples, int sample_rate) {
    if (!is_analyzable(samples, num_samples, sample_rate)) return {};
    if (range_.min_hz <= 0.0 || range_.max_hz <= range_.min_hz) return {};

    const int fft_size = std::max(kMinFftSize, fft::next_power_of_two(num_samples));
    fft::magnitude_spectrum(samples, num_samples, fft_size, work_, spectrum_);
    const double bin_hz = static_cast<double>(sample_rate) / fft_size;

    double mean = 0.0;
    for (double m : spectrum_) mean += m;
    mean /= static_cast<double>(spectrum_.size());

    const double multiplier = range_.max_hz > kHighFrequencyHz ? 1.2 : 1.5;
    const double threshold = std::max(kMinPeakThreshold, mean * multiplier);

    const int peak_bin = find_peak_bin(threshold, bin_hz);
    if (peak_bin < 0) return {};

    const double refined = parabolic_interpolation(spectrum_.data(), static_cast<int>(spectrum_.size()), peak_bin);
    const double frequency = refined * bin_hz;
    if (frequency < range_.min_hz || frequency > range_.max_hz) return {};

    // A very low range floor means the caller wants rough low notes; skip validation then.
    if (peak_bin * bin_hz < kHighFrequencyHz && range_.min_hz >= 100.0) {
        if (!validate_harmonics(peak_bin, bin_hz)) return {};
    }

    PitchResult r;
    r.pitch = frequency;
    r.confidence = std::min(1.0, spectrum_[peak_bin] / (mean + 1e-10) / 10.0);
    return r;
}

int FftPitchDetector::find_peak_bin(double threshold, double bin_hz) const {
    const int size = static_cast<int>(spectrum_.size());
    const int min_bin = static_cast<int>(std::ceil(range_.min_hz / bin_hz));
    const int max_bin = static_cast<int>(std::floor(range_.max_hz / bin_hz));
    const int high_bin = static_cast<int>(std::ceil(kHighFrequencyHz / bin_hz));
    const int transition_lo = static_cast<int>(std::ceil((kHighFrequencyHz - kTransitionHalfWidthHz) / bin_hz));
    const int transition_hi = static_cast<int>(std::ceil((kHighFrequencyHz + kTransitionHalfWidthHz) / bin_hz));

    const auto& s = spectrum_;
    double best = -1.0;
    int peak = -1;
    for (int i = std::max(1, min_bin); i < std::min(size - 1, max_bin); ++i) {
        const bool in_transition = i >= transition_lo && i <= transition_hi;
        double effective = threshold;
        if (i >= high_bin) effective *= 0.5;
        else if (in_transition) effective *= 0.7;

        const bool local_peak = s[i] > effective && s[i] > s[i - 1] && s[i] > s[i + 1];
        if (!local_peak || s[i] <= best) continue;
        if (in_transition) {
            // Transition band needs a peak that also clears its second neighbours.
            const bool strong = (i <= 1 || s[i] > s[i - 2] * 0.8) && (i >= size - 2 || s[i] > s[i + 2] * 0.8);
            if (!strong) continue;
        }
        best = s[i];
        peak = i;
    }
    return peak;
}

bool FftPitchDetector::validate_harmonics(int peak_bin, double bin_hz) const {
    const auto& s = spectrum_;
    const int size = static_cast<int>(s.size());
    const double fundamental = peak_bin * bin_hz;
    const double peak = s[peak_bin];

    // A strong subharmonic means we locked onto an overtone.
    if (peak_bin >= 4) {
        if (s[peak_bin / 2] > peak * 0.7) return false;
        if (s[peak_bin / 3] > peak * 0.6) return false;
    }

    if (fundamental >= kHighFrequencyHz - kTransitionHalfWidthHz &&
        fundamental <= kHighFrequencyHz + kTransitionHalfWidthHz) {
        const int h2 = peak_bin * 2;
        const int h3 = peak_bin * 3;
        const bool h2_ok = h2 < size && s[h2] >= peak * 0.15;
        const bool h3_ok = h3 < size && s[h3] >= peak * 0.1;
        return h2_ok || h3_ok;
    }

    int checked = 0;
    int valid = 0;
    for (int harmonic = 2; harmonic <= 4; ++harmonic) {
        const int bin = peak_bin * harmonic;
        if (bin >= size) break;
        ++checked;
        if (s[bin] >= peak * (0.2 / (harmonic - 1))) ++valid;
    }
    return checked > 0 && valid >= checked / 2.0;
}

} // namespace harp::dsp

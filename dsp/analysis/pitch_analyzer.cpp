#include "pitch_analyzer.hpp"
#include "dsp/pitch_detection_utils.hpp"
#include "harp/cents.hpp"

#include <iostream>

namespace harp::dsp {

// The detector listens one semitone beyond the harmonica's playable range.
static constexpr double kRangeMarginCents = 100.0;

PitchAnalyzer::PitchAnalyzer() : PitchAnalyzer(Config{}) {}

PitchAnalyzer::PitchAnalyzer(const Config& cfg)
    : notes_(cfg.concert_pitch_hz),
      detector_cfg_(cfg.detector),
      key_index_(cfg.key_index),
      tune_index_(cfg.tune_index),
      confidence_threshold_(cfg.confidence_threshold),
      harmonica_(Harmonica::create(cfg.key_index, cfg.tune_index, *notes_.table())),
      detector_(createPitchDetector(cfg.algorithm, cfg.detector)) {
    std::lock_guard<std::mutex> lock(mutex_);
    rebuild_locked();
}

void PitchAnalyzer::rebuild_locked() {
    auto table = notes_.table();
    harmonica_ = Harmonica::create(key_index_, tune_index_, *table);
    layout_ = HarpLayout(harmonica_, *table);
    const FrequencyRange playable = harmonica_.playable_range();
    if (playable.min_hz > 0.0 && playable.max_hz > playable.min_hz) {
        detector_->set_frequency_range({add_cents_to_frequency(-kRangeMarginCents, playable.min_hz),
                                        add_cents_to_frequency(kRangeMarginCents, playable.max_hz)});
    } else {
        detector_->set_frequency_range({detector_cfg_.min_frequency, detector_cfg_.max_frequency});
    }
}

AnalysisResult PitchAnalyzer::process(const float* samples, int num_samples, int sample_rate) {
    AnalysisResult out;
    out.volume = compute_rms(samples, num_samples);

    std::lock_guard<std::mutex> lock(mutex_);
    const PitchResult r = detector_->detect_pitch(samples, num_samples, sample_rate);
    out.raw_pitch = r.pitch;
    out.confidence = r.confidence;
    if (!r.detected() || r.confidence < confidence_threshold_) return out;

    out.pitch = r.pitch;
    auto table = notes_.table();
    out.note_name = table->note_name(out.pitch);
    if (out.note_name) {
        out.note_cents = get_cents(out.pitch, table->frequency(*out.note_name));
    }

    for (const auto& cell : layout_.cells()) {
        if (!harmonica_.is_note_active(cell.channel, cell.note, out.pitch)) continue;
        ActiveCell a;
        a.channel = cell.channel;
        a.note = cell.note;
        a.kind = cell.kind;
        a.note_name = cell.note_name;
        a.cents = harmonica_.cents_note(cell.channel, cell.note, out.pitch);
        // Inverse channels show the blow cell with negated cents.
        if (cell.note == 0 && harmonica_.has_inverse_cents_handling(cell.channel)) {
            a.cents = -a.cents;
        }
        out.active_cells.push_back(std::move(a));
    }
    return out;
}

void PitchAnalyzer::set_harmonica(int key_index, int tune_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    key_index_ = key_index;
    tune_index_ = tune_index;
    rebuild_locked();
}

void PitchAnalyzer::set_algorithm(PitchAlgorithm algorithm) {
    auto next = createPitchDetector(algorithm, detector_cfg_);
    std::lock_guard<std::mutex> lock(mutex_);
    detector_ = std::move(next);
    rebuild_locked();
}

void PitchAnalyzer::set_confidence(double threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    confidence_threshold_ = threshold;
}

bool PitchAnalyzer::set_confidence_by_index(int index) {
    const auto& values = supported_confidences();
    if (index < 0 || index >= static_cast<int>(values.size())) {
        std::cerr << "Ignoring confidence index " << index
                  << " (valid: 0.." << values.size() - 1 << ")" << std::endl;
        return false;
    }
    set_confidence(std::stod(values[index]));
    return true;
}

void PitchAnalyzer::set_concert_pitch(int hz) {
    notes_.set_concert_pitch(hz);
    std::lock_guard<std::mutex> lock(mutex_);
    rebuild_locked();
}

bool PitchAnalyzer::set_concert_pitch_by_index(int index) {
    if (!notes_.set_concert_pitch_by_index(index)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    rebuild_locked();
    return true;
}

Harmonica PitchAnalyzer::harmonica() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return harmonica_;
}

HarpLayout PitchAnalyzer::layout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return layout_;
}

PitchAlgorithm PitchAnalyzer::algorithm() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detector_->algorithm();
}

double PitchAnalyzer::confidence_threshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confidence_threshold_;
}

FrequencyRange PitchAnalyzer::detector_range() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detector_->frequency_range();
}

const std::vector<std::string>& PitchAnalyzer::supported_confidences() {
    static const std::vector<std::string> values = {
        "0.95", "0.90", "0.85", "0.80", "0.75", "0.70", "0.65", "0.60", "0.55", "0.50",
        "0.45", "0.40", "0.35", "0.30", "0.25", "0.20", "0.15", "0.10", "0.05"};
    return values;
}

} // namespace harp::dsp

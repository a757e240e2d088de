#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "harp/harmonica.hpp"
#include "harp/note_table.hpp"
#include "harp/pitch_detector.hpp"
#include "tuning/harp_layout.hpp"

namespace harp::dsp {

struct ActiveCell {
    int channel = 0;
    int note = 0;
    NoteKind kind = NoteKind::Blow;
    std::string note_name;
    double cents = 0.0; // deviation from the cell's expected frequency
};

struct AnalysisResult {
    double raw_pitch = kNoDetectedPitch;
    double confidence = 0.0;
    double volume = 0.0;                 // RMS of the block
    double pitch = kNoDetectedPitch;     // raw_pitch, or kNoDetectedPitch below the confidence gate
    std::optional<std::string> note_name;
    double note_cents = 0.0;             // deviation from the named note
    std::vector<ActiveCell> active_cells;

    bool has_pitch() const { return pitch != kNoDetectedPitch; }
};

// Detector -> confidence gate -> note name -> active harmonica cells.
// process() runs on the audio thread; setters may be called from any thread.
class PitchAnalyzer {
public:
    struct Config {
        int key_index = 4;               // C
        int tune_index = 6;              // RICHTER
        int concert_pitch_hz = NoteTable::kDefaultConcertPitch;
        PitchAlgorithm algorithm = PitchAlgorithm::Yin;
        double confidence_threshold = 0.95;
        DetectorConfig detector{};
    };

    PitchAnalyzer();
    explicit PitchAnalyzer(const Config& cfg);

    AnalysisResult process(const float* samples, int num_samples, int sample_rate);
    AnalysisResult process(const std::vector<float>& samples, int sample_rate) {
        return process(samples.data(), static_cast<int>(samples.size()), sample_rate);
    }

    void set_harmonica(int key_index, int tune_index);
    void set_algorithm(PitchAlgorithm algorithm);
    void set_confidence(double threshold);
    // Index into supported_confidences(); out-of-range indices are ignored.
    bool set_confidence_by_index(int index);
    void set_concert_pitch(int hz);
    bool set_concert_pitch_by_index(int index);

    Harmonica harmonica() const;
    HarpLayout layout() const;
    PitchAlgorithm algorithm() const;
    double confidence_threshold() const;
    int concert_pitch() const { return notes_.concert_pitch(); }
    FrequencyRange detector_range() const;

    // "0.95", "0.90", ... "0.05"
    static const std::vector<std::string>& supported_confidences();

private:
    void rebuild_locked();

    mutable std::mutex mutex_;
    NoteLookup notes_;
    DetectorConfig detector_cfg_;
    int key_index_;
    int tune_index_;
    double confidence_threshold_;
    Harmonica harmonica_;
    HarpLayout layout_;
    std::unique_ptr<IPitchDetector> detector_;
};

} // namespace harp::dsp

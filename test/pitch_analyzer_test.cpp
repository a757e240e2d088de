#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "harp/cents.hpp"
#include "dsp/analysis/pitch_analyzer.hpp"

using namespace harp;
using harp::dsp::AnalysisResult;
using harp::dsp::PitchAnalyzer;

namespace {

constexpr int kSampleRate = 44100;

std::vector<float> sine(double hz, int n = 4096) {
    std::vector<float> out(n);
    for (int i = 0; i < n; ++i) {
        out[i] = static_cast<float>(0.5 * std::sin(6.28318530717958647692 * hz * i / kSampleRate));
    }
    return out;
}

const dsp::ActiveCell* find_cell(const AnalysisResult& r, int channel, int note) {
    for (const auto& c : r.active_cells) {
        if (c.channel == channel && c.note == note) return &c;
    }
    return nullptr;
}

} // namespace

TEST(PitchAnalyzerTest, DefaultsToRichterCYin) {
    PitchAnalyzer analyzer;
    EXPECT_EQ(analyzer.harmonica().key(), Key::C);
    EXPECT_EQ(analyzer.harmonica().tune(), Tune::RICHTER);
    EXPECT_EQ(analyzer.algorithm(), PitchAlgorithm::Yin);
    EXPECT_DOUBLE_EQ(analyzer.confidence_threshold(), 0.95);
    EXPECT_EQ(analyzer.concert_pitch(), 440);
}

TEST(PitchAnalyzerTest, DetectorRangeFollowsHarmonica) {
    PitchAnalyzer analyzer;
    const FrequencyRange r = analyzer.detector_range();
    EXPECT_NEAR(r.min_hz, add_cents_to_frequency(-100.0, 261.626), 1e-6);
    EXPECT_NEAR(r.max_hz, add_cents_to_frequency(100.0, 2217.464), 1e-6);
}

TEST(PitchAnalyzerTest, DrawBendIsActiveFor440) {
    PitchAnalyzer analyzer;
    const AnalysisResult r = analyzer.process(sine(440.0), kSampleRate);
    ASSERT_TRUE(r.has_pitch());
    EXPECT_NEAR(r.pitch, 440.0, 4.4);
    EXPECT_GE(r.confidence, 0.95);
    EXPECT_NEAR(r.volume, 0.5 / std::sqrt(2.0), 0.01);
    EXPECT_EQ(r.note_name.value_or(""), "A4");
    EXPECT_LT(std::fabs(r.note_cents), 10.0);

    ASSERT_EQ(r.active_cells.size(), 1u);
    const auto& cell = r.active_cells.front();
    EXPECT_EQ(cell.channel, 3);
    EXPECT_EQ(cell.note, 3);
    EXPECT_EQ(cell.kind, NoteKind::DrawBend);
    EXPECT_EQ(cell.note_name, "A4");
    EXPECT_DOUBLE_EQ(cell.cents, analyzer.harmonica().cents_note(3, 3, r.pitch));
}

TEST(PitchAnalyzerTest, InverseBlowCentsAreNegated) {
    PitchAnalyzer analyzer;
    const AnalysisResult r = analyzer.process(sine(add_cents_to_frequency(20.0, 1046.5)), kSampleRate);
    ASSERT_TRUE(r.has_pitch());
    const dsp::ActiveCell* blow = find_cell(r, 7, 0);
    ASSERT_NE(blow, nullptr);
    EXPECT_EQ(blow->kind, NoteKind::Blow);
    EXPECT_DOUBLE_EQ(blow->cents, -analyzer.harmonica().cents_note(7, 0, r.pitch));
    EXPECT_LT(blow->cents, 0.0);
}

TEST(PitchAnalyzerTest, SilenceHasNoPitch) {
    PitchAnalyzer analyzer;
    std::vector<float> silence(4096, 0.0f);
    const AnalysisResult r = analyzer.process(silence, kSampleRate);
    EXPECT_FALSE(r.has_pitch());
    EXPECT_EQ(r.raw_pitch, kNoDetectedPitch);
    EXPECT_FALSE(r.note_name.has_value());
    EXPECT_TRUE(r.active_cells.empty());
    EXPECT_EQ(r.volume, 0.0);
}

TEST(PitchAnalyzerTest, ConfidenceGateKeepsRawPitch) {
    PitchAnalyzer analyzer;
    analyzer.set_confidence(1.01);
    const AnalysisResult r = analyzer.process(sine(440.0), kSampleRate);
    EXPECT_FALSE(r.has_pitch());
    EXPECT_NEAR(r.raw_pitch, 440.0, 4.4);
    EXPECT_TRUE(r.active_cells.empty());
}

TEST(PitchAnalyzerTest, ConfidenceList) {
    const auto& values = PitchAnalyzer::supported_confidences();
    ASSERT_EQ(values.size(), 19u);
    EXPECT_EQ(values.front(), "0.95");
    EXPECT_EQ(values.back(), "0.05");

    PitchAnalyzer analyzer;
    EXPECT_TRUE(analyzer.set_confidence_by_index(18));
    EXPECT_DOUBLE_EQ(analyzer.confidence_threshold(), 0.05);
    EXPECT_FALSE(analyzer.set_confidence_by_index(19));
    EXPECT_DOUBLE_EQ(analyzer.confidence_threshold(), 0.05);
}

TEST(PitchAnalyzerTest, Reconfiguration) {
    PitchAnalyzer analyzer;
    analyzer.set_harmonica(7, 6);
    EXPECT_EQ(analyzer.harmonica().key_name(), "E");
    ASSERT_NE(analyzer.layout().find(1, 0), nullptr);
    EXPECT_EQ(analyzer.layout().find(1, 0)->note_name, "E4");

    analyzer.set_algorithm(PitchAlgorithm::Mpm);
    EXPECT_EQ(analyzer.algorithm(), PitchAlgorithm::Mpm);
    const FrequencyRange r = analyzer.detector_range();
    EXPECT_NEAR(r.min_hz, add_cents_to_frequency(-100.0, analyzer.harmonica().playable_range().min_hz), 1e-6);

    analyzer.set_harmonica(4, 6);
    const AnalysisResult mpm = analyzer.process(sine(880.0), kSampleRate);
    ASSERT_TRUE(mpm.has_pitch());
    EXPECT_NE(find_cell(mpm, 6, 1), nullptr);
}

TEST(PitchAnalyzerTest, ConcertPitchRebuildsLayout) {
    PitchAnalyzer analyzer;
    analyzer.set_concert_pitch(442);
    EXPECT_EQ(analyzer.concert_pitch(), 442);
    ASSERT_NE(analyzer.layout().find(3, 3), nullptr);
    EXPECT_NEAR(analyzer.layout().find(3, 3)->frequency, 442.0, 0.01);

    EXPECT_TRUE(analyzer.set_concert_pitch_by_index(9));
    EXPECT_EQ(analyzer.concert_pitch(), 440);
    EXPECT_FALSE(analyzer.set_concert_pitch_by_index(40));
    EXPECT_EQ(analyzer.concert_pitch(), 440);
}

TEST(PitchAnalyzerTest, EveryAlgorithmFindsTheSameCell) {
    for (const auto& name : supported_pitch_algorithms()) {
        PitchAnalyzer::Config cfg;
        cfg.algorithm = pitch_algorithm_from_name(name);
        cfg.confidence_threshold = 0.5;
        PitchAnalyzer analyzer(cfg);
        const AnalysisResult r = analyzer.process(sine(659.253, 8192), kSampleRate);
        ASSERT_TRUE(r.has_pitch()) << name;
        EXPECT_NE(find_cell(r, 5, 0), nullptr) << name;
    }
}

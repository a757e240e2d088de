#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <limits>
#include <vector>

#include "harp/harmonica.hpp"
#include "harp/note_table.hpp"
#include "harp/pitch_detector.hpp"

using namespace harp;

namespace {

constexpr int kSampleRate = 44100;
constexpr double kTwoPi = 6.28318530717958647692;

std::vector<float> sine(double hz, int n, double amplitude = 0.5) {
    std::vector<float> out(n);
    for (int i = 0; i < n; ++i) out[i] = static_cast<float>(amplitude * std::sin(kTwoPi * hz * i / kSampleRate));
    return out;
}

// Fundamental plus 2nd and 3rd partials, like a reed.
std::vector<float> reed(double hz, int n) {
    std::vector<float> out(n);
    for (int i = 0; i < n; ++i) {
        const double t = kTwoPi * hz * i / kSampleRate;
        out[i] = static_cast<float>(0.5 * std::sin(t) + 0.25 * std::sin(2 * t) + 0.15 * std::sin(3 * t));
    }
    return out;
}

} // namespace

class DetectorAccuracyTest : public ::testing::TestWithParam<PitchAlgorithm> {};

TEST_P(DetectorAccuracyTest, Detects440WithinOnePercent) {
    auto detector = createPitchDetector(GetParam());
    const int n = GetParam() == PitchAlgorithm::Fft ? 8192 : 4096;
    const PitchResult r = detector->detect_pitch(sine(440.0, n), kSampleRate);
    ASSERT_TRUE(r.detected()) << pitch_algorithm_name(GetParam());
    EXPECT_NEAR(r.pitch, 440.0, 4.4);
    EXPECT_GT(r.confidence, 0.5);
    EXPECT_LE(r.confidence, 1.0);
}

TEST_P(DetectorAccuracyTest, SilenceAndDegenerateInput) {
    auto detector = createPitchDetector(GetParam());
    std::vector<float> zeros(4096, 0.0f);
    PitchResult r = detector->detect_pitch(zeros, kSampleRate);
    EXPECT_EQ(r.pitch, kNoDetectedPitch);
    EXPECT_EQ(r.confidence, 0.0);

    EXPECT_FALSE(detector->detect_pitch(nullptr, 4096, kSampleRate).detected());
    EXPECT_FALSE(detector->detect_pitch(sine(440.0, 3), kSampleRate).detected());
    EXPECT_FALSE(detector->detect_pitch(sine(440.0, 4096), 0).detected());

    auto broken = sine(440.0, 4096);
    broken[100] = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(detector->detect_pitch(broken, kSampleRate).detected());
}

TEST_P(DetectorAccuracyTest, ReportsAlgorithmAndDefaultRange) {
    auto detector = createPitchDetector(GetParam());
    EXPECT_EQ(detector->algorithm(), GetParam());
    EXPECT_DOUBLE_EQ(detector->frequency_range().min_hz, 80.0);
    EXPECT_DOUBLE_EQ(detector->frequency_range().max_hz, 4835.0);
}

INSTANTIATE_TEST_SUITE_P(AllAlgorithms, DetectorAccuracyTest,
                         ::testing::Values(PitchAlgorithm::Yin, PitchAlgorithm::Mpm,
                                           PitchAlgorithm::Fft, PitchAlgorithm::Hybrid));

TEST(PitchDetectorTest, YinAndMpmFollowRichterLayout) {
    NoteTable table;
    Harmonica h = Harmonica::create(Key::C, Tune::RICHTER, table);
    auto yin = createPitchDetector(PitchAlgorithm::Yin);
    auto mpm = createPitchDetector(PitchAlgorithm::Mpm);
    for (int ch = Harmonica::kChannelMin; ch <= Harmonica::kChannelMax; ++ch) {
        for (int note : h.playable_notes(ch)) {
            const double f = h.note_frequency(ch, note);
            const auto samples = sine(f, 4096);
            const PitchResult y = yin->detect_pitch(samples, kSampleRate);
            const PitchResult m = mpm->detect_pitch(samples, kSampleRate);
            EXPECT_NEAR(y.pitch, f, f * 0.01) << "YIN channel " << ch << " note " << note;
            EXPECT_NEAR(m.pitch, f, f * 0.01) << "MPM channel " << ch << " note " << note;
            EXPECT_TRUE(h.is_note_active(ch, note, y.pitch)) << "channel " << ch << " note " << note;
        }
    }
}

TEST(PitchDetectorTest, LowNotes) {
    auto yin = createPitchDetector(PitchAlgorithm::Yin);
    auto hybrid = createPitchDetector(PitchAlgorithm::Hybrid);
    for (double f : {98.0, 130.813, 196.0}) {
        EXPECT_NEAR(yin->detect_pitch(sine(f, 4096), kSampleRate).pitch, f, f * 0.01) << f;
        EXPECT_NEAR(hybrid->detect_pitch(sine(f, 4096), kSampleRate).pitch, f, f * 0.01) << f;
    }
}

TEST(PitchDetectorTest, RangeExcludesOutOfBandPitch) {
    auto yin = createPitchDetector(PitchAlgorithm::Yin);
    yin->set_frequency_range({500.0, 1000.0});
    EXPECT_DOUBLE_EQ(yin->frequency_range().min_hz, 500.0);
    EXPECT_FALSE(yin->detect_pitch(sine(440.0, 4096), kSampleRate).detected());
    EXPECT_NEAR(yin->detect_pitch(sine(660.0, 4096), kSampleRate).pitch, 660.0, 6.6);

    auto mpm = createPitchDetector(PitchAlgorithm::Mpm);
    mpm->set_frequency_range({500.0, 1000.0});
    EXPECT_NEAR(mpm->detect_pitch(sine(660.0, 4096), kSampleRate).pitch, 660.0, 6.6);
}

TEST(PitchDetectorTest, YinThresholdIsConfigurable) {
    DetectorConfig strict;
    strict.yin_threshold = 1e-12;
    auto yin = createPitchDetector(PitchAlgorithm::Yin, strict);
    EXPECT_FALSE(yin->detect_pitch(sine(440.0, 4096), kSampleRate).detected());
}

TEST(PitchDetectorTest, FftValidatesHarmonicsOfLowNotes) {
    // 40 bins of an 8192-point transform at 44.1 kHz
    const double f0 = 40.0 * kSampleRate / 8192.0;
    DetectorConfig cfg;
    cfg.min_frequency = 100.0;
    cfg.max_frequency = 1000.0;
    auto fft = createPitchDetector(PitchAlgorithm::Fft, cfg);

    EXPECT_FALSE(fft->detect_pitch(sine(f0, 8192), kSampleRate).detected());
    const PitchResult r = fft->detect_pitch(reed(f0, 8192), kSampleRate);
    ASSERT_TRUE(r.detected());
    EXPECT_NEAR(r.pitch, f0, 1.0);
}

TEST(PitchDetectorTest, FftDetectsHighNotes) {
    auto fft = createPitchDetector(PitchAlgorithm::Fft);
    const PitchResult r = fft->detect_pitch(sine(2093.0, 8192), kSampleRate);
    ASSERT_TRUE(r.detected());
    EXPECT_NEAR(r.pitch, 2093.0, 2093.0 * 0.01);
}

TEST(PitchDetectorTest, HybridGatesNoise) {
    auto hybrid = createPitchDetector(PitchAlgorithm::Hybrid);
    EXPECT_FALSE(hybrid->detect_pitch(sine(440.0, 4096, 0.001), kSampleRate).detected());
}

TEST(PitchDetectorTest, MpmIsFasterThanYin) {
    const auto samples = sine(440.0, 8192);
    auto yin = createPitchDetector(PitchAlgorithm::Yin);
    auto mpm = createPitchDetector(PitchAlgorithm::Mpm);
    yin->detect_pitch(samples, kSampleRate);
    mpm->detect_pitch(samples, kSampleRate);

    using Clock = std::chrono::steady_clock;
    auto t0 = Clock::now();
    for (int i = 0; i < 5; ++i) yin->detect_pitch(samples, kSampleRate);
    auto t1 = Clock::now();
    for (int i = 0; i < 5; ++i) mpm->detect_pitch(samples, kSampleRate);
    auto t2 = Clock::now();
    EXPECT_LT(t2 - t1, t1 - t0);
}

TEST(PitchDetectorTest, AlgorithmNames) {
    const auto& names = supported_pitch_algorithms();
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "YIN");
    EXPECT_EQ(pitch_algorithm_from_name("mpm"), PitchAlgorithm::Mpm);
    EXPECT_EQ(pitch_algorithm_from_name("Hybrid"), PitchAlgorithm::Hybrid);
    EXPECT_EQ(pitch_algorithm_from_name("FFT"), PitchAlgorithm::Fft);
    EXPECT_EQ(pitch_algorithm_from_name("zcr"), PitchAlgorithm::Yin);
    EXPECT_STREQ(pitch_algorithm_name(PitchAlgorithm::Hybrid), "HYBRID");
}

#include "harp/app_settings.hpp"
#include "harp/app_settings_io.hpp"
#include "harp/audio_input.hpp"
#include "harp/block_accumulator.hpp"
#include "harp/harmonica.hpp"
#include "harp/note_table.hpp"
#include "harp/pitch_detector.hpp"
#include "dsp/analysis/pitch_analyzer.hpp"
#include "tuning/harp_layout.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <signal.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace harp;

static std::atomic<bool> g_running(true);

static void signal_handler(int) { g_running = false; }

static void print_usage(const char* argv0) {
    std::cout << "Harmonica bending trainer (console)\n"
              << "Usage: " << argv0 << " [options]\n"
              << "  --key <name|index>     Harmonica key (default: C)\n"
              << "  --tune <name|index>    Tuning (default: RICHTER)\n"
              << "  --pitch <hz>           Concert pitch 431..446 (default: 440)\n"
              << "  --algorithm <name>     YIN, MPM, FFT or HYBRID (default: YIN)\n"
              << "  --confidence <value>   Minimum confidence 0.05..0.95 (default: 0.95)\n"
              << "  --device <name>        ALSA capture device (default: default)\n"
              << "  --config <path>        Load settings from a JSON file\n"
              << "  --save-config          Write the effective settings back to --config\n"
              << "  --simulate <hz>        Analyze a synthetic sine instead of the microphone\n"
              << "  --layout               Print the harmonica layout and exit\n"
              << "  --help                 Show this help\n";
}

// Index of value in list, or a numeric index when value is all digits; -1 if neither.
static int resolve_index(const std::string& value, const std::vector<std::string>& list) {
    for (size_t i = 0; i < list.size(); ++i) {
        if (list[i].size() != value.size()) continue;
        bool same = true;
        for (size_t c = 0; c < value.size(); ++c) {
            if (std::toupper(static_cast<unsigned char>(value[c])) != list[i][c]) { same = false; break; }
        }
        if (same) return static_cast<int>(i);
    }
    if (!value.empty() && value.find_first_not_of("0123456789") == std::string::npos) {
        int idx = std::atoi(value.c_str());
        if (idx >= 0 && idx < static_cast<int>(list.size())) return idx;
    }
    return -1;
}

static int nearest_confidence_index(double value) {
    const auto& list = dsp::PitchAnalyzer::supported_confidences();
    int best = 0;
    double best_diff = 1e9;
    for (size_t i = 0; i < list.size(); ++i) {
        double d = std::fabs(std::stod(list[i]) - value);
        if (d < best_diff) { best_diff = d; best = static_cast<int>(i); }
    }
    return best;
}

static void print_layout(const HarpLayout& layout, const Harmonica& harmonica) {
    std::cout << "Harmonica " << harmonica.key_name() << " " << harmonica.tune_name()
              << " (key " << std::fixed << std::setprecision(3) << harmonica.key_frequency() << " Hz)\n";
    for (int ch = Harmonica::kChannelMin; ch <= Harmonica::kChannelMax; ++ch) {
        std::cout << "  Ch " << std::setw(2) << ch << ":";
        for (const auto& cell : layout.cells_for_channel(ch)) {
            std::cout << "  " << note_kind_name(cell.kind) << " " << cell.note_name
                      << " " << std::setprecision(3) << cell.frequency;
        }
        std::cout << "\n";
    }
    const FrequencyRange r = harmonica.playable_range();
    std::cout << "  Range: " << r.min_hz << " .. " << r.max_hz << " Hz" << std::endl;
}

static std::string describe(const dsp::AnalysisResult& r) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << std::setw(8) << r.pitch << " Hz  " << std::setw(4) << r.note_name.value_or("--")
       << " " << std::showpos << std::setprecision(1) << r.note_cents << std::noshowpos << "c"
       << "  conf " << std::setprecision(2) << r.confidence;
    for (const auto& c : r.active_cells) {
        os << "  [" << c.channel << " " << note_kind_name(c.kind) << " "
           << std::showpos << std::setprecision(1) << c.cents << std::noshowpos << "c]";
    }
    return os.str();
}

static int run_simulation(dsp::PitchAnalyzer& analyzer, const AppSettings& st, double hz) {
    const int sr = st.sample_rate;
    const int block = st.buffer_size;
    std::vector<float> signal(static_cast<size_t>(sr));
    const double two_pi = 6.28318530717958647692;
    for (int i = 0; i < sr; ++i) {
        signal[i] = static_cast<float>(0.5 * std::sin(two_pi * hz * i / sr));
    }
    std::cout << "Simulating " << hz << " Hz sine, " << sr << " Hz, block " << block << "\n";
    BlockAccumulator acc(block, block / 4);
    int detected = 0;
    acc.push(signal.data(), static_cast<int>(signal.size()), [&](const float* data, int n) {
        auto r = analyzer.process(data, n, sr);
        if (r.has_pitch()) ++detected;
        std::cout << describe(r) << "\n";
    });
    std::cout << std::flush;
    return detected > 0 ? 0 : 2;
}

static int run_live(dsp::PitchAnalyzer& analyzer, const AppSettings& st) {
    AudioConfig cfg;
    cfg.device_name = st.device_name;
    cfg.sample_rate = static_cast<unsigned int>(st.sample_rate);
    cfg.block_size = static_cast<unsigned int>(st.buffer_size);
    cfg.period_size = static_cast<unsigned int>(std::max(64, st.buffer_size / 4));
    cfg.use_realtime_priority = st.realtime_priority;

    auto input = createAudioInput(cfg);
    std::mutex result_mutex;
    dsp::AnalysisResult latest;
    long long sequence = 0;
    input->set_process_callback([&](const float* data, int n, int sample_rate) {
        auto r = analyzer.process(data, n, sample_rate);
        std::lock_guard<std::mutex> lock(result_mutex);
        latest = std::move(r);
        ++sequence;
    });
    if (!input->start()) {
        std::cerr << "Failed to start audio input" << std::endl;
        return 1;
    }
    std::cout << "Listening on " << input->get_config().device_name << ". Press Ctrl+C to exit\n";

    long long shown = 0;
    std::string last_note;
    bool capture_failed = false;
    while (g_running.load()) {
        if (!input->is_running()) {
            std::cerr << "Audio capture stopped" << std::endl;
            capture_failed = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        dsp::AnalysisResult r;
        {
            std::lock_guard<std::mutex> lock(result_mutex);
            if (sequence == shown) continue;
            shown = sequence;
            r = latest;
        }
        if (!r.has_pitch()) {
            if (!last_note.empty()) { std::cout << "      --" << std::endl; last_note.clear(); }
            continue;
        }
        last_note = r.note_name.value_or("?");
        std::cout << describe(r) << std::endl;
    }
    input->stop();
    const auto stats = input->get_capture_stats();
    std::cout << "Blocks: " << stats.blocks << ", xruns: " << stats.xruns
              << ", slowest analysis: " << stats.max_callback_ms << " ms" << std::endl;
    return capture_failed ? 1 : 0;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);

    AppSettings st;
    std::string config_path;
    bool save_config = false;
    bool layout_only = false;
    double simulate_hz = 0.0;

    // Config file first so flags can override it.
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) config_path = argv[i + 1];
    }
    if (!config_path.empty() && !load_settings(config_path.c_str(), st)) {
        std::cerr << "Could not read settings from " << config_path << ", using defaults" << std::endl;
    }

    if (st.sample_rate <= 0 || st.buffer_size <= 0) {
        std::cerr << "Invalid sample_rate " << st.sample_rate << " or buffer_size " << st.buffer_size << std::endl;
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) { std::cerr << "Missing value for " << arg << std::endl; return false; }
            out = argv[++i];
            return true;
        };
        std::string value;
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--save-config") {
            save_config = true;
        } else if (arg == "--layout") {
            layout_only = true;
        } else if (arg == "--key") {
            if (!next(value)) return 1;
            int idx = resolve_index(value, Harmonica::supported_keys());
            if (idx < 0) std::cerr << "Unknown key " << value << ", keeping " << st.key_index << std::endl;
            else st.key_index = idx;
        } else if (arg == "--tune") {
            if (!next(value)) return 1;
            int idx = resolve_index(value, Harmonica::supported_tunes());
            if (idx < 0) std::cerr << "Unknown tune " << value << ", keeping " << st.tune_index << std::endl;
            else st.tune_index = idx;
        } else if (arg == "--pitch") {
            if (!next(value)) return 1;
            const auto& pitches = NoteLookup::supported_concert_pitches();
            int idx = -1;
            for (size_t p = 0; p < pitches.size(); ++p) if (pitches[p] == value) idx = static_cast<int>(p);
            if (idx < 0) std::cerr << "Unsupported concert pitch " << value << ", keeping index " << st.concert_pitch_index << std::endl;
            else st.concert_pitch_index = idx;
        } else if (arg == "--algorithm") {
            if (!next(value)) return 1;
            int idx = resolve_index(value, supported_pitch_algorithms());
            if (idx < 0) std::cerr << "Unknown algorithm " << value << ", using YIN" << std::endl;
            st.algorithm_index = idx < 0 ? 0 : idx;
        } else if (arg == "--confidence") {
            if (!next(value)) return 1;
            st.confidence_index = nearest_confidence_index(std::atof(value.c_str()));
        } else if (arg == "--device") {
            if (!next(value)) return 1;
            st.device_name = value;
        } else if (arg == "--simulate") {
            if (!next(value)) return 1;
            simulate_hz = std::atof(value.c_str());
            if (!(simulate_hz > 0.0)) { std::cerr << "Invalid --simulate frequency " << value << std::endl; return 1; }
        } else {
            std::cerr << "Unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (save_config) {
        if (config_path.empty()) {
            std::cerr << "--save-config needs --config <path>" << std::endl;
        } else if (!save_settings(config_path.c_str(), st)) {
            std::cerr << "Could not write settings to " << config_path << std::endl;
        } else {
            std::cout << "Settings saved to " << config_path << std::endl;
        }
    }

    dsp::PitchAnalyzer::Config cfg;
    cfg.key_index = st.key_index;
    cfg.tune_index = st.tune_index;
    const auto& algorithms = supported_pitch_algorithms();
    if (st.algorithm_index >= 0 && st.algorithm_index < static_cast<int>(algorithms.size())) {
        cfg.algorithm = pitch_algorithm_from_name(algorithms[st.algorithm_index]);
    }
    dsp::PitchAnalyzer analyzer(cfg);
    analyzer.set_concert_pitch_by_index(st.concert_pitch_index);
    analyzer.set_confidence_by_index(st.confidence_index);

    std::cout << "Concert pitch " << analyzer.concert_pitch() << " Hz, algorithm "
              << pitch_algorithm_name(analyzer.algorithm()) << ", confidence >= "
              << analyzer.confidence_threshold() << "\n";
    print_layout(analyzer.layout(), analyzer.harmonica());
    if (layout_only) return 0;

    if (simulate_hz > 0.0) return run_simulation(analyzer, st, simulate_hz);
    return run_live(analyzer, st);
}

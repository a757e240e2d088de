#include "harp/audio_input.hpp"
#include "harp/block_accumulator.hpp"

#include <alsa/asoundlib.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <pthread.h>
#include <sched.h>
#include <sys/mman.h>
#include <thread>
#include <vector>

namespace harp {

// Capture-capable PCM names: the configured one, "default", then plughw:/hw: hints.
static std::vector<std::string> capture_candidates(const std::string& preferred) {
    std::vector<std::string> candidates;
    if (!preferred.empty()) candidates.push_back(preferred);
    if (preferred != "default") candidates.push_back("default");

    void** hints = nullptr;
    if (snd_device_name_hint(-1, "pcm", &hints) != 0 || !hints) return candidates;
    std::vector<std::string> plughw;
    std::vector<std::string> hw;
    for (void** n = hints; *n != nullptr; ++n) {
        char* name = snd_device_name_get_hint(*n, "NAME");
        char* ioid = snd_device_name_get_hint(*n, "IOID");
        // NULL IOID means the device does both directions
        if (name && (!ioid || std::strcmp(ioid, "Input") == 0)) {
            std::string s(name);
            if (s.rfind("plughw:", 0) == 0) plughw.push_back(s);
            else if (s.rfind("hw:", 0) == 0) hw.push_back(s);
        }
        std::free(name);
        std::free(ioid);
    }
    snd_device_name_free_hint(hints);
    candidates.insert(candidates.end(), plughw.begin(), plughw.end());
    candidates.insert(candidates.end(), hw.begin(), hw.end());
    return candidates;
}

class AlsaAudioInput : public IAudioInput {
public:
    explicit AlsaAudioInput(const AudioConfig& cfg)
        : config_(cfg), accumulator_(static_cast<int>(cfg.block_size), static_cast<int>(cfg.period_size)) {}

    ~AlsaAudioInput() override { stop(); }

    bool start() override {
        if (running_.load()) return true;
        // A capture thread that stopped on a read error still needs joining.
        stop();
        if (!open_device() || !configure_hw()) {
            close_device();
            return false;
        }
        accumulator_ = BlockAccumulator(static_cast<int>(config_.block_size), static_cast<int>(config_.period_size));
        running_ = true;
        capture_thread_ = std::thread(&AlsaAudioInput::capture_loop, this);
        if (config_.use_realtime_priority) set_realtime_priority();
        return true;
    }

    void stop() override {
        running_ = false;
        if (capture_thread_.joinable()) capture_thread_.join();
        close_device();
    }

    bool is_running() const override { return running_.load(); }

    void set_process_callback(ProcessCallback callback) override { callback_ = std::move(callback); }

    const AudioConfig& get_config() const override { return config_; }

    CaptureStats get_capture_stats() const override {
        CaptureStats s;
        s.blocks = blocks_.load();
        s.xruns = xruns_.load();
        s.max_callback_ms = max_callback_ms_.load();
        return s;
    }

private:
    bool open_device() {
        const auto candidates = capture_candidates(config_.device_name);
        for (const auto& dev : candidates) {
            if (snd_pcm_open(&pcm_, dev.c_str(), SND_PCM_STREAM_CAPTURE, 0) == 0) {
                if (dev != config_.device_name) {
                    std::cout << "Using capture device: " << dev << std::endl;
                    config_.device_name = dev;
                }
                return true;
            }
        }
        pcm_ = nullptr;
        std::cerr << "Cannot open any audio capture device. Last tried: "
                  << (candidates.empty() ? std::string("<none>") : candidates.back()) << std::endl;
        return false;
    }

    bool check(int err, const char* what) {
        if (err >= 0) return true;
        std::cerr << "Cannot " << what << ": " << snd_strerror(err) << std::endl;
        return false;
    }

    bool configure_hw() {
        snd_pcm_hw_params_t* hw;
        snd_pcm_hw_params_alloca(&hw);

        if (!check(snd_pcm_hw_params_any(pcm_, hw), "initialize hardware parameters")) return false;
        if (!check(snd_pcm_hw_params_set_access(pcm_, hw, SND_PCM_ACCESS_RW_INTERLEAVED), "set access type")) return false;

        format_ = SND_PCM_FORMAT_FLOAT_LE;
        if (snd_pcm_hw_params_set_format(pcm_, hw, format_) < 0) {
            format_ = SND_PCM_FORMAT_S16_LE;
            if (!check(snd_pcm_hw_params_set_format(pcm_, hw, format_), "set format")) return false;
        }
        if (!check(snd_pcm_hw_params_set_channels(pcm_, hw, 1), "set mono capture")) return false;

        unsigned int rate = config_.sample_rate;
        if (!check(snd_pcm_hw_params_set_rate_near(pcm_, hw, &rate, nullptr), "set sample rate")) return false;
        snd_pcm_uframes_t period = config_.period_size;
        if (!check(snd_pcm_hw_params_set_period_size_near(pcm_, hw, &period, nullptr), "set period size")) return false;
        unsigned int periods = config_.num_periods;
        if (!check(snd_pcm_hw_params_set_periods_near(pcm_, hw, &periods, nullptr), "set periods")) return false;

        if (!check(snd_pcm_hw_params(pcm_, hw), "set hardware parameters")) return false;
        if (!check(snd_pcm_prepare(pcm_), "prepare audio interface")) return false;

        snd_pcm_hw_params_get_period_size(hw, &period, nullptr);
        snd_pcm_hw_params_get_rate(hw, &rate, nullptr);
        if (rate != config_.sample_rate) {
            std::cout << "Sample rate adjusted to " << rate << " Hz" << std::endl;
        }
        config_.sample_rate = rate;
        config_.period_size = static_cast<unsigned int>(period);

        std::cout << "ALSA configured: " << rate << " Hz, "
                  << period << " frames/period, "
                  << config_.block_size << " frames/block ("
                  << (1000.0f * config_.block_size / rate) << " ms)"
                  << (format_ == SND_PCM_FORMAT_S16_LE ? ", S16" : ", float") << std::endl;
        return true;
    }

    void close_device() {
        if (pcm_) {
            snd_pcm_close(pcm_);
            pcm_ = nullptr;
        }
    }

    void deliver(const float* input, int frames) {
        const int rate = static_cast<int>(config_.sample_rate);
        accumulator_.push(input, frames, [&](const float* block, int n) {
            if (!callback_) return;
            auto t0 = std::chrono::steady_clock::now();
            callback_(block, n, rate);
            float ms = std::chrono::duration<float, std::milli>(std::chrono::steady_clock::now() - t0).count();
            if (ms > max_callback_ms_.load()) max_callback_ms_.store(ms);
            blocks_.fetch_add(1);
        });
    }

    void capture_loop() {
        if (config_.use_realtime_priority) mlockall(MCL_CURRENT | MCL_FUTURE);

        const snd_pcm_uframes_t period = config_.period_size;
        std::vector<float> buffer_f(period);
        std::vector<int16_t> buffer_s16;
        if (format_ == SND_PCM_FORMAT_S16_LE) buffer_s16.resize(period);

        while (running_.load()) {
            snd_pcm_sframes_t frames;
            if (format_ == SND_PCM_FORMAT_FLOAT_LE) {
                frames = snd_pcm_readi(pcm_, buffer_f.data(), period);
            } else {
                frames = snd_pcm_readi(pcm_, buffer_s16.data(), period);
            }

            if (frames == -EPIPE) {
                xruns_.fetch_add(1);
                snd_pcm_prepare(pcm_);
                continue;
            }
            if (frames == -EAGAIN) continue;
            if (frames < 0) {
                std::cerr << "Read error: " << snd_strerror(static_cast<int>(frames)) << std::endl;
                running_ = false;
                break;
            }
            if (format_ == SND_PCM_FORMAT_S16_LE) {
                const float scale = 1.0f / 32768.0f;
                for (snd_pcm_sframes_t i = 0; i < frames; ++i) buffer_f[i] = buffer_s16[i] * scale;
            }
            deliver(buffer_f.data(), static_cast<int>(frames));
        }

        if (config_.use_realtime_priority) munlockall();
    }

    void set_realtime_priority() {
        sched_param param{};
        param.sched_priority = sched_get_priority_max(SCHED_FIFO) - 1;
        if (pthread_setschedparam(capture_thread_.native_handle(), SCHED_FIFO, &param) != 0) {
            std::cerr << "Warning: Could not set realtime priority. Run with sudo or configure limits.conf" << std::endl;
        }
    }

    AudioConfig config_;
    snd_pcm_t* pcm_ = nullptr;
    snd_pcm_format_t format_ = SND_PCM_FORMAT_FLOAT_LE;
    std::atomic<bool> running_{false};
    std::thread capture_thread_;
    ProcessCallback callback_;
    BlockAccumulator accumulator_;

    std::atomic<long long> blocks_{0};
    std::atomic<int> xruns_{0};
    std::atomic<float> max_callback_ms_{0.0f};
};

std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config) {
    return std::make_unique<AlsaAudioInput>(config);
}

} // namespace harp

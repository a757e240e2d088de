#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace harp {

struct AudioConfig {
    std::string device_name = "default";
    unsigned int sample_rate = 44100;
    unsigned int period_size = 1024;  // frames per read, also the analysis hop
    unsigned int num_periods = 4;
    unsigned int block_size = 4096;   // frames handed to the callback
    bool use_realtime_priority = false;
};

class IAudioInput {
public:
    // Called from the capture thread with block_size mono frames.
    using ProcessCallback = std::function<void(const float* input, int num_samples, int sample_rate)>;

    virtual ~IAudioInput() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    virtual void set_process_callback(ProcessCallback callback) = 0;
    virtual const AudioConfig& get_config() const = 0;

    struct CaptureStats {
        long long blocks = 0;
        int xruns = 0;
        float max_callback_ms = 0.0f;
    };
    virtual CaptureStats get_capture_stats() const = 0;
};

// Factory that returns the active platform backend
std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config);

} // namespace harp

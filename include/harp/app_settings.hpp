#pragma once

#include <string>

namespace harp {

struct AppSettings {
    // Harmonica selection (indices into the supported lists)
    int key_index = 4;             // C
    int tune_index = 6;            // RICHTER
    int concert_pitch_index = 9;   // 440 Hz

    // Detection
    int algorithm_index = 0;       // YIN
    int confidence_index = 0;      // 0.95

    // Audio capture
    int sample_rate = 44100;
    int buffer_size = 4096;        // analysis block in frames
    std::string device_name = "default";
    bool realtime_priority = false;
};

} // namespace harp

#include "harp/app_settings.hpp"
#include "harp/app_settings_io.hpp"
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cstring>

namespace harp {

// Minimal JSON (hand-rolled). Expects the flat file save_settings writes.
static bool parse_key_value(const char* s, const char* key, int& out) {
    const char* p = std::strstr(s, key);
    if (!p) return false;
    p = std::strchr(p, ':'); if (!p) return false; ++p;
    char* end = nullptr;
    long v = std::strtol(p, &end, 10);
    if (end == p) return false;
    out = static_cast<int>(v);
    return true;
}
// Sizes and rates must be positive; anything else keeps the current value.
static bool parse_positive(const char* s, const char* key, int& out) {
    int v = 0;
    if (!parse_key_value(s, key, v) || v <= 0) return false;
    out = v;
    return true;
}
static bool parse_key_value(const char* s, const char* key, bool& out) {
    const char* p = std::strstr(s, key);
    if (!p) return false;
    p = std::strchr(p, ':'); if (!p) return false; ++p;
    while (*p == ' ' || *p == '\t') ++p;
    if (std::strncmp(p, "true", 4) == 0) { out = true; return true; }
    if (std::strncmp(p, "false", 5) == 0) { out = false; return true; }
    return false;
}
static bool parse_key_value(const char* s, const char* key, std::string& out) {
    const char* p = std::strstr(s, key);
    if (!p) return false;
    p = std::strchr(p, ':'); if (!p) return false; ++p;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '"') return false;
    ++p;
    const char* start = p;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') ++p;
    out.assign(start, p - start);
    return true;
}

bool load_settings(const char* path, AppSettings& st) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<20) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(buf.data(), 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;

    const char* s = buf.c_str();
    parse_key_value(s, "\"key_index\"", st.key_index);
    parse_key_value(s, "\"tune_index\"", st.tune_index);
    parse_key_value(s, "\"concert_pitch_index\"", st.concert_pitch_index);
    parse_key_value(s, "\"algorithm_index\"", st.algorithm_index);
    parse_key_value(s, "\"confidence_index\"", st.confidence_index);
    parse_positive(s, "\"sample_rate\"", st.sample_rate);
    parse_positive(s, "\"buffer_size\"", st.buffer_size);
    parse_key_value(s, "\"device_name\"", st.device_name);
    parse_key_value(s, "\"realtime_priority\"", st.realtime_priority);
    return true;
}

bool save_settings(const char* path, const AppSettings& st) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    const int written = std::fprintf(f,
        "{\n"
        "  \"key_index\": %d,\n"
        "  \"tune_index\": %d,\n"
        "  \"concert_pitch_index\": %d,\n"
        "  \"algorithm_index\": %d,\n"
        "  \"confidence_index\": %d,\n"
        "  \"sample_rate\": %d,\n"
        "  \"buffer_size\": %d,\n"
        "  \"device_name\": \"%s\",\n"
        "  \"realtime_priority\": %s\n"
        "}\n",
        st.key_index,
        st.tune_index,
        st.concert_pitch_index,
        st.algorithm_index,
        st.confidence_index,
        st.sample_rate,
        st.buffer_size,
        st.device_name.c_str(),
        st.realtime_priority ? "true" : "false");
    const bool closed = std::fclose(f) == 0;
    return written > 0 && closed;
}

} // namespace harp

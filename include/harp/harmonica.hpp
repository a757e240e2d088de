#pragma once

#include <array>
#include <string>
#include <vector>

#include "harp/note_table.hpp"

namespace harp {

// Index order is stable: settings files store these indices.
enum class Key {
    A, A_FLAT, B, B_FLAT, C, D, D_FLAT, E, E_FLAT, F, F_HASH, G, HA_FLAT, HB_FLAT, HG,
    LA, LA_FLAT, LB, LB_FLAT, LC, LD, LD_FLAT, LE, LE_FLAT, LF, LF_HASH, LG, LLE, LLF, LLF_HASH
};

enum class Tune {
    COUNTRY, DIMINISHED, HARMONICMOLL, MELODYMAKER, NATURALMOLL, PADDYRICHTER, RICHTER, CIRCULAR, AUGMENTED
};

struct FrequencyRange {
    double min_hz = 0.0;
    double max_hz = 0.0;
};

// Ten-channel diatonic harmonica.
//
// Note offsets per channel:
//    0       blow
//    1       draw
//    2..4    draw bends (2 is the overdraw where blow > draw)
//   -1..-3   blow bends (-1 is the overblow where draw > blow)
class Harmonica {
public:
    static constexpr int kChannelMin = 1;
    static constexpr int kChannelMax = 10;
    static constexpr int kNoteMin = -3;
    static constexpr int kNoteMax = 4;

    using HalfTones = std::array<int, kChannelMax + 1>; // index 0 unused

    Harmonica(Key key, Tune tune, double key_frequency);

    static Harmonica create(Key key, Tune tune, const NoteTable& table);
    // Unknown indices/names fall back to Richter tuning and key C.
    static Harmonica create(int key_index, int tune_index, const NoteTable& table);
    static Harmonica create(const std::string& key_name, const std::string& tune_name, const NoteTable& table);

    double note_frequency(int channel, int note) const;
    double note_frequency_minimum(int channel, int note) const;
    double note_frequency_maximum(int channel, int note) const;
    bool is_note_active(int channel, int note, double frequency) const;
    // get_cents(frequency, note_frequency(channel, note))
    double cents_note(int channel, int note, double frequency) const;

    bool has_inverse_cents_handling(int channel) const;
    bool is_overblow(int channel, int note) const;
    bool is_overdraw(int channel, int note) const;

    int draw_bending_tones_count(int channel) const;
    int blow_bending_tones_count(int channel) const;

    // Unbent reed frequencies (not rounded)
    double channel_in_frequency(int channel) const;
    double channel_out_frequency(int channel) const;

    // Offsets playable on a channel in display order: blow, draw, draw bends,
    // blow bends, then the overblow or overdraw slot.
    std::vector<int> playable_notes(int channel) const;

    // Lowest bend to highest overblow/overdraw over all channels.
    FrequencyRange playable_range() const;

    Key key() const { return key_; }
    Tune tune() const { return tune_; }
    double key_frequency() const { return key_frequency_; }
    std::string key_name() const;
    std::string tune_name() const;

    const HalfTones& half_tones_in() const { return *half_tones_in_; }
    const HalfTones& half_tones_out() const { return *half_tones_out_; }

    static const std::vector<std::string>& supported_keys();
    static const std::vector<std::string>& supported_tunes();
    // Note name ("C4", "G#3", ...) a key is pitched at.
    static const char* key_note_name(Key key);

private:
    static bool valid_channel(int channel) { return channel >= kChannelMin && channel <= kChannelMax; }
    double overblow_overdraw_frequency(int channel) const;

    Key key_;
    Tune tune_;
    double key_frequency_;
    const HalfTones* half_tones_in_;
    const HalfTones* half_tones_out_;
};

} // namespace harp

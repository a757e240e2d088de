#include "harp/harmonica.hpp"
#include "harp/cents.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace harp {

namespace {

using HalfTones = Harmonica::HalfTones;

// Half-tone offsets from the key root per channel (index 0 unused).
const HalfTones kRichterIn      = {0, 2, 7, 11, 14, 17, 21, 23, 26, 29, 33};
const HalfTones kRichterOut     = {0, 0, 4, 7, 12, 16, 19, 24, 28, 31, 36};
const HalfTones kCountryIn      = {0, 2, 7, 11, 14, 18, 21, 23, 26, 29, 33};
const HalfTones kCountryOut     = {0, 0, 4, 7, 12, 16, 19, 24, 28, 31, 36};
const HalfTones kDiminishedIn   = {0, 2, 5, 8, 11, 14, 17, 20, 23, 26, 29};
const HalfTones kDiminishedOut  = {0, 0, 3, 6, 9, 12, 15, 18, 21, 24, 27};
const HalfTones kHarmonicMollIn = {0, 2, 7, 11, 14, 17, 20, 23, 26, 29, 32};
const HalfTones kHarmonicMollOut= {0, 0, 3, 7, 12, 15, 19, 24, 27, 31, 36};
const HalfTones kPaddyRichterIn = {0, 2, 7, 11, 14, 17, 21, 23, 26, 29, 33};
const HalfTones kPaddyRichterOut= {0, 0, 4, 9, 12, 16, 19, 24, 28, 31, 36};
const HalfTones kMelodyMakerIn  = {0, 2, 7, 11, 14, 18, 21, 23, 26, 29, 33};
const HalfTones kMelodyMakerOut = {0, 0, 4, 9, 12, 16, 19, 24, 28, 31, 36};
const HalfTones kNaturalMollIn  = {0, 2, 7, 10, 14, 17, 21, 22, 26, 29, 33};
const HalfTones kNaturalMollOut = {0, 0, 3, 7, 12, 15, 19, 24, 27, 31, 36};
const HalfTones kCircularIn     = {0, 2, 5, 9, 12, 16, 19, 22, 26, 29, 33};
const HalfTones kCircularOut    = {0, 0, 4, 7, 10, 14, 17, 21, 24, 28, 31};
const HalfTones kAugmentedIn    = {0, 3, 7, 11, 15, 19, 23, 27, 31, 35, 39};
const HalfTones kAugmentedOut   = {0, 0, 4, 8, 12, 16, 20, 24, 28, 32, 36};

struct KeyInfo { Key key; const char* name; const char* note; };

const KeyInfo kKeys[] = {
    {Key::A, "A", "A3"},               {Key::A_FLAT, "A_FLAT", "G#3"},
    {Key::B, "B", "B3"},               {Key::B_FLAT, "B_FLAT", "A#3"},
    {Key::C, "C", "C4"},               {Key::D, "D", "D4"},
    {Key::D_FLAT, "D_FLAT", "C#4"},    {Key::E, "E", "E4"},
    {Key::E_FLAT, "E_FLAT", "D#4"},    {Key::F, "F", "F4"},
    {Key::F_HASH, "F_HASH", "F#4"},    {Key::G, "G", "G3"},
    {Key::HA_FLAT, "HA_FLAT", "G#4"},  {Key::HB_FLAT, "HB_FLAT", "A#4"},
    {Key::HG, "HG", "G4"},             {Key::LA, "LA", "A2"},
    {Key::LA_FLAT, "LA_FLAT", "G#2"},  {Key::LB, "LB", "B2"},
    {Key::LB_FLAT, "LB_FLAT", "A#2"},  {Key::LC, "LC", "C3"},
    {Key::LD, "LD", "D3"},             {Key::LD_FLAT, "LD_FLAT", "C#3"},
    {Key::LE, "LE", "E3"},             {Key::LE_FLAT, "LE_FLAT", "D#3"},
    {Key::LF, "LF", "F3"},             {Key::LF_HASH, "LF_HASH", "F#3"},
    {Key::LG, "LG", "G2"},             {Key::LLE, "LLE", "E2"},
    {Key::LLF, "LLF", "F2"},           {Key::LLF_HASH, "LLF_HASH", "F#2"},
};

struct TuneInfo { Tune tune; const char* name; const HalfTones* in; const HalfTones* out; };

const TuneInfo kTunes[] = {
    {Tune::COUNTRY,      "COUNTRY",      &kCountryIn,       &kCountryOut},
    {Tune::DIMINISHED,   "DIMINISHED",   &kDiminishedIn,    &kDiminishedOut},
    {Tune::HARMONICMOLL, "HARMONICMOLL", &kHarmonicMollIn,  &kHarmonicMollOut},
    {Tune::MELODYMAKER,  "MELODYMAKER",  &kMelodyMakerIn,   &kMelodyMakerOut},
    {Tune::NATURALMOLL,  "NATURALMOLL",  &kNaturalMollIn,   &kNaturalMollOut},
    {Tune::PADDYRICHTER, "PADDYRICHTER", &kPaddyRichterIn,  &kPaddyRichterOut},
    {Tune::RICHTER,      "RICHTER",      &kRichterIn,       &kRichterOut},
    {Tune::CIRCULAR,     "CIRCULAR",     &kCircularIn,      &kCircularOut},
    {Tune::AUGMENTED,    "AUGMENTED",    &kAugmentedIn,     &kAugmentedOut},
};

constexpr int kKeyCount = static_cast<int>(sizeof(kKeys) / sizeof(kKeys[0]));
constexpr int kTuneCount = static_cast<int>(sizeof(kTunes) / sizeof(kTunes[0]));

const TuneInfo& tune_info(Tune tune) {
    for (const auto& t : kTunes) if (t.tune == tune) return t;
    return kTunes[static_cast<int>(Tune::RICHTER)];
}

const KeyInfo& key_info(Key key) {
    for (const auto& k : kKeys) if (k.key == key) return k;
    return kKeys[static_cast<int>(Key::C)];
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::toupper(c); });
    return s;
}

} // namespace

Harmonica::Harmonica(Key key, Tune tune, double key_frequency)
    : key_(key), tune_(tune), key_frequency_(key_frequency) {
    const auto& t = tune_info(tune);
    half_tones_in_ = t.in;
    half_tones_out_ = t.out;
}

Harmonica Harmonica::create(Key key, Tune tune, const NoteTable& table) {
    return Harmonica(key, tune, table.frequency(key_info(key).note));
}

Harmonica Harmonica::create(int key_index, int tune_index, const NoteTable& table) {
    Key key = Key::C;
    Tune tune = Tune::RICHTER;
    if (key_index >= 0 && key_index < kKeyCount) {
        key = kKeys[key_index].key;
    } else {
        std::cerr << "Unknown key index " << key_index << ", using C" << std::endl;
    }
    if (tune_index >= 0 && tune_index < kTuneCount) {
        tune = kTunes[tune_index].tune;
    } else {
        std::cerr << "Unknown tune index " << tune_index << ", using RICHTER" << std::endl;
    }
    return create(key, tune, table);
}

Harmonica Harmonica::create(const std::string& key_name, const std::string& tune_name, const NoteTable& table) {
    const std::string k = upper(key_name);
    const std::string t = upper(tune_name);
    int key_index = -1;
    int tune_index = -1;
    for (int i = 0; i < kKeyCount; ++i) if (k == kKeys[i].name) { key_index = i; break; }
    for (int i = 0; i < kTuneCount; ++i) if (t == kTunes[i].name) { tune_index = i; break; }
    return create(key_index, tune_index, table);
}

double Harmonica::channel_in_frequency(int channel) const {
    if (!valid_channel(channel)) return 0.0;
    return add_cents_to_frequency(half_tones_in()[channel] * 100.0, key_frequency_);
}

double Harmonica::channel_out_frequency(int channel) const {
    if (!valid_channel(channel)) return 0.0;
    return add_cents_to_frequency(half_tones_out()[channel] * 100.0, key_frequency_);
}

bool Harmonica::has_inverse_cents_handling(int channel) const {
    if (!valid_channel(channel)) return false;
    return round3(channel_out_frequency(channel)) > round3(channel_in_frequency(channel));
}

bool Harmonica::is_overblow(int channel, int note) const {
    return note == -1 && valid_channel(channel) && !has_inverse_cents_handling(channel);
}

bool Harmonica::is_overdraw(int channel, int note) const {
    return note == 2 && valid_channel(channel) && has_inverse_cents_handling(channel);
}

double Harmonica::overblow_overdraw_frequency(int channel) const {
    const double reed = has_inverse_cents_handling(channel) ? channel_out_frequency(channel)
                                                            : channel_in_frequency(channel);
    return add_cents_to_frequency(100.0, reed);
}

double Harmonica::note_frequency(int channel, int note) const {
    if (!valid_channel(channel) || note < kNoteMin || note > kNoteMax) return 0.0;
    if (is_overblow(channel, note) || is_overdraw(channel, note)) {
        return round3(overblow_overdraw_frequency(channel));
    }
    if (note == 0) return round3(channel_out_frequency(channel));
    if (note == 1) return round3(channel_in_frequency(channel));

    // Walk from the unbent reed one semitone per step, rounding every step.
    // An overblow/overdraw slot met on the way restarts from its own pitch.
    const int step = note > 1 ? 1 : -1;
    int current = note > 1 ? 1 : 0;
    double frequency = note_frequency(channel, current);
    while (current != note) {
        current += step;
        if (is_overblow(channel, current) || is_overdraw(channel, current)) {
            frequency = round3(overblow_overdraw_frequency(channel));
        } else {
            frequency = round3(add_cents_to_frequency(-100.0, frequency));
        }
    }
    return frequency;
}

double Harmonica::note_frequency_minimum(int channel, int note) const {
    return add_cents_to_frequency(-50.0, note_frequency(channel, note));
}

double Harmonica::note_frequency_maximum(int channel, int note) const {
    return add_cents_to_frequency(50.0, note_frequency(channel, note));
}

bool Harmonica::is_note_active(int channel, int note, double frequency) const {
    const double expected = note_frequency(channel, note);
    if (expected <= 0.0) return false;
    const double lower = add_cents_to_frequency(-50.0, expected);
    const double upper = add_cents_to_frequency(50.0, expected);
    return frequency >= lower && frequency <= upper;
}

double Harmonica::cents_note(int channel, int note, double frequency) const {
    return get_cents(frequency, note_frequency(channel, note));
}

int Harmonica::draw_bending_tones_count(int channel) const {
    if (!valid_channel(channel)) return 0;
    return std::max(0, half_tones_in()[channel] - half_tones_out()[channel] - 1);
}

int Harmonica::blow_bending_tones_count(int channel) const {
    if (!valid_channel(channel)) return 0;
    return std::max(0, half_tones_out()[channel] - half_tones_in()[channel] - 1);
}

std::vector<int> Harmonica::playable_notes(int channel) const {
    std::vector<int> notes;
    if (!valid_channel(channel)) return notes;
    notes.push_back(0);
    notes.push_back(1);
    const int draw_bends = draw_bending_tones_count(channel);
    for (int note = 2; note < 2 + draw_bends; ++note) notes.push_back(note);
    const int blow_bends = blow_bending_tones_count(channel);
    for (int note = -blow_bends; note < 0; ++note) notes.push_back(note);
    if (has_inverse_cents_handling(channel)) {
        notes.push_back(2);
    } else {
        notes.push_back(-1);
    }
    return notes;
}

FrequencyRange Harmonica::playable_range() const {
    FrequencyRange r;
    bool first = true;
    for (int channel = kChannelMin; channel <= kChannelMax; ++channel) {
        for (int note : playable_notes(channel)) {
            const double f = note_frequency(channel, note);
            if (f <= 0.0) continue;
            if (first) { r.min_hz = r.max_hz = f; first = false; continue; }
            r.min_hz = std::min(r.min_hz, f);
            r.max_hz = std::max(r.max_hz, f);
        }
    }
    return r;
}

std::string Harmonica::key_name() const {
    return key_info(key_).name;
}

std::string Harmonica::tune_name() const {
    return tune_info(tune_).name;
}

const char* Harmonica::key_note_name(Key key) {
    return key_info(key).note;
}

const std::vector<std::string>& Harmonica::supported_keys() {
    static const std::vector<std::string> keys = [] {
        std::vector<std::string> v;
        for (const auto& k : kKeys) v.emplace_back(k.name);
        return v;
    }();
    return keys;
}

const std::vector<std::string>& Harmonica::supported_tunes() {
    static const std::vector<std::string> tunes = [] {
        std::vector<std::string> v;
        for (const auto& t : kTunes) v.emplace_back(t.name);
        return v;
    }();
    return tunes;
}

} // namespace harp

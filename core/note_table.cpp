#include "harp/note_table.hpp"
#include "harp/cents.hpp"

#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace harp {

static const char* kPitchClassNames[12] = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

// Equal-tempered C0..B8 at A4 = 440 Hz; other concert pitches are derived by a cents shift.
static const double kFrequencies440[NoteTable::kNoteCount] = {
    16.3516, 17.3239, 18.354, 19.4454, 20.6017, 21.8268, 23.1247, 24.4997, 25.9565, 27.5, 29.1352, 30.8677,
    32.7032, 34.6478, 36.7081, 38.8909, 41.2034, 43.6535, 46.2493, 48.9994, 51.9131, 55.0, 58.2705, 61.7354,
    65.4064, 69.2957, 73.4162, 77.7817, 82.4069, 87.3071, 92.4986, 97.9989, 103.826, 110.0, 116.541, 123.471,
    130.813, 138.591, 146.832, 155.563, 164.814, 174.614, 184.997, 195.998, 207.652, 220.0, 233.082, 246.942,
    261.626, 277.183, 293.665, 311.127, 329.628, 349.228, 369.994, 391.995, 415.305, 440.0, 466.164, 493.883,
    523.251, 554.365, 587.33, 622.254, 659.255, 698.456, 739.989, 783.991, 830.609, 880.0, 932.328, 987.767,
    1046.5, 1108.73, 1174.66, 1244.51, 1318.51, 1396.91, 1479.98, 1567.98, 1661.22, 1760.0, 1864.66, 1975.53,
    2093.0, 2217.46, 2349.32, 2489.02, 2637.02, 2793.83, 2959.96, 3135.96, 3322.44, 3520.0, 3729.31, 3951.07,
    4186.01, 4434.92, 4698.64, 4978.03, 5274.04, 5587.65, 5919.91, 6271.93, 6644.88, 7040.0, 7458.62, 7902.13
};

static std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\n\r");
    size_t b = s.find_last_not_of(" \t\n\r");
    if (a == std::string::npos) return std::string();
    return s.substr(a, b - a + 1);
}

static int letter_semitone(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'C': return 0;
        case 'D': return 2;
        case 'E': return 4;
        case 'F': return 5;
        case 'G': return 7;
        case 'A': return 9;
        case 'B': return 11;
        default: return -1;
    }
}

NoteTable::NoteTable(int concert_pitch_hz) : concert_pitch_(concert_pitch_hz) {
    const double shift = get_cents(concert_pitch_hz, 440.0);
    notes_.reserve(kNoteCount);
    for (int i = 0; i < kNoteCount; ++i) {
        Note n;
        n.name = std::string(kPitchClassNames[i % 12]) + std::to_string(kLowestOctave + i / 12);
        n.frequency = round3(add_cents_to_frequency(shift, kFrequencies440[i]));
        notes_.push_back(std::move(n));
    }
}

int NoteTable::parse_note_index(const std::string& name) {
    const std::string s = trim(name);
    if (s.empty()) {
        throw std::invalid_argument("note name must not be empty");
    }
    const int letter = letter_semitone(s[0]);
    if (letter < 0) {
        throw std::invalid_argument("invalid note letter in '" + s + "'");
    }
    size_t pos = 1;
    int accidental = 0;
    if (pos < s.size() && s[pos] == '#') { accidental = 1; ++pos; }
    else if (pos < s.size() && (s[pos] == 'b' || s[pos] == 'B')) { accidental = -1; ++pos; }

    if (pos >= s.size()) {
        throw std::invalid_argument("missing octave in note name '" + s + "'");
    }
    int octave = 0;
    for (size_t i = pos; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            throw std::invalid_argument("invalid octave in note name '" + s + "'");
        }
        octave = octave * 10 + (s[i] - '0');
        if (octave > kHighestOctave) break;
    }
    if (octave < kLowestOctave || octave > kHighestOctave) {
        throw std::invalid_argument("octave out of range [0,8] in note name '" + s + "'");
    }
    const int index = (octave - kLowestOctave) * 12 + letter + accidental;
    if (index < 0 || index >= kNoteCount) {
        throw std::invalid_argument("note '" + s + "' lies outside C0..B8");
    }
    return index;
}

double NoteTable::frequency(const std::string& name) const {
    return notes_[parse_note_index(name)].frequency;
}

std::optional<Note> NoteTable::note(const std::string& name) const {
    try {
        return notes_[parse_note_index(name)];
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

std::optional<std::string> NoteTable::note_name(double frequency) const {
    if (!(frequency > 0.0) || !std::isfinite(frequency)) return std::nullopt;
    // Compare in Hz so a frequency built with add_cents_to_frequency(+-50) lands inside.
    for (const auto& n : notes_) {
        if (frequency >= add_cents_to_frequency(-kMatchWindowCents, n.frequency) &&
            frequency <= add_cents_to_frequency(kMatchWindowCents, n.frequency)) {
            return n.name;
        }
    }
    return std::nullopt;
}

NoteLookup::NoteLookup(int concert_pitch_hz)
    : table_(std::make_shared<const NoteTable>(concert_pitch_hz)) {}

void NoteLookup::set_concert_pitch(int hz) {
    // Build outside the lock; only the swap is serialized.
    auto next = std::make_shared<const NoteTable>(hz);
    std::lock_guard<std::mutex> lock(mutex_);
    table_ = std::move(next);
}

bool NoteLookup::set_concert_pitch_by_index(int index) {
    const auto& pitches = supported_concert_pitches();
    if (index < 0 || index >= static_cast<int>(pitches.size())) {
        std::cerr << "Ignoring concert pitch index " << index
                  << " (valid: 0.." << pitches.size() - 1 << ")" << std::endl;
        return false;
    }
    set_concert_pitch(std::stoi(pitches[index]));
    return true;
}

int NoteLookup::concert_pitch() const {
    return table()->concert_pitch();
}

std::string NoteLookup::concert_pitch_name() const {
    return std::to_string(concert_pitch());
}

std::shared_ptr<const NoteTable> NoteLookup::table() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
}

const std::vector<std::string>& NoteLookup::supported_concert_pitches() {
    static const std::vector<std::string> pitches = {
        "431", "432", "433", "434", "435", "436", "437", "438",
        "439", "440", "441", "442", "443", "444", "445", "446"};
    return pitches;
}

} // namespace harp

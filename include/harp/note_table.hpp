#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace harp {

struct Note {
    std::string name;       // e.g. "C#4"
    double frequency = 0.0; // Hz
};

// Immutable chromatic table C0..B8 for one concert pitch.
// Entries are ordered by ascending frequency.
class NoteTable {
public:
    static constexpr int kDefaultConcertPitch = 440;
    static constexpr int kLowestOctave = 0;
    static constexpr int kHighestOctave = 8;
    static constexpr int kNoteCount = (kHighestOctave - kLowestOctave + 1) * 12;
    static constexpr double kMatchWindowCents = 50.0;

    explicit NoteTable(int concert_pitch_hz = kDefaultConcertPitch);

    int concert_pitch() const { return concert_pitch_; }
    const std::vector<Note>& notes() const { return notes_; }

    // Frequency for a note name such as "A4", " c#3", "Db4".
    // Throws std::invalid_argument for empty/unparsable names or octaves outside 0..8.
    double frequency(const std::string& name) const;

    // Name of the first entry within [-50, +50] cents of frequency, if any.
    std::optional<std::string> note_name(double frequency) const;

    // Entry for a name, std::nullopt when the name is not valid.
    std::optional<Note> note(const std::string& name) const;

    // Index into notes() for a note name; throws like frequency().
    static int parse_note_index(const std::string& name);

private:
    int concert_pitch_;
    std::vector<Note> notes_;
};

// Shared tuning reference. Holds the current NoteTable snapshot and replaces
// it atomically when the concert pitch changes; readers keep whatever snapshot
// they took.
class NoteLookup {
public:
    explicit NoteLookup(int concert_pitch_hz = NoteTable::kDefaultConcertPitch);

    void set_concert_pitch(int hz);
    // Index into supported_concert_pitches(); out-of-range indices are ignored.
    bool set_concert_pitch_by_index(int index);

    int concert_pitch() const;
    std::string concert_pitch_name() const;

    std::shared_ptr<const NoteTable> table() const;

    double frequency(const std::string& name) const { return table()->frequency(name); }
    std::optional<std::string> note_name(double frequency) const { return table()->note_name(frequency); }

    static const std::vector<std::string>& supported_concert_pitches();

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const NoteTable> table_;
};

} // namespace harp

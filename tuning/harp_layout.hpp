#pragma once

#include <string>
#include <vector>

#include "harp/harmonica.hpp"
#include "harp/note_table.hpp"

namespace harp {

enum class NoteKind { Blow, Draw, DrawBend, BlowBend, Overblow, Overdraw };

const char* note_kind_name(NoteKind kind);

struct NoteCell {
    int channel = 0;
    int note = 0;             // offset as used by Harmonica::note_frequency
    NoteKind kind = NoteKind::Blow;
    double frequency = 0.0;   // expected, Hz
    std::string note_name;    // e.g. "D#4"
};

// Playable cells of one harmonica, channel by channel. Rebuilt whenever key,
// tune or concert pitch change; cheap enough to do from the UI thread.
class HarpLayout {
public:
    HarpLayout() = default;
    HarpLayout(const Harmonica& harmonica, const NoteTable& table);

    const std::vector<NoteCell>& cells() const { return cells_; }
    std::vector<NoteCell> cells_for_channel(int channel) const;
    const NoteCell* find(int channel, int note) const;
    bool empty() const { return cells_.empty(); }

private:
    std::vector<NoteCell> cells_;
};

} // namespace harp

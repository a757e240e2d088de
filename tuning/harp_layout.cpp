#include "harp_layout.hpp"

#include <iostream>

namespace harp {

const char* note_kind_name(NoteKind kind) {
    switch (kind) {
        case NoteKind::Blow: return "blow";
        case NoteKind::Draw: return "draw";
        case NoteKind::DrawBend: return "draw bend";
        case NoteKind::BlowBend: return "blow bend";
        case NoteKind::Overblow: return "overblow";
        case NoteKind::Overdraw: return "overdraw";
    }
    return "?";
}

static NoteKind classify(const Harmonica& harmonica, int channel, int note) {
    if (harmonica.is_overblow(channel, note)) return NoteKind::Overblow;
    if (harmonica.is_overdraw(channel, note)) return NoteKind::Overdraw;
    if (note == 0) return NoteKind::Blow;
    if (note == 1) return NoteKind::Draw;
    return note > 1 ? NoteKind::DrawBend : NoteKind::BlowBend;
}

HarpLayout::HarpLayout(const Harmonica& harmonica, const NoteTable& table) {
    for (int channel = Harmonica::kChannelMin; channel <= Harmonica::kChannelMax; ++channel) {
        for (int note : harmonica.playable_notes(channel)) {
            NoteCell cell;
            cell.channel = channel;
            cell.note = note;
            cell.kind = classify(harmonica, channel, note);
            cell.frequency = harmonica.note_frequency(channel, note);
            auto name = table.note_name(cell.frequency);
            if (!name) {
                std::cerr << "No note name for channel " << channel << " note " << note
                          << " (" << cell.frequency << " Hz), skipping" << std::endl;
                continue;
            }
            cell.note_name = *name;
            cells_.push_back(std::move(cell));
        }
    }
}

std::vector<NoteCell> HarpLayout::cells_for_channel(int channel) const {
    std::vector<NoteCell> out;
    for (const auto& c : cells_) {
        if (c.channel == channel) out.push_back(c);
    }
    return out;
}

const NoteCell* HarpLayout::find(int channel, int note) const {
    for (const auto& c : cells_) {
        if (c.channel == channel && c.note == note) return &c;
    }
    return nullptr;
}

} // namespace harp

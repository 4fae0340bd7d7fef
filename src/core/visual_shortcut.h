#pragma once

#include "core/key_chord.h"
#include "core/keyboard_action.h"

namespace chordkit
{
// Presentation layer over the canonical catalog. Adds the hints a declarative
// UI needs (standard cancel action, right-to-left mirroring) without changing
// the catalog itself.

enum class Mirroring : std::uint8_t
{
    Automatic,        // horizontal arrows flip in right-to-left layouts
    WithoutMirroring, // physical direction is kept (media transport)
};

struct VisualShortcut
{
    KeyChord  chord;
    Mirroring mirroring = Mirroring::Automatic;
    bool      is_cancel_action = false;
};

VisualShortcut VisualShortcutFor(KeyboardAction action);

// The chord the user actually presses for `shortcut` in the given layout
// direction.
KeyChord EffectiveChord(const VisualShortcut& shortcut, bool right_to_left);

const char* MirroringName(Mirroring m);

} // namespace chordkit

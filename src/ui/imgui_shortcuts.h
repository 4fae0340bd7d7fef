#pragma once

#include "core/command.h"
#include "core/key_chord.h"
#include "core/keyboard_action.h"

#include "imgui.h"

#include <optional>
#include <vector>

namespace chordkit::ui
{
// Dear ImGui adapter for chordkit chords.
//
// - Resolves the symbolic Primary modifier for the target platform.
// - Matching requires the exact modifier set (Ctrl+Shift+Z does not fire Ctrl+Z).
// - Return also matches keypad Enter.

ImGuiKey ToImGuiKey(const KeyTrigger& trigger);

// ImGuiMod_* | ImGuiKey_*; ImGuiKey_None if the trigger has no ImGui key.
ImGuiKeyChord ToImGuiKeyChord(const KeyChord& chord, Platform platform);

bool IsChordPressed(const KeyChord& chord, Platform platform, bool repeat = false);

// Catalog action pressed this frame, honouring right-to-left mirroring.
bool ActionPressed(KeyboardAction action, Platform platform, bool right_to_left);

// First command in `commands` whose chord was pressed this frame.
std::optional<CommandDescriptor> PressedCommand(const std::vector<CommandDescriptor>& commands, Platform platform);

// Shortcut list shown while the primary modifier is held for `hold_seconds`.
// Call once per frame after the host's windows.
void DrawShortcutOverlay(const std::vector<CommandDescriptor>& commands, Platform platform,
                         float hold_seconds = 0.6f);

} // namespace chordkit::ui

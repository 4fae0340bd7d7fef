#pragma once

#include "core/command.h"
#include "core/key_chord.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chordkit
{
// Standard keyboard actions with canonical key equivalents.
//
// Every action except `Cancel` uses the primary shortcut modifier (Command on
// macOS, Control elsewhere). `Reply` and `Refresh` share Primary+R, see
// FindChordCollisions().
enum class KeyboardAction : std::uint8_t
{
    Cancel,           // Escape, no modifiers
    Close,            // Primary+W
    Done,             // Primary+Return
    Save,             // Primary+S
    Share,            // Primary+I
    Edit,             // Primary+E
    New,              // Primary+N
    Reply,            // Primary+R
    Refresh,          // Primary+R
    Bookmarks,        // Primary+B
    Search,           // Primary+F
    Delete,           // Primary+Delete
    Today,            // Primary+T
    ZoomIn,           // Primary+=
    ZoomOut,          // Primary+-
    ZoomToActualSize, // Primary+0
    Rewind,           // Primary+Left
    FastForward,      // Primary+Right
};

inline constexpr std::size_t kKeyboardActionCount = 18;

// Declaration order.
const std::array<KeyboardAction, kKeyboardActionCount>& AllKeyboardActions();

// Canonical key equivalent. Total over KeyboardAction.
KeyChord KeyEquivalent(KeyboardAction action);

// Stable snake_case id ("zoom_to_actual_size").
const char* ActionId(KeyboardAction action);
std::optional<KeyboardAction> ActionFromId(std::string_view id);

// English developer-facing name ("Zoom to Actual Size"). Not localized.
const char* ActionDisplayName(KeyboardAction action);

// Command for registering `action` with a host; handler-key is the action ordinal.
CommandDescriptor ActionCommand(KeyboardAction action, std::optional<std::string> label = std::nullopt);

// Resolves a handler-key produced by ActionCommand() back to its action.
std::optional<KeyboardAction> ActionFromHandler(HandlerKey handler);

// Actions whose key equivalent is `chord` once Primary is resolved for
// `platform`, in declaration order. "Primary+W" and "Ctrl+W" both find Close
// on Linux.
std::vector<KeyboardAction> ActionsForChord(const KeyChord& chord, Platform platform);

// Every unordered pair of distinct actions with identical key equivalents,
// in declaration order.
std::vector<std::pair<KeyboardAction, KeyboardAction>> FindChordCollisions();

} // namespace chordkit

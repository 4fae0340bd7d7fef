#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace chordkit
{
// Platform-neutral key chord model.
//
// - `ModifierFlags::Primary` is symbolic: it stands for the platform's
//   conventional shortcut modifier and is only resolved to Super/Control by
//   ResolvePrimaryModifier().
// - Character triggers are stored lower-case; named keys cover the non-printing
//   keys used by the action catalog.

enum class Platform : std::uint8_t
{
    Any = 0,
    Windows,
    Linux,
    MacOS,
};

enum class ModifierFlags : std::uint8_t
{
    None       = 0,
    Primary    = 1 << 0,
    Shift      = 1 << 1,
    Alt        = 1 << 2,
    Control    = 1 << 3,
    Super      = 1 << 4,
    NumericPad = 1 << 5,
    CapsLock   = 1 << 6,
};

constexpr ModifierFlags operator|(ModifierFlags a, ModifierFlags b)
{
    return (ModifierFlags)((std::uint8_t)a | (std::uint8_t)b);
}

constexpr ModifierFlags operator&(ModifierFlags a, ModifierFlags b)
{
    return (ModifierFlags)((std::uint8_t)a & (std::uint8_t)b);
}

constexpr ModifierFlags& operator|=(ModifierFlags& a, ModifierFlags b)
{
    a = a | b;
    return a;
}

constexpr bool Has(ModifierFlags set, ModifierFlags flag)
{
    return (set & flag) == flag && flag != ModifierFlags::None;
}

constexpr bool IsEmpty(ModifierFlags set)
{
    return set == ModifierFlags::None;
}

enum class NamedKey : std::uint8_t
{
    None = 0, // trigger is a character
    Escape,
    Return,
    Delete,
    Tab,
    Space,
    LeftArrow,
    RightArrow,
    UpArrow,
    DownArrow,
};

struct KeyTrigger
{
    NamedKey named     = NamedKey::None;
    char     character = 0;

    static KeyTrigger Character(char c);
    static KeyTrigger Named(NamedKey k) { KeyTrigger t; t.named = k; return t; }

    bool IsCharacter() const { return named == NamedKey::None; }

    bool operator==(const KeyTrigger&) const = default;
};

struct KeyChord
{
    ModifierFlags modifiers = ModifierFlags::None;
    KeyTrigger    trigger;

    bool operator==(const KeyChord&) const = default;
};

// Runtime platform (compile-time best effort).
Platform RuntimePlatform();

// "any", "windows", "linux", "macos". Unknown strings map to Platform::Any.
Platform PlatformFromString(std::string_view s);
const char* PlatformName(Platform p);

// Replaces the symbolic Primary flag with Super on macOS and Control elsewhere.
ModifierFlags ResolvePrimaryModifier(ModifierFlags modifiers, Platform platform);

// Stable lower-case token for a named key ("escape", "left", ...).
const char* NamedKeyToken(NamedKey k);

// Human-readable chord text after resolving Primary for `platform`,
// e.g. "Cmd+W", "Ctrl+W", "Esc", "Ctrl+Left".
std::string FormatChord(const KeyChord& chord, Platform platform);

// Glyph rendering in the macOS menu style ("⌘W", "⎋", "⌘←"). Other platforms
// fall back to FormatChord().
std::string FormatChordSymbols(const KeyChord& chord, Platform platform);

// Parses a chord string like "Primary+R" or "Ctrl+Shift+Z".
// Returns false on parse error (err contains human-readable message).
bool ParseChordString(const std::string& chord, KeyChord& out, std::string& err);

} // namespace chordkit

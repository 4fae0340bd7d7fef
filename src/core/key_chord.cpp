#include "core/key_chord.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <vector>

namespace chordkit
{
namespace
{
constexpr std::string_view kWhitespace = " \t\r\n";

static std::string_view TrimView(std::string_view s)
{
    const size_t first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
        return {};
    return s.substr(first, s.find_last_not_of(kWhitespace) - first + 1);
}

static std::string Lowered(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

struct TokenEntry
{
    std::string_view token;
    ModifierFlags    modifier;
    KeyTrigger       trigger;
};

// Lower-case spellings accepted by ParseChordString(). Entries with a
// modifier are modifiers; the rest name a key.
static constexpr TokenEntry kTokens[] = {
    {"primary", ModifierFlags::Primary, {}},
    {"mod", ModifierFlags::Primary, {}},
    {"ctrl", ModifierFlags::Control, {}},
    {"control", ModifierFlags::Control, {}},
    {"shift", ModifierFlags::Shift, {}},
    {"alt", ModifierFlags::Alt, {}},
    {"option", ModifierFlags::Alt, {}},
    {"super", ModifierFlags::Super, {}},
    {"meta", ModifierFlags::Super, {}},
    {"win", ModifierFlags::Super, {}},
    {"cmd", ModifierFlags::Super, {}},
    {"command", ModifierFlags::Super, {}},
    {"capslock", ModifierFlags::CapsLock, {}},
    {"keypad", ModifierFlags::NumericPad, {}},
    {"numpad", ModifierFlags::NumericPad, {}},

    {"escape", ModifierFlags::None, {.named = NamedKey::Escape}},
    {"esc", ModifierFlags::None, {.named = NamedKey::Escape}},
    {"return", ModifierFlags::None, {.named = NamedKey::Return}},
    {"enter", ModifierFlags::None, {.named = NamedKey::Return}},
    {"delete", ModifierFlags::None, {.named = NamedKey::Delete}},
    {"del", ModifierFlags::None, {.named = NamedKey::Delete}},
    {"backspace", ModifierFlags::None, {.named = NamedKey::Delete}},
    {"tab", ModifierFlags::None, {.named = NamedKey::Tab}},
    {"space", ModifierFlags::None, {.named = NamedKey::Space}},
    {"left", ModifierFlags::None, {.named = NamedKey::LeftArrow}},
    {"right", ModifierFlags::None, {.named = NamedKey::RightArrow}},
    {"up", ModifierFlags::None, {.named = NamedKey::UpArrow}},
    {"down", ModifierFlags::None, {.named = NamedKey::DownArrow}},
    {"minus", ModifierFlags::None, {.character = '-'}},
    {"equal", ModifierFlags::None, {.character = '='}},
    {"plus", ModifierFlags::None, {.character = '+'}},
    {"comma", ModifierFlags::None, {.character = ','}},
    {"period", ModifierFlags::None, {.character = '.'}},
    {"dot", ModifierFlags::None, {.character = '.'}},
};

static const TokenEntry* FindToken(std::string_view lower)
{
    for (const TokenEntry& e : kTokens)
    {
        if (e.token == lower)
            return &e;
    }
    return nullptr;
}

// "Ctrl+Shift+Z" -> {"Ctrl", "Shift", "Z"}. A '+' where a token should start
// is the plus key itself, so "Ctrl++" -> {"Ctrl", "+"}.
static std::vector<std::string_view> ChordTokens(std::string_view s)
{
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (pos < s.size())
    {
        if (s[pos] == '+')
        {
            tokens.push_back(s.substr(pos, 1));
            pos += 2;
            continue;
        }
        const size_t sep = s.find('+', pos);
        tokens.push_back(s.substr(pos, sep == std::string_view::npos ? std::string_view::npos : sep - pos));
        if (sep == std::string_view::npos)
            break;
        pos = sep + 1;
    }
    return tokens;
}

static std::string TriggerText(const KeyTrigger& t)
{
    switch (t.named)
    {
        case NamedKey::None:
        {
            const char c = t.character;
            if (c >= 'a' && c <= 'z')
                return std::string(1, (char)std::toupper((unsigned char)c));
            return std::string(1, c);
        }
        case NamedKey::Escape: return "Esc";
        case NamedKey::Return: return "Return";
        case NamedKey::Delete: return "Delete";
        case NamedKey::Tab: return "Tab";
        case NamedKey::Space: return "Space";
        case NamedKey::LeftArrow: return "Left";
        case NamedKey::RightArrow: return "Right";
        case NamedKey::UpArrow: return "Up";
        case NamedKey::DownArrow: return "Down";
    }
    return {};
}

static std::string TriggerSymbol(const KeyTrigger& t)
{
    switch (t.named)
    {
        case NamedKey::None: return TriggerText(t);
        case NamedKey::Escape: return "⎋";
        case NamedKey::Return: return "↩";
        case NamedKey::Delete: return "⌫";
        case NamedKey::Tab: return "⇥";
        case NamedKey::Space: return "Space";
        case NamedKey::LeftArrow: return "←";
        case NamedKey::RightArrow: return "→";
        case NamedKey::UpArrow: return "↑";
        case NamedKey::DownArrow: return "↓";
    }
    return {};
}
} // namespace

KeyTrigger KeyTrigger::Character(char c)
{
    KeyTrigger t;
    t.character = (char)std::tolower((unsigned char)c);
    return t;
}

Platform RuntimePlatform()
{
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

Platform PlatformFromString(std::string_view s)
{
    const std::string pl = Lowered(s);
    if (pl == "windows") return Platform::Windows;
    if (pl == "linux") return Platform::Linux;
    if (pl == "macos") return Platform::MacOS;
    return Platform::Any;
}

const char* PlatformName(Platform p)
{
    switch (p)
    {
        case Platform::Any: return "any";
        case Platform::Windows: return "windows";
        case Platform::Linux: return "linux";
        case Platform::MacOS: return "macos";
    }
    return "any";
}

ModifierFlags ResolvePrimaryModifier(ModifierFlags modifiers, Platform platform)
{
    if (!Has(modifiers, ModifierFlags::Primary))
        return modifiers;
    const ModifierFlags rest = (ModifierFlags)((std::uint8_t)modifiers & ~(std::uint8_t)ModifierFlags::Primary);
    return rest | (platform == Platform::MacOS ? ModifierFlags::Super : ModifierFlags::Control);
}

const char* NamedKeyToken(NamedKey k)
{
    switch (k)
    {
        case NamedKey::None: return "";
        case NamedKey::Escape: return "escape";
        case NamedKey::Return: return "return";
        case NamedKey::Delete: return "delete";
        case NamedKey::Tab: return "tab";
        case NamedKey::Space: return "space";
        case NamedKey::LeftArrow: return "left";
        case NamedKey::RightArrow: return "right";
        case NamedKey::UpArrow: return "up";
        case NamedKey::DownArrow: return "down";
    }
    return "";
}

std::string FormatChord(const KeyChord& chord, Platform platform)
{
    const ModifierFlags m = ResolvePrimaryModifier(chord.modifiers, platform);
    const bool mac = (platform == Platform::MacOS);

    std::string out;
    if (Has(m, ModifierFlags::Control)) out += "Ctrl+";
    if (Has(m, ModifierFlags::Alt)) out += mac ? "Option+" : "Alt+";
    if (Has(m, ModifierFlags::Shift)) out += "Shift+";
    if (Has(m, ModifierFlags::Super)) out += mac ? "Cmd+" : "Super+";
    if (Has(m, ModifierFlags::CapsLock)) out += "CapsLock+";
    if (Has(m, ModifierFlags::NumericPad)) out += "Keypad+";
    out += TriggerText(chord.trigger);
    return out;
}

std::string FormatChordSymbols(const KeyChord& chord, Platform platform)
{
    if (platform != Platform::MacOS)
        return FormatChord(chord, platform);

    // Menu order: control, option, shift, command.
    const ModifierFlags m = ResolvePrimaryModifier(chord.modifiers, platform);
    std::string out;
    if (Has(m, ModifierFlags::Control)) out += "⌃";
    if (Has(m, ModifierFlags::Alt)) out += "⌥";
    if (Has(m, ModifierFlags::Shift)) out += "⇧";
    if (Has(m, ModifierFlags::Super)) out += "⌘";
    if (Has(m, ModifierFlags::CapsLock)) out += "⇪";
    out += TriggerSymbol(chord.trigger);
    return out;
}

bool ParseChordString(const std::string& chord, KeyChord& out, std::string& err)
{
    err.clear();
    out = KeyChord{};

    const std::string_view text = TrimView(chord);
    if (text.empty())
    {
        err = "empty chord";
        return false;
    }

    ModifierFlags mods = ModifierFlags::None;
    std::optional<KeyTrigger> key;

    for (const std::string_view raw : ChordTokens(text))
    {
        std::string_view tok = TrimView(raw);
        if (tok.empty())
            tok = "+";

        std::optional<KeyTrigger> trigger;
        if (tok.size() == 1 && (std::isalnum((unsigned char)tok[0]) || std::ispunct((unsigned char)tok[0])))
        {
            trigger = KeyTrigger::Character(tok[0]);
        }
        else if (const TokenEntry* e = FindToken(Lowered(tok)))
        {
            if (!IsEmpty(e->modifier))
            {
                mods |= e->modifier;
                continue;
            }
            trigger = e->trigger;
        }
        else
        {
            err = "unknown key token '" + std::string(tok) + "'";
            return false;
        }

        if (key.has_value())
        {
            err = "multiple keys in chord '" + chord + "'";
            return false;
        }
        key = trigger;
    }

    if (!key.has_value())
    {
        err = "chord has no key";
        return false;
    }

    out.modifiers = mods;
    out.trigger = *key;
    return true;
}

} // namespace chordkit

#include "ui/imgui_shortcuts.h"

#include "core/visual_shortcut.h"

#include "imgui_internal.h"

namespace chordkit::ui
{
namespace
{
static ImGuiKey CharacterKey(char c)
{
    if (c >= 'a' && c <= 'z')
        return (ImGuiKey)((int)ImGuiKey_A + (c - 'a'));
    if (c >= '0' && c <= '9')
        return (ImGuiKey)((int)ImGuiKey_0 + (c - '0'));

    switch (c)
    {
        case '-': return ImGuiKey_Minus;
        case '=': return ImGuiKey_Equal;
        case ',': return ImGuiKey_Comma;
        case '.': return ImGuiKey_Period;
        case '/': return ImGuiKey_Slash;
        case ';': return ImGuiKey_Semicolon;
        case '\'': return ImGuiKey_Apostrophe;
        case '[': return ImGuiKey_LeftBracket;
        case ']': return ImGuiKey_RightBracket;
        case '\\': return ImGuiKey_Backslash;
        case '`': return ImGuiKey_GraveAccent;
        case ' ': return ImGuiKey_Space;
        default: return ImGuiKey_None;
    }
}

static bool ModExactMatch(ModifierFlags m, const ImGuiIO& io)
{
    if ((bool)io.KeyCtrl != Has(m, ModifierFlags::Control)) return false;
    if ((bool)io.KeyShift != Has(m, ModifierFlags::Shift)) return false;
    if ((bool)io.KeyAlt != Has(m, ModifierFlags::Alt)) return false;
    if ((bool)io.KeySuper != Has(m, ModifierFlags::Super)) return false;
    return true;
}

static ImGuiKey PrimaryModifierKey(Platform platform)
{
    return platform == Platform::MacOS ? ImGuiMod_Super : ImGuiMod_Ctrl;
}
} // namespace

ImGuiKey ToImGuiKey(const KeyTrigger& trigger)
{
    switch (trigger.named)
    {
        case NamedKey::None: return CharacterKey(trigger.character);
        case NamedKey::Escape: return ImGuiKey_Escape;
        case NamedKey::Return: return ImGuiKey_Enter;
        // The key labelled Delete on Apple keyboards deletes backwards.
        case NamedKey::Delete: return ImGuiKey_Backspace;
        case NamedKey::Tab: return ImGuiKey_Tab;
        case NamedKey::Space: return ImGuiKey_Space;
        case NamedKey::LeftArrow: return ImGuiKey_LeftArrow;
        case NamedKey::RightArrow: return ImGuiKey_RightArrow;
        case NamedKey::UpArrow: return ImGuiKey_UpArrow;
        case NamedKey::DownArrow: return ImGuiKey_DownArrow;
    }
    return ImGuiKey_None;
}

ImGuiKeyChord ToImGuiKeyChord(const KeyChord& chord, Platform platform)
{
    const ImGuiKey key = ToImGuiKey(chord.trigger);
    if (key == ImGuiKey_None)
        return ImGuiKey_None;

    const ModifierFlags m = ResolvePrimaryModifier(chord.modifiers, platform);
    ImGuiKeyChord out = key;
    if (Has(m, ModifierFlags::Control)) out |= ImGuiMod_Ctrl;
    if (Has(m, ModifierFlags::Shift)) out |= ImGuiMod_Shift;
    if (Has(m, ModifierFlags::Alt)) out |= ImGuiMod_Alt;
    if (Has(m, ModifierFlags::Super)) out |= ImGuiMod_Super;
    // CapsLock and NumericPad have no ImGuiMod_ equivalent.
    return out;
}

bool IsChordPressed(const KeyChord& chord, Platform platform, bool repeat)
{
    const ImGuiKey key = ToImGuiKey(chord.trigger);
    if (key == ImGuiKey_None)
        return false;

    const ImGuiIO& io = ImGui::GetIO();
    if (!ModExactMatch(ResolvePrimaryModifier(chord.modifiers, platform), io))
        return false;
    if (chord.trigger.named == NamedKey::Return)
        return ImGui::IsKeyPressed(ImGuiKey_Enter, repeat) || ImGui::IsKeyPressed(ImGuiKey_KeypadEnter, repeat);
    return ImGui::IsKeyPressed(key, repeat);
}

bool ActionPressed(KeyboardAction action, Platform platform, bool right_to_left)
{
    const KeyChord chord = EffectiveChord(VisualShortcutFor(action), right_to_left);
    return IsChordPressed(chord, platform);
}

std::optional<CommandDescriptor> PressedCommand(const std::vector<CommandDescriptor>& commands, Platform platform)
{
    for (const auto& c : commands)
    {
        if (IsChordPressed(c.Chord(), platform))
            return c;
    }
    return std::nullopt;
}

void DrawShortcutOverlay(const std::vector<CommandDescriptor>& commands, Platform platform, float hold_seconds)
{
    if (commands.empty())
        return;

    const ImGuiKeyData* mod = ImGui::GetKeyData(PrimaryModifierKey(platform));
    if (!mod || !mod->Down || mod->DownDuration < hold_seconds)
        return;

    const ImGuiViewport* vp = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(vp->GetCenter(), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowBgAlpha(0.92f);

    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                   ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing |
                                   ImGuiWindowFlags_NoNav | ImGuiWindowFlags_NoInputs;
    if (ImGui::Begin("##chordkit_shortcut_overlay", nullptr, flags))
    {
        if (ImGui::BeginTable("##shortcuts", 2, ImGuiTableFlags_SizingFixedFit))
        {
            for (const auto& c : commands)
            {
                ImGui::TableNextRow();
                ImGui::TableSetColumnIndex(0);
                ImGui::TextUnformatted(c.Label().has_value() ? c.Label()->c_str() : "");
                ImGui::TableSetColumnIndex(1);
                const std::string chord = FormatChordSymbols(c.Chord(), platform);
                ImGui::TextDisabled("%s", chord.c_str());
            }
            ImGui::EndTable();
        }
    }
    ImGui::End();
}

} // namespace chordkit::ui

#include "core/catalog_json.h"

#include "core/keyboard_action.h"
#include "core/visual_shortcut.h"

#include <exception>
#include <fstream>

using json = nlohmann::json;

namespace chordkit
{
namespace
{
static json ModifierNames(ModifierFlags m)
{
    json out = json::array();
    if (Has(m, ModifierFlags::Control)) out.push_back("ctrl");
    if (Has(m, ModifierFlags::Alt)) out.push_back("alt");
    if (Has(m, ModifierFlags::Shift)) out.push_back("shift");
    if (Has(m, ModifierFlags::Super)) out.push_back("super");
    if (Has(m, ModifierFlags::CapsLock)) out.push_back("capslock");
    if (Has(m, ModifierFlags::NumericPad)) out.push_back("keypad");
    return out;
}

static std::string TriggerToken(const KeyTrigger& t)
{
    if (t.IsCharacter())
        return std::string(1, t.character);
    return NamedKeyToken(t.named);
}
} // namespace

json ChordToJson(const KeyChord& chord, Platform platform)
{
    json j;
    j["chord"] = FormatChord(chord, platform);
    j["modifiers"] = ModifierNames(ResolvePrimaryModifier(chord.modifiers, platform));
    j["trigger"] = TriggerToken(chord.trigger);
    return j;
}

json CatalogToJson(Platform platform)
{
    json j;
    j["schema_version"] = 1;
    j["platform"] = PlatformName(platform);

    json actions = json::array();
    for (const KeyboardAction a : AllKeyboardActions())
    {
        const VisualShortcut vs = VisualShortcutFor(a);
        json ja = ChordToJson(vs.chord, platform);
        ja["id"] = ActionId(a);
        ja["title"] = ActionDisplayName(a);
        ja["mirroring"] = MirroringName(vs.mirroring);
        ja["cancel_action"] = vs.is_cancel_action;
        actions.push_back(std::move(ja));
    }
    j["actions"] = std::move(actions);

    json collisions = json::array();
    for (const auto& [a, b] : FindChordCollisions())
        collisions.push_back(json::array({ActionId(a), ActionId(b)}));
    j["collisions"] = std::move(collisions);
    return j;
}

json CommandsToJson(const std::vector<CommandDescriptor>& commands, Platform platform)
{
    json out = json::array();
    for (const auto& c : commands)
    {
        json jc = ChordToJson(c.Chord(), platform);
        if (c.Label().has_value())
            jc["label"] = c.Label().value();
        else
            jc["label"] = nullptr;
        jc["handler"] = c.Handler();
        out.push_back(std::move(jc));
    }
    return out;
}

bool SaveCatalogJson(const std::string& path, Platform platform, std::string& err)
{
    err.clear();

    std::ofstream out(path);
    if (!out)
    {
        err = "Failed to open '" + path + "' for writing.";
        return false;
    }

    try
    {
        out << CatalogToJson(platform).dump(2) << "\n";
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to write JSON: ") + e.what();
        return false;
    }

    if (!out)
    {
        err = "Failed to write '" + path + "'.";
        return false;
    }
    return true;
}

} // namespace chordkit

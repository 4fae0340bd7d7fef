#include "core/catalog_json.h"
#include "core/i18n.h"
#include "core/key_chord.h"
#include "core/keyboard_action.h"
#include "core/tab_selector.h"
#include "core/visual_shortcut.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--platform any|windows|linux|macos] [--locale <id>] [--json]\n"
              << "                 [--tabs <title,title,...>] [--chord <text>] [--out <file>]\n"
              << "\n"
              << "Prints the standard keyboard action catalog with its key equivalents.\n"
              << "Chord collisions are reported on stderr.\n"
              << "\n"
              << "Options:\n"
              << "  --platform <p>  Platform used to resolve the primary modifier (default: this host)\n"
              << "  --locale <id>   Locale for right-to-left mirroring (default: ICU default locale)\n"
              << "  --json          Print JSON instead of a table\n"
              << "  --tabs <list>   Also print the tab shortcuts for these comma separated titles\n"
              << "  --chord <text>  Only list the actions bound to <text> (\"Ctrl+W\", \"Primary+R\")\n"
              << "  --out <file>    Write the catalog JSON to <file>\n";
}

static std::vector<chordkit::TabDescriptor> SplitTabs(std::string_view list)
{
    std::vector<chordkit::TabDescriptor> out;
    size_t b = 0;
    for (;;)
    {
        const size_t p = list.find(',', b);
        const size_t e = (p == std::string_view::npos) ? list.size() : p;
        chordkit::TabDescriptor t;
        if (e > b)
            t.title = std::string(list.substr(b, e - b));
        out.push_back(std::move(t));
        if (p == std::string_view::npos)
            break;
        b = p + 1;
    }
    return out;
}

static void PrintTable(chordkit::Platform platform, bool rtl)
{
    std::printf("%-22s %-14s %-18s %s\n", "action", "chord", "mirroring", rtl ? "effective (rtl)" : "");
    for (const chordkit::KeyboardAction a : chordkit::AllKeyboardActions())
    {
        const chordkit::VisualShortcut vs = chordkit::VisualShortcutFor(a);
        const std::string chord = chordkit::FormatChord(vs.chord, platform);
        const std::string effective = chordkit::FormatChord(chordkit::EffectiveChord(vs, rtl), platform);
        std::printf("%-22s %-14s %-18s %s\n", chordkit::ActionId(a), chord.c_str(),
                    chordkit::MirroringName(vs.mirroring), rtl ? effective.c_str() : "");
    }
}
} // namespace

int main(int argc, char** argv)
{
    chordkit::Platform platform = chordkit::RuntimePlatform();
    std::string locale;
    std::string out_path;
    bool as_json = false;
    bool have_tabs = false;
    std::vector<chordkit::TabDescriptor> tabs;
    std::optional<chordkit::KeyChord> lookup;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--platform")
        {
            const std::string_view p = need("--platform");
            platform = chordkit::PlatformFromString(p);
            if (platform == chordkit::Platform::Any && p != "any")
            {
                std::cerr << "Invalid --platform value (expected any|windows|linux|macos)\n";
                return 2;
            }
        }
        else if (a == "--locale")
        {
            locale = std::string(need("--locale"));
        }
        else if (a == "--json")
        {
            as_json = true;
        }
        else if (a == "--tabs")
        {
            tabs = SplitTabs(need("--tabs"));
            have_tabs = true;
        }
        else if (a == "--chord")
        {
            const std::string text(need("--chord"));
            chordkit::KeyChord chord;
            std::string err;
            if (!chordkit::ParseChordString(text, chord, err))
            {
                std::cerr << "Invalid --chord value: " << err << "\n";
                return 2;
            }
            lookup = chord;
        }
        else if (a == "--out")
        {
            out_path = std::string(need("--out"));
        }
        else
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    // Both chords stay registered; which one wins is up to the host.
    for (const auto& [x, y] : chordkit::FindChordCollisions())
    {
        std::cerr << "chordkit_catalog: warning: " << chordkit::ActionId(x) << " and " << chordkit::ActionId(y)
                  << " share " << chordkit::FormatChord(chordkit::KeyEquivalent(x), platform) << "\n";
    }

    const bool rtl = chordkit::i18n::IsRightToLeft(locale);
    const std::vector<chordkit::CommandDescriptor> tab_commands =
        have_tabs ? chordkit::AvailableTabCommands(tabs, /*is_modal_presented=*/false)
                  : std::vector<chordkit::CommandDescriptor>{};

    if (lookup.has_value())
    {
        const std::vector<chordkit::KeyboardAction> hits = chordkit::ActionsForChord(*lookup, platform);
        if (as_json)
        {
            nlohmann::json j;
            j["chord"] = chordkit::FormatChord(*lookup, platform);
            j["actions"] = nlohmann::json::array();
            for (const chordkit::KeyboardAction hit : hits)
                j["actions"].push_back(chordkit::ActionId(hit));
            std::cout << j.dump(2) << "\n";
        }
        else
        {
            for (const chordkit::KeyboardAction hit : hits)
                std::printf("%-22s %s\n", chordkit::ActionId(hit), chordkit::ActionDisplayName(hit));
            if (hits.empty())
                std::cerr << "chordkit_catalog: no action uses " << chordkit::FormatChord(*lookup, platform) << "\n";
        }
    }
    else if (as_json)
    {
        nlohmann::json j = chordkit::CatalogToJson(platform);
        j["locale"] = locale.empty() ? chordkit::i18n::DefaultLocale() : locale;
        j["right_to_left"] = rtl;
        if (have_tabs)
            j["tab_commands"] = chordkit::CommandsToJson(tab_commands, platform);
        std::cout << j.dump(2) << "\n";
    }
    else
    {
        PrintTable(platform, rtl);
        if (have_tabs)
        {
            std::printf("\n%-14s %s\n", "tab chord", "title");
            for (const auto& c : tab_commands)
            {
                const std::string chord = chordkit::FormatChord(c.Chord(), platform);
                std::printf("%-14s %s\n", chord.c_str(), c.Label().value_or("(untitled)").c_str());
            }
            if (tabs.size() > chordkit::kMaxTabShortcuts)
                std::printf("(%zu tabs without shortcuts)\n", tabs.size() - chordkit::kMaxTabShortcuts);
        }
    }

    if (!out_path.empty())
    {
        std::string err;
        if (!chordkit::SaveCatalogJson(out_path, platform, err))
        {
            std::cerr << "chordkit_catalog: FAIL: " << err << "\n";
            return 3;
        }
    }
    return 0;
}

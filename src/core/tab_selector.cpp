#include "core/tab_selector.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

namespace chordkit
{
std::vector<CommandDescriptor> AvailableTabCommands(const std::vector<TabDescriptor>& visible_tabs,
                                                    bool is_modal_presented)
{
    std::vector<CommandDescriptor> out;
    if (is_modal_presented)
        return out;

    const size_t n = std::min(visible_tabs.size(), kMaxTabShortcuts);
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        const KeyChord chord{.modifiers = ModifierFlags::Primary,
                             .trigger = KeyTrigger::Character((char)('1' + i))};
        out.emplace_back(chord, visible_tabs[i].title, (HandlerKey)i);
    }
    return out;
}

std::optional<std::size_t> TabIndexForTriggerDigit(std::string_view input)
{
    if (input.size() != 1)
        return std::nullopt;
    const char c = input[0];
    if (c < '1' || c > '9')
        return std::nullopt;
    return (std::size_t)(c - '1');
}

std::vector<CommandDescriptor> KeyboardTabSelector::KeyCommands(std::vector<CommandDescriptor> inherited) const
{
    std::vector<CommandDescriptor> commands = std::move(inherited);
    if (host_.IsModalActive())
        return commands;

    const std::vector<TabDescriptor> tabs = host_.CurrentVisibleTabs();
    const size_t configured = host_.ConfiguredTabCount();
    if (tabs.size() != configured)
    {
        std::fprintf(stderr,
                     "[tabs] fatal: %zu of %zu configured tabs are visible; "
                     "tab containers with an overflow list are not supported\n",
                     tabs.size(), configured);
        std::abort();
    }

    std::vector<CommandDescriptor> tab_commands = AvailableTabCommands(tabs, false);
    commands.insert(commands.end(), tab_commands.begin(), tab_commands.end());
    return commands;
}

bool KeyboardTabSelector::HandleKeyCommand(const CommandDescriptor& command)
{
    const KeyTrigger& trigger = command.Trigger();
    if (!trigger.IsCharacter())
        return false;

    const char digit = trigger.character;
    const std::optional<std::size_t> index = TabIndexForTriggerDigit(std::string_view(&digit, 1));
    if (!index.has_value())
        return false;

    // The tab set may have changed since the command list was built.
    if (index.value() >= host_.CurrentVisibleTabs().size())
        return false;

    host_.SetSelectedTab(index.value());
    return true;
}

} // namespace chordkit

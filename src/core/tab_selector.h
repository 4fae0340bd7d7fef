#pragma once

#include "core/command.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chordkit
{
// Primary+1 .. Primary+9 for jumping straight to a tab.
//
// - Only the first nine tabs get shortcuts; there is no secondary chord.
// - Tab containers that move tabs behind an overflow ("More") list are not
//   supported: building commands for one is a fatal configuration error.
// - Commands are rebuilt on every query since tabs and modal state change.

inline constexpr std::size_t kMaxTabShortcuts = 9;

struct TabDescriptor
{
    std::optional<std::string> title;
};

// Capabilities a tab container exposes to the selector. Implemented by the UI
// host (see ui/keyboard_tab_bar.h) or by test fakes.
class TabHost
{
public:
    virtual ~TabHost() = default;

    // Tabs currently shown in the tab strip, in order.
    virtual std::vector<TabDescriptor> CurrentVisibleTabs() const = 0;
    // All tabs configured on the container, shown or not.
    virtual std::size_t ConfiguredTabCount() const = 0;
    // True while a modal overlay has input focus.
    virtual bool IsModalActive() const = 0;

    virtual std::size_t SelectedTab() const = 0;
    virtual void SetSelectedTab(std::size_t index) = 0;
};

// One command per tab for the first min(N, 9) tabs; empty while a modal is
// presented. Handler-key is the tab index.
std::vector<CommandDescriptor> AvailableTabCommands(const std::vector<TabDescriptor>& visible_tabs,
                                                    bool is_modal_presented);

// '1'..'9' -> 0..8. Anything else (including "0", "10" and "") is no match.
// Not bounds-checked against the current tab count.
std::optional<std::size_t> TabIndexForTriggerDigit(std::string_view input);

class KeyboardTabSelector
{
public:
    explicit KeyboardTabSelector(TabHost& host) : host_(host) {}

    // `inherited` followed by the tab commands. Aborts if the host hides any
    // configured tab.
    std::vector<CommandDescriptor> KeyCommands(std::vector<CommandDescriptor> inherited = {}) const;

    // Selects the tab addressed by `command`. Returns false (and leaves the
    // selection alone) when the trigger is not a tab digit or the tab no
    // longer exists.
    bool HandleKeyCommand(const CommandDescriptor& command);

    // Directional focus on the tab strip cannot activate a tab, so containers
    // driven by this selector keep it off.
    bool AllowsFocusNavigation() const { return false; }

private:
    TabHost& host_;
};

} // namespace chordkit

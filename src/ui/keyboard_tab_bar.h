#pragma once

#include "core/key_chord.h"
#include "core/tab_selector.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chordkit::ui
{
// ImGui tab bar that switches tabs with Primary+1 .. Primary+9.
//
// Every configured tab is always shown (no overflow list), so the selector's
// configuration check holds by construction.
class KeyboardTabBar final : public TabHost
{
public:
    struct Tab
    {
        std::optional<std::string> title;
        std::function<void()>      render;
    };

    KeyboardTabBar() : selector_(*this) {}

    KeyboardTabBar(const KeyboardTabBar&) = delete;
    KeyboardTabBar& operator=(const KeyboardTabBar&) = delete;

    // `render` draws the tab's contents while it is selected. It may call
    // AddTab() or ClearTabs(); the change shows within the same Draw().
    void AddTab(std::optional<std::string> title, std::function<void()> render);
    void ClearTabs();
    size_t TabCount() const { return tabs_.size(); }

    // Commands owned by the host (window-level actions); tab commands are
    // appended after them.
    void SetInheritedCommands(std::vector<CommandDescriptor> commands) { inherited_ = std::move(commands); }

    // Commands gathered during the last Draw(), for DrawShortcutOverlay().
    const std::vector<CommandDescriptor>& LastCommands() const { return last_commands_; }

    // Dispatches a pressed tab shortcut, then draws the tab bar and the
    // selected tab's contents. Tab headers take no nav focus; the contents do.
    void Draw(const char* str_id, Platform platform);

    // TabHost
    std::vector<TabDescriptor> CurrentVisibleTabs() const override;
    std::size_t ConfiguredTabCount() const override { return tabs_.size(); }
    bool IsModalActive() const override;
    std::size_t SelectedTab() const override { return selected_; }
    void SetSelectedTab(std::size_t index) override;

private:
    std::vector<Tab>               tabs_;
    std::vector<CommandDescriptor> inherited_;
    std::vector<CommandDescriptor> last_commands_;
    size_t                         selected_ = 0;
    bool                           pending_select_ = false; // keyboard selection not yet shown
    KeyboardTabSelector            selector_;
};

} // namespace chordkit::ui

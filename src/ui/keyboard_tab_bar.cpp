#include "ui/keyboard_tab_bar.h"

#include "ui/imgui_shortcuts.h"

#include "imgui_internal.h"

#include <cstddef>
#include <string>

namespace chordkit::ui
{
void KeyboardTabBar::AddTab(std::optional<std::string> title, std::function<void()> render)
{
    tabs_.push_back(Tab{.title = std::move(title), .render = std::move(render)});
}

void KeyboardTabBar::ClearTabs()
{
    tabs_.clear();
    selected_ = 0;
    pending_select_ = false;
}

std::vector<TabDescriptor> KeyboardTabBar::CurrentVisibleTabs() const
{
    std::vector<TabDescriptor> out;
    out.reserve(tabs_.size());
    for (const auto& t : tabs_)
        out.push_back(TabDescriptor{.title = t.title});
    return out;
}

bool KeyboardTabBar::IsModalActive() const
{
    return ImGui::IsPopupOpen("", ImGuiPopupFlags_AnyPopupId | ImGuiPopupFlags_AnyPopupLevel);
}

void KeyboardTabBar::SetSelectedTab(std::size_t index)
{
    if (index >= tabs_.size())
        return;
    selected_ = index;
    pending_select_ = true;
}

void KeyboardTabBar::Draw(const char* str_id, Platform platform)
{
    last_commands_ = selector_.KeyCommands(inherited_);

    // Inherited commands are dispatched by the host; only tab digits land here.
    const std::vector<CommandDescriptor> tab_commands(last_commands_.begin() + (std::ptrdiff_t)inherited_.size(),
                                                      last_commands_.end());
    if (const auto pressed = PressedCommand(tab_commands, platform))
        selector_.HandleKeyCommand(*pressed);

    // Tabs are reached through their digit shortcuts, not through nav focus.
    const bool no_nav = !selector_.AllowsFocusNavigation();
    if (no_nav)
        ImGui::PushItemFlag(ImGuiItemFlags_NoNav, true);

    if (ImGui::BeginTabBar(str_id))
    {
        for (size_t i = 0; i < tabs_.size(); ++i)
        {
            // Untitled tabs still need a unique, non-empty ImGui label.
            const std::string label = tabs_[i].title.value_or("") + "###tab" + std::to_string(i);

            ImGuiTabItemFlags flags = ImGuiTabItemFlags_None;
            if (pending_select_ && i == selected_)
                flags |= ImGuiTabItemFlags_SetSelected;

            if (ImGui::BeginTabItem(label.c_str(), nullptr, flags))
            {
                // SetSelected lands a frame late; keep the keyboard choice until it shows.
                if (!pending_select_ || i == selected_)
                {
                    selected_ = i;
                    pending_select_ = false;
                }

                // The callback may add or clear tabs, so tabs_[i] is not held across it.
                const std::function<void()> render = tabs_[i].render;
                if (no_nav)
                    ImGui::PopItemFlag();
                if (render)
                    render();
                if (no_nav)
                    ImGui::PushItemFlag(ImGuiItemFlags_NoNav, true);
                ImGui::EndTabItem();
            }
        }
        ImGui::EndTabBar();
    }

    if (no_nav)
        ImGui::PopItemFlag();
}

} // namespace chordkit::ui

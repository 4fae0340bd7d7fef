#pragma once

#include "core/command.h"
#include "core/keyboard_action.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace chordkit
{
// System-provided toolbar/navigation bar items.
enum class SystemBarItem : std::uint8_t
{
    Done,
    Cancel,
    Edit,
    Save,
    Add,
    FlexibleSpace,
    FixedSpace,
    Compose,
    Reply,
    Action,
    Organize,
    Bookmarks,
    Search,
    Refresh,
    Stop,
    Camera,
    Trash,
    Play,
    Pause,
    Rewind,
    FastForward,
    Undo,
    Redo,
    Close,
};

// Keyboard equivalent for a system item, if it has one.
std::optional<KeyboardAction> KeyboardActionForSystemItem(SystemBarItem item);

class BarButtonItem
{
public:
    // Runs once the base state is built, before the item is handed out.
    using PostInit = std::function<void(BarButtonItem&, SystemBarItem)>;

private:
    struct PassKey
    {
        explicit PassKey() = default;
    };

public:
    static std::unique_ptr<BarButtonItem> Create(SystemBarItem item, const PostInit& post_init = {});

    // Only reachable through Create().
    BarButtonItem(PassKey, SystemBarItem item) : system_item_(item) {}

    SystemBarItem SystemItem() const { return system_item_; }

    const std::optional<std::string>& Title() const { return title_; }
    void SetTitle(std::optional<std::string> title) { title_ = std::move(title); }

    const std::optional<KeyboardAction>& KeyboardActionValue() const { return keyboard_action_; }
    void SetKeyboardAction(std::optional<KeyboardAction> action) { keyboard_action_ = action; }

    bool Enabled() const { return enabled_; }
    void SetEnabled(bool enabled) { enabled_ = enabled; }

    // Command to register while the item is shown; none if the item is
    // disabled or has no keyboard action.
    std::optional<CommandDescriptor> KeyCommand() const;

private:
    SystemBarItem                 system_item_;
    std::optional<std::string>    title_;
    std::optional<KeyboardAction> keyboard_action_;
    bool                          enabled_ = true;
};

// BarButtonItem::Create() with a post-init step that assigns the system item's
// keyboard action.
std::unique_ptr<BarButtonItem> CreateKeyboardBarButtonItem(SystemBarItem item);

} // namespace chordkit

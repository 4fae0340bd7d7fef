#include "core/bar_button_item.h"

namespace chordkit
{
std::optional<KeyboardAction> KeyboardActionForSystemItem(SystemBarItem item)
{
    switch (item)
    {
        case SystemBarItem::Done: return KeyboardAction::Done;
        case SystemBarItem::Cancel: return KeyboardAction::Cancel;
        case SystemBarItem::Edit: return KeyboardAction::Edit;
        case SystemBarItem::Save: return KeyboardAction::Save;
        case SystemBarItem::Add: return KeyboardAction::New;
        case SystemBarItem::Reply: return KeyboardAction::Reply;
        case SystemBarItem::Action: return KeyboardAction::Share;
        case SystemBarItem::Bookmarks: return KeyboardAction::Bookmarks;
        case SystemBarItem::Search: return KeyboardAction::Search;
        case SystemBarItem::Refresh: return KeyboardAction::Refresh;
        case SystemBarItem::Trash: return KeyboardAction::Delete;
        case SystemBarItem::Rewind: return KeyboardAction::Rewind;
        case SystemBarItem::FastForward: return KeyboardAction::FastForward;
        case SystemBarItem::Close: return KeyboardAction::Close;

        // Space items are not buttons; the rest have no standard chord.
        case SystemBarItem::FlexibleSpace:
        case SystemBarItem::FixedSpace:
        case SystemBarItem::Compose:
        case SystemBarItem::Organize:
        case SystemBarItem::Stop:
        case SystemBarItem::Camera:
        case SystemBarItem::Play:
        case SystemBarItem::Pause:
        case SystemBarItem::Undo:
        case SystemBarItem::Redo:
            return std::nullopt;
    }
    return std::nullopt;
}

std::unique_ptr<BarButtonItem> BarButtonItem::Create(SystemBarItem item, const PostInit& post_init)
{
    auto out = std::make_unique<BarButtonItem>(PassKey{}, item);
    if (post_init)
        post_init(*out, item);
    return out;
}

std::optional<CommandDescriptor> BarButtonItem::KeyCommand() const
{
    if (!enabled_ || !keyboard_action_.has_value())
        return std::nullopt;
    return ActionCommand(keyboard_action_.value(), title_);
}

std::unique_ptr<BarButtonItem> CreateKeyboardBarButtonItem(SystemBarItem item)
{
    return BarButtonItem::Create(item, [](BarButtonItem& b, SystemBarItem system_item) {
        b.SetKeyboardAction(KeyboardActionForSystemItem(system_item));
    });
}

} // namespace chordkit

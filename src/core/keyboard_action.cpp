#include "core/keyboard_action.h"

namespace chordkit
{
namespace
{
static KeyChord Primary(char c)
{
    return KeyChord{.modifiers = ModifierFlags::Primary, .trigger = KeyTrigger::Character(c)};
}

static KeyChord Primary(NamedKey k)
{
    return KeyChord{.modifiers = ModifierFlags::Primary, .trigger = KeyTrigger::Named(k)};
}
} // namespace

const std::array<KeyboardAction, kKeyboardActionCount>& AllKeyboardActions()
{
    static const std::array<KeyboardAction, kKeyboardActionCount> kAll = {
        KeyboardAction::Cancel,
        KeyboardAction::Close,
        KeyboardAction::Done,
        KeyboardAction::Save,
        KeyboardAction::Share,
        KeyboardAction::Edit,
        KeyboardAction::New,
        KeyboardAction::Reply,
        KeyboardAction::Refresh,
        KeyboardAction::Bookmarks,
        KeyboardAction::Search,
        KeyboardAction::Delete,
        KeyboardAction::Today,
        KeyboardAction::ZoomIn,
        KeyboardAction::ZoomOut,
        KeyboardAction::ZoomToActualSize,
        KeyboardAction::Rewind,
        KeyboardAction::FastForward,
    };
    return kAll;
}

KeyChord KeyEquivalent(KeyboardAction action)
{
    switch (action)
    {
        case KeyboardAction::Cancel:
            return KeyChord{.modifiers = ModifierFlags::None, .trigger = KeyTrigger::Named(NamedKey::Escape)};
        case KeyboardAction::Close: return Primary('w');
        // Return rather than keypad Enter: Enter alone is not reliably delivered as a
        // distinct key on all keyboards.
        case KeyboardAction::Done: return Primary(NamedKey::Return);
        case KeyboardAction::Save: return Primary('s');
        case KeyboardAction::Share: return Primary('i'); // Safari: Email This Page
        case KeyboardAction::Edit: return Primary('e');
        case KeyboardAction::New: return Primary('n');
        case KeyboardAction::Reply: return Primary('r');
        case KeyboardAction::Refresh: return Primary('r');
        case KeyboardAction::Bookmarks: return Primary('b');
        case KeyboardAction::Search: return Primary('f');
        case KeyboardAction::Delete: return Primary(NamedKey::Delete);
        case KeyboardAction::Today: return Primary('t');
        case KeyboardAction::ZoomIn: return Primary('=');
        case KeyboardAction::ZoomOut: return Primary('-');
        case KeyboardAction::ZoomToActualSize: return Primary('0');
        case KeyboardAction::Rewind: return Primary(NamedKey::LeftArrow);
        case KeyboardAction::FastForward: return Primary(NamedKey::RightArrow);
    }
    return KeyChord{};
}

const char* ActionId(KeyboardAction action)
{
    switch (action)
    {
        case KeyboardAction::Cancel: return "cancel";
        case KeyboardAction::Close: return "close";
        case KeyboardAction::Done: return "done";
        case KeyboardAction::Save: return "save";
        case KeyboardAction::Share: return "share";
        case KeyboardAction::Edit: return "edit";
        case KeyboardAction::New: return "new";
        case KeyboardAction::Reply: return "reply";
        case KeyboardAction::Refresh: return "refresh";
        case KeyboardAction::Bookmarks: return "bookmarks";
        case KeyboardAction::Search: return "search";
        case KeyboardAction::Delete: return "delete";
        case KeyboardAction::Today: return "today";
        case KeyboardAction::ZoomIn: return "zoom_in";
        case KeyboardAction::ZoomOut: return "zoom_out";
        case KeyboardAction::ZoomToActualSize: return "zoom_to_actual_size";
        case KeyboardAction::Rewind: return "rewind";
        case KeyboardAction::FastForward: return "fast_forward";
    }
    return "";
}

std::optional<KeyboardAction> ActionFromId(std::string_view id)
{
    for (const KeyboardAction a : AllKeyboardActions())
    {
        if (id == ActionId(a))
            return a;
    }
    return std::nullopt;
}

const char* ActionDisplayName(KeyboardAction action)
{
    switch (action)
    {
        case KeyboardAction::Cancel: return "Cancel";
        case KeyboardAction::Close: return "Close";
        case KeyboardAction::Done: return "Done";
        case KeyboardAction::Save: return "Save";
        case KeyboardAction::Share: return "Share";
        case KeyboardAction::Edit: return "Edit";
        case KeyboardAction::New: return "New";
        case KeyboardAction::Reply: return "Reply";
        case KeyboardAction::Refresh: return "Refresh";
        case KeyboardAction::Bookmarks: return "Bookmarks";
        case KeyboardAction::Search: return "Search";
        case KeyboardAction::Delete: return "Delete";
        case KeyboardAction::Today: return "Today";
        case KeyboardAction::ZoomIn: return "Zoom In";
        case KeyboardAction::ZoomOut: return "Zoom Out";
        case KeyboardAction::ZoomToActualSize: return "Zoom to Actual Size";
        case KeyboardAction::Rewind: return "Rewind";
        case KeyboardAction::FastForward: return "Fast Forward";
    }
    return "";
}

CommandDescriptor ActionCommand(KeyboardAction action, std::optional<std::string> label)
{
    return CommandDescriptor(KeyEquivalent(action), std::move(label), (HandlerKey)action);
}

std::optional<KeyboardAction> ActionFromHandler(HandlerKey handler)
{
    if (handler < 0 || handler >= (HandlerKey)kKeyboardActionCount)
        return std::nullopt;
    return (KeyboardAction)handler;
}

std::vector<KeyboardAction> ActionsForChord(const KeyChord& chord, Platform platform)
{
    const ModifierFlags wanted = ResolvePrimaryModifier(chord.modifiers, platform);
    std::vector<KeyboardAction> out;
    for (const KeyboardAction a : AllKeyboardActions())
    {
        const KeyChord k = KeyEquivalent(a);
        if (k.trigger == chord.trigger && ResolvePrimaryModifier(k.modifiers, platform) == wanted)
            out.push_back(a);
    }
    return out;
}

std::vector<std::pair<KeyboardAction, KeyboardAction>> FindChordCollisions()
{
    std::vector<std::pair<KeyboardAction, KeyboardAction>> out;
    const auto& all = AllKeyboardActions();
    for (size_t i = 0; i < all.size(); ++i)
    {
        const KeyChord ci = KeyEquivalent(all[i]);
        for (size_t j = i + 1; j < all.size(); ++j)
        {
            if (KeyEquivalent(all[j]) == ci)
                out.emplace_back(all[i], all[j]);
        }
    }
    return out;
}

} // namespace chordkit

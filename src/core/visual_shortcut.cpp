#include "core/visual_shortcut.h"

namespace chordkit
{
VisualShortcut VisualShortcutFor(KeyboardAction action)
{
    VisualShortcut vs;
    vs.chord = KeyEquivalent(action);

    switch (action)
    {
        case KeyboardAction::Cancel:
            vs.is_cancel_action = true;
            break;
        case KeyboardAction::Rewind:
        case KeyboardAction::FastForward:
            vs.mirroring = Mirroring::WithoutMirroring;
            break;
        default:
            break;
    }
    return vs;
}

KeyChord EffectiveChord(const VisualShortcut& shortcut, bool right_to_left)
{
    KeyChord chord = shortcut.chord;
    if (!right_to_left || shortcut.mirroring != Mirroring::Automatic)
        return chord;

    if (chord.trigger.named == NamedKey::LeftArrow)
        chord.trigger = KeyTrigger::Named(NamedKey::RightArrow);
    else if (chord.trigger.named == NamedKey::RightArrow)
        chord.trigger = KeyTrigger::Named(NamedKey::LeftArrow);
    return chord;
}

const char* MirroringName(Mirroring m)
{
    switch (m)
    {
        case Mirroring::Automatic: return "automatic";
        case Mirroring::WithoutMirroring: return "without_mirroring";
    }
    return "automatic";
}

} // namespace chordkit

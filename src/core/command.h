#pragma once

#include "core/key_chord.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace chordkit
{
// Opaque token correlating a command with the logical action it fires.
// Tab commands use the zero-based tab index; catalog commands use the
// KeyboardAction ordinal.
using HandlerKey = std::int32_t;

// One invocable keyboard shortcut, as registered with a host's shortcut
// discovery UI. Built fresh for every query; never mutated afterwards.
class CommandDescriptor
{
public:
    CommandDescriptor(KeyChord chord, std::optional<std::string> label, HandlerKey handler)
        : chord_(chord), label_(std::move(label)), handler_(handler)
    {
    }

    const KeyChord& Chord() const { return chord_; }
    ModifierFlags Modifiers() const { return chord_.modifiers; }
    const KeyTrigger& Trigger() const { return chord_.trigger; }
    const std::optional<std::string>& Label() const { return label_; }
    HandlerKey Handler() const { return handler_; }

    bool operator==(const CommandDescriptor&) const = default;

private:
    KeyChord                   chord_;
    std::optional<std::string> label_;
    HandlerKey                 handler_ = 0;
};

} // namespace chordkit

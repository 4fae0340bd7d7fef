#pragma once

#include "core/command.h"
#include "core/key_chord.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace chordkit
{
// JSON export of the action catalog and of command lists, for tooling and
// shortcut discovery UIs. Export only; nothing is read back.
//
// Catalog schema (schema_version=1):
//   { "schema_version": 1, "platform": "macos",
//     "actions": [ { "id", "title", "chord", "modifiers": [...], "trigger",
//                    "mirroring", "cancel_action" } ],
//     "collisions": [ ["reply", "refresh"] ] }

nlohmann::json ChordToJson(const KeyChord& chord, Platform platform);

nlohmann::json CatalogToJson(Platform platform);

nlohmann::json CommandsToJson(const std::vector<CommandDescriptor>& commands, Platform platform);

// Writes CatalogToJson(platform) to `path`. Returns false with `err` set on
// failure.
bool SaveCatalogJson(const std::string& path, Platform platform, std::string& err);

} // namespace chordkit

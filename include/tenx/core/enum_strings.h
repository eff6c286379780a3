#pragma once

#include <string>

#include "tenx/core/entities.h"

namespace tenx {

// Stable lowercase identifiers used in snapshots, the CLI and log lines.
// The *_from_string parsers throw std::runtime_error on unknown input.

const char* terrain_to_string(Terrain t);
Terrain terrain_from_string(const std::string& s);
bool is_water(Terrain t);

const char* participant_kind_to_string(ParticipantKind k);
ParticipantKind participant_kind_from_string(const std::string& s);

const char* game_status_to_string(GameStatus s);
GameStatus game_status_from_string(const std::string& s);

const char* game_event_kind_to_string(GameEventKind k);
GameEventKind game_event_kind_from_string(const std::string& s);

} // namespace tenx

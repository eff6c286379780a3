#pragma once

#include <string>

#include "tenx/core/game_state.h"
#include "tenx/util/json.h"

namespace tenx {

// Built-in unit catalog: "warrior" (melee) and "slinger" (ranged 1..2).
ContentDB default_content();

// Parses {"unit_types": [ {code, attack, defence, health, move_points,
// is_ranged, range_min, range_max}, ... ]}.
// Throws std::runtime_error on malformed input, duplicate codes or
// inconsistent stats (non-positive health, ranged unit with an empty range).
ContentDB load_content_from_json(const std::string& json_text);

const UnitDefinition* find_unit_type(const ContentDB& content, const std::string& code);

} // namespace tenx

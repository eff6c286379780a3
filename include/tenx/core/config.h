#pragma once

#include <string>

#include "tenx/util/json.h"

namespace tenx {

struct EngineConfig {
  // Defence stat cities use in compute_damage().
  int city_defence{15};

  // HP regained by the ending participant's cities at end of turn, capped at
  // max HP. A city is under siege while an enemy unit stands adjacent to it.
  int city_regen_normal{4};
  int city_regen_under_siege{2};

  // Per-resource ceiling of a city stockpile. Harvest stops at the cap and
  // leaves the tile untouched.
  int resource_storage_cap{100};

  // Lifetime of a cached action result.
  int idempotency_ttl_seconds{3600};

  // A move may not end on an enemy city that still has HP.
  bool block_live_enemy_cities{true};

  // Maximum number of persistent events kept in GameState::events.
  // 0 means "unlimited".
  int max_events{200};

  std::string log_level{"info"};
};

// Reads any subset of the EngineConfig keys from a JSON object. Unknown keys are
// ignored; a known key with the wrong type throws std::runtime_error.
EngineConfig load_engine_config_from_json(const std::string& json_text, EngineConfig base = {});

json::Value engine_config_to_json(const EngineConfig& cfg);

} // namespace tenx

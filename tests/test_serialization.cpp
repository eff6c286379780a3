#include <iostream>
#include <stdexcept>
#include <string>

#include "tenx/core/content.h"
#include "tenx/core/rules.h"
#include "tenx/core/scenario.h"
#include "tenx/core/serialization.h"
#include "tenx/util/json.h"

#define TENX_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_serialization() {
  const tenx::ContentDB content = tenx::default_content();
  const tenx::EngineConfig cfg;

  auto s = tenx::make_demo_scenario(content, 12);

  // Put some history into the snapshot.
  tenx::ActionRequest move;
  move.kind = tenx::ActionKind::Move;
  move.actor_participant_id = 1;
  move.unit_id = 4;
  move.destination = tenx::GridPosition{2, 2};
  TENX_ASSERT(tenx::apply_action(s, content, cfg, move).ok);

  tenx::ActionRequest end;
  end.kind = tenx::ActionKind::EndTurn;
  end.actor_participant_id = 1;
  TENX_ASSERT(tenx::apply_action(s, content, cfg, end).ok);
  TENX_ASSERT(!s.events.empty());

  const std::string text = tenx::serialize_game_to_json(s);
  const auto loaded = tenx::deserialize_game_from_json(text);

  TENX_ASSERT(loaded.id == 12);
  TENX_ASSERT(loaded.turn_no == 2);
  TENX_ASSERT(loaded.active_participant_id == 2);
  TENX_ASSERT(loaded.units.size() == s.units.size());
  TENX_ASSERT(loaded.units.at(4).tile_id == s.units.at(4).tile_id);
  TENX_ASSERT(loaded.cities.at(3).hp == s.cities.at(3).hp);
  TENX_ASSERT(loaded.events.size() == s.events.size());
  TENX_ASSERT(loaded.next_id == s.next_id);
  TENX_ASSERT(loaded.next_event_seq == s.next_event_seq);
  TENX_ASSERT(loaded.map.tiles.size() == 80);

  // The warrior stood on the wheat next to its city when the turn ended.
  TENX_ASSERT(loaded.cities.at(3).resources.at("wheat") == 6);
  TENX_ASSERT(loaded.cities.at(3).tiles == s.cities.at(3).tiles);
  TENX_ASSERT(loaded.tile_resources.size() == 1);
  TENX_ASSERT(loaded.tile_resources.at(23) == 19);
  TENX_ASSERT(loaded.map.tiles[22].resource_amount == 20);

  // Byte-stable: the same state always produces the same text.
  TENX_ASSERT(tenx::serialize_game_to_json(loaded) == text);
  TENX_ASSERT(tenx::serialize_game_to_json(loaded, 0) == tenx::serialize_game_to_json(s, 0));

  // Foreign schema version.
  {
    auto root = tenx::json::parse(text);
    (*root.as_object())["schema_version"] = 2.0;
    bool threw = false;
    try {
      (void)tenx::deserialize_game_from_json(tenx::json::stringify(root));
    } catch (const tenx::SchemaMismatchError& e) {
      threw = true;
      TENX_ASSERT(e.found() == 2);
      TENX_ASSERT(e.expected() == tenx::kCurrentSchemaVersion);
    }
    TENX_ASSERT(threw);
  }

  // Missing schema version is malformed, not a mismatch.
  {
    auto root = tenx::json::parse(text);
    root.as_object()->erase("schema_version");
    bool threw = false;
    try {
      (void)tenx::deserialize_game_from_json(tenx::json::stringify(root));
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("missing schema_version") != std::string::npos;
    }
    TENX_ASSERT(threw);
  }

  // Duplicate unit ids.
  {
    auto root = tenx::json::parse(text);
    auto* units = (*root.as_object())["units"].as_array();
    TENX_ASSERT(units != nullptr);
    TENX_ASSERT(!units->empty());
    units->push_back(units->front());
    bool threw = false;
    try {
      (void)tenx::deserialize_game_from_json(tenx::json::stringify(root));
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("Duplicate unit id") != std::string::npos;
    }
    TENX_ASSERT(threw);
  }

  // Not JSON at all.
  {
    bool threw = false;
    try {
      (void)tenx::deserialize_game_from_json("{\"schema_version\": 1,");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    TENX_ASSERT(threw);
  }

  return 0;
}

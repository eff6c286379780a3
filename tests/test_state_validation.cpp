#include <iostream>
#include <string>
#include <vector>

#include "tenx/core/content.h"
#include "tenx/core/scenario.h"
#include "tenx/core/state_validation.h"

#define TENX_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool has_error(const std::vector<std::string>& errors, const std::string& needle) {
  for (const auto& e : errors) {
    if (e.find(needle) != std::string::npos) return true;
  }
  return false;
}

} // namespace

int test_state_validation() {
  const tenx::ContentDB content = tenx::default_content();
  const auto demo = tenx::make_demo_scenario(content);

  TENX_ASSERT(tenx::validate_game_state(demo).empty());
  TENX_ASSERT(tenx::validate_game_state(demo, &content).empty());

  // Two units on one tile.
  {
    auto s = demo;
    s.units.at(7).tile_id = s.units.at(4).tile_id;
    const auto errors = tenx::validate_game_state(s);
    TENX_ASSERT(has_error(errors, "holds more than one unit (4, 7)"));
  }

  // Unknown unit type is only detectable with content.
  {
    auto s = demo;
    s.units.at(5).type_code = "catapult";
    TENX_ASSERT(tenx::validate_game_state(s).empty());
    TENX_ASSERT(has_error(tenx::validate_game_state(s, &content), "Unit 5 has unknown type 'catapult'"));
  }

  // HP above the type's health.
  {
    auto s = demo;
    s.units.at(5).hp = 61;
    TENX_ASSERT(has_error(tenx::validate_game_state(s, &content), "Unit 5 hp 61 exceeds max 60"));
  }

  // next_id must stay ahead of every allocated id.
  {
    auto s = demo;
    s.next_id = 8;
    TENX_ASSERT(has_error(tenx::validate_game_state(s), "next_id 8 is not greater than max entity id 8"));
  }

  // Eliminated active participant.
  {
    auto s = demo;
    tenx::find_participant(s, 1)->is_eliminated = true;
    TENX_ASSERT(has_error(tenx::validate_game_state(s), "Active participant 1 is eliminated"));
  }

  // Map shape and key/id agreement.
  {
    auto s = demo;
    s.map.tiles.pop_back();
    auto u = s.units.at(8);
    s.units.erase(8);
    s.units[9] = u;
    s.next_id = 10;
    const auto errors = tenx::validate_game_state(s);
    TENX_ASSERT(has_error(errors, "Map tile count 79 does not match 10x8"));
    TENX_ASSERT(has_error(errors, "Unit id mismatch: key=9 value.id=8"));
  }

  // City hp out of range and an unknown owner.
  {
    auto s = demo;
    s.cities.at(6).hp = 150;
    s.cities.at(3).participant_id = 42;
    const auto errors = tenx::validate_game_state(s);
    TENX_ASSERT(has_error(errors, "City 6 hp 150 outside [0, "));
    TENX_ASSERT(has_error(errors, "City 3 has unknown owner 42"));
  }

  // Harvest bookkeeping: worked tiles must exist and stocks stay non-negative.
  {
    auto s = demo;
    s.cities.at(3).tiles.push_back(500);
    s.cities.at(6).resources["stone"] = -2;
    s.tile_resources[23] = -1;
    s.tile_resources[900] = 4;
    const auto errors = tenx::validate_game_state(s);
    TENX_ASSERT(has_error(errors, "City 3 works missing tile 500"));
    TENX_ASSERT(has_error(errors, "City 6 has negative stone stock -2"));
    TENX_ASSERT(has_error(errors, "Tile 23 has negative remaining resource"));
    TENX_ASSERT(has_error(errors, "Resource stock recorded for missing tile 900"));
  }

  return 0;
}

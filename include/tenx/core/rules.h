#pragma once

#include <map>
#include <string>

#include "tenx/core/actions.h"
#include "tenx/core/config.h"
#include "tenx/core/game_state.h"

namespace tenx {

// Validates req against s and, if legal, applies it in place.
//
// On failure the returned result carries the error kind and s is left
// untouched. On success s holds the post-action state and the result has
// ok == true with an empty state_json (the caller owns the state projection).
//
// This is the single-game rule set only: the action guard, idempotency and
// persistence live in TurnEngine.
ActionResult apply_action(GameState& s, const ContentDB& content, const EngineConfig& cfg, const ActionRequest& req);

// Hands a defeated (hp <= 0) city to new_owner with 1 HP, eliminates the previous
// owner when it has no cities left and finishes the game when new_owner holds
// every city. No-op for cities that still have HP or already belong to new_owner.
void capture_city(GameState& s, City& city, Id new_owner, const EngineConfig& cfg);

struct HarvestTotals {
  std::map<std::string, int> harvested;
  // Units a full stockpile could not take. The tile keeps them.
  std::map<std::string, int> overflow;
};

// Moves one unit from each worked resource tile into the city's stockpile.
// Tiles that are depleted or held by an enemy unit yield nothing; a resource
// already at storage_cap counts as overflow instead.
void harvest_city_resources(GameState& s, City& city, int storage_cap, HarvestTotals& totals);

// End-of-turn upkeep and hand-over: regenerates and harvests the ending
// participant's cities, clears every unit's has_acted flag, advances turn_no
// and passes the turn to the next non-eliminated participant.
void advance_turn(GameState& s, const EngineConfig& cfg);

} // namespace tenx

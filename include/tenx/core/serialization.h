#pragma once

#include <stdexcept>
#include <string>

#include "tenx/core/game_state.h"
#include "tenx/util/json.h"

namespace tenx {

// Thrown when a snapshot was written with a different schema_version.
class SchemaMismatchError : public std::runtime_error {
 public:
  SchemaMismatchError(int found, int expected);

  int found() const { return found_; }
  int expected() const { return expected_; }

 private:
  int found_;
  int expected_;
};

json::Value serialize_game_to_json_value(const GameState& state);

// Snapshot text. Entities are emitted in id order and object keys sorted, so
// equal states always produce identical bytes. indent == 0 gives the compact
// form used as the state projection in action results.
std::string serialize_game_to_json(const GameState& state, int indent = 2);

// Throws SchemaMismatchError on a version mismatch and std::runtime_error on
// malformed input or duplicate ids.
GameState deserialize_game_from_json(const std::string& json_text);

} // namespace tenx

#pragma once

#include <cstdint>
#include <string>

#include "tenx/core/game_state.h"

namespace tenx {

struct DigestOptions {
  // Include the persistent GameEvent log.
  bool include_events{true};
};

// Stable 64-bit digest of a game state.
//
//  - Deterministic across runs/platforms (no dependence on unordered_map iteration order).
//  - Ignores the transient action guard (turn_in_progress).
//  - Sensitive to turn order and to event order.
std::uint64_t digest_game_state64(const GameState& state, const DigestOptions& opt = {});

// Digest of the unit catalog, for identifying content sets in bug reports.
std::uint64_t digest_content_db64(const ContentDB& content);

// Fixed-width lowercase hex.
std::string digest64_to_hex(std::uint64_t v);

} // namespace tenx

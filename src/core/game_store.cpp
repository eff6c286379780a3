#include "tenx/core/game_store.h"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace tenx {

struct MemoryGameStore::Impl {
  struct Slot {
    std::mutex mu;
    GameState state;
  };

  mutable std::mutex mu;
  std::unordered_map<Id, std::shared_ptr<Slot>> slots;

  std::shared_ptr<Slot> slot(Id game_id) const {
    std::lock_guard<std::mutex> lock(mu);
    auto it = slots.find(game_id);
    return it == slots.end() ? nullptr : it->second;
  }
};

MemoryGameStore::MemoryGameStore() : impl_(std::make_unique<Impl>()) {}

MemoryGameStore::~MemoryGameStore() = default;

void MemoryGameStore::create(GameState state) {
  if (state.id == kInvalidId) throw std::invalid_argument("MemoryGameStore::create: game id is not set");

  auto slot = std::make_shared<Impl::Slot>();
  state.turn_in_progress = false;
  const Id id = state.id;
  slot->state = std::move(state);

  std::lock_guard<std::mutex> lock(impl_->mu);
  if (!impl_->slots.emplace(id, std::move(slot)).second) {
    throw std::invalid_argument("MemoryGameStore::create: game " + std::to_string(id) + " already exists");
  }
}

bool MemoryGameStore::contains(Id game_id) const { return impl_->slot(game_id) != nullptr; }

std::vector<Id> MemoryGameStore::game_ids() const {
  std::vector<Id> out;
  {
    std::lock_guard<std::mutex> lock(impl_->mu);
    out.reserve(impl_->slots.size());
    for (const auto& [id, _] : impl_->slots) out.push_back(id);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<GameState> MemoryGameStore::load(Id game_id) {
  auto slot = impl_->slot(game_id);
  if (!slot) return std::nullopt;
  std::lock_guard<std::mutex> lock(slot->mu);
  return slot->state;
}

bool MemoryGameStore::try_begin(Id game_id) {
  auto slot = impl_->slot(game_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lock(slot->mu);
  if (slot->state.turn_in_progress) return false;
  slot->state.turn_in_progress = true;
  return true;
}

void MemoryGameStore::commit(GameState state) {
  auto slot = impl_->slot(state.id);
  if (!slot) throw std::logic_error("MemoryGameStore::commit: unknown game " + std::to_string(state.id));
  std::lock_guard<std::mutex> lock(slot->mu);
  if (!slot->state.turn_in_progress) {
    throw std::logic_error("MemoryGameStore::commit: guard not held for game " + std::to_string(state.id));
  }
  state.turn_in_progress = true;
  slot->state = std::move(state);
}

void MemoryGameStore::release(Id game_id) {
  auto slot = impl_->slot(game_id);
  if (!slot) return;
  std::lock_guard<std::mutex> lock(slot->mu);
  slot->state.turn_in_progress = false;
}

} // namespace tenx

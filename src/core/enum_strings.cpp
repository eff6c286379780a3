#include "tenx/core/enum_strings.h"

#include <stdexcept>

#include "tenx/util/strings.h"

namespace tenx {

const char* terrain_to_string(Terrain t) {
  switch (t) {
    case Terrain::Grassland: return "grassland";
    case Terrain::Tundra: return "tundra";
    case Terrain::Tropical: return "tropical";
    case Terrain::Water: return "water";
    case Terrain::Ocean: return "ocean";
  }
  return "grassland";
}

Terrain terrain_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "grassland" || s == "plains") return Terrain::Grassland;
  if (s == "tundra") return Terrain::Tundra;
  if (s == "tropical") return Terrain::Tropical;
  if (s == "water") return Terrain::Water;
  if (s == "ocean") return Terrain::Ocean;
  throw std::runtime_error("Unknown terrain: " + raw);
}

bool is_water(Terrain t) { return t == Terrain::Water || t == Terrain::Ocean; }

const char* participant_kind_to_string(ParticipantKind k) {
  switch (k) {
    case ParticipantKind::Human: return "human";
    case ParticipantKind::Ai: return "ai";
  }
  return "human";
}

ParticipantKind participant_kind_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "human") return ParticipantKind::Human;
  if (s == "ai") return ParticipantKind::Ai;
  throw std::runtime_error("Unknown participant kind: " + raw);
}

const char* game_status_to_string(GameStatus s) {
  switch (s) {
    case GameStatus::Active: return "active";
    case GameStatus::Finished: return "finished";
  }
  return "active";
}

GameStatus game_status_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "active") return GameStatus::Active;
  if (s == "finished") return GameStatus::Finished;
  throw std::runtime_error("Unknown game status: " + raw);
}

const char* game_event_kind_to_string(GameEventKind k) {
  switch (k) {
    case GameEventKind::UnitMoved: return "unit_moved";
    case GameEventKind::UnitAttacked: return "unit_attacked";
    case GameEventKind::CityAttacked: return "city_attacked";
    case GameEventKind::UnitDestroyed: return "unit_destroyed";
    case GameEventKind::CityCaptured: return "city_captured";
    case GameEventKind::ParticipantEliminated: return "participant_eliminated";
    case GameEventKind::TurnEnded: return "turn_ended";
    case GameEventKind::GameFinished: return "game_finished";
  }
  return "unit_moved";
}

GameEventKind game_event_kind_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "unit_moved") return GameEventKind::UnitMoved;
  if (s == "unit_attacked") return GameEventKind::UnitAttacked;
  if (s == "city_attacked") return GameEventKind::CityAttacked;
  if (s == "unit_destroyed") return GameEventKind::UnitDestroyed;
  if (s == "city_captured") return GameEventKind::CityCaptured;
  if (s == "participant_eliminated") return GameEventKind::ParticipantEliminated;
  if (s == "turn_ended") return GameEventKind::TurnEnded;
  if (s == "game_finished") return GameEventKind::GameFinished;
  throw std::runtime_error("Unknown game event kind: " + raw);
}

} // namespace tenx

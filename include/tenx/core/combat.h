#pragma once

#include <optional>

#include "tenx/core/entities.h"

namespace tenx {

// Damage dealt by one hit.
//
// Both stats are scaled by their side's remaining health fraction (clamped to
// [0, 1]; a non-positive max counts as full health), a non-positive effective
// defence is treated as 1, and
//
//   value = atk * (1 + (atk - def) / def) * 0.5
//
// is rounded half away from zero. Never returns less than 1.
int compute_damage(int atk_stat, int def_stat, int attacker_hp, int attacker_max_hp, int defender_hp,
                   int defender_max_hp);

// A defender strikes back only when both sides are melee. Ranged attackers are
// never countered, and ranged defenders never counter, even when adjacent.
bool counterattack_allowed(const UnitDefinition& attacker, const UnitDefinition& defender);

// Range legality for an attack at hex distance `distance`: melee units need
// adjacency (distance 1), ranged units need range_min <= distance <= range_max.
bool attack_in_range(const UnitDefinition& attacker, int distance);

struct AttackOutcome {
  int damage{0};
  std::optional<int> counter_damage;
  int defender_hp_after{0};
  int attacker_hp_after{0};
  bool defender_destroyed{false};
  bool attacker_destroyed{false};
};

struct CityAttackOutcome {
  int damage{0};
  int city_hp_after{0};
  bool city_defeated{false};
};

// Pure: computes what resolve_unit_attack would do, without touching the units.
AttackOutcome forecast_unit_attack(const Unit& attacker, const UnitDefinition& attacker_def, const Unit& defender,
                                   const UnitDefinition& defender_def);

// Applies one unit-vs-unit attack: damage to the defender, then the counterattack
// if the defender survived and counterattack_allowed(). HP is clamped at 0.
// Destroyed units are reported, not removed; removal is the caller's job.
AttackOutcome resolve_unit_attack(Unit& attacker, const UnitDefinition& attacker_def, Unit& defender,
                                  const UnitDefinition& defender_def);

CityAttackOutcome forecast_city_attack(const Unit& attacker, const UnitDefinition& attacker_def, const City& city,
                                       int city_defence);

// Cities never counterattack. HP is clamped at 0.
CityAttackOutcome resolve_city_attack(const Unit& attacker, const UnitDefinition& attacker_def, City& city,
                                      int city_defence);

} // namespace tenx

#include "tenx/core/combat.h"

#include <algorithm>
#include <cmath>

namespace tenx {

namespace {

double health_ratio(int hp, int max_hp) {
  if (max_hp <= 0) return 1.0;
  return std::clamp(static_cast<double>(hp) / static_cast<double>(max_hp), 0.0, 1.0);
}

} // namespace

int compute_damage(int atk_stat, int def_stat, int attacker_hp, int attacker_max_hp, int defender_hp,
                   int defender_max_hp) {
  const double atk = static_cast<double>(atk_stat) * health_ratio(attacker_hp, attacker_max_hp);
  double def = static_cast<double>(def_stat) * health_ratio(defender_hp, defender_max_hp);
  if (def <= 0.0) def = 1.0;

  const double value = atk * (1.0 + (atk - def) / def) * 0.5;
  // std::lround rounds halfway cases away from zero.
  const long rounded = std::lround(value);
  return static_cast<int>(std::max<long>(1, rounded));
}

bool counterattack_allowed(const UnitDefinition& attacker, const UnitDefinition& defender) {
  return !attacker.is_ranged && !defender.is_ranged;
}

bool attack_in_range(const UnitDefinition& attacker, int distance) {
  if (!attacker.is_ranged) return distance == 1;
  return distance >= attacker.range_min && distance <= attacker.range_max;
}

AttackOutcome forecast_unit_attack(const Unit& attacker, const UnitDefinition& attacker_def, const Unit& defender,
                                   const UnitDefinition& defender_def) {
  AttackOutcome out;
  out.damage = compute_damage(attacker_def.attack, defender_def.defence, attacker.hp, attacker_def.health,
                              defender.hp, defender_def.health);
  out.defender_hp_after = std::max(0, defender.hp - out.damage);
  out.attacker_hp_after = attacker.hp;

  if (out.defender_hp_after > 0 && counterattack_allowed(attacker_def, defender_def)) {
    // The counter is computed from the defender's post-hit health.
    const int counter = compute_damage(defender_def.attack, attacker_def.defence, out.defender_hp_after,
                                       defender_def.health, attacker.hp, attacker_def.health);
    out.counter_damage = counter;
    out.attacker_hp_after = std::max(0, attacker.hp - counter);
  }

  out.defender_destroyed = out.defender_hp_after <= 0;
  out.attacker_destroyed = out.attacker_hp_after <= 0;
  return out;
}

AttackOutcome resolve_unit_attack(Unit& attacker, const UnitDefinition& attacker_def, Unit& defender,
                                  const UnitDefinition& defender_def) {
  const AttackOutcome out = forecast_unit_attack(attacker, attacker_def, defender, defender_def);
  defender.hp = out.defender_hp_after;
  attacker.hp = out.attacker_hp_after;
  return out;
}

CityAttackOutcome forecast_city_attack(const Unit& attacker, const UnitDefinition& attacker_def, const City& city,
                                       int city_defence) {
  CityAttackOutcome out;
  out.damage = compute_damage(attacker_def.attack, city_defence, attacker.hp, attacker_def.health, city.hp,
                              city.max_hp);
  out.city_hp_after = std::max(0, city.hp - out.damage);
  out.city_defeated = out.city_hp_after <= 0;
  return out;
}

CityAttackOutcome resolve_city_attack(const Unit& attacker, const UnitDefinition& attacker_def, City& city,
                                      int city_defence) {
  const CityAttackOutcome out = forecast_city_attack(attacker, attacker_def, city, city_defence);
  city.hp = out.city_hp_after;
  return out;
}

} // namespace tenx

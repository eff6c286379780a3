#include <iostream>

#include "tenx/core/combat.h"

#define TENX_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

tenx::UnitDefinition make_type(const char* code, int attack, int defence, int health, bool ranged) {
  tenx::UnitDefinition d;
  d.code = code;
  d.attack = attack;
  d.defence = defence;
  d.health = health;
  d.move_points = 2;
  d.is_ranged = ranged;
  if (ranged) {
    d.range_min = 1;
    d.range_max = 2;
  }
  return d;
}

tenx::Unit make_unit(tenx::Id id, const tenx::UnitDefinition& d, int hp) {
  tenx::Unit u;
  u.id = id;
  u.type_code = d.code;
  u.hp = hp;
  return u;
}

} // namespace

int test_combat() {
  const auto warrior = make_type("warrior", 20, 10, 100, false);
  const auto slinger = make_type("slinger", 15, 8, 60, true);

  // Damage formula.
  TENX_ASSERT(tenx::compute_damage(20, 10, 100, 100, 100, 100) == 20);
  TENX_ASSERT(tenx::compute_damage(20, 8, 100, 100, 60, 60) == 25);
  TENX_ASSERT(tenx::compute_damage(1, 100, 100, 100, 100, 100) == 1);
  TENX_ASSERT(tenx::compute_damage(20, 0, 100, 100, 100, 100) >= 1);
  TENX_ASSERT(tenx::compute_damage(20, 10, 0, 100, 100, 100) == 1);
  for (int i = 0; i < 5; ++i) TENX_ASSERT(tenx::compute_damage(20, 10, 73, 100, 41, 100) == tenx::compute_damage(20, 10, 73, 100, 41, 100));

  // Range legality.
  TENX_ASSERT(tenx::attack_in_range(warrior, 1));
  TENX_ASSERT(!tenx::attack_in_range(warrior, 2));
  TENX_ASSERT(!tenx::attack_in_range(warrior, 0));
  TENX_ASSERT(tenx::attack_in_range(slinger, 1));
  TENX_ASSERT(tenx::attack_in_range(slinger, 2));
  TENX_ASSERT(!tenx::attack_in_range(slinger, 3));

  TENX_ASSERT(tenx::counterattack_allowed(warrior, warrior));
  TENX_ASSERT(!tenx::counterattack_allowed(warrior, slinger));
  TENX_ASSERT(!tenx::counterattack_allowed(slinger, warrior));

  // Warrior hits slinger at adjacency: 60 -> 35, no counter from a ranged defender.
  {
    auto a = make_unit(1, warrior, 100);
    auto d = make_unit(2, slinger, 60);
    const auto out = tenx::resolve_unit_attack(a, warrior, d, slinger);
    TENX_ASSERT(out.damage == 25);
    TENX_ASSERT(d.hp == 35);
    TENX_ASSERT(a.hp == 100);
    TENX_ASSERT(!out.counter_damage.has_value());
    TENX_ASSERT(!out.defender_destroyed);
  }

  // Ranged attacker is never countered.
  {
    auto a = make_unit(1, slinger, 60);
    auto d = make_unit(2, warrior, 100);
    const auto out = tenx::resolve_unit_attack(a, slinger, d, warrior);
    TENX_ASSERT(out.damage == 11);
    TENX_ASSERT(d.hp == 89);
    TENX_ASSERT(a.hp == 60);
    TENX_ASSERT(!out.counter_damage.has_value());
  }

  // Melee vs melee: defender at 80 strikes back for 13.
  {
    auto a = make_unit(1, warrior, 100);
    auto d = make_unit(2, warrior, 100);
    const auto out = tenx::resolve_unit_attack(a, warrior, d, warrior);
    TENX_ASSERT(out.damage == 20);
    TENX_ASSERT(d.hp == 80);
    TENX_ASSERT(out.counter_damage.has_value());
    TENX_ASSERT(*out.counter_damage == 13);
    TENX_ASSERT(a.hp == 87);
  }

  // Wounded defender: counter computed from its post-hit health.
  {
    const auto guard = make_type("guard", 15, 12, 100, false);
    auto a = make_unit(1, warrior, 100);
    auto d = make_unit(2, guard, 80);
    const auto out = tenx::resolve_unit_attack(a, warrior, d, guard);
    TENX_ASSERT(out.damage == 21);
    TENX_ASSERT(d.hp == 59);
    TENX_ASSERT(out.counter_damage.has_value());
    TENX_ASSERT(*out.counter_damage == 4);
    TENX_ASSERT(a.hp == 96);
  }

  // Lethal hit: HP clamps at 0 and no counter.
  {
    auto a = make_unit(1, warrior, 100);
    auto d = make_unit(2, warrior, 7);
    const auto out = tenx::resolve_unit_attack(a, warrior, d, warrior);
    TENX_ASSERT(d.hp == 0);
    TENX_ASSERT(out.defender_destroyed);
    TENX_ASSERT(!out.counter_damage.has_value());
    TENX_ASSERT(a.hp == 100);
  }

  // Forecast does not mutate and matches resolve.
  {
    const auto a = make_unit(1, warrior, 64);
    const auto d = make_unit(2, warrior, 90);
    const auto f = tenx::forecast_unit_attack(a, warrior, d, warrior);
    TENX_ASSERT(a.hp == 64);
    TENX_ASSERT(d.hp == 90);
    auto a2 = a;
    auto d2 = d;
    const auto r = tenx::resolve_unit_attack(a2, warrior, d2, warrior);
    TENX_ASSERT(f.damage == r.damage);
    TENX_ASSERT(f.attacker_hp_after == a2.hp);
    TENX_ASSERT(f.defender_hp_after == d2.hp);
  }

  // City at 50/100 hit by attack 25: 50 - 42 = 8, never a counter.
  {
    const auto champion = make_type("champion", 25, 10, 100, false);
    const auto a = make_unit(1, champion, 100);
    tenx::City city;
    city.id = 3;
    city.hp = 50;
    city.max_hp = 100;
    const auto out = tenx::resolve_city_attack(a, champion, city, 15);
    TENX_ASSERT(out.damage == 42);
    TENX_ASSERT(city.hp == 8);
    TENX_ASSERT(!out.city_defeated);
    TENX_ASSERT(a.hp == 100);

    const auto finisher = tenx::resolve_city_attack(a, champion, city, 15);
    TENX_ASSERT(city.hp == 0);
    TENX_ASSERT(finisher.city_defeated);
  }

  return 0;
}

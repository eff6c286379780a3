#include "tenx/core/content.h"

#include <stdexcept>

namespace tenx {

namespace {

UnitDefinition unit_type_from_json(const json::Value& v) {
  UnitDefinition d;
  d.code = v.at("code").string_value();
  d.attack = static_cast<int>(v.at("attack").int_value());
  d.defence = static_cast<int>(v.at("defence").int_value());
  d.health = static_cast<int>(v.at("health").int_value());
  d.move_points = static_cast<int>(v.at("move_points").int_value());
  if (const auto* p = v.find("is_ranged")) d.is_ranged = p->bool_value();
  if (const auto* p = v.find("range_min")) d.range_min = static_cast<int>(p->int_value());
  if (const auto* p = v.find("range_max")) d.range_max = static_cast<int>(p->int_value());

  if (d.code.empty()) throw std::runtime_error("unit type has an empty code");
  if (d.health <= 0) throw std::runtime_error("unit type '" + d.code + "' must have positive health");
  if (d.move_points < 0) throw std::runtime_error("unit type '" + d.code + "' has negative move_points");
  if (d.is_ranged && (d.range_min < 1 || d.range_max < d.range_min)) {
    throw std::runtime_error("unit type '" + d.code + "' has an invalid range");
  }
  return d;
}

} // namespace

ContentDB default_content() {
  ContentDB c;

  UnitDefinition warrior;
  warrior.code = "warrior";
  warrior.attack = 20;
  warrior.defence = 10;
  warrior.health = 100;
  warrior.move_points = 2;
  c.unit_types[warrior.code] = warrior;

  UnitDefinition slinger;
  slinger.code = "slinger";
  slinger.attack = 15;
  slinger.defence = 8;
  slinger.health = 60;
  slinger.move_points = 2;
  slinger.is_ranged = true;
  slinger.range_min = 1;
  slinger.range_max = 2;
  c.unit_types[slinger.code] = slinger;

  return c;
}

ContentDB load_content_from_json(const std::string& json_text) {
  const json::Value root = json::parse(json_text);
  ContentDB c;
  for (const auto& entry : root.at("unit_types").array()) {
    UnitDefinition d = unit_type_from_json(entry);
    const std::string code = d.code;
    if (!c.unit_types.emplace(code, std::move(d)).second) {
      throw std::runtime_error("duplicate unit type code: " + code);
    }
  }
  return c;
}

const UnitDefinition* find_unit_type(const ContentDB& content, const std::string& code) {
  return find_ptr(content.unit_types, code);
}

} // namespace tenx

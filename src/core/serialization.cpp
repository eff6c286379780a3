#include "tenx/core/serialization.h"

#include <utility>

#include "tenx/core/enum_strings.h"
#include "tenx/util/sorted_keys.h"

namespace tenx {
namespace {

using json::Array;
using json::Object;
using json::Value;

Value id_value(Id id) { return static_cast<double>(id); }

Id id_from(const Value& v) { return static_cast<Id>(v.int_value()); }

int int_from(const Value& v) { return static_cast<int>(v.int_value()); }

Value map_to_json(const Map& m) {
  Object o;
  o["code"] = m.code;
  o["width"] = static_cast<double>(m.width);
  o["height"] = static_cast<double>(m.height);

  Array tiles;
  tiles.reserve(m.tiles.size());
  for (const auto& t : m.tiles) {
    Object to;
    to["id"] = id_value(t.id);
    to["row"] = static_cast<double>(t.pos.row);
    to["col"] = static_cast<double>(t.pos.col);
    to["terrain"] = std::string(terrain_to_string(t.terrain));
    if (!t.resource_type.empty()) {
      to["resource_type"] = t.resource_type;
      to["resource_amount"] = static_cast<double>(t.resource_amount);
    }
    tiles.push_back(std::move(to));
  }
  o["tiles"] = std::move(tiles);
  return o;
}

Map map_from_json(const Value& v) {
  Map m;
  m.code = v.at("code").string_value();
  m.width = int_from(v.at("width"));
  m.height = int_from(v.at("height"));
  for (const auto& tv : v.at("tiles").array()) {
    Tile t;
    t.id = id_from(tv.at("id"));
    t.pos.row = int_from(tv.at("row"));
    t.pos.col = int_from(tv.at("col"));
    t.terrain = terrain_from_string(tv.at("terrain").string_value());
    if (const auto* rt = tv.find("resource_type")) t.resource_type = rt->string_value();
    if (const auto* ra = tv.find("resource_amount")) t.resource_amount = int_from(*ra);
    m.tiles.push_back(std::move(t));
  }
  return m;
}

} // namespace

SchemaMismatchError::SchemaMismatchError(int found, int expected)
    : std::runtime_error("Snapshot schema_version " + std::to_string(found) + " does not match expected " +
                         std::to_string(expected)),
      found_(found),
      expected_(expected) {}

json::Value serialize_game_to_json_value(const GameState& s) {
  Object root;
  root["schema_version"] = static_cast<double>(s.schema_version);
  root["id"] = id_value(s.id);
  root["turn_no"] = static_cast<double>(s.turn_no);
  root["active_participant_id"] = id_value(s.active_participant_id);
  root["status"] = std::string(game_status_to_string(s.status));
  root["turn_in_progress"] = s.turn_in_progress;
  root["next_id"] = id_value(s.next_id);
  root["next_event_seq"] = static_cast<double>(s.next_event_seq);
  root["map"] = map_to_json(s.map);

  Array participants;
  for (const auto& p : s.participants) {
    Object o;
    o["id"] = id_value(p.id);
    o["display_name"] = p.display_name;
    o["kind"] = std::string(participant_kind_to_string(p.kind));
    o["is_eliminated"] = p.is_eliminated;
    participants.push_back(std::move(o));
  }
  root["participants"] = std::move(participants);

  Array units;
  for (Id id : util::sorted_keys(s.units)) {
    const auto& u = s.units.at(id);
    Object o;
    o["id"] = id_value(u.id);
    o["participant_id"] = id_value(u.participant_id);
    o["type"] = u.type_code;
    o["hp"] = static_cast<double>(u.hp);
    o["tile_id"] = id_value(u.tile_id);
    o["has_acted"] = u.has_acted;
    units.push_back(std::move(o));
  }
  root["units"] = std::move(units);

  Array cities;
  for (Id id : util::sorted_keys(s.cities)) {
    const auto& c = s.cities.at(id);
    Object o;
    o["id"] = id_value(c.id);
    o["participant_id"] = id_value(c.participant_id);
    o["tile_id"] = id_value(c.tile_id);
    o["hp"] = static_cast<double>(c.hp);
    o["max_hp"] = static_cast<double>(c.max_hp);
    Array worked;
    for (Id tile_id : c.tiles) worked.push_back(id_value(tile_id));
    o["tiles"] = std::move(worked);
    Object stock;
    for (const auto& type : util::sorted_keys(c.resources)) stock[type] = static_cast<double>(c.resources.at(type));
    o["resources"] = std::move(stock);
    cities.push_back(std::move(o));
  }
  root["cities"] = std::move(cities);

  Array tile_resources;
  for (Id tile_id : util::sorted_keys(s.tile_resources)) {
    Object o;
    o["tile_id"] = id_value(tile_id);
    o["amount"] = static_cast<double>(s.tile_resources.at(tile_id));
    tile_resources.push_back(std::move(o));
  }
  root["tile_resources"] = std::move(tile_resources);

  Array events;
  for (const auto& ev : s.events) {
    Object o;
    o["seq"] = static_cast<double>(ev.seq);
    o["turn_no"] = static_cast<double>(ev.turn_no);
    o["kind"] = std::string(game_event_kind_to_string(ev.kind));
    o["participant_id"] = id_value(ev.participant_id);
    o["message"] = ev.message;
    events.push_back(std::move(o));
  }
  root["events"] = std::move(events);

  return root;
}

std::string serialize_game_to_json(const GameState& state, int indent) {
  return json::stringify(serialize_game_to_json_value(state), indent);
}

GameState deserialize_game_from_json(const std::string& json_text) {
  const Value root = json::parse(json_text);
  if (!root.is_object()) throw std::runtime_error("Snapshot must be a JSON object");

  const Value* ver = root.find("schema_version");
  if (!ver) throw std::runtime_error("Snapshot is missing schema_version");
  const int version = int_from(*ver);
  if (version != kCurrentSchemaVersion) throw SchemaMismatchError(version, kCurrentSchemaVersion);

  GameState s;
  s.schema_version = version;
  s.id = id_from(root.at("id"));
  s.turn_no = int_from(root.at("turn_no"));
  s.active_participant_id = id_from(root.at("active_participant_id"));
  s.status = game_status_from_string(root.at("status").string_value());
  if (const auto* v = root.find("turn_in_progress")) s.turn_in_progress = v->bool_value();

  s.next_id = 1;
  if (const auto* v = root.find("next_id")) s.next_id = static_cast<Id>(v->int_value(1));
  s.next_event_seq = 1;
  if (const auto* v = root.find("next_event_seq")) s.next_event_seq = static_cast<std::uint64_t>(v->int_value(1));
  if (s.next_event_seq == 0) s.next_event_seq = 1;

  s.map = map_from_json(root.at("map"));

  for (const auto& pv : root.at("participants").array()) {
    Participant p;
    p.id = id_from(pv.at("id"));
    p.display_name = pv.at("display_name").string_value();
    p.kind = participant_kind_from_string(pv.at("kind").string_value());
    if (const auto* e = pv.find("is_eliminated")) p.is_eliminated = e->bool_value();
    if (find_participant(s, p.id)) {
      throw std::runtime_error("Duplicate participant id " + std::to_string(p.id));
    }
    s.participants.push_back(std::move(p));
  }

  for (const auto& uv : root.at("units").array()) {
    Unit u;
    u.id = id_from(uv.at("id"));
    u.participant_id = id_from(uv.at("participant_id"));
    u.type_code = uv.at("type").string_value();
    u.hp = int_from(uv.at("hp"));
    u.tile_id = id_from(uv.at("tile_id"));
    if (const auto* a = uv.find("has_acted")) u.has_acted = a->bool_value();
    const Id id = u.id;
    if (!s.units.emplace(id, std::move(u)).second) {
      throw std::runtime_error("Duplicate unit id " + std::to_string(id));
    }
  }

  for (const auto& cv : root.at("cities").array()) {
    City c;
    c.id = id_from(cv.at("id"));
    c.participant_id = id_from(cv.at("participant_id"));
    c.tile_id = id_from(cv.at("tile_id"));
    c.hp = int_from(cv.at("hp"));
    c.max_hp = int_from(cv.at("max_hp"));
    if (const auto* worked = cv.find("tiles")) {
      for (const auto& tv : worked->array()) c.tiles.push_back(id_from(tv));
    }
    if (const auto* stock = cv.find("resources")) {
      for (const auto& [type, amount] : stock->object()) c.resources[type] = int_from(amount);
    }
    const Id id = c.id;
    if (!s.cities.emplace(id, c).second) {
      throw std::runtime_error("Duplicate city id " + std::to_string(id));
    }
  }

  if (const auto* left = root.find("tile_resources")) {
    for (const auto& rv : left->array()) {
      const Id tile_id = id_from(rv.at("tile_id"));
      if (!s.tile_resources.emplace(tile_id, int_from(rv.at("amount"))).second) {
        throw std::runtime_error("Duplicate tile_resources entry for tile " + std::to_string(tile_id));
      }
    }
  }

  if (const auto* ev_list = root.find("events")) {
    for (const auto& evv : ev_list->array()) {
      GameEvent ev;
      ev.seq = static_cast<std::uint64_t>(evv.at("seq").int_value());
      ev.turn_no = int_from(evv.at("turn_no"));
      ev.kind = game_event_kind_from_string(evv.at("kind").string_value());
      ev.participant_id = id_from(evv.at("participant_id"));
      ev.message = evv.at("message").string_value();
      s.events.push_back(std::move(ev));
    }
  }

  return s;
}

} // namespace tenx

#include "tenx/core/config.h"

#include <stdexcept>

namespace tenx {

namespace {

void read_int(const json::Value& root, const char* key, int& out) {
  const json::Value* v = root.find(key);
  if (!v) return;
  if (!v->is_number()) throw std::runtime_error(std::string("config: '") + key + "' must be a number");
  out = static_cast<int>(v->int_value());
}

void read_bool(const json::Value& root, const char* key, bool& out) {
  const json::Value* v = root.find(key);
  if (!v) return;
  if (!v->is_bool()) throw std::runtime_error(std::string("config: '") + key + "' must be a boolean");
  out = v->bool_value();
}

void read_string(const json::Value& root, const char* key, std::string& out) {
  const json::Value* v = root.find(key);
  if (!v) return;
  if (!v->is_string()) throw std::runtime_error(std::string("config: '") + key + "' must be a string");
  out = v->string_value();
}

} // namespace

EngineConfig load_engine_config_from_json(const std::string& json_text, EngineConfig base) {
  const json::Value root = json::parse(json_text);
  if (!root.is_object()) throw std::runtime_error("config: top-level value must be an object");

  read_int(root, "city_defence", base.city_defence);
  read_int(root, "city_regen_normal", base.city_regen_normal);
  read_int(root, "city_regen_under_siege", base.city_regen_under_siege);
  read_int(root, "resource_storage_cap", base.resource_storage_cap);
  read_int(root, "idempotency_ttl_seconds", base.idempotency_ttl_seconds);
  read_bool(root, "block_live_enemy_cities", base.block_live_enemy_cities);
  read_int(root, "max_events", base.max_events);
  read_string(root, "log_level", base.log_level);

  if (base.city_defence < 0) throw std::runtime_error("config: city_defence must be >= 0");
  if (base.resource_storage_cap < 0) throw std::runtime_error("config: resource_storage_cap must be >= 0");
  if (base.idempotency_ttl_seconds <= 0) throw std::runtime_error("config: idempotency_ttl_seconds must be > 0");
  if (base.max_events < 0) throw std::runtime_error("config: max_events must be >= 0");
  return base;
}

json::Value engine_config_to_json(const EngineConfig& cfg) {
  json::Object o;
  o["city_defence"] = static_cast<double>(cfg.city_defence);
  o["city_regen_normal"] = static_cast<double>(cfg.city_regen_normal);
  o["city_regen_under_siege"] = static_cast<double>(cfg.city_regen_under_siege);
  o["resource_storage_cap"] = static_cast<double>(cfg.resource_storage_cap);
  o["idempotency_ttl_seconds"] = static_cast<double>(cfg.idempotency_ttl_seconds);
  o["block_live_enemy_cities"] = cfg.block_live_enemy_cities;
  o["max_events"] = static_cast<double>(cfg.max_events);
  o["log_level"] = cfg.log_level;
  return o;
}

} // namespace tenx

#include <iostream>
#include <stdexcept>
#include <optional>
#include <string>
#include <vector>

#include "tenx/core/actions.h"
#include "tenx/core/config.h"
#include "tenx/core/content.h"
#include "tenx/core/enum_strings.h"
#include "tenx/core/game_store.h"
#include "tenx/core/idempotency_store.h"
#include "tenx/core/pathfinder.h"
#include "tenx/core/scenario.h"
#include "tenx/core/serialization.h"
#include "tenx/core/state_validation.h"
#include "tenx/core/turn_engine.h"
#include "tenx/util/digest.h"
#include "tenx/util/file_io.h"
#include "tenx/util/json.h"
#include "tenx/util/log.h"
#include "tenx/util/strings.h"

namespace {

#ifndef TENX_VERSION
#define TENX_VERSION "unknown"
#endif

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

// "--path R,C R,C": the two positions following the flag.
bool get_path_args(int argc, char** argv, std::string& from, std::string& to) {
  for (int i = 1; i < argc - 2; ++i) {
    if (std::string(argv[i]) == "--path") {
      from = argv[i + 1];
      to = argv[i + 2];
      return true;
    }
  }
  return false;
}

std::optional<tenx::GridPosition> parse_position(const std::string& raw) {
  const auto parts = tenx::split(raw, ',');
  if (parts.size() != 2) return std::nullopt;
  try {
    tenx::GridPosition p;
    p.row = std::stoi(tenx::trim(parts[0]));
    p.col = std::stoi(tenx::trim(parts[1]));
    return p;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

void print_usage(const char* exe) {
  std::cout << "TenX engine CLI v" << TENX_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "tenx_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --scenario PATH   Game snapshot JSON to load (default: built-in demo skirmish)\n";
  std::cout << "  --content PATH    Unit catalog JSON (default: built-in warrior/slinger catalog)\n";
  std::cout << "  --config PATH     Engine config JSON (default: built-in defaults)\n";
  std::cout << "  --actions PATH    JSON list of action requests to execute in order\n";
  std::cout << "  --log-level LVL   debug|info|warn|error|off (overrides the config file)\n";
  std::cout << "  --validate        Validate the final state; exit 1 on errors\n";
  std::cout << "  --digest          Print the 64-bit state digest\n";
  std::cout << "  --path R,C R,C    Print the shortest path between two positions on the final board\n";
  std::cout << "  --budget N        Movement budget for --path (default: 2)\n";
  std::cout << "  --save PATH       Write the final state snapshot\n";
  std::cout << "  --dump            Print the final state snapshot to stdout\n";
  std::cout << "  --quiet           Suppress non-essential output\n";
  std::cout << "  --version         Print the version and exit\n";
}

std::vector<tenx::ActionRequest> load_actions(const std::string& path) {
  const auto root = tenx::json::parse(tenx::read_text_file(path));
  const tenx::json::Array* list = root.as_array();
  if (!list) list = &root.at("actions").array();

  std::vector<tenx::ActionRequest> out;
  out.reserve(list->size());
  for (const auto& v : *list) out.push_back(tenx::action_request_from_json(v));
  return out;
}

void print_path_query(const tenx::GameState& s, const std::string& from_raw, const std::string& to_raw, int budget) {
  const auto from = parse_position(from_raw);
  const auto to = parse_position(to_raw);
  if (!from || !to) throw std::runtime_error("--path expects positions as ROW,COL");

  tenx::BoardIndex board(s);
  const tenx::Tile* start_tile = board.tile_at(*from);
  const tenx::Id start_id = start_tile ? start_tile->id : tenx::kInvalidId;
  const tenx::BlockedFn blocked = [&board, start_id](const tenx::GridPosition& p) {
    const tenx::Tile* t = board.tile_at(p);
    if (!t || tenx::is_water(t->terrain)) return true;
    return t->id != start_id && board.unit_on(t->id) != tenx::kInvalidId;
  };

  const auto path = tenx::find_path(*from, *to, budget, s.map.width, s.map.height, blocked);
  std::cout << "path " << tenx::to_string(*from) << " -> " << tenx::to_string(*to) << " (budget " << budget << "): ";
  if (!path) {
    std::cout << "none\n";
    return;
  }
  for (std::size_t i = 0; i < path->size(); ++i) {
    if (i) std::cout << " ";
    std::cout << tenx::to_string((*path)[i]);
  }
  std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << TENX_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string scenario_path = get_str_arg(argc, argv, "--scenario", "");
    const std::string content_path = get_str_arg(argc, argv, "--content", "");
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string actions_path = get_str_arg(argc, argv, "--actions", "");
    const std::string save_path = get_str_arg(argc, argv, "--save", "");
    const std::string log_level = get_str_arg(argc, argv, "--log-level", "");
    const int budget = std::stoi(get_str_arg(argc, argv, "--budget", "2"));
    const bool quiet = has_flag(argc, argv, "--quiet");

    tenx::EngineConfig cfg;
    if (!config_path.empty()) cfg = tenx::load_engine_config_from_json(tenx::read_text_file(config_path));
    tenx::log::set_level(tenx::log::parse_level(log_level.empty() ? cfg.log_level : log_level));

    const tenx::ContentDB content =
        content_path.empty() ? tenx::default_content() : tenx::load_content_from_json(tenx::read_text_file(content_path));

    tenx::GameState initial = scenario_path.empty() ? tenx::make_demo_scenario(content)
                                                    : tenx::deserialize_game_from_json(tenx::read_text_file(scenario_path));
    const auto load_errors = tenx::validate_game_state(initial, &content);
    if (!load_errors.empty()) {
      std::cerr << "Scenario validation failed:\n";
      for (const auto& e : load_errors) std::cerr << "  - " << e << "\n";
      return 1;
    }

    const tenx::Id game_id = initial.id;
    tenx::MemoryGameStore store;
    store.create(std::move(initial));
    tenx::MemoryIdempotencyStore idempotency;
    tenx::TurnEngine engine(store, idempotency, content, cfg);

    if (!actions_path.empty()) {
      const auto actions = load_actions(actions_path);
      int ok = 0;
      int failed = 0;
      for (std::size_t i = 0; i < actions.size(); ++i) {
        const auto& req = actions[i];
        const tenx::ActionResult r = engine.execute(game_id, req);
        if (r.ok) {
          ++ok;
        } else {
          ++failed;
        }
        if (quiet) continue;
        std::cout << "#" << (i + 1) << " " << tenx::action_kind_to_string(req.kind) << " actor=" << req.actor_participant_id;
        if (r.ok) {
          std::cout << " ok\n";
        } else {
          std::cout << " " << tenx::error_kind_to_string(r.error) << ": " << r.message << "\n";
        }
      }
      if (!quiet) std::cout << ok << " ok, " << failed << " failed\n";
    }

    const auto final_state = store.load(game_id);
    if (!final_state) throw std::runtime_error("game vanished from the store");
    const tenx::GameState& s = *final_state;

    if (!quiet) {
      std::cout << "turn " << s.turn_no << ", status " << tenx::game_status_to_string(s.status)
                << ", active participant " << s.active_participant_id << ", " << s.units.size() << " units, "
                << s.cities.size() << " cities\n";
    }

    std::string path_from;
    std::string path_to;
    if (get_path_args(argc, argv, path_from, path_to)) print_path_query(s, path_from, path_to, budget);

    if (has_flag(argc, argv, "--digest")) {
      std::cout << "digest " << tenx::digest64_to_hex(tenx::digest_game_state64(s)) << "\n";
    }

    if (has_flag(argc, argv, "--validate")) {
      const auto errors = tenx::validate_game_state(s, &content);
      if (!errors.empty()) {
        std::cerr << "State validation failed:\n";
        for (const auto& e : errors) std::cerr << "  - " << e << "\n";
        return 1;
      }
      if (!quiet) std::cout << "State OK\n";
    }

    if (!save_path.empty()) {
      tenx::write_text_file(save_path, tenx::serialize_game_to_json(s));
      if (!quiet) std::cout << "Saved to " << save_path << "\n";
    }

    if (has_flag(argc, argv, "--dump")) {
      std::cout << "\n--- JSON ---\n" << tenx::serialize_game_to_json(s) << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    tenx::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}

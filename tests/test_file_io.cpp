#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "tenx/util/file_io.h"

#define TENX_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  struct CwdGuard {
    fs::path saved;
    explicit CwdGuard(fs::path p) : saved(std::move(p)) {}
    ~CwdGuard() {
      std::error_code ec_restore;
      fs::current_path(saved, ec_restore);
    }
  };

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "tenx_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  // Parent directories are created on write.
  const fs::path target = dir / "saves" / "game.json";
  tenx::write_text_file(target.string(), "{\"turn_no\": 1}\n");
  TENX_ASSERT(tenx::read_text_file(target.string()) == "{\"turn_no\": 1}\n");

  tenx::write_text_file(target.string(), "{\"turn_no\": 2}\n");
  TENX_ASSERT(tenx::read_text_file(target.string()) == "{\"turn_no\": 2}\n");

  bool threw = false;
  try {
    (void)tenx::read_text_file((dir / "missing.json").string());
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("missing.json") != std::string::npos;
  }
  TENX_ASSERT(threw);

  // Relative data paths resolve from a working directory outside the repo.
  {
    const fs::path old_cwd = fs::current_path(ec);
    TENX_ASSERT(!ec);
    CwdGuard cwd_guard(old_cwd);
    fs::current_path(dir, ec);
    TENX_ASSERT(!ec);

    const std::string catalog = tenx::read_text_file("data/unit_definitions.json");
    TENX_ASSERT(catalog.find("\"unit_types\"") != std::string::npos);
  }

  // No temp siblings are left behind.
  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    TENX_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  fs::remove_all(dir, ec);
  return 0;
}

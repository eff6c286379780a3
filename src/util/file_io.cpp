#include "tenx/util/file_io.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace tenx {

namespace fs = std::filesystem;

namespace {

fs::path temp_sibling(const fs::path& target) {
  static std::atomic<unsigned> counter{0};
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string name = target.filename().string() + ".tmp." + std::to_string(now) + "." +
                     std::to_string(counter.fetch_add(1));
  const auto dir = target.parent_path();
  return dir.empty() ? fs::path(name) : (dir / name);
}

// Removes the temp file unless the write completed and the rename happened.
struct TempFileCleanup {
  fs::path path;
  bool active{true};
  explicit TempFileCleanup(fs::path p) : path(std::move(p)) {}
  ~TempFileCleanup() {
    if (!active) return;
    std::error_code ec;
    fs::remove(path, ec);
  }
  void release() { active = false; }
};

fs::path resolve_read_path(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute()) return requested;
  if (fs::exists(requested, ec) && !ec) return requested;

  std::vector<fs::path> roots;
#ifdef TENX_SOURCE_DIR
  roots.emplace_back(TENX_SOURCE_DIR);
#endif
  ec.clear();
  fs::path cur = fs::current_path(ec);
  if (!ec) {
    for (int depth = 0; depth < 8 && !cur.empty(); ++depth) {
      roots.push_back(cur);
      const auto parent = cur.parent_path();
      if (parent == cur) break;
      cur = parent;
    }
  }

  for (const auto& root : roots) {
    ec.clear();
    const auto candidate = root / requested;
    if (fs::exists(candidate, ec) && !ec) return candidate;
  }
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path resolved = resolve_read_path(fs::path(path));
  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path p(path);
  if (p.has_parent_path()) ensure_dir(p.parent_path().string());

  const fs::path tmp = temp_sibling(p);
  TempFileCleanup cleanup(tmp);
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, p, ec);
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  cleanup.release();
}

} // namespace tenx

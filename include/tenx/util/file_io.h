#pragma once

#include <string>

namespace tenx {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are also tried
// against TENX_SOURCE_DIR (when defined) and the parents of the working
// directory, so tests and the CLI can find data/ from a build tree.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
// Uses a temporary sibling file + rename so a crash never leaves a truncated file.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

} // namespace tenx

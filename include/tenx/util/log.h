#pragma once

#include <string>

namespace tenx::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Accepts "debug", "info", "warn", "error", "off" (any case).
// Unknown strings map to Info.
Level parse_level(const std::string& s);
const char* level_name(Level l);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace tenx::log

#pragma once

#include <string>
#include <vector>

namespace tenx {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim(const std::string& s);

// Splits on a single delimiter. Empty fields are kept.
std::vector<std::string> split(const std::string& s, char delim);

} // namespace tenx

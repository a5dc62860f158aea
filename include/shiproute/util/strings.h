#pragma once

#include <string>

namespace shiproute {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim(const std::string& s);

// Fixed-precision decimal rendering used in log lines and file names.
std::string format_fixed(double v, int precision = 4);

} // namespace shiproute

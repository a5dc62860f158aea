#pragma once

#include <functional>
#include <string>

namespace shiproute::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Receives every message that passes the level filter.
using Sink = std::function<void(Level, const std::string&)>;

void set_level(Level lvl);
Level level();

// Parses "debug", "info", "warn"/"warning", "error", "off" (case-insensitive).
// Throws std::invalid_argument for anything else.
Level level_from_string(const std::string& s);
const char* level_label(Level l);

// Replaces the default stderr sink. Passing an empty function restores it.
void set_sink(Sink sink);
void reset_sink();

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace shiproute::log

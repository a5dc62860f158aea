#include "shiproute/util/log.h"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "shiproute/util/strings.h"

namespace shiproute::log {
namespace {

std::mutex g_mu;
Level g_level = Level::Info;
Sink g_sink;

void emit(Level l, const std::string& msg) {
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_level == Level::Off || l < g_level) return;
  if (g_sink) {
    g_sink(l, msg);
    return;
  }
  std::cerr << "[" << level_label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_level = lvl;
}

Level level() {
  std::lock_guard<std::mutex> lock(g_mu);
  return g_level;
}

const char* level_label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
  }
  return "";
}

Level level_from_string(const std::string& s) {
  const std::string v = to_lower(trim(s));
  if (v == "debug") return Level::Debug;
  if (v == "info") return Level::Info;
  if (v == "warn" || v == "warning") return Level::Warn;
  if (v == "error") return Level::Error;
  if (v == "off") return Level::Off;
  throw std::invalid_argument("Unknown log level: '" + s + "'");
}

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = std::move(sink);
}

void reset_sink() { set_sink(Sink{}); }

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace shiproute::log

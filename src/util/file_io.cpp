#include "shiproute/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace shiproute {

namespace fs = std::filesystem;

namespace {

fs::path temp_sibling(const fs::path& target) {
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::string base = target.filename().string() + ".tmp." + std::to_string(now);
  const fs::path dir = target.parent_path();
  for (int attempt = 0; attempt < 100; ++attempt) {
    const std::string name = attempt == 0 ? base : base + "." + std::to_string(attempt);
    fs::path candidate = dir.empty() ? fs::path(name) : dir / name;
    std::error_code ec;
    if (!fs::exists(candidate, ec) && !ec) return candidate;
  }
  return dir.empty() ? fs::path(base) : dir / base;
}

// Removes the temp file unless the write was committed.
struct TempGuard {
  fs::path path;
  bool committed{false};
  explicit TempGuard(fs::path p) : path(std::move(p)) {}
  ~TempGuard() {
    if (committed) return;
    std::error_code ec;
    fs::remove(path, ec);
  }
};

} // namespace

std::string read_text_file(const std::string& path) {
  std::ifstream in(fs::path(path), std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + path);
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
  }
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path p(path);
  if (p.has_parent_path()) ensure_dir(p.parent_path().string());

  TempGuard tmp(temp_sibling(p));
  {
    std::ofstream out(tmp.path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.path.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.path.string());
  }

  std::error_code ec;
  fs::rename(tmp.path, p, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(p, rm_ec);
    ec.clear();
    fs::rename(tmp.path, p, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  tmp.committed = true;
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && !ec;
}

bool is_readable_dir(const std::string& path) {
  if (path.empty()) return false;
  std::error_code ec;
  if (!fs::is_directory(path, ec) || ec) return false;
  fs::directory_iterator it(path, ec);
  return !ec;
}

std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  return (fs::path(dir) / name).string();
}

} // namespace shiproute

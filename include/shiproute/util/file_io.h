#pragma once

#include <string>

namespace shiproute {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// The contents go to a temporary sibling first and are renamed into place, so a
// reader never observes a half-written file.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

bool file_exists(const std::string& path);

// True if `path` names an existing directory whose entries can be listed.
bool is_readable_dir(const std::string& path);

// Joins a directory and a file name with the platform separator.
std::string join_path(const std::string& dir, const std::string& name);

} // namespace shiproute

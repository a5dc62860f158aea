#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace shiproute {

// Base of every error raised by the genetic operators. Catching this (or
// std::runtime_error) is enough to discard a single bad individual.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad or missing factory/config argument. Raised before any optimization work.
class ConfigurationError : public Error {
 public:
  explicit ConfigurationError(const std::string& msg) : Error(msg) {}
};

// An expected route artifact is absent. The GeoJSON initializer recovers from
// this by substituting a great-circle route.
class MissingArtifactError : public Error {
 public:
  MissingArtifactError(const std::string& msg, std::string path) : Error(msg), path_(std::move(path)) {}

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

// A route cannot be processed: too short for an operator's index arithmetic,
// or a malformed route artifact.
class InvalidRouteError : public Error {
 public:
  explicit InvalidRouteError(const std::string& msg) : Error(msg) {}
};

// The pathfinder could not connect the requested cells.
class PathNotFoundError : public Error {
 public:
  explicit PathNotFoundError(const std::string& msg) : Error(msg) {}
};

// Failure inside a best-effort population observer. Only ever logged.
class DiagnosticError : public Error {
 public:
  explicit DiagnosticError(const std::string& msg) : Error(msg) {}
};

} // namespace shiproute

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace treetags {

class EngineError : public std::runtime_error {
public:
  enum class Kind { kDecode, kParse, kIo };

  EngineError(Kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

// A grammar library or tag query that could not be loaded. Only the one
// profile is affected.
class ProfileLoadError : public std::runtime_error {
public:
  ProfileLoadError(std::string language, const std::string &message)
      : std::runtime_error(message), language_(std::move(language)) {}

  const std::string &language() const { return language_; }

private:
  std::string language_;
};

class TagFileError : public std::runtime_error {
public:
  enum class Kind { kMissing, kUnrecognizedHeader, kIo };

  TagFileError(Kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

} // namespace treetags

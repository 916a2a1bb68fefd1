#pragma once

#include <treetags/language_profile.h>
#include <treetags/models.h>

#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace treetags {

// Parses one file and runs the profile's tag query. Instances hold a parser
// and query cursor and are used by a single worker at a time.
class TagEngine {
public:
  virtual ~TagEngine() = default;
  virtual std::vector<CaptureMatch>
  ParseAndQuery(std::string_view source, const LanguageProfile &profile) = 0;
};

using EngineFactory = std::function<std::unique_ptr<TagEngine>()>;

} // namespace treetags

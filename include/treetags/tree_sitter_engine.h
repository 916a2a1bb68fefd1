#pragma once

#include <treetags/interfaces.h>

#include <cstddef>

extern "C" {
#include <tree_sitter/api.h>
}

namespace treetags {

inline constexpr std::size_t kMaxSiblingText = 512;

class TreeSitterEngine : public TagEngine {
public:
  TreeSitterEngine();
  ~TreeSitterEngine() override;
  TreeSitterEngine(const TreeSitterEngine &) = delete;
  TreeSitterEngine &operator=(const TreeSitterEngine &) = delete;

  // Captures ordered by definition start byte, enclosing before nested.
  std::vector<CaptureMatch>
  ParseAndQuery(std::string_view source,
                const LanguageProfile &profile) override;

private:
  TSParser *parser_;
  TSQueryCursor *cursor_;
};

EngineFactory MakeTreeSitterEngineFactory();

} // namespace treetags

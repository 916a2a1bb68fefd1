#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <tree_sitter/api.h>
}

namespace treetags {

struct QueryPredicate {
  enum class Operator { kEq, kNotEq, kMatch, kNotMatch, kAnyOf, kNotAnyOf };

  Operator op = Operator::kEq;
  std::uint32_t capture_id = 0;
  std::optional<std::uint32_t> other_capture_id;
  std::vector<std::string> literals;
  std::optional<std::regex> pattern;
};

// A loaded grammar library, its language and the compiled tag query.
// Immutable once built; shared by every worker.
struct CompiledGrammar {
  CompiledGrammar() = default;
  ~CompiledGrammar();
  CompiledGrammar(const CompiledGrammar &) = delete;
  CompiledGrammar &operator=(const CompiledGrammar &) = delete;

  std::string language_name;
  void *library = nullptr;
  const TSLanguage *language = nullptr;
  TSQuery *query = nullptr;
  std::vector<std::string> capture_names;
  // Indexed by pattern index.
  std::vector<std::vector<QueryPredicate>> predicates;

  // Whether the text predicates of the match's pattern hold for source.
  bool SatisfiesPredicates(const TSQueryMatch &match,
                           std::string_view source) const;
};

std::string DefaultGrammarSymbol(const std::string &language);

// Throws ProfileLoadError when the library, its language function or the
// query cannot be loaded.
std::shared_ptr<const CompiledGrammar>
LoadGrammar(const std::string &language_name,
            const std::filesystem::path &library, const std::string &symbol,
            const std::string &query_source);

std::string ReadQueryFile(const std::string &language_name,
                          const std::filesystem::path &path);

} // namespace treetags

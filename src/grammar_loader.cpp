#include <treetags/grammar_loader.h>

#include <treetags/errors.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

#include <dlfcn.h>

namespace treetags {
namespace {

using LanguageFunction = const TSLanguage *(*)();

std::string QueryErrorName(TSQueryError error) {
  switch (error) {
  case TSQueryErrorNone:
    return "none";
  case TSQueryErrorSyntax:
    return "syntax error";
  case TSQueryErrorNodeType:
    return "unknown node type";
  case TSQueryErrorField:
    return "unknown field";
  case TSQueryErrorCapture:
    return "unknown capture";
  case TSQueryErrorStructure:
    return "impossible pattern structure";
  case TSQueryErrorLanguage:
    return "incompatible language";
  }
  return "unknown error";
}

std::uint32_t LineOfOffset(const std::string &source, std::uint32_t offset) {
  const auto end = std::min<std::size_t>(offset, source.size());
  return static_cast<std::uint32_t>(
             std::count(source.begin(), source.begin() + end, '\n')) +
         1;
}

std::string StringValue(const TSQuery *query, std::uint32_t id) {
  std::uint32_t length = 0;
  const char *value = ts_query_string_value_for_id(query, id, &length);
  return std::string(value, length);
}

std::optional<QueryPredicate>
BuildPredicate(const std::string &language_name, const TSQuery *query,
               const std::vector<TSQueryPredicateStep> &steps) {
  if (steps.empty() || steps.front().type != TSQueryPredicateStepTypeString) {
    return std::nullopt;
  }
  const auto name = StringValue(query, steps.front().value_id);
  // Directives such as #set! and #strip! carry no filtering meaning here.
  if (!name.empty() && name.back() == '!') {
    return std::nullopt;
  }

  QueryPredicate predicate;
  if (name == "eq?") {
    predicate.op = QueryPredicate::Operator::kEq;
  } else if (name == "not-eq?") {
    predicate.op = QueryPredicate::Operator::kNotEq;
  } else if (name == "match?") {
    predicate.op = QueryPredicate::Operator::kMatch;
  } else if (name == "not-match?") {
    predicate.op = QueryPredicate::Operator::kNotMatch;
  } else if (name == "any-of?") {
    predicate.op = QueryPredicate::Operator::kAnyOf;
  } else if (name == "not-any-of?") {
    predicate.op = QueryPredicate::Operator::kNotAnyOf;
  } else {
    return std::nullopt;
  }

  if (steps.size() < 3 || steps[1].type != TSQueryPredicateStepTypeCapture) {
    throw ProfileLoadError(language_name, "Predicate #" + name +
                                              " needs a capture and an argument");
  }
  predicate.capture_id = steps[1].value_id;

  for (std::size_t i = 2; i < steps.size(); ++i) {
    if (steps[i].type == TSQueryPredicateStepTypeCapture) {
      predicate.other_capture_id = steps[i].value_id;
    } else {
      predicate.literals.push_back(StringValue(query, steps[i].value_id));
    }
  }

  const bool is_match = predicate.op == QueryPredicate::Operator::kMatch ||
                        predicate.op == QueryPredicate::Operator::kNotMatch;
  if (is_match) {
    if (predicate.literals.size() != 1) {
      throw ProfileLoadError(language_name,
                             "Predicate #" + name + " needs one pattern");
    }
    try {
      predicate.pattern.emplace(predicate.literals.front());
    } catch (const std::regex_error &ex) {
      throw ProfileLoadError(language_name, "Invalid #" + name + " pattern '" +
                                                predicate.literals.front() +
                                                "': " + ex.what());
    }
  }
  return predicate;
}

std::vector<std::vector<QueryPredicate>>
BuildPredicates(const std::string &language_name, const TSQuery *query) {
  const auto pattern_count = ts_query_pattern_count(query);
  std::vector<std::vector<QueryPredicate>> predicates(pattern_count);
  for (std::uint32_t pattern = 0; pattern < pattern_count; ++pattern) {
    std::uint32_t step_count = 0;
    const auto *steps =
        ts_query_predicates_for_pattern(query, pattern, &step_count);
    std::vector<TSQueryPredicateStep> current;
    for (std::uint32_t i = 0; i < step_count; ++i) {
      if (steps[i].type == TSQueryPredicateStepTypeDone) {
        if (auto predicate = BuildPredicate(language_name, query, current)) {
          predicates[pattern].push_back(std::move(*predicate));
        }
        current.clear();
        continue;
      }
      current.push_back(steps[i]);
    }
  }
  return predicates;
}

std::string_view NodeText(TSNode node, std::string_view source) {
  const auto start = std::min<std::size_t>(ts_node_start_byte(node),
                                           source.size());
  const auto end = std::min<std::size_t>(ts_node_end_byte(node), source.size());
  return source.substr(start, end - start);
}

std::optional<std::string_view> CaptureText(const TSQueryMatch &match,
                                            std::uint32_t capture_id,
                                            std::string_view source) {
  for (std::uint16_t i = 0; i < match.capture_count; ++i) {
    if (match.captures[i].index == capture_id) {
      return NodeText(match.captures[i].node, source);
    }
  }
  return std::nullopt;
}

bool Holds(const QueryPredicate &predicate, std::string_view text,
           const TSQueryMatch &match, std::string_view source) {
  using Operator = QueryPredicate::Operator;
  switch (predicate.op) {
  case Operator::kEq:
  case Operator::kNotEq: {
    bool equal = false;
    if (predicate.other_capture_id) {
      const auto other =
          CaptureText(match, *predicate.other_capture_id, source);
      equal = other && *other == text;
    } else {
      equal = !predicate.literals.empty() && predicate.literals.front() == text;
    }
    return predicate.op == Operator::kEq ? equal : !equal;
  }
  case Operator::kMatch:
  case Operator::kNotMatch: {
    const bool found = std::regex_search(text.begin(), text.end(),
                                         *predicate.pattern);
    return predicate.op == Operator::kMatch ? found : !found;
  }
  case Operator::kAnyOf:
  case Operator::kNotAnyOf: {
    const bool listed =
        std::find(predicate.literals.begin(), predicate.literals.end(),
                  text) != predicate.literals.end();
    return predicate.op == Operator::kAnyOf ? listed : !listed;
  }
  }
  return true;
}

} // namespace

CompiledGrammar::~CompiledGrammar() {
  if (query != nullptr) {
    ts_query_delete(query);
  }
  if (library != nullptr) {
    dlclose(library);
  }
}

bool CompiledGrammar::SatisfiesPredicates(const TSQueryMatch &match,
                                          std::string_view source) const {
  if (match.pattern_index >= predicates.size()) {
    return true;
  }
  for (const auto &predicate : predicates[match.pattern_index]) {
    for (std::uint16_t i = 0; i < match.capture_count; ++i) {
      if (match.captures[i].index != predicate.capture_id) {
        continue;
      }
      if (!Holds(predicate, NodeText(match.captures[i].node, source), match,
                 source)) {
        return false;
      }
    }
  }
  return true;
}

std::string DefaultGrammarSymbol(const std::string &language) {
  std::string symbol = "tree_sitter_";
  for (const auto character : language) {
    symbol.push_back(character == '-' ? '_' : character);
  }
  return symbol;
}

std::string ReadQueryFile(const std::string &language_name,
                          const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw ProfileLoadError(language_name,
                           "Failed to open query file: " + path.string());
  }
  std::ostringstream contents;
  contents << stream.rdbuf();
  return contents.str();
}

std::shared_ptr<const CompiledGrammar>
LoadGrammar(const std::string &language_name,
            const std::filesystem::path &library, const std::string &symbol,
            const std::string &query_source) {
  auto grammar = std::make_shared<CompiledGrammar>();
  grammar->language_name = language_name;

  grammar->library = dlopen(library.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (grammar->library == nullptr) {
    const char *error = dlerror();
    throw ProfileLoadError(language_name,
                           "Failed to load grammar library " +
                               library.string() + ": " +
                               (error != nullptr ? error : "unknown error"));
  }

  dlerror();
  auto *function = reinterpret_cast<LanguageFunction>(
      dlsym(grammar->library, symbol.c_str()));
  if (const char *error = dlerror(); error != nullptr || function == nullptr) {
    throw ProfileLoadError(language_name,
                           "Grammar library " + library.string() +
                               " has no symbol " + symbol);
  }

  grammar->language = function();
  if (grammar->language == nullptr) {
    throw ProfileLoadError(language_name,
                           symbol + " returned no language");
  }
  const auto version = ts_language_version(grammar->language);
  if (version < TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION ||
      version > TREE_SITTER_LANGUAGE_VERSION) {
    throw ProfileLoadError(
        language_name,
        "Grammar ABI version " + std::to_string(version) +
            " is outside the supported range " +
            std::to_string(TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION) + "-" +
            std::to_string(TREE_SITTER_LANGUAGE_VERSION));
  }

  std::uint32_t error_offset = 0;
  TSQueryError error_type = TSQueryErrorNone;
  grammar->query = ts_query_new(grammar->language, query_source.data(),
                                static_cast<std::uint32_t>(query_source.size()),
                                &error_offset, &error_type);
  if (grammar->query == nullptr) {
    throw ProfileLoadError(language_name,
                           "Tag query " + QueryErrorName(error_type) +
                               " at offset " + std::to_string(error_offset) +
                               " (line " +
                               std::to_string(
                                   LineOfOffset(query_source, error_offset)) +
                               ")");
  }

  const auto capture_count = ts_query_capture_count(grammar->query);
  grammar->capture_names.reserve(capture_count);
  for (std::uint32_t i = 0; i < capture_count; ++i) {
    std::uint32_t length = 0;
    const char *name = ts_query_capture_name_for_id(grammar->query, i, &length);
    grammar->capture_names.emplace_back(name, length);
  }
  grammar->predicates = BuildPredicates(language_name, grammar->query);
  return grammar;
}

} // namespace treetags

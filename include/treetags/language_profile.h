#pragma once

#include <treetags/tag_options.h>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace treetags {

struct CompiledGrammar;

struct KindSpec {
  char code = '\0';
  std::string name;
  bool enabled_by_default = true;
};

// line:<n> of the identifier.
struct LineRule {};

// end:<n>, the last line of a definition spanning several lines.
struct EndLineRule {};

// signature:<text> from a sibling field such as "parameters".
struct SignatureRule {
  std::string sibling_field;
};

// typeref:typename:<text> from a sibling field such as "type".
struct TypeRefRule {
  std::string sibling_field;
};

// access:<value> from the first word of a modifier node that appears in
// keywords, or fallback when there is none.
struct AccessModifierRule {
  std::string node_type;
  std::vector<std::pair<std::string, std::string>> keywords;
  std::string fallback;
};

// access:public for identifiers starting with an upper-case letter,
// access:private otherwise.
struct ExportedNameAccessRule {};

using FieldRuleVariant =
    std::variant<LineRule, EndLineRule, SignatureRule, TypeRefRule,
                 AccessModifierRule, ExportedNameAccessRule>;

struct FieldRule {
  FieldRuleVariant rule;
  // Capture names the rule is limited to; empty applies to every definition.
  std::vector<std::string> applies_to;
};

enum class AddressMode { kPattern, kLineNumber };

struct LanguageProfile {
  std::string name;
  std::vector<std::string> extensions;
  std::shared_ptr<const CompiledGrammar> grammar;
  std::map<std::string, KindSpec> kinds;
  std::vector<FieldRule> field_rules;
  AddressMode address_mode = AddressMode::kPattern;
  std::string scope_separator = ".";

  const KindSpec *FindKind(const std::string &capture_name) const;
  std::vector<KindAlias> DefaultKindAliases() const;
  std::vector<KindAlias> OptionalKindAliases() const;
};

// A grammar the user points at from the configuration file.
struct GrammarRegistration {
  std::string language;
  std::filesystem::path library;
  std::optional<std::filesystem::path> query;
  std::vector<std::string> extensions;
  std::optional<std::string> symbol;
};

} // namespace treetags

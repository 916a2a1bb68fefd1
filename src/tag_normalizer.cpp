#include <treetags/tag_normalizer.h>

#include <treetags/source_text.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

namespace treetags {
namespace {

constexpr const char *kDefinitionPrefix = "definition.";

struct OpenDefinition {
  std::uint32_t start_byte = 0;
  std::uint32_t end_byte = 0;
  TagKind kind;
  std::string qualified_name;
};

bool StrictlyContains(const OpenDefinition &outer, const CaptureMatch &inner) {
  const bool same_range = outer.start_byte == inner.start_byte &&
                          outer.end_byte == inner.end_byte;
  return !same_range && outer.start_byte <= inner.start_byte &&
         inner.end_byte <= outer.end_byte;
}

const SiblingNode *FindByField(const CaptureMatch &capture,
                               const std::string &field_name) {
  for (const auto &sibling : capture.siblings) {
    if (sibling.field_name == field_name) {
      return &sibling;
    }
  }
  return nullptr;
}

bool IsFileScoped(const CaptureMatch &capture) {
  return std::any_of(capture.siblings.begin(), capture.siblings.end(),
                     [](const SiblingNode &sibling) {
                       return sibling.node_type == "storage_class_specifier" &&
                              sibling.text == "static";
                     });
}

std::vector<std::string> Words(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (const auto character : text) {
    if (std::isalnum(static_cast<unsigned char>(character)) != 0 ||
        character == '_') {
      current.push_back(character);
      continue;
    }
    if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

// Some grammars keep all modifiers in one node, others give each its own
// node; every node of the rule's type is searched.
std::optional<std::string> AccessFromModifier(const CaptureMatch &capture,
                                              const AccessModifierRule &rule) {
  for (const auto &sibling : capture.siblings) {
    if (sibling.node_type != rule.node_type || sibling.truncated) {
      continue;
    }
    for (const auto &word : Words(sibling.text)) {
      for (const auto &[keyword, access] : rule.keywords) {
        if (word == keyword) {
          return access;
        }
      }
    }
  }
  if (rule.fallback.empty()) {
    return std::nullopt;
  }
  return rule.fallback;
}

std::optional<std::string> SiblingText(const CaptureMatch &capture,
                                       const std::string &field_name) {
  const auto *sibling = FindByField(capture, field_name);
  if (sibling == nullptr || sibling->truncated) {
    return std::nullopt;
  }
  auto text = CollapseWhitespace(sibling->text);
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

bool RuleApplies(const FieldRule &rule, const std::string &capture_name) {
  return rule.applies_to.empty() ||
         std::find(rule.applies_to.begin(), rule.applies_to.end(),
                   capture_name) != rule.applies_to.end();
}

bool HasField(const ExtensionFields &fields, const std::string &key) {
  return std::any_of(fields.begin(), fields.end(),
                     [&](const auto &field) { return field.first == key; });
}

} // namespace

TagNormalizer::TagNormalizer(NormalizerOptions options)
    : options_(std::move(options)) {}

bool TagNormalizer::IsKindEnabled(const LanguageProfile &profile,
                                  const KindSpec &kind) const {
  const auto filter = options_.kind_filters.find(profile.name);
  if (filter == options_.kind_filters.end()) {
    return kind.enabled_by_default;
  }
  return filter->second.IsEnabled(kind.code);
}

ExtensionFields TagNormalizer::ExtractFields(const CaptureMatch &capture,
                                             const LanguageProfile &profile,
                                             const KindSpec &kind) const {
  const auto &fields = options_.fields;
  ExtensionFields extracted;
  const auto add = [&](const std::string &key, std::string value) {
    if (fields.IsEnabled(key) && !HasField(extracted, key)) {
      extracted.emplace_back(key, std::move(value));
    }
  };

  add("kind", kind.name);

  for (const auto &rule : profile.field_rules) {
    if (!RuleApplies(rule, capture.capture_name)) {
      continue;
    }
    if (std::holds_alternative<LineRule>(rule.rule)) {
      add("line", std::to_string(capture.name_start.row + 1));
    } else if (std::holds_alternative<EndLineRule>(rule.rule)) {
      if (capture.end.row > capture.start.row) {
        add("end", std::to_string(capture.end.row + 1));
      }
    } else if (const auto *signature = std::get_if<SignatureRule>(&rule.rule)) {
      if (auto text = SiblingText(capture, signature->sibling_field)) {
        add("signature", std::move(*text));
      }
    } else if (const auto *typeref = std::get_if<TypeRefRule>(&rule.rule)) {
      if (auto text = SiblingText(capture, typeref->sibling_field)) {
        add("typeref", "typename:" + *text);
      }
    } else if (const auto *access =
                   std::get_if<AccessModifierRule>(&rule.rule)) {
      if (auto value = AccessFromModifier(capture, *access)) {
        add("access", std::move(*value));
      }
    } else if (std::holds_alternative<ExportedNameAccessRule>(rule.rule)) {
      const auto first = static_cast<unsigned char>(capture.name.front());
      add("access", std::isupper(first) != 0 ? "public" : "private");
    }
  }
  return extracted;
}

std::vector<Tag> TagNormalizer::Normalize(
    const std::vector<CaptureMatch> &captures, const LanguageProfile &profile,
    const std::string &file_path) const {
  std::vector<Tag> tags;
  std::vector<OpenDefinition> open;
  std::set<std::tuple<std::uint32_t, std::uint32_t, std::string>> seen;

  const bool line_numbers = options_.line_number_addresses ||
                            profile.address_mode == AddressMode::kLineNumber;

  for (const auto &capture : captures) {
    if (capture.capture_name.rfind(kDefinitionPrefix, 0) != 0) {
      continue;
    }
    const auto *kind = profile.FindKind(capture.capture_name);
    if (kind == nullptr) {
      continue;
    }
    if (capture.name.empty() || ContainsControlCharacter(capture.name)) {
      continue;
    }
    // Several patterns may describe the same node; the first one wins.
    if (!seen.emplace(capture.start_byte, capture.end_byte, capture.name)
             .second) {
      continue;
    }

    while (!open.empty() && !StrictlyContains(open.back(), capture)) {
      open.pop_back();
    }

    std::optional<TagScope> scope;
    if (!open.empty()) {
      scope = TagScope{open.back().kind, open.back().qualified_name};
    }

    const TagKind tag_kind{kind->code, kind->name};
    auto qualified_name =
        scope ? scope->name + profile.scope_separator + capture.name
              : capture.name;
    open.push_back(OpenDefinition{capture.start_byte, capture.end_byte,
                                  tag_kind, qualified_name});

    if (!IsKindEnabled(profile, *kind)) {
      continue;
    }
    if (!options_.extras.file_scope && IsFileScoped(capture)) {
      continue;
    }

    Tag tag;
    tag.name = capture.name;
    tag.file = file_path;
    tag.kind = tag_kind;
    const auto line = capture.name_start.row + 1;
    tag.address = line_numbers ? TagAddress::LineNumber(line)
                               : TagAddress::Pattern(capture.line_text, line);
    if (scope && options_.fields.IsEnabled("scope")) {
      tag.scope = scope;
    }
    tag.extension_fields = ExtractFields(capture, profile, *kind);

    if (options_.extras.qualified && scope) {
      auto qualified = tag;
      qualified.name = qualified_name;
      tags.push_back(std::move(tag));
      tags.push_back(std::move(qualified));
      continue;
    }
    tags.push_back(std::move(tag));
  }
  return tags;
}

} // namespace treetags

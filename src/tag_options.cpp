#include <treetags/tag_options.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace treetags {
namespace {

const std::map<std::string, std::string> &FieldAliases() {
  static const std::map<std::string, std::string> aliases = {
      {"n", "line"},      {"line", "line"},
      {"k", "kind"},      {"kind", "kind"},
      {"s", "scope"},     {"scope", "scope"},
      {"S", "signature"}, {"signature", "signature"},
      {"a", "access"},    {"access", "access"},
      {"e", "end"},       {"end", "end"},
      {"t", "typeref"},   {"typeref", "typeref"}};
  return aliases;
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::vector<std::string> SplitCommas(const std::string &spec) {
  std::vector<std::string> parts;
  std::string current;
  for (const auto character : spec) {
    if (character == ',') {
      parts.push_back(Trim(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  parts.push_back(Trim(current));
  parts.erase(std::remove(parts.begin(), parts.end(), std::string{}),
              parts.end());
  return parts;
}

bool HasModifiers(const std::string &spec) {
  return spec.find_first_of("+-") != std::string::npos;
}

// "+m-c" or "nksS" style specs: one entry per letter, keeping a leading
// sign attached to the letter after it.
std::vector<std::string> SplitLetters(const std::string &spec) {
  std::vector<std::string> entries;
  for (std::size_t i = 0; i < spec.size(); ++i) {
    const auto character = spec[i];
    if (std::isspace(static_cast<unsigned char>(character)) != 0) {
      continue;
    }
    if (character == '+' || character == '-') {
      if (i + 1 < spec.size() &&
          std::isspace(static_cast<unsigned char>(spec[i + 1])) == 0) {
        entries.push_back(std::string{character, spec[i + 1]});
        ++i;
      }
      continue;
    }
    entries.emplace_back(1, character);
  }
  return entries;
}

std::vector<std::string> SplitSpec(const std::string &spec) {
  if (spec.find(',') != std::string::npos) {
    return SplitCommas(spec);
  }
  const auto trimmed = Trim(spec);
  const bool signed_entry =
      !trimmed.empty() && (trimmed[0] == '+' || trimmed[0] == '-');
  const auto body = signed_entry ? trimmed.substr(1) : trimmed;
  if (body.size() > 1 && FieldAliases().count(body) != 0) {
    return {trimmed};
  }
  return SplitLetters(trimmed);
}

void Warn(std::vector<std::string> *warnings, std::string message) {
  if (warnings != nullptr) {
    warnings->push_back(std::move(message));
  }
}

} // namespace

std::string CanonicalFieldName(const std::string &name) {
  const auto found = FieldAliases().find(name);
  if (found == FieldAliases().end()) {
    return {};
  }
  return found->second;
}

FieldSelection::FieldSelection() : enabled_{"scope", "typeref"} {}

FieldSelection FieldSelection::Parse(const std::string &spec,
                                     std::vector<std::string> *warnings) {
  FieldSelection selection;
  for (const auto &entry : SplitSpec(spec)) {
    char operation = '+';
    auto name = entry;
    if (!name.empty() && (name[0] == '+' || name[0] == '-')) {
      operation = name[0];
      name = name.substr(1);
    }
    const auto canonical = CanonicalFieldName(name);
    if (canonical.empty()) {
      Warn(warnings, "Unknown field: " + name);
      continue;
    }
    if (operation == '-') {
      selection.Disable(canonical);
    } else {
      selection.Enable(canonical);
    }
  }
  return selection;
}

bool FieldSelection::IsEnabled(const std::string &field) const {
  return enabled_.count(field) != 0;
}

void FieldSelection::Enable(const std::string &field) {
  enabled_.insert(field);
}

void FieldSelection::Disable(const std::string &field) {
  enabled_.erase(field);
}

ExtrasSelection ExtrasSelection::Parse(const std::string &spec,
                                       std::vector<std::string> *warnings) {
  ExtrasSelection extras;
  for (const auto &part : SplitCommas(spec)) {
    if (part.size() < 2 || (part[0] != '+' && part[0] != '-')) {
      Warn(warnings, "Unknown extra: " + part);
      continue;
    }
    const bool enable = part[0] == '+';
    const auto name = part.substr(1);
    if (name == "q" || name == "qualified") {
      extras.qualified = enable;
    } else if (name == "f" || name == "fileScope") {
      extras.file_scope = enable;
    } else {
      Warn(warnings, "Unknown extra: " + part);
    }
  }
  return extras;
}

KindFilter KindFilter::Parse(const std::string &spec,
                             const std::vector<KindAlias> &defaults,
                             const std::vector<KindAlias> &optionals,
                             std::vector<std::string> *warnings) {
  std::map<std::string, char> lookup;
  std::set<char> default_codes;
  for (const auto &kind : defaults) {
    default_codes.insert(kind.code);
    for (const auto &alias : kind.aliases) {
      lookup.emplace(alias, kind.code);
    }
  }
  for (const auto &kind : optionals) {
    for (const auto &alias : kind.aliases) {
      lookup.emplace(alias, kind.code);
    }
  }

  KindFilter filter;
  filter.allow_all_ = false;
  if (Trim(spec).empty()) {
    filter.enabled_ = default_codes;
    return filter;
  }

  const bool modifier_mode = HasModifiers(spec);
  auto entries = spec.find(',') != std::string::npos ? SplitCommas(spec)
                                                     : SplitLetters(spec);
  const auto trimmed = Trim(spec);
  const auto body = trimmed[0] == '+' || trimmed[0] == '-'
                        ? trimmed.substr(1)
                        : trimmed;
  if (spec.find(',') == std::string::npos && body.size() > 1 &&
      lookup.count(body) != 0) {
    entries = {trimmed};
  }
  if (modifier_mode) {
    filter.enabled_ = default_codes;
  }
  for (const auto &entry : entries) {
    char operation = '+';
    auto name = entry;
    if (!name.empty() && (name[0] == '+' || name[0] == '-')) {
      operation = name[0];
      name = Trim(name.substr(1));
    }
    const auto found = lookup.find(name);
    if (found == lookup.end()) {
      Warn(warnings, "Unknown tag kind: " + name);
      continue;
    }
    if (operation == '-') {
      filter.enabled_.erase(found->second);
    } else {
      filter.enabled_.insert(found->second);
    }
  }
  return filter;
}

bool KindFilter::IsEnabled(char code) const {
  return allow_all_ || enabled_.count(code) != 0;
}

} // namespace treetags

#include <treetags/language_profile.h>

namespace treetags {
namespace {

std::vector<KindAlias> CollectAliases(const LanguageProfile &profile,
                                      bool enabled_by_default) {
  std::map<char, KindAlias> aliases;
  for (const auto &[capture, kind] : profile.kinds) {
    if (kind.enabled_by_default != enabled_by_default) {
      continue;
    }
    auto &alias = aliases[kind.code];
    if (alias.code == '\0') {
      alias.code = kind.code;
      alias.aliases.emplace_back(1, kind.code);
    }
    alias.aliases.push_back(kind.name);
  }

  std::vector<KindAlias> collected;
  collected.reserve(aliases.size());
  for (auto &entry : aliases) {
    collected.push_back(std::move(entry.second));
  }
  return collected;
}

} // namespace

const KindSpec *LanguageProfile::FindKind(
    const std::string &capture_name) const {
  const auto found = kinds.find(capture_name);
  if (found == kinds.end()) {
    return nullptr;
  }
  return &found->second;
}

std::vector<KindAlias> LanguageProfile::DefaultKindAliases() const {
  return CollectAliases(*this, true);
}

std::vector<KindAlias> LanguageProfile::OptionalKindAliases() const {
  return CollectAliases(*this, false);
}

} // namespace treetags

#pragma once

#include <treetags/language_profile.h>

#include <string>
#include <vector>

namespace treetags {

// A language shipped with treetags. The grammar itself is a shared library
// installed next to tree-sitter; profile.grammar is filled in at load time.
struct BuiltinLanguage {
  LanguageProfile profile;
  std::string library_name;
  std::string symbol;
  std::string query;
};

const std::vector<BuiltinLanguage> &BuiltinLanguages();
const BuiltinLanguage *FindBuiltinLanguage(const std::string &name);

} // namespace treetags

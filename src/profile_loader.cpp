#include <treetags/profile_loader.h>

#include <treetags/builtin_languages.h>
#include <treetags/errors.h>
#include <treetags/grammar_loader.h>

#include <set>
#include <string>
#include <utility>

namespace treetags {
namespace {

LanguageProfile LoadBuiltinProfile(const BuiltinLanguage &builtin) {
  auto profile = builtin.profile;
  profile.grammar = LoadGrammar(profile.name, builtin.library_name,
                                builtin.symbol, builtin.query);
  return profile;
}

} // namespace

LanguageProfile LoadUserProfile(const GrammarRegistration &registration) {
  const auto *builtin = FindBuiltinLanguage(registration.language);

  LanguageProfile profile;
  std::string query;
  if (registration.query) {
    query = ReadQueryFile(registration.language, *registration.query);
  } else if (builtin != nullptr) {
    query = builtin->query;
  } else {
    throw ProfileLoadError(registration.language,
                           "Grammar for '" + registration.language +
                               "' needs a query file");
  }

  if (builtin != nullptr) {
    profile = builtin->profile;
  } else {
    profile.name = registration.language;
  }
  if (!registration.extensions.empty()) {
    profile.extensions = registration.extensions;
  }
  if (profile.extensions.empty()) {
    throw ProfileLoadError(registration.language,
                           "Grammar for '" + registration.language +
                               "' needs at least one file extension");
  }

  const auto symbol = registration.symbol.value_or(
      builtin != nullptr ? builtin->symbol
                         : DefaultGrammarSymbol(registration.language));
  profile.grammar =
      LoadGrammar(registration.language, registration.library, symbol, query);

  // User queries may use any definition.* capture; give unknown ones a kind
  // derived from the capture name so they are not dropped.
  const std::string prefix = "definition.";
  for (const auto &capture : profile.grammar->capture_names) {
    if (capture.rfind(prefix, 0) != 0 || profile.kinds.count(capture) != 0 ||
        capture.size() == prefix.size()) {
      continue;
    }
    const auto long_name = capture.substr(prefix.size());
    profile.kinds.emplace(capture, KindSpec{long_name.front(), long_name, true});
  }
  return profile;
}

void LoadProfiles(LanguageRegistry &registry,
                  const std::vector<GrammarRegistration> &grammars,
                  const std::shared_ptr<Logger> &logger) {
  const auto log = EnsureLogger(logger);

  // A built-in stays in place when the user grammar replacing it fails.
  std::set<std::string> replaced;
  for (const auto &grammar : grammars) {
    try {
      registry.RegisterUser(LoadUserProfile(grammar));
      replaced.insert(grammar.language);
    } catch (const ProfileLoadError &ex) {
      registry.ReportError(ProfileError{ex.language(), ex.what()});
    }
  }

  for (const auto &builtin : BuiltinLanguages()) {
    if (replaced.count(builtin.profile.name) != 0) {
      continue;
    }
    try {
      registry.RegisterBuiltin(LoadBuiltinProfile(builtin));
    } catch (const ProfileLoadError &ex) {
      registry.ReportError(ProfileError{ex.language(), ex.what()});
    }
  }

  log->Log(LogLevel::kInfo, "profiles.loaded",
           {{"languages", std::to_string(registry.LanguageNames().size())},
            {"errors", std::to_string(registry.Errors().size())}});
}

} // namespace treetags

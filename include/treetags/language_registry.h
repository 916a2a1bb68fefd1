#pragma once

#include <treetags/language_profile.h>
#include <treetags/logging.h>
#include <treetags/models.h>

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace treetags {

// Extension to profile table. Filled before dispatch and only read while
// workers run.
class LanguageRegistry {
public:
  explicit LanguageRegistry(std::shared_ptr<Logger> logger = nullptr);

  void RegisterBuiltin(LanguageProfile profile);
  // Extensions claimed here win over built-in claims.
  void RegisterUser(LanguageProfile profile);
  // Logged the first time it is seen; the language stays unregistered.
  void ReportError(ProfileError error);

  const LanguageProfile *Resolve(const std::filesystem::path &file) const;
  const LanguageProfile *Find(const std::string &language) const;

  std::vector<std::string> LanguageNames() const;
  const std::vector<ProfileError> &Errors() const { return errors_; }

private:
  const LanguageProfile *Store(LanguageProfile profile);

  std::shared_ptr<Logger> logger_;
  std::vector<std::unique_ptr<const LanguageProfile>> profiles_;
  std::unordered_map<std::string, const LanguageProfile *> builtin_extensions_;
  std::unordered_map<std::string, const LanguageProfile *> user_extensions_;
  std::unordered_map<std::string, const LanguageProfile *> builtin_names_;
  std::unordered_map<std::string, const LanguageProfile *> user_names_;
  std::vector<ProfileError> errors_;
};

} // namespace treetags

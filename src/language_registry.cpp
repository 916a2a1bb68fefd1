#include <treetags/language_registry.h>

#include <algorithm>
#include <set>
#include <utility>

namespace treetags {
namespace {

std::string ExtensionOf(const std::filesystem::path &file) {
  const auto extension = file.extension().string();
  if (extension.size() < 2) {
    return {};
  }
  return extension.substr(1);
}

std::string StripDot(const std::string &extension) {
  if (!extension.empty() && extension.front() == '.') {
    return extension.substr(1);
  }
  return extension;
}

} // namespace

LanguageRegistry::LanguageRegistry(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

const LanguageProfile *LanguageRegistry::Store(LanguageProfile profile) {
  profiles_.push_back(
      std::make_unique<const LanguageProfile>(std::move(profile)));
  return profiles_.back().get();
}

void LanguageRegistry::RegisterBuiltin(LanguageProfile profile) {
  const auto *stored = Store(std::move(profile));
  builtin_names_[stored->name] = stored;
  for (const auto &extension : stored->extensions) {
    builtin_extensions_[StripDot(extension)] = stored;
  }
  logger_->Log(LogLevel::kDebug, "profile.registered",
               {{"language", stored->name}, {"origin", "builtin"}});
}

void LanguageRegistry::RegisterUser(LanguageProfile profile) {
  const auto *stored = Store(std::move(profile));
  user_names_[stored->name] = stored;
  for (const auto &extension : stored->extensions) {
    user_extensions_[StripDot(extension)] = stored;
  }
  logger_->Log(LogLevel::kDebug, "profile.registered",
               {{"language", stored->name}, {"origin", "user"}});
}

void LanguageRegistry::ReportError(ProfileError error) {
  const auto duplicate =
      std::any_of(errors_.begin(), errors_.end(), [&](const auto &existing) {
        return existing.language == error.language &&
               existing.cause == error.cause;
      });
  if (duplicate) {
    return;
  }
  logger_->Log(LogLevel::kWarn, "profile.load.failed",
               {{"language", error.language}, {"cause", error.cause}});
  errors_.push_back(std::move(error));
}

const LanguageProfile *
LanguageRegistry::Resolve(const std::filesystem::path &file) const {
  const auto extension = ExtensionOf(file);
  if (extension.empty()) {
    return nullptr;
  }
  if (const auto user = user_extensions_.find(extension);
      user != user_extensions_.end()) {
    return user->second;
  }
  if (const auto builtin = builtin_extensions_.find(extension);
      builtin != builtin_extensions_.end()) {
    return builtin->second;
  }
  return nullptr;
}

const LanguageProfile *
LanguageRegistry::Find(const std::string &language) const {
  if (const auto user = user_names_.find(language); user != user_names_.end()) {
    return user->second;
  }
  if (const auto builtin = builtin_names_.find(language);
      builtin != builtin_names_.end()) {
    return builtin->second;
  }
  return nullptr;
}

std::vector<std::string> LanguageRegistry::LanguageNames() const {
  std::set<std::string> names;
  for (const auto &profile : profiles_) {
    names.insert(profile->name);
  }
  return {names.begin(), names.end()};
}

} // namespace treetags

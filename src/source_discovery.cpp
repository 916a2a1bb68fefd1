#include <treetags/source_discovery.h>

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

#include <fnmatch.h>

namespace treetags {
namespace {

bool IsVersionControlDirectory(const std::filesystem::path &path) {
  static const std::set<std::string> kSkipped = {".git", ".hg", ".svn"};
  return kSkipped.count(path.filename().string()) > 0;
}

bool Matches(const std::string &pattern, const std::string &value) {
  return fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

} // namespace

bool IsExcluded(const std::filesystem::path &relative,
                const std::vector<std::string> &patterns) {
  const auto whole = relative.generic_string();
  for (const auto &pattern : patterns) {
    if (Matches(pattern, whole)) {
      return true;
    }
    for (const auto &component : relative) {
      if (Matches(pattern, component.string())) {
        return true;
      }
    }
  }
  return false;
}

SourceDiscovery::SourceDiscovery(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void SourceDiscovery::CollectDirectory(const std::filesystem::path &directory,
                                       const DiscoveryOptions &options,
                                       DiscoveryResult &result) const {
  std::error_code error;
  std::filesystem::recursive_directory_iterator it(
      directory, std::filesystem::directory_options::skip_permission_denied,
      error);
  if (error) {
    result.warnings.push_back("Cannot read directory " + directory.string() +
                              ": " + error.message());
    return;
  }

  const std::filesystem::recursive_directory_iterator end;
  while (it != end) {
    const auto &entry = *it;
    const auto relative = entry.path().lexically_relative(directory);
    std::error_code status_error;
    const bool is_directory = entry.is_directory(status_error);
    if (is_directory && (IsVersionControlDirectory(entry.path()) ||
                         IsExcluded(relative, options.exclude_patterns))) {
      it.disable_recursion_pending();
    } else if (entry.is_regular_file(status_error) &&
               !IsExcluded(relative, options.exclude_patterns)) {
      result.files.push_back(entry.path());
    }

    it.increment(error);
    if (error) {
      result.warnings.push_back("Cannot read directory " +
                                directory.string() + ": " + error.message());
      break;
    }
  }
}

DiscoveryResult SourceDiscovery::Discover(const DiscoveryOptions &options) const {
  DiscoveryResult result;
  auto inputs = options.inputs;
  if (inputs.empty()) {
    inputs.push_back(options.root);
  }

  for (const auto &input : inputs) {
    std::error_code error;
    const auto status = std::filesystem::status(input, error);
    if (error || !std::filesystem::exists(status)) {
      result.warnings.push_back("Cannot access " + input.string() +
                                (error ? ": " + error.message() : ""));
      continue;
    }
    if (std::filesystem::is_directory(status)) {
      CollectDirectory(input, options, result);
      continue;
    }
    if (!IsExcluded(input.filename(), options.exclude_patterns) &&
        !IsExcluded(input.lexically_normal(), options.exclude_patterns)) {
      result.files.push_back(input);
    }
  }

  for (auto &file : result.files) {
    file = file.lexically_normal();
  }
  std::sort(result.files.begin(), result.files.end());
  result.files.erase(std::unique(result.files.begin(), result.files.end()),
                     result.files.end());

  for (const auto &warning : result.warnings) {
    logger_->Log(LogLevel::kWarn, "discovery.unreadable",
                 {{"detail", warning}});
  }
  logger_->Log(LogLevel::kInfo, "discovery.complete",
               {{"files", std::to_string(result.files.size())}});
  return result;
}

} // namespace treetags

#pragma once

#include <treetags/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace treetags {

struct DiscoveryOptions {
  // Files and directories named on the command line. Empty means root.
  std::vector<std::filesystem::path> inputs;
  std::filesystem::path root = ".";
  std::vector<std::string> exclude_patterns;
};

struct DiscoveryResult {
  std::vector<std::filesystem::path> files;
  std::vector<std::string> warnings;
};

// True when a glob matches the whole relative path or any one component.
bool IsExcluded(const std::filesystem::path &relative,
                const std::vector<std::string> &patterns);

class SourceDiscovery {
public:
  explicit SourceDiscovery(std::shared_ptr<Logger> logger = nullptr);

  DiscoveryResult Discover(const DiscoveryOptions &options) const;

private:
  void CollectDirectory(const std::filesystem::path &directory,
                        const DiscoveryOptions &options,
                        DiscoveryResult &result) const;

  std::shared_ptr<Logger> logger_;
};

} // namespace treetags

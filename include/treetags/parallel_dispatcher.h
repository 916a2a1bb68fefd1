#pragma once

#include <treetags/interfaces.h>
#include <treetags/language_registry.h>
#include <treetags/logging.h>
#include <treetags/models.h>
#include <treetags/tag_normalizer.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace treetags {

struct DispatchResult {
  std::vector<Tag> tags;
  std::vector<FileError> errors;
  // Tag-file-relative paths of files that were parsed successfully.
  std::vector<std::string> regenerated_files;
  std::size_t processed = 0;
  std::size_t skipped = 0;
};

// Path as written into the tag file: relative to base_directory when the
// file lives below it, otherwise the path as given.
std::string RelativeTagPath(const std::filesystem::path &file,
                            const std::filesystem::path &base_directory);

class ParallelDispatcher {
public:
  ParallelDispatcher(const LanguageRegistry &registry, EngineFactory factory,
                     TagNormalizer normalizer,
                     std::shared_ptr<Logger> logger = nullptr);

  DispatchResult Run(const std::vector<std::filesystem::path> &files,
                     std::size_t worker_count,
                     const std::filesystem::path &base_directory) const;

private:
  const LanguageRegistry &registry_;
  EngineFactory factory_;
  TagNormalizer normalizer_;
  std::shared_ptr<Logger> logger_;
};

} // namespace treetags

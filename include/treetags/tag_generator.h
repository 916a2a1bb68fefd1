#pragma once

#include <treetags/cli_options.h>
#include <treetags/interfaces.h>
#include <treetags/language_registry.h>
#include <treetags/logging.h>
#include <treetags/parallel_dispatcher.h>
#include <treetags/tag_normalizer.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace treetags {

struct GenerationRequest {
  std::vector<std::filesystem::path> files;
  // "-" writes to standard output.
  std::filesystem::path tag_file = kDefaultTagFile;
  bool append = false;
  bool sort = true;
  std::size_t workers = kDefaultWorkers;
  NormalizerOptions normalizer;
};

struct GenerationResult {
  DispatchResult dispatch;
  std::vector<ProfileError> profile_errors;
  std::size_t written = 0;
};

// A run that failed after dispatch. Carries the file and profile errors
// collected so far so the caller can still report them.
class GenerationError : public std::runtime_error {
public:
  GenerationError(const std::string &message, GenerationResult partial)
      : std::runtime_error(message), partial_(std::move(partial)) {}

  const GenerationResult &partial() const { return partial_; }

private:
  GenerationResult partial_;
};

// Field, extras and kind settings of options resolved against the
// registered languages. Unknown entries are reported through warnings.
NormalizerOptions BuildNormalizerOptions(const TagOptions &options,
                                         const LanguageRegistry &registry,
                                         std::vector<std::string> *warnings);

// Runs one tag file generation: read the existing file in append mode,
// dispatch, merge, write. A missing or corrupt append target throws
// TagFileError before anything is parsed; a failed write throws
// GenerationError.
class TagGenerator {
public:
  TagGenerator(const LanguageRegistry &registry, EngineFactory factory,
               std::shared_ptr<Logger> logger = nullptr);

  GenerationResult Run(const GenerationRequest &request) const;

private:
  const LanguageRegistry &registry_;
  EngineFactory factory_;
  std::shared_ptr<Logger> logger_;
};

} // namespace treetags

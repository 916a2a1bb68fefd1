#include <treetags/parallel_dispatcher.h>

#include <treetags/errors.h>
#include <treetags/worker_thread.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace treetags {
namespace {

enum class FileState { kPending, kTagged, kSkipped, kFailed };

struct FileOutcome {
  FileState state = FileState::kPending;
  std::string tag_path;
  std::vector<Tag> tags;
  std::optional<FileError> error;
};

std::string ReadSource(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw EngineError(EngineError::Kind::kIo,
                      "Failed to open source file: " + path.string());
  }
  std::ostringstream contents;
  contents << stream.rdbuf();
  if (stream.bad()) {
    throw EngineError(EngineError::Kind::kIo,
                      "Failed to read source file: " + path.string());
  }
  return contents.str();
}

std::filesystem::path Normalized(const std::filesystem::path &path) {
  return std::filesystem::absolute(path).lexically_normal();
}

} // namespace

std::string RelativeTagPath(const std::filesystem::path &file,
                            const std::filesystem::path &base_directory) {
  const auto relative =
      Normalized(file).lexically_relative(Normalized(base_directory));
  if (relative.empty() || *relative.begin() == "..") {
    return file.generic_string();
  }
  return relative.generic_string();
}

ParallelDispatcher::ParallelDispatcher(const LanguageRegistry &registry,
                                       EngineFactory factory,
                                       TagNormalizer normalizer,
                                       std::shared_ptr<Logger> logger)
    : registry_(registry), factory_(std::move(factory)),
      normalizer_(std::move(normalizer)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!factory_) {
    throw std::invalid_argument("ParallelDispatcher requires an engine factory");
  }
}

DispatchResult
ParallelDispatcher::Run(const std::vector<std::filesystem::path> &files,
                        std::size_t worker_count,
                        const std::filesystem::path &base_directory) const {
  DispatchResult result;
  if (files.empty()) {
    return result;
  }
  const auto workers = std::clamp<std::size_t>(worker_count, 1, files.size());
  logger_->Log(LogLevel::kInfo, "dispatch.start",
               {{"files", std::to_string(files.size())},
                {"workers", std::to_string(workers)}});

  std::vector<FileOutcome> outcomes(files.size());
  std::atomic<std::size_t> next_index{0};

  RunOnWorkerThreads(workers, [&](std::size_t) {
    std::unique_ptr<TagEngine> engine;
    for (auto index = next_index.fetch_add(1); index < files.size();
         index = next_index.fetch_add(1)) {
      const auto &path = files[index];
      auto &outcome = outcomes[index];
      const auto *profile = registry_.Resolve(path);
      if (profile == nullptr) {
        outcome.state = FileState::kSkipped;
        continue;
      }
      outcome.tag_path = RelativeTagPath(path, base_directory);
      try {
        if (!engine) {
          engine = factory_();
          if (!engine) {
            throw std::runtime_error("Engine factory produced no engine");
          }
        }
        const auto source = ReadSource(path);
        const auto captures = engine->ParseAndQuery(source, *profile);
        outcome.tags = normalizer_.Normalize(captures, *profile,
                                             outcome.tag_path);
        outcome.state = FileState::kTagged;
      } catch (const std::exception &ex) {
        outcome.tags.clear();
        outcome.error = FileError{path.string(), ex.what()};
        outcome.state = FileState::kFailed;
      }
    }
  });

  for (auto &outcome : outcomes) {
    switch (outcome.state) {
    case FileState::kTagged:
      ++result.processed;
      result.regenerated_files.push_back(outcome.tag_path);
      result.tags.insert(result.tags.end(),
                         std::make_move_iterator(outcome.tags.begin()),
                         std::make_move_iterator(outcome.tags.end()));
      break;
    case FileState::kFailed:
      logger_->Log(LogLevel::kWarn, "dispatch.file.failed",
                   {{"path", outcome.error->path},
                    {"cause", outcome.error->cause}});
      result.errors.push_back(std::move(*outcome.error));
      break;
    case FileState::kSkipped:
    case FileState::kPending:
      ++result.skipped;
      break;
    }
  }

  logger_->Log(LogLevel::kInfo, "dispatch.complete",
               {{"processed", std::to_string(result.processed)},
                {"skipped", std::to_string(result.skipped)},
                {"failed", std::to_string(result.errors.size())},
                {"tags", std::to_string(result.tags.size())}});
  return result;
}

} // namespace treetags

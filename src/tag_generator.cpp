#include <treetags/tag_generator.h>

#include <treetags/tag_file_reader.h>
#include <treetags/tag_store.h>
#include <treetags/tag_writer.h>

#include <optional>
#include <set>
#include <stdexcept>
#include <utility>

namespace treetags {
namespace {

std::filesystem::path TagFileDirectory(const std::filesystem::path &tag_file) {
  if (tag_file == "-") {
    return std::filesystem::current_path();
  }
  const auto parent = tag_file.parent_path();
  return parent.empty() ? std::filesystem::current_path() : parent;
}

} // namespace

NormalizerOptions BuildNormalizerOptions(const TagOptions &options,
                                         const LanguageRegistry &registry,
                                         std::vector<std::string> *warnings) {
  NormalizerOptions normalizer;
  if (options.fields) {
    normalizer.fields = FieldSelection::Parse(*options.fields, warnings);
  }
  if (options.extras) {
    normalizer.extras = ExtrasSelection::Parse(*options.extras, warnings);
  }
  normalizer.line_number_addresses = options.excmd.value_or("") == "number";

  for (const auto &[language, spec] : options.kinds) {
    const auto *profile = registry.Find(CanonicalLanguageName(language));
    if (profile == nullptr) {
      if (warnings != nullptr) {
        warnings->push_back("Unknown language for kinds: " + language);
      }
      continue;
    }
    normalizer.kind_filters[profile->name] =
        KindFilter::Parse(spec, profile->DefaultKindAliases(),
                          profile->OptionalKindAliases(), warnings);
  }
  return normalizer;
}

TagGenerator::TagGenerator(const LanguageRegistry &registry,
                           EngineFactory factory,
                           std::shared_ptr<Logger> logger)
    : registry_(registry), factory_(std::move(factory)),
      logger_(EnsureLogger(std::move(logger))) {}

GenerationResult TagGenerator::Run(const GenerationRequest &request) const {
  GenerationResult result;
  result.profile_errors = registry_.Errors();

  std::optional<TagFile> existing;
  if (request.append) {
    if (request.tag_file == "-") {
      throw std::invalid_argument(
          "Append mode needs a tag file, not standard output");
    }
    existing = ReadTagFile(request.tag_file);
  }

  ParallelDispatcher dispatcher(registry_, factory_,
                                TagNormalizer(request.normalizer), logger_);
  result.dispatch = dispatcher.Run(request.files, request.workers,
                                   TagFileDirectory(request.tag_file));

  TagStore store(logger_);
  store.Add(std::move(result.dispatch.tags));
  result.dispatch.tags.clear();
  if (existing) {
    const std::set<std::string> regenerated(
        result.dispatch.regenerated_files.begin(),
        result.dispatch.regenerated_files.end());
    store.MergeExisting(std::move(*existing), regenerated);
  }

  const auto written = store.size();
  try {
    TagWriter writer(logger_);
    writer.Write(store.TakeEntries(), request.tag_file.string(),
                 WriteOptions{request.sort});
  } catch (const std::runtime_error &ex) {
    logger_->Log(LogLevel::kError, "writer.failed",
                 {{"tag_file", request.tag_file.string()},
                  {"cause", ex.what()}});
    throw GenerationError(ex.what(), std::move(result));
  }
  result.written = written;
  return result;
}

} // namespace treetags

#include <treetags/treetags_cli.h>

#include <treetags/cli_exit_codes.h>
#include <treetags/cli_options.h>
#include <treetags/errors.h>
#include <treetags/language_registry.h>
#include <treetags/profile_loader.h>
#include <treetags/source_discovery.h>
#include <treetags/tag_generator.h>
#include <treetags/tree_sitter_engine.h>
#include <treetags/version.h>

#include <filesystem>
#include <iostream>

namespace treetags {
namespace {

LoggingConfig BuildLoggingConfig(const TagOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

std::filesystem::path DiscoveryRoot(const std::filesystem::path &tag_file) {
  if (tag_file == "-" || tag_file.parent_path().empty()) {
    return ".";
  }
  return tag_file.parent_path();
}

void PrintWarnings(const std::vector<std::string> &warnings) {
  for (const auto &warning : warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }
}

} // namespace

int RunTreetags(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseArguments(arguments);
  if (cli_options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (cli_options.show_version) {
    std::cout << kProgramName << " " << kProgramVersion << "\n";
    return kExitSuccess;
  }

  const auto options = ResolveOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(options), std::clog);
  for (const auto &ignored : options.ignored_options) {
    logger->Log(LogLevel::kDebug, "option.ignored", {{"option", ignored}});
  }

  LanguageRegistry registry(logger);
  LoadProfiles(registry, options.grammars, logger);

  const auto tag_file =
      ResolveTagFilePath(options, std::filesystem::current_path());

  std::vector<std::string> warnings;
  GenerationRequest request;
  request.tag_file = tag_file;
  request.append = options.append.value_or(false);
  request.sort = options.sort.value_or(true);
  request.workers = options.workers.value_or(kDefaultWorkers);
  request.normalizer = BuildNormalizerOptions(options, registry, &warnings);

  SourceDiscovery discovery(logger);
  DiscoveryOptions discovery_options;
  discovery_options.inputs = options.inputs;
  discovery_options.root = DiscoveryRoot(tag_file);
  discovery_options.exclude_patterns = options.exclude;
  auto discovered = discovery.Discover(discovery_options);
  request.files = std::move(discovered.files);
  warnings.insert(warnings.end(), discovered.warnings.begin(),
                  discovered.warnings.end());
  PrintWarnings(warnings);

  TagGenerator generator(registry, MakeTreeSitterEngineFactory(), logger);
  GenerationResult result;
  try {
    result = generator.Run(request);
  } catch (const GenerationError &error) {
    ReportErrors(error.partial().profile_errors,
                 error.partial().dispatch.errors, std::cerr);
    throw;
  } catch (const std::exception &) {
    ReportErrors(registry.Errors(), {}, std::cerr);
    throw;
  }

  ReportErrors(result.profile_errors, result.dispatch.errors, std::cerr);
  // File and profile errors are warnings: the run still succeeds.
  return kExitSuccess;
}

} // namespace treetags

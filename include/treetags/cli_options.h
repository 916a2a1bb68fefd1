#pragma once

#include <treetags/language_profile.h>
#include <treetags/logging.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace treetags {

inline constexpr const char *kDefaultTagFile = "tags";
inline constexpr std::size_t kDefaultWorkers = 4;

struct TagOptions {
  std::optional<std::string> tag_file;
  std::optional<bool> append;
  std::optional<bool> sort;
  std::optional<std::size_t> workers;
  std::vector<std::string> exclude;
  std::optional<std::string> fields;
  std::optional<std::string> extras;
  std::optional<std::string> excmd;
  std::map<std::string, std::string> kinds;
  std::vector<GrammarRegistration> grammars;
  std::optional<std::filesystem::path> config_file;
  std::optional<LogLevel> log_level;
  std::vector<std::filesystem::path> inputs;
  std::vector<std::string> ignored_options;
  bool show_help = false;
  bool show_version = false;
};

TagOptions ParseArguments(const std::vector<std::string> &arguments);
TagOptions ParseConfigFile(const std::filesystem::path &path);
TagOptions MergeOptions(const TagOptions &config_options,
                        const TagOptions &cli_options);

// $XDG_CONFIG_HOME/treetags/config.yaml, falling back to
// $HOME/.config/treetags/config.yaml.
std::optional<std::filesystem::path> DefaultConfigPath();

// Loads the explicit --config file, or the default one when it exists, and
// lets the command line win.
TagOptions ResolveOptions(const TagOptions &cli_options);

// "-" stays as is. In append mode the tag file name is looked up in
// working_directory and its parents.
std::filesystem::path ResolveTagFilePath(const TagOptions &options,
                                         const std::filesystem::path &working_directory);

std::string CanonicalLanguageName(const std::string &language);

void PrintUsage(std::ostream &stream);

} // namespace treetags

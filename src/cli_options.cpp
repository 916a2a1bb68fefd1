#include <treetags/cli_options.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace treetags {
namespace {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::optional<bool> ParseBoolLike(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  return std::nullopt;
}

bool ParseBool(const std::string &value, const std::string &name) {
  const auto parsed = ParseBoolLike(value);
  if (!parsed) {
    throw std::invalid_argument(name + " expects a boolean value, got '" +
                                value + "'");
  }
  return *parsed;
}

std::size_t ParseWorkers(const std::string &value) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
      })) {
    throw std::invalid_argument("--workers expects a non-negative number, got '" +
                                value + "'");
  }
  try {
    return static_cast<std::size_t>(std::stoul(trimmed));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("--workers value is out of range: " + value);
  }
}

std::string ParseExcmd(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized != "number" && normalized != "pattern") {
    throw std::invalid_argument("Unsupported --excmd value: " + value +
                                " (expected number or pattern)");
  }
  return normalized;
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

// "--c++-kinds" and "--kinds-c++" both name a language.
std::optional<std::string> KindsFlagLanguage(const std::string &flag) {
  static const std::string kSuffix = "-kinds";
  static const std::string kPrefix = "--kinds-";
  if (flag.rfind(kPrefix, 0) == 0 && flag.size() > kPrefix.size()) {
    return flag.substr(kPrefix.size());
  }
  if (flag.size() > kSuffix.size() + 2 && flag.rfind("--", 0) == 0 &&
      flag.compare(flag.size() - kSuffix.size(), kSuffix.size(), kSuffix) ==
          0) {
    return flag.substr(2, flag.size() - 2 - kSuffix.size());
  }
  return std::nullopt;
}

bool IsIgnoredOption(const std::string &flag) {
  return flag == "--options" || flag == "--format" ||
         flag == "--language-force";
}

// Handles "--append", "--append=yes" and "--append yes". A following
// argument that is not boolean-like is left for the file list.
bool ParseToggle(const std::vector<std::string> &arguments, std::size_t &index,
                 const std::optional<std::string> &inline_value,
                 const std::string &flag) {
  if (inline_value) {
    return ParseBool(*inline_value, flag);
  }
  if (index + 1 < arguments.size()) {
    if (const auto value = ParseBoolLike(arguments[index + 1])) {
      ++index;
      return *value;
    }
  }
  return true;
}

bool DispatchOption(const std::vector<std::string> &arguments,
                    std::size_t &index, TagOptions &options) {
  auto flag = arguments[index];
  std::optional<std::string> inline_value;
  if (flag.rfind("--", 0) == 0) {
    if (const auto equals = flag.find('='); equals != std::string::npos) {
      inline_value = flag.substr(equals + 1);
      flag = flag.substr(0, equals);
    }
  }
  const auto value = [&](const std::string &name) {
    return inline_value ? *inline_value : RequireValue(arguments, index, name);
  };

  if (flag == "--help" || flag == "-h") {
    options.show_help = true;
    return true;
  }
  if (flag == "--version") {
    options.show_version = true;
    return true;
  }
  if (flag == "-f" || flag == "-o" || flag == "--output") {
    options.tag_file = value(flag);
    return true;
  }
  if (flag == "-a" || flag == "--append") {
    options.append = ParseToggle(arguments, index, inline_value, flag);
    return true;
  }
  if (flag == "--sort") {
    options.sort = ParseToggle(arguments, index, inline_value, flag);
    return true;
  }
  if (flag == "-u") {
    options.sort = false;
    return true;
  }
  if (flag == "--workers" || flag == "-j") {
    options.workers = ParseWorkers(value(flag));
    return true;
  }
  if (flag == "--exclude") {
    options.exclude.push_back(value(flag));
    return true;
  }
  if (flag == "--fields") {
    options.fields = value(flag);
    return true;
  }
  if (flag == "--extras" || flag == "--extra") {
    options.extras = value(flag);
    return true;
  }
  if (flag == "--excmd") {
    options.excmd = ParseExcmd(value(flag));
    return true;
  }
  if (flag == "--config") {
    options.config_file = value(flag);
    return true;
  }
  if (flag == "--log-level") {
    options.log_level = ParseLogLevel(value(flag));
    return true;
  }
  if (flag == "--verbose" || flag == "-V") {
    options.log_level = LogLevel::kInfo;
    return true;
  }
  if (flag == "--debug") {
    options.log_level = LogLevel::kDebug;
    return true;
  }
  if (flag == "-R" || flag == "--recurse") {
    options.ignored_options.push_back(flag);
    return true;
  }
  if (IsIgnoredOption(flag)) {
    options.ignored_options.push_back(flag + "=" + value(flag));
    return true;
  }
  if (const auto language = KindsFlagLanguage(flag)) {
    options.kinds[CanonicalLanguageName(*language)] = value(flag);
    return true;
  }
  return false;
}

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "tag_file", "workers", "sort",   "append", "exclude",  "fields",
      "extras",   "excmd",   "kinds",  "grammars", "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"tagfile", "tag_file"},
      {"output", "tag_file"},
      {"jobs", "workers"},
      {"excludes", "exclude"},
      {"languages", "grammars"},
      {"user_grammars", "grammars"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractString(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
    return values;
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or list of strings");
  }
  for (const auto &child : node) {
    if (!child.IsScalar()) {
      throw std::invalid_argument("Config key '" + key_name +
                                  "' must be a list of strings");
    }
    values.push_back(child.as<std::string>());
  }
  return values;
}

std::filesystem::path ResolveAgainst(const std::filesystem::path &base,
                                     const std::string &value) {
  std::filesystem::path path(value);
  if (path.is_relative()) {
    path = base / path;
  }
  return path.lexically_normal();
}

GrammarRegistration ExtractGrammar(const YAML::Node &node,
                                   const std::filesystem::path &base) {
  if (!node.IsMap()) {
    throw std::invalid_argument(
        "Each entry of 'grammars' must be a mapping with 'language' and "
        "'library'");
  }
  GrammarRegistration grammar;
  for (const auto &entry : node) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    const auto &value = entry.second;
    if (key == "language" || key == "language_name") {
      grammar.language = CanonicalLanguageName(ExtractString(value, key));
    } else if (key == "library" || key == "grammar_lib_path") {
      grammar.library = ResolveAgainst(base, ExtractString(value, key));
    } else if (key == "query" || key == "query_file_path") {
      grammar.query = ResolveAgainst(base, ExtractString(value, key));
    } else if (key == "extensions") {
      grammar.extensions = ExtractList(value, key);
    } else if (key == "symbol") {
      grammar.symbol = ExtractString(value, key);
    } else {
      throw std::invalid_argument(
          "Unknown grammar key: " + key +
          ". Supported keys: language, library, query, extensions, symbol");
    }
  }
  if (grammar.language.empty() || grammar.library.empty()) {
    throw std::invalid_argument(
        "Grammar entries require both 'language' and 'library'");
  }
  return grammar;
}

void ApplyConfigEntry(const std::string &key, const YAML::Node &value,
                      const std::filesystem::path &base, TagOptions &options) {
  if (key == "tag_file") {
    options.tag_file = ExtractString(value, key);
  } else if (key == "workers") {
    options.workers = ParseWorkers(ExtractString(value, key));
  } else if (key == "sort") {
    options.sort = ParseBool(ExtractString(value, key), key);
  } else if (key == "append") {
    options.append = ParseBool(ExtractString(value, key), key);
  } else if (key == "exclude") {
    options.exclude = ExtractList(value, key);
  } else if (key == "fields") {
    options.fields = ExtractString(value, key);
  } else if (key == "extras") {
    options.extras = ExtractString(value, key);
  } else if (key == "excmd") {
    options.excmd = ParseExcmd(ExtractString(value, key));
  } else if (key == "log_level") {
    options.log_level = ParseLogLevel(ExtractString(value, key));
  } else if (key == "kinds") {
    if (!value.IsMap()) {
      throw std::invalid_argument(
          "Config key 'kinds' must map language names to kind specs");
    }
    for (const auto &entry : value) {
      options.kinds[CanonicalLanguageName(entry.first.as<std::string>())] =
          ExtractString(entry.second, "kinds");
    }
  } else if (key == "grammars") {
    if (!value.IsSequence()) {
      throw std::invalid_argument("Config key 'grammars' must be a list");
    }
    for (const auto &entry : value) {
      options.grammars.push_back(ExtractGrammar(entry, base));
    }
  } else {
    ThrowUnknownKey(key);
  }
}

} // namespace

std::string CanonicalLanguageName(const std::string &language) {
  auto normalized = ToLower(Trim(language));
  static const std::unordered_map<std::string, std::string> aliases = {
      {"cpp", "c++"},       {"cxx", "c++"},       {"js", "javascript"},
      {"py", "python"},     {"rs", "rust"},       {"golang", "go"},
      {"rb", "ruby"},       {"ml", "ocaml"},      {"ts", "typescript"},
      {"ex", "elixir"},     {"cs", "c#"},         {"csharp", "c#"},
      {"c_sharp", "c#"},    {"sh", "bash"}};
  if (const auto alias = aliases.find(normalized); alias != aliases.end()) {
    return alias->second;
  }
  return normalized;
}

TagOptions ParseArguments(const std::vector<std::string> &arguments) {
  TagOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--") {
      for (++i; i < arguments.size(); ++i) {
        options.inputs.emplace_back(arguments[i]);
      }
      break;
    }
    if (argument.size() > 1 && argument.front() == '-') {
      if (!DispatchOption(arguments, i, options)) {
        throw std::invalid_argument("Unknown argument: " + argument);
      }
      if (options.show_help || options.show_version) {
        break;
      }
      continue;
    }
    options.inputs.emplace_back(argument);
  }
  return options;
}

TagOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &ex) {
    throw std::invalid_argument("Failed to parse config file " +
                                path.string() + ": " + ex.what());
  }

  TagOptions options;
  options.config_file = path;
  if (root.IsNull()) {
    return options;
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  const auto base = std::filesystem::absolute(path).parent_path();
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    ApplyConfigEntry(key, entry.second, base, options);
  }
  return options;
}

TagOptions MergeOptions(const TagOptions &config_options,
                        const TagOptions &cli_options) {
  TagOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.tag_file, cli_options.tag_file);
  override_value(merged.append, cli_options.append);
  override_value(merged.sort, cli_options.sort);
  override_value(merged.workers, cli_options.workers);
  override_value(merged.fields, cli_options.fields);
  override_value(merged.extras, cli_options.extras);
  override_value(merged.excmd, cli_options.excmd);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.log_level, cli_options.log_level);

  if (!cli_options.exclude.empty()) {
    merged.exclude.insert(merged.exclude.end(), cli_options.exclude.begin(),
                          cli_options.exclude.end());
  }
  for (const auto &[language, spec] : cli_options.kinds) {
    merged.kinds[language] = spec;
  }
  merged.grammars.insert(merged.grammars.end(), cli_options.grammars.begin(),
                         cli_options.grammars.end());
  merged.inputs = cli_options.inputs;
  merged.ignored_options = cli_options.ignored_options;
  merged.show_help = cli_options.show_help;
  merged.show_version = cli_options.show_version;
  return merged;
}

std::optional<std::filesystem::path> DefaultConfigPath() {
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME");
      xdg != nullptr && *xdg != '\0') {
    return std::filesystem::path(xdg) / "treetags" / "config.yaml";
  }
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return std::filesystem::path(home) / ".config" / "treetags" /
           "config.yaml";
  }
  return std::nullopt;
}

TagOptions ResolveOptions(const TagOptions &cli_options) {
  if (cli_options.show_help || cli_options.show_version) {
    return cli_options;
  }

  TagOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  } else if (const auto default_path = DefaultConfigPath();
             default_path && std::filesystem::exists(*default_path)) {
    config_options = ParseConfigFile(*default_path);
  }
  return MergeOptions(config_options, cli_options);
}

std::filesystem::path
ResolveTagFilePath(const TagOptions &options,
                   const std::filesystem::path &working_directory) {
  const std::filesystem::path name = options.tag_file.value_or(kDefaultTagFile);
  if (name == "-" || name.is_absolute()) {
    return name;
  }
  if (options.append.value_or(false)) {
    for (auto directory = working_directory; !directory.empty();
         directory = directory.parent_path()) {
      const auto candidate = directory / name;
      if (std::filesystem::exists(candidate)) {
        return candidate;
      }
      if (directory == directory.parent_path()) {
        break;
      }
    }
  }
  return working_directory / name;
}

void PrintUsage(std::ostream &stream) {
  stream
      << "Usage: treetags [options] [file|directory...]\n"
      << "Options:\n"
      << "  -f <file>             Tag file to write ('-' for stdout, default: "
         "tags)\n"
      << "  --append [yes|no]     Replace entries of the given files in an\n"
      << "                        existing tag file\n"
      << "  --sort [yes|no]       Sort the tag file (default: yes)\n"
      << "  --workers <n>         Number of worker threads (default: 4)\n"
      << "  --exclude <glob>      Skip matching files and directories "
         "(repeatable)\n"
      << "  --fields <spec>       Extension fields, e.g. +n, +S-t, "
         "+line,+signature\n"
      << "  --extras <spec>       +q (qualified tags), -f (skip file-scoped "
         "tags)\n"
      << "  --excmd <mode>        Address form: pattern (default) or number\n"
      << "  --<lang>-kinds <spec> Kinds to tag, e.g. --c++-kinds=+p or "
         "--go-kinds=fsm\n"
      << "  --config <file>       YAML config file (default: "
         "$XDG_CONFIG_HOME/treetags/config.yaml)\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --version             Print the program version\n"
      << "  --help                Show this message\n"
      << "Accepted for ctags compatibility and ignored: --options, --format,\n"
      << "  --language-force, -R\n";
}

} // namespace treetags

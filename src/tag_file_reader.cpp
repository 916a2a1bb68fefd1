#include <treetags/tag_file_reader.h>

#include <treetags/errors.h>
#include <treetags/escaping.h>

#include <cctype>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <utility>

namespace treetags {
namespace {

constexpr const char *kPseudoTagPrefix = "!_TAG_";

bool IsNumber(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  for (const auto character : value) {
    if (std::isdigit(static_cast<unsigned char>(character)) == 0) {
      return false;
    }
  }
  return true;
}

std::uint32_t ToLine(const std::string &value) {
  try {
    return static_cast<std::uint32_t>(std::stoul(value));
  } catch (const std::out_of_range &) {
    return 0;
  }
}

TagAddress ParseAddress(const std::string &text) {
  TagAddress address;
  address.rendered = text;
  if (IsNumber(text)) {
    address.kind = TagAddress::Kind::kLineNumber;
    address.line = ToLine(text);
    return address;
  }
  address.kind = TagAddress::Kind::kPattern;
  auto body = text;
  if (body.size() >= 2 && (body.front() == '/' || body.front() == '?') &&
      body.back() == body.front()) {
    body = body.substr(1, body.size() - 2);
  }
  if (!body.empty() && body.front() == '^') {
    body.erase(0, 1);
  }
  if (!body.empty() && body.back() == '$') {
    // An odd run of backslashes before the '$' escapes it.
    std::size_t backslashes = 0;
    for (auto i = body.size() - 1; i > 0 && body[i - 1] == '\\'; --i) {
      ++backslashes;
    }
    if (backslashes % 2 == 0) {
      body.pop_back();
    }
  }
  address.pattern_source = UnescapePattern(body);
  return address;
}

void ApplyHeaderLine(const std::string &line, TagFileHeader &header,
                     bool &has_sorted, const std::string &source_name) {
  const auto first_tab = line.find('\t');
  const auto name = line.substr(0, first_tab);
  std::string value;
  if (first_tab != std::string::npos) {
    const auto second_tab = line.find('\t', first_tab + 1);
    value = line.substr(first_tab + 1, second_tab == std::string::npos
                                           ? std::string::npos
                                           : second_tab - first_tab - 1);
  }

  if (name == "!_TAG_FILE_SORTED") {
    if (value != "0" && value != "1" && value != "2") {
      throw TagFileError(TagFileError::Kind::kUnrecognizedHeader,
                         "Unrecognized !_TAG_FILE_SORTED value '" + value +
                             "' in " + source_name);
    }
    header.sorted = std::stoi(value);
    has_sorted = true;
    return;
  }
  if (name == "!_TAG_FILE_FORMAT") {
    if (value != "1" && value != "2") {
      throw TagFileError(TagFileError::Kind::kUnrecognizedHeader,
                         "Unsupported tag file format '" + value + "' in " +
                             source_name);
    }
    header.format = std::stoi(value);
    return;
  }
  if (name == "!_TAG_PROGRAM_NAME") {
    header.program_name = value;
    return;
  }
  if (name == "!_TAG_PROGRAM_VERSION") {
    header.program_version = value;
  }
}

} // namespace

std::optional<Tag> ParseTagLine(const std::string &line) {
  const auto fields = SplitTagLine(line);
  if (fields.size() < 3 || fields[0].empty() || fields[1].empty()) {
    return std::nullopt;
  }

  Tag tag;
  tag.name = fields[0];
  tag.file = fields[1];
  tag.address = ParseAddress(fields[2]);

  for (std::size_t i = 3; i < fields.size(); ++i) {
    const auto &field = fields[i];
    const auto colon = field.find(':');
    if (colon == std::string::npos) {
      if (tag.kind.code == '\0' && field.size() == 1) {
        tag.kind.code = field[0];
      }
      continue;
    }
    auto key = field.substr(0, colon);
    auto value = field.substr(colon + 1);
    if (key == "kind" && value.size() == 1 && tag.kind.code == '\0') {
      tag.kind.code = value[0];
      continue;
    }
    if (key == "line" && IsNumber(value)) {
      tag.address.line = ToLine(value);
    }
    tag.extension_fields.emplace_back(std::move(key), std::move(value));
  }
  return tag;
}

TagFile ParseTagFile(std::istream &stream, const std::string &source_name) {
  TagFile file;
  bool has_sorted = false;
  bool has_content = false;
  std::string line;

  while (std::getline(stream, line)) {
    has_content = true;
    auto parsed = line;
    if (!parsed.empty() && parsed.back() == '\r') {
      parsed.pop_back();
    }
    if (parsed.empty()) {
      continue;
    }
    if (parsed.rfind(kPseudoTagPrefix, 0) == 0) {
      ApplyHeaderLine(parsed, file.header, has_sorted, source_name);
      continue;
    }
    auto tag = ParseTagLine(parsed);
    if (!tag) {
      ++file.malformed_lines;
      continue;
    }
    file.entries.push_back(TagFileEntry{std::move(*tag), std::move(line)});
  }

  if (!has_content) {
    throw TagFileError(TagFileError::Kind::kUnrecognizedHeader,
                       "Tag file is empty: " + source_name);
  }
  if (!has_sorted) {
    throw TagFileError(TagFileError::Kind::kUnrecognizedHeader,
                       "Tag file has no !_TAG_FILE_SORTED header: " +
                           source_name);
  }
  return file;
}

TagFile ReadTagFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw TagFileError(TagFileError::Kind::kMissing,
                       "Tag file not found: " + path.string());
  }
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw TagFileError(TagFileError::Kind::kIo,
                       "Failed to open tag file: " + path.string());
  }
  auto file = ParseTagFile(stream, path.string());
  if (stream.bad()) {
    throw TagFileError(TagFileError::Kind::kIo,
                       "Failed to read tag file: " + path.string());
  }
  return file;
}

} // namespace treetags

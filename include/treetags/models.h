#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace treetags {

struct SourcePoint {
  std::uint32_t row = 0;
  std::uint32_t column = 0;
};

// A named child of a node between the identifier and the definition node
// (the identifier's own siblings first). Text longer than the engine's
// snapshot limit is left empty and marked truncated.
struct SiblingNode {
  std::string field_name;
  std::string node_type;
  std::string text;
  bool truncated = false;
};

struct CaptureMatch {
  std::string capture_name;
  std::uint32_t pattern_index = 0;
  std::uint32_t start_byte = 0;
  std::uint32_t end_byte = 0;
  SourcePoint start;
  SourcePoint end;

  std::string name;
  SourcePoint name_start;
  std::string line_text;
  std::vector<SiblingNode> siblings;
};

struct TagAddress {
  enum class Kind { kPattern, kLineNumber };

  Kind kind = Kind::kPattern;
  std::uint32_t line = 0;
  std::string pattern_source;
  // Set by the tag file reader: the address exactly as it appeared on disk.
  std::optional<std::string> rendered;

  static TagAddress Pattern(std::string source_line, std::uint32_t line) {
    TagAddress address;
    address.kind = Kind::kPattern;
    address.pattern_source = std::move(source_line);
    address.line = line;
    return address;
  }

  static TagAddress LineNumber(std::uint32_t line) {
    TagAddress address;
    address.kind = Kind::kLineNumber;
    address.line = line;
    return address;
  }
};

struct TagKind {
  char code = '\0';
  std::string name;
};

// Innermost enclosing definition: its kind and its qualified name.
struct TagScope {
  TagKind kind;
  std::string name;
};

using ExtensionFields = std::vector<std::pair<std::string, std::string>>;

struct Tag {
  std::string name;
  std::string file;
  TagAddress address;
  TagKind kind;
  std::optional<TagScope> scope;
  ExtensionFields extension_fields;
};

struct TagFileEntry {
  Tag tag;
  std::string line;
};

struct TagFileHeader {
  int format = 2;
  int sorted = 1;
  std::string program_name;
  std::string program_version;
};

struct TagFile {
  TagFileHeader header;
  std::vector<TagFileEntry> entries;
  std::size_t malformed_lines = 0;
};

struct FileError {
  std::string path;
  std::string cause;
};

struct ProfileError {
  std::string language;
  std::string cause;
};

} // namespace treetags

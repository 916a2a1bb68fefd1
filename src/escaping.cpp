#include <treetags/escaping.h>

namespace treetags {
namespace {

bool IsContinuationByte(unsigned char byte) { return (byte & 0xC0) == 0x80; }

// Escaped body cut to at most limit bytes without splitting a "\x" pair or a
// multi-byte character.
std::string TruncateEscaped(const std::string &escaped, std::size_t limit) {
  std::size_t cut = 0;
  std::size_t i = 0;
  while (i < escaped.size()) {
    std::size_t width = 1;
    if (escaped[i] == '\\' && i + 1 < escaped.size()) {
      width = 2;
    } else {
      while (i + width < escaped.size() &&
             IsContinuationByte(static_cast<unsigned char>(escaped[i + width]))) {
        ++width;
      }
    }
    if (i + width > limit) {
      break;
    }
    i += width;
    cut = i;
  }
  return escaped.substr(0, cut);
}

std::size_t FindPatternEnd(const std::string &line, std::size_t start) {
  const auto delimiter = line[start];
  for (std::size_t i = start + 1; i < line.size(); ++i) {
    if (line[i] == '\\') {
      ++i;
      continue;
    }
    if (line[i] == delimiter && line.compare(i + 1, 2, ";\"") == 0) {
      return i + 1;
    }
  }
  return std::string::npos;
}

} // namespace

std::string EscapePattern(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '\\' || character == '/') {
      escaped.push_back('\\');
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string UnescapePattern(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size() &&
        (value[i + 1] == '\\' || value[i + 1] == '/')) {
      unescaped.push_back(value[i + 1]);
      ++i;
      continue;
    }
    unescaped.push_back(value[i]);
  }
  return unescaped;
}

std::string RenderPattern(const std::string &source_line,
                          std::size_t max_length) {
  const auto escaped = EscapePattern(source_line);
  if (escaped.size() + 4 <= max_length) {
    return "/^" + escaped + "$/";
  }
  const auto limit = max_length > 3 ? max_length - 3 : 0;
  return "/^" + TruncateEscaped(escaped, limit) + "/";
}

std::vector<std::string> SplitTagLine(const std::string &line) {
  std::vector<std::string> fields;
  const auto first_tab = line.find('\t');
  if (first_tab == std::string::npos) {
    return fields;
  }
  const auto second_tab = line.find('\t', first_tab + 1);
  if (second_tab == std::string::npos) {
    return fields;
  }
  fields.push_back(line.substr(0, first_tab));
  fields.push_back(line.substr(first_tab + 1, second_tab - first_tab - 1));

  const auto address_start = second_tab + 1;
  std::size_t address_end = std::string::npos;
  if (address_start < line.size() &&
      (line[address_start] == '/' || line[address_start] == '?')) {
    address_end = FindPatternEnd(line, address_start);
  } else {
    address_end = line.find(";\"", address_start);
  }
  if (address_end == std::string::npos) {
    // Old-style line without the ';"' terminator.
    const auto tab = line.find('\t', address_start);
    fields.push_back(line.substr(address_start, tab == std::string::npos
                                                    ? std::string::npos
                                                    : tab - address_start));
    if (tab == std::string::npos) {
      return fields;
    }
    address_end = tab;
  } else {
    fields.push_back(line.substr(address_start, address_end - address_start));
    address_end += 2;
  }

  std::size_t position = address_end;
  while (position < line.size()) {
    if (line[position] == '\t') {
      ++position;
    }
    const auto tab = line.find('\t', position);
    const auto end = tab == std::string::npos ? line.size() : tab;
    if (end > position) {
      fields.push_back(line.substr(position, end - position));
    }
    position = end;
  }
  return fields;
}

} // namespace treetags

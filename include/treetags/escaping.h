#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace treetags {

inline constexpr std::size_t kMaxPatternLength = 256;

std::string EscapePattern(const std::string &value);
std::string UnescapePattern(const std::string &value);

// Renders "/^line$/". When the result would exceed max_length bytes the body
// is cut on a character boundary and the trailing anchor is dropped.
std::string RenderPattern(const std::string &source_line,
                          std::size_t max_length = kMaxPatternLength);

// Splits a tag line into name, file, address (without the ';"' terminator)
// followed by the extension fields. Tabs inside a search pattern stay part
// of the address. Returns fewer than three fields for malformed lines.
std::vector<std::string> SplitTagLine(const std::string &line);

} // namespace treetags

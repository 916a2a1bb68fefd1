#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace treetags {

bool IsValidUtf8(std::string_view bytes);

// Text of the physical line holding byte offset, without its terminator.
// "\n", "\r\n" and a lone "\r" all end a line, so CR-only files give the
// right pattern even though tree-sitter counts rows by "\n" alone.
std::string LineTextAt(std::string_view source, std::size_t offset);

// Runs of whitespace (including newlines) become a single space.
std::string CollapseWhitespace(std::string_view text);

bool ContainsControlCharacter(std::string_view text);

} // namespace treetags

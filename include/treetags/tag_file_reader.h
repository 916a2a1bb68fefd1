#pragma once

#include <treetags/models.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace treetags {

// Throws TagFileError when the file is missing, empty or lacks a
// recognizable !_TAG_FILE_SORTED header.
TagFile ReadTagFile(const std::filesystem::path &path);
TagFile ParseTagFile(std::istream &stream, const std::string &source_name);

std::optional<Tag> ParseTagLine(const std::string &line);

} // namespace treetags

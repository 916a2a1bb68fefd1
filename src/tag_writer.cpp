#include <treetags/tag_writer.h>

#include <treetags/escaping.h>
#include <treetags/version.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

namespace treetags {
namespace {

std::filesystem::path CreateTemporaryFile(
    const std::filesystem::path &destination) {
  auto directory = destination.parent_path();
  if (directory.empty()) {
    directory = ".";
  }
  auto pattern =
      (directory / ("." + destination.filename().string() + ".XXXXXX"))
          .string();
  const auto descriptor = mkstemp(pattern.data());
  if (descriptor < 0) {
    throw std::runtime_error("Failed to create temporary tag file in " +
                             directory.string() + ": " +
                             std::strerror(errno));
  }
  if (fchmod(descriptor, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) != 0) {
    const auto error = errno;
    close(descriptor);
    unlink(pattern.c_str());
    throw std::runtime_error("Failed to set permissions on " + pattern +
                             ": " + std::strerror(error));
  }
  close(descriptor);
  return pattern;
}

void WriteLines(std::ostream &stream, const std::vector<std::string> &header,
                const std::vector<TagFileEntry> &entries) {
  for (const auto &line : header) {
    stream << line << '\n';
  }
  for (const auto &entry : entries) {
    if (entry.line.empty()) {
      stream << FormatTagLine(entry.tag) << '\n';
    } else {
      stream << entry.line << '\n';
    }
  }
}

} // namespace

std::string RenderAddress(const TagAddress &address) {
  if (address.rendered) {
    return *address.rendered;
  }
  if (address.kind == TagAddress::Kind::kLineNumber) {
    return std::to_string(address.line);
  }
  return RenderPattern(address.pattern_source);
}

std::string FormatTagLine(const Tag &tag) {
  std::string line = tag.name;
  line += '\t';
  line += tag.file;
  line += '\t';
  line += RenderAddress(tag.address);
  line += ";\"\t";
  line += tag.kind.code;
  if (tag.scope) {
    line += '\t';
    line += tag.scope->kind.name;
    line += ':';
    line += tag.scope->name;
  }
  for (const auto &[key, value] : tag.extension_fields) {
    line += '\t';
    line += key;
    line += ':';
    line += value;
  }
  return line;
}

std::vector<std::string> FormatHeader(const WriteOptions &options) {
  return {
      "!_TAG_FILE_FORMAT\t2\t/extended format; --format=1 will not append ;\" "
      "to lines/",
      std::string("!_TAG_FILE_SORTED\t") + (options.sorted ? "1" : "0") +
          "\t/0=unsorted, 1=sorted, 2=foldcase/",
      std::string("!_TAG_PROGRAM_NAME\t") + kProgramName + "\t//",
      std::string("!_TAG_PROGRAM_VERSION\t") + kProgramVersion + "\t//",
  };
}

void SortEntries(std::vector<TagFileEntry> &entries) {
  std::stable_sort(entries.begin(), entries.end(),
                   [](const TagFileEntry &left, const TagFileEntry &right) {
                     if (left.tag.name != right.tag.name) {
                       return left.tag.name < right.tag.name;
                     }
                     if (left.tag.file != right.tag.file) {
                       return left.tag.file < right.tag.file;
                     }
                     return RenderAddress(left.tag.address) <
                            RenderAddress(right.tag.address);
                   });
}

TagWriter::TagWriter(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void TagWriter::Write(std::vector<TagFileEntry> entries, std::ostream &stream,
                      const WriteOptions &options) const {
  if (options.sorted) {
    SortEntries(entries);
  }
  WriteLines(stream, FormatHeader(options), entries);
  stream.flush();
  if (!stream) {
    throw std::runtime_error("Failed to write tag output");
  }
}

void TagWriter::Write(std::vector<TagFileEntry> entries,
                      const std::string &destination,
                      const WriteOptions &options) const {
  const auto count = entries.size();
  if (destination == "-") {
    Write(std::move(entries), std::cout, options);
    logger_->Log(LogLevel::kInfo, "writer.complete",
                 {{"destination", "stdout"},
                  {"entries", std::to_string(count)}});
    return;
  }

  const std::filesystem::path target(destination);
  const auto temporary = CreateTemporaryFile(target);
  try {
    {
      std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
      if (!stream) {
        throw std::runtime_error("Failed to open temporary tag file: " +
                                 temporary.string());
      }
      Write(std::move(entries), stream, options);
    }
    std::filesystem::rename(temporary, target);
  } catch (const std::exception &) {
    std::error_code ignored;
    std::filesystem::remove(temporary, ignored);
    throw;
  }

  logger_->Log(LogLevel::kInfo, "writer.complete",
               {{"destination", target.string()},
                {"entries", std::to_string(count)}});
}

} // namespace treetags

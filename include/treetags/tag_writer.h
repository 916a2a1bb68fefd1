#pragma once

#include <treetags/logging.h>
#include <treetags/models.h>

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace treetags {

struct WriteOptions {
  bool sorted = true;
};

std::string RenderAddress(const TagAddress &address);
std::string FormatTagLine(const Tag &tag);
std::vector<std::string> FormatHeader(const WriteOptions &options);

// Stable sort by (name, file), byte-wise, ties broken by address text.
void SortEntries(std::vector<TagFileEntry> &entries);

class TagWriter {
public:
  explicit TagWriter(std::shared_ptr<Logger> logger = nullptr);

  // "-" writes to standard output. Any other destination is replaced
  // atomically through a temporary file in the same directory.
  void Write(std::vector<TagFileEntry> entries, const std::string &destination,
             const WriteOptions &options) const;
  void Write(std::vector<TagFileEntry> entries, std::ostream &stream,
             const WriteOptions &options) const;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace treetags

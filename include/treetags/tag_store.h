#pragma once

#include <treetags/logging.h>
#include <treetags/models.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace treetags {

// Owns the tags of a run until they are written. In append mode the entries
// of an existing tag file are merged in: entries of regenerated files are
// dropped, every other line is kept as it was read.
class TagStore {
public:
  explicit TagStore(std::shared_ptr<Logger> logger = nullptr);

  void Add(std::vector<Tag> tags);
  void MergeExisting(TagFile existing,
                     const std::set<std::string> &regenerated_files);

  const std::vector<TagFileEntry> &Entries() const { return entries_; }
  std::vector<TagFileEntry> TakeEntries();
  std::size_t size() const { return entries_.size(); }

private:
  std::shared_ptr<Logger> logger_;
  std::vector<TagFileEntry> entries_;
};

} // namespace treetags

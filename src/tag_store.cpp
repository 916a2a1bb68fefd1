#include <treetags/tag_store.h>

#include <iterator>
#include <utility>

namespace treetags {

TagStore::TagStore(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void TagStore::Add(std::vector<Tag> tags) {
  entries_.reserve(entries_.size() + tags.size());
  for (auto &tag : tags) {
    entries_.push_back(TagFileEntry{std::move(tag), {}});
  }
}

void TagStore::MergeExisting(TagFile existing,
                             const std::set<std::string> &regenerated_files) {
  std::vector<TagFileEntry> kept;
  kept.reserve(existing.entries.size());
  std::size_t replaced = 0;
  for (auto &entry : existing.entries) {
    if (regenerated_files.count(entry.tag.file) != 0) {
      ++replaced;
      continue;
    }
    kept.push_back(std::move(entry));
  }

  logger_->Log(LogLevel::kInfo, "append.merge",
               {{"kept", std::to_string(kept.size())},
                {"replaced", std::to_string(replaced)},
                {"added", std::to_string(entries_.size())},
                {"malformed", std::to_string(existing.malformed_lines)}});

  kept.insert(kept.end(), std::make_move_iterator(entries_.begin()),
              std::make_move_iterator(entries_.end()));
  entries_ = std::move(kept);
}

std::vector<TagFileEntry> TagStore::TakeEntries() {
  return std::exchange(entries_, {});
}

} // namespace treetags

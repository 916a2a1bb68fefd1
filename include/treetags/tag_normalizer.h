#pragma once

#include <treetags/language_profile.h>
#include <treetags/models.h>
#include <treetags/tag_options.h>

#include <map>
#include <string>
#include <vector>

namespace treetags {

struct NormalizerOptions {
  FieldSelection fields;
  ExtrasSelection extras;
  // Keyed by language name. Languages without an entry use the
  // enabled-by-default flags of their kind table.
  std::map<std::string, KindFilter> kind_filters;
  bool line_number_addresses = false;
};

// Turns the captures of one file into tags. Captures must arrive in tree
// pre-order; scopes are recovered from byte-range nesting.
class TagNormalizer {
public:
  explicit TagNormalizer(NormalizerOptions options = {});

  std::vector<Tag> Normalize(const std::vector<CaptureMatch> &captures,
                             const LanguageProfile &profile,
                             const std::string &file_path) const;

  const NormalizerOptions &options() const { return options_; }

private:
  bool IsKindEnabled(const LanguageProfile &profile,
                     const KindSpec &kind) const;
  ExtensionFields ExtractFields(const CaptureMatch &capture,
                                const LanguageProfile &profile,
                                const KindSpec &kind) const;

  NormalizerOptions options_;
};

} // namespace treetags

#pragma once

#include <treetags/models.h>

#include <iosfwd>
#include <vector>

namespace treetags {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFatal = 1;

void ReportErrors(const std::vector<ProfileError> &profile_errors,
                  const std::vector<FileError> &file_errors,
                  std::ostream &stream);

} // namespace treetags

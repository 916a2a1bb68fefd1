#include <treetags/cli_exit_codes.h>

#include <ostream>

namespace treetags {

void ReportErrors(const std::vector<ProfileError> &profile_errors,
                  const std::vector<FileError> &file_errors,
                  std::ostream &stream) {
  for (const auto &error : profile_errors) {
    stream << "Warning: language " << error.language
           << " disabled: " << error.cause << "\n";
  }
  for (const auto &error : file_errors) {
    stream << "Warning: " << error.path << ": " << error.cause << "\n";
  }
}

} // namespace treetags

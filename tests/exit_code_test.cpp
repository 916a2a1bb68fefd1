#include <treetags/cli_exit_codes.h>
#include <treetags/tag_generator.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <utility>

namespace treetags {
namespace {

using ::testing::HasSubstr;

TEST(ExitCodesTest, FatalDiffersFromSuccess) {
  EXPECT_EQ(0, kExitSuccess);
  EXPECT_EQ(1, kExitFatal);
}

TEST(ExitCodesTest, ReportsErrorsCarriedByAFailedRun) {
  GenerationResult partial;
  partial.profile_errors.push_back(ProfileError{"rust", "grammar missing"});
  partial.dispatch.errors.push_back(FileError{"src/bad.c", "not valid UTF-8"});
  const GenerationError error("Failed to create temporary tag file",
                              std::move(partial));
  std::ostringstream stream;

  ReportErrors(error.partial().profile_errors, error.partial().dispatch.errors,
               stream);

  EXPECT_THAT(stream.str(), HasSubstr("language rust disabled"));
  EXPECT_THAT(stream.str(), HasSubstr("src/bad.c: not valid UTF-8"));
  EXPECT_STREQ("Failed to create temporary tag file", error.what());
}

TEST(ExitCodesTest, ReportsEveryAccumulatedError) {
  std::ostringstream stream;

  ReportErrors({ProfileError{"rust", "grammar missing"}},
               {FileError{"src/bad.c", "not valid UTF-8"},
                FileError{"src/gone.c", "Failed to open source file"}},
               stream);

  const auto output = stream.str();
  EXPECT_THAT(output, HasSubstr("Warning: language rust disabled: grammar missing"));
  EXPECT_THAT(output, HasSubstr("Warning: src/bad.c: not valid UTF-8"));
  EXPECT_THAT(output, HasSubstr("src/gone.c"));
}

} // namespace
} // namespace treetags

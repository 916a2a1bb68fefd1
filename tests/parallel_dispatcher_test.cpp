#include <treetags/parallel_dispatcher.h>
#include <treetags/worker_thread.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support/fake_engine.h"
#include "test_support/temporary_project.h"

namespace treetags {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ParallelDispatcherTest : public ::testing::Test {
protected:
  ParallelDispatcherTest() {
    registry_.RegisterBuiltin(test::LineProfile("line", {"ln"}));
  }

  EngineFactory Factory() {
    return [this]() {
      return std::make_unique<test::LineEngine>(&calls_, &stack_size_);
    };
  }

  std::vector<std::string> Names(const DispatchResult &result) const {
    std::vector<std::string> names;
    for (const auto &tag : result.tags) {
      names.push_back(tag.file + ":" + tag.name);
    }
    return names;
  }

  test::TemporaryProject project_;
  LanguageRegistry registry_;
  std::atomic<int> calls_{0};
  std::atomic<std::size_t> stack_size_{0};
};

TEST_F(ParallelDispatcherTest, TagsEveryRecognizedFile) {
  const auto a = project_.AddFile("a.ln", "definition.function alpha\n");
  const auto b = project_.AddFile("sub/b.ln", "definition.class Beta\n");
  ParallelDispatcher dispatcher(registry_, Factory(), TagNormalizer{});

  const auto result = dispatcher.Run({a, b}, 2, project_.root());

  EXPECT_EQ(2u, result.processed);
  EXPECT_EQ(0u, result.skipped);
  EXPECT_TRUE(result.errors.empty());
  EXPECT_THAT(Names(result), ElementsAre("a.ln:alpha", "sub/b.ln:Beta"));
  EXPECT_THAT(result.regenerated_files, ElementsAre("a.ln", "sub/b.ln"));
}

TEST_F(ParallelDispatcherTest, UnknownExtensionsAreSkippedSilently) {
  const auto notes = project_.AddFile("notes.txt", "definition.function x\n");
  const auto code = project_.AddFile("c.ln", "definition.function y\n");
  ParallelDispatcher dispatcher(registry_, Factory(), TagNormalizer{});

  const auto result = dispatcher.Run({notes, code}, 4, project_.root());

  EXPECT_EQ(1u, result.skipped);
  EXPECT_EQ(1u, result.processed);
  EXPECT_TRUE(result.errors.empty());
  EXPECT_EQ(1, calls_.load());
  EXPECT_THAT(Names(result), ElementsAre("c.ln:y"));
}

TEST_F(ParallelDispatcherTest, FailingFileDoesNotStopTheBatch) {
  std::vector<std::filesystem::path> files;
  for (int i = 0; i < 12; ++i) {
    files.push_back(project_.AddFile(
        "f" + std::to_string(i) + ".ln",
        i == 5 ? "!fail\n" : "definition.function f" + std::to_string(i) + "\n"));
  }
  files.push_back(project_.root() / "missing.ln");
  std::stringstream log;
  ParallelDispatcher dispatcher(
      registry_, Factory(), TagNormalizer{},
      std::make_shared<StructuredLogger>(log, LoggingConfig{}));

  const auto result = dispatcher.Run(files, 3, project_.root());

  EXPECT_EQ(11u, result.processed);
  EXPECT_EQ(11u, result.tags.size());
  ASSERT_EQ(2u, result.errors.size());
  EXPECT_THAT(result.errors[0].path, HasSubstr("f5.ln"));
  EXPECT_THAT(result.errors[0].cause, HasSubstr("parser gave up"));
  EXPECT_THAT(result.errors[1].path, HasSubstr("missing.ln"));
  EXPECT_EQ(11u, result.regenerated_files.size());
  EXPECT_THAT(log.str(), HasSubstr("dispatch.file.failed"));
}

TEST_F(ParallelDispatcherTest, OutputOrderFollowsInputOrder) {
  std::vector<std::filesystem::path> files;
  for (int i = 0; i < 40; ++i) {
    files.push_back(project_.AddFile("m" + std::to_string(i) + ".ln",
                                     "definition.function t" +
                                         std::to_string(i) + "\n"));
  }
  ParallelDispatcher dispatcher(registry_, Factory(), TagNormalizer{});

  const auto serial = dispatcher.Run(files, 1, project_.root());
  const auto parallel = dispatcher.Run(files, 8, project_.root());

  EXPECT_EQ(Names(serial), Names(parallel));
  EXPECT_EQ("m0.ln:t0", Names(parallel).front());
  EXPECT_EQ("m39.ln:t39", Names(parallel).back());
}

TEST_F(ParallelDispatcherTest, WorkerCountIsClamped) {
  const auto file = project_.AddFile("one.ln", "definition.function only\n");
  std::stringstream log;
  ParallelDispatcher dispatcher(
      registry_, Factory(), TagNormalizer{},
      std::make_shared<StructuredLogger>(log, LoggingConfig{LogLevel::kInfo}));

  const auto zero = dispatcher.Run({file}, 0, project_.root());
  const auto many = dispatcher.Run({file}, 64, project_.root());

  EXPECT_EQ(1u, zero.tags.size());
  EXPECT_EQ(1u, many.tags.size());
  EXPECT_THAT(log.str(), HasSubstr("\"workers\": \"1\""));
  EXPECT_EQ(std::string::npos, log.str().find("\"workers\": \"64\""));
}

TEST_F(ParallelDispatcherTest, EmptyInputProducesNothing) {
  ParallelDispatcher dispatcher(registry_, Factory(), TagNormalizer{});

  const auto result = dispatcher.Run({}, 4, project_.root());

  EXPECT_TRUE(result.tags.empty());
  EXPECT_EQ(0, calls_.load());
}

TEST_F(ParallelDispatcherTest, WorkersRunOnEnlargedStacks) {
  const auto file = project_.AddFile("s.ln", "definition.function deep\n");
  ParallelDispatcher dispatcher(registry_, Factory(), TagNormalizer{});

  dispatcher.Run({file}, 1, project_.root());

  EXPECT_GE(stack_size_.load(), WorkerStackSize());
  EXPECT_EQ(DefaultThreadStackSize() * kWorkerStackMultiplier,
            WorkerStackSize());
}

TEST_F(ParallelDispatcherTest, MissingEngineIsAFileError) {
  const auto file = project_.AddFile("e.ln", "definition.function x\n");
  ParallelDispatcher dispatcher(
      registry_, []() { return std::unique_ptr<TagEngine>(); }, TagNormalizer{});

  const auto result = dispatcher.Run({file}, 1, project_.root());

  ASSERT_EQ(1u, result.errors.size());
  EXPECT_THAT(result.errors[0].cause, HasSubstr("no engine"));
}

TEST(ParallelDispatcherConstructionTest, RequiresFactory) {
  LanguageRegistry registry;
  EXPECT_THROW((ParallelDispatcher(registry, EngineFactory{}, TagNormalizer{})),
               std::invalid_argument);
}

TEST(RelativeTagPathTest, RelativeToTagFileDirectory) {
  EXPECT_EQ("src/a.c", RelativeTagPath("/work/proj/src/a.c", "/work/proj"));
  EXPECT_EQ("a.c", RelativeTagPath("/work/proj/./src/../a.c", "/work/proj"));
  EXPECT_EQ("/elsewhere/b.c", RelativeTagPath("/elsewhere/b.c", "/work/proj"));
}

TEST(WorkerThreadTest, RunsEveryWorkerAndRethrowsFailures) {
  std::atomic<int> ran{0};
  RunOnWorkerThreads(4, [&](std::size_t) { ++ran; });
  EXPECT_EQ(4, ran.load());

  EXPECT_THROW(RunOnWorkerThreads(2,
                                  [](std::size_t index) {
                                    if (index == 1) {
                                      throw std::runtime_error("boom");
                                    }
                                  }),
               std::runtime_error);
}

} // namespace
} // namespace treetags

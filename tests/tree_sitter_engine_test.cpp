#include <treetags/errors.h>
#include <treetags/tag_normalizer.h>
#include <treetags/tag_writer.h>
#include <treetags/tree_sitter_engine.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_support/grammar_fixture.h"

namespace treetags {
namespace {

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Pair;

std::vector<Tag> TagSource(const LanguageProfile &profile,
                           const std::string &source,
                           NormalizerOptions options = {}) {
  TreeSitterEngine engine;
  const auto captures = engine.ParseAndQuery(source, profile);
  return TagNormalizer(std::move(options)).Normalize(captures, profile, "src");
}

const Tag *FindTag(const std::vector<Tag> &tags, const std::string &name) {
  for (const auto &tag : tags) {
    if (tag.name == name) {
      return &tag;
    }
  }
  return nullptr;
}

class PythonEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    profile_ = test::LoadedBuiltin("python");
    if (!profile_) {
      GTEST_SKIP() << "tree-sitter python grammar is not installed";
    }
  }

  std::optional<LanguageProfile> profile_;
};

TEST_F(PythonEngineTest, CapturesArriveInTreeOrder) {
  TreeSitterEngine engine;

  const auto captures = engine.ParseAndQuery(
      "class Foo:\n    def bar(self):\n        print(1)\n", *profile_);

  ASSERT_GE(captures.size(), 2u);
  for (std::size_t i = 1; i < captures.size(); ++i) {
    const auto &previous = captures[i - 1];
    const auto &current = captures[i];
    EXPECT_TRUE(previous.start_byte < current.start_byte ||
                (previous.start_byte == current.start_byte &&
                 previous.end_byte >= current.end_byte));
  }
  EXPECT_EQ("definition.class", captures.front().capture_name);
  EXPECT_EQ("Foo", captures.front().name);
}

TEST_F(PythonEngineTest, MethodIsScopedToClass) {
  const auto tags =
      TagSource(*profile_, "class Foo:\n    def bar(self):\n        pass\n");

  const auto *foo = FindTag(tags, "Foo");
  const auto *bar = FindTag(tags, "bar");
  ASSERT_NE(nullptr, foo);
  ASSERT_NE(nullptr, bar);
  EXPECT_EQ('c', foo->kind.code);
  EXPECT_FALSE(foo->scope.has_value());
  EXPECT_EQ('m', bar->kind.code);
  ASSERT_TRUE(bar->scope.has_value());
  EXPECT_EQ("class", bar->scope->kind.name);
  EXPECT_EQ("Foo", bar->scope->name);
  EXPECT_EQ(2u, bar->address.line);
  EXPECT_EQ("    def bar(self):", bar->address.pattern_source);
}

TEST_F(PythonEngineTest, ReferencesProduceNoTags) {
  const auto tags = TagSource(*profile_, "print(1)\nlen([])\n");

  EXPECT_TRUE(tags.empty());
}

TEST_F(PythonEngineTest, SignatureComesFromParameters) {
  NormalizerOptions options;
  options.fields = FieldSelection::Parse("+nS");

  const auto tags =
      TagSource(*profile_, "def area(width,\n         height):\n    pass\n",
                options);

  ASSERT_EQ(1u, tags.size());
  EXPECT_THAT(tags[0].extension_fields,
              Contains(Pair("signature", "(width, height)")));
  EXPECT_THAT(tags[0].extension_fields, Contains(Pair("line", "1")));
}

TEST_F(PythonEngineTest, MalformedInputStillYieldsTags) {
  const auto tags =
      TagSource(*profile_, "def ok():\n    pass\n\ndef broken(:\n    pass\n");

  EXPECT_NE(nullptr, FindTag(tags, "ok"));
}

TEST_F(PythonEngineTest, InvalidUtf8IsADecodeError) {
  TreeSitterEngine engine;

  try {
    engine.ParseAndQuery("x = '\xff\xfe'\n", *profile_);
    FAIL() << "Expected EngineError";
  } catch (const EngineError &error) {
    EXPECT_EQ(EngineError::Kind::kDecode, error.kind());
  }
}

TEST_F(PythonEngineTest, CarriageReturnsStayOutOfPatterns) {
  const auto tags = TagSource(*profile_, "def win():\r\n    pass\r\n");

  ASSERT_EQ(1u, tags.size());
  EXPECT_EQ("def win():", tags[0].address.pattern_source);
}

TEST(TreeSitterEngineTest, ProfileWithoutGrammarIsAParseError) {
  LanguageProfile profile;
  profile.name = "empty";
  TreeSitterEngine engine;

  try {
    engine.ParseAndQuery("x", profile);
    FAIL() << "Expected EngineError";
  } catch (const EngineError &error) {
    EXPECT_EQ(EngineError::Kind::kParse, error.kind());
  }
}

TEST(TreeSitterEngineTest, BackslashesAreEscapedInPatterns) {
  const auto profile = test::LoadedBuiltin("c");
  if (!profile) {
    GTEST_SKIP() << "tree-sitter c grammar is not installed";
  }

  const auto tags = TagSource(*profile, "#define SEP \"\\\\\"\n");

  const auto *sep = FindTag(tags, "SEP");
  ASSERT_NE(nullptr, sep);
  EXPECT_THAT(FormatTagLine(*sep), HasSubstr("/^#define SEP \"\\\\\\\\\"$/"));
}

TEST(TreeSitterEngineTest, CStructMembersUseDoubleColonScopes) {
  const auto profile = test::LoadedBuiltin("c");
  if (!profile) {
    GTEST_SKIP() << "tree-sitter c grammar is not installed";
  }

  const auto tags = TagSource(*profile,
                              "struct point {\n  int x;\n  int y;\n};\n"
                              "static int helper(void) { return 0; }\n");

  const auto *x = FindTag(tags, "x");
  ASSERT_NE(nullptr, x);
  EXPECT_EQ('m', x->kind.code);
  EXPECT_EQ("point", x->scope->name);
  EXPECT_NE(nullptr, FindTag(tags, "helper"));

  NormalizerOptions options;
  options.extras.file_scope = false;
  const auto exported = TagSource(*profile,
                                  "static int helper(void) { return 0; }\n"
                                  "int api(void) { return helper(); }\n",
                                  options);
  EXPECT_EQ(nullptr, FindTag(exported, "helper"));
  EXPECT_NE(nullptr, FindTag(exported, "api"));
}

TEST(TreeSitterEngineTest, RubyMethodsNestInsideModulesAndClasses) {
  const auto profile = test::LoadedBuiltin("ruby");
  if (!profile) {
    GTEST_SKIP() << "tree-sitter ruby grammar is not installed";
  }

  const auto tags = TagSource(*profile, "module Outer\n"
                                        "  class Inner\n"
                                        "    def run(a, b)\n"
                                        "    end\n"
                                        "    def self.build\n"
                                        "    end\n"
                                        "  end\n"
                                        "end\n");

  const auto *outer = FindTag(tags, "Outer");
  const auto *run = FindTag(tags, "run");
  const auto *build = FindTag(tags, "build");
  ASSERT_NE(nullptr, outer);
  ASSERT_NE(nullptr, run);
  ASSERT_NE(nullptr, build);
  EXPECT_EQ('m', outer->kind.code);
  EXPECT_EQ('f', run->kind.code);
  ASSERT_TRUE(run->scope.has_value());
  EXPECT_EQ("Inner", run->scope->name);
  EXPECT_EQ('S', build->kind.code);
  EXPECT_EQ(5u, build->address.line);
}

TEST(TreeSitterEngineTest, BashFunctionsAndHeredocsAreTagged) {
  const auto profile = test::LoadedBuiltin("bash");
  if (!profile) {
    GTEST_SKIP() << "tree-sitter bash grammar is not installed";
  }

  const auto tags = TagSource(*profile, "setup() {\n"
                                        "  cat <<EOF\n"
                                        "hello\n"
                                        "EOF\n"
                                        "}\n"
                                        "setup\n");

  const auto *setup = FindTag(tags, "setup");
  ASSERT_NE(nullptr, setup);
  EXPECT_EQ('f', setup->kind.code);
  EXPECT_EQ(1u, setup->address.line);
  const auto *heredoc = FindTag(tags, "EOF");
  ASSERT_NE(nullptr, heredoc);
  EXPECT_EQ('h', heredoc->kind.code);
  EXPECT_EQ(2u, heredoc->address.line);
}

TEST(TreeSitterEngineTest, FactoryBuildsIndependentEngines) {
  const auto factory = MakeTreeSitterEngineFactory();

  const auto first = factory();
  const auto second = factory();

  EXPECT_NE(nullptr, first);
  EXPECT_NE(first.get(), second.get());
}

} // namespace
} // namespace treetags

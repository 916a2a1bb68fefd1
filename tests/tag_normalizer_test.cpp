#include <treetags/tag_normalizer.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace treetags {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Not;
using ::testing::Pair;

CaptureMatch Definition(std::string capture_name, std::string name,
                        std::uint32_t start_byte, std::uint32_t end_byte,
                        std::uint32_t start_row, std::uint32_t end_row,
                        std::string line_text) {
  CaptureMatch capture;
  capture.capture_name = std::move(capture_name);
  capture.name = std::move(name);
  capture.start_byte = start_byte;
  capture.end_byte = end_byte;
  capture.start = {start_row, 0};
  capture.end = {end_row, 1};
  capture.name_start = {start_row, 4};
  capture.line_text = std::move(line_text);
  return capture;
}

LanguageProfile ClassProfile() {
  LanguageProfile profile;
  profile.name = "toy";
  profile.extensions = {"toy"};
  profile.kinds = {{"definition.class", {'c', "class", true}},
                   {"definition.field", {'m', "member", true}},
                   {"definition.method", {'f', "function", true}},
                   {"definition.prototype", {'p', "prototype", false}}};
  profile.field_rules = {
      FieldRule{LineRule{}, {}},
      FieldRule{EndLineRule{}, {}},
      FieldRule{SignatureRule{"parameters"}, {"definition.method"}},
      FieldRule{TypeRefRule{"type"}, {"definition.field"}},
      FieldRule{AccessModifierRule{"modifiers",
                                   {{"public", "public"},
                                    {"private", "private"}},
                                   "default"},
                {"definition.method"}}};
  return profile;
}

// class Foo { int bar; }
std::vector<CaptureMatch> FooBarCaptures() {
  return {Definition("definition.class", "Foo", 0, 22, 0, 0,
                     "class Foo { int bar; }"),
          Definition("definition.field", "bar", 12, 20, 0, 0,
                     "class Foo { int bar; }")};
}

TEST(TagNormalizerTest, NestedFieldIsScopedToItsClass) {
  const TagNormalizer normalizer;

  const auto tags =
      normalizer.Normalize(FooBarCaptures(), ClassProfile(), "src/foo.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_EQ("Foo", tags[0].name);
  EXPECT_EQ('c', tags[0].kind.code);
  EXPECT_FALSE(tags[0].scope.has_value());

  EXPECT_EQ("bar", tags[1].name);
  EXPECT_EQ('m', tags[1].kind.code);
  ASSERT_TRUE(tags[1].scope.has_value());
  EXPECT_EQ('c', tags[1].scope->kind.code);
  EXPECT_EQ("class", tags[1].scope->kind.name);
  EXPECT_EQ("Foo", tags[1].scope->name);
  EXPECT_EQ("src/foo.toy", tags[1].file);
}

TEST(TagNormalizerTest, ReferencesAndUnmappedCapturesAreDropped) {
  const TagNormalizer normalizer;
  auto captures = FooBarCaptures();
  captures.push_back(
      Definition("reference.call", "print", 30, 40, 2, 2, "print()"));
  captures.push_back(
      Definition("definition.macro", "MAX", 50, 60, 3, 3, "#define MAX 1"));
  captures.push_back(Definition("name", "stray", 70, 75, 4, 4, "stray"));

  const auto tags = normalizer.Normalize(captures, ClassProfile(), "a.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_EQ("Foo", tags[0].name);
  EXPECT_EQ("bar", tags[1].name);
}

TEST(TagNormalizerTest, ScopeChainsUseProfileSeparator) {
  auto profile = ClassProfile();
  profile.scope_separator = "::";
  const TagNormalizer normalizer;
  const std::vector<CaptureMatch> captures = {
      Definition("definition.class", "Outer", 0, 100, 0, 9, "class Outer {"),
      Definition("definition.class", "Inner", 10, 90, 1, 8, "class Inner {"),
      Definition("definition.method", "run", 20, 40, 2, 3, "void run() {"),
      Definition("definition.method", "stop", 95, 99, 9, 9, "void stop();")};

  const auto tags = normalizer.Normalize(captures, profile, "x.toy");

  ASSERT_EQ(4u, tags.size());
  EXPECT_EQ("Outer", tags[1].scope->name);
  EXPECT_EQ("Outer::Inner", tags[2].scope->name);
  EXPECT_EQ("Outer", tags[3].scope->name);
}

TEST(TagNormalizerTest, SiblingsAfterAClosedScopeAreNotNested) {
  const TagNormalizer normalizer;
  const std::vector<CaptureMatch> captures = {
      Definition("definition.class", "A", 0, 10, 0, 1, "class A {}"),
      Definition("definition.class", "B", 11, 20, 2, 3, "class B {}")};

  const auto tags = normalizer.Normalize(captures, ClassProfile(), "x.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_FALSE(tags[1].scope.has_value());
}

TEST(TagNormalizerTest, DefinitionsSharingOneNodeDoNotNest) {
  const TagNormalizer normalizer;
  const std::vector<CaptureMatch> captures = {
      Definition("definition.field", "a", 0, 10, 0, 0, "int a, b;"),
      Definition("definition.field", "b", 0, 10, 0, 0, "int a, b;")};

  const auto tags = normalizer.Normalize(captures, ClassProfile(), "x.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_FALSE(tags[0].scope.has_value());
  EXPECT_FALSE(tags[1].scope.has_value());
}

TEST(TagNormalizerTest, DuplicateMatchesOfOneNodeKeepTheFirst) {
  const TagNormalizer normalizer;
  const std::vector<CaptureMatch> captures = {
      Definition("definition.class", "K", 0, 50, 0, 4, "class K:"),
      Definition("definition.method", "run", 10, 40, 1, 3, "def run(self):"),
      Definition("definition.field", "run", 10, 40, 1, 3, "def run(self):")};

  const auto tags = normalizer.Normalize(captures, ClassProfile(), "k.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_EQ('f', tags[1].kind.code);
}

TEST(TagNormalizerTest, DisabledKindsStillOpenScopes) {
  NormalizerOptions options;
  options.kind_filters["toy"] =
      KindFilter::Parse("m", ClassProfile().DefaultKindAliases(),
                        ClassProfile().OptionalKindAliases());
  const TagNormalizer normalizer(options);

  const auto tags =
      normalizer.Normalize(FooBarCaptures(), ClassProfile(), "a.toy");

  ASSERT_EQ(1u, tags.size());
  EXPECT_EQ("bar", tags[0].name);
  ASSERT_TRUE(tags[0].scope.has_value());
  EXPECT_EQ("Foo", tags[0].scope->name);
}

TEST(TagNormalizerTest, KindsOffByDefaultAreSkippedUnlessEnabled) {
  const std::vector<CaptureMatch> captures = {Definition(
      "definition.prototype", "decl", 0, 12, 0, 0, "void decl();")};

  const TagNormalizer defaults;
  EXPECT_TRUE(defaults.Normalize(captures, ClassProfile(), "a.toy").empty());

  NormalizerOptions options;
  options.kind_filters["toy"] =
      KindFilter::Parse("+p", ClassProfile().DefaultKindAliases(),
                        ClassProfile().OptionalKindAliases());
  const TagNormalizer enabled(options);
  EXPECT_EQ(1u, enabled.Normalize(captures, ClassProfile(), "a.toy").size());
}

TEST(TagNormalizerTest, EmptyAndControlCharacterNamesAreDropped) {
  const TagNormalizer normalizer;
  const std::vector<CaptureMatch> captures = {
      Definition("definition.class", "", 0, 5, 0, 0, "class"),
      Definition("definition.class", "Bad\nName", 6, 10, 1, 1, "class Bad")};

  EXPECT_TRUE(normalizer.Normalize(captures, ClassProfile(), "a.toy").empty());
}

TEST(TagNormalizerTest, PatternAddressUsesIdentifierLine) {
  const TagNormalizer normalizer;
  auto captures = FooBarCaptures();
  captures[1].name_start = {3, 6};

  const auto tags = normalizer.Normalize(captures, ClassProfile(), "a.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_EQ(TagAddress::Kind::kPattern, tags[1].address.kind);
  EXPECT_EQ("class Foo { int bar; }", tags[1].address.pattern_source);
  EXPECT_EQ(4u, tags[1].address.line);
}

TEST(TagNormalizerTest, LineNumberAddressesWhenRequested) {
  NormalizerOptions options;
  options.line_number_addresses = true;
  const TagNormalizer normalizer(options);

  const auto tags =
      normalizer.Normalize(FooBarCaptures(), ClassProfile(), "a.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_EQ(TagAddress::Kind::kLineNumber, tags[0].address.kind);
  EXPECT_EQ(1u, tags[0].address.line);

  auto profile = ClassProfile();
  profile.address_mode = AddressMode::kLineNumber;
  const TagNormalizer by_profile;
  EXPECT_EQ(TagAddress::Kind::kLineNumber,
            by_profile.Normalize(FooBarCaptures(), profile, "a.toy")[0]
                .address.kind);
}

TEST(TagNormalizerTest, ExtractsEnabledExtensionFields) {
  NormalizerOptions options;
  options.fields = FieldSelection::Parse("+nkSeat");
  const TagNormalizer normalizer(options);

  auto method =
      Definition("definition.method", "run", 10, 80, 1, 4, "  public void run(int a,");
  method.siblings = {{"", "modifiers", "public static", false},
                     {"parameters", "formal_parameters", "(int a,\n    int b)",
                      false}};
  auto field = Definition("definition.field", "count", 90, 100, 5, 5,
                          "  int count;");
  field.siblings = {{"type", "integral_type", "int", false}};

  const auto tags =
      normalizer.Normalize({method, field}, ClassProfile(), "a.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_THAT(tags[0].extension_fields,
              ElementsAre(Pair("kind", "function"), Pair("line", "2"),
                          Pair("end", "5"), Pair("signature", "(int a, int b)"),
                          Pair("access", "public")));
  EXPECT_THAT(tags[1].extension_fields,
              ElementsAre(Pair("kind", "member"), Pair("line", "6"),
                          Pair("typeref", "typename:int")));
}

TEST(TagNormalizerTest, FieldsAreFilteredBySelection) {
  const TagNormalizer normalizer;
  auto field = Definition("definition.field", "count", 0, 10, 0, 2, "int count;");
  field.siblings = {{"type", "integral_type", "int", false}};

  const auto tags = normalizer.Normalize({field}, ClassProfile(), "a.toy");

  ASSERT_EQ(1u, tags.size());
  EXPECT_THAT(tags[0].extension_fields,
              ElementsAre(Pair("typeref", "typename:int")));
}

TEST(TagNormalizerTest, MissingOrTruncatedSiblingsOmitTheField) {
  NormalizerOptions options;
  options.fields = FieldSelection::Parse("+S");
  const TagNormalizer normalizer(options);
  auto bare = Definition("definition.method", "run", 0, 10, 0, 0, "run()");
  auto huge = Definition("definition.method", "big", 20, 30, 1, 1, "big(...)");
  huge.siblings = {{"parameters", "formal_parameters", "", true}};

  const auto tags = normalizer.Normalize({bare, huge}, ClassProfile(), "a.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_THAT(tags[0].extension_fields,
              Not(Contains(Pair("signature", ::testing::_))));
  EXPECT_THAT(tags[1].extension_fields,
              Not(Contains(Pair("signature", ::testing::_))));
}

TEST(TagNormalizerTest, AccessFallsBackWhenNoModifierMatches) {
  NormalizerOptions options;
  options.fields = FieldSelection::Parse("+a");
  const TagNormalizer normalizer(options);
  const auto method =
      Definition("definition.method", "run", 0, 10, 0, 0, "void run()");

  const auto tags = normalizer.Normalize({method}, ClassProfile(), "a.toy");

  ASSERT_EQ(1u, tags.size());
  EXPECT_THAT(tags[0].extension_fields, Contains(Pair("access", "default")));
}

TEST(TagNormalizerTest, AccessIsFoundInAnyOfSeveralModifierNodes) {
  NormalizerOptions options;
  options.fields = FieldSelection::Parse("+a");
  const TagNormalizer normalizer(options);
  auto method = Definition("definition.method", "Run", 0, 30, 0, 0,
                           "static private void Run()");
  method.siblings = {{"", "modifiers", "static", false},
                     {"", "modifiers", "private", false}};

  const auto tags = normalizer.Normalize({method}, ClassProfile(), "a.toy");

  ASSERT_EQ(1u, tags.size());
  EXPECT_THAT(tags[0].extension_fields, Contains(Pair("access", "private")));
}

TEST(TagNormalizerTest, ExportedNamesArePublic) {
  auto profile = ClassProfile();
  profile.field_rules = {FieldRule{ExportedNameAccessRule{}, {}}};
  NormalizerOptions options;
  options.fields = FieldSelection::Parse("+a");
  const TagNormalizer normalizer(options);
  const std::vector<CaptureMatch> captures = {
      Definition("definition.method", "Serve", 0, 10, 0, 0, "func Serve()"),
      Definition("definition.method", "serve", 11, 20, 1, 1, "func serve()")};

  const auto tags = normalizer.Normalize(captures, profile, "a.toy");

  ASSERT_EQ(2u, tags.size());
  EXPECT_THAT(tags[0].extension_fields, Contains(Pair("access", "public")));
  EXPECT_THAT(tags[1].extension_fields, Contains(Pair("access", "private")));
}

TEST(TagNormalizerTest, QualifiedExtraAddsScopedNames) {
  NormalizerOptions options;
  options.extras.qualified = true;
  const TagNormalizer normalizer(options);

  const auto tags =
      normalizer.Normalize(FooBarCaptures(), ClassProfile(), "a.toy");

  ASSERT_EQ(3u, tags.size());
  EXPECT_EQ("Foo", tags[0].name);
  EXPECT_EQ("bar", tags[1].name);
  EXPECT_EQ("Foo.bar", tags[2].name);
  EXPECT_EQ("Foo", tags[2].scope->name);
}

TEST(TagNormalizerTest, FileScopeExtraOffDropsStaticDefinitions) {
  NormalizerOptions options;
  options.extras.file_scope = false;
  const TagNormalizer normalizer(options);
  auto helper =
      Definition("definition.method", "helper", 0, 20, 0, 1, "static int helper()");
  helper.siblings = {{"", "storage_class_specifier", "static", false}};
  const auto exported =
      Definition("definition.method", "api", 30, 50, 2, 3, "int api()");

  const auto tags =
      normalizer.Normalize({helper, exported}, ClassProfile(), "a.toy");

  ASSERT_EQ(1u, tags.size());
  EXPECT_EQ("api", tags[0].name);
}

} // namespace
} // namespace treetags

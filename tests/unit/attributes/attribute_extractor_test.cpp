#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "folio_core/attributes/attribute_extractor.hpp"
#include "folio_core/attributes/json_attribute_parser.hpp"
#include "folio_core/attributes/yaml_attribute_parser.hpp"
#include "folio_core/errors.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

using folio_core::AttributeExtractor;
using folio_core::ItemRole;
using folio_core::WalkedFile;
using ::testing::_;
using ::testing::StrictMock;

namespace folio_tests {

class AttributeExtractorTest : public ::testing::Test {
 protected:
  WalkedFile content_file(const std::string& id) {
    return {id, std::filesystem::path("/site/content") / id};
  }

  InMemoryFileSystem fs_;
  folio_core::YamlAttributeParser yaml_;
};

TEST_F(AttributeExtractorTest, FrontmatterIsParsedAndStripped) {
  AttributeExtractor extractor(fs_, yaml_, "/site/content");
  const std::string raw = "---\ntitle: Hi\n---\nBody\n";

  auto result = extractor.extract(content_file("page.md"), ItemRole::Content, false, raw);

  EXPECT_EQ(result.attributes["title"], "Hi");
  EXPECT_EQ(result.body, "Body\n");
  EXPECT_TRUE(result.frontmatter_consumed);
}

TEST_F(AttributeExtractorTest, NoFrontmatterLeavesContentUnchanged) {
  AttributeExtractor extractor(fs_, yaml_, "/site/content");

  auto result = extractor.extract(content_file("page.md"), ItemRole::Content, false, "Just text");

  EXPECT_TRUE(result.attributes.is_object());
  EXPECT_TRUE(result.attributes.empty());
  EXPECT_EQ(result.body, "Just text");
  EXPECT_FALSE(result.frontmatter_consumed);
}

TEST_F(AttributeExtractorTest, SidecarWinsAndContentStaysVerbatim) {
  fs_.add_file("/site/content/page.md.meta", "title: From sidecar\n");
  AttributeExtractor extractor(fs_, yaml_, "/site/content");
  const std::string raw = "---\ntitle: From frontmatter\nlayout: x\n---\nBody\n";

  auto result = extractor.extract(content_file("page.md"), ItemRole::Content, false, raw);

  EXPECT_EQ(result.attributes, folio_core::AttributeMap({{"title", "From sidecar"}}));
  EXPECT_EQ(result.body, raw);
  EXPECT_FALSE(result.frontmatter_consumed);
}

TEST_F(AttributeExtractorTest, SidecarPathFollowsNestedIds) {
  AttributeExtractor extractor(fs_, yaml_, "/site/content");

  EXPECT_EQ(extractor.sidecar_path("posts/a.md").generic_string(), "/site/content/posts/a.md.meta");
}

TEST_F(AttributeExtractorTest, BinaryContentMayUseSidecar) {
  fs_.add_file("/site/content/img/logo.png.meta", "alt: Logo\n");
  AttributeExtractor extractor(fs_, yaml_, "/site/content");

  auto result = extractor.extract(content_file("img/logo.png"), ItemRole::Content, true, "");

  EXPECT_EQ(result.attributes["alt"], "Logo");
}

TEST_F(AttributeExtractorTest, BinaryWithoutSidecarIsNotParsed) {
  StrictMock<MockAttributeParser> parser;
  AttributeExtractor extractor(fs_, parser, "/site/content");

  auto result = extractor.extract(content_file("img/logo.png"), ItemRole::Content, true, "");

  EXPECT_TRUE(result.attributes.empty());
}

TEST_F(AttributeExtractorTest, IncludesAreNeverParsed) {
  StrictMock<MockAttributeParser> parser;
  fs_.add_file("/site/content/nav.html.meta", "title: no\n");
  AttributeExtractor extractor(fs_, parser, "/site/content");
  const std::string raw = "---\ntitle: Nav\n---\n<nav/>";

  auto result = extractor.extract({"nav.html", "/site/includes/nav.html"}, ItemRole::Include, false, raw);

  EXPECT_TRUE(result.attributes.empty());
  EXPECT_EQ(result.body, raw);
}

TEST_F(AttributeExtractorTest, LayoutsUseFrontmatterButNoSidecar) {
  fs_.add_file("/site/content/default.html.meta", "title: Wrong\n");
  AttributeExtractor extractor(fs_, yaml_, "/site/content");

  auto result = extractor.extract({"default.html", "/site/layouts/default.html"}, ItemRole::Layout,
                                  false, "---\nlayout: base\n---\n<html/>");

  EXPECT_EQ(result.attributes, folio_core::AttributeMap({{"layout", "base"}}));
  EXPECT_EQ(result.body, "<html/>");
}

TEST_F(AttributeExtractorTest, JsonSyntaxAppliesToFrontmatter) {
  folio_core::JsonAttributeParser json;
  AttributeExtractor extractor(fs_, json, "/site/content");

  auto result = extractor.extract(content_file("page.md"), ItemRole::Content, false,
                                  "---\n{\"title\": \"Json\"}\n---\nBody");

  EXPECT_EQ(result.attributes["title"], "Json");
  EXPECT_EQ(result.body, "Body");
}

TEST_F(AttributeExtractorTest, MalformedFrontmatterPropagatesWithFile) {
  AttributeExtractor extractor(fs_, yaml_, "/site/content");

  try {
    (void)extractor.extract(content_file("bad.md"), ItemRole::Content, false, "---\na: [b\n---\n");
    FAIL() << "Expected AttributeParseError";
  } catch (const folio_core::AttributeParseError& e) {
    EXPECT_EQ(e.file(), "/site/content/bad.md");
  }
}

TEST_F(AttributeExtractorTest, MalformedSidecarNamesSidecar) {
  fs_.add_file("/site/content/page.md.meta", "a: [b\n");
  AttributeExtractor extractor(fs_, yaml_, "/site/content");

  try {
    (void)extractor.extract(content_file("page.md"), ItemRole::Content, false, "Body");
    FAIL() << "Expected AttributeParseError";
  } catch (const folio_core::AttributeParseError& e) {
    EXPECT_EQ(e.file(), "/site/content/page.md.meta");
  }
}

// Error file names use forward slashes for nested ids, from either source.
TEST_F(AttributeExtractorTest, ParseErrorsNameNestedFilesWithForwardSlashes) {
  AttributeExtractor extractor(fs_, yaml_, "/site/content");

  try {
    (void)extractor.extract(content_file("posts/tech/bad.md"), ItemRole::Content, false,
                            "---\na: [b\n---\n");
    FAIL() << "Expected AttributeParseError";
  } catch (const folio_core::AttributeParseError& e) {
    EXPECT_EQ(e.file(), "/site/content/posts/tech/bad.md");
  }

  fs_.add_file("/site/content/posts/tech/page.md.meta", "a: [b\n");
  try {
    (void)extractor.extract(content_file("posts/tech/page.md"), ItemRole::Content, false, "Body");
    FAIL() << "Expected AttributeParseError";
  } catch (const folio_core::AttributeParseError& e) {
    EXPECT_EQ(e.file(), "/site/content/posts/tech/page.md.meta");
  }
}

}  // namespace folio_tests

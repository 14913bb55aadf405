#include <gtest/gtest.h>

#include "folio_core/fs/file_info.hpp"

using folio_core::FileInfo;

namespace {

const std::vector<std::string> kTextExtensions = {"html", "md", "twig", "html.twig"};

}  // namespace

TEST(FileInfoTest, SimpleTextExtension) {
  FileInfo info("posts/2020-05-01-hello-world.md", kTextExtensions);

  EXPECT_EQ(info.filename(), "2020-05-01-hello-world");
  EXPECT_EQ(info.extension(), "md");
  EXPECT_FALSE(info.is_binary());
}

TEST(FileInfoTest, LongestCompoundExtensionWins) {
  FileInfo info("layouts/default.html.twig", kTextExtensions);

  EXPECT_EQ(info.filename(), "default");
  EXPECT_EQ(info.extension(), "html.twig");
  EXPECT_TRUE(info.has_predefined_extension());
}

TEST(FileInfoTest, ExtensionComparisonIgnoresCase) {
  FileInfo info("README.MD", kTextExtensions);

  EXPECT_FALSE(info.is_binary());
  EXPECT_EQ(info.extension(), "MD");
  EXPECT_EQ(info.filename(), "README");
}

TEST(FileInfoTest, UnknownExtensionIsBinary) {
  FileInfo info("assets/logo.png", kTextExtensions);

  EXPECT_TRUE(info.is_binary());
  EXPECT_EQ(info.filename(), "logo");
  EXPECT_EQ(info.extension(), "png");
}

TEST(FileInfoTest, DotFileHasNoExtension) {
  FileInfo info(".htaccess", kTextExtensions);

  EXPECT_TRUE(info.is_binary());
  EXPECT_EQ(info.filename(), ".htaccess");
  EXPECT_EQ(info.extension(), "");
}

TEST(FileInfoTest, NoExtension) {
  FileInfo info("LICENSE", kTextExtensions);

  EXPECT_TRUE(info.is_binary());
  EXPECT_EQ(info.filename(), "LICENSE");
  EXPECT_EQ(info.extension(), "");
}

TEST(FileInfoTest, ExtensionAloneDoesNotCount) {
  // ".md" is a hidden file, not an empty name with an md extension
  FileInfo info(".md", kTextExtensions);

  EXPECT_TRUE(info.is_binary());
  EXPECT_EQ(info.filename(), ".md");
}

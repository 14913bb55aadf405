#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "folio_core/derivation/category_deriver.hpp"

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace folio_core {

TEST(CategoryDeriverTest, DirectlyUnderPostsHasNoCategories) {
  auto categories = derive_categories("posts/2020-05-01-hello-world.md");

  ASSERT_TRUE(categories.has_value());
  EXPECT_THAT(*categories, IsEmpty());
}

TEST(CategoryDeriverTest, SubdirectoriesBecomeCategories) {
  EXPECT_THAT(*derive_categories("posts/tech/2020-01-01-post.md"), ElementsAre("tech"));
  EXPECT_THAT(*derive_categories("posts/tech/cpp/a.md"), ElementsAre("tech", "cpp"));
}

TEST(CategoryDeriverTest, OutsidePostsGivesNothing) {
  EXPECT_FALSE(derive_categories("index.html").has_value());
  EXPECT_FALSE(derive_categories("pages/posts/a.md").has_value());
  EXPECT_FALSE(derive_categories("postscript/a.md").has_value());
  EXPECT_FALSE(derive_categories("posts").has_value());
}

TEST(CategoryDeriverTest, ApplyStoresList) {
  AttributeMap attrs = make_attribute_map();

  apply_categories("posts/tech/a.md", attrs);

  EXPECT_EQ(attrs["categories"], AttributeValue::array({"tech"}));
}

TEST(CategoryDeriverTest, ApplyStoresEmptyListDirectlyUnderPosts) {
  AttributeMap attrs = make_attribute_map();

  apply_categories("posts/a.md", attrs);

  ASSERT_TRUE(attrs.contains("categories"));
  EXPECT_TRUE(attrs["categories"].is_array());
  EXPECT_TRUE(attrs["categories"].empty());
}

TEST(CategoryDeriverTest, ExplicitCategoriesAreKept) {
  AttributeMap attrs = {{"categories", AttributeValue::array({"news"})}};

  apply_categories("posts/tech/a.md", attrs);

  EXPECT_EQ(attrs["categories"], AttributeValue::array({"news"}));
}

TEST(CategoryDeriverTest, ExplicitNullCategoriesAreKept) {
  AttributeMap attrs = {{"categories", nullptr}};

  apply_categories("posts/tech/a.md", attrs);

  EXPECT_TRUE(attrs["categories"].is_null());
}

TEST(CategoryDeriverTest, NonPostsLeavesAttributesAlone) {
  AttributeMap attrs = make_attribute_map();

  apply_categories("about/index.html", attrs);

  EXPECT_FALSE(attrs.contains("categories"));
}

}  // namespace folio_core

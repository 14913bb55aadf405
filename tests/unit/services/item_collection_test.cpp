#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "folio_core/services/item_collection.hpp"

namespace folio_core {

TEST(ItemCollectionTest, StoresItemsOrderedById) {
  ItemCollection collection;
  collection.put(Item("b.md", ItemRole::Content, false, "b"));
  collection.put(Item("a.md", ItemRole::Content, false, "a"));

  EXPECT_EQ(collection.size(), 2u);
  EXPECT_THAT(collection.ids(), ::testing::ElementsAre("a.md", "b.md"));
  EXPECT_TRUE(collection.contains("a.md"));
  EXPECT_EQ(collection.at("b.md").content(), "b");
}

TEST(ItemCollectionTest, LastWriteWins) {
  ItemCollection collection;

  EXPECT_FALSE(collection.put(Item("index.html", ItemRole::Content, false, "first")));
  EXPECT_TRUE(collection.put(Item("index.html", ItemRole::Content, false, "second")));

  EXPECT_EQ(collection.size(), 1u);
  EXPECT_EQ(collection.at("index.html").content(), "second");
  EXPECT_EQ(collection.replaced_count(), 1u);
}

TEST(ItemCollectionTest, LookupOfMissingId) {
  ItemCollection collection;

  EXPECT_THROW((void)collection.at("nope"), std::out_of_range);
}

TEST(ItemCollectionTest, ClearResetsEverything) {
  ItemCollection collection;
  collection.put(Item("a", ItemRole::Layout, false, ""));
  collection.put(Item("a", ItemRole::Layout, false, ""));

  collection.clear();

  EXPECT_TRUE(collection.empty());
  EXPECT_EQ(collection.replaced_count(), 0u);
}

}  // namespace folio_core

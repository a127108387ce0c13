// File: tests/core/item_dictionary_test.cpp
#include "core/item_dictionary.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>

namespace arminer {
namespace {

TEST(ItemDictionaryTest, InternAssignsDenseIds) {
    ItemDictionary dict;
    ItemID milk = dict.Intern("milk");
    ItemID bread = dict.Intern("bread");

    EXPECT_EQ(0u, milk.value());
    EXPECT_EQ(1u, bread.value());
    EXPECT_EQ(2u, dict.Size());
}

TEST(ItemDictionaryTest, InternIsIdempotent) {
    ItemDictionary dict;
    ItemID first = dict.Intern("milk");
    ItemID second = dict.Intern("milk");

    EXPECT_EQ(first, second);
    EXPECT_EQ(1u, dict.Size());
}

TEST(ItemDictionaryTest, InternRejectsEmptyLabel) {
    ItemDictionary dict;
    EXPECT_THROW(dict.Intern(""), InvalidParameterError);
}

TEST(ItemDictionaryTest, FromLabelsKeepsOrder) {
    auto dict = ItemDictionary::FromLabels({"bread", "butter", "milk"});

    EXPECT_EQ("bread", dict.Label(ItemID(0)));
    EXPECT_EQ("milk", dict.Label(ItemID(2)));
    ASSERT_TRUE(dict.Find("butter").has_value());
    EXPECT_EQ(1u, dict.Find("butter")->value());
}

TEST(ItemDictionaryTest, FromLabelsRejectsDuplicates) {
    EXPECT_THROW(ItemDictionary::FromLabels({"a", "b", "a"}), InvalidParameterError);
}

TEST(ItemDictionaryTest, FindUnknownReturnsNullopt) {
    auto dict = ItemDictionary::FromLabels({"a"});
    EXPECT_FALSE(dict.Find("b").has_value());
}

TEST(ItemDictionaryTest, LabelOfUnknownIdThrows) {
    auto dict = ItemDictionary::FromLabels({"a"});
    EXPECT_THROW(dict.Label(ItemID(5)), std::out_of_range);
    EXPECT_THROW(dict.Label(ItemID()), std::out_of_range);
}

TEST(ItemDictionaryTest, ResolveDropsUnknownLabels) {
    auto dict = ItemDictionary::FromLabels({"bread", "milk"});
    ItemSet resolved = dict.Resolve({"milk", "caviar", "bread"});

    EXPECT_EQ(2u, resolved.size());
    EXPECT_EQ(1u, resolved.count(ItemID(0)));
    EXPECT_EQ(1u, resolved.count(ItemID(1)));
}

TEST(ItemDictionaryTest, FormatUsesLabels) {
    auto dict = ItemDictionary::FromLabels({"bread", "milk"});
    EXPECT_EQ("{bread,milk}", dict.Format({ItemID(0), ItemID(1)}));
    EXPECT_EQ("{}", dict.Format({}));
}

} // namespace
} // namespace arminer

// tests/test_secondary_index.cpp
#include "repository/SecondaryIndex.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using stridedb::record::FieldValue;
using stridedb::repository::SecondaryIndex;

TEST(SecondaryIndex, GroupsOffsetsByValue) {
    SecondaryIndex index{1, false};
    index.update(0, int32_t{5});
    index.update(33, int32_t{5});
    index.update(66, int32_t{6});

    EXPECT_EQ(index.offsets_with_value(int32_t{5}), (std::vector<size_t>{0, 33}));
    EXPECT_EQ(index.offsets_with_value(int32_t{6}), (std::vector<size_t>{66}));
    EXPECT_TRUE(index.offsets_with_value(int32_t{7}).empty());
    EXPECT_EQ(index.bucket_count(), 2u);
    EXPECT_EQ(index.entry_count(), 3u);
}

TEST(SecondaryIndex, OverwriteMovesOffsetAndDropsEmptyBucket) {
    SecondaryIndex index{1, false};
    index.update(0, std::string{"a"});
    index.update(0, std::string{"b"});

    EXPECT_TRUE(index.offsets_with_value(std::string{"a"}).empty());
    EXPECT_EQ(index.offsets_with_value(std::string{"b"}), (std::vector<size_t>{0}));
    EXPECT_EQ(index.bucket_count(), 1u);
    EXPECT_EQ(index.entry_count(), 1u);
    EXPECT_EQ(index.value_at(0), FieldValue{std::string{"b"}});
    EXPECT_FALSE(index.value_at(1).has_value());
}

TEST(SecondaryIndex, RewritingSameValueKeepsSingleEntry) {
    SecondaryIndex index{1, false};
    index.update(10, int64_t{3});
    index.update(10, int64_t{3});

    EXPECT_EQ(index.offsets_with_value(int64_t{3}), (std::vector<size_t>{10}));
}

TEST(SecondaryIndex, UniqueValuesStayClaimedAfterReplacement) {
    SecondaryIndex index{2, true};
    EXPECT_TRUE(index.is_unique(int32_t{10}));

    index.update(0, int32_t{10});
    EXPECT_FALSE(index.is_unique(int32_t{10}));

    index.update(0, int32_t{11});
    EXPECT_FALSE(index.is_unique(int32_t{10}));
    EXPECT_FALSE(index.is_unique(int32_t{11}));
    EXPECT_EQ(index.unique_value_count(), 2u);
}

TEST(SecondaryIndex, NonUniqueIndexNeverClaims) {
    SecondaryIndex index{2, false};
    index.update(0, int32_t{10});
    EXPECT_TRUE(index.is_unique(int32_t{10}));
    EXPECT_EQ(index.unique_value_count(), 0u);
}

TEST(SecondaryIndex, CopyIsIndependentSnapshot) {
    SecondaryIndex index{0, true};
    index.update(0, int16_t{1});

    const SecondaryIndex snapshot = index;
    index.update(0, int16_t{2});
    index.update(5, int16_t{3});

    EXPECT_NE(index, snapshot);
    EXPECT_EQ(snapshot.offsets_with_value(int16_t{1}), (std::vector<size_t>{0}));
    EXPECT_TRUE(snapshot.is_unique(int16_t{2}));

    index = snapshot;
    EXPECT_EQ(index, snapshot);
}

#include <gtest/gtest.h>
#include "TagMap.hxx"
#include <stdexcept>

TEST(TagMap, IndexToTagIsOneBased) {
    EXPECT_EQ(TagMap::toEngineTag(0, 4), 1);
    EXPECT_EQ(TagMap::toEngineTag(3, 4), 4);
}

TEST(TagMap, TagToIndexInverts) {
    for (std::size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(TagMap::toInputIndex(TagMap::toEngineTag(i, 10)), i);
    }
}

TEST(TagMap, RejectsOutOfRange) {
    EXPECT_THROW(TagMap::toEngineTag(4, 4), std::out_of_range);
    EXPECT_THROW(TagMap::toEngineTag(0, 0), std::out_of_range);
    EXPECT_THROW(TagMap::toInputIndex(0), std::out_of_range);
    EXPECT_THROW(TagMap::toInputIndex(-3), std::out_of_range);
}

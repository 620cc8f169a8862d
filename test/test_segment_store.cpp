#include "SegmentStore.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(SegmentStore, FirstCopyWins) {
    SegmentStore store;
    EXPECT_TRUE(store.put(3, bytes_of("abc")));
    EXPECT_FALSE(store.put(3, bytes_of("xyz")));

    ASSERT_NE(store.get(3), nullptr);
    EXPECT_EQ(*store.get(3), bytes_of("abc"));
    EXPECT_EQ(store.count(), 1u);
    EXPECT_EQ(store.bytes(), 3u);
}

TEST(SegmentStore, MissingListsGapsAscending) {
    SegmentStore store;
    store.put(0, bytes_of("a"));
    store.put(2, bytes_of("c"));
    store.put(5, bytes_of("f"));

    EXPECT_EQ(store.missing(6), (std::vector<uint32_t>{1, 3, 4}));
    EXPECT_EQ(store.missing(8), (std::vector<uint32_t>{1, 3, 4, 6, 7}));
    EXPECT_TRUE(SegmentStore().missing(0).empty());
}

TEST(SegmentStore, WritesInSequenceOrder) {
    SegmentStore store;
    store.put(2, bytes_of("cc"));
    store.put(0, bytes_of("aa"));
    store.put(1, bytes_of("bb"));

    std::ostringstream out;
    EXPECT_EQ(store.write_to(out), 6);
    EXPECT_EQ(out.str(), "aabbcc");
}

TEST(SegmentStore, PartialWriteSkipsGaps) {
    SegmentStore store;
    store.put(0, bytes_of("head"));
    store.put(2, bytes_of("tail"));

    std::ostringstream out;
    EXPECT_EQ(store.write_to(out), 8);
    EXPECT_EQ(out.str(), "headtail");
}

TEST(SegmentStore, ClearResets) {
    SegmentStore store;
    store.put(0, bytes_of("x"));
    store.clear();
    EXPECT_EQ(store.count(), 0u);
    EXPECT_EQ(store.bytes(), 0u);
    EXPECT_FALSE(store.has(0));
}

#include "mediaprobe/memory_reader.hpp"
#include "mediaprobe/errors.hpp"

#include <gtest/gtest.h>

namespace mediaprobe {
namespace {

TEST(MemoryReaderTest, ServesRangesAndShortensAtEnd) {
    MemoryReader reader;
    reader.Put("x", MakePatternBytes(10));

    EXPECT_EQ(10, reader.ProbeLength("x"));
    EXPECT_EQ(4u, reader.FetchRange("x", 2, 4).size());
    EXPECT_EQ(3u, reader.FetchRange("x", 7, 100).size());
    EXPECT_TRUE(reader.FetchRange("x", 10, 4).empty());
    EXPECT_EQ(3u, reader.FetchCount());
    EXPECT_EQ(7u, reader.BytesServed());
}

TEST(MemoryReaderTest, MissingObjectIsNotFound) {
    MemoryReader reader;
    try {
        reader.ProbeLength("nope");
        FAIL() << "expected RemoteReadError";
    } catch (const RemoteReadError& e) {
        EXPECT_EQ(RemoteFailure::kNotFound, e.Reason());
    }

    reader.Put("gone", MakePatternBytes(4));
    EXPECT_TRUE(reader.Remove("gone"));
    EXPECT_THROW(reader.FetchRange("gone", 0, 1), RemoteReadError);
}

TEST(MemoryReaderTest, PatternDependsOnSeed) {
    EXPECT_EQ(MakePatternBytes(64, 3), MakePatternBytes(64, 3));
    EXPECT_NE(MakePatternBytes(64, 3), MakePatternBytes(64, 4));
}

} // namespace
} // namespace mediaprobe

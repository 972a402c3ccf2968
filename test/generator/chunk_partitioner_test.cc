#include <gtest/gtest.h>
#include "../../src/generator/chunk_partitioner.h"
#include "../../src/common/errors.h"

using namespace BulkGen;

TEST(ChunkPartitionerTest, RejectsIndivisibleRecordCount) {
    EXPECT_THROW(PartitionRecords(10, 3), ConfigError);
}

TEST(ChunkPartitionerTest, RejectsZeroArguments) {
    EXPECT_THROW(PartitionRecords(0, 1), ConfigError);
    EXPECT_THROW(PartitionRecords(10, 0), ConfigError);
}

TEST(ChunkPartitionerTest, TwoChunksScenario) {
    auto chunks = PartitionRecords(2000000, 1000000);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].index, 0u);
    EXPECT_EQ(chunks[0].start, 0u);
    EXPECT_EQ(chunks[0].length, 1000000u);
    EXPECT_EQ(chunks[1].index, 1u);
    EXPECT_EQ(chunks[1].start, 1000000u);
    EXPECT_EQ(chunks[1].length, 1000000u);
}

TEST(ChunkPartitionerTest, ChunksTileTheRangeExactly) {
    const std::pair<size_t, size_t> cases[] = {
        {1, 1}, {7, 7}, {7, 1}, {96, 8}, {1000, 10}, {4096, 256}, {300000, 1000},
    };
    for (const auto& [n, c] : cases) {
        auto chunks = PartitionRecords(n, c);
        ASSERT_EQ(chunks.size(), n / c) << "N=" << n << " C=" << c;

        // Contiguous and in index order: each chunk starts where the previous ended
        size_t next = 0;
        for (size_t i = 0; i < chunks.size(); ++i) {
            EXPECT_EQ(chunks[i].index, i);
            EXPECT_EQ(chunks[i].start, next);
            EXPECT_EQ(chunks[i].length, c);
            next = chunks[i].start + chunks[i].length;
        }
        EXPECT_EQ(next, n) << "N=" << n << " C=" << c;
    }
}

TEST(ChunkPartitionerTest, CounterSpacing) {
    EXPECT_EQ(CounterSpacingBits(1), 64u);
    EXPECT_EQ(CounterSpacingBits(2), 56u);
    EXPECT_EQ(CounterSpacingBits(256), 56u);
    EXPECT_EQ(CounterSpacingBits(257), 48u);
    EXPECT_EQ(CounterSpacingBits(65536), 48u);
    EXPECT_EQ(CounterSpacingBits(65537), 40u);
}

TEST(ChunkPartitionerTest, RejectsChunksOverlappingInCounterSpace) {
    // 2^32 + 1 chunks need five index bytes, leaving 2^24 blocks per chunk
    const size_t num_chunks = (size_t{1} << 32) + 1;
    const size_t chunk_size = (size_t{1} << 24) + 1;
    EXPECT_THROW(PartitionRecords(num_chunks * chunk_size, chunk_size), ConfigError);
}

TEST(ChunkPartitionerTest, AcceptsChunkFillingItsWholeCounterRange) {
    // 257 chunks start on multiples of 2^48; a 2^48-block chunk ends exactly at the next start
    const size_t chunk_size = size_t{1} << 48;
    auto chunks = PartitionRecords(257 * chunk_size, chunk_size);
    EXPECT_EQ(chunks.size(), 257u);
    EXPECT_THROW(PartitionRecords(257 * (chunk_size + 1), chunk_size + 1), ConfigError);
}

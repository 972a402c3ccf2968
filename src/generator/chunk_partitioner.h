#pragma once

#include <cstddef>
#include <vector>

namespace BulkGen {

/**
 * One unit of parallel work: records [start, start + length) of the output buffer.
 */
struct ChunkDescriptor {
    size_t index;
    size_t start;
    size_t length;
};

/**
 * Splits [0, num_records) into num_records / chunk_size equal, contiguous,
 * index-ordered chunks.
 *
 * Only computes descriptors; never touches the output buffer, so a rejected
 * configuration is reported before any storage is reserved.
 *
 * @throws ConfigError if either argument is zero, if num_records is not a
 *         multiple of chunk_size, or if chunks this large would run into each
 *         other's counter range under the per-chunk IV scheme
 */
std::vector<ChunkDescriptor> PartitionRecords(size_t num_records, size_t chunk_size);

/**
 * log2 of the minimum counter distance between the start values of any two of
 * num_chunks chunks. Chunk i starts at the big-endian reading of its IV, which
 * places the little-endian index bytes at the top of the low 64 bits: indices
 * that fit in b bytes therefore start on multiples of 2^(64 - 8b).
 * A chunk of at most 2^CounterSpacingBits(n) blocks cannot reach its neighbour.
 */
unsigned CounterSpacingBits(size_t num_chunks);

} // namespace BulkGen

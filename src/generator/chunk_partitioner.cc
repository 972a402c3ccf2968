#include "chunk_partitioner.h"
#include "common/errors.h"

#include <cstdint>
#include <string>
#include <glog/logging.h>

namespace BulkGen {

unsigned CounterSpacingBits(size_t num_chunks) {
    uint64_t max_index = num_chunks > 0 ? static_cast<uint64_t>(num_chunks - 1) : 0;
    unsigned index_bytes = 0;
    while (max_index != 0) {
        ++index_bytes;
        max_index >>= 8;
    }
    return 64 - 8 * index_bytes;
}

std::vector<ChunkDescriptor> PartitionRecords(size_t num_records, size_t chunk_size) {
    if (num_records == 0) {
        throw ConfigError("record count must be at least 1");
    }
    if (chunk_size == 0) {
        throw ConfigError("chunk size must be at least 1");
    }
    if (num_records % chunk_size != 0) {
        throw ConfigError("record count (" + std::to_string(num_records) +
                          ") must be divisible by chunk size (" + std::to_string(chunk_size) + ")");
    }

    size_t num_chunks = num_records / chunk_size;
    unsigned spacing_bits = CounterSpacingBits(num_chunks);
    // One record is one counter block
    if (spacing_bits < 64 && static_cast<uint64_t>(chunk_size) > (uint64_t{1} << spacing_bits)) {
        throw ConfigError("chunk size " + std::to_string(chunk_size) + " exceeds the counter range of 2^" +
                          std::to_string(spacing_bits) + " blocks available to each of " +
                          std::to_string(num_chunks) + " chunks");
    }

    std::vector<ChunkDescriptor> chunks;
    chunks.reserve(num_chunks);
    for (size_t i = 0; i < num_chunks; ++i) {
        chunks.push_back(ChunkDescriptor{i, i * chunk_size, chunk_size});
    }

    VLOG(1) << "Partitioned " << num_records << " records into " << num_chunks
            << " chunks of " << chunk_size;
    return chunks;
}

} // namespace BulkGen

#pragma once

#include <cstddef>
#include <cstdint>
#include "common/config.h"

namespace BulkGen {

/**
 * Mutable view of a contiguous byte range inside a RecordBuffer.
 * Does not own the memory. Each chunk task gets exactly one view and no two
 * views handed out for a run overlap.
 */
class ChunkView {
public:
    ChunkView() : data_(nullptr), size_(0) {}
    ChunkView(uint8_t* data, size_t size) : data_(data), size_(size) {}

    uint8_t* Data() { return data_; }
    const uint8_t* Data() const { return data_; }
    size_t Size() const { return size_; }
    size_t NumRecords() const { return size_ / RECORD_SIZE; }

private:
    uint8_t* data_;
    size_t size_;
};

struct AllocationOptions {
    bool use_hugepages = true;
    bool populate = false;
};

/**
 * Exclusively owned, contiguous storage for a fixed number of 16-byte records.
 * Backed by an anonymous mapping that is never read or written at allocation
 * time; callers must overwrite every byte before reading it.
 */
class RecordBuffer {
public:
    /**
     * Reserves storage for num_records records.
     * @throws AllocationError on size overflow or if the mapping fails
     */
    RecordBuffer(size_t num_records, const AllocationOptions& options = AllocationOptions());
    ~RecordBuffer();

    RecordBuffer(const RecordBuffer&) = delete;
    RecordBuffer& operator=(const RecordBuffer&) = delete;

    size_t NumRecords() const { return num_records_; }
    size_t SizeBytes() const { return size_bytes_; }
    // Bytes actually mapped (rounded up to the huge page size when huge pages are used)
    size_t MappedBytes() const { return mapped_bytes_; }
    bool UsesHugePages() const { return huge_pages_; }

    const uint8_t* Data() const { return data_; }

    /**
     * Returns a writable view of records [start_record, start_record + num_records).
     * @throws std::out_of_range if the range exceeds the buffer
     */
    ChunkView View(size_t start_record, size_t num_records);

    /**
     * Copy of record i. Only meaningful once generation has completed.
     * @throws std::out_of_range if i >= NumRecords()
     */
    Record At(size_t i) const;

private:
    uint8_t* data_;
    size_t num_records_;
    size_t size_bytes_;
    size_t mapped_bytes_;
    bool huge_pages_;
};

/**
 * Gets the default huge page size from /proc/meminfo
 */
size_t DefaultHugePageSize();

} // namespace BulkGen

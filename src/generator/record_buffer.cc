#include "record_buffer.h"
#include "common/errors.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <sys/mman.h>
#include <glog/logging.h>

namespace BulkGen {

#define ALIGN_UP(x, align_to) (((x) + ((align_to)-1)) & ~((align_to)-1))

size_t DefaultHugePageSize() {
    FILE* f = fopen("/proc/meminfo", "r");
    unsigned long hps = 0;
    if (!f) {
        LOG(WARNING) << "Failed to open /proc/meminfo, using default huge page size";
        return DEFAULT_HUGE_PAGE_SIZE;
    }

    char* line = nullptr;
    size_t len = 0;

    while (getline(&line, &len, f) != -1) {
        if (sscanf(line, "Hugepagesize: %lu kB", &hps) == 1) {
            hps *= 1024;
            break;
        }
    }

    free(line);
    fclose(f);

    if (hps == 0) {
        LOG(WARNING) << "Failed to determine huge page size, using default";
        hps = DEFAULT_HUGE_PAGE_SIZE;
    }
    return hps;
}

RecordBuffer::RecordBuffer(size_t num_records, const AllocationOptions& options)
    : data_(nullptr),
      num_records_(num_records),
      size_bytes_(0),
      mapped_bytes_(0),
      huge_pages_(false) {
    if (num_records == 0) {
        throw AllocationError("cannot allocate an empty record buffer");
    }
    if (num_records > std::numeric_limits<size_t>::max() / RECORD_SIZE) {
        throw AllocationError("record count " + std::to_string(num_records) +
                              " overflows the addressable byte size");
    }
    size_bytes_ = num_records * RECORD_SIZE;

    int populate_flag = options.populate ? MAP_POPULATE : 0;
    void* buffer = MAP_FAILED;

    if (options.use_hugepages) {
        size_t map_align = DefaultHugePageSize();
        size_t aligned_size = ALIGN_UP(size_bytes_, map_align);
        if (aligned_size >= size_bytes_) {
            buffer = mmap(NULL, aligned_size, PROT_READ | PROT_WRITE,
                          MAP_PRIVATE | MAP_ANONYMOUS | MAP_HUGETLB | populate_flag, -1, 0);
        }
        if (buffer != MAP_FAILED) {
            mapped_bytes_ = aligned_size;
            huge_pages_ = true;
        } else {
            LOG(INFO) << "MAP_HUGETLB allocation failed, falling back to regular pages. "
                      << "Check /sys/kernel/mm/hugepages for optimal performance.";
        }
    }

    if (buffer == MAP_FAILED) {
        buffer = mmap(NULL, size_bytes_, PROT_READ | PROT_WRITE,
                      MAP_PRIVATE | MAP_ANONYMOUS | populate_flag, -1, 0);
        if (buffer == MAP_FAILED) {
            int err = errno;
            LOG(ERROR) << "mmap of " << size_bytes_ << " bytes failed: " << strerror(err);
            throw AllocationError("failed to reserve " + std::to_string(size_bytes_) +
                                  " bytes: " + strerror(err));
        }
        mapped_bytes_ = size_bytes_;
    }

    data_ = static_cast<uint8_t*>(buffer);
    VLOG(1) << "Reserved " << mapped_bytes_ << " bytes for " << num_records_
            << " records (huge pages: " << huge_pages_ << ")";
}

RecordBuffer::~RecordBuffer() {
    if (data_ != nullptr && munmap(data_, mapped_bytes_) != 0) {
        LOG(ERROR) << "munmap failed: " << strerror(errno);
    }
}

ChunkView RecordBuffer::View(size_t start_record, size_t num_records) {
    if (start_record > num_records_ || num_records > num_records_ - start_record) {
        throw std::out_of_range("View [" + std::to_string(start_record) + ", +" +
                                std::to_string(num_records) + ") out of bounds for " +
                                std::to_string(num_records_) + " records");
    }
    return ChunkView(data_ + start_record * RECORD_SIZE, num_records * RECORD_SIZE);
}

Record RecordBuffer::At(size_t i) const {
    if (i >= num_records_) {
        throw std::out_of_range("Record index " + std::to_string(i) + " out of bounds");
    }
    Record record;
    std::memcpy(record.data(), data_ + i * RECORD_SIZE, RECORD_SIZE);
    return record;
}

} // namespace BulkGen

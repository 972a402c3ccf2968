#pragma once

#include <chrono>
#include <cstddef>
#include <vector>
#include "common/config.h"
#include "record_buffer.h"

namespace BulkGen {

/**
 * Result of a completed generation run
 */
struct RunReport {
    size_t num_records = 0;
    std::chrono::nanoseconds elapsed{0};
    // Records per second
    double rate = 0;
    // First records of the buffer, in order
    std::vector<Record> sample;

    double ElapsedSeconds() const {
        return std::chrono::duration<double>(elapsed).count();
    }
};

/**
 * Computes elapsed time, rate and a sample of the first sample_count records
 * (clamped to the buffer size). Must only be called after generation has
 * joined; never writes to the buffer.
 * Elapsed time is floored at 1ns so the rate stays finite.
 */
RunReport ComputeReport(std::chrono::steady_clock::time_point start,
                        std::chrono::steady_clock::time_point end,
                        const RecordBuffer& buffer, size_t sample_count);

/**
 * ComputeReport with end = now
 */
RunReport Report(std::chrono::steady_clock::time_point start,
                 const RecordBuffer& buffer, size_t sample_count);

} // namespace BulkGen

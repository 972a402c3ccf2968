#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "common/config.h"
#include "chunk_partitioner.h"
#include "chunk_scheduler.h"
#include "record_buffer.h"
#include "throughput_reporter.h"

namespace BulkGen {

struct GeneratorOptions {
    size_t record_count = 0;
    size_t chunk_size = 0;
    std::vector<uint8_t> key;
    // 0 = one worker per hardware thread
    size_t worker_threads = 0;
    size_t sample_count = 5;
    AllocationOptions allocation;
};

/**
 * Lifecycle of one run. Transitions only move forward; any error moves the
 * run to kFailed.
 */
enum class RunState {
    kConfigured,
    kAllocated,
    kGenerating,
    kCompleted,
    kReported,
    kFailed
};

const char* RunStateName(RunState state);

/**
 * Owns one generation run: validates the options, reserves the output buffer,
 * fills it in parallel and measures throughput. Runs at most once.
 */
class BulkGenerator {
public:
    /**
     * Validates options and computes the chunk partition. Nothing is allocated.
     * @throws ConfigError on an invalid record count, chunk size or key length
     */
    explicit BulkGenerator(GeneratorOptions options);

    /**
     * Allocates, generates and reports.
     * @throws AllocationError, WorkerFailure
     * @throws std::logic_error if called more than once
     */
    RunReport Run();

    RunState State() const { return state_; }
    const std::vector<ChunkDescriptor>& Chunks() const { return chunks_; }
    size_t NumWorkers() const { return scheduler_.NumThreads(); }

    // Output buffer, nullptr until allocated. Read-only: contents are final
    // once State() is kCompleted or later.
    const RecordBuffer* Buffer() const { return buffer_.get(); }

private:
    void Transition(RunState next);

    GeneratorOptions options_;
    CipherKey key_;
    std::vector<ChunkDescriptor> chunks_;
    ChunkScheduler scheduler_;
    std::unique_ptr<RecordBuffer> buffer_;
    RunState state_;
};

} // namespace BulkGen

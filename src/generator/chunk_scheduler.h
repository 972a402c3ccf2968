#pragma once

#include <cstddef>
#include <functional>
#include <vector>
#include "common/config.h"
#include "chunk_partitioner.h"
#include "record_buffer.h"

namespace BulkGen {

/**
 * Fork-join fan-out of chunk tasks over a fixed set of worker threads.
 *
 * The buffer is split into one ChunkView per chunk before any worker starts,
 * and worker w owns chunks w, w+T, w+2T, ... (T = worker count), so workers
 * share nothing mutable and no lock is taken.
 */
class ChunkScheduler {
public:
    using ChunkTask = std::function<void(const ChunkDescriptor&, ChunkView)>;

    /**
     * @param num_threads Worker count, 0 for one per hardware thread
     */
    explicit ChunkScheduler(size_t num_threads = 0);

    size_t NumThreads() const { return num_threads_; }

    /**
     * Runs task once per chunk and returns after every task has finished.
     * @throws std::out_of_range if a chunk lies outside the buffer
     * @throws WorkerFailure if any task threw; the lowest failing chunk is reported
     */
    void Dispatch(const std::vector<ChunkDescriptor>& chunks, RecordBuffer& buffer,
                  const ChunkTask& task) const;

    /**
     * Fills every chunk with the AES-128-CTR keystream of (key, DeriveIV(index)).
     */
    void Run(const std::vector<ChunkDescriptor>& chunks, RecordBuffer& buffer,
             const CipherKey& key) const;

private:
    size_t num_threads_;
};

} // namespace BulkGen

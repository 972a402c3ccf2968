#include "chunk_scheduler.h"
#include "iv_deriver.h"
#include "keystream.h"
#include "common/errors.h"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <glog/logging.h>

namespace BulkGen {

ChunkScheduler::ChunkScheduler(size_t num_threads) : num_threads_(num_threads) {
    if (num_threads_ == 0) {
        num_threads_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

void ChunkScheduler::Dispatch(const std::vector<ChunkDescriptor>& chunks, RecordBuffer& buffer,
                              const ChunkTask& task) const {
    if (chunks.empty()) {
        return;
    }

    // Hand out every sub-view up front; each one is written by its owner only
    std::vector<ChunkView> views;
    views.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        views.push_back(buffer.View(chunk.start, chunk.length));
    }

    const size_t num_workers = std::min(num_threads_, chunks.size());
    // Slot w is written by worker w only and read after join
    std::vector<std::exception_ptr> errors(num_workers);
    std::vector<size_t> failed_chunk(num_workers, 0);

    auto worker = [&](size_t w) {
        size_t done = 0;
        for (size_t i = w; i < chunks.size(); i += num_workers) {
            try {
                task(chunks[i], views[i]);
            } catch (...) {
                errors[w] = std::current_exception();
                failed_chunk[w] = chunks[i].index;
                return;
            }
            ++done;
        }
        VLOG(2) << "Worker " << w << " finished " << done << " chunks";
    };

    std::vector<std::thread> threads;
    threads.reserve(num_workers);
    try {
        for (size_t w = 0; w < num_workers; ++w) {
            threads.emplace_back(worker, w);
        }
    } catch (const std::system_error& e) {
        LOG(ERROR) << "Failed to spawn worker " << threads.size() << ": " << e.what();
        for (auto& thread : threads) {
            thread.join();
        }
        throw;
    }

    for (auto& thread : threads) {
        thread.join();
    }

    // Report the failure with the lowest chunk index so the outcome does not
    // depend on thread timing
    size_t first = num_workers;
    for (size_t w = 0; w < num_workers; ++w) {
        if (errors[w] && (first == num_workers || failed_chunk[w] < failed_chunk[first])) {
            first = w;
        }
    }
    if (first == num_workers) {
        return;
    }

    try {
        std::rethrow_exception(errors[first]);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Chunk " << failed_chunk[first] << " failed: " << e.what();
        throw WorkerFailure(failed_chunk[first], e.what());
    } catch (...) {
        LOG(ERROR) << "Chunk " << failed_chunk[first] << " failed with a non-standard exception";
        throw WorkerFailure(failed_chunk[first], "unknown exception");
    }
}

void ChunkScheduler::Run(const std::vector<ChunkDescriptor>& chunks, RecordBuffer& buffer,
                         const CipherKey& key) const {
    LOG(INFO) << "Generating " << chunks.size() << " chunks on "
              << std::min(num_threads_, chunks.size()) << " workers";
    Dispatch(chunks, buffer, [&key](const ChunkDescriptor& chunk, ChunkView view) {
        IV iv = DeriveIV(chunk.index);
        FillKeystream(key, iv, view);
    });
}

} // namespace BulkGen

#include "bulk_generator.h"
#include "common/errors.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <glog/logging.h>

namespace BulkGen {

namespace {

CipherKey ValidateKey(const std::vector<uint8_t>& key) {
    if (key.size() != CIPHER_KEY_SIZE) {
        throw ConfigError("key must be " + std::to_string(CIPHER_KEY_SIZE) +
                          " bytes, got " + std::to_string(key.size()));
    }
    CipherKey out;
    std::copy(key.begin(), key.end(), out.begin());
    return out;
}

} // namespace

const char* RunStateName(RunState state) {
    switch (state) {
        case RunState::kConfigured: return "Configured";
        case RunState::kAllocated: return "Allocated";
        case RunState::kGenerating: return "Generating";
        case RunState::kCompleted: return "Completed";
        case RunState::kReported: return "Reported";
        case RunState::kFailed: return "Failed";
    }
    return "Unknown";
}

BulkGenerator::BulkGenerator(GeneratorOptions options)
    : options_(std::move(options)),
      key_(ValidateKey(options_.key)),
      chunks_(PartitionRecords(options_.record_count, options_.chunk_size)),
      scheduler_(options_.worker_threads),
      state_(RunState::kConfigured) {}

void BulkGenerator::Transition(RunState next) {
    VLOG(1) << "Run state " << RunStateName(state_) << " -> " << RunStateName(next);
    state_ = next;
}

RunReport BulkGenerator::Run() {
    if (state_ != RunState::kConfigured) {
        throw std::logic_error(std::string("BulkGenerator::Run called in state ") + RunStateName(state_));
    }

    try {
        LOG(INFO) << "Allocating space for " << options_.record_count << " records ("
                  << static_cast<double>(options_.record_count) * RECORD_SIZE / (1024.0 * 1024.0 * 1024.0)
                  << " GiB)";
        buffer_ = std::make_unique<RecordBuffer>(options_.record_count, options_.allocation);
        Transition(RunState::kAllocated);

        auto start = std::chrono::steady_clock::now();
        Transition(RunState::kGenerating);
        scheduler_.Run(chunks_, *buffer_, key_);
        Transition(RunState::kCompleted);

        RunReport report = Report(start, *buffer_, options_.sample_count);
        Transition(RunState::kReported);
        LOG(INFO) << "Generated " << report.num_records << " records in "
                  << report.ElapsedSeconds() << "s";
        return report;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Run failed in state " << RunStateName(state_) << ": " << e.what();
        Transition(RunState::kFailed);
        throw;
    }
}

} // namespace BulkGen

#ifndef BULKGEN_SRC_COMMON_ERRORS_H_
#define BULKGEN_SRC_COMMON_ERRORS_H_

#include <cstddef>
#include <stdexcept>
#include <string>

namespace BulkGen {

/**
 * Base class for every fatal error a generation run can raise.
 * None of them is recoverable: a run either completes or is abandoned.
 */
class BulkGenError : public std::runtime_error {
public:
    explicit BulkGenError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Invalid run parameters (record count, chunk size, key, worker settings).
 * Always raised before any buffer is reserved.
 */
class ConfigError : public BulkGenError {
public:
    explicit ConfigError(const std::string& what) : BulkGenError("config error: " + what) {}
};

/**
 * The output buffer could not be reserved (size overflow or out of memory).
 */
class AllocationError : public BulkGenError {
public:
    explicit AllocationError(const std::string& what) : BulkGenError("allocation error: " + what) {}
};

/**
 * Key or IV of the wrong length, or the cipher backend refused to initialise.
 */
class CipherInitError : public BulkGenError {
public:
    explicit CipherInitError(const std::string& what) : BulkGenError("cipher init error: " + what) {}
};

/**
 * A chunk task failed during generation. Fatal to the whole run.
 */
class WorkerFailure : public BulkGenError {
public:
    WorkerFailure(size_t chunk_index, const std::string& what)
        : BulkGenError("worker failure on chunk " + std::to_string(chunk_index) + ": " + what),
          chunk_index_(chunk_index) {}

    size_t chunk_index() const { return chunk_index_; }

private:
    size_t chunk_index_;
};

} // namespace BulkGen

#endif  // BULKGEN_SRC_COMMON_ERRORS_H_

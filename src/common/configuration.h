#ifndef BULKGEN_CONFIGURATION_H_
#define BULKGEN_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace cxxopts {
class ParseResult;
}

namespace YAML {
class Node;
}

namespace BulkGen {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct BulkGenConfig {
    struct Generator {
        // 1e9 records = ~14.9 GiB of output
        ConfigValue<size_t> record_count{1000000000UL, "BULKGEN_RECORD_COUNT"};
        // 1M records = 16 MiB per chunk
        ConfigValue<size_t> chunk_size{1000000UL, "BULKGEN_CHUNK_SIZE"};
        ConfigValue<std::string> key_hex{"13131313131313131313131313131313", "BULKGEN_KEY_HEX"};
        // 0 = one worker per hardware thread
        ConfigValue<size_t> worker_threads{0, "BULKGEN_WORKER_THREADS"};
    } generator;

    struct Report {
        ConfigValue<size_t> sample_count{5, "BULKGEN_SAMPLE_COUNT"};
    } report;

    struct Memory {
        ConfigValue<bool> use_hugepages{true, "BULKGEN_USE_HUGEPAGES"};
        // Pre-fault the mapping at allocation time (moves page-fault cost out of the timed region)
        ConfigValue<bool> populate{false, "BULKGEN_MEMORY_POPULATE"};
    } memory;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file. Returns false only if the file cannot be
    // read or parsed; call validate() once all overrides are applied.
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with parsed command line arguments
    void overrideFromCommandLine(const cxxopts::ParseResult& result);

    // Restore compiled-in defaults
    void reset() { config_ = BulkGenConfig{}; }

    // Get the configuration
    const BulkGenConfig& config() const { return config_; }
    BulkGenConfig& config() { return config_; }

    // Helper methods for common access patterns
    size_t getRecordCount() const { return config_.generator.record_count.get(); }
    size_t getChunkSize() const { return config_.generator.chunk_size.get(); }
    size_t getWorkerThreads() const { return config_.generator.worker_threads.get(); }
    size_t getSampleCount() const { return config_.report.sample_count.get(); }

    // Decoded generator key. Throws ConfigError if key_hex is not valid hex.
    std::vector<uint8_t> getKeyBytes() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    BulkGenConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

/**
 * Decodes a hex string ("0a1B..") into bytes.
 * Throws ConfigError on odd length or non-hex characters.
 */
std::vector<uint8_t> ParseHexBytes(const std::string& hex);

// Template specializations for getEnvValue
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace BulkGen

#endif // BULKGEN_CONFIGURATION_H_

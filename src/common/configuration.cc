#include "configuration.h"
#include "errors.h"
#include "config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include <cxxopts.hpp>

namespace BulkGen {

namespace {
constexpr size_t MAX_SAMPLE_COUNT = 1024;
constexpr size_t MAX_WORKER_THREADS = 4096;

int HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        // stoull silently wraps negative input
        if (std::string(env_val).find('-') != std::string::npos) {
            LOG(WARNING) << "Ignoring negative value for env var " << env_var_ << ": " << env_val;
            return std::nullopt;
        }
        try {
            size_t pos = 0;
            unsigned long long value = std::stoull(env_val, &pos);
            if (env_val[pos] != '\0') {
                LOG(WARNING) << "Ignoring trailing characters in env var " << env_var_ << ": " << env_val;
                return std::nullopt;
            }
            return static_cast<size_t>(value);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["bulkgen"]) {
        LOG(WARNING) << "Configuration has no 'bulkgen' section, keeping defaults";
        return;
    }
    auto root = yaml["bulkgen"];

    // Generator
    if (root["generator"]) {
        auto generator = root["generator"];
        if (generator["record_count"]) config_.generator.record_count.set(generator["record_count"].as<size_t>());
        if (generator["chunk_size"]) config_.generator.chunk_size.set(generator["chunk_size"].as<size_t>());
        if (generator["key_hex"]) config_.generator.key_hex.set(generator["key_hex"].as<std::string>());
        if (generator["worker_threads"]) config_.generator.worker_threads.set(generator["worker_threads"].as<size_t>());
    }

    // Report
    if (root["report"]) {
        auto report = root["report"];
        if (report["sample_count"]) config_.report.sample_count.set(report["sample_count"].as<size_t>());
    }

    // Memory
    if (root["memory"]) {
        auto memory = root["memory"];
        if (memory["use_hugepages"]) config_.memory.use_hugepages.set(memory["use_hugepages"].as<bool>());
        if (memory["populate"]) config_.memory.populate.set(memory["populate"].as<bool>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(const cxxopts::ParseResult& result) {
    if (result.count("records")) {
        config_.generator.record_count.set(result["records"].as<size_t>());
    }
    if (result.count("chunk_size")) {
        config_.generator.chunk_size.set(result["chunk_size"].as<size_t>());
    }
    if (result.count("key")) {
        config_.generator.key_hex.set(result["key"].as<std::string>());
    }
    if (result.count("threads")) {
        config_.generator.worker_threads.set(result["threads"].as<size_t>());
    }
    if (result.count("samples")) {
        config_.report.sample_count.set(result["samples"].as<size_t>());
    }
    if (result.count("no_hugepages")) {
        config_.memory.use_hugepages.set(false);
    }
    if (result.count("populate")) {
        config_.memory.populate.set(true);
    }
}

std::vector<uint8_t> Configuration::getKeyBytes() const {
    return ParseHexBytes(config_.generator.key_hex.get());
}

bool Configuration::validate() const {
    validation_errors_.clear();

    size_t records = config_.generator.record_count.get();
    size_t chunk = config_.generator.chunk_size.get();

    if (records == 0) {
        validation_errors_.push_back("Record count must be at least 1");
    }
    if (chunk == 0) {
        validation_errors_.push_back("Chunk size must be at least 1");
    } else if (records % chunk != 0) {
        validation_errors_.push_back("Record count (" + std::to_string(records) +
                                     ") must be divisible by chunk size (" + std::to_string(chunk) + ")");
    }

    try {
        size_t key_len = getKeyBytes().size();
        if (key_len != CIPHER_KEY_SIZE) {
            validation_errors_.push_back("Key must be " + std::to_string(CIPHER_KEY_SIZE) +
                                         " bytes, got " + std::to_string(key_len));
        }
    } catch (const ConfigError& e) {
        validation_errors_.push_back(e.what());
    }

    if (config_.generator.worker_threads.get() > MAX_WORKER_THREADS) {
        validation_errors_.push_back("Worker threads cannot exceed " + std::to_string(MAX_WORKER_THREADS));
    }

    if (config_.report.sample_count.get() > MAX_SAMPLE_COUNT) {
        validation_errors_.push_back("Sample count cannot exceed " + std::to_string(MAX_SAMPLE_COUNT));
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

std::vector<uint8_t> ParseHexBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw ConfigError("hex string has odd length " + std::to_string(hex.size()));
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = HexDigit(hex[i]);
        int lo = HexDigit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw ConfigError("invalid hex character near offset " + std::to_string(i) + " in '" + hex + "'");
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

} // namespace BulkGen

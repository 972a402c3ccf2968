#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace BulkGen {

/// Size of one generated record. Equal to the AES block size so that one
/// record consumes exactly one counter value.
constexpr size_t RECORD_SIZE = 16;
/// AES-128 key and counter-mode IV sizes
constexpr size_t CIPHER_KEY_SIZE = 16;
constexpr size_t CIPHER_IV_SIZE = 16;

using Record = std::array<uint8_t, RECORD_SIZE>;
using CipherKey = std::array<uint8_t, CIPHER_KEY_SIZE>;
using IV = std::array<uint8_t, CIPHER_IV_SIZE>;

/// Fallback when /proc/meminfo has no Hugepagesize line
constexpr size_t DEFAULT_HUGE_PAGE_SIZE = 2UL * 1024 * 1024;

} // namespace BulkGen

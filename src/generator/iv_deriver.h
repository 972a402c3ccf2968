#pragma once

#include <cstdint>
#include "common/config.h"

namespace BulkGen {

/**
 * Counter-mode IV for a chunk: bytes [0, 8) are zero, bytes [8, 16) hold the
 * chunk index in little-endian order. Pure and independent of the key.
 */
IV DeriveIV(uint64_t chunk_index);

} // namespace BulkGen

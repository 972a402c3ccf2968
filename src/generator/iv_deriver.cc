#include "iv_deriver.h"

namespace BulkGen {

IV DeriveIV(uint64_t chunk_index) {
    IV iv{};
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        iv[8 + i] = static_cast<uint8_t>(chunk_index >> (8 * i));
    }
    return iv;
}

} // namespace BulkGen

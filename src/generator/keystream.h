#pragma once

#include <cstddef>
#include <cstdint>
#include <openssl/evp.h>
#include "common/config.h"
#include "record_buffer.h"

namespace BulkGen {

/**
 * AES-128-CTR state for one chunk. The 128-bit counter starts at the IV read
 * as a big-endian integer and advances by one per 16-byte block.
 * Lives inside a single chunk task and is never shared.
 */
class CipherContext {
public:
    /**
     * @throws CipherInitError if key_len or iv_len is not 16 or OpenSSL
     *         refuses to initialise the context
     */
    CipherContext(const uint8_t* key, size_t key_len, const uint8_t* iv, size_t iv_len);
    ~CipherContext();

    CipherContext(const CipherContext&) = delete;
    CipherContext& operator=(const CipherContext&) = delete;

    /**
     * Writes the next len bytes of keystream to out. Successive calls
     * continue the same counter sequence.
     * @throws std::runtime_error if OpenSSL reports a failure
     */
    void Generate(uint8_t* out, size_t len);

private:
    EVP_CIPHER_CTX* ctx_;
};

/**
 * Overwrites span with the AES-128-CTR keystream for (key, iv), i.e. the
 * encryption of an all-zero plaintext of the same length. Writes nothing
 * outside span.
 */
void FillKeystream(const uint8_t* key, size_t key_len, const IV& iv, ChunkView span);
void FillKeystream(const CipherKey& key, const IV& iv, ChunkView span);

} // namespace BulkGen

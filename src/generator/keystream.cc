#include "keystream.h"
#include "common/errors.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <openssl/err.h>

namespace BulkGen {

namespace {

// Plaintext source for CTR encryption. Encrypting zeros yields the raw
// keystream, so the (uninitialised) destination is never read.
constexpr size_t ZERO_BLOCK_SIZE = 64 * 1024;
const uint8_t kZeroBlock[ZERO_BLOCK_SIZE] = {};

std::string OpenSSLErrorString() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

} // namespace

CipherContext::CipherContext(const uint8_t* key, size_t key_len, const uint8_t* iv, size_t iv_len)
    : ctx_(nullptr) {
    if (key == nullptr || key_len != CIPHER_KEY_SIZE) {
        throw CipherInitError("key must be " + std::to_string(CIPHER_KEY_SIZE) +
                              " bytes, got " + std::to_string(key == nullptr ? 0 : key_len));
    }
    if (iv == nullptr || iv_len != CIPHER_IV_SIZE) {
        throw CipherInitError("IV must be " + std::to_string(CIPHER_IV_SIZE) +
                              " bytes, got " + std::to_string(iv == nullptr ? 0 : iv_len));
    }

    ctx_ = EVP_CIPHER_CTX_new();
    if (ctx_ == nullptr) {
        throw CipherInitError("EVP_CIPHER_CTX_new failed: " + OpenSSLErrorString());
    }
    if (1 != EVP_EncryptInit_ex(ctx_, EVP_aes_128_ctr(), nullptr, key, iv)) {
        std::string reason = OpenSSLErrorString();
        EVP_CIPHER_CTX_free(ctx_);
        ctx_ = nullptr;
        throw CipherInitError("EVP_EncryptInit_ex failed: " + reason);
    }
}

CipherContext::~CipherContext() {
    if (ctx_ != nullptr) {
        EVP_CIPHER_CTX_free(ctx_);
    }
}

void CipherContext::Generate(uint8_t* out, size_t len) {
    size_t done = 0;
    while (done < len) {
        // EVP_EncryptUpdate takes an int length
        int piece = static_cast<int>(std::min(len - done, ZERO_BLOCK_SIZE));
        int out_len = 0;
        if (1 != EVP_EncryptUpdate(ctx_, out + done, &out_len, kZeroBlock, piece)) {
            throw std::runtime_error("EVP_EncryptUpdate failed at offset " + std::to_string(done) +
                                     ": " + OpenSSLErrorString());
        }
        if (out_len != piece) {
            throw std::runtime_error("EVP_EncryptUpdate produced " + std::to_string(out_len) +
                                     " bytes, expected " + std::to_string(piece));
        }
        done += static_cast<size_t>(piece);
    }
}

void FillKeystream(const uint8_t* key, size_t key_len, const IV& iv, ChunkView span) {
    CipherContext cipher(key, key_len, iv.data(), iv.size());
    cipher.Generate(span.Data(), span.Size());
}

void FillKeystream(const CipherKey& key, const IV& iv, ChunkView span) {
    FillKeystream(key.data(), key.size(), iv, span);
}

} // namespace BulkGen

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/generator/keystream.h"
#include "../../src/generator/iv_deriver.h"
#include "../../src/common/errors.h"
#include <openssl/evp.h>
#include <cstring>
#include <vector>

using namespace BulkGen;
using ::testing::HasSubstr;

namespace {

// AES-128 of a single block, computed with ECB so it shares no code path with CTR
Record EncryptBlock(const CipherKey& key, const IV& block) {
    Record out{};
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    int len = 0;
    EXPECT_EQ(1, EVP_EncryptInit_ex(ctx, EVP_aes_128_ecb(), nullptr, key.data(), nullptr));
    EVP_CIPHER_CTX_set_padding(ctx, 0);
    EXPECT_EQ(1, EVP_EncryptUpdate(ctx, out.data(), &len, block.data(), static_cast<int>(block.size())));
    EXPECT_EQ(len, static_cast<int>(RECORD_SIZE));
    EVP_CIPHER_CTX_free(ctx);
    return out;
}

// 128-bit big-endian add
IV AddToCounter(IV counter, uint64_t n) {
    unsigned carry = 0;
    for (int i = 15; i >= 0; --i) {
        unsigned sum = counter[i] + static_cast<unsigned>(n & 0xFF) + carry;
        counter[i] = static_cast<uint8_t>(sum);
        carry = sum >> 8;
        n >>= 8;
    }
    return counter;
}

CipherKey FixedKey() {
    CipherKey key;
    key.fill(0x13);
    return key;
}

} // namespace

class KeystreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        AllocationOptions options;
        options.use_hugepages = false;
        buffer_ = std::make_unique<RecordBuffer>(num_records_, options);
    }

    static constexpr size_t num_records_ = 8192; // 128 KiB, spans several zero-block passes
    std::unique_ptr<RecordBuffer> buffer_;
};

TEST_F(KeystreamTest, EveryBlockMatchesCounterEncryption) {
    const CipherKey key = FixedKey();
    const IV iv = DeriveIV(3);
    FillKeystream(key, iv, buffer_->View(0, num_records_));

    for (size_t k = 0; k < num_records_; ++k) {
        Record expected = EncryptBlock(key, AddToCounter(iv, k));
        ASSERT_EQ(buffer_->At(k), expected) << "block " << k;
    }
}

TEST_F(KeystreamTest, CounterCarriesAcrossBytes) {
    // Start one block below a byte-15 rollover so the counter carries into byte 14
    const CipherKey key = FixedKey();
    IV iv{};
    iv[15] = 0xFF;
    FillKeystream(key, iv, buffer_->View(0, 2));

    IV next{};
    next[14] = 0x01;
    EXPECT_EQ(buffer_->At(0), EncryptBlock(key, iv));
    EXPECT_EQ(buffer_->At(1), EncryptBlock(key, next));
}

TEST_F(KeystreamTest, OverwritesExistingContents) {
    const CipherKey key = FixedKey();
    const IV iv = DeriveIV(0);
    ChunkView view = buffer_->View(0, 64);
    std::memset(view.Data(), 0x5A, view.Size());
    FillKeystream(key, iv, view);

    for (size_t k = 0; k < 64; ++k) {
        EXPECT_EQ(buffer_->At(k), EncryptBlock(key, AddToCounter(iv, k)));
    }
}

TEST_F(KeystreamTest, WritesNothingOutsideTheSpan) {
    const CipherKey key = FixedKey();
    std::memset(buffer_->View(0, num_records_).Data(), 0xEE, num_records_ * RECORD_SIZE);

    FillKeystream(key, DeriveIV(1), buffer_->View(100, 50));

    Record guard;
    guard.fill(0xEE);
    EXPECT_EQ(buffer_->At(99), guard);
    EXPECT_EQ(buffer_->At(150), guard);
    EXPECT_NE(buffer_->At(100), guard);
    EXPECT_NE(buffer_->At(149), guard);
}

TEST_F(KeystreamTest, SplitGenerationContinuesTheCounter) {
    const CipherKey key = FixedKey();
    const IV iv = DeriveIV(7);
    FillKeystream(key, iv, buffer_->View(0, 100));

    std::vector<uint8_t> split(100 * RECORD_SIZE);
    CipherContext cipher(key.data(), key.size(), iv.data(), iv.size());
    cipher.Generate(split.data(), 37 * RECORD_SIZE);
    cipher.Generate(split.data() + 37 * RECORD_SIZE, 63 * RECORD_SIZE);

    EXPECT_EQ(0, std::memcmp(split.data(), buffer_->Data(), split.size()));
}

TEST_F(KeystreamTest, DifferentIVsGiveDifferentStreams) {
    const CipherKey key = FixedKey();
    FillKeystream(key, DeriveIV(0), buffer_->View(0, 1));
    FillKeystream(key, DeriveIV(1), buffer_->View(1, 1));
    EXPECT_NE(buffer_->At(0), buffer_->At(1));
}

TEST_F(KeystreamTest, WrongKeyLengthIsCipherInitError) {
    std::vector<uint8_t> short_key(15, 0x13);
    try {
        FillKeystream(short_key.data(), short_key.size(), DeriveIV(0), buffer_->View(0, 1));
        FAIL() << "expected CipherInitError";
    } catch (const CipherInitError& e) {
        EXPECT_THAT(e.what(), HasSubstr("key must be 16 bytes"));
    }

    std::vector<uint8_t> long_key(32, 0x13);
    EXPECT_THROW(FillKeystream(long_key.data(), long_key.size(), DeriveIV(0), buffer_->View(0, 1)),
                 CipherInitError);
    EXPECT_THROW(FillKeystream(nullptr, 16, DeriveIV(0), buffer_->View(0, 1)), CipherInitError);
}

TEST_F(KeystreamTest, WrongIvLengthIsCipherInitError) {
    const CipherKey key = FixedKey();
    uint8_t iv[8] = {};
    EXPECT_THROW(CipherContext(key.data(), key.size(), iv, sizeof(iv)), CipherInitError);
}

#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <string>
#include <vector>
#include "crypto/aes_cipher.hpp"
#include "crypto/base64.hpp"
#include "crypto/encryption_service.hpp"
#include "test_utils.hpp"

using namespace k7::crypto;

namespace {

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

CryptoErrorCode error_code_of(const std::function<void()>& action) {
    try {
        action();
    } catch (const CryptoError& e) {
        return e.code();
    }
    ADD_FAILURE() << "Expected CryptoError";
    return CryptoErrorCode::CipherFailure;
}

} // namespace

// ---- AES CIPHER ----

class AesCipherTest : public ::testing::Test {
protected:
    Bytes key;
    Bytes iv;

    void SetUp() override {
        init_logging();
        key.resize(AesCipher::KEY_SIZE, 0x42);
        iv.resize(AesCipher::IV_SIZE, 0x24);
    }
};

TEST_F(AesCipherTest, BasicOperation) {
    const Bytes plaintext = to_bytes("Hello, World! This is a test of buffer encryption.");

    AesCipher cipher(key, iv);
    Bytes encrypted = cipher.encrypt(plaintext);
    ASSERT_NE(encrypted, plaintext);
    ASSERT_EQ(encrypted.size() % AesCipher::BLOCK_SIZE, 0u);

    Bytes decrypted = cipher.decrypt(encrypted);
    ASSERT_EQ(decrypted, plaintext);
}

TEST_F(AesCipherTest, EmptyInputIsOnePaddingBlock) {
    AesCipher cipher(key, iv);
    Bytes encrypted = cipher.encrypt({});
    EXPECT_EQ(encrypted.size(), AesCipher::BLOCK_SIZE);
    EXPECT_TRUE(cipher.decrypt(encrypted).empty());
}

TEST_F(AesCipherTest, LargeDataSpansManyChunks) {
    Bytes plaintext(100000);
    for (size_t i = 0; i < plaintext.size(); ++i) {
        plaintext[i] = static_cast<uint8_t>(i * 7);
    }

    AesCipher cipher(key, iv);
    Bytes encrypted = cipher.encrypt(plaintext);
    EXPECT_EQ(encrypted.size(), (plaintext.size() / AesCipher::BLOCK_SIZE + 1) * AesCipher::BLOCK_SIZE);
    EXPECT_EQ(cipher.decrypt(encrypted), plaintext);
}

TEST_F(AesCipherTest, InvalidKeyOrIvSize) {
    EXPECT_THROW(AesCipher(Bytes(16, 0x42), iv), CryptoError);
    EXPECT_THROW(AesCipher(key, Bytes(8, 0x24)), CryptoError);
}

TEST_F(AesCipherTest, GeneratedIvsDiffer) {
    auto first = AesCipher::generate_IV();
    auto second = AesCipher::generate_IV();
    EXPECT_NE(first, second);
}

// ---- BASE64 ----

TEST(Base64Test, EncodesStandardAlphabetWithPadding) {
    EXPECT_EQ(base64_encode(to_bytes("Man")), "TWFu");
    EXPECT_EQ(base64_encode(to_bytes("Ma")), "TWE=");
    EXPECT_EQ(base64_encode(to_bytes("M")), "TQ==");
    EXPECT_EQ(base64_encode({}), "");
}

TEST(Base64Test, DecodesPaddedInput) {
    EXPECT_EQ(base64_decode("TWFu"), to_bytes("Man"));
    EXPECT_EQ(base64_decode("TWE="), to_bytes("Ma"));
    EXPECT_EQ(base64_decode("TQ=="), to_bytes("M"));
}

TEST(Base64Test, ToleratesTrailingLineTerminators) {
    EXPECT_EQ(base64_decode("TWFu\n"), to_bytes("Man"));
    EXPECT_EQ(base64_decode("TWE=\r\n"), to_bytes("Ma"));
}

TEST(Base64Test, RejectsMalformedInput) {
    const std::vector<std::string> malformed = {
        "",
        "TWF",
        "TW=u",
        "=TWF",
        "T===",
        "TWF*",
        "TW Fu===",
        "!!!notbase64!!!",
        "\r\n"
    };

    for (const auto& text : malformed) {
        EXPECT_EQ(error_code_of([&] { base64_decode(text); }), CryptoErrorCode::MalformedEncoding)
            << "Input: '" << text << "'";
    }
}

// ---- ENCRYPTION SERVICE ----

class EncryptionServiceTest : public ::testing::Test {
protected:
    EncryptionService service;
    const std::string password = "correct horse battery staple";

    void SetUp() override {
        init_logging();
    }
};

TEST_F(EncryptionServiceTest, SealOpenRoundTrip) {
    const Bytes plaintext = to_bytes("{\"key\":\"alice\"}");

    std::string archive = service.seal_to_base64(plaintext, password);
    EXPECT_EQ(service.open_from_base64(archive, password), plaintext);
}

TEST_F(EncryptionServiceTest, SealedBlobLayout) {
    const Bytes plaintext = to_bytes("0123456789abcdef0123");

    SealedBlob blob = service.seal(plaintext, password);
    EXPECT_EQ(blob.iv.size(), AesCipher::IV_SIZE);
    EXPECT_EQ(blob.ciphertext.size(), 32u);

    Bytes framed = base64_decode(blob.to_base64());
    ASSERT_EQ(framed.size(), blob.iv.size() + blob.ciphertext.size());
    EXPECT_TRUE(std::equal(blob.iv.begin(), blob.iv.end(), framed.begin()));
}

TEST_F(EncryptionServiceTest, FreshIvPerSeal) {
    const Bytes plaintext = to_bytes("same input");
    EXPECT_NE(service.seal_to_base64(plaintext, password), service.seal_to_base64(plaintext, password));
}

TEST_F(EncryptionServiceTest, KeyIsPasswordPaddedOrTruncated) {
    Bytes short_key = EncryptionService::derive_key("abc");
    ASSERT_EQ(short_key.size(), AesCipher::KEY_SIZE);
    EXPECT_EQ(short_key[0], 'a');
    EXPECT_EQ(short_key[2], 'c');
    EXPECT_EQ(short_key[3], 0);
    EXPECT_EQ(short_key[31], 0);

    std::string long_password(40, 'x');
    long_password[31] = 'y';
    Bytes long_key = EncryptionService::derive_key(long_password);
    ASSERT_EQ(long_key.size(), AesCipher::KEY_SIZE);
    EXPECT_EQ(long_key[31], 'y');

    // Only the first 32 bytes matter
    std::string archive = service.seal_to_base64(to_bytes("payload"), long_password);
    EXPECT_EQ(service.open_from_base64(archive, long_password.substr(0, 32) + "ignored"), to_bytes("payload"));
}

TEST_F(EncryptionServiceTest, MissingPassword) {
    EXPECT_EQ(error_code_of([&] { service.seal(to_bytes("x"), ""); }), CryptoErrorCode::MissingPassword);
    EXPECT_EQ(error_code_of([&] { service.open_from_base64("not even base64", ""); }),
              CryptoErrorCode::MissingPassword);
}

TEST_F(EncryptionServiceTest, MalformedEncoding) {
    EXPECT_EQ(error_code_of([&] { service.open_from_base64("!!!notbase64!!!", password); }),
              CryptoErrorCode::MalformedEncoding);
}

TEST_F(EncryptionServiceTest, TruncatedBlob) {
    // IV plus four bytes, short of one cipher block
    std::string archive = base64_encode(Bytes(20, 0x11));
    EXPECT_EQ(error_code_of([&] { service.open_from_base64(archive, password); }), CryptoErrorCode::Truncated);
}

TEST_F(EncryptionServiceTest, UnalignedCiphertext) {
    std::string archive = base64_encode(Bytes(16 + 17, 0x11));
    EXPECT_EQ(error_code_of([&] { service.open_from_base64(archive, password); }),
              CryptoErrorCode::DecryptFailed);
}

TEST_F(EncryptionServiceTest, WrongPasswordNeverYieldsPlaintext) {
    const Bytes plaintext = to_bytes("secret record data that spans more than one block");
    std::string archive = service.seal_to_base64(plaintext, password);

    // Without an integrity tag a wrong key fails the padding check in almost
    // every case and otherwise decrypts to garbage
    try {
        Bytes opened = service.open_from_base64(archive, "wrong password");
        EXPECT_NE(opened, plaintext);
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), CryptoErrorCode::DecryptFailed);
    }
}

TEST_F(EncryptionServiceTest, CorruptedCiphertextDetected) {
    SealedBlob blob = service.seal(to_bytes("payload"), password);
    blob.ciphertext.back() ^= 0xFF;

    try {
        Bytes opened = service.open(blob, password);
        EXPECT_NE(opened, to_bytes("payload"));
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), CryptoErrorCode::DecryptFailed);
    }
}

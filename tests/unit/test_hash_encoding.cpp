#include <gtest/gtest.h>
#include "chunkrelay/crypto/encoding.hpp"
#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/crypto/random.hpp"
#include "chunkrelay/transfer/payload_source.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

using namespace chunkrelay::crypto;
using namespace chunkrelay::transfer;

namespace {
    std::vector<std::uint8_t> bytes_of(const std::string& text) {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }

    const std::string ABC_DIGEST = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    const std::string EMPTY_DIGEST = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
}

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
    }
};

TEST_F(HashTest, KnownVectors) {
    EXPECT_EQ(hash_utils::digest_hex(bytes_of("abc")), ABC_DIGEST);
    EXPECT_EQ(hash_utils::digest_hex({}), EMPTY_DIGEST);
}

TEST_F(HashTest, StreamingMatchesOneShot) {
    Sha256Hasher hasher;
    ASSERT_TRUE(hasher.initialize());
    ASSERT_TRUE(hasher.update(bytes_of("a")));
    ASSERT_TRUE(hasher.update(bytes_of("bc")));

    EXPECT_EQ(hash_utils::hash_to_hex(hasher.finalize()), ABC_DIGEST);
}

TEST_F(HashTest, HexParsing) {
    auto parsed = hash_utils::hash_from_hex(ABC_DIGEST);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(hash_utils::hash_to_hex(*parsed), ABC_DIGEST);

    EXPECT_FALSE(hash_utils::hash_from_hex("abc").has_value());
    EXPECT_FALSE(hash_utils::hash_from_hex(std::string(64, 'g')).has_value());
}

TEST_F(HashTest, VerifyDigest) {
    auto data = bytes_of("abc");

    EXPECT_TRUE(hash_utils::verify_digest(data, ABC_DIGEST));
    EXPECT_FALSE(hash_utils::verify_digest(bytes_of("abd"), ABC_DIGEST));
    EXPECT_FALSE(hash_utils::verify_digest(data, "not-a-digest"));
}

TEST_F(HashTest, HashFile) {
    const std::filesystem::path path = "test_hash_file.bin";
    {
        std::ofstream file(path, std::ios::binary);
        file << "abc";
    }

    Sha256Hash hash{};
    ASSERT_TRUE(Sha256Hasher::hash_file(path, hash));
    EXPECT_EQ(hash_utils::hash_to_hex(hash), ABC_DIGEST);

    std::filesystem::remove(path);
    EXPECT_FALSE(Sha256Hasher::hash_file(path, hash));
}

class Base64Test : public ::testing::Test {};

TEST_F(Base64Test, Rfc4648Vectors) {
    EXPECT_EQ(base64::encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(base64::encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(base64::encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(base64::encode(bytes_of("foobar")), "Zm9vYmFy");
    EXPECT_EQ(base64::encode({}), "");
}

TEST_F(Base64Test, EncodedLengthHasNoPaddingForMultiplesOfThree) {
    EXPECT_EQ(base64::encoded_length(44334), 59112u);
    EXPECT_EQ(base64::encoded_length(16383), 21844u);
    EXPECT_EQ(base64::encoded_length(1), 4u);

    std::vector<std::uint8_t> chunk(16383, 0x5A);
    auto encoded = base64::encode(chunk);
    EXPECT_EQ(encoded.size(), base64::encoded_length(chunk.size()));
    EXPECT_EQ(encoded.find('='), std::string::npos);
}

TEST_F(Base64Test, DecodeRestoresBinary) {
    std::vector<std::uint8_t> binary;
    for (int i = 0; i < 256; ++i) {
        binary.push_back(static_cast<std::uint8_t>(i));
    }

    std::vector<std::uint8_t> decoded;
    ASSERT_TRUE(base64::decode(base64::encode(binary), decoded));
    EXPECT_EQ(decoded, binary);
}

TEST_F(Base64Test, DecodeRejectsMalformedInput) {
    std::vector<std::uint8_t> decoded{1, 2, 3};

    EXPECT_EQ(base64::decode("Zm9", decoded).error, CryptoError::DECODE_FAILED);
    EXPECT_TRUE(decoded.empty());
    EXPECT_EQ(base64::decode("Zm9v!!!!", decoded).error, CryptoError::DECODE_FAILED);
    EXPECT_TRUE(base64::decode("", decoded));
    EXPECT_TRUE(decoded.empty());
}

class SecureRandomTest : public ::testing::Test {};

TEST_F(SecureRandomTest, HexIdsAreUniqueAndSized) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = SecureRandom::generate_hex_id();
        EXPECT_EQ(id.size(), TRANSFER_ID_BYTES * 2);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST_F(SecureRandomTest, UniformStaysInRange) {
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(SecureRandom::generate_uniform(10), 10u);
    }
}

TEST_F(SecureRandomTest, EmptyBufferRejected) {
    std::vector<std::uint8_t> empty;
    EXPECT_EQ(SecureRandom::generate_bytes(empty).error, CryptoError::BUFFER_TOO_SMALL);
}

class PayloadSourceTest : public ::testing::Test {};

TEST_F(PayloadSourceTest, MemorySourceSlices) {
    MemoryPayloadSource source(bytes_of("0123456789"));

    EXPECT_EQ(source.size(), 10u);
    EXPECT_EQ(source.read(2, 3), bytes_of("234"));
    EXPECT_EQ(source.read(8, 5), bytes_of("89"));
    EXPECT_THROW(source.read(11, 1), std::runtime_error);
    EXPECT_EQ(compute_digest(MemoryPayloadSource(bytes_of("abc"))), ABC_DIGEST);
}

TEST_F(PayloadSourceTest, FileSourceMatchesContent) {
    const std::filesystem::path path = "test_payload_source.bin";
    std::vector<std::uint8_t> content(3 * 1024 * 1024 + 17);
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<std::uint8_t>(i * 31 + 7);
    }
    {
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    }

    {
        FilePayloadSource source(path);
        EXPECT_EQ(source.size(), content.size());

        auto slice = source.read(1024 * 1024 - 5, 10);
        EXPECT_EQ(slice, std::vector<std::uint8_t>(content.begin() + 1024 * 1024 - 5,
                                                   content.begin() + 1024 * 1024 + 5));
        EXPECT_EQ(compute_digest(source), hash_utils::digest_hex(content));
    }

    std::filesystem::remove(path);
    EXPECT_THROW(FilePayloadSource missing(path), std::runtime_error);
}

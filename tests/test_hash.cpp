#include <gtest/gtest.h>
#include "../main/src/hash.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class HashTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;

    void SetUp() override {
        init_localization();
        suite_work_dir = fs::absolute("tmp_hash_test");
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir);
    }

    void TearDown() override {
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }

    std::string create_dummy_file(const std::string& name, const std::string& content) {
        fs::path p = suite_work_dir / name;
        std::ofstream f(p, std::ios::binary);
        f << content;
        return p.string();
    }
};

TEST_F(HashTest, Sha256KnownVectors) {
    EvpHashFunction hasher;
    EXPECT_EQ(hasher.name(), "sha256");
    EXPECT_EQ(to_hex(hash_bytes(hasher, "")), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(to_hex(hash_bytes(hasher, "abc")), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashTest, ResetDropsPreviousInput) {
    EvpHashFunction hasher;
    const std::string junk = "previous line";
    hasher.update(reinterpret_cast<const std::uint8_t*>(junk.data()), junk.size());

    // hash_bytes starts from a reset state
    EXPECT_EQ(to_hex(hash_bytes(hasher, "a")), "ca978112ca1bbdcafac231b39a23dc4da786eff8147c4e72b9807785afee48bb");
    EXPECT_EQ(to_hex(hash_bytes(hasher, "a")), "ca978112ca1bbdcafac231b39a23dc4da786eff8147c4e72b9807785afee48bb");
}

TEST_F(HashTest, StreamingUpdatesMatchOneShot) {
    EvpHashFunction hasher;
    const std::string part1 = "ab";
    const std::string part2 = "c";
    hasher.reset();
    hasher.update(reinterpret_cast<const std::uint8_t*>(part1.data()), part1.size());
    hasher.update(reinterpret_cast<const std::uint8_t*>(part2.data()), part2.size());
    Digest streamed = hasher.finalize();
    EXPECT_EQ(streamed, hash_bytes(hasher, "abc"));
}

TEST_F(HashTest, HashPairIsHashOfConcatenation) {
    EvpHashFunction hasher;
    Digest left = hash_bytes(hasher, "a");
    Digest right = hash_bytes(hasher, "b");

    std::string concatenated(left.begin(), left.end());
    concatenated.append(right.begin(), right.end());
    ASSERT_EQ(concatenated.size(), 2 * DIGEST_SIZE);

    EXPECT_EQ(hash_pair(hasher, left, right), hash_bytes(hasher, concatenated));
    EXPECT_EQ(to_hex(hash_pair(hasher, left, right)), "e5a01fee14e0ed5c48714f22180f25ad8365b53f9779f79dc4a3d7e93963f94a");
    EXPECT_NE(hash_pair(hasher, left, right), hash_pair(hasher, right, left));
}

TEST_F(HashTest, OtherThirtyTwoByteAlgorithms) {
    EvpHashFunction sha3("sha3-256");
    EXPECT_EQ(sha3.name(), "sha3-256");
    EXPECT_EQ(to_hex(hash_bytes(sha3, "")), "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");

    EvpHashFunction upper("SHA256");
    EXPECT_EQ(to_hex(hash_bytes(upper, "abc")), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashTest, UnknownAlgorithmIsUnavailable) {
    EXPECT_THROW(EvpHashFunction("no-such-digest"), HashAlgorithmUnavailable);
    EXPECT_THROW(make_hash_function_factory("no-such-digest"), HashAlgorithmUnavailable);
}

TEST_F(HashTest, WrongDigestSizeIsUnavailable) {
    EXPECT_THROW(EvpHashFunction("sha512"), HashAlgorithmUnavailable);
    EXPECT_THROW(EvpHashFunction("sha1"), HashAlgorithmUnavailable);
}

TEST_F(HashTest, UnavailableIsATreesumException) {
    EXPECT_THROW(EvpHashFunction("no-such-digest"), TreesumException);
}

TEST_F(HashTest, FactoryHandsOutIndependentInstances) {
    HashFunctionFactory factory = make_hash_function_factory("sha256");
    auto first = factory();
    auto second = factory();
    ASSERT_NE(first.get(), second.get());

    const std::string data = "abc";
    first->reset();
    first->update(reinterpret_cast<const std::uint8_t*>(data.data()), 1);
    // Interleaved use of a second instance must not disturb the first
    EXPECT_EQ(to_hex(hash_bytes(*second, "b")), "3e23e8160039594a33894f6564e1b1348bbd7a0088d42c4acb73eeaed59c009d");
    first->update(reinterpret_cast<const std::uint8_t*>(data.data()) + 1, 2);
    EXPECT_EQ(to_hex(first->finalize()), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashTest, ToHexIsLowercaseAndFixedWidth) {
    Digest digest{};
    digest[0] = 0x0A;
    digest[31] = 0xFF;
    std::string hex = to_hex(digest);
    ASSERT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "0a");
    EXPECT_EQ(hex.substr(62, 2), "ff");
    EXPECT_EQ(hex.substr(2, 60), std::string(60, '0'));
}

TEST_F(HashTest, CalculateSHA256) {
    std::string path = create_dummy_file("test.txt", "hello world");
    // echo -n "hello world" | sha256sum
    EXPECT_EQ(calculate_sha256(path), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(HashTest, CalculateSHA256LargerThanBuffer) {
    std::string path = create_dummy_file("big.txt", std::string(20000, 'x'));
    EvpHashFunction hasher;
    EXPECT_EQ(calculate_sha256(path), to_hex(hash_bytes(hasher, std::string(20000, 'x'))));
}

TEST_F(HashTest, CalculateSHA256MissingFile) {
    EXPECT_THROW(calculate_sha256(suite_work_dir / "missing.txt"), FileAccessError);
    EXPECT_THROW(calculate_sha256(suite_work_dir), FileAccessError);
}

#pragma once

#include "digest.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

inline constexpr std::string_view DEFAULT_HASH_ALGORITHM = "sha256";

// Streaming hash primitive used by the leaf hasher and the tree reducer.
// finalize() ends the current message; call reset() before the next one.
class HashFunction {
public:
    virtual ~HashFunction() = default;

    virtual void reset() = 0;
    virtual void update(const std::uint8_t* data, std::size_t len) = 0;
    virtual Digest finalize() = 0;
    virtual std::string name() const = 0;
};

// OpenSSL EVP backed implementation. The algorithm is resolved by name
// and must produce a DIGEST_SIZE digest.
// Throws HashAlgorithmUnavailable if that is not possible.
class EvpHashFunction : public HashFunction {
public:
    explicit EvpHashFunction(const std::string& algorithm = std::string(DEFAULT_HASH_ALGORITHM));
    ~EvpHashFunction() override;

    EvpHashFunction(const EvpHashFunction&) = delete;
    EvpHashFunction& operator=(const EvpHashFunction&) = delete;

    void reset() override;
    void update(const std::uint8_t* data, std::size_t len) override;
    Digest finalize() override;
    std::string name() const override { return algorithm_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string algorithm_;
};

using HashFunctionFactory = std::function<std::unique_ptr<HashFunction>()>;

// Checks the algorithm once, then hands out fresh EvpHashFunction instances.
HashFunctionFactory make_hash_function_factory(const std::string& algorithm);

// Digest of one complete message, computed from a reset state.
Digest hash_bytes(HashFunction& hasher, const std::uint8_t* data, std::size_t len);
Digest hash_bytes(HashFunction& hasher, std::string_view data);

// Digest of left's bytes followed by right's bytes.
Digest hash_pair(HashFunction& hasher, const Digest& left, const Digest& right);

// Calculates the flat SHA256 hash of a file, as lowercase hex.
// Throws FileAccessError if the file cannot be opened or read.
std::string calculate_sha256(const fs::path& file_path);

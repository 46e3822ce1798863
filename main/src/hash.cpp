#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <memory>

namespace {

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

const EVP_MD* resolve_digest(const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (!md) {
        throw HashAlgorithmUnavailable(string_format("error.hash_unknown_algorithm", algorithm.c_str()));
    }
    if (EVP_MD_size(md) != static_cast<int>(DIGEST_SIZE)) {
        throw HashAlgorithmUnavailable(string_format("error.hash_wrong_size", algorithm.c_str(),
                                                     EVP_MD_size(md), static_cast<int>(DIGEST_SIZE)));
    }
    return md;
}

} // namespace

struct EvpHashFunction::Impl {
    const EVP_MD* md = nullptr;
    EvpMdCtxPtr ctx;
};

EvpHashFunction::EvpHashFunction(const std::string& algorithm)
    : impl_(std::make_unique<Impl>()), algorithm_(algorithm) {
    impl_->md = resolve_digest(algorithm);
    impl_->ctx.reset(EVP_MD_CTX_new());
    if (!impl_->ctx) {
        throw HashAlgorithmUnavailable(get_string("error.openssl_ctx_failed"));
    }
    reset();
}

EvpHashFunction::~EvpHashFunction() = default;

void EvpHashFunction::reset() {
    if (EVP_DigestInit_ex(impl_->ctx.get(), impl_->md, nullptr) != 1) {
        throw HashAlgorithmUnavailable(get_string("error.openssl_init_failed"));
    }
}

void EvpHashFunction::update(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        throw TreesumException(get_string("error.openssl_update_failed"));
    }
}

Digest EvpHashFunction::finalize() {
    Digest digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &digest_len) != 1 || digest_len != DIGEST_SIZE) {
        throw TreesumException(get_string("error.openssl_final_failed"));
    }
    return digest;
}

HashFunctionFactory make_hash_function_factory(const std::string& algorithm) {
    resolve_digest(algorithm);
    return [algorithm]() -> std::unique_ptr<HashFunction> {
        return std::make_unique<EvpHashFunction>(algorithm);
    };
}

Digest hash_bytes(HashFunction& hasher, const std::uint8_t* data, std::size_t len) {
    hasher.reset();
    hasher.update(data, len);
    return hasher.finalize();
}

Digest hash_bytes(HashFunction& hasher, std::string_view data) {
    return hash_bytes(hasher, reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

Digest hash_pair(HashFunction& hasher, const Digest& left, const Digest& right) {
    hasher.reset();
    hasher.update(left.data(), left.size());
    hasher.update(right.data(), right.size());
    return hasher.finalize();
}

std::string calculate_sha256(const fs::path& file_path) {
    std::error_code ec;
    if (fs::is_directory(file_path, ec)) {
        throw FileAccessError(string_format("error.read_file_failed", file_path.c_str(), "Is a directory"));
    }
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw FileAccessError(string_format("error.open_file_failed", file_path.c_str()));
    }

    EvpHashFunction hasher("sha256");

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer))) {
        hasher.update(reinterpret_cast<const std::uint8_t*>(buffer), static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw FileAccessError(string_format("error.read_file_failed", file_path.c_str(), "I/O error"));
    }
    if (file.gcount() > 0) { // Handle the last chunk
        hasher.update(reinterpret_cast<const std::uint8_t*>(buffer), static_cast<std::size_t>(file.gcount()));
    }

    return to_hex(hasher.finalize());
}

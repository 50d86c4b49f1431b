#pragma once

#include "cxfer/core/result.hpp"

#include <cstddef>
#include <memory>
#include <string>

struct evp_md_ctx_st;

namespace cxfer::transfer {

/**
 * @brief 64-bit FNV-1a digest as 16 lowercase hex characters
 */
std::string fnv1a_hex(const std::string& text);

/**
 * @brief Incremental MD5 over OpenSSL EVP
 *
 * Matches the digest the device prints for `show file <path> md5sum`.
 */
class Md5Digest {
public:
    Md5Digest();
    ~Md5Digest();

    Md5Digest(const Md5Digest&) = delete;
    Md5Digest& operator=(const Md5Digest&) = delete;

    Result<void> update(const char* data, std::size_t size);

    /// Finalizes the digest, further updates are rejected
    Result<std::string> finish();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool finished_ = false;
};

} // namespace cxfer::transfer

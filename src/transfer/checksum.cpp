#include "cxfer/transfer/checksum.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <iomanip>
#include <sstream>

namespace cxfer::transfer {

std::string fnv1a_hex(const std::string& text) {
    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    for (char c : text) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
        hash *= prime;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

void Md5Digest::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Md5Digest::Md5Digest() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        ctx_.reset();
    }
}

Md5Digest::~Md5Digest() = default;

Result<void> Md5Digest::update(const char* data, std::size_t size) {
    if (!ctx_ || finished_) {
        return Err<void>(Error::io("MD5 context unavailable"));
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        return Err<void>(Error::io("MD5 update failed"));
    }
    return Ok();
}

Result<std::string> Md5Digest::finish() {
    if (!ctx_ || finished_) {
        return Err<std::string>(Error::io("MD5 context unavailable"));
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        return Err<std::string>(Error::io("MD5 finalization failed"));
    }
    finished_ = true;

    std::ostringstream hex;
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return Ok(hex.str());
}

} // namespace cxfer::transfer

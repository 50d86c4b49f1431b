#pragma once

#include "cxfer/core/cancellation.hpp"
#include "cxfer/core/config.hpp"
#include "cxfer/remote/session.hpp"
#include "cxfer/transfer/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace cxfer::transfer {

struct VerifierOptions {
    std::string listing_command = "dir {path}";
    std::string probe_command = "show file {path} | head";
    std::string checksum_command = "show file {path} md5sum";
    int attempts = 3;
    Millis settle_delay{std::chrono::seconds(3)};   ///< Before the first listing
    Millis delay{std::chrono::seconds(5)};          ///< Between listings
    bool accept_read_probe = true;
    bool verify_checksum = false;
};

struct VerificationResult {
    bool verified = false;
    VerificationMethod method = VerificationMethod::None;
    std::uint32_t listing_attempts = 0;
    std::optional<std::uint64_t> remote_size;
    std::optional<Error> error;
};

/**
 * @brief Confirms that an uploaded chunk is present on the device
 *
 * OUTCOMES:
 * - listed size equals the expected length: verified by Size, or by Checksum
 *   when MD5 verification is on and the remote digest matches
 * - listed size differs: SizeMismatch, returned without further listings
 * - file not listed yet: NotFoundYet, listed again after `delay`
 * - listing without a readable size: read-probe fallback when allowed
 */
class Verifier {
public:
    Verifier(remote::RemoteSession& session, VerifierOptions options,
             const CancellationToken* cancel = nullptr);

    VerificationResult verify(const std::string& remote_path,
                              std::uint64_t expected_length,
                              const std::string& expected_md5 = {});

private:
    bool wait(Millis duration) const;
    bool read_probe(const std::string& remote_path);
    VerificationResult confirm_checksum(const std::string& remote_path,
                                        const std::string& expected_md5,
                                        VerificationResult sized);

    remote::RemoteSession& session_;
    VerifierOptions options_;
    const CancellationToken* cancel_;
};

} // namespace cxfer::transfer

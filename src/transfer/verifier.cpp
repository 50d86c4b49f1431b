#include "cxfer/transfer/verifier.hpp"

#include "cxfer/remote/listing.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>
#include <thread>

namespace cxfer::transfer {

Verifier::Verifier(remote::RemoteSession& session, VerifierOptions options,
                   const CancellationToken* cancel)
    : session_(session),
      options_(std::move(options)),
      cancel_(cancel) {}

bool Verifier::wait(Millis duration) const {
    if (cancel_ != nullptr) {
        return cancel_->sleep_for(duration);
    }
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
    return true;
}

VerificationResult Verifier::verify(const std::string& remote_path,
                                    std::uint64_t expected_length,
                                    const std::string& expected_md5) {
    VerificationResult result;
    const auto file_name = remote::split_remote_path(remote_path).second;
    const int attempts = std::max(1, options_.attempts);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (!wait(attempt == 1 ? options_.settle_delay : options_.delay)) {
            result.error = Error::cancelled("verification of " + remote_path + " cancelled");
            return result;
        }

        result.listing_attempts = static_cast<std::uint32_t>(attempt);
        auto output = session_.command(render_command(options_.listing_command, remote_path));
        if (output.is_error()) {
            result.error = output.error();
            if (output.error().fatal()) {
                return result;
            }
            spdlog::warn("Verification listing {}/{} for {} failed: {}",
                         attempt, attempts, file_name, output.error().describe());
            continue;
        }

        const auto listing = remote::parse_file_listing(output.value(), file_name);
        switch (listing.kind) {
            case remote::FileListing::Kind::Found:
                result.remote_size = listing.size;
                if (*listing.size != expected_length) {
                    result.error = Error::verification(ErrorDetail::SizeMismatch,
                        file_name + " is " + std::to_string(*listing.size) + " bytes on the device, expected " +
                        std::to_string(expected_length));
                    return result;
                }
                result.verified = true;
                result.method = VerificationMethod::Size;
                result.error.reset();
                if (options_.verify_checksum && !expected_md5.empty()) {
                    return confirm_checksum(remote_path, expected_md5, std::move(result));
                }
                return result;

            case remote::FileListing::Kind::Missing:
                result.error = Error::verification(ErrorDetail::NotFoundYet,
                                                   file_name + " not listed on the device yet");
                spdlog::info("Verification {}/{}: {} not found yet", attempt, attempts, file_name);
                break;

            case remote::FileListing::Kind::Unparsable:
                if (options_.accept_read_probe && read_probe(remote_path)) {
                    spdlog::warn("Size of {} could not be read, accepted because the file is readable", file_name);
                    result.verified = true;
                    result.method = VerificationMethod::ReadProbe;
                    result.error.reset();
                    return result;
                }
                result.error = Error::verification(ErrorDetail::Unparsable,
                                                   "listing for " + file_name + " has no readable size");
                spdlog::info("Verification {}/{}: size of {} not readable", attempt, attempts, file_name);
                break;
        }
    }

    spdlog::error("Verification of {} failed after {} listings", file_name, result.listing_attempts);
    return result;
}

bool Verifier::read_probe(const std::string& remote_path) {
    auto output = session_.command(render_command(options_.probe_command, remote_path));
    if (output.is_error()) {
        spdlog::debug("Read probe of {} failed: {}", remote_path, output.error().describe());
        return false;
    }
    // Only the first line can be a CLI banner, the rest is file content
    std::istringstream lines(output.value());
    std::string line;
    while (std::getline(lines, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            return !remote::is_error_banner(line);
        }
    }
    return false;
}

VerificationResult Verifier::confirm_checksum(const std::string& remote_path,
                                              const std::string& expected_md5,
                                              VerificationResult sized) {
    auto output = session_.command(render_command(options_.checksum_command, remote_path));
    if (output.is_error()) {
        spdlog::warn("Checksum of {} unavailable ({}), keeping size verification",
                     remote_path, output.error().describe());
        return sized;
    }

    const auto remote_md5 = remote::parse_md5(output.value());
    if (!remote_md5) {
        spdlog::warn("Could not parse MD5 of {} from device output, keeping size verification", remote_path);
        return sized;
    }
    if (*remote_md5 != expected_md5) {
        sized.verified = false;
        sized.method = VerificationMethod::None;
        sized.error = Error::verification(ErrorDetail::ChecksumMismatch,
            "MD5 of " + remote_path + " is " + *remote_md5 + ", expected " + expected_md5);
        return sized;
    }
    sized.method = VerificationMethod::Checksum;
    return sized;
}

} // namespace cxfer::transfer

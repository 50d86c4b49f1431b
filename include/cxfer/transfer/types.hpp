#pragma once

#include "cxfer/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cxfer::transfer {

enum class ChunkStatus {
    Pending,
    Uploading,
    Verifying,
    Verified,
    FailedRetryable,
    FailedTerminal
};

/**
 * @brief How strongly a verified chunk was confirmed on the device
 */
enum class VerificationMethod {
    None,
    Checksum,   ///< Remote MD5 matched the staged bytes
    Size,       ///< Listing reported the expected byte count
    ReadProbe   ///< File readable but size unknown, weaker evidence
};

enum class JobState {
    Planned,
    Running,
    Completed,
    Failed,
    Aborted
};

/**
 * @brief One contiguous byte range of the source file
 */
struct Chunk {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::filesystem::path staging_path;   ///< Empty until staged
    std::string remote_path;
    ChunkStatus status = ChunkStatus::Pending;
    std::uint32_t attempts = 0;           ///< Upload attempts
    std::uint32_t verify_listings = 0;    ///< Listing commands issued by the verifier
    VerificationMethod verified_by = VerificationMethod::None;
    std::string md5;                      ///< Set when checksum verification is enabled
    std::optional<Error> last_error;
    bool resumed = false;                 ///< Verified by an earlier run
};

/**
 * @brief Remote free space versus what the job needs
 */
struct SpaceReport {
    std::optional<std::uint64_t> free_bytes;   ///< nullopt when the listing had no figure
    std::uint64_t required_bytes = 0;
    double margin = 1.0;
    bool warning = false;

    [[nodiscard]] std::uint64_t budget() const noexcept {
        return static_cast<std::uint64_t>(static_cast<double>(required_bytes) * margin);
    }
    [[nodiscard]] bool free_known() const noexcept { return free_bytes.has_value(); }
    [[nodiscard]] bool sufficient() const noexcept {
        return !free_bytes.has_value() || budget() <= *free_bytes;
    }
};

struct ChunkOutcome {
    std::uint32_t index = 0;
    std::string remote_path;
    std::uint64_t length = 0;
    ChunkStatus status = ChunkStatus::Pending;
    std::uint32_t attempts = 0;
    std::uint32_t verify_listings = 0;
    VerificationMethod verified_by = VerificationMethod::None;
    bool resumed = false;
    std::string error;
};

/**
 * @brief Final report of a job, always lists every chunk
 */
struct JobSummary {
    std::string job_id;
    std::string source;
    std::string remote_target;
    JobState state = JobState::Planned;
    std::uint64_t source_size = 0;
    std::uint64_t verified_bytes = 0;
    std::size_t verified_count = 0;
    std::size_t failed_count = 0;
    std::size_t pending_count = 0;
    std::vector<ChunkOutcome> chunks;
    std::vector<std::uint32_t> missing_chunks;   ///< Never reached or pending
    std::vector<std::uint32_t> bad_chunks;       ///< Terminally failed
    std::vector<std::uint32_t> weakly_verified;  ///< Accepted by read-probe only
    std::optional<SpaceReport> space;
    std::string error;
    bool reassembly_required = false;
    std::vector<std::string> reassembly_guidance;
    std::chrono::milliseconds duration{0};
};

const char* to_string(ChunkStatus status) noexcept;
const char* to_string(VerificationMethod method) noexcept;
const char* to_string(JobState state) noexcept;

std::optional<ChunkStatus> chunk_status_from_string(const std::string& text);
std::optional<VerificationMethod> verification_method_from_string(const std::string& text);

} // namespace cxfer::transfer

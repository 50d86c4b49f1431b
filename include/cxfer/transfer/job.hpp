#pragma once

#include "cxfer/core/result.hpp"
#include "cxfer/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cxfer::transfer {

/**
 * @brief Deterministic identity of a transfer
 *
 * Same source, size, chunk size and target give the same id, which is what
 * lets a rerun find its ledger.
 */
std::string make_job_id(const std::string& absolute_source,
                        std::uint64_t source_size,
                        std::uint64_t chunk_size,
                        const std::string& remote_target);

/**
 * @brief One file moving to one remote target
 *
 * STATE MACHINE:
 * Planned -> Running -> Completed | Failed | Aborted
 * Planned may also go straight to Failed or Aborted (pre-flight failure,
 * cancellation before the first chunk). Terminal states accept no transition.
 */
class TransferJob {
public:
    TransferJob(std::string job_id,
                std::filesystem::path source,
                std::uint64_t source_size,
                std::string remote_target,
                std::uint64_t chunk_size,
                std::vector<Chunk> manifest);

    [[nodiscard]] const std::string& id() const noexcept { return job_id_; }
    [[nodiscard]] const std::filesystem::path& source() const noexcept { return source_; }
    [[nodiscard]] std::uint64_t source_size() const noexcept { return source_size_; }
    [[nodiscard]] const std::string& remote_target() const noexcept { return remote_target_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] JobState state() const noexcept { return state_; }
    [[nodiscard]] const std::optional<Error>& last_error() const noexcept { return last_error_; }

    [[nodiscard]] std::vector<Chunk>& chunks() noexcept { return manifest_; }
    [[nodiscard]] const std::vector<Chunk>& chunks() const noexcept { return manifest_; }

    [[nodiscard]] std::chrono::system_clock::time_point created_at() const noexcept { return created_at_; }
    [[nodiscard]] std::chrono::system_clock::time_point updated_at() const noexcept { return updated_at_; }

    Result<void> start();
    Result<void> transition_to(JobState next_state);
    Result<void> mark_failed(Error error);
    Result<void> abort(Error reason);

    /// Bytes of every chunk that is not Verified yet
    [[nodiscard]] std::uint64_t remaining_bytes() const noexcept;
    [[nodiscard]] std::size_t verified_count() const noexcept;
    [[nodiscard]] bool all_verified() const noexcept;

    void touch();

private:
    [[nodiscard]] bool can_transition(JobState target) const noexcept;

    std::string job_id_;
    std::filesystem::path source_;
    std::uint64_t source_size_ = 0;
    std::string remote_target_;
    std::uint64_t chunk_size_ = 0;
    std::vector<Chunk> manifest_;

    JobState state_ = JobState::Planned;
    std::optional<Error> last_error_;
    std::chrono::system_clock::time_point created_at_{};
    std::chrono::system_clock::time_point updated_at_{};
};

} // namespace cxfer::transfer

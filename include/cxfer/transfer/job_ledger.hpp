#pragma once

#include "cxfer/core/result.hpp"
#include "cxfer/transfer/job.hpp"
#include "cxfer/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace cxfer::transfer {

struct LedgerRecord {
    std::uint32_t index = 0;
    ChunkStatus status = ChunkStatus::Pending;
    std::uint32_t attempts = 0;
    std::uint32_t verify_listings = 0;
    VerificationMethod verified_by = VerificationMethod::None;
    std::string remote_path;
    std::uint64_t length = 0;
    std::string error;
    std::string timestamp;
};

/**
 * @brief Append-only per-chunk status log of one job
 *
 * FILE FORMAT:
 * `<ledger_dir>/<job_id>.ledger.jsonl`, one JSON object per line. The last
 * line for a chunk index wins.
 *
 * FAILURE POLICY:
 * An I/O failure is reported once as a Ledger error and persistence is then
 * switched off; the job keeps its state in memory only.
 */
class JobLedger {
public:
    JobLedger(std::filesystem::path directory, std::string job_id);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool persistent() const;

    /**
     * @brief Read the ledger, keeping only records that fit `manifest`
     *
     * Malformed lines and records whose length or remote path differ from
     * the current plan are skipped. A missing file is an empty ledger.
     */
    Result<std::map<std::uint32_t, LedgerRecord>> load(const std::vector<Chunk>& manifest);

    /**
     * @brief Mark chunks recorded as Verified as done
     *
     * RETURNS: number of chunks restored
     */
    Result<std::size_t> restore(TransferJob& job);

    Result<void> record(const Chunk& chunk);

    JobSummary summarize(const TransferJob& job,
                         const std::optional<SpaceReport>& space,
                         std::chrono::milliseconds duration) const;

private:
    Result<void> disable(std::string reason);

    std::filesystem::path directory_;
    std::string job_id_;
    std::filesystem::path path_;

    mutable std::mutex mutex_;
    bool persistent_ = true;
};

} // namespace cxfer::transfer

#pragma once

#include "cxfer/core/cancellation.hpp"
#include "cxfer/core/config.hpp"
#include "cxfer/core/result.hpp"
#include "cxfer/events/event_bus.hpp"
#include "cxfer/remote/session.hpp"
#include "cxfer/transfer/job.hpp"
#include "cxfer/transfer/job_ledger.hpp"
#include "cxfer/transfer/types.hpp"

#include <filesystem>
#include <string>

namespace cxfer::transfer {

/**
 * @brief Turn an operator-supplied target into a full remote file path
 *
 * An empty target means `<default_filesystem><source name>`; a target ending
 * in ':' or '/' gets the source file name appended.
 */
std::string resolve_remote_target(const std::string& target,
                                  const std::filesystem::path& source,
                                  const std::string& default_filesystem);

/**
 * @brief Runs one chunked transfer job end to end
 *
 * FLOW:
 * connect -> identify device -> restore ledger -> space gate -> keepalive on
 * -> worker -> keepalive off -> summary
 *
 * Every exit path leaves the job in a terminal state and emits exactly one
 * TransferFinishedEvent carrying the summary.
 */
class TransferService {
public:
    TransferService(TransferConfig config, remote::RemoteSession& session, events::EventBus& bus);

    /// Plan a job for `source`; does not touch the network
    Result<TransferJob> prepare(const std::filesystem::path& source, const std::string& remote_target) const;

    JobSummary run(TransferJob& job, const CancellationToken& cancel);

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

private:
    JobSummary finish(TransferJob& job, const JobLedger& ledger,
                      const std::optional<SpaceReport>& space,
                      std::chrono::steady_clock::time_point started);
    void settle(TransferJob& job, const Error& error);

    TransferConfig config_;
    remote::RemoteSession& session_;
    events::EventBus& bus_;
};

} // namespace cxfer::transfer

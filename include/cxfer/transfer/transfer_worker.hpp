#pragma once

#include "cxfer/core/cancellation.hpp"
#include "cxfer/core/config.hpp"
#include "cxfer/core/result.hpp"
#include "cxfer/events/event_bus.hpp"
#include "cxfer/remote/session.hpp"
#include "cxfer/transfer/job.hpp"
#include "cxfer/transfer/job_ledger.hpp"
#include "cxfer/transfer/verifier.hpp"

#include <filesystem>
#include <string>

namespace cxfer::transfer {

/**
 * @brief Drains a job's manifest one chunk at a time
 *
 * PER CHUNK:
 * 1. stage the byte range into the staging directory
 * 2. push it over the bulk channel
 * 3. verify it on the device
 * 4. record the outcome in the ledger
 *
 * A failed attempt deletes the remote artifact, refreshes both channels and
 * waits retry_backoff * attempt before the next one. After max_retries + 1
 * attempts the chunk is FailedTerminal, which ends the run unless partial
 * success is enabled. Authentication failures end the run immediately.
 *
 * The worker only touches chunk state; job state belongs to the caller.
 */
class TransferWorker {
public:
    TransferWorker(const TransferConfig& config,
                   remote::RemoteSession& session,
                   JobLedger& ledger,
                   events::EventBus& bus,
                   const CancellationToken& cancel);

    /**
     * @brief Process every chunk that is not Verified yet
     *
     * RETURNS:
     * Ok when every chunk is verified. Otherwise the first terminal chunk
     * error, a fatal connection error, or Cancelled.
     */
    Result<void> run(TransferJob& job);

private:
    Result<void> process_chunk(TransferJob& job, Chunk& chunk);
    Result<void> attempt(TransferJob& job, Chunk& chunk);
    Result<void> stage(const TransferJob& job, Chunk& chunk);
    Result<void> refresh(const TransferJob& job, const std::string& reason);
    Result<void> recheck_space(const Chunk& chunk);

    void fail_terminal(TransferJob& job, Chunk& chunk, const Error& error);
    void discard_staging(Chunk& chunk);
    void remove_remote(const Chunk& chunk);
    void record(const Chunk& chunk);

    const TransferConfig& config_;
    remote::RemoteSession& session_;
    JobLedger& ledger_;
    events::EventBus& bus_;
    const CancellationToken& cancel_;
    Verifier verifier_;
};

VerifierOptions verifier_options(const TransferConfig& config);

} // namespace cxfer::transfer

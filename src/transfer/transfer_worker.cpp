#include "cxfer/transfer/transfer_worker.hpp"

#include "cxfer/events/events.hpp"
#include "cxfer/remote/listing.hpp"
#include "cxfer/transfer/checksum.hpp"
#include "cxfer/transfer/space_guard.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>

namespace cxfer::transfer {
namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kStagingBlock = 1024 * 1024;

} // namespace

VerifierOptions verifier_options(const TransferConfig& config) {
    VerifierOptions options;
    options.listing_command = config.commands.listing;
    options.probe_command = config.commands.probe;
    options.checksum_command = config.commands.checksum;
    options.attempts = config.verify_attempts;
    options.settle_delay = config.settle_delay;
    options.delay = config.verify_delay;
    options.accept_read_probe = config.accept_read_probe;
    options.verify_checksum = config.verify_checksum;
    return options;
}

TransferWorker::TransferWorker(const TransferConfig& config,
                               remote::RemoteSession& session,
                               JobLedger& ledger,
                               events::EventBus& bus,
                               const CancellationToken& cancel)
    : config_(config),
      session_(session),
      ledger_(ledger),
      bus_(bus),
      cancel_(cancel),
      verifier_(session, verifier_options(config), &cancel) {}

Result<void> TransferWorker::run(TransferJob& job) {
    std::optional<Error> first_failure;
    int since_refresh = 0;

    for (auto& chunk : job.chunks()) {
        if (chunk.status == ChunkStatus::Verified) {
            continue;
        }
        if (cancel_.cancelled()) {
            return Err<void>(Error::cancelled("cancelled before chunk " + std::to_string(chunk.index)));
        }

        if (config_.refresh_every_chunks > 0 && since_refresh >= config_.refresh_every_chunks) {
            since_refresh = 0;
            if (auto refreshed = refresh(job, "periodic"); refreshed.is_error() && refreshed.error().fatal()) {
                return refreshed;
            }
        }

        if (config_.recheck_space) {
            if (auto space = recheck_space(chunk); space.is_error()) {
                return space;
            }
        }

        auto processed = process_chunk(job, chunk);
        ++since_refresh;
        if (processed.is_ok()) {
            continue;
        }

        const auto& error = processed.error();
        if (error.kind == ErrorKind::Cancelled || error.detail == ErrorDetail::AuthFailed) {
            return processed;
        }
        if (!config_.partial_success) {
            return processed;
        }
        spdlog::warn("Continuing past chunk {} in partial-success mode", chunk.index);
        if (!first_failure) {
            first_failure = error;
        }
    }

    if (first_failure) {
        return Err<void>(*first_failure);
    }
    return Ok();
}

Result<void> TransferWorker::process_chunk(TransferJob& job, Chunk& chunk) {
    if (auto staged = stage(job, chunk); staged.is_error()) {
        fail_terminal(job, chunk, staged.error());
        return staged;
    }

    const auto max_attempts = static_cast<std::uint32_t>(config_.max_retries) + 1;
    chunk.attempts = 0;

    while (true) {
        if (cancel_.cancelled()) {
            discard_staging(chunk);
            chunk.status = ChunkStatus::Pending;
            return Err<void>(Error::cancelled("cancelled during chunk " + std::to_string(chunk.index)));
        }

        ++chunk.attempts;
        chunk.status = ChunkStatus::Uploading;
        job.touch();
        bus_.emit(events::ChunkUploadStartedEvent{
            job.id(), chunk.index, static_cast<std::uint32_t>(job.chunks().size()),
            chunk.attempts, chunk.length, chunk.remote_path});

        auto outcome = attempt(job, chunk);
        if (outcome.is_ok()) {
            chunk.status = ChunkStatus::Verified;
            chunk.last_error.reset();
            discard_staging(chunk);
            record(chunk);
            bus_.emit(events::ChunkVerifiedEvent{
                job.id(), chunk.index, static_cast<std::uint32_t>(job.chunks().size()), chunk.length,
                chunk.attempts, chunk.verify_listings, chunk.verified_by});
            return Ok();
        }

        const Error error = outcome.error();
        chunk.last_error = error;

        if (error.kind == ErrorKind::Cancelled) {
            discard_staging(chunk);
            chunk.status = ChunkStatus::Pending;
            return outcome;
        }
        if (error.fatal() || chunk.attempts >= max_attempts) {
            fail_terminal(job, chunk, error);
            return outcome;
        }

        chunk.status = ChunkStatus::FailedRetryable;
        const auto wait = config_.retry_backoff * static_cast<int>(chunk.attempts);
        record(chunk);
        bus_.emit(events::ChunkFailedEvent{job.id(), chunk.index, chunk.attempts, error, false, wait});

        remove_remote(chunk);
        if (auto refreshed = refresh(job, "retry"); refreshed.is_error() && refreshed.error().fatal()) {
            fail_terminal(job, chunk, refreshed.error());
            return refreshed;
        }

        if (!cancel_.sleep_for(wait)) {
            discard_staging(chunk);
            chunk.status = ChunkStatus::Pending;
            return Err<void>(Error::cancelled("cancelled during retry backoff of chunk " + std::to_string(chunk.index)));
        }
        chunk.status = ChunkStatus::Pending;
    }
}

Result<void> TransferWorker::attempt(TransferJob& job, Chunk& chunk) {
    if (auto bulk = session_.ensure_bulk_channel(); bulk.is_error()) {
        return bulk;
    }

    unsigned last_step = 0;
    auto progress = [&](std::uint64_t sent, std::uint64_t total) {
        if (total == 0) {
            return;
        }
        const auto step = static_cast<unsigned>(sent * 10 / total);
        if (step > last_step) {
            last_step = step;
            bus_.emit(events::ChunkProgressEvent{job.id(), chunk.index, sent, total, step * 10});
        }
    };

    const auto started = Clock::now();
    auto uploaded = session_.upload(chunk.staging_path, chunk.remote_path, chunk.length,
                                    config_.chunk_timeout, progress);
    if (uploaded.is_error()) {
        return uploaded;
    }
    bus_.emit(events::ChunkUploadedEvent{
        job.id(), chunk.index, chunk.length,
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started)});

    chunk.status = ChunkStatus::Verifying;
    auto verified = verifier_.verify(chunk.remote_path, chunk.length, chunk.md5);
    chunk.verify_listings += verified.listing_attempts;
    if (!verified.verified) {
        return Err<void>(verified.error.value_or(
            Error::verification(ErrorDetail::Unparsable, "verification of " + chunk.remote_path + " failed")));
    }
    chunk.verified_by = verified.method;
    return Ok();
}

Result<void> TransferWorker::stage(const TransferJob& job, Chunk& chunk) {
    std::error_code ec;
    fs::create_directories(config_.staging_dir, ec);
    if (ec) {
        return Err<void>(Error::io("Cannot create staging directory " + config_.staging_dir.string() + ": " + ec.message()));
    }

    const auto file_name = remote::split_remote_path(chunk.remote_path).second;
    chunk.staging_path = config_.staging_dir / file_name;

    std::ifstream input(job.source(), std::ios::binary);
    if (!input) {
        return Err<void>(Error::io("Failed to open source file: " + job.source().string()));
    }
    input.seekg(static_cast<std::streamoff>(chunk.offset));

    std::ofstream output(chunk.staging_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(Error::io("Failed to create staging file: " + chunk.staging_path.string()));
    }

    std::optional<Md5Digest> digest;
    if (config_.verify_checksum) {
        digest.emplace();
    }

    std::vector<char> buffer(kStagingBlock);
    std::uint64_t remaining = chunk.length;
    while (remaining > 0) {
        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), remaining));
        input.read(buffer.data(), want);
        const auto got = input.gcount();
        if (got <= 0) {
            return Err<void>(Error::io("Source file ended early while staging chunk " + std::to_string(chunk.index)));
        }
        output.write(buffer.data(), got);
        if (!output) {
            return Err<void>(Error::io("Failed to write staging file: " + chunk.staging_path.string()));
        }
        if (digest) {
            if (auto updated = digest->update(buffer.data(), static_cast<std::size_t>(got)); updated.is_error()) {
                return updated;
            }
        }
        remaining -= static_cast<std::uint64_t>(got);
    }
    output.close();
    if (!output) {
        return Err<void>(Error::io("Failed to flush staging file: " + chunk.staging_path.string()));
    }

    if (digest) {
        auto md5 = digest->finish();
        if (md5.is_error()) {
            return Err<void>(md5.error());
        }
        chunk.md5 = md5.value();
    }

    spdlog::debug("Staged chunk {} ({} bytes at offset {}) to {}",
                  chunk.index, chunk.length, chunk.offset, chunk.staging_path.string());
    return Ok();
}

Result<void> TransferWorker::refresh(const TransferJob& job, const std::string& reason) {
    auto refreshed = session_.refresh(config_.commands.keepalive);
    bus_.emit(events::SessionRefreshedEvent{job.id(), reason, refreshed.is_ok()});
    return refreshed;
}

Result<void> TransferWorker::recheck_space(const Chunk& chunk) {
    SpaceGuard guard(session_, SpaceGuardOptions{config_.remote_filesystem, config_.commands.listing, config_.space_margin});
    auto report = guard.check(chunk.length);
    if (report.is_error()) {
        return Err<void>(report.error());
    }
    if (report.value().warning && !config_.allow_unknown_space) {
        return Err<void>(Error::space("Free space unknown before chunk " + std::to_string(chunk.index)));
    }
    return Ok();
}

void TransferWorker::fail_terminal(TransferJob& job, Chunk& chunk, const Error& error) {
    chunk.status = ChunkStatus::FailedTerminal;
    chunk.last_error = error;
    job.touch();
    record(chunk);
    bus_.emit(events::ChunkFailedEvent{job.id(), chunk.index, chunk.attempts, error, true, Millis{0}});
    if (error.kind == ErrorKind::Upload || error.kind == ErrorKind::Verification) {
        remove_remote(chunk);
    }
    discard_staging(chunk);
}

void TransferWorker::discard_staging(Chunk& chunk) {
    if (chunk.staging_path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(chunk.staging_path, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging file {}: {}", chunk.staging_path.string(), ec.message());
    }
    chunk.staging_path.clear();
}

void TransferWorker::remove_remote(const Chunk& chunk) {
    auto removed = session_.command(render_command(config_.commands.remove, chunk.remote_path));
    if (removed.is_error()) {
        spdlog::warn("Cleanup of {} failed: {}", chunk.remote_path, removed.error().describe());
        return;
    }
    if (remote::reports_error(removed.value())) {
        spdlog::debug("Cleanup of {}: {}", chunk.remote_path, removed.value());
    }
}

void TransferWorker::record(const Chunk& chunk) {
    if (auto recorded = ledger_.record(chunk); recorded.is_error()) {
        spdlog::warn("Ledger update for chunk {} failed: {}", chunk.index, recorded.error().describe());
    }
}

} // namespace cxfer::transfer

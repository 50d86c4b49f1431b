#include "cxfer/transfer/service.hpp"

#include "cxfer/events/events.hpp"
#include "cxfer/remote/listing.hpp"
#include "cxfer/transfer/chunk_planner.hpp"
#include "cxfer/transfer/job_ledger.hpp"
#include "cxfer/transfer/space_guard.hpp"
#include "cxfer/transfer/transfer_worker.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace cxfer::transfer {
namespace fs = std::filesystem;

namespace {

// Keepalive runs exactly as long as the worker
class KeepaliveScope {
public:
    KeepaliveScope(remote::RemoteSession& session, const TransferConfig& config)
        : session_(session) {
        session_.start_keepalive(config.commands.keepalive, config.keepalive_interval);
    }
    ~KeepaliveScope() { session_.stop_keepalive(); }

    KeepaliveScope(const KeepaliveScope&) = delete;
    KeepaliveScope& operator=(const KeepaliveScope&) = delete;

private:
    remote::RemoteSession& session_;
};

} // namespace

std::string resolve_remote_target(const std::string& target,
                                  const fs::path& source,
                                  const std::string& default_filesystem) {
    const auto name = source.filename().string();
    if (target.empty()) {
        return remote::join_remote_path(default_filesystem, name);
    }
    const char last = target.back();
    if (last == ':' || last == '/') {
        return target + name;
    }
    return target;
}

TransferService::TransferService(TransferConfig config, remote::RemoteSession& session, events::EventBus& bus)
    : config_(std::move(config)),
      session_(session),
      bus_(bus) {}

Result<TransferJob> TransferService::prepare(const fs::path& source, const std::string& remote_target) const {
    if (auto valid = config_.validate(); valid.is_error()) {
        return Err<TransferJob>(valid.error());
    }

    std::error_code ec;
    const auto absolute = fs::absolute(source, ec);
    if (ec) {
        return Err<TransferJob>(Error::usage("Cannot resolve " + source.string() + ": " + ec.message()));
    }
    if (!fs::is_regular_file(absolute, ec)) {
        return Err<TransferJob>(Error::usage("Local file not found: " + absolute.string()));
    }
    const auto size = fs::file_size(absolute, ec);
    if (ec) {
        return Err<TransferJob>(Error::io("Cannot read size of " + absolute.string() + ": " + ec.message()));
    }

    const auto target = resolve_remote_target(remote_target, absolute, config_.remote_filesystem);
    auto manifest = plan(size, config_.chunk_size);
    if (manifest.is_error()) {
        return Err<TransferJob>(manifest.error());
    }

    const auto job_id = make_job_id(absolute.string(), size, config_.chunk_size, target);
    auto directory = remote::split_remote_path(target).first;
    if (directory.empty()) {
        directory = config_.remote_filesystem;
    }
    assign_remote_paths(manifest.value(), directory, absolute.stem().string(), job_id);

    spdlog::info("Planned job {}: {} ({} bytes) -> {} in {} chunk(s) of {} bytes",
                 job_id, absolute.string(), size, target, manifest.value().size(), config_.chunk_size);
    return Ok(TransferJob(job_id, absolute, size, target, config_.chunk_size, std::move(manifest.value())));
}

JobSummary TransferService::run(TransferJob& job, const CancellationToken& cancel) {
    const auto started = std::chrono::steady_clock::now();
    std::optional<SpaceReport> space;
    JobLedger ledger(config_.ledger_dir, job.id());

    if (auto connected = session_.connect(); connected.is_error()) {
        settle(job, connected.error());
        return finish(job, ledger, space, started);
    }

    auto identity = session_.identify(config_.commands.version);
    if (identity.is_error()) {
        spdlog::warn("Could not identify device: {}", identity.error().describe());
    } else if (identity.value()) {
        spdlog::info("Connected to device {}", *identity.value());
    } else {
        spdlog::warn("Device did not report a name in '{}'", config_.commands.version);
    }

    auto restored = ledger.restore(job);
    if (restored.is_error()) {
        spdlog::warn("Starting without resume data: {}", restored.error().describe());
    }
    const auto resumed = restored.is_ok() ? restored.value() : std::size_t{0};

    if (cancel.cancelled()) {
        settle(job, Error::cancelled("cancelled before transfer start"));
        return finish(job, ledger, space, started);
    }

    if (!job.all_verified()) {
        SpaceGuard guard(session_, SpaceGuardOptions{config_.remote_filesystem, config_.commands.listing,
                                                     config_.space_margin});
        auto report = guard.check(job.remaining_bytes());
        if (report.is_error()) {
            spdlog::error("Space check failed: {}", report.error().describe());
            settle(job, report.error());
            return finish(job, ledger, space, started);
        }
        space = report.value();
        bus_.emit(events::SpaceCheckedEvent{job.id(), *space});
        if (space->warning) {
            if (!config_.allow_unknown_space) {
                settle(job, Error::space("Free space on " + config_.remote_filesystem +
                                         " is unknown and unknown space is not allowed"));
                return finish(job, ledger, space, started);
            }
            spdlog::warn("Proceeding without a confirmed free-space figure");
        }
    }

    if (auto running = job.start(); running.is_error()) {
        spdlog::error("Cannot start job {}: {}", job.id(), running.error().describe());
        return finish(job, ledger, space, started);
    }
    bus_.emit(events::TransferStartedEvent{
        job.id(), job.source().string(), job.remote_target(), job.source_size(),
        static_cast<std::uint32_t>(job.chunks().size()), static_cast<std::uint32_t>(resumed)});

    Result<void> outcome = Ok();
    {
        KeepaliveScope keepalive(session_, config_);
        TransferWorker worker(config_, session_, ledger, bus_, cancel);
        outcome = worker.run(job);
    }

    if (outcome.is_error()) {
        settle(job, outcome.error());
    } else if (auto completed = job.transition_to(JobState::Completed); completed.is_error()) {
        spdlog::error("Job {}: {}", job.id(), completed.error().describe());
    }
    return finish(job, ledger, space, started);
}

void TransferService::settle(TransferJob& job, const Error& error) {
    auto settled = error.kind == ErrorKind::Cancelled ? job.abort(error) : job.mark_failed(error);
    if (settled.is_error()) {
        spdlog::error("Job {}: {}", job.id(), settled.error().describe());
    }
}

JobSummary TransferService::finish(TransferJob& job, const JobLedger& ledger,
                                   const std::optional<SpaceReport>& space,
                                   std::chrono::steady_clock::time_point started) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto summary = ledger.summarize(job, space, elapsed);
    bus_.emit(events::TransferFinishedEvent{summary});
    return summary;
}

} // namespace cxfer::transfer

/**
 * @file components.hpp
 * @brief Observers of transfer events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every event emitted by the transfer service is logged and counted
 */

#pragma once

#include "cxfer/events/event_bus.hpp"
#include "cxfer/events/events.hpp"
#include "cxfer/transfer/summary.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace cxfer::events {

namespace detail {
inline double mib(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}
} // namespace detail

/**
 * @brief Logs every transfer event through spdlog
 *
 * Progress lines go to debug level, one line per 10 % of a chunk would
 * otherwise flood multi-hour transfers.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) { on_started(e); });
        bus_.subscribe<SpaceCheckedEvent>([this](const SpaceCheckedEvent& e) { on_space_checked(e); });
        bus_.subscribe<ChunkUploadStartedEvent>([this](const ChunkUploadStartedEvent& e) { on_upload_started(e); });
        bus_.subscribe<ChunkProgressEvent>([this](const ChunkProgressEvent& e) { on_progress(e); });
        bus_.subscribe<ChunkUploadedEvent>([this](const ChunkUploadedEvent& e) { on_uploaded(e); });
        bus_.subscribe<ChunkVerifiedEvent>([this](const ChunkVerifiedEvent& e) { on_verified(e); });
        bus_.subscribe<ChunkFailedEvent>([this](const ChunkFailedEvent& e) { on_failed(e); });
        bus_.subscribe<SessionRefreshedEvent>([this](const SessionRefreshedEvent& e) { on_refreshed(e); });
        bus_.subscribe<TransferFinishedEvent>([this](const TransferFinishedEvent& e) { on_finished(e); });
    }

private:
    void on_started(const TransferStartedEvent& e) {
        spdlog::info("[TransferStarted] job={} source={} target={} size={:.2f}MiB chunks={} resumed={}",
                     e.job_id, e.source, e.remote_target, detail::mib(e.total_bytes),
                     e.chunk_count, e.resumed_chunks);
    }

    void on_space_checked(const SpaceCheckedEvent& e) {
        if (e.report.free_known()) {
            spdlog::info("[SpaceChecked] job={} need={:.2f}MiB (x{:.2f}) free={:.2f}MiB",
                         e.job_id, detail::mib(e.report.required_bytes), e.report.margin,
                         detail::mib(*e.report.free_bytes));
        } else {
            spdlog::warn("[SpaceChecked] job={} need={:.2f}MiB free=unknown",
                         e.job_id, detail::mib(e.report.required_bytes));
        }
    }

    void on_upload_started(const ChunkUploadStartedEvent& e) {
        spdlog::info("[ChunkUpload] job={} chunk={}/{} attempt={} bytes={} remote={}",
                     e.job_id, e.chunk_index + 1, e.total_chunks, e.attempt, e.bytes, e.remote_path);
    }

    void on_progress(const ChunkProgressEvent& e) {
        spdlog::debug("[ChunkProgress] job={} chunk={} {}% ({:.1f}/{:.1f}MiB)",
                      e.job_id, e.chunk_index + 1, e.percent,
                      detail::mib(e.bytes_sent), detail::mib(e.bytes_total));
    }

    void on_uploaded(const ChunkUploadedEvent& e) {
        const double seconds = static_cast<double>(e.duration.count()) / 1000.0;
        const double rate = seconds > 0 ? detail::mib(e.bytes) / seconds : 0.0;
        spdlog::info("[ChunkUploaded] job={} chunk={} in {:.1f}s ({:.1f}MiB/s)",
                     e.job_id, e.chunk_index + 1, seconds, rate);
    }

    void on_verified(const ChunkVerifiedEvent& e) {
        if (e.method == transfer::VerificationMethod::ReadProbe) {
            spdlog::warn("[ChunkVerified] job={} chunk={}/{} accepted by read-probe only (size not confirmed)",
                         e.job_id, e.chunk_index + 1, e.total_chunks);
            return;
        }
        spdlog::info("[ChunkVerified] job={} chunk={}/{} method={} attempts={} listings={}",
                     e.job_id, e.chunk_index + 1, e.total_chunks, transfer::to_string(e.method),
                     e.attempts, e.verify_listings);
    }

    void on_failed(const ChunkFailedEvent& e) {
        if (e.terminal) {
            spdlog::error("[ChunkFailed] job={} chunk={} attempt={} giving up: {}",
                          e.job_id, e.chunk_index + 1, e.attempt, e.error.describe());
        } else {
            spdlog::warn("[ChunkFailed] job={} chunk={} attempt={} retry in {}ms: {}",
                         e.job_id, e.chunk_index + 1, e.attempt, e.retry_in.count(), e.error.describe());
        }
    }

    void on_refreshed(const SessionRefreshedEvent& e) {
        if (e.ok) {
            spdlog::info("[SessionRefreshed] job={} reason={}", e.job_id, e.reason);
        } else {
            spdlog::warn("[SessionRefreshed] job={} reason={} refresh failed", e.job_id, e.reason);
        }
    }

    void on_finished(const TransferFinishedEvent& e) {
        const bool ok = e.summary.state == transfer::JobState::Completed;
        for (const auto& line : transfer::format_summary(e.summary)) {
            if (ok) {
                spdlog::info("{}", line);
            } else {
                spdlog::error("{}", line);
            }
        }
    }

    EventBus& bus_;
};

/**
 * @brief Counts transfer outcomes for the end-of-run report
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> upload_attempts{0};
        std::atomic<uint64_t> chunks_uploaded{0};
        std::atomic<uint64_t> chunks_verified{0};
        std::atomic<uint64_t> weak_verifications{0};
        std::atomic<uint64_t> bytes_verified{0};
        std::atomic<uint64_t> retries{0};
        std::atomic<uint64_t> terminal_failures{0};
        std::atomic<uint64_t> session_refreshes{0};
        std::atomic<uint64_t> jobs_completed{0};
        std::atomic<uint64_t> jobs_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkUploadStartedEvent>([this](const ChunkUploadStartedEvent&) {
            stats_.upload_attempts++;
        });
        bus_.subscribe<ChunkUploadedEvent>([this](const ChunkUploadedEvent&) {
            stats_.chunks_uploaded++;
        });
        bus_.subscribe<ChunkVerifiedEvent>([this](const ChunkVerifiedEvent& e) {
            stats_.chunks_verified++;
            stats_.bytes_verified += e.bytes;
            if (e.method == transfer::VerificationMethod::ReadProbe) {
                stats_.weak_verifications++;
            }
        });
        bus_.subscribe<ChunkFailedEvent>([this](const ChunkFailedEvent& e) {
            if (e.terminal) {
                stats_.terminal_failures++;
            } else {
                stats_.retries++;
            }
        });
        bus_.subscribe<SessionRefreshedEvent>([this](const SessionRefreshedEvent&) {
            stats_.session_refreshes++;
        });
        bus_.subscribe<TransferFinishedEvent>([this](const TransferFinishedEvent& e) {
            if (e.summary.state == transfer::JobState::Completed) {
                stats_.jobs_completed++;
            } else {
                stats_.jobs_failed++;
            }
        });
    }

    const Stats& get_stats() const { return stats_; }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace cxfer::events

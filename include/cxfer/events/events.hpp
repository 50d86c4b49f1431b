/**
 * @file events.hpp
 * @brief Events emitted while a chunked transfer job runs
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: ChunkUploadedEvent, TransferFinishedEvent.
 * Every event carries the job id so observers can follow several jobs.
 */

#pragma once

#include "cxfer/core/error.hpp"
#include "cxfer/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace cxfer::events {

/**
 * @brief Job passed its pre-flight checks and starts draining the manifest
 *
 * WHO EMITS: TransferService
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct TransferStartedEvent {
    std::string job_id;
    std::string source;
    std::string remote_target;
    std::uint64_t total_bytes = 0;
    std::uint32_t chunk_count = 0;
    std::uint32_t resumed_chunks = 0;
};

/**
 * @brief Result of the remote free-space check
 */
struct SpaceCheckedEvent {
    std::string job_id;
    transfer::SpaceReport report;
};

struct ChunkUploadStartedEvent {
    std::string job_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t attempt = 0;
    std::uint64_t bytes = 0;
    std::string remote_path;
};

/**
 * @brief Upload progress, emitted at every 10 % step of a chunk
 */
struct ChunkProgressEvent {
    std::string job_id;
    std::uint32_t chunk_index = 0;
    std::uint64_t bytes_sent = 0;
    std::uint64_t bytes_total = 0;
    unsigned percent = 0;
};

struct ChunkUploadedEvent {
    std::string job_id;
    std::uint32_t chunk_index = 0;
    std::uint64_t bytes = 0;
    std::chrono::milliseconds duration{0};
};

struct ChunkVerifiedEvent {
    std::string job_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
    std::uint32_t verify_listings = 0;
    transfer::VerificationMethod method = transfer::VerificationMethod::None;
};

/**
 * @brief A chunk attempt failed
 *
 * terminal == false means the worker will retry after backoff.
 */
struct ChunkFailedEvent {
    std::string job_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t attempt = 0;
    Error error;
    bool terminal = false;
    std::chrono::milliseconds retry_in{0};
};

/**
 * @brief Both channels were rebuilt (periodic or after a failure)
 */
struct SessionRefreshedEvent {
    std::string job_id;
    std::string reason;
    bool ok = true;
};

/**
 * @brief Job reached a terminal state, summary included
 *
 * WHO EMITS: TransferService
 * WHO SUBSCRIBES: Logger (prints the chunk table and reassembly guidance)
 */
struct TransferFinishedEvent {
    transfer::JobSummary summary;
};

} // namespace cxfer::events

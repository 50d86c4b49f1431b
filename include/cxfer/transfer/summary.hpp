#pragma once

#include "cxfer/transfer/job.hpp"
#include "cxfer/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cxfer::transfer {

/**
 * @brief Snapshot of a job as a JobSummary
 *
 * Missing chunks are those never verified nor terminally failed, bad chunks
 * are the terminal failures.
 */
JobSummary build_summary(const TransferJob& job,
                         const std::optional<SpaceReport>& space,
                         std::chrono::milliseconds duration);

/**
 * @brief Operator instructions for turning chunk artifacts into the target file
 *
 * A one-chunk job gets a single copy command. Multi-chunk jobs list every
 * artifact in order; concatenation is left to the operator.
 */
std::vector<std::string> reassembly_guidance(const TransferJob& job);

/// Human-readable report, one string per log line
std::vector<std::string> format_summary(const JobSummary& summary);

nlohmann::json to_json(const JobSummary& summary);

} // namespace cxfer::transfer

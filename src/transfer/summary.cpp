#include "cxfer/transfer/summary.hpp"

#include "cxfer/remote/listing.hpp"

#include <spdlog/fmt/fmt.h>

namespace cxfer::transfer {
namespace {

double to_mib(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

std::string join_indices(const std::vector<std::uint32_t>& indices) {
    std::string text;
    for (const auto index : indices) {
        if (!text.empty()) {
            text += ", ";
        }
        text += std::to_string(index);
    }
    return text;
}

} // namespace

JobSummary build_summary(const TransferJob& job,
                         const std::optional<SpaceReport>& space,
                         std::chrono::milliseconds duration) {
    JobSummary summary;
    summary.job_id = job.id();
    summary.source = job.source().string();
    summary.remote_target = job.remote_target();
    summary.state = job.state();
    summary.source_size = job.source_size();
    summary.space = space;
    summary.duration = duration;
    if (job.last_error()) {
        summary.error = job.last_error()->describe();
    }

    for (const auto& chunk : job.chunks()) {
        ChunkOutcome outcome;
        outcome.index = chunk.index;
        outcome.remote_path = chunk.remote_path;
        outcome.length = chunk.length;
        outcome.status = chunk.status;
        outcome.attempts = chunk.attempts;
        outcome.verify_listings = chunk.verify_listings;
        outcome.verified_by = chunk.verified_by;
        outcome.resumed = chunk.resumed;
        if (chunk.last_error && chunk.status != ChunkStatus::Verified) {
            outcome.error = chunk.last_error->describe();
        }

        switch (chunk.status) {
            case ChunkStatus::Verified:
                ++summary.verified_count;
                summary.verified_bytes += chunk.length;
                if (chunk.verified_by == VerificationMethod::ReadProbe) {
                    summary.weakly_verified.push_back(chunk.index);
                }
                break;
            case ChunkStatus::FailedTerminal:
                ++summary.failed_count;
                summary.bad_chunks.push_back(chunk.index);
                break;
            default:
                ++summary.pending_count;
                summary.missing_chunks.push_back(chunk.index);
                break;
        }
        summary.chunks.push_back(std::move(outcome));
    }

    if (job.state() == JobState::Completed) {
        summary.reassembly_required = job.chunks().size() > 1;
        summary.reassembly_guidance = reassembly_guidance(job);
    }
    return summary;
}

std::vector<std::string> reassembly_guidance(const TransferJob& job) {
    std::vector<std::string> lines;
    const auto& chunks = job.chunks();
    if (chunks.empty()) {
        return lines;
    }

    if (chunks.size() == 1) {
        lines.push_back(fmt::format("To place the file: copy {} {}", chunks.front().remote_path, job.remote_target()));
        return lines;
    }

    lines.push_back(fmt::format("Reassembly required: {} chunks make up {}", chunks.size(), job.remote_target()));
    lines.push_back("The device CLI may not provide a file concatenation command, reassembly is a manual step:");
    lines.push_back(fmt::format("  1. copy {} {} (first {} bytes only)",
                                chunks.front().remote_path, job.remote_target(), chunks.front().length));
    lines.push_back("  2. append the remaining chunks in index order with an external tool, or copy them to a "
                    "host that can concatenate them and push the result");
    lines.push_back("Chunk artifacts in order:");
    for (const auto& chunk : chunks) {
        lines.push_back(fmt::format("  [{:03}] {} ({} bytes)", chunk.index, chunk.remote_path, chunk.length));
    }
    return lines;
}

std::vector<std::string> format_summary(const JobSummary& summary) {
    std::vector<std::string> lines;
    lines.push_back(fmt::format("[TransferFinished] job={} state={} verified={}/{} ({:.1f}/{:.1f}MiB) in {:.1f}s",
                                summary.job_id, to_string(summary.state), summary.verified_count,
                                summary.chunks.size(), to_mib(summary.verified_bytes),
                                to_mib(summary.source_size),
                                static_cast<double>(summary.duration.count()) / 1000.0));
    if (!summary.error.empty()) {
        lines.push_back("  error: " + summary.error);
    }

    for (const auto& chunk : summary.chunks) {
        std::string line = fmt::format("  chunk {:03} {:<16} attempts={} listings={} {}",
                                       chunk.index, to_string(chunk.status), chunk.attempts,
                                       chunk.verify_listings, chunk.remote_path);
        if (chunk.status == ChunkStatus::Verified) {
            line += fmt::format(" [{}{}]", to_string(chunk.verified_by), chunk.resumed ? ", resumed" : "");
        } else if (!chunk.error.empty()) {
            line += " (" + chunk.error + ")";
        }
        lines.push_back(std::move(line));
    }

    if (!summary.missing_chunks.empty()) {
        lines.push_back("  missing chunks: " + join_indices(summary.missing_chunks));
    }
    if (!summary.bad_chunks.empty()) {
        lines.push_back("  bad chunks: " + join_indices(summary.bad_chunks));
    }
    if (!summary.weakly_verified.empty()) {
        lines.push_back("  verified by read-probe only (size unconfirmed): " + join_indices(summary.weakly_verified));
    }
    for (const auto& guidance : summary.reassembly_guidance) {
        lines.push_back(guidance);
    }
    return lines;
}

nlohmann::json to_json(const JobSummary& summary) {
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto& chunk : summary.chunks) {
        chunks.push_back({
            {"index", chunk.index},
            {"remote_path", chunk.remote_path},
            {"length", chunk.length},
            {"status", to_string(chunk.status)},
            {"attempts", chunk.attempts},
            {"verify_listings", chunk.verify_listings},
            {"verified_by", to_string(chunk.verified_by)},
            {"resumed", chunk.resumed},
            {"error", chunk.error},
        });
    }

    nlohmann::json json = {
        {"job_id", summary.job_id},
        {"source", summary.source},
        {"remote_target", summary.remote_target},
        {"state", to_string(summary.state)},
        {"source_size", summary.source_size},
        {"verified_bytes", summary.verified_bytes},
        {"verified_count", summary.verified_count},
        {"failed_count", summary.failed_count},
        {"pending_count", summary.pending_count},
        {"missing_chunks", summary.missing_chunks},
        {"bad_chunks", summary.bad_chunks},
        {"weakly_verified", summary.weakly_verified},
        {"error", summary.error},
        {"reassembly_required", summary.reassembly_required},
        {"reassembly_guidance", summary.reassembly_guidance},
        {"duration_ms", summary.duration.count()},
        {"chunks", std::move(chunks)},
    };

    if (summary.space) {
        json["space"] = {
            {"free_bytes", summary.space->free_bytes ? nlohmann::json(*summary.space->free_bytes) : nlohmann::json()},
            {"required_bytes", summary.space->required_bytes},
            {"margin", summary.space->margin},
            {"budget", summary.space->budget()},
            {"warning", summary.space->warning},
        };
    }
    return json;
}

} // namespace cxfer::transfer

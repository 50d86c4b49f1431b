#include "cxfer/transfer/job.hpp"

#include "cxfer/transfer/checksum.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_map>

namespace cxfer::transfer {
namespace {

bool is_progressive(JobState current, JobState target) {
    static const std::unordered_map<JobState, std::vector<JobState>> transitions {
        {JobState::Planned, {JobState::Running, JobState::Failed, JobState::Aborted}},
        {JobState::Running, {JobState::Completed, JobState::Failed, JobState::Aborted}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

std::string make_job_id(const std::string& absolute_source,
                        std::uint64_t source_size,
                        std::uint64_t chunk_size,
                        const std::string& remote_target) {
    const std::string key = absolute_source + '\n' + std::to_string(source_size) + '\n' +
                            std::to_string(chunk_size) + '\n' + remote_target;
    return fnv1a_hex(key);
}

TransferJob::TransferJob(std::string job_id,
                         std::filesystem::path source,
                         std::uint64_t source_size,
                         std::string remote_target,
                         std::uint64_t chunk_size,
                         std::vector<Chunk> manifest)
    : job_id_(std::move(job_id)),
      source_(std::move(source)),
      source_size_(source_size),
      remote_target_(std::move(remote_target)),
      chunk_size_(chunk_size),
      manifest_(std::move(manifest)) {
    created_at_ = std::chrono::system_clock::now();
    updated_at_ = created_at_;
}

Result<void> TransferJob::start() {
    if (state_ != JobState::Planned) {
        return Err<void>(Error::usage(std::string("Job ") + job_id_ + " already " + to_string(state_)));
    }
    return transition_to(JobState::Running);
}

Result<void> TransferJob::transition_to(JobState next_state) {
    if (state_ == next_state) {
        return Ok();
    }
    if (!can_transition(next_state)) {
        return Err<void>(Error::usage(std::string("Illegal job state transition ") +
                                      to_string(state_) + " -> " + to_string(next_state)));
    }
    state_ = next_state;
    touch();
    if (next_state == JobState::Running || next_state == JobState::Completed) {
        last_error_.reset();
    }
    return Ok();
}

Result<void> TransferJob::mark_failed(Error error) {
    if (!can_transition(JobState::Failed)) {
        return Err<void>(Error::usage(std::string("Cannot fail a job that is ") + to_string(state_)));
    }
    last_error_ = std::move(error);
    return transition_to(JobState::Failed);
}

Result<void> TransferJob::abort(Error reason) {
    if (!can_transition(JobState::Aborted)) {
        return Err<void>(Error::usage(std::string("Cannot abort a job that is ") + to_string(state_)));
    }
    last_error_ = std::move(reason);
    return transition_to(JobState::Aborted);
}

std::uint64_t TransferJob::remaining_bytes() const noexcept {
    return std::accumulate(manifest_.begin(), manifest_.end(), std::uint64_t{0},
        [](std::uint64_t total, const Chunk& chunk) {
            return chunk.status == ChunkStatus::Verified ? total : total + chunk.length;
        });
}

std::size_t TransferJob::verified_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(manifest_.begin(), manifest_.end(),
        [](const Chunk& chunk) { return chunk.status == ChunkStatus::Verified; }));
}

bool TransferJob::all_verified() const noexcept {
    return verified_count() == manifest_.size();
}

void TransferJob::touch() {
    updated_at_ = std::chrono::system_clock::now();
}

bool TransferJob::can_transition(JobState target) const noexcept {
    if (state_ == target) {
        return true;
    }
    if (state_ == JobState::Completed || state_ == JobState::Failed || state_ == JobState::Aborted) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace cxfer::transfer

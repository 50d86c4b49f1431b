#include "cxfer/transfer/types.hpp"

#include <array>
#include <utility>

namespace cxfer::transfer {
namespace {

constexpr std::array<std::pair<ChunkStatus, const char*>, 6> kChunkStatusNames{{
    {ChunkStatus::Pending, "pending"},
    {ChunkStatus::Uploading, "uploading"},
    {ChunkStatus::Verifying, "verifying"},
    {ChunkStatus::Verified, "verified"},
    {ChunkStatus::FailedRetryable, "failed-retryable"},
    {ChunkStatus::FailedTerminal, "failed-terminal"},
}};

constexpr std::array<std::pair<VerificationMethod, const char*>, 4> kMethodNames{{
    {VerificationMethod::None, "none"},
    {VerificationMethod::Checksum, "checksum"},
    {VerificationMethod::Size, "size"},
    {VerificationMethod::ReadProbe, "read-probe"},
}};

} // namespace

const char* to_string(ChunkStatus status) noexcept {
    for (const auto& [value, name] : kChunkStatusNames) {
        if (value == status) {
            return name;
        }
    }
    return "unknown";
}

const char* to_string(VerificationMethod method) noexcept {
    for (const auto& [value, name] : kMethodNames) {
        if (value == method) {
            return name;
        }
    }
    return "unknown";
}

const char* to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Planned: return "planned";
        case JobState::Running: return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Aborted: return "aborted";
    }
    return "unknown";
}

std::optional<ChunkStatus> chunk_status_from_string(const std::string& text) {
    for (const auto& [value, name] : kChunkStatusNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<VerificationMethod> verification_method_from_string(const std::string& text) {
    for (const auto& [value, name] : kMethodNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace cxfer::transfer

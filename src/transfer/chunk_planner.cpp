#include "cxfer/transfer/chunk_planner.hpp"

#include "cxfer/remote/listing.hpp"

#include <cstdio>
#include <limits>

namespace cxfer::transfer {
namespace {
constexpr std::size_t kJobIdPrefix = 8;
}

Result<std::vector<Chunk>> plan(std::uint64_t source_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        return Err<std::vector<Chunk>>(Error::usage("chunk size must be > 0"));
    }
    if (source_size == 0) {
        return Err<std::vector<Chunk>>(Error::usage("source file is empty"));
    }

    const std::uint64_t count = (source_size + chunk_size - 1) / chunk_size;
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return Err<std::vector<Chunk>>(Error::usage("chunk size too small for this file"));
    }

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        Chunk chunk;
        chunk.index = static_cast<std::uint32_t>(i);
        chunk.offset = i * chunk_size;
        chunk.length = (i + 1 == count) ? source_size - chunk_size * (count - 1) : chunk_size;
        chunks.push_back(std::move(chunk));
    }
    return Ok(std::move(chunks));
}

std::string chunk_file_name(const std::string& stem, const std::string& job_id, std::uint32_t index) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "_chunk_%03u.bin", static_cast<unsigned>(index));
    return stem + "_" + job_id.substr(0, kJobIdPrefix) + suffix;
}

void assign_remote_paths(std::vector<Chunk>& chunks,
                         const std::string& remote_directory,
                         const std::string& stem,
                         const std::string& job_id) {
    for (auto& chunk : chunks) {
        chunk.remote_path = remote::join_remote_path(remote_directory,
                                                     chunk_file_name(stem, job_id, chunk.index));
    }
}

} // namespace cxfer::transfer

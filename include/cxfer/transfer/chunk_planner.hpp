#pragma once

#include "cxfer/core/result.hpp"
#include "cxfer/transfer/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cxfer::transfer {

/**
 * @brief Split `source_size` bytes into contiguous chunks of `chunk_size`
 *
 * Every chunk but the last is exactly `chunk_size` long; lengths sum to the
 * source size. Zero sizes are usage errors.
 */
Result<std::vector<Chunk>> plan(std::uint64_t source_size, std::uint64_t chunk_size);

/// "<stem>_<first 8 chars of job id>_chunk_<NNN>.bin"
std::string chunk_file_name(const std::string& stem, const std::string& job_id, std::uint32_t index);

/**
 * @brief Give every chunk its remote path inside `remote_directory`
 */
void assign_remote_paths(std::vector<Chunk>& chunks,
                         const std::string& remote_directory,
                         const std::string& stem,
                         const std::string& job_id);

} // namespace cxfer::transfer

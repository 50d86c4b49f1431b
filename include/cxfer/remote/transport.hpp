#pragma once

#include "cxfer/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace cxfer::remote {

/// Called with (bytes_sent, bytes_total) while a file is pushed
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

/**
 * @brief The two channels a device management session offers
 *
 * A command channel runs CLI commands and returns their raw text. A bulk
 * channel pushes local files to remote paths. Implementations must allow each
 * channel to be closed and reopened without invalidating the other.
 *
 * THREAD SAFETY:
 * Callers serialize command-channel calls among themselves and bulk-channel
 * calls among themselves; a command call and a bulk call may overlap.
 *
 * ERRORS:
 * - open_*: Connection/AuthFailed (fatal), Connection/Timeout or
 *   Connection/Unreachable (retryable)
 * - execute: Connection/Timeout or Connection/ChannelLost
 * - push_file: Upload/Timeout, Upload/ChannelLost or Io for local problems
 */
class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    virtual Result<void> open_command_channel() = 0;
    virtual void close_command_channel() noexcept = 0;
    [[nodiscard]] virtual bool command_channel_open() const = 0;

    virtual Result<std::string> execute(const std::string& command,
                                        std::chrono::milliseconds timeout) = 0;

    virtual Result<void> open_bulk_channel() = 0;
    virtual void close_bulk_channel() noexcept = 0;
    [[nodiscard]] virtual bool bulk_channel_active() const = 0;

    virtual Result<void> push_file(const std::filesystem::path& local_file,
                                   const std::string& remote_path,
                                   std::uint64_t size,
                                   std::chrono::milliseconds timeout,
                                   const ProgressCallback& progress) = 0;

    /// Human-readable endpoint, used in log lines
    [[nodiscard]] virtual std::string endpoint() const = 0;
};

} // namespace cxfer::remote

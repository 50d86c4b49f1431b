#pragma once

#include "cxfer/core/cancellation.hpp"
#include "cxfer/core/result.hpp"
#include "cxfer/remote/keepalive.hpp"
#include "cxfer/remote/transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cxfer::remote {

enum class SessionHealth {
    Disconnected,
    Healthy,
    Stale,
    Reconnecting,
    Closed
};

const char* to_string(SessionHealth health) noexcept;

struct SessionSettings {
    int connect_attempts = 3;
    std::chrono::milliseconds connect_backoff{std::chrono::seconds(20)};  ///< Wait n*backoff after attempt n
    std::chrono::milliseconds command_timeout{std::chrono::seconds(90)};
};

/**
 * @brief Live connection pair to one device, owned by one job
 *
 * All command-channel traffic, including keepalive probes and the replacement
 * of the channel on reconnect, is serialized by one mutex so a probe never
 * interleaves with a verification listing. The bulk channel has its own mutex
 * and is only used by the transfer worker.
 */
class RemoteSession {
public:
    RemoteSession(std::unique_ptr<RemoteTransport> transport,
                  SessionSettings settings,
                  const CancellationToken* cancel = nullptr);
    ~RemoteSession();

    RemoteSession(const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

    /// Open the command channel with bounded, increasing backoff
    Result<void> connect();

    Result<std::string> command(const std::string& text);
    Result<std::string> command(const std::string& text, std::chrono::milliseconds timeout);

    /// Recreate the bulk channel when absent or inactive (close-before-replace)
    Result<void> ensure_bulk_channel();

    Result<void> upload(const std::filesystem::path& local_file,
                        const std::string& remote_path,
                        std::uint64_t size,
                        std::chrono::milliseconds timeout,
                        const ProgressCallback& progress);

    /**
     * @brief Force a fresh bulk channel and check the command channel
     *
     * The command channel is probed with `probe_command` and reopened only if
     * the probe fails.
     */
    Result<void> refresh(const std::string& probe_command);

    /// Run `version_command` and return the "Device name:" value if present
    Result<std::optional<std::string>> identify(const std::string& version_command);

    void start_keepalive(std::string probe_command, std::chrono::milliseconds interval);
    void stop_keepalive();

    /// Stops the keepalive, then tears down both channels
    void close();

    [[nodiscard]] SessionHealth health() const noexcept { return health_.load(); }
    [[nodiscard]] std::chrono::steady_clock::time_point last_activity() const;
    [[nodiscard]] std::string endpoint() const { return transport_->endpoint(); }
    [[nodiscard]] const KeepaliveMonitor* keepalive() const noexcept { return keepalive_.get(); }

private:
    Result<void> connect_locked();
    Result<std::string> execute_locked(const std::string& text, std::chrono::milliseconds timeout);
    Result<void> reopen_bulk_locked();
    Result<void> probe(const std::string& text);
    void touch();

    std::unique_ptr<RemoteTransport> transport_;
    SessionSettings settings_;
    const CancellationToken* cancel_;

    std::mutex command_mutex_;
    std::mutex bulk_mutex_;
    std::mutex keepalive_mutex_;

    std::atomic<SessionHealth> health_{SessionHealth::Disconnected};

    mutable std::mutex activity_mutex_;
    std::chrono::steady_clock::time_point last_activity_{};

    std::unique_ptr<KeepaliveMonitor> keepalive_;
};

} // namespace cxfer::remote

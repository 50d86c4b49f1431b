#include "cxfer/remote/session.hpp"

#include "cxfer/remote/listing.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace cxfer::remote {

const char* to_string(SessionHealth health) noexcept {
    switch (health) {
        case SessionHealth::Disconnected: return "disconnected";
        case SessionHealth::Healthy: return "healthy";
        case SessionHealth::Stale: return "stale";
        case SessionHealth::Reconnecting: return "reconnecting";
        case SessionHealth::Closed: return "closed";
    }
    return "unknown";
}

RemoteSession::RemoteSession(std::unique_ptr<RemoteTransport> transport,
                             SessionSettings settings,
                             const CancellationToken* cancel)
    : transport_(std::move(transport)),
      settings_(settings),
      cancel_(cancel) {}

RemoteSession::~RemoteSession() {
    close();
}

Result<void> RemoteSession::connect() {
    std::lock_guard lock(command_mutex_);
    if (health_ == SessionHealth::Healthy && transport_->command_channel_open()) {
        return Ok();
    }
    return connect_locked();
}

Result<void> RemoteSession::connect_locked() {
    if (health_ == SessionHealth::Closed) {
        return Err<void>(Error::connection(ErrorDetail::ChannelLost, "session already closed"));
    }

    const int attempts = std::max(1, settings_.connect_attempts);
    std::optional<Error> last_error;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        health_ = SessionHealth::Reconnecting;
        spdlog::info("Connecting to {} (attempt {}/{})", transport_->endpoint(), attempt, attempts);

        transport_->close_command_channel();
        auto opened = transport_->open_command_channel();
        if (opened.is_ok()) {
            health_ = SessionHealth::Healthy;
            touch();
            spdlog::info("Command channel to {} established", transport_->endpoint());
            return Ok();
        }

        last_error = opened.error();
        if (opened.error().fatal()) {
            health_ = SessionHealth::Disconnected;
            spdlog::error("Connection to {} failed permanently: {}",
                          transport_->endpoint(), opened.error().describe());
            return opened;
        }

        spdlog::warn("Connection attempt {}/{} to {} failed: {}",
                     attempt, attempts, transport_->endpoint(), opened.error().describe());
        if (attempt == attempts) {
            break;
        }

        const auto wait = settings_.connect_backoff * attempt;
        spdlog::info("Retrying connection in {}ms", wait.count());
        if (cancel_ != nullptr) {
            if (!cancel_->sleep_for(wait)) {
                health_ = SessionHealth::Disconnected;
                return Err<void>(Error::cancelled("connection attempts cancelled"));
            }
        } else {
            std::this_thread::sleep_for(wait);
        }
    }

    health_ = SessionHealth::Disconnected;
    return Err<void>(last_error.value_or(
        Error::connection(ErrorDetail::Unreachable, "no connection attempt succeeded")));
}

Result<std::string> RemoteSession::command(const std::string& text) {
    return command(text, settings_.command_timeout);
}

Result<std::string> RemoteSession::command(const std::string& text, std::chrono::milliseconds timeout) {
    std::lock_guard lock(command_mutex_);
    if (health_ == SessionHealth::Closed) {
        return Err<std::string>(Error::connection(ErrorDetail::ChannelLost, "session closed"));
    }
    if (health_ != SessionHealth::Healthy || !transport_->command_channel_open()) {
        spdlog::info("Command channel is {}, reconnecting on demand", to_string(health_.load()));
        if (auto reconnected = connect_locked(); reconnected.is_error()) {
            return Err<std::string>(reconnected.error());
        }
    }
    return execute_locked(text, timeout);
}

Result<std::string> RemoteSession::execute_locked(const std::string& text, std::chrono::milliseconds timeout) {
    spdlog::debug("Sending command: {}", text);
    auto output = transport_->execute(text, timeout);
    if (output.is_ok()) {
        touch();
        return output;
    }
    if (output.error().kind == ErrorKind::Connection) {
        health_ = SessionHealth::Stale;
    }
    spdlog::debug("Command '{}' failed: {}", text, output.error().describe());
    return output;
}

Result<void> RemoteSession::probe(const std::string& text) {
    std::lock_guard lock(command_mutex_);
    if (health_ == SessionHealth::Closed || !transport_->command_channel_open()) {
        return Err<void>(Error::connection(ErrorDetail::ChannelLost, "command channel not open"));
    }
    auto output = execute_locked(text, settings_.command_timeout);
    if (output.is_error()) {
        return Err<void>(output.error());
    }
    return Ok();
}

Result<void> RemoteSession::ensure_bulk_channel() {
    std::lock_guard lock(bulk_mutex_);
    if (health_ == SessionHealth::Closed) {
        return Err<void>(Error::connection(ErrorDetail::ChannelLost, "session closed"));
    }
    if (transport_->bulk_channel_active()) {
        return Ok();
    }
    return reopen_bulk_locked();
}

Result<void> RemoteSession::reopen_bulk_locked() {
    transport_->close_bulk_channel();
    auto opened = transport_->open_bulk_channel();
    if (opened.is_error()) {
        spdlog::error("Failed to establish bulk channel to {}: {}",
                      transport_->endpoint(), opened.error().describe());
        return opened;
    }
    spdlog::info("Bulk channel to {} established", transport_->endpoint());
    return Ok();
}

Result<void> RemoteSession::upload(const std::filesystem::path& local_file,
                                   const std::string& remote_path,
                                   std::uint64_t size,
                                   std::chrono::milliseconds timeout,
                                   const ProgressCallback& progress) {
    std::lock_guard lock(bulk_mutex_);
    if (health_ == SessionHealth::Closed) {
        return Err<void>(Error::connection(ErrorDetail::ChannelLost, "session closed"));
    }
    if (!transport_->bulk_channel_active()) {
        if (auto reopened = reopen_bulk_locked(); reopened.is_error()) {
            return reopened;
        }
    }
    auto pushed = transport_->push_file(local_file, remote_path, size, timeout, progress);
    if (pushed.is_ok()) {
        touch();
    }
    return pushed;
}

Result<void> RemoteSession::refresh(const std::string& probe_command) {
    {
        std::lock_guard lock(bulk_mutex_);
        if (health_ == SessionHealth::Closed) {
            return Err<void>(Error::connection(ErrorDetail::ChannelLost, "session closed"));
        }
        if (auto reopened = reopen_bulk_locked(); reopened.is_error()) {
            return reopened;
        }
    }

    std::lock_guard lock(command_mutex_);
    if (health_ == SessionHealth::Healthy && transport_->command_channel_open()) {
        auto probed = execute_locked(probe_command, settings_.command_timeout);
        if (probed.is_ok()) {
            spdlog::debug("Command channel is healthy");
            return Ok();
        }
        spdlog::warn("Command channel check failed: {}, reconnecting", probed.error().describe());
    }
    return connect_locked();
}

Result<std::optional<std::string>> RemoteSession::identify(const std::string& version_command) {
    auto output = command(version_command);
    if (output.is_error()) {
        return Err<std::optional<std::string>>(output.error());
    }
    return Ok(parse_device_name(output.value()));
}

void RemoteSession::start_keepalive(std::string probe_command, std::chrono::milliseconds interval) {
    std::lock_guard lock(keepalive_mutex_);
    if (keepalive_ && keepalive_->running()) {
        return;
    }
    keepalive_ = std::make_unique<KeepaliveMonitor>(
        [this, cmd = std::move(probe_command)]() { return probe(cmd); }, interval);
    keepalive_->start();
}

void RemoteSession::stop_keepalive() {
    std::lock_guard lock(keepalive_mutex_);
    if (keepalive_) {
        keepalive_->stop();
    }
}

void RemoteSession::close() {
    stop_keepalive();
    if (health_.exchange(SessionHealth::Closed) == SessionHealth::Closed) {
        return;
    }
    {
        std::lock_guard lock(command_mutex_);
        transport_->close_command_channel();
    }
    {
        std::lock_guard lock(bulk_mutex_);
        transport_->close_bulk_channel();
    }
    spdlog::debug("Session to {} closed", transport_->endpoint());
}

std::chrono::steady_clock::time_point RemoteSession::last_activity() const {
    std::lock_guard lock(activity_mutex_);
    return last_activity_;
}

void RemoteSession::touch() {
    std::lock_guard lock(activity_mutex_);
    last_activity_ = std::chrono::steady_clock::now();
}

} // namespace cxfer::remote

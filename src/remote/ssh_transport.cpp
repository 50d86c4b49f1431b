#include "cxfer/remote/ssh_transport.hpp"

#include "cxfer/remote/listing.hpp"

#include <libssh/libssh.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <vector>

namespace cxfer::remote {
namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kReadBufferSize = 16 * 1024;
constexpr std::size_t kWriteBufferSize = 64 * 1024;
constexpr int kReadSliceMs = 1000;

struct ChannelDeleter {
    void operator()(ssh_channel_struct* channel) const noexcept {
        if (ssh_channel_is_open(channel)) {
            ssh_channel_close(channel);
        }
        ssh_channel_free(channel);
    }
};
using ChannelPtr = std::unique_ptr<ssh_channel_struct, ChannelDeleter>;

struct ScpDeleter {
    void operator()(ssh_scp_struct* scp) const noexcept {
        ssh_scp_close(scp);
        ssh_scp_free(scp);
    }
};
using ScpPtr = std::unique_ptr<ssh_scp_struct, ScpDeleter>;

bool mentions_timeout(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("timeout") != std::string::npos || lower.find("timed out") != std::string::npos;
}

// TCP keepalive so a quiet management link is not dropped by middleboxes during long pushes
void enable_tcp_keepalive(ssh_session session) {
    const socket_t fd = ssh_get_fd(session);
    if (fd == SSH_INVALID_SOCKET) {
        return;
    }
    const int on = 1;
    const int idle = 30;
    const int interval = 15;
    const int count = 6;
    if (setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on)) != 0 ||
        setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) != 0 ||
        setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval)) != 0 ||
        setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count)) != 0) {
        spdlog::warn("Failed to enable TCP keepalive on SSH socket");
    }
}

} // namespace

void SshTransport::SessionDeleter::operator()(ssh_session_struct* session) const noexcept {
    if (ssh_is_connected(session)) {
        ssh_disconnect(session);
    }
    ssh_free(session);
}

SshTransport::SshTransport(EndpointConfig endpoint, std::chrono::milliseconds connect_timeout)
    : endpoint_(std::move(endpoint)),
      connect_timeout_(connect_timeout) {}

SshTransport::~SshTransport() {
    close_bulk_channel();
    close_command_channel();
}

std::string SshTransport::endpoint() const {
    std::string text;
    if (!endpoint_.username.empty()) {
        text = endpoint_.username + "@";
    }
    return text + endpoint_.host + ":" + std::to_string(endpoint_.port);
}

Result<SshTransport::SessionPtr> SshTransport::open_session(const char* purpose) const {
    SessionPtr session(ssh_new());
    if (!session) {
        return Err<SessionPtr>(Error::connection(ErrorDetail::Unreachable, "Failed to create SSH session"));
    }

    unsigned int port = endpoint_.port;
    long timeout_s = std::max<long>(1, static_cast<long>(
        std::chrono::duration_cast<std::chrono::seconds>(connect_timeout_).count()));
    ssh_options_set(session.get(), SSH_OPTIONS_HOST, endpoint_.host.c_str());
    ssh_options_set(session.get(), SSH_OPTIONS_PORT, &port);
    ssh_options_set(session.get(), SSH_OPTIONS_TIMEOUT, &timeout_s);
    if (!endpoint_.username.empty()) {
        ssh_options_set(session.get(), SSH_OPTIONS_USER, endpoint_.username.c_str());
    }

    if (ssh_connect(session.get()) != SSH_OK) {
        const std::string message = std::string("SSH connection failed: ") + ssh_get_error(session.get());
        const auto detail = mentions_timeout(message) ? ErrorDetail::Timeout : ErrorDetail::Unreachable;
        return Err<SessionPtr>(Error::connection(detail, message));
    }

    switch (ssh_session_is_known_server(session.get())) {
        case SSH_KNOWN_HOSTS_OK:
            break;
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            return Err<SessionPtr>(Error::auth_failed("Host key for " + endpoint_.host + " does not match known_hosts"));
        case SSH_KNOWN_HOSTS_NOT_FOUND:
        case SSH_KNOWN_HOSTS_UNKNOWN:
        case SSH_KNOWN_HOSTS_ERROR:
            if (endpoint_.strict_host_key) {
                return Err<SessionPtr>(Error::auth_failed("Host " + endpoint_.host + " is not in known_hosts"));
            }
            spdlog::warn("Host key for {} is not verified against known_hosts", endpoint_.host);
            break;
    }

    const int auth = endpoint_.password.empty()
        ? ssh_userauth_publickey_auto(session.get(), nullptr, nullptr)
        : ssh_userauth_password(session.get(), nullptr, endpoint_.password.c_str());
    if (auth == SSH_AUTH_ERROR) {
        return Err<SessionPtr>(Error::connection(ErrorDetail::ChannelLost,
            std::string("SSH authentication aborted: ") + ssh_get_error(session.get())));
    }
    if (auth != SSH_AUTH_SUCCESS) {
        return Err<SessionPtr>(Error::auth_failed("SSH authentication rejected for " + endpoint()));
    }

    enable_tcp_keepalive(session.get());
    spdlog::debug("SSH {} session to {} authenticated", purpose, endpoint());
    return Ok(std::move(session));
}

Result<void> SshTransport::open_command_channel() {
    auto session = open_session("command");
    if (session.is_error()) {
        return Err<void>(session.error());
    }
    command_ = std::move(session.value());
    return Ok();
}

void SshTransport::close_command_channel() noexcept {
    command_.reset();
}

bool SshTransport::command_channel_open() const {
    return command_ && ssh_is_connected(command_.get());
}

Result<std::string> SshTransport::execute(const std::string& command, std::chrono::milliseconds timeout) {
    if (!command_channel_open()) {
        return Err<std::string>(Error::connection(ErrorDetail::ChannelLost, "command session not connected"));
    }

    ChannelPtr channel(ssh_channel_new(command_.get()));
    if (!channel) {
        return Err<std::string>(Error::connection(ErrorDetail::ChannelLost, "Failed to allocate SSH channel"));
    }
    if (ssh_channel_open_session(channel.get()) != SSH_OK) {
        return Err<std::string>(Error::connection(ErrorDetail::ChannelLost,
            std::string("Failed to open SSH channel: ") + ssh_get_error(command_.get())));
    }
    if (ssh_channel_request_exec(channel.get(), command.c_str()) != SSH_OK) {
        return Err<std::string>(Error::connection(ErrorDetail::ChannelLost,
            std::string("Failed to execute '") + command + "': " + ssh_get_error(command_.get())));
    }

    const auto deadline = Clock::now() + timeout;
    std::array<char, kReadBufferSize> buffer{};
    std::string output;

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            return Err<std::string>(Error::connection(ErrorDetail::Timeout,
                "Command '" + command + "' timed out after " + std::to_string(timeout.count()) + "ms"));
        }
        const int slice = static_cast<int>(std::min<long long>(remaining.count(), kReadSliceMs));

        const int read = ssh_channel_read_timeout(channel.get(), buffer.data(),
                                                  static_cast<std::uint32_t>(buffer.size()), 0, slice);
        if (read == SSH_ERROR) {
            return Err<std::string>(Error::connection(ErrorDetail::ChannelLost,
                std::string("Read failed: ") + ssh_get_error(command_.get())));
        }
        if (read > 0) {
            output.append(buffer.data(), static_cast<std::size_t>(read));
            continue;
        }

        const int err_read = ssh_channel_read_nonblocking(channel.get(), buffer.data(),
                                                          static_cast<std::uint32_t>(buffer.size()), 1);
        if (err_read > 0) {
            output.append(buffer.data(), static_cast<std::size_t>(err_read));
            continue;
        }
        if (ssh_channel_is_eof(channel.get())) {
            break;
        }
    }

    return Ok(std::move(output));
}

Result<void> SshTransport::open_bulk_channel() {
    auto session = open_session("bulk");
    if (session.is_error()) {
        return Err<void>(session.error());
    }
    bulk_ = std::move(session.value());
    return Ok();
}

void SshTransport::close_bulk_channel() noexcept {
    bulk_.reset();
}

bool SshTransport::bulk_channel_active() const {
    return bulk_ && ssh_is_connected(bulk_.get());
}

Result<void> SshTransport::push_file(const std::filesystem::path& local_file,
                                     const std::string& remote_path,
                                     std::uint64_t size,
                                     std::chrono::milliseconds timeout,
                                     const ProgressCallback& progress) {
    if (!bulk_channel_active()) {
        return Err<void>(Error::upload(ErrorDetail::ChannelLost, "bulk session not connected"));
    }

    std::ifstream input(local_file, std::ios::binary);
    if (!input) {
        return Err<void>(Error::io("Failed to open staged chunk: " + local_file.string()));
    }

    auto [directory, file_name] = split_remote_path(remote_path);
    if (directory.empty()) {
        directory = ".";
    }

    ScpPtr scp(ssh_scp_new(bulk_.get(), SSH_SCP_WRITE, directory.c_str()));
    if (!scp) {
        return Err<void>(Error::upload(ErrorDetail::ChannelLost,
            std::string("Failed to allocate SCP session: ") + ssh_get_error(bulk_.get())));
    }
    if (ssh_scp_init(scp.get()) != SSH_OK) {
        return Err<void>(Error::upload(ErrorDetail::ChannelLost,
            std::string("Failed to start SCP: ") + ssh_get_error(bulk_.get())));
    }
    if (ssh_scp_push_file64(scp.get(), file_name.c_str(), size, 0644) != SSH_OK) {
        return Err<void>(Error::upload(ErrorDetail::ChannelLost,
            std::string("Remote refused ") + remote_path + ": " + ssh_get_error(bulk_.get())));
    }

    const auto deadline = Clock::now() + timeout;
    std::vector<char> buffer(kWriteBufferSize);
    std::uint64_t sent = 0;

    while (sent < size) {
        if (Clock::now() > deadline) {
            return Err<void>(Error::upload(ErrorDetail::Timeout,
                "Upload of " + remote_path + " exceeded " + std::to_string(timeout.count()) + "ms"));
        }
        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), size - sent));
        input.read(buffer.data(), want);
        const auto got = input.gcount();
        if (got <= 0) {
            return Err<void>(Error::io("Staged chunk shorter than expected: " + local_file.string()));
        }
        if (ssh_scp_write(scp.get(), buffer.data(), static_cast<std::size_t>(got)) != SSH_OK) {
            const std::string message = std::string("SCP write failed: ") + ssh_get_error(bulk_.get());
            const auto detail = mentions_timeout(message) ? ErrorDetail::Timeout : ErrorDetail::ChannelLost;
            return Err<void>(Error::upload(detail, message));
        }
        sent += static_cast<std::uint64_t>(got);
        if (progress) {
            progress(sent, size);
        }
    }

    return Ok();
}

} // namespace cxfer::remote

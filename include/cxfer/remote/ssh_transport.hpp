#pragma once

#include "cxfer/core/config.hpp"
#include "cxfer/remote/transport.hpp"

#include <chrono>
#include <memory>
#include <string>

struct ssh_session_struct;

namespace cxfer::remote {

/**
 * @brief RemoteTransport over libssh
 *
 * Two independent SSH sessions are kept: one for CLI commands (an exec
 * channel per command) and one for SCP pushes. Either can be torn down and
 * rebuilt without touching the other.
 */
class SshTransport final : public RemoteTransport {
public:
    SshTransport(EndpointConfig endpoint, std::chrono::milliseconds connect_timeout);
    ~SshTransport() override;

    SshTransport(const SshTransport&) = delete;
    SshTransport& operator=(const SshTransport&) = delete;

    Result<void> open_command_channel() override;
    void close_command_channel() noexcept override;
    [[nodiscard]] bool command_channel_open() const override;

    Result<std::string> execute(const std::string& command,
                                std::chrono::milliseconds timeout) override;

    Result<void> open_bulk_channel() override;
    void close_bulk_channel() noexcept override;
    [[nodiscard]] bool bulk_channel_active() const override;

    Result<void> push_file(const std::filesystem::path& local_file,
                           const std::string& remote_path,
                           std::uint64_t size,
                           std::chrono::milliseconds timeout,
                           const ProgressCallback& progress) override;

    [[nodiscard]] std::string endpoint() const override;

private:
    struct SessionDeleter {
        void operator()(ssh_session_struct* session) const noexcept;
    };
    using SessionPtr = std::unique_ptr<ssh_session_struct, SessionDeleter>;

    Result<SessionPtr> open_session(const char* purpose) const;

    EndpointConfig endpoint_;
    std::chrono::milliseconds connect_timeout_;

    SessionPtr command_;
    SessionPtr bulk_;
};

} // namespace cxfer::remote

#pragma once

#include <string>
#include <string_view>

namespace cxfer {

/**
 * @brief Broad failure classes of a transfer job
 *
 * The kind decides the propagation policy: connection problems are retried
 * unless authentication failed, space errors stop a job before any upload,
 * upload and verification errors are retried per chunk, ledger errors are
 * logged and otherwise ignored.
 */
enum class ErrorKind {
    Connection,
    Space,
    Upload,
    Verification,
    Ledger,
    Usage,
    Io,
    Cancelled
};

enum class ErrorDetail {
    None,
    AuthFailed,       ///< Credentials rejected, never retried
    Timeout,
    Unreachable,
    ChannelLost,
    Insufficient,     ///< Not enough remote space
    SizeMismatch,     ///< Remote size differs, strong corruption signal
    NotFoundYet,      ///< Listing does not show the file, weak sync-lag signal
    ChecksumMismatch,
    Unparsable
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    ErrorDetail detail = ErrorDetail::None;
    std::string message;

    Error() = default;
    Error(ErrorKind k, ErrorDetail d, std::string msg)
        : kind(k), detail(d), message(std::move(msg)) {}

    [[nodiscard]] bool retryable() const noexcept;
    [[nodiscard]] bool fatal() const noexcept { return !retryable(); }

    [[nodiscard]] std::string describe() const;

    static Error connection(ErrorDetail detail, std::string message) {
        return Error{ErrorKind::Connection, detail, std::move(message)};
    }
    static Error auth_failed(std::string message) {
        return Error{ErrorKind::Connection, ErrorDetail::AuthFailed, std::move(message)};
    }
    static Error space(std::string message) {
        return Error{ErrorKind::Space, ErrorDetail::Insufficient, std::move(message)};
    }
    static Error upload(ErrorDetail detail, std::string message) {
        return Error{ErrorKind::Upload, detail, std::move(message)};
    }
    static Error verification(ErrorDetail detail, std::string message) {
        return Error{ErrorKind::Verification, detail, std::move(message)};
    }
    static Error ledger(std::string message) {
        return Error{ErrorKind::Ledger, ErrorDetail::None, std::move(message)};
    }
    static Error usage(std::string message) {
        return Error{ErrorKind::Usage, ErrorDetail::None, std::move(message)};
    }
    static Error io(std::string message) {
        return Error{ErrorKind::Io, ErrorDetail::None, std::move(message)};
    }
    static Error cancelled(std::string message) {
        return Error{ErrorKind::Cancelled, ErrorDetail::None, std::move(message)};
    }
};

std::string_view to_string(ErrorKind kind) noexcept;
std::string_view to_string(ErrorDetail detail) noexcept;

} // namespace cxfer

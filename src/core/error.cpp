#include "cxfer/core/error.hpp"

namespace cxfer {

bool Error::retryable() const noexcept {
    switch (kind) {
        case ErrorKind::Connection:
            return detail != ErrorDetail::AuthFailed;
        case ErrorKind::Upload:
        case ErrorKind::Verification:
            return true;
        case ErrorKind::Space:
        case ErrorKind::Ledger:
        case ErrorKind::Usage:
        case ErrorKind::Io:
        case ErrorKind::Cancelled:
            return false;
    }
    return false;
}

std::string Error::describe() const {
    std::string text(to_string(kind));
    if (detail != ErrorDetail::None) {
        text += "/";
        text += to_string(detail);
    }
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    return text;
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection: return "ConnectionError";
        case ErrorKind::Space: return "SpaceError";
        case ErrorKind::Upload: return "UploadError";
        case ErrorKind::Verification: return "VerificationError";
        case ErrorKind::Ledger: return "LedgerError";
        case ErrorKind::Usage: return "UsageError";
        case ErrorKind::Io: return "IoError";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string_view to_string(ErrorDetail detail) noexcept {
    switch (detail) {
        case ErrorDetail::None: return "none";
        case ErrorDetail::AuthFailed: return "auth-failed";
        case ErrorDetail::Timeout: return "timeout";
        case ErrorDetail::Unreachable: return "unreachable";
        case ErrorDetail::ChannelLost: return "channel-lost";
        case ErrorDetail::Insufficient: return "insufficient";
        case ErrorDetail::SizeMismatch: return "size-mismatch";
        case ErrorDetail::NotFoundYet: return "not-found-yet";
        case ErrorDetail::ChecksumMismatch: return "checksum-mismatch";
        case ErrorDetail::Unparsable: return "unparsable";
    }
    return "unknown";
}

} // namespace cxfer

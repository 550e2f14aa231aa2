#pragma once

/**
 * @file error.hpp
 * @brief Error taxonomy shared by every drivesync layer
 *
 * Per-file kinds (TransientTransport, Integrity, Remote, NotFound, Io) are
 * recorded on the file's progress record and the batch keeps going.
 * Run-level kinds (Authentication, Configuration) abort the whole run.
 * Cancelled is not a failure: it reports a cooperative stop.
 */

#include <string>

namespace dsync {

enum class ErrorKind {
    TransientTransport,  // network / timeout / 5xx, retried with backoff
    Integrity,           // checksum mismatch after a completed transfer
    Authentication,      // missing or expired credentials, 401/403
    Configuration,       // unknown task, malformed filter rule or config
    Remote,              // non-retryable remote answer
    NotFound,            // remote item (or local record) does not exist
    Io,                  // local filesystem or database failure
    Cancelled            // cooperative cancel observed
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    /**
     * True for kinds that abort a whole sync run rather than a single file
     */
    bool is_fatal() const {
        return kind == ErrorKind::Authentication || kind == ErrorKind::Configuration;
    }

    bool is_retryable() const { return kind == ErrorKind::TransientTransport; }
};

class ErrorKindUtils {
public:
    static std::string to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::TransientTransport: return "TransientTransportError";
            case ErrorKind::Integrity: return "IntegrityError";
            case ErrorKind::Authentication: return "AuthenticationError";
            case ErrorKind::Configuration: return "ConfigurationError";
            case ErrorKind::Remote: return "RemoteError";
            case ErrorKind::NotFound: return "NotFoundError";
            case ErrorKind::Io: return "IoError";
            case ErrorKind::Cancelled: return "Cancelled";
            default: return "UnknownError";
        }
    }
};

inline std::string describe(const Error& error) {
    return ErrorKindUtils::to_string(error.kind) + ": " + error.message;
}

} // namespace dsync

#pragma once

#include <string>
#include <variant>
#include <stdexcept>

namespace livetalk {

/**
 * @brief Stable error kinds reported to clients and logs
 */
enum class ErrorKind {
    None,
    Busy,                 ///< Session already processing a turn
    InvalidRequest,       ///< Malformed or empty client input
    EmptyTranscription,   ///< No speech detected in the audio
    TranscriptionFailed,  ///< Decode or STT engine failure
    BackendUnavailable,   ///< Completion endpoint unreachable
    BackendError,         ///< Completion endpoint returned non-2xx
    ProtocolError,        ///< Malformed stream framing or JSON
    SynthesisFailed,      ///< TTS engine failure
    Cancelled,            ///< Explicit cancellation or client disconnect
    Timeout,              ///< Call deadline exceeded
    CompressionFailed,    ///< Summarization failed (never surfaced to clients)
    StoreError,           ///< Persistent store read/write failure
    ConfigError
};

/// Wire name of an error kind, e.g. "backend_error"
const char* error_kind_name(ErrorKind kind);

/**
 * @brief Error information structure
 */
struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    int http_status = 0;  ///< Set for BackendError

    Error() = default;
    Error(ErrorKind k, const std::string& msg, int status = 0)
        : kind(k), message(msg), http_status(status) {}

    bool is_error() const { return kind != ErrorKind::None; }
    explicit operator bool() const { return is_error(); }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

// Helper functions for creating errors
inline Error make_error(ErrorKind kind, const std::string& message) {
    return Error(kind, message);
}

inline Error make_backend_error(int http_status, const std::string& message) {
    return Error(ErrorKind::BackendError, message, http_status);
}

inline Error make_cancelled_error(const std::string& message = "Turn cancelled") {
    return Error(ErrorKind::Cancelled, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorKind::Timeout, message);
}

} // namespace livetalk

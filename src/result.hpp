// =============================================================================
// Scry - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Errors carry an ErrorKind so callers can react to the failure class
// (reconnect on Connection, surface CaptureUnavailable, drop a bad unit on
// Decode, keep going on DeviceBusy) without parsing message text.
//
// Usage:
//   Result<int> parsePort(const std::string& s) {
//       if (s.empty()) return Error(ErrorKind::Config, "empty port");
//       return Ok(std::stoi(s));
//   }
//
//   auto result = parsePort("5555");
//   if (result.is_ok()) use(result.value());
//   else SLOG_ERROR("cfg", "%s", result.error().message.c_str());
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace scry {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorKind {
    Connection,          // transport-level, usually recoverable by reconnect
    CaptureUnavailable,  // device denied screen capture (permission/policy)
    Decode,              // one malformed access unit
    DeviceBusy,          // transient input write failure
    Transfer,            // file push failure, see TransferError::reason
    Config,              // invalid configuration or argument
    Cancelled            // work abandoned because the owner stopped
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::Connection:         return "ConnectionError";
        case ErrorKind::CaptureUnavailable: return "CaptureUnavailable";
        case ErrorKind::Decode:             return "DecodeError";
        case ErrorKind::DeviceBusy:         return "DeviceBusy";
        case ErrorKind::Transfer:           return "TransferError";
        case ErrorKind::Config:             return "ConfigError";
        case ErrorKind::Cancelled:          return "Cancelled";
    }
    return "UnknownError";
}

struct Error {
    ErrorKind kind = ErrorKind::Connection;
    std::string message;
    int code = 0;

    Error() = default;
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
};

// File push error
struct TransferError : Error {
    enum class Reason {
        IOFailure,       // local read or channel write failed
        DeviceRejected,  // device refused the file
        PathInvalid      // local or remote path unusable
    };
    Reason reason = Reason::IOFailure;

    TransferError() : Error(ErrorKind::Transfer, "") {}
    TransferError(Reason r, std::string msg)
        : Error(ErrorKind::Transfer, std::move(msg)), reason(r) {}
};

inline const char* transferReasonName(TransferError::Reason r) {
    switch (r) {
        case TransferError::Reason::IOFailure:      return "IOFailure";
        case TransferError::Reason::DeviceRejected: return "DeviceRejected";
        case TransferError::Reason::PathInvalid:    return "PathInvalid";
    }
    return "Unknown";
}

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(ErrorKind kind, std::string message, int code = 0) {
    return Result<T, Error>(Error(kind, std::move(message), code));
}

} // namespace scry

#pragma once

#include <string>
#include <utility>

namespace gitquery {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    IoError,
    MalformedRecord,   // a record violates its line format
    InvalidTimestamp,  // an epoch-seconds field is not a representable integer
    UnresolvedHash,    // a ref could not be resolved to a commit identifier
    NotFound,
    InternalError
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::MalformedRecord: return "malformed-record";
        case ErrorCode::InvalidTimestamp: return "invalid-timestamp";
        case ErrorCode::UnresolvedHash: return "unresolved-hash";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;

    /// "<code>: <message>", used when reporting at the CLI boundary
    std::string describe() const { return std::string(toString(code)) + ": " + message; }
};

/**
 * @brief Value-or-error return type
 *
 * Every fallible operation returns Expected<T>; errors never travel as
 * exceptions across the public API.
 */
template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    /// Move the held value out (only meaningful when has_value())
    T take() { return std::move(value_); }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

}

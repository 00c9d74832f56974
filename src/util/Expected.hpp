#pragma once

#include <string>
#include <utility>

namespace gitpulse {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    NotARepository,
    IoError,
    CorruptObject,
    ObjectNotFound,
    RefNotFound,
    TransportError,
    Timeout,
    InternalError
};

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/// Human readable name of an error code ("io-error", "transport-error", ...)
const char* errorCodeName(ErrorCode code);

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

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::NotARepository: return "not-a-repository";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::CorruptObject: return "corrupt-object";
        case ErrorCode::ObjectNotFound: return "object-not-found";
        case ErrorCode::RefNotFound: return "ref-not-found";
        case ErrorCode::TransportError: return "transport-error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

}

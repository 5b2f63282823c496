#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace g1 {

enum class ErrorKind : uint8_t {
    None,
    Discovery,         // scan failed, non-fatal
    Connection,        // connect/pair timed out or was rejected
    Protocol,          // unexpected or malformed command response
    ConfigIncomplete,  // saved addresses missing
    Storage,           // config could not be persisted
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Discovery: return "discovery";
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::ConfigIncomplete: return "config_incomplete";
        case ErrorKind::Storage: return "storage";
    }
    return "unknown";
}

// Outcome of an operation: ok, or an error kind with a message
struct Status {
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool ok() const { return error == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    static Status success() { return {}; }
    static Status failure(ErrorKind kind, std::string msg) {
        return {kind, std::move(msg)};
    }
};

// Value on success, status describing the failure otherwise
template<typename T>
struct Result {
    std::optional<T> value;
    Status status;

    bool ok() const { return status.ok() && value.has_value(); }
    explicit operator bool() const { return ok(); }

    T& operator*() { return *value; }
    const T& operator*() const { return *value; }
    T* operator->() { return &*value; }
    const T* operator->() const { return &*value; }

    static Result success(T v) { return {std::move(v), Status::success()}; }
    static Result failure(ErrorKind kind, std::string msg) {
        return {std::nullopt, Status::failure(kind, std::move(msg))};
    }
};

} // namespace g1

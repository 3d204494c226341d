#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace enginecache {

// Type aliases
using EngineVersion = std::string;
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    NotFound,
    NetworkError,
    HashMismatch,
    IOError,
    OperationCancelled,
    InvalidArgument,
    ManifestInvalid,
    Timeout,
    TlsError,
    ServerError,
    PermissionDenied,
    StorageFull,
    OperationInProgress,
    InvalidState,
    PolicyViolation,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::HashMismatch: return "Signature mismatch";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::ManifestInvalid: return "Invalid manifest";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::TlsError: return "TLS verification failed";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::StorageFull: return "Storage full";
        case ErrorCode::OperationInProgress: return "Operation in progress";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::PolicyViolation: return "Policy violation";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Transport-class failures a caller may reasonably retry.
constexpr bool isNetworkFailure(ErrorCode error) {
    return error == ErrorCode::NetworkError || error == ErrorCode::Timeout ||
           error == ErrorCode::TlsError || error == ErrorCode::ServerError;
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace enginecache

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<enginecache::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(enginecache::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", enginecache::errorToString(error));
    }
};
#endif

namespace enginecache {

// Common constants
inline constexpr std::size_t HASH_SIZE = 32;        // SHA-256
inline constexpr std::size_t HASH_STRING_SIZE = 64; // Hex encoded
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024;

} // namespace enginecache

#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace prism {

enum class ErrorCode {
    Unknown = 1,

    // Render outcomes reported to callers
    ComplianceRejected,
    PoolExhausted,
    PoolShutdown,
    LaunchFailure,
    PageLoadTimeout,
    CaptureFailure,

    // Input and configuration
    InvalidConfig,
    InvalidArgument,
    NotFound,

    // DevTools transport
    Timeout,
    ConnectionFailed,
    ConnectionClosed,
    ProtocolError,

    IoError,
    InternalError,
};

/// A failure with a stable code, a short message and optional detail (the
/// underlying cause, e.g. a CDP error string or an errno message).
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Wire name of an error code, as reported in RenderResult and HTTP bodies.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::ComplianceRejected: return "COMPLIANCE_REJECTED";
        case ErrorCode::PoolExhausted: return "POOL_EXHAUSTED";
        case ErrorCode::PoolShutdown: return "POOL_SHUTDOWN";
        case ErrorCode::LaunchFailure: return "LAUNCH_FAILURE";
        case ErrorCode::PageLoadTimeout: return "PAGE_LOAD_TIMEOUT";
        case ErrorCode::CaptureFailure: return "CAPTURE_FAILURE";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        case ErrorCode::Unknown: break;
    }
    return "UNKNOWN";
}

// Coroutines return failures through Fail: GCC 14 hits an internal compiler
// error on `co_return std::unexpected(...)` (gcc bug 112341), so the
// conversion to Result<T> happens in a conversion operator instead.
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }
inline auto ok_result() -> Result<void> { return {}; }

} // namespace prism

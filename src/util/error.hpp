#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <nonstd/expected.hpp>
#include <source_location>
#include <string>
#include <utility>

namespace snapgate {

enum class ErrorCode : std::uint8_t {
    ok,
    file_not_found,
    parse_error,
    invalid_config,
    socket_failed,
    bind_failed,
    already_running,
    not_running,
    protocol_validation,
    authorization_denied,
    transfer_timeout,
    payload_too_large,
    capacity_exceeded,
    storage_error,
    transport_error,
    unknown_error
};

struct Error {
    ErrorCode code;
    std::string message;
    std::source_location location;

    Error(ErrorCode error_code, std::string msg,
          std::source_location loc = std::source_location::current())
        : code(error_code), message(std::move(msg)), location(loc) {}
};

template <typename T>
using Result = nonstd::expected<T, Error>;

template <typename T>
using ResultPtr = Result<std::unique_ptr<T>>;

template <typename T>
[[nodiscard]] inline auto make_error(ErrorCode code, std::string message,
                                     std::source_location loc = std::source_location::current())
    -> Result<T> {
    return nonstd::make_unexpected(Error{code, std::move(message), loc});
}

template <typename T>
[[nodiscard]] inline auto make_result_ptr(std::unique_ptr<T> ptr) -> ResultPtr<T> {
    return ResultPtr<T>{std::move(ptr)};
}

template <typename T>
[[nodiscard]] inline auto
make_result_ptr_error(ErrorCode code, std::string message,
                      std::source_location loc = std::source_location::current())
    -> ResultPtr<T> {
    return nonstd::make_unexpected(Error{code, std::move(message), loc});
}

[[nodiscard]] constexpr auto error_code_name(ErrorCode code) -> const char* {
    switch (code) {
    case ErrorCode::ok:
        return "ok";
    case ErrorCode::file_not_found:
        return "file_not_found";
    case ErrorCode::parse_error:
        return "parse_error";
    case ErrorCode::invalid_config:
        return "invalid_config";
    case ErrorCode::socket_failed:
        return "socket_failed";
    case ErrorCode::bind_failed:
        return "bind_failed";
    case ErrorCode::already_running:
        return "already_running";
    case ErrorCode::not_running:
        return "not_running";
    case ErrorCode::protocol_validation:
        return "protocol_validation";
    case ErrorCode::authorization_denied:
        return "authorization_denied";
    case ErrorCode::transfer_timeout:
        return "transfer_timeout";
    case ErrorCode::payload_too_large:
        return "payload_too_large";
    case ErrorCode::capacity_exceeded:
        return "capacity_exceeded";
    case ErrorCode::storage_error:
        return "storage_error";
    case ErrorCode::transport_error:
        return "transport_error";
    case ErrorCode::unknown_error:
        return "unknown_error";
    }
    return "unknown";
}

} // namespace snapgate

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// Propagate error or return value. Expression-style like Rust's `?` operator.
// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define SNAPGATE_TRY(expr)                                                                         \
    ({                                                                                             \
        auto _try_result = (expr);                                                                 \
        if (!_try_result)                                                                          \
            return nonstd::make_unexpected(_try_result.error());                                   \
        std::move(_try_result).value();                                                            \
    })

// NOLINTEND(cppcoreguidelines-macro-usage)

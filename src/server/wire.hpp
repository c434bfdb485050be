#pragma once

#include <util/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace snapgate::wire {

// Terminates the raw image stream; bytes before the first occurrence are the payload.
inline constexpr std::string_view END_OF_DATA_MARKER = "EOF";

inline constexpr const char* STATUS_OK = "OK";
inline constexpr const char* STATUS_ERROR = "ERROR";
inline constexpr const char* STATUS_DENIED = "DENIED";
inline constexpr const char* STATUS_GRANTED = "GRANTED";

inline constexpr const char* IMAGE_PROMPT = "Send image data";
inline constexpr const char* DENIED_REASON = "Access denied - invalid credentials";

struct Handshake {
    std::string room;
    std::string uid;
};

// Parses the client's opening message. Both fields are trimmed and must be non-empty;
// any other shape is a protocol_validation error.
[[nodiscard]] auto parse_handshake(std::string_view raw) -> Result<Handshake>;

[[nodiscard]] auto encode_error(std::string_view reason) -> std::string;
[[nodiscard]] auto encode_denied(std::string_view reason = DENIED_REASON) -> std::string;
[[nodiscard]] auto encode_ready(std::string_view user) -> std::string;
[[nodiscard]] auto encode_granted(std::string_view timestamp, size_t size, std::string_view user)
    -> std::string;

[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

} // namespace snapgate::wire

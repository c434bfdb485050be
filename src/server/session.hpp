#pragma once

#include "server_state.hpp"
#include "wire.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <storage/capture_store.hpp>
#include <string>
#include <string_view>
#include <util/error.hpp>
#include <util/unique_fd.hpp>
#include <vector>

namespace snapgate {

class AuthorizationCache;
class EventBus;

enum class SessionState : uint8_t {
    awaiting_handshake,
    authorizing,
    awaiting_image,
    persisting,
    responded,
    failed,
};

[[nodiscard]] constexpr auto to_string(SessionState state) -> const char* {
    switch (state) {
    case SessionState::awaiting_handshake:
        return "awaiting_handshake";
    case SessionState::authorizing:
        return "authorizing";
    case SessionState::awaiting_image:
        return "awaiting_image";
    case SessionState::persisting:
        return "persisting";
    case SessionState::responded:
        return "responded";
    case SessionState::failed:
        return "failed";
    }
    return "unknown";
}

struct SessionLimits {
    size_t handshake_buffer_bytes = 1024;
    size_t read_chunk_bytes = 8192;
    size_t max_payload_bytes = 10 * 1024 * 1024;
    std::chrono::milliseconds transfer_timeout{30000};
};

struct SessionDependencies {
    ServerState& state;
    AuthorizationCache& authorization;
    storage::CaptureStore& store;
    EventBus& events;
};

// What happened on one connection, for logging and tests.
struct SessionReport {
    SessionState state = SessionState::awaiting_handshake;
    std::string room;
    std::string uid;
    std::string user;
    size_t payload_size = 0;
    std::optional<storage::RecordOutcome> record;
    std::optional<ErrorCode> error;
    std::chrono::duration<double> duration{0};
};

// Drives one accepted connection through
// handshake -> authorize -> transfer -> respond, then closes the socket.
class ProtocolSession {
public:
    ProtocolSession(util::UniqueFd socket, std::string peer, ConnectionLease lease,
                    SessionDependencies deps, SessionLimits limits);

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    // Runs to completion on the calling thread. Never throws for protocol,
    // storage or transport failures.
    auto run() -> SessionReport;

    [[nodiscard]] auto state() const -> SessionState { return m_report.state; }
    [[nodiscard]] auto peer() const -> const std::string& { return m_peer; }

private:
    using Clock = std::chrono::steady_clock;

    void drive();
    [[nodiscard]] auto read_handshake() -> Result<wire::Handshake>;
    [[nodiscard]] auto receive_image() -> Result<std::vector<uint8_t>>;
    [[nodiscard]] auto persist(std::vector<uint8_t> image, const std::string& timestamp)
        -> Result<storage::RecordOutcome>;
    [[nodiscard]] auto wait_readable(Clock::time_point deadline) -> Result<void>;
    [[nodiscard]] auto send_message(const std::string& message) -> Result<void>;

    void transition(SessionState next);
    // Logs the failure and sends ERROR; `reason` overrides the text the client sees.
    void fail(const Error& error, std::string_view reason = {});
    void finish();

    util::UniqueFd m_socket;
    std::string m_peer;
    ConnectionLease m_lease;
    SessionDependencies m_deps;
    SessionLimits m_limits;
    SessionReport m_report;
    Clock::time_point m_started;
};

} // namespace snapgate

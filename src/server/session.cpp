#include "session.hpp"

#include "authorization_cache.hpp"
#include "event_bus.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <spdlog/fmt/fmt.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <util/clock.hpp>
#include <util/digest.hpp>
#include <util/logging.hpp>

namespace snapgate {

namespace {

[[nodiscard]] auto client_reason(const Error& error) -> std::string {
    switch (error.code) {
    case ErrorCode::protocol_validation:
    case ErrorCode::payload_too_large:
        return error.message;
    case ErrorCode::transfer_timeout:
        return "Connection timed out";
    case ErrorCode::storage_error:
        return "Failed to save image";
    default:
        return "Internal server error";
    }
}

[[nodiscard]] auto log_level_for(ErrorCode code) -> spdlog::level::level_enum {
    switch (code) {
    case ErrorCode::protocol_validation:
    case ErrorCode::payload_too_large:
    case ErrorCode::transfer_timeout:
        return spdlog::level::warn;
    case ErrorCode::transport_error:
        return spdlog::level::debug;
    default:
        return spdlog::level::err;
    }
}

void set_send_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        SNAPGATE_LOG_DEBUG("SO_SNDTIMEO failed: {}", strerror(errno));
    }
}

} // namespace

ProtocolSession::ProtocolSession(util::UniqueFd socket, std::string peer, ConnectionLease lease,
                                 SessionDependencies deps, SessionLimits limits)
    : m_socket(std::move(socket)), m_peer(std::move(peer)), m_lease(std::move(lease)),
      m_deps(deps), m_limits(limits) {}

auto ProtocolSession::run() -> SessionReport {
    m_started = Clock::now();
    set_send_timeout(m_socket.get(), m_limits.transfer_timeout);

    try {
        drive();
    } catch (const std::exception& e) {
        fail(Error{ErrorCode::unknown_error, std::string("Unexpected error: ") + e.what()});
    }

    finish();
    return m_report;
}

void ProtocolSession::drive() {
    // AwaitingHandshake
    auto handshake = read_handshake();
    if (!handshake) {
        fail(handshake.error());
        return;
    }
    m_report.room = handshake->room;
    m_report.uid = handshake->uid;

    m_lease.join_room(m_report.room);
    m_deps.events.log(spdlog::level::info,
                      fmt::format("Client connected from {} to room '{}' (total: {})", m_peer,
                                  m_report.room, m_deps.state.active_connections()));
    m_deps.events.client_connected(m_report.room, m_peer);
    transition(SessionState::authorizing);

    // Authorizing
    auto name = m_deps.authorization.lookup(m_report.uid, m_report.room);
    if (!name) {
        fail(Error{ErrorCode::storage_error,
                   "Authorization check failed: " + name.error().message},
             "Failed to verify authorization");
        return;
    }
    if (!name->has_value()) {
        m_report.error = ErrorCode::authorization_denied;
        auto sent = send_message(wire::encode_denied());
        if (!sent) {
            SNAPGATE_LOG_DEBUG("Could not deliver DENIED to {}: {}", m_peer, sent.error().message);
        }
        m_deps.events.log(spdlog::level::info,
                          fmt::format("Access denied for UID {} in room {}", m_report.uid,
                                      m_report.room));
        transition(SessionState::failed);
        return;
    }
    m_report.user = **name;

    auto ready = send_message(wire::encode_ready(m_report.user));
    if (!ready) {
        fail(ready.error());
        return;
    }
    transition(SessionState::awaiting_image);

    // AwaitingImage
    m_deps.events.log(spdlog::level::info, fmt::format("Receiving image from {} in {}",
                                                       m_report.user, m_report.room));
    auto image = receive_image();
    if (!image) {
        fail(image.error());
        return;
    }
    m_report.payload_size = image->size();
    transition(SessionState::persisting);

    // Persisting
    auto timestamp = util::iso8601_now();
    auto stored = persist(std::move(*image), timestamp);
    if (!stored) {
        fail(stored.error());
        return;
    }
    m_report.record = *stored;

    auto granted =
        send_message(wire::encode_granted(timestamp, m_report.payload_size, m_report.user));
    if (!granted) {
        SNAPGATE_LOG_DEBUG("Could not deliver GRANTED to {}: {}", m_peer,
                           granted.error().message);
    }
    transition(SessionState::responded);
}

auto ProtocolSession::read_handshake() -> Result<wire::Handshake> {
    const auto deadline = Clock::now() + m_limits.transfer_timeout;
    std::string buffer(m_limits.handshake_buffer_bytes, '\0');

    while (true) {
        SNAPGATE_TRY(wait_readable(deadline));
        const ssize_t received = recv(m_socket.get(), buffer.data(), buffer.size(), 0);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return make_error<wire::Handshake>(ErrorCode::transport_error,
                                               std::string("recv failed: ") + strerror(errno));
        }
        buffer.resize(static_cast<size_t>(received));
        break;
    }

    return wire::parse_handshake(buffer);
}

auto ProtocolSession::receive_image() -> Result<std::vector<uint8_t>> {
    const auto deadline = Clock::now() + m_limits.transfer_timeout;
    const auto marker = wire::END_OF_DATA_MARKER;
    const size_t overlap = marker.size() - 1;

    std::vector<uint8_t> buffer;
    std::vector<uint8_t> chunk(m_limits.read_chunk_bytes);
    bool marker_found = false;

    while (!marker_found) {
        SNAPGATE_TRY(wait_readable(deadline));

        const ssize_t received = recv(m_socket.get(), chunk.data(), chunk.size(), 0);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return make_error<std::vector<uint8_t>>(
                ErrorCode::transport_error, std::string("recv failed: ") + strerror(errno));
        }
        if (received == 0) {
            break; // peer closed: everything so far is the payload
        }

        // The marker may straddle two reads.
        const size_t search_from = buffer.size() > overlap ? buffer.size() - overlap : 0;
        buffer.insert(buffer.end(), chunk.begin(), chunk.begin() + received);

        auto it = std::search(buffer.begin() + static_cast<std::ptrdiff_t>(search_from),
                              buffer.end(), marker.begin(), marker.end());
        if (it != buffer.end()) {
            buffer.erase(it, buffer.end());
            marker_found = true;
        }

        if (buffer.size() > m_limits.max_payload_bytes + (marker_found ? 0 : overlap)) {
            return make_error<std::vector<uint8_t>>(
                ErrorCode::payload_too_large,
                fmt::format("Payload exceeds limit: {} bytes (max {})", buffer.size(),
                            m_limits.max_payload_bytes));
        }
    }

    if (buffer.size() > m_limits.max_payload_bytes) {
        return make_error<std::vector<uint8_t>>(
            ErrorCode::payload_too_large,
            fmt::format("Payload exceeds limit: {} bytes (max {})", buffer.size(),
                        m_limits.max_payload_bytes));
    }
    if (buffer.empty()) {
        return make_error<std::vector<uint8_t>>(ErrorCode::protocol_validation,
                                                "No image data received");
    }
    return buffer;
}

auto ProtocolSession::persist(std::vector<uint8_t> image, const std::string& timestamp)
    -> Result<storage::RecordOutcome> {
    auto hash = util::sha256_hex(image);
    if (!hash) {
        return make_error<storage::RecordOutcome>(ErrorCode::storage_error,
                                                  "Hashing failed: " + hash.error().message);
    }

    storage::NewCapture capture{
        .uid = m_report.uid,
        .room = m_report.room,
        .name = m_report.user,
        .image = image,
        .image_hash = std::move(*hash),
        .timestamp = timestamp,
    };

    auto outcome = m_deps.store.record_capture(capture);
    if (!outcome) {
        return make_error<storage::RecordOutcome>(ErrorCode::storage_error,
                                                  "Capture save failed: " +
                                                      outcome.error().message);
    }

    if (outcome->status == storage::RecordStatus::duplicate) {
        m_deps.events.log(spdlog::level::info,
                          fmt::format("Duplicate image detected for {} in {}", m_report.user,
                                      m_report.room));
    } else {
        m_deps.events.log(spdlog::level::info,
                          fmt::format("Capture saved: {} ({} bytes)", m_report.user,
                                      image.size()));
    }
    return *outcome;
}

auto ProtocolSession::wait_readable(Clock::time_point deadline) -> Result<void> {
    while (true) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            return make_error<void>(ErrorCode::transfer_timeout, "Timed out waiting for data");
        }

        pollfd pfd{m_socket.get(), POLLIN, 0};
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return make_error<void>(ErrorCode::transport_error,
                                    std::string("poll failed: ") + strerror(errno));
        }
        if (ready == 0) {
            continue; // re-check the deadline
        }
        // POLLHUP/POLLERR still let recv() report EOF or the socket error.
        return {};
    }
}

auto ProtocolSession::send_message(const std::string& message) -> Result<void> {
    size_t total_sent = 0;
    while (total_sent < message.size()) {
        const ssize_t sent = send(m_socket.get(), message.data() + total_sent,
                                  message.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return make_error<void>(ErrorCode::transport_error,
                                    std::string("send failed: ") + strerror(errno));
        }
        total_sent += static_cast<size_t>(sent);
    }
    return {};
}

void ProtocolSession::transition(SessionState next) {
    SNAPGATE_LOG_TRACE("Session {}: {} -> {}", m_peer, to_string(m_report.state),
                       to_string(next));
    m_report.state = next;
}

void ProtocolSession::fail(const Error& error, std::string_view reason) {
    m_report.error = error.code;

    if (error.code == ErrorCode::transfer_timeout) {
        m_deps.events.log(spdlog::level::warn, fmt::format("Connection timeout with {}", m_peer));
    } else if (error.code == ErrorCode::storage_error) {
        m_deps.events.log(spdlog::level::err,
                          fmt::format("Storage error for {}: {}", m_peer, error.message));
    } else {
        m_deps.events.log(log_level_for(error.code),
                          fmt::format("Session error with {} ({}): {}", m_peer,
                                      error_code_name(error.code), error.message));
    }

    if (error.code != ErrorCode::transport_error) {
        auto sent = send_message(
            wire::encode_error(reason.empty() ? client_reason(error) : std::string(reason)));
        if (!sent) {
            SNAPGATE_LOG_DEBUG("Could not deliver ERROR to {}: {}", m_peer, sent.error().message);
        }
    }
    transition(SessionState::failed);
}

void ProtocolSession::finish() {
    m_socket.reset();
    m_lease.release();

    m_report.duration = Clock::now() - m_started;
    const auto active = m_deps.state.active_connections();
    if (m_report.room.empty()) {
        m_deps.events.log(spdlog::level::debug,
                          fmt::format("Client {} disconnected before handshake (duration: "
                                      "{:.2f}s, active: {})",
                                      m_peer, m_report.duration.count(), active));
        return;
    }

    m_deps.events.log(spdlog::level::info,
                      fmt::format("Client {} disconnected from room '{}' (duration: {:.2f}s, "
                                  "active: {})",
                                  m_peer, m_report.room, m_report.duration.count(), active));
    m_deps.events.client_disconnected(m_report.room, m_peer);
}

} // namespace snapgate

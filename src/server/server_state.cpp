#include "server_state.hpp"

#include <utility>

namespace snapgate {

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : m_state(std::exchange(other.m_state, nullptr)), m_generation(other.m_generation),
      m_room(std::move(other.m_room)) {}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        release();
        m_state = std::exchange(other.m_state, nullptr);
        m_generation = other.m_generation;
        m_room = std::move(other.m_room);
    }
    return *this;
}

void ConnectionLease::join_room(const std::string& room) {
    if (m_state == nullptr || !m_room.empty() || room.empty()) {
        return;
    }
    m_room = room;
    m_state->join_room(m_generation, m_room);
}

void ConnectionLease::release() {
    if (m_state == nullptr) {
        return;
    }
    std::exchange(m_state, nullptr)->release(m_generation, m_room);
}

auto ServerState::try_admit() -> std::optional<ConnectionLease> {
    std::lock_guard lock(m_mutex);
    ++m_active;
    if (m_active > m_max_connections || m_in_flight >= m_max_connections) {
        --m_active;
        return std::nullopt;
    }
    ++m_in_flight;
    return ConnectionLease{this, m_generation};
}

void ServerState::join_room(uint64_t generation, const std::string& room) {
    std::lock_guard lock(m_mutex);
    if (generation != m_generation) {
        return;
    }
    ++m_rooms[room];
}

void ServerState::release(uint64_t generation, const std::string& room) {
    std::lock_guard lock(m_mutex);
    if (m_in_flight > 0) {
        --m_in_flight;
    }
    if (generation != m_generation) {
        return;
    }
    if (!room.empty()) {
        auto it = m_rooms.find(room);
        if (it != m_rooms.end()) {
            if (it->second <= 1) {
                m_rooms.erase(it);
            } else {
                --it->second;
            }
        }
    }
    if (m_active > 0) {
        --m_active;
    }
}

void ServerState::mark_running(std::string host, uint16_t port) {
    std::lock_guard lock(m_mutex);
    m_running = true;
    m_host = std::move(host);
    m_port = port;
}

void ServerState::mark_stopped() {
    std::lock_guard lock(m_mutex);
    m_running = false;
}

auto ServerState::running() const -> bool {
    std::lock_guard lock(m_mutex);
    return m_running;
}

void ServerState::reset_counters() {
    std::lock_guard lock(m_mutex);
    m_active = 0;
    m_rooms.clear();
    ++m_generation;
}

auto ServerState::snapshot() const -> ServerStatus {
    std::lock_guard lock(m_mutex);
    return ServerStatus{m_running, m_host, m_port, m_active, m_rooms};
}

auto ServerState::active_connections() const -> uint32_t {
    std::lock_guard lock(m_mutex);
    return m_active;
}

auto ServerState::sessions_in_flight() const -> uint32_t {
    std::lock_guard lock(m_mutex);
    return m_in_flight;
}

auto ServerState::room_occupancy(const std::string& room) const -> uint32_t {
    std::lock_guard lock(m_mutex);
    auto it = m_rooms.find(room);
    return it == m_rooms.end() ? 0 : it->second;
}

} // namespace snapgate

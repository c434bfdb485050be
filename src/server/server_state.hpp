#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace snapgate {

struct ServerStatus {
    bool running = false;
    std::string host;
    uint16_t port = 0;
    uint32_t active_connections = 0;
    std::map<std::string, uint32_t> rooms;

    [[nodiscard]] auto total_rooms() const -> size_t { return rooms.size(); }
};

class ServerState;

// One admitted connection. Releasing (explicitly or on destruction) gives back
// the connection slot and the room seat exactly once.
class ConnectionLease {
public:
    ConnectionLease() = default;
    ~ConnectionLease() { release(); }

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;
    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;

    // Records the room named in the handshake and takes a seat in it.
    void join_room(const std::string& room);
    void release();

    [[nodiscard]] auto active() const -> bool { return m_state != nullptr; }
    [[nodiscard]] auto room() const -> const std::string& { return m_room; }

private:
    friend class ServerState;
    ConnectionLease(ServerState* state, uint64_t generation)
        : m_state(state), m_generation(generation) {}

    ServerState* m_state = nullptr;
    uint64_t m_generation = 0;
    std::string m_room;
};

// Counters shared by the accept loop and every session. All reads and writes
// go through one mutex so connect/disconnect pairs never lose updates.
class ServerState {
public:
    explicit ServerState(uint32_t max_connections) : m_max_connections(max_connections) {}

    ServerState(const ServerState&) = delete;
    ServerState& operator=(const ServerState&) = delete;

    // Counts the connection, then checks the ceiling; over the ceiling the
    // increment is rolled back and nullopt is returned. Sessions admitted
    // before a reset still hold a worker, so they count against the ceiling
    // until they release.
    [[nodiscard]] auto try_admit() -> std::optional<ConnectionLease>;

    void mark_running(std::string host, uint16_t port);
    void mark_stopped();
    [[nodiscard]] auto running() const -> bool;

    // Clears counters and occupancy. Leases issued before the reset only give
    // back their in-flight slot when released.
    void reset_counters();

    [[nodiscard]] auto snapshot() const -> ServerStatus;
    [[nodiscard]] auto active_connections() const -> uint32_t;
    // Sessions still running, including those admitted before the last reset.
    [[nodiscard]] auto sessions_in_flight() const -> uint32_t;
    [[nodiscard]] auto room_occupancy(const std::string& room) const -> uint32_t;
    [[nodiscard]] auto max_connections() const -> uint32_t { return m_max_connections; }

private:
    friend class ConnectionLease;
    void join_room(uint64_t generation, const std::string& room);
    void release(uint64_t generation, const std::string& room);

    const uint32_t m_max_connections;
    mutable std::mutex m_mutex;
    bool m_running = false;
    std::string m_host;
    uint16_t m_port = 0;
    uint32_t m_active = 0;
    uint32_t m_in_flight = 0;
    std::map<std::string, uint32_t> m_rooms;
    uint64_t m_generation = 0;
};

} // namespace snapgate

#pragma once

#include "server_state.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <util/error.hpp>
#include <util/unique_fd.hpp>

namespace snapgate {

class EventBus;

// Receives an admitted connection. Ownership of the socket and lease moves
// to the callee.
using SessionLauncher =
    std::function<void(util::UniqueFd socket, std::string peer, ConnectionLease lease)>;

struct AcceptorOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8888;
    std::chrono::milliseconds poll_interval{1000};
    int backlog = 128;
};

// TCP listener plus the thread that accepts on it. Each accepted socket is
// admitted against ServerState; rejected ones get a capacity error and are
// closed here.
class Acceptor {
public:
    ~Acceptor();

    Acceptor(const Acceptor&) = delete;
    Acceptor& operator=(const Acceptor&) = delete;

    // Binds and listens; does not start accepting yet.
    [[nodiscard]] static auto bind(const AcceptorOptions& options, ServerState& state,
                                   EventBus& events) -> ResultPtr<Acceptor>;

    void start(SessionLauncher launcher);

    // Stops accepting and closes the listening socket. Sessions already
    // handed to the launcher are not touched.
    void stop();

    [[nodiscard]] auto port() const -> uint16_t { return m_port; }
    [[nodiscard]] auto host() const -> const std::string& { return m_host; }
    [[nodiscard]] auto accepting() const -> bool { return m_running.load(); }

private:
    Acceptor(util::UniqueFd listen_fd, std::string host, uint16_t port,
             std::chrono::milliseconds poll_interval, ServerState& state, EventBus& events);

    void accept_loop();
    void admit(util::UniqueFd client, std::string peer);

    util::UniqueFd m_listen_fd;
    std::string m_host;
    uint16_t m_port = 0;
    std::chrono::milliseconds m_poll_interval;
    ServerState& m_state;
    EventBus& m_events;

    SessionLauncher m_launcher;
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};

} // namespace snapgate

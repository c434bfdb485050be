#include "acceptor.hpp"

#include "event_bus.hpp"
#include "wire.hpp"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <spdlog/fmt/fmt.h>
#include <sys/socket.h>
#include <util/logging.hpp>

namespace snapgate {

namespace {

constexpr auto ACCEPT_ERROR_BACKOFF = std::chrono::milliseconds(50);

[[nodiscard]] auto format_peer(const sockaddr_in& addr) -> std::string {
    std::array<char, INET_ADDRSTRLEN> ip{};
    if (inet_ntop(AF_INET, &addr.sin_addr, ip.data(), ip.size()) == nullptr) {
        return "unknown";
    }
    return fmt::format("{}:{}", ip.data(), ntohs(addr.sin_port));
}

} // namespace

Acceptor::Acceptor(util::UniqueFd listen_fd, std::string host, uint16_t port,
                   std::chrono::milliseconds poll_interval, ServerState& state,
                   EventBus& events)
    : m_listen_fd(std::move(listen_fd)), m_host(std::move(host)), m_port(port),
      m_poll_interval(poll_interval), m_state(state), m_events(events) {}

Acceptor::~Acceptor() {
    stop();
}

auto Acceptor::bind(const AcceptorOptions& options, ServerState& state, EventBus& events)
    -> ResultPtr<Acceptor> {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options.port);
    if (inet_pton(AF_INET, options.host.c_str(), &addr.sin_addr) != 1) {
        return make_result_ptr_error<Acceptor>(ErrorCode::bind_failed,
                                               "Invalid listen address: " + options.host);
    }

    util::UniqueFd fd(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
    if (!fd) {
        return make_result_ptr_error<Acceptor>(ErrorCode::socket_failed,
                                               std::string("Failed to create socket: ") +
                                                   strerror(errno));
    }

    int reuse = 1;
    if (setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        return make_result_ptr_error<Acceptor>(ErrorCode::socket_failed,
                                               std::string("Failed to set SO_REUSEADDR: ") +
                                                   strerror(errno));
    }

    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string error_msg;
        if (errno == EADDRINUSE) {
            error_msg = fmt::format("Address {}:{} already in use", options.host, options.port);
        } else {
            error_msg = std::string("Failed to bind socket: ") + strerror(errno);
        }
        return make_result_ptr_error<Acceptor>(ErrorCode::bind_failed, error_msg);
    }

    if (listen(fd.get(), options.backlog) < 0) {
        return make_result_ptr_error<Acceptor>(ErrorCode::bind_failed,
                                               std::string("Failed to listen: ") +
                                                   strerror(errno));
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(fd.get(), reinterpret_cast<sockaddr*>(&bound), &bound_len) < 0) {
        return make_result_ptr_error<Acceptor>(ErrorCode::socket_failed,
                                               std::string("getsockname failed: ") +
                                                   strerror(errno));
    }

    auto acceptor = std::unique_ptr<Acceptor>(new Acceptor(std::move(fd), options.host,
                                                           ntohs(bound.sin_port),
                                                           options.poll_interval, state, events));
    SNAPGATE_LOG_DEBUG("Listening on {}:{}", acceptor->m_host, acceptor->m_port);
    return make_result_ptr(std::move(acceptor));
}

void Acceptor::start(SessionLauncher launcher) {
    if (m_running.exchange(true)) {
        return;
    }
    m_launcher = std::move(launcher);
    m_thread = std::thread([this] { accept_loop(); });
}

void Acceptor::stop() {
    m_running = false;
    m_listen_fd.shutdown_socket();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_listen_fd.reset();
}

void Acceptor::accept_loop() {
    while (m_running) {
        pollfd pfd{m_listen_fd.get(), POLLIN, 0};
        const int ready = poll(&pfd, 1, static_cast<int>(m_poll_interval.count()));
        if (!m_running) {
            break;
        }
        if (ready < 0) {
            if (errno != EINTR) {
                m_events.log(spdlog::level::err,
                             fmt::format("Error accepting connection: {}", strerror(errno)));
                std::this_thread::sleep_for(ACCEPT_ERROR_BACKOFF);
            }
            continue;
        }
        if (ready == 0) {
            continue; // timeout, re-check the running flag
        }

        sockaddr_in peer_addr{};
        socklen_t peer_len = sizeof(peer_addr);
        util::UniqueFd client(accept4(m_listen_fd.get(), reinterpret_cast<sockaddr*>(&peer_addr),
                                      &peer_len, SOCK_CLOEXEC));
        if (!client) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && m_running) {
                m_events.log(spdlog::level::err,
                             fmt::format("Error accepting connection: {}", strerror(errno)));
                std::this_thread::sleep_for(ACCEPT_ERROR_BACKOFF);
            }
            continue;
        }

        admit(std::move(client), format_peer(peer_addr));
    }
    SNAPGATE_LOG_DEBUG("Accept loop on port {} exited", m_port);
}

void Acceptor::admit(util::UniqueFd client, std::string peer) {
    auto lease = m_state.try_admit();
    if (!lease) {
        m_events.log(spdlog::level::warn,
                     fmt::format("Connection limit reached ({}), rejecting {}",
                                 m_state.max_connections(), peer));
        const auto message = wire::encode_error("Server at maximum capacity");
        if (send(client.get(), message.data(), message.size(), MSG_NOSIGNAL | MSG_DONTWAIT) <
            0) {
            SNAPGATE_LOG_DEBUG("Could not deliver capacity error to {}: {}", peer,
                               strerror(errno));
        }
        return;
    }

    m_launcher(std::move(client), std::move(peer), std::move(*lease));
}

} // namespace snapgate

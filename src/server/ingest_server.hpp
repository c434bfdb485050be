#pragma once

#include "acceptor.hpp"
#include "authorization_cache.hpp"
#include "event_bus.hpp"
#include "server_state.hpp"
#include "session.hpp"

#include <memory>
#include <mutex>
#include <storage/capture_store.hpp>
#include <util/config.hpp>
#include <util/error.hpp>
#include <util/job_system.hpp>

namespace snapgate {

// The one long-lived server object. Control surfaces (console shell, signal
// handlers, tests) hold it by reference; start() and stop() can be cycled.
class IngestServer {
public:
    [[nodiscard]] static auto create(const Config& config) -> ResultPtr<IngestServer>;

    ~IngestServer();

    IngestServer(const IngestServer&) = delete;
    IngestServer& operator=(const IngestServer&) = delete;

    // Binds the listener and begins accepting. Fails with already_running or
    // bind_failed; on failure the server stays stopped.
    [[nodiscard]] auto start() -> Result<void>;

    // Stops accepting and resets counters. In-flight sessions run to
    // completion on the worker pool.
    [[nodiscard]] auto stop() -> Result<void>;

    [[nodiscard]] auto get_status() const -> ServerStatus;
    [[nodiscard]] auto running() const -> bool { return m_state.running(); }

    // Blocks until every dispatched session has finished.
    void wait_for_sessions();

    [[nodiscard]] auto events() -> EventBus& { return m_events; }
    [[nodiscard]] auto store() -> storage::CaptureStore& { return *m_store; }
    [[nodiscard]] auto authorization_cache() -> AuthorizationCache& { return *m_authorization; }
    [[nodiscard]] auto config() const -> const Config& { return m_config; }

private:
    IngestServer(Config config, std::unique_ptr<storage::CaptureStore> store);

    void launch_session(util::UniqueFd socket, std::string peer, ConnectionLease lease);

    Config m_config;
    SessionLimits m_limits;
    EventBus m_events;
    ServerState m_state;
    std::unique_ptr<storage::CaptureStore> m_store;
    std::unique_ptr<AuthorizationCache> m_authorization;

    std::mutex m_control_mutex;
    std::unique_ptr<Acceptor> m_acceptor;

    // Declared last: destroyed first, so sessions finish while everything
    // they reference is still alive.
    util::JobSystem m_jobs;
};

} // namespace snapgate

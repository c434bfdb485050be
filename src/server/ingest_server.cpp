#include "ingest_server.hpp"

#include <spdlog/fmt/fmt.h>
#include <util/logging.hpp>

namespace snapgate {

namespace {

[[nodiscard]] auto limits_from(const Config& config) -> SessionLimits {
    SessionLimits limits;
    limits.handshake_buffer_bytes = config.server.handshake_buffer_bytes;
    limits.read_chunk_bytes = config.server.read_chunk_bytes;
    limits.max_payload_bytes = config.server.max_payload_bytes;
    limits.transfer_timeout = std::chrono::milliseconds(config.server.transfer_timeout_ms);
    return limits;
}

} // namespace

IngestServer::IngestServer(Config config, std::unique_ptr<storage::CaptureStore> store)
    : m_config(std::move(config)), m_limits(limits_from(m_config)),
      m_state(m_config.server.max_connections), m_store(std::move(store)),
      m_authorization(std::make_unique<AuthorizationCache>(
          *m_store, m_config.authorization.cache_capacity)),
      m_jobs(m_config.server.max_connections) {}

IngestServer::~IngestServer() {
    if (m_state.running()) {
        auto result = stop();
        if (!result) {
            SNAPGATE_LOG_WARN("Stop during shutdown failed: {}", result.error().message);
        }
    }
    m_jobs.wait_all();
}

auto IngestServer::create(const Config& config) -> ResultPtr<IngestServer> {
    storage::PoolOptions pool_options;
    pool_options.database = config.storage.database;
    pool_options.max_idle = config.storage.pool_size;
    pool_options.busy_timeout_ms = config.storage.busy_timeout_ms;

    auto store = storage::CaptureStore::create(std::move(pool_options));
    if (!store) {
        return make_result_ptr_error<IngestServer>(store.error().code,
                                                   "Failed to open capture store: " +
                                                       store.error().message);
    }

    auto server =
        std::unique_ptr<IngestServer>(new IngestServer(config, std::move(store.value())));
    SNAPGATE_LOG_INFO("Capture store ready at {} ({} worker threads)",
                      config.storage.database.string(), server->m_jobs.thread_count());
    return make_result_ptr(std::move(server));
}

auto IngestServer::start() -> Result<void> {
    std::lock_guard lock(m_control_mutex);

    if (m_state.running()) {
        m_events.log(spdlog::level::warn, "Server is already running");
        return make_error<void>(ErrorCode::already_running, "Server is already running");
    }

    AcceptorOptions options;
    options.host = m_config.server.host;
    options.port = m_config.server.port;
    options.poll_interval = std::chrono::milliseconds(m_config.server.accept_poll_ms);

    auto acceptor = Acceptor::bind(options, m_state, m_events);
    if (!acceptor) {
        m_events.log(spdlog::level::err,
                     fmt::format("Failed to start server: {}", acceptor.error().message));
        return make_error<void>(ErrorCode::bind_failed, acceptor.error().message);
    }
    m_acceptor = std::move(acceptor.value());

    m_state.mark_running(m_acceptor->host(), m_acceptor->port());
    m_acceptor->start([this](util::UniqueFd socket, std::string peer, ConnectionLease lease) {
        launch_session(std::move(socket), std::move(peer), std::move(lease));
    });

    const auto text = fmt::format("Server running on {}:{}", m_acceptor->host(),
                                  m_acceptor->port());
    m_events.log(spdlog::level::info, text);
    m_events.status(text);
    return {};
}

auto IngestServer::stop() -> Result<void> {
    std::lock_guard lock(m_control_mutex);

    if (!m_state.running()) {
        m_events.log(spdlog::level::warn, "Server is not running");
        return make_error<void>(ErrorCode::not_running, "Server is not running");
    }

    m_state.mark_stopped();
    if (m_acceptor) {
        m_acceptor->stop();
        m_acceptor.reset();
    }
    m_store->drain_pool();
    m_state.reset_counters();

    m_events.log(spdlog::level::info, "Server stopped");
    m_events.status("Server stopped");
    return {};
}

auto IngestServer::get_status() const -> ServerStatus {
    return m_state.snapshot();
}

void IngestServer::wait_for_sessions() {
    m_jobs.wait_all();
}

void IngestServer::launch_session(util::UniqueFd socket, std::string peer,
                                  ConnectionLease lease) {
    auto session = std::make_shared<ProtocolSession>(
        std::move(socket), std::move(peer), std::move(lease),
        SessionDependencies{m_state, *m_authorization, *m_store, m_events}, m_limits);

    m_jobs.post([session] {
        auto report = session->run();
        SNAPGATE_LOG_TRACE("Session {} finished in state {}", session->peer(),
                           to_string(report.state));
    });
}

} // namespace snapgate

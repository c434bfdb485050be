#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <spdlog/common.h>
#include <string>
#include <vector>

namespace snapgate {

enum class EventKind : uint8_t {
    log,
    status,
    client_connected,
    client_disconnected,
};

struct ServerEvent {
    EventKind kind = EventKind::log;
    std::string text;
    std::string room;
    std::string peer;
};

// Bounded per-subscriber queue. When full, the oldest event is discarded so
// a publisher never waits on a slow reader.
class EventMailbox {
public:
    explicit EventMailbox(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    void push(ServerEvent event);
    [[nodiscard]] auto try_pop() -> std::optional<ServerEvent>;
    [[nodiscard]] auto wait_pop(std::chrono::milliseconds timeout) -> std::optional<ServerEvent>;
    [[nodiscard]] auto drain() -> std::vector<ServerEvent>;
    [[nodiscard]] auto dropped() const -> uint64_t;

    // Wakes a blocked wait_pop() so the subscriber can shut down.
    void close();
    [[nodiscard]] auto closed() const -> bool;

private:
    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<ServerEvent> m_events;
    uint64_t m_dropped = 0;
    bool m_closed = false;
};

using Subscription = std::shared_ptr<EventMailbox>;

// Fan-out of log and status events to any number of attached views. The bus
// holds subscribers weakly: releasing the Subscription detaches it.
class EventBus {
public:
    static constexpr size_t DEFAULT_MAILBOX_CAPACITY = 1024;

    [[nodiscard]] auto subscribe(size_t capacity = DEFAULT_MAILBOX_CAPACITY) -> Subscription;
    void unsubscribe(const Subscription& subscription);

    void publish(ServerEvent event);

    // Writes to the process log and publishes "[HH:MM:SS] message".
    void log(spdlog::level::level_enum level, const std::string& message);
    void status(std::string text);
    void client_connected(std::string room, std::string peer);
    void client_disconnected(std::string room, std::string peer);

    [[nodiscard]] auto subscriber_count() -> size_t;

private:
    [[nodiscard]] auto live_subscribers() -> std::vector<Subscription>;

    std::mutex m_mutex;
    std::vector<std::weak_ptr<EventMailbox>> m_subscribers;
};

} // namespace snapgate

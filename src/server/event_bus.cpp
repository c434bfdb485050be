#include "event_bus.hpp"

#include <algorithm>
#include <util/clock.hpp>
#include <util/logging.hpp>

namespace snapgate {

void EventMailbox::push(ServerEvent event) {
    {
        std::lock_guard lock(m_mutex);
        if (m_closed) {
            return;
        }
        if (m_events.size() >= m_capacity) {
            m_events.pop_front();
            ++m_dropped;
        }
        m_events.push_back(std::move(event));
    }
    m_cv.notify_one();
}

auto EventMailbox::try_pop() -> std::optional<ServerEvent> {
    std::lock_guard lock(m_mutex);
    if (m_events.empty()) {
        return std::nullopt;
    }
    ServerEvent event = std::move(m_events.front());
    m_events.pop_front();
    return event;
}

auto EventMailbox::wait_pop(std::chrono::milliseconds timeout) -> std::optional<ServerEvent> {
    std::unique_lock lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return m_closed || !m_events.empty(); });
    if (m_events.empty()) {
        return std::nullopt;
    }
    ServerEvent event = std::move(m_events.front());
    m_events.pop_front();
    return event;
}

auto EventMailbox::drain() -> std::vector<ServerEvent> {
    std::lock_guard lock(m_mutex);
    std::vector<ServerEvent> out(std::make_move_iterator(m_events.begin()),
                                 std::make_move_iterator(m_events.end()));
    m_events.clear();
    return out;
}

auto EventMailbox::dropped() const -> uint64_t {
    std::lock_guard lock(m_mutex);
    return m_dropped;
}

void EventMailbox::close() {
    {
        std::lock_guard lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

auto EventMailbox::closed() const -> bool {
    std::lock_guard lock(m_mutex);
    return m_closed;
}

auto EventBus::subscribe(size_t capacity) -> Subscription {
    auto mailbox = std::make_shared<EventMailbox>(capacity);
    std::lock_guard lock(m_mutex);
    m_subscribers.push_back(mailbox);
    return mailbox;
}

void EventBus::unsubscribe(const Subscription& subscription) {
    if (!subscription) {
        return;
    }
    subscription->close();
    std::lock_guard lock(m_mutex);
    std::erase_if(m_subscribers, [&](const std::weak_ptr<EventMailbox>& weak) {
        auto live = weak.lock();
        return !live || live == subscription;
    });
}

auto EventBus::live_subscribers() -> std::vector<Subscription> {
    std::vector<Subscription> live;
    std::lock_guard lock(m_mutex);
    std::erase_if(m_subscribers,
                  [](const std::weak_ptr<EventMailbox>& weak) { return weak.expired(); });
    live.reserve(m_subscribers.size());
    for (const auto& weak : m_subscribers) {
        if (auto mailbox = weak.lock()) {
            live.push_back(std::move(mailbox));
        }
    }
    return live;
}

void EventBus::publish(ServerEvent event) {
    auto subscribers = live_subscribers();
    if (subscribers.empty()) {
        return;
    }
    for (size_t i = 0; i + 1 < subscribers.size(); ++i) {
        subscribers[i]->push(event);
    }
    subscribers.back()->push(std::move(event));
}

void EventBus::log(spdlog::level::level_enum level, const std::string& message) {
    auto logger = get_logger();
    if (!logger->should_log(level)) {
        return;
    }
    logger->log(level, "{}", message);
    publish(ServerEvent{EventKind::log, "[" + util::clock_time_now() + "] " + message, {}, {}});
}

void EventBus::status(std::string text) {
    publish(ServerEvent{EventKind::status, std::move(text), {}, {}});
}

void EventBus::client_connected(std::string room, std::string peer) {
    publish(ServerEvent{EventKind::client_connected, {}, std::move(room), std::move(peer)});
}

void EventBus::client_disconnected(std::string room, std::string peer) {
    publish(ServerEvent{EventKind::client_disconnected, {}, std::move(room), std::move(peer)});
}

auto EventBus::subscriber_count() -> size_t {
    return live_subscribers().size();
}

} // namespace snapgate

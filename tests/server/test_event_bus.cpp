#include "server/event_bus.hpp"
#include "util/logging.hpp"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <vector>

using namespace snapgate;

TEST_CASE("EventMailbox drops the oldest event when full", "[events]") {
    EventMailbox mailbox(3);
    for (int i = 0; i < 5; ++i) {
        mailbox.push(ServerEvent{EventKind::status, std::to_string(i), {}, {}});
    }

    auto events = mailbox.drain();
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].text == "2");
    REQUIRE(events[2].text == "4");
    REQUIRE(mailbox.dropped() == 2);
}

TEST_CASE("EventMailbox wait_pop", "[events]") {
    EventMailbox mailbox(4);

    SECTION("Times out when empty") {
        auto start = std::chrono::steady_clock::now();
        auto event = mailbox.wait_pop(std::chrono::milliseconds(30));
        REQUIRE(!event.has_value());
        REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(25));
    }

    SECTION("Wakes on push from another thread") {
        std::thread producer([&mailbox]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            mailbox.push(ServerEvent{EventKind::status, "hello", {}, {}});
        });
        auto event = mailbox.wait_pop(std::chrono::seconds(5));
        producer.join();
        REQUIRE(event.has_value());
        REQUIRE(event->text == "hello");
    }

    SECTION("close() wakes a waiter and rejects later pushes") {
        std::thread closer([&mailbox]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            mailbox.close();
        });
        auto event = mailbox.wait_pop(std::chrono::seconds(5));
        closer.join();
        REQUIRE(!event.has_value());
        REQUIRE(mailbox.closed());

        mailbox.push(ServerEvent{EventKind::status, "late", {}, {}});
        REQUIRE(!mailbox.try_pop().has_value());
    }
}

TEST_CASE("EventBus fans out to every live subscriber", "[events]") {
    EventBus bus;
    auto first = bus.subscribe();
    auto second = bus.subscribe();
    REQUIRE(bus.subscriber_count() == 2);

    bus.client_connected("r1", "127.0.0.1:5000");
    bus.status("Server stopped");

    for (const auto& mailbox : {first, second}) {
        auto events = mailbox->drain();
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].kind == EventKind::client_connected);
        REQUIRE(events[0].room == "r1");
        REQUIRE(events[0].peer == "127.0.0.1:5000");
        REQUIRE(events[1].kind == EventKind::status);
        REQUIRE(events[1].text == "Server stopped");
    }
}

TEST_CASE("EventBus detaches dropped and unsubscribed mailboxes", "[events]") {
    EventBus bus;
    auto kept = bus.subscribe();
    {
        auto temporary = bus.subscribe();
        REQUIRE(bus.subscriber_count() == 2);
    }
    REQUIRE(bus.subscriber_count() == 1);

    bus.unsubscribe(kept);
    REQUIRE(bus.subscriber_count() == 0);
    REQUIRE(kept->closed());

    REQUIRE_NOTHROW(bus.status("nobody listening"));
}

TEST_CASE("EventBus log prefixes the wall-clock time", "[events]") {
    initialize_logger("events_test");
    set_log_level(spdlog::level::info);

    EventBus bus;
    auto mailbox = bus.subscribe();

    bus.log(spdlog::level::info, "Server running on 0.0.0.0:8888 {}");
    bus.log(spdlog::level::debug, "filtered out");

    auto events = mailbox->drain();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].kind == EventKind::log);
    const auto& text = events[0].text;
    REQUIRE(text.size() > 11);
    REQUIRE(text[0] == '[');
    REQUIRE(text[3] == ':');
    REQUIRE(text[6] == ':');
    REQUIRE(text.substr(9, 2) == "] ");
    REQUIRE(text.substr(11) == "Server running on 0.0.0.0:8888 {}");
}

TEST_CASE("A slow subscriber never blocks publishers", "[events]") {
    EventBus bus;
    auto slow = bus.subscribe(8);

    std::vector<std::thread> publishers;
    for (int t = 0; t < 4; ++t) {
        publishers.emplace_back([&bus]() {
            for (int i = 0; i < 1000; ++i) {
                bus.status("tick");
            }
        });
    }
    for (auto& thread : publishers) {
        thread.join();
    }

    REQUIRE(slow->drain().size() == 8);
    REQUIRE(slow->dropped() == 4000 - 8);
}

#include "server/ingest_server.hpp"
#include "support/socket_client.hpp"
#include "support/temp_database.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <functional>
#include <netinet/in.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace snapgate;
using namespace std::chrono_literals;

namespace {

auto test_config(const test::TempDatabase& db, uint32_t max_connections = 10) -> Config {
    Config config = default_config();
    config.server.host = "127.0.0.1";
    config.server.port = 0;
    config.server.max_connections = max_connections;
    config.server.accept_poll_ms = 50;
    config.server.transfer_timeout_ms = 5000;
    config.storage.database = db.path();
    return config;
}

auto make_server(const Config& config) -> std::unique_ptr<IngestServer> {
    auto server = IngestServer::create(config);
    REQUIRE(server.has_value());
    REQUIRE(server.value()->store().grant_authorization("u1", "r1", "Alice").has_value());
    REQUIRE(server.value()->store().grant_authorization("u2", "r1", "Bob").has_value());
    return std::move(server.value());
}

auto connect_to(uint16_t port) -> util::UniqueFd {
    util::UniqueFd fd(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    REQUIRE(fd.valid());
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    REQUIRE(connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    return fd;
}

auto wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s)
    -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

auto image_bytes(uint8_t seed, size_t size) -> std::vector<uint8_t> {
    std::vector<uint8_t> bytes(size);
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<uint8_t>(seed + i * 13);
    }
    // Keep the marker out of the payload.
    for (auto& b : bytes) {
        if (b == 'E') {
            b = 'e';
        }
    }
    return bytes;
}

// Full client exchange; returns the final response.
auto submit(uint16_t port, const std::string& uid, const std::vector<uint8_t>& image)
    -> std::optional<nlohmann::json> {
    auto fd = connect_to(port);
    if (!test::send_text(fd.get(), R"({"room":"r1","uid":")" + uid + R"("})")) {
        return std::nullopt;
    }
    auto first = test::read_json(fd.get());
    if (!first || (*first)["status"] != "OK") {
        return first;
    }
    auto payload = image;
    payload.insert(payload.end(), {'E', 'O', 'F'});
    if (!test::send_bytes(fd.get(), payload)) {
        return std::nullopt;
    }
    return test::read_json(fd.get());
}

} // namespace

TEST_CASE("IngestServer start and stop lifecycle", "[ingest_server]") {
    test::TempDatabase db("lifecycle");
    auto server = make_server(test_config(db));
    auto events = server->events().subscribe();

    REQUIRE_FALSE(server->running());

    SECTION("Stop before start is reported") {
        auto result = server->stop();
        REQUIRE(!result.has_value());
        REQUIRE(result.error().code == ErrorCode::not_running);

        bool notified = false;
        for (const auto& event : events->drain()) {
            notified |= event.kind == EventKind::log &&
                        event.text.find("Server is not running") != std::string::npos;
        }
        REQUIRE(notified);
    }

    SECTION("Start reports the bound address") {
        REQUIRE(server->start().has_value());
        auto status = server->get_status();
        REQUIRE(status.running);
        REQUIRE(status.host == "127.0.0.1");
        REQUIRE(status.port != 0);
        REQUIRE(status.active_connections == 0);
        REQUIRE(status.total_rooms() == 0);

        bool announced = false;
        for (const auto& event : events->drain()) {
            announced |= event.kind == EventKind::status &&
                         event.text == "Server running on 127.0.0.1:" + std::to_string(status.port);
        }
        REQUIRE(announced);

        SECTION("Second start is rejected without side effects") {
            auto again = server->start();
            REQUIRE(!again.has_value());
            REQUIRE(again.error().code == ErrorCode::already_running);
            REQUIRE(server->get_status().port == status.port);
        }

        SECTION("Stop then restart") {
            REQUIRE(server->stop().has_value());
            REQUIRE_FALSE(server->running());

            bool stopped = false;
            for (const auto& event : events->drain()) {
                stopped |= event.kind == EventKind::status && event.text == "Server stopped";
            }
            REQUIRE(stopped);

            REQUIRE(server->start().has_value());
            REQUIRE(server->running());
            auto reply = submit(server->get_status().port, "u1", image_bytes(1, 64));
            REQUIRE(reply.has_value());
            REQUIRE((*reply)["status"] == "GRANTED");
        }
    }
}

TEST_CASE("IngestServer reports bind failures and stays stopped", "[ingest_server]") {
    test::TempDatabase db_a("bind_a");
    test::TempDatabase db_b("bind_b");
    auto first = make_server(test_config(db_a));
    REQUIRE(first->start().has_value());

    auto config = test_config(db_b);
    config.server.port = first->get_status().port;
    auto second = make_server(config);

    auto result = second->start();
    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::bind_failed);
    REQUIRE_FALSE(second->running());
    REQUIRE_FALSE(second->get_status().running);
}

TEST_CASE("IngestServer create fails on an unusable database", "[ingest_server]") {
    Config config = default_config();
    config.storage.database = "/nonexistent-dir/snapgate/database.db";

    auto server = IngestServer::create(config);
    REQUIRE(!server.has_value());
    REQUIRE(server.error().code == ErrorCode::storage_error);
}

TEST_CASE("IngestServer accepts, authorizes and stores over TCP", "[ingest_server]") {
    test::TempDatabase db("e2e");
    auto server = make_server(test_config(db));
    REQUIRE(server->start().has_value());
    const auto port = server->get_status().port;

    SECTION("Authorized submission") {
        const auto image = image_bytes(7, 100000);
        auto reply = submit(port, "u1", image);
        REQUIRE(reply.has_value());
        REQUIRE((*reply)["status"] == "GRANTED");
        REQUIRE((*reply)["size"] == image.size());
        REQUIRE((*reply)["user"] == "Alice");
        server->wait_for_sessions();
        REQUIRE(*server->store().capture_count() == 1);
    }

    SECTION("Unknown identity is denied") {
        auto fd = connect_to(port);
        REQUIRE(test::send_text(fd.get(), R"({"room":"r1","uid":"nobody"})"));
        auto reply = test::read_json(fd.get());
        REQUIRE(reply.has_value());
        REQUIRE((*reply)["status"] == "DENIED");
        REQUIRE(test::wait_closed(fd.get()));
    }

    SECTION("Duplicate submission is granted and stored once") {
        const auto image = image_bytes(3, 2048);
        REQUIRE((*submit(port, "u1", image))["status"] == "GRANTED");
        REQUIRE((*submit(port, "u1", image))["status"] == "GRANTED");
        REQUIRE((*submit(port, "u2", image))["status"] == "GRANTED");
        server->wait_for_sessions();
        REQUIRE(*server->store().capture_count() == 2);
    }

    SECTION("Concurrent clients are all served") {
        constexpr int clients = 8;
        std::atomic<int> granted{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < clients; ++i) {
            threads.emplace_back([&, i]() {
                auto reply = submit(port, i % 2 == 0 ? "u1" : "u2",
                                    image_bytes(static_cast<uint8_t>(i), 4096));
                if (reply && (*reply)["status"] == "GRANTED") {
                    granted++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        server->wait_for_sessions();
        REQUIRE(granted.load() == clients);
        REQUIRE(*server->store().capture_count() == clients);
    }

    server->wait_for_sessions();
    REQUIRE(wait_until([&] { return server->get_status().active_connections == 0; }));
    REQUIRE(server->get_status().total_rooms() == 0);
}

TEST_CASE("IngestServer enforces the connection ceiling", "[ingest_server]") {
    test::TempDatabase db("capacity");
    auto server = make_server(test_config(db, 2));
    REQUIRE(server->start().has_value());
    const auto port = server->get_status().port;

    // Two clients park in the image phase and hold their slots.
    std::vector<util::UniqueFd> held;
    for (const char* uid : {"u1", "u2"}) {
        auto fd = connect_to(port);
        REQUIRE(test::send_text(fd.get(), std::string(R"({"room":"r1","uid":")") + uid +
                                              R"("})"));
        auto ready = test::read_json(fd.get());
        REQUIRE(ready.has_value());
        REQUIRE((*ready)["status"] == "OK");
        held.push_back(std::move(fd));
    }

    auto status = server->get_status();
    REQUIRE(status.active_connections == 2);
    REQUIRE(status.rooms.at("r1") == 2);

    SECTION("Excess connection gets a capacity error") {
        auto extra = connect_to(port);
        auto reply = test::read_json(extra.get());
        REQUIRE(reply.has_value());
        REQUIRE((*reply)["status"] == "ERROR");
        REQUIRE((*reply)["reason"] == "Server at maximum capacity");
        REQUIRE(test::wait_closed(extra.get()));
        REQUIRE(server->get_status().active_connections == 2);
    }

    SECTION("A slot frees up when a held client finishes") {
        auto payload = image_bytes(9, 512);
        payload.insert(payload.end(), {'E', 'O', 'F'});
        REQUIRE(test::send_bytes(held[0].get(), payload));
        auto granted = test::read_json(held[0].get());
        REQUIRE(granted.has_value());
        REQUIRE((*granted)["status"] == "GRANTED");

        REQUIRE(wait_until([&] { return server->get_status().active_connections == 1; }));
        REQUIRE(server->get_status().rooms.at("r1") == 1);

        auto reply = submit(port, "u1", image_bytes(11, 256));
        REQUIRE(reply.has_value());
        REQUIRE((*reply)["status"] == "GRANTED");
    }

    for (auto& fd : held) {
        shutdown(fd.get(), SHUT_RDWR);
    }
    server->wait_for_sessions();
    REQUIRE(wait_until([&] { return server->get_status().active_connections == 0; }));
    REQUIRE(server->get_status().total_rooms() == 0);
}

TEST_CASE("IngestServer stop leaves in-flight sessions to finish", "[ingest_server]") {
    test::TempDatabase db("stop_midflight");
    auto server = make_server(test_config(db));
    REQUIRE(server->start().has_value());
    const auto port = server->get_status().port;

    auto fd = connect_to(port);
    REQUIRE(test::send_text(fd.get(), R"({"room":"r1","uid":"u1"})"));
    REQUIRE(test::read_json(fd.get()).has_value());
    REQUIRE(server->get_status().active_connections == 1);

    REQUIRE(server->stop().has_value());
    auto stopped = server->get_status();
    REQUIRE_FALSE(stopped.running);
    REQUIRE(stopped.active_connections == 0);
    REQUIRE(stopped.total_rooms() == 0);

    auto payload = image_bytes(5, 1024);
    payload.insert(payload.end(), {'E', 'O', 'F'});
    REQUIRE(test::send_bytes(fd.get(), payload));
    auto reply = test::read_json(fd.get());
    REQUIRE(reply.has_value());
    REQUIRE((*reply)["status"] == "GRANTED");

    server->wait_for_sessions();
    REQUIRE(server->get_status().active_connections == 0);
    REQUIRE(*server->store().capture_count() == 1);

    SECTION("New connections are refused while stopped") {
        util::UniqueFd refused(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        REQUIRE(connect(refused.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0);
    }

    SECTION("Restart counts from zero") {
        REQUIRE(server->start().has_value());
        REQUIRE(server->get_status().active_connections == 0);
    }
}

TEST_CASE("IngestServer serves new clients promptly after a restart", "[ingest_server]") {
    test::TempDatabase db("restart_busy");
    auto server = make_server(test_config(db, 3));
    REQUIRE(server->start().has_value());

    // Two sessions from the first run stay parked in the image phase.
    std::vector<util::UniqueFd> held;
    for (const char* uid : {"u1", "u2"}) {
        auto fd = connect_to(server->get_status().port);
        REQUIRE(test::send_text(fd.get(), std::string(R"({"room":"r1","uid":")") + uid +
                                              R"("})"));
        auto ready = test::read_json(fd.get());
        REQUIRE(ready.has_value());
        REQUIRE((*ready)["status"] == "OK");
        held.push_back(std::move(fd));
    }

    REQUIRE(server->stop().has_value());
    REQUIRE(server->start().has_value());
    const auto port = server->get_status().port;
    REQUIRE(server->get_status().active_connections == 0);

    auto fresh = connect_to(port);
    REQUIRE(test::send_text(fresh.get(), R"({"room":"r1","uid":"u1"})"));
    auto ready = test::read_json(fresh.get(), 1s);
    REQUIRE(ready.has_value());
    REQUIRE((*ready)["status"] == "OK");
    REQUIRE(server->get_status().active_connections == 1);

    // Every worker is busy now; the next client is turned away instead of queued.
    auto extra = connect_to(port);
    auto reply = test::read_json(extra.get(), 1s);
    REQUIRE(reply.has_value());
    REQUIRE((*reply)["status"] == "ERROR");
    REQUIRE((*reply)["reason"] == "Server at maximum capacity");

    shutdown(fresh.get(), SHUT_RDWR);
    for (auto& fd : held) {
        shutdown(fd.get(), SHUT_RDWR);
    }
    server->wait_for_sessions();
    REQUIRE(server->get_status().active_connections == 0);
}

TEST_CASE("IngestServer times out a stalled client", "[ingest_server]") {
    test::TempDatabase db("timeout");
    auto config = test_config(db);
    config.server.transfer_timeout_ms = 300;
    auto server = make_server(config);
    REQUIRE(server->start().has_value());

    auto fd = connect_to(server->get_status().port);
    REQUIRE(test::send_text(fd.get(), R"({"room":"r1","uid":"u1"})"));
    REQUIRE(test::read_json(fd.get()).has_value());

    auto reply = test::read_json(fd.get(), 3s);
    REQUIRE(reply.has_value());
    REQUIRE((*reply)["status"] == "ERROR");
    REQUIRE((*reply)["reason"] == "Connection timed out");

    server->wait_for_sessions();
    REQUIRE(server->get_status().active_connections == 0);
}

#include "console_shell.hpp"

#include <chrono>
#include <istream>
#include <ostream>
#include <server/ingest_server.hpp>
#include <server/wire.hpp>
#include <string>
#include <util/logging.hpp>

namespace snapgate::app {

namespace {

constexpr auto EVENT_POLL_INTERVAL = std::chrono::milliseconds(200);

} // namespace

ConsoleShell::ConsoleShell(IngestServer& server, std::ostream& out)
    : m_server(server), m_out(out), m_subscription(server.events().subscribe()) {
    m_printer = std::thread([this] { pump_events(); });
}

ConsoleShell::~ConsoleShell() {
    m_attached = false;
    m_server.events().unsubscribe(m_subscription);
    if (m_printer.joinable()) {
        m_printer.join();
    }
}

auto ConsoleShell::execute(std::string_view line) -> bool {
    const auto command = wire::trim(line);
    if (command.empty()) {
        return true;
    }

    if (command == "start") {
        auto result = m_server.start();
        if (!result) {
            std::lock_guard lock(m_out_mutex);
            m_out << "start failed: " << result.error().message << '\n';
        }
    } else if (command == "stop") {
        auto result = m_server.stop();
        if (!result) {
            std::lock_guard lock(m_out_mutex);
            m_out << "stop failed: " << result.error().message << '\n';
        }
    } else if (command == "status") {
        print_status();
    } else if (command == "help") {
        print_help();
    } else if (command == "quit" || command == "exit") {
        return false;
    } else {
        std::lock_guard lock(m_out_mutex);
        m_out << "Unknown command '" << command << "' (try 'help')\n";
    }
    return true;
}

void ConsoleShell::run(std::istream& in, const std::atomic<bool>& keep_running) {
    print_help();
    std::string line;
    while (keep_running && m_attached) {
        {
            std::lock_guard lock(m_out_mutex);
            m_out << "> " << std::flush;
        }
        if (!std::getline(in, line)) {
            break;
        }
        if (!execute(line)) {
            break;
        }
    }
    SNAPGATE_LOG_DEBUG("Console detached");
}

void ConsoleShell::flush_events() {
    while (auto event = m_subscription->try_pop()) {
        print_event(*event);
    }
}

void ConsoleShell::print_status() {
    const auto status = m_server.get_status();
    std::lock_guard lock(m_out_mutex);
    m_out << "running: " << (status.running ? "yes" : "no") << '\n';
    if (status.running) {
        m_out << "listening: " << status.host << ':' << status.port << '\n';
    }
    m_out << "active connections: " << status.active_connections << '\n';
    m_out << "total rooms: " << status.total_rooms() << '\n';
    for (const auto& [room, count] : status.rooms) {
        m_out << "  " << room << ": " << count << '\n';
    }
}

void ConsoleShell::print_help() {
    std::lock_guard lock(m_out_mutex);
    m_out << "Commands: start, stop, status, help, quit\n";
}

void ConsoleShell::print_event(const ServerEvent& event) {
    std::lock_guard lock(m_out_mutex);
    switch (event.kind) {
    case EventKind::log:
        m_out << event.text << '\n';
        break;
    case EventKind::status:
        m_out << "[status] " << event.text << '\n';
        break;
    case EventKind::client_connected:
        m_out << "[+] " << event.peer << " joined " << event.room << '\n';
        break;
    case EventKind::client_disconnected:
        m_out << "[-] " << event.peer << " left " << event.room << '\n';
        break;
    }
    m_out.flush();
}

void ConsoleShell::pump_events() {
    while (m_attached) {
        auto event = m_subscription->wait_pop(EVENT_POLL_INTERVAL);
        if (event) {
            print_event(*event);
        } else if (m_subscription->closed()) {
            break;
        }
    }
}

} // namespace snapgate::app

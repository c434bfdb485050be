#pragma once

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <server/event_bus.hpp>
#include <string_view>
#include <thread>

namespace snapgate {
class IngestServer;
}

namespace snapgate::app {

// Line-oriented operator console. Attaching subscribes to the server's events
// and prints them; detaching (destruction) leaves the server untouched.
class ConsoleShell {
public:
    ConsoleShell(IngestServer& server, std::ostream& out);
    ~ConsoleShell();

    ConsoleShell(const ConsoleShell&) = delete;
    ConsoleShell& operator=(const ConsoleShell&) = delete;

    // Executes one command line. Returns false once the operator asked to quit.
    auto execute(std::string_view line) -> bool;

    // Reads commands until quit, end of input, or `keep_running` turns false.
    void run(std::istream& in, const std::atomic<bool>& keep_running);

    // Prints any events queued so far without waiting.
    void flush_events();

private:
    void print_status();
    void print_help();
    void print_event(const ServerEvent& event);
    void pump_events();

    IngestServer& m_server;
    std::ostream& m_out;
    std::mutex m_out_mutex;
    Subscription m_subscription;
    std::atomic<bool> m_attached{true};
    std::thread m_printer;
};

} // namespace snapgate::app

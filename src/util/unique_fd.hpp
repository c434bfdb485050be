#pragma once

#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace snapgate::util {

// Owns a socket or file descriptor and closes it on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : m_fd(fd) {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : m_fd(std::exchange(other.m_fd, -1)) {}

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.m_fd, -1));
        }
        return *this;
    }

    void reset(int fd = -1) {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
        m_fd = fd;
    }

    // Wakes any thread blocked in accept()/recv() on this descriptor without
    // releasing the descriptor number.
    void shutdown_socket() const {
        if (m_fd >= 0) {
            ::shutdown(m_fd, SHUT_RDWR);
        }
    }

    [[nodiscard]] int get() const { return m_fd; }
    [[nodiscard]] bool valid() const { return m_fd >= 0; }
    explicit operator bool() const { return valid(); }

private:
    int m_fd = -1;
};

} // namespace snapgate::util

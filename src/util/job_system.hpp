#pragma once

#include <BS_thread_pool.hpp>
#include <cstddef>
#include <functional>
#include <memory>

namespace snapgate::util {

// Worker pool for connection sessions. One instance is owned by the server and
// outlives individual start/stop cycles so in-flight sessions can finish.
class JobSystem {
public:
    explicit JobSystem(size_t thread_count = 0);
    ~JobSystem();

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    // Fire-and-forget; the job owns everything it needs.
    void post(std::function<void()> job);

    void wait_all();
    [[nodiscard]] auto thread_count() const -> size_t;

private:
    std::unique_ptr<BS::thread_pool> m_pool;
};

} // namespace snapgate::util

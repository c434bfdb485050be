#include "job_system.hpp"

#include <thread>

namespace snapgate::util {

JobSystem::JobSystem(size_t thread_count) {
    if (thread_count == 0) {
        thread_count = std::thread::hardware_concurrency();
    }

    m_pool = std::make_unique<BS::thread_pool>(static_cast<BS::concurrency_t>(thread_count));
}

JobSystem::~JobSystem() {
    if (m_pool) {
        m_pool->wait_for_tasks();
        m_pool.reset();
    }
}

void JobSystem::post(std::function<void()> job) {
    m_pool->push_task(std::move(job));
}

void JobSystem::wait_all() {
    m_pool->wait_for_tasks();
}

auto JobSystem::thread_count() const -> size_t {
    return m_pool->get_thread_count();
}

} // namespace snapgate::util

#include "core/shared/worker_pool.h"
#include "core/shared/logging.h"

namespace sr {

WorkerPool::WorkerPool(size_t threadCount)
{
    const size_t count = threadCount > 0 ? threadCount : defaultThreadCount();
    m_threads.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        m_threads.emplace_back([this] { workerLoop(); });
    }
    LOG_DEBUG(srCore, "WorkerPool started with %d thread(s)", static_cast<int>(count));
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

size_t WorkerPool::defaultThreadCount()
{
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 2 : static_cast<size_t>(hw);
}

bool WorkerPool::submit(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            LOG_WARN(srCore, "WorkerPool::submit() called after shutdown");
            return false;
        }
        m_tasks.push_back(std::move(task));
    }
    m_cv.notify_one();
    return true;
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown && m_threads.empty()) {
            return;
        }
        m_shutdown = true;
    }
    m_cv.notify_all();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_threads.clear();
}

size_t WorkerPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void WorkerPool::workerLoop()
{
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_shutdown || !m_tasks.empty(); });
            if (m_tasks.empty()) {
                return;  // shutdown and drained
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }
        task();
    }
}

} // namespace sr

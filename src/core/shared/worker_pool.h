#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sr {

// WorkerPool -- fixed set of worker threads draining a FIFO task queue.
//
// Tasks submitted before shutdown() always run; shutdown() drains the queue,
// then joins every worker. submit() after shutdown() is refused.
class WorkerPool {
public:
    // threadCount 0 = defaultThreadCount()
    explicit WorkerPool(size_t threadCount = 0);
    ~WorkerPool();

    // Non-copyable, non-movable (thread ownership)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    bool submit(std::function<void()> task);
    void shutdown();

    size_t threadCount() const { return m_threads.size(); }
    size_t pendingCount() const;

    // Hardware concurrency, or 2 when the platform cannot report it.
    static size_t defaultThreadCount();

private:
    void workerLoop();

    std::vector<std::thread> m_threads;
    std::deque<std::function<void()>> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_shutdown = false;
};

} // namespace sr

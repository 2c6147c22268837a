#pragma once

#include <log4cplus/logger.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mrpc::rpc {

/**
 * Runs inbound work off the read loop.
 *
 * Requests go to a pool of worker threads and may complete in any order.
 * Notifications go to a single ordered lane so they run in arrival order.
 */
class Dispatcher {
public:
    using Task = std::function<void()>;

    /**
     * @param thread_pool_size Number of request workers (0 is treated as 1)
     * @param logger Receives failures of tasks that throw
     */
    Dispatcher(std::size_t thread_pool_size, log4cplus::Logger logger);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void post(Task task);
    void post_ordered(Task task);

    /// Runs queued tasks to completion and joins every thread.
    void stop();

private:
    struct Lane {
        std::queue<Task> tasks;
        std::mutex mutex;
        std::condition_variable cv;
    };

    void worker_thread_func(Lane& lane);
    void enqueue(Lane& lane, Task task);

    log4cplus::Logger logger_;
    Lane pool_lane_;
    Lane ordered_lane_;
    std::vector<std::thread> worker_threads_;
    std::thread ordered_thread_;
    std::atomic<bool> pool_running_{false};
};

} // namespace mrpc::rpc

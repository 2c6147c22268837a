#include "dispatcher.hpp"

#include <log4cplus/loggingmacros.h>

#include <exception>
#include <utility>

namespace mrpc::rpc {

Dispatcher::Dispatcher(std::size_t thread_pool_size, log4cplus::Logger logger) : logger_(std::move(logger)) {
    pool_running_ = true;
    std::size_t workers = thread_pool_size > 0 ? thread_pool_size : 1;
    for (std::size_t i = 0; i < workers; ++i) {
        worker_threads_.emplace_back(&Dispatcher::worker_thread_func, this, std::ref(pool_lane_));
    }
    ordered_thread_ = std::thread(&Dispatcher::worker_thread_func, this, std::ref(ordered_lane_));
}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::post(Task task) {
    enqueue(pool_lane_, std::move(task));
}

void Dispatcher::post_ordered(Task task) {
    enqueue(ordered_lane_, std::move(task));
}

void Dispatcher::enqueue(Lane& lane, Task task) {
    {
        std::lock_guard<std::mutex> lock(lane.mutex);
        lane.tasks.push(std::move(task));
    }
    lane.cv.notify_one();
}

void Dispatcher::stop() {
    if (!pool_running_.exchange(false)) {
        return;
    }

    for (Lane* lane : {&pool_lane_, &ordered_lane_}) {
        // Taking the lock orders the flag change before any waiter re-checks it.
        std::lock_guard<std::mutex> lock(lane->mutex);
        lane->cv.notify_all();
    }

    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    worker_threads_.clear();

    if (ordered_thread_.joinable()) {
        ordered_thread_.join();
    }
}

void Dispatcher::worker_thread_func(Lane& lane) {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(lane.mutex);
            lane.cv.wait(lock, [this, &lane] { return !lane.tasks.empty() || !pool_running_; });

            if (!pool_running_ && lane.tasks.empty()) {
                return;
            }

            task = std::move(lane.tasks.front());
            lane.tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(logger_, "Dispatched task failed: " << e.what());
        } catch (...) {
            LOG4CPLUS_ERROR(logger_, "Dispatched task failed with a non-standard exception");
        }
    }
}

} // namespace mrpc::rpc

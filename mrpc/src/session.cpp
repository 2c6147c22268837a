#include "session.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <condition_variable>
#include <exception>
#include <mutex>

namespace mrpc {

namespace {

/// Kills the child once `grace` passes, unless cancelled first.
class KillTimer {
public:
    KillTimer(ChildProcess& process, std::chrono::milliseconds grace)
        : thread_([this, &process, grace] {
              std::unique_lock<std::mutex> lock(mutex_);
              if (!cv_.wait_for(lock, grace, [this] { return cancelled_; })) {
                  LOG4CPLUS_WARN(core_logger(), "Child pid=" << process.pid() << " still running after "
                                                              << grace.count() << "ms, killing it");
                  process.kill();
              }
          }) {}

    ~KillTimer() { cancel(); }

    KillTimer(const KillTimer&) = delete;
    KillTimer& operator=(const KillTimer&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_one();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    std::thread thread_;
};

} // namespace

Session::Session(std::unique_ptr<transport::FdStream> stream, SessionOptions options)
    : Session(nullptr, std::move(stream), std::move(options)) {}

Session::Session(std::unique_ptr<ChildProcess> process, std::unique_ptr<transport::FdStream> stream,
                 SessionOptions options)
    : process_(std::move(process)), stream_(std::move(stream)), options_(std::move(options)) {
    endpoint_ = std::make_unique<rpc::Endpoint>(*stream_, *stream_, stream_.get(), options_.endpoint);
    if (options_.serve) {
        start_serve();
    }
}

Session::~Session() {
    try {
        close();
    } catch (const std::exception& exc) {
        LOG4CPLUS_WARN(core_logger(), "Session close: " << exc.what());
    }
    if (serve_thread_.joinable()) {
        serve_thread_.join();
    }
}

std::unique_ptr<Session> Session::connect(const std::string& address, SessionOptions options) {
    return std::make_unique<Session>(transport::dial(address), std::move(options));
}

std::unique_ptr<Session> Session::spawn(ChildProcessOptions process, SessionOptions options) {
    auto child = std::make_unique<ChildProcess>(std::move(process));
    auto stream = child->release_stream();
    return std::unique_ptr<Session>(new Session(std::move(child), std::move(stream), std::move(options)));
}

void Session::start_serve() {
    if (serve_thread_.joinable()) {
        return;
    }
    std::promise<void> done;
    serve_done_ = done.get_future();
    serve_thread_ = std::thread([this, done = std::move(done)]() mutable {
        try {
            endpoint_->serve();
            done.set_value();
        } catch (const std::exception&) {
            done.set_exception(std::current_exception());
        }
    });
}

void Session::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    std::exception_ptr first;

    // Armed before the endpoint closes: a writer stalled on the child's
    // full stdin only returns once the child is gone.
    std::unique_ptr<KillTimer> kill_timer;
    if (process_) {
        kill_timer = std::make_unique<KillTimer>(*process_, options_.grace);
    }

    try {
        endpoint_->close();
    } catch (const Error&) {
        first = std::current_exception();
    }

    if (process_) {
        try {
            process_->wait();
        } catch (const ProcessError&) {
            if (!first) {
                first = std::current_exception();
            }
        }
        kill_timer->cancel();
    }

    if (serve_thread_.joinable()) {
        if (serve_done_.wait_for(options_.grace) == std::future_status::timeout) {
            // The destructor still joins the thread.
            if (!first) {
                first = std::make_exception_ptr(TransportError("mrpc: serve did not exit"));
            }
        } else {
            serve_thread_.join();
            try {
                serve_done_.get();
            } catch (const std::exception&) {
                if (!first) {
                    first = std::current_exception();
                }
            }
        }
    }

    if (first) {
        std::rethrow_exception(first);
    }
}

} // namespace mrpc

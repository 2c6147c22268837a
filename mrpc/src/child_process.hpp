#pragma once

#include "transport.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mrpc {

struct ChildProcessOptions {
    std::string command;
    std::vector<std::string> args;

    /// Replaces the environment when non-empty ("NAME=value" entries).
    std::vector<std::string> env;

    /// Working directory; empty keeps ours.
    std::string dir;
};

/**
 * A child process whose stdin and stdout are the RPC stream.
 * stderr is inherited.
 */
class ChildProcess {
public:
    /// @throws ProcessError if the pipes or the fork fail
    explicit ChildProcess(ChildProcessOptions options);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    /// Stream connected to the child's stdin/stdout. Owned by the process
    /// object until released.
    std::unique_ptr<transport::FdStream> release_stream() { return std::move(stream_); }

    /// Blocks until the child exits.
    /// @throws ProcessError on a non-zero exit status or a fatal signal
    void wait();

    /// Waits up to `grace`, then kills the child and reaps it.
    /// @throws ProcessError as wait(), or when the child had to be killed
    void wait_for(std::chrono::milliseconds grace);

    /// Sends SIGKILL unless the child has been reaped. Safe to call while
    /// another thread is blocked in wait().
    void kill();

    bool exited() const { return exited_; }

private:
    void reap(int status);

    ChildProcessOptions options_;
    pid_t pid_ = -1;

    // The pid is only reaped under reap_mutex_, so kill() never signals a
    // recycled pid.
    std::mutex reap_mutex_;
    std::atomic<bool> exited_{false};
    std::unique_ptr<transport::FdStream> stream_;
};

} // namespace mrpc

#include "child_process.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace mrpc {

namespace {

std::string errno_message(const char* what) {
    return std::string("mrpc: ") + what + ": " + std::strerror(errno);
}

std::vector<char*> c_strings(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& value : values) {
        out.push_back(value.data());
    }
    out.push_back(nullptr);
    return out;
}

void close_pipe(int fds[2]) {
    ::close(fds[0]);
    ::close(fds[1]);
}

} // namespace

ChildProcess::ChildProcess(ChildProcessOptions options) : options_(std::move(options)) {
    if (options_.command.empty()) {
        throw ProcessError("mrpc: empty command");
    }

    int to_child[2];
    int from_child[2];
    if (::pipe2(to_child, O_CLOEXEC) < 0) {
        throw ProcessError(errno_message("pipe"));
    }
    if (::pipe2(from_child, O_CLOEXEC) < 0) {
        std::string message = errno_message("pipe");
        close_pipe(to_child);
        throw ProcessError(message);
    }

    // Everything the child touches after fork is prepared up front.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(options_.command);
    argv_storage.insert(argv_storage.end(), options_.args.begin(), options_.args.end());
    std::vector<std::string> env_storage = options_.env;
    std::vector<char*> argv = c_strings(argv_storage);
    std::vector<char*> envp = c_strings(env_storage);

    pid_ = ::fork();
    if (pid_ < 0) {
        std::string message = errno_message("fork");
        close_pipe(to_child);
        close_pipe(from_child);
        throw ProcessError(message);
    }

    if (pid_ == 0) {
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        if (!options_.dir.empty() && ::chdir(options_.dir.c_str()) < 0) {
            ::_exit(127);
        }
        if (env_storage.empty()) {
            ::execvp(argv[0], argv.data());
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
        }
        ::_exit(127);
    }

    ::close(to_child[0]);
    ::close(from_child[1]);
    stream_ = std::make_unique<transport::FdStream>(from_child[0], to_child[1]);
    LOG4CPLUS_DEBUG(core_logger(), "Started " << options_.command << " pid=" << pid_);
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !exited_) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        ::waitpid(pid_, &status, 0);
    }
}

void ChildProcess::reap(int status) {
    exited_ = true;
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        LOG4CPLUS_DEBUG(core_logger(), options_.command << " exited with status " << code);
        if (code != 0) {
            throw ProcessError("mrpc: " + options_.command + " exited with status " + std::to_string(code));
        }
        return;
    }
    if (WIFSIGNALED(status)) {
        throw ProcessError("mrpc: " + options_.command + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
}

void ChildProcess::wait() {
    if (exited_) {
        return;
    }

    // Wait for the exit without reaping, then reap under the lock.
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
    } while (rc < 0 && errno == EINTR);
    std::string wait_error = rc < 0 ? errno_message("waitid") : std::string();

    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (exited_) {
        return;
    }
    if (rc < 0) {
        exited_ = true;
        throw ProcessError(wait_error);
    }

    int status = 0;
    pid_t reaped;
    do {
        reaped = ::waitpid(pid_, &status, 0);
    } while (reaped < 0 && errno == EINTR);
    if (reaped < 0) {
        exited_ = true;
        throw ProcessError(errno_message("waitpid"));
    }
    reap(status);
}

void ChildProcess::wait_for(std::chrono::milliseconds grace) {
    if (exited_) {
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        siginfo_t info{};
        int rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc == 0 && info.si_pid == pid_) {
            wait();
            return;
        }
        if (rc < 0 && errno != EINTR) {
            // wait() reports the failure.
            wait();
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!exited_) {
        LOG4CPLUS_WARN(core_logger(), options_.command << " did not exit, killing pid=" << pid_);
        kill();
    }
    wait();
}

void ChildProcess::kill() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (pid_ > 0 && !exited_) {
        ::kill(pid_, SIGKILL);
    }
}

} // namespace mrpc

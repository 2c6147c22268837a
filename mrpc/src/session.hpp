#pragma once

#include "child_process.hpp"
#include "rpc/endpoint.hpp"
#include "transport.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace mrpc {

struct SessionOptions {
    rpc::EndpointOptions endpoint;

    /// Start the read loop on a background thread when the session opens.
    bool serve = true;

    /// How long close() waits for the child process and for the read loop.
    std::chrono::milliseconds grace = std::chrono::seconds(10);
};

/**
 * One connection with everything it owns: the stream, the child process at
 * the other end (if any), the Endpoint and its read loop.
 *
 *   auto session = Session::spawn({"mrpc_peer"});
 *   int sum = 0;
 *   session->endpoint().call("add", &sum, 2, 3);
 *   session->close();
 */
class Session {
public:
    explicit Session(std::unique_ptr<transport::FdStream> stream, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Dials a Unix socket path or a "host:port" TCP address.
    static std::unique_ptr<Session> connect(const std::string& address, SessionOptions options = {});

    /// Starts a child process and talks to it over its stdin/stdout.
    static std::unique_ptr<Session> spawn(ChildProcessOptions process, SessionOptions options = {});

    rpc::Endpoint& endpoint() { return *endpoint_; }
    ChildProcess* process() { return process_.get(); }

    /// Runs the read loop on a background thread. No-op if already started.
    void start_serve();

    /**
     * Closes the endpoint, then waits for the child process and the read
     * loop to end. The child is killed once the grace period has passed
     * since close() began, whichever step it is stuck in. All steps run and
     * the first error is rethrown.
     */
    void close();

private:
    Session(std::unique_ptr<ChildProcess> process, std::unique_ptr<transport::FdStream> stream,
            SessionOptions options);

    std::unique_ptr<ChildProcess> process_;
    std::unique_ptr<transport::FdStream> stream_;
    SessionOptions options_;
    std::unique_ptr<rpc::Endpoint> endpoint_;

    std::thread serve_thread_;
    std::future<void> serve_done_;
    bool closed_ = false;
};

} // namespace mrpc

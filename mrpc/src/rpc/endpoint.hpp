#pragma once

#include "codec/binding.hpp"
#include "codec/extension.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "handler.hpp"
#include "logger.hpp"
#include "message.hpp"
#include "transport.hpp"

#include <log4cplus/logger.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mrpc::rpc {

class Batch;

/// Decodes a response result into the caller's target. The decoder is
/// positioned on the result value.
using ResultDecoder = std::function<void(codec::Decoder& dec)>;

struct EndpointOptions {
    /// Sink for diagnostics.
    log4cplus::Logger logger = endpoint_logger();

    /// Worker threads running inbound requests.
    std::size_t handler_threads = 4;

    /// Peer verb executing a batch atomically.
    std::string atomic_method = "nvim_call_atomic";

    std::shared_ptr<const codec::ExtensionRegistry> extensions;
};

/**
 * One MessagePack-RPC connection.
 *
 * serve() is the read loop and must run on exactly one thread. call(),
 * notify() and register_handler() may be used from any thread, including
 * from inside handlers.
 */
class Endpoint {
public:
    Endpoint(transport::Reader& reader, transport::Writer& writer, transport::Closer* closer,
             EndpointOptions options = {});
    ~Endpoint();

    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;

    /**
     * Calls `method` and blocks until the response arrives, decoding the
     * result into `*result`.
     *
     * @throws ApplicationError when the peer answers with an error
     * @throws ConvertError when the result does not fit `Result`
     * @throws ClosedError when the endpoint closes first
     */
    template <typename Result, typename... Args>
    void call(const std::string& method, Result* result, const Args&... args) {
        codec::Encoder params(extensions());
        codec::pack_params(params, args...);
        invoke(method, params, [result](codec::Decoder& dec) { codec::unpack(dec, *result); });
    }

    /// Same as above, discarding the result.
    template <typename... Args>
    void call(const std::string& method, std::nullptr_t, const Args&... args) {
        codec::Encoder params(extensions());
        codec::pack_params(params, args...);
        invoke(method, params, [](codec::Decoder& dec) { dec.skip(); });
    }

    /// Sends a notification. No id is used and no reply is awaited.
    template <typename... Args>
    void notify(const std::string& method, const Args&... args) {
        codec::Encoder params(extensions());
        codec::pack_params(params, args...);
        send_notification(method, params);
    }

    template <typename Fn>
    void register_handler(const std::string& method, Fn&& fn) {
        handlers_.add(method, make_handler(std::forward<Fn>(fn)));
    }

    void register_handler(const std::string& method, std::shared_ptr<Handler> handler);

    /// Serves `options().atomic_method` for peers sending batches.
    void register_atomic_handler();

    Batch new_batch();

    /**
     * Reads and dispatches messages until end of input or close().
     *
     * @throws TransportError on I/O failure
     * @throws std::logic_error if serve() is already running
     */
    void serve();

    /// Closes the stream and fails every pending call with ClosedError.
    void close();

    bool closed() const { return closed_; }

    /// Sends an encoded params array as a request and waits for the reply.
    void invoke(const std::string& method, const codec::Encoder& params, ResultDecoder decode);

    void send_notification(const std::string& method, const codec::Encoder& params);

    const EndpointOptions& options() const { return options_; }
    const codec::ExtensionRegistry* extensions() const { return options_.extensions.get(); }

private:
    struct PendingCall {
        std::uint64_t id = 0;
        std::string method;
        ResultDecoder decode_result;
        std::promise<void> done;
    };

    void add_pending(const std::shared_ptr<PendingCall>& call);
    std::shared_ptr<PendingCall> take_pending(std::uint64_t id);
    void release_pending(std::exception_ptr error);

    /// Throws the write failure that ended the endpoint, or ClosedError after close().
    void check_writable();

    /// Ends the endpoint after a write failed: every pending and later call
    /// fails with `error` and the stream is closed.
    void fail(std::exception_ptr error);

    void handle_request(codec::Decoder& dec, const MessageHeader& header);
    void handle_notification(codec::Decoder& dec, const MessageHeader& header);
    void handle_response(codec::Decoder& dec, const MessageHeader& header);

    void write_message(const codec::Encoder& message);
    void write_result(std::uint64_t id, const codec::Encoder& result);
    void write_error(std::uint64_t id, ErrorKind kind, const std::string& message);

    transport::Reader& reader_;
    transport::Writer& writer_;
    transport::Closer* closer_;
    EndpointOptions options_;

    std::atomic<std::uint64_t> next_id_{1};
    std::atomic<bool> closed_{false};
    std::atomic<bool> serving_{false};

    std::mutex write_mutex_;

    std::mutex pending_mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<PendingCall>> pending_;
    std::exception_ptr terminal_error_;
    std::exception_ptr write_error_;

    HandlerRegistry handlers_;
    Dispatcher dispatcher_;
};

/// Turns an error value from the wire into an ApplicationError for `method`.
/// [kind, message] pairs keep their kind; anything else is rendered as text.
ApplicationError application_error(const std::string& method, const codec::Value& error);

/// Packs the wire form of an error: [kind, message].
void pack_error(codec::Encoder& enc, ErrorKind kind, const std::string& message);

} // namespace mrpc::rpc

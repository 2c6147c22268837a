#include "endpoint.hpp"

#include "atomic.hpp"
#include "batch.hpp"

#include <log4cplus/loggingmacros.h>

#include <stdexcept>

namespace mrpc::rpc {

namespace {

class ServingGuard {
public:
    explicit ServingGuard(std::atomic<bool>& serving) : serving_(serving) {}
    ~ServingGuard() { serving_ = false; }

private:
    std::atomic<bool>& serving_;
};

} // namespace

ApplicationError application_error(const std::string& method, const codec::Value& error) {
    const msgpack::object& value = error.object();
    if (value.type == msgpack::type::ARRAY && value.via.array.size == 2) {
        const msgpack::object& kind = value.via.array.ptr[0];
        if (kind.type == msgpack::type::POSITIVE_INTEGER &&
            (kind.via.u64 == static_cast<std::uint64_t>(ErrorKind::exception) ||
             kind.via.u64 == static_cast<std::uint64_t>(ErrorKind::validation))) {
            return ApplicationError(method, static_cast<ErrorKind>(kind.via.u64),
                                    codec::to_string(value.via.array.ptr[1]));
        }
    }
    return ApplicationError(method, ErrorKind::unknown, codec::to_string(error));
}

void pack_error(codec::Encoder& enc, ErrorKind kind, const std::string& message) {
    enc.pack_array_len(2);
    enc.pack_int(static_cast<int>(kind));
    enc.pack_string(message);
}

Endpoint::Endpoint(transport::Reader& reader, transport::Writer& writer, transport::Closer* closer,
                   EndpointOptions options)
    : reader_(reader),
      writer_(writer),
      closer_(closer),
      options_(std::move(options)),
      dispatcher_(options_.handler_threads, options_.logger) {}

Endpoint::~Endpoint() {
    release_pending(std::make_exception_ptr(ClosedError()));
    dispatcher_.stop();
}

void Endpoint::register_handler(const std::string& method, std::shared_ptr<Handler> handler) {
    handlers_.add(method, std::move(handler));
}

void Endpoint::register_atomic_handler() {
    handlers_.add(options_.atomic_method, std::make_shared<AtomicHandler>(handlers_));
}

Batch Endpoint::new_batch() {
    return Batch(*this);
}

void Endpoint::add_pending(const std::shared_ptr<PendingCall>& call) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (terminal_error_) {
        std::rethrow_exception(terminal_error_);
    }
    pending_.emplace(call->id, call);
}

std::shared_ptr<Endpoint::PendingCall> Endpoint::take_pending(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return nullptr;
    }
    auto call = std::move(it->second);
    pending_.erase(it);
    return call;
}

void Endpoint::release_pending(std::exception_ptr error) {
    std::unordered_map<std::uint64_t, std::shared_ptr<PendingCall>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!terminal_error_) {
            terminal_error_ = error;
        }
        pending.swap(pending_);
    }
    for (auto& entry : pending) {
        entry.second->done.set_exception(terminal_error_);
    }
}

void Endpoint::check_writable() {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (write_error_) {
            std::rethrow_exception(write_error_);
        }
    }
    if (closed_) {
        throw ClosedError();
    }
}

void Endpoint::fail(std::exception_ptr error) {
    LOG4CPLUS_ERROR(options_.logger, "write failed, closing endpoint");
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        write_error_ = error;
    }
    closed_ = true;
    release_pending(error);
    if (closer_) {
        try {
            closer_->close();
        } catch (const TransportError& exc) {
            LOG4CPLUS_WARN(options_.logger, "close after write failure: " << exc.what());
        }
    }
}

void Endpoint::write_message(const codec::Encoder& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    check_writable();
    try {
        writer_.write(message.data(), message.size());
    } catch (const TransportError&) {
        // A partial write leaves the stream unframed; nothing more may be sent.
        if (!closed_) {
            fail(std::current_exception());
        }
        throw;
    }
}

void Endpoint::invoke(const std::string& method, const codec::Encoder& params, ResultDecoder decode) {
    auto call = std::make_shared<PendingCall>();
    call->id = next_id_++;
    call->method = method;
    call->decode_result = std::move(decode);
    auto done = call->done.get_future();

    codec::Encoder request(extensions());
    write_request_header(request, call->id, method);
    request.pack_raw(params.bytes());

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        check_writable();
        // Registered before the write so the reply always finds it.
        add_pending(call);
        try {
            writer_.write(request.data(), request.size());
        } catch (const TransportError&) {
            take_pending(call->id);
            if (!closed_) {
                fail(std::current_exception());
            }
            throw;
        }
    }

    LOG4CPLUS_TRACE(options_.logger, "call " << method << " id=" << call->id);
    done.get();
}

void Endpoint::send_notification(const std::string& method, const codec::Encoder& params) {
    codec::Encoder message(extensions());
    write_notification_header(message, method);
    message.pack_raw(params.bytes());
    write_message(message);
}

void Endpoint::write_result(std::uint64_t id, const codec::Encoder& result) {
    codec::Encoder message(extensions());
    write_response_header(message, id);
    message.pack_nil();
    message.pack_raw(result.bytes());
    write_message(message);
}

void Endpoint::write_error(std::uint64_t id, ErrorKind kind, const std::string& text) {
    codec::Encoder message(extensions());
    write_response_header(message, id);
    pack_error(message, kind, text);
    message.pack_nil();
    write_message(message);
}

void Endpoint::serve() {
    if (serving_.exchange(true)) {
        throw std::logic_error("mrpc: serve is already running");
    }
    ServingGuard guard(serving_);

    codec::Decoder dec(reader_, extensions());
    try {
        for (;;) {
            MessageHeader header;
            try {
                if (!read_message_header(dec, header)) {
                    break;
                }
                switch (header.kind) {
                case MessageKind::request:
                    handle_request(dec, header);
                    break;
                case MessageKind::notification:
                    handle_notification(dec, header);
                    break;
                case MessageKind::response:
                    handle_response(dec, header);
                    break;
                }
            } catch (const ProtocolError& exc) {
                LOG4CPLUS_WARN(options_.logger, exc.what());
            }
            dec.discard_message();
        }
    } catch (const TransportError& exc) {
        if (closed_) {
            release_pending(std::make_exception_ptr(ClosedError()));
            return;
        }
        LOG4CPLUS_ERROR(options_.logger, "serve: " << exc.what());
        release_pending(std::current_exception());
        throw;
    }

    LOG4CPLUS_DEBUG(options_.logger, "serve: end of input");
    release_pending(std::make_exception_ptr(ClosedError()));
}

void Endpoint::handle_request(codec::Decoder& dec, const MessageHeader& header) {
    std::uint64_t id = header.id;
    std::shared_ptr<Handler> handler = handlers_.find(header.method);
    if (!handler) {
        LOG4CPLUS_WARN(options_.logger, "Unknown request method: " << header.method);
        std::string text = "unknown request method: " + header.method;
        dispatcher_.post([this, id, text] { write_error(id, ErrorKind::exception, text); });
        return;
    }

    Invocation invocation;
    try {
        invocation = handler->bind(dec, header.argc);
    } catch (const TransportError&) {
        throw;
    } catch (const Error& exc) {
        LOG4CPLUS_WARN(options_.logger, header.method << ": " << exc.what());
        std::string text = exc.what();
        dispatcher_.post([this, id, text] { write_error(id, ErrorKind::validation, text); });
        return;
    }

    std::string method = header.method;
    dispatcher_.post([this, id, method, handler, invocation] {
        codec::Encoder result(extensions());
        try {
            invocation(result);
        } catch (const ApplicationError& exc) {
            write_error(id, exc.kind(), exc.message());
            return;
        } catch (const std::exception& exc) {
            LOG4CPLUS_DEBUG(options_.logger, method << " failed: " << exc.what());
            write_error(id, ErrorKind::exception, exc.what());
            return;
        } catch (...) {
            LOG4CPLUS_WARN(options_.logger, method << " threw a non-standard exception");
            write_error(id, ErrorKind::exception, "unknown exception");
            return;
        }
        write_result(id, result);
    });
}

void Endpoint::handle_notification(codec::Decoder& dec, const MessageHeader& header) {
    std::shared_ptr<Handler> handler = handlers_.find(header.method);
    if (!handler) {
        LOG4CPLUS_WARN(options_.logger, "Unknown notification method: " << header.method);
        return;
    }

    Invocation invocation;
    try {
        invocation = handler->bind(dec, header.argc);
    } catch (const TransportError&) {
        throw;
    } catch (const Error& exc) {
        LOG4CPLUS_WARN(options_.logger, header.method << ": " << exc.what());
        return;
    }

    std::string method = header.method;
    dispatcher_.post_ordered([this, method, handler, invocation] {
        codec::Encoder ignored(extensions());
        try {
            invocation(ignored);
        } catch (const std::exception& exc) {
            LOG4CPLUS_WARN(options_.logger, "notification " << method << " failed: " << exc.what());
        } catch (...) {
            LOG4CPLUS_WARN(options_.logger, "notification " << method << " threw a non-standard exception");
        }
    });
}

void Endpoint::handle_response(codec::Decoder& dec, const MessageHeader& header) {
    std::shared_ptr<PendingCall> call = take_pending(header.id);
    if (!call) {
        throw ProtocolError("mrpc: response for unknown id " + std::to_string(header.id));
    }

    try {
        codec::Value error;
        codec::decode(dec, error);
        if (!error.is_nil()) {
            call->done.set_exception(std::make_exception_ptr(application_error(call->method, error)));
            return;
        }
        if (!dec.next()) {
            throw TransportError("mrpc: unexpected end of input");
        }
        call->decode_result(dec);
        call->done.set_value();
    } catch (const TransportError&) {
        call->done.set_exception(std::current_exception());
        throw;
    } catch (const std::exception&) {
        call->done.set_exception(std::current_exception());
    }
}

void Endpoint::close() {
    if (closed_.exchange(true)) {
        return;
    }

    std::exception_ptr error;
    if (closer_) {
        try {
            closer_->close();
        } catch (const TransportError&) {
            error = std::current_exception();
        }
    }

    release_pending(std::make_exception_ptr(ClosedError()));
    if (error) {
        std::rethrow_exception(error);
    }
}

} // namespace mrpc::rpc

#include "test_helpers.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>
#include <log4cplus/loggingmacros.h>

#include <signal.h>

#include <mutex>

namespace {
class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() {
            init_logging("../mrpc/src/log4cplus.ini");
            // Writes to a child that died must fail with EPIPE, as in mrpc_peer.
            ::signal(SIGPIPE, SIG_IGN);
        });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

void close_quietly(mrpc::rpc::Endpoint& endpoint) {
    try {
        endpoint.close();
    } catch (const mrpc::Error& exc) {
        LOG4CPLUS_WARN(core_logger(), "close: " << exc.what());
    }
}
} // namespace

void serve_in_background(mrpc::rpc::Endpoint& endpoint, std::thread& thread) {
    thread = std::thread([&endpoint]() {
        try {
            endpoint.serve();
        } catch (const mrpc::Error& exc) {
            LOG4CPLUS_WARN(core_logger(), "serve: " << exc.what());
        }
    });
}

Loopback::Loopback(mrpc::rpc::EndpointOptions client_options, mrpc::rpc::EndpointOptions server_options) {
    mrpc::transport::make_socket_pair(client_stream_, server_stream_);
    client_ = std::make_unique<mrpc::rpc::Endpoint>(*client_stream_, *client_stream_, client_stream_.get(),
                                                    std::move(client_options));
    server_ = std::make_unique<mrpc::rpc::Endpoint>(*server_stream_, *server_stream_, server_stream_.get(),
                                                    std::move(server_options));
    serve_in_background(*client_, client_thread_);
    serve_in_background(*server_, server_thread_);
}

Loopback::~Loopback() {
    close_quietly(*client_);
    close_quietly(*server_);
    client_thread_.join();
    server_thread_.join();
}

FakePeer::FakePeer(mrpc::rpc::EndpointOptions options) {
    mrpc::transport::make_socket_pair(peer_stream_, endpoint_stream_);
    decoder_ = std::make_unique<mrpc::codec::Decoder>(*peer_stream_, options.extensions.get());
    endpoint_ = std::make_unique<mrpc::rpc::Endpoint>(*endpoint_stream_, *endpoint_stream_, endpoint_stream_.get(),
                                                      std::move(options));
    serve_in_background(*endpoint_, serve_thread_);
}

FakePeer::~FakePeer() {
    close_quietly(*endpoint_);
    peer_stream_->close();
    serve_thread_.join();
}

std::optional<mrpc::rpc::Message> FakePeer::read() {
    return mrpc::rpc::decode_message(*decoder_);
}

void FakePeer::write(const mrpc::rpc::Message& message) {
    mrpc::codec::Encoder enc;
    mrpc::rpc::encode_message(enc, message);
    write_raw(enc.bytes());
}

void FakePeer::write_raw(std::string_view bytes) {
    peer_stream_->write(bytes.data(), bytes.size());
}

void FakePeer::close() {
    peer_stream_->close();
}

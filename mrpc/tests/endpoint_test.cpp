#include <gtest/gtest.h>

#include "errors.hpp"
#include "rpc/endpoint.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using mrpc::codec::Value;
using namespace mrpc::rpc;

namespace {

std::future<std::int64_t> call_async(Endpoint& endpoint, const std::string& method, std::int64_t arg) {
    return std::async(std::launch::async, [&endpoint, method, arg]() {
        std::int64_t result = 0;
        endpoint.call(method, &result, arg);
        return result;
    });
}

Request expect_request(FakePeer& peer) {
    auto message = peer.read();
    if (!message) {
        throw std::runtime_error("peer stream ended");
    }
    const auto* request = std::get_if<Request>(&*message);
    if (!request) {
        throw std::runtime_error("expected a request");
    }
    return *request;
}

/// Forwards the first write, then fails every later one like a broken pipe.
class FailingWriter final : public mrpc::transport::Writer {
public:
    explicit FailingWriter(mrpc::transport::Writer& target) : target_(target) {}

    void write(const char* data, std::size_t size) override {
        if (writes_++ == 0) {
            target_.write(data, size);
            first_written_.set_value();
            return;
        }
        throw mrpc::TransportError("mrpc: write: Broken pipe");
    }

    std::future<void> first_write() { return first_written_.get_future(); }

private:
    mrpc::transport::Writer& target_;
    std::atomic<int> writes_{0};
    std::promise<void> first_written_;
};

} // namespace

TEST(Endpoint, CallReturnsHandlerResult) {
    Loopback loop;
    loop.server().register_handler("add", [](std::int64_t a, std::int64_t b) { return a + b; });

    int sum = 0;
    loop.client().call("add", &sum, 2, 3);
    EXPECT_EQ(sum, 5);
}

TEST(Endpoint, BothSidesCanServeHandlers) {
    Loopback loop;
    loop.server().register_handler("upper", [](std::string s) {
        for (auto& c : s) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return s;
    });
    loop.client().register_handler("ping", []() { return std::string("pong"); });

    std::string out;
    loop.client().call("upper", &out, "abc");
    EXPECT_EQ(out, "ABC");

    loop.server().call("ping", &out);
    EXPECT_EQ(out, "pong");
}

TEST(Endpoint, ConcurrentCallsGetTheirOwnResults) {
    Loopback loop;
    loop.server().register_handler("echo", [](std::int64_t v) { return v; });

    std::vector<std::future<std::int64_t>> calls;
    for (std::int64_t i = 0; i < 32; ++i) {
        calls.push_back(call_async(loop.client(), "echo", i));
    }
    for (std::int64_t i = 0; i < 32; ++i) {
        EXPECT_EQ(calls[i].get(), i);
    }
}

TEST(Endpoint, OutOfOrderResponsesReachTheirCallers) {
    FakePeer peer;
    auto first = call_async(peer.endpoint(), "f", 1);
    Request r1 = expect_request(peer);
    auto second = call_async(peer.endpoint(), "f", 2);
    Request r2 = expect_request(peer);
    EXPECT_NE(r1.id, r2.id);

    peer.write(Response{r2.id, std::nullopt, Value(200)});
    EXPECT_EQ(second.get(), 200);
    EXPECT_EQ(first.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    peer.write(Response{r1.id, std::nullopt, Value(100)});
    EXPECT_EQ(first.get(), 100);
}

TEST(Endpoint, CloseUnblocksEveryPendingCall) {
    FakePeer peer;
    std::vector<std::future<std::int64_t>> calls;
    for (int i = 0; i < 3; ++i) {
        calls.push_back(call_async(peer.endpoint(), "never", i));
        expect_request(peer);
    }

    peer.endpoint().close();
    for (auto& call : calls) {
        EXPECT_THROW(call.get(), mrpc::ClosedError);
    }

    int result = 0;
    EXPECT_THROW(peer.endpoint().call("late", &result), mrpc::ClosedError);
}

TEST(Endpoint, PeerHangupFailsPendingCalls) {
    FakePeer peer;
    auto call = call_async(peer.endpoint(), "never", 0);
    expect_request(peer);
    peer.close();
    EXPECT_THROW(call.get(), mrpc::ClosedError);
}

TEST(Endpoint, NotifyUsesNoIdAndDoesNotWait) {
    FakePeer peer;
    peer.endpoint().notify("event", 1);
    peer.endpoint().notify("event", "two");
    auto call = call_async(peer.endpoint(), "after", 0);

    for (int i = 0; i < 2; ++i) {
        auto message = peer.read();
        ASSERT_TRUE(message.has_value());
        const auto* n = std::get_if<Notification>(&*message);
        ASSERT_NE(n, nullptr);
        EXPECT_EQ(n->method, "event");
    }

    Request request = expect_request(peer);
    EXPECT_EQ(request.id, 1u);
    peer.write(Response{request.id, std::nullopt, Value(1)});
    EXPECT_EQ(call.get(), 1);
}

TEST(Endpoint, UnknownMethodIsAnError) {
    Loopback loop;
    int result = 0;
    try {
        loop.client().call("missing", &result);
        FAIL() << "expected ApplicationError";
    } catch (const mrpc::ApplicationError& exc) {
        EXPECT_EQ(exc.kind(), mrpc::ErrorKind::exception);
        EXPECT_EQ(exc.method(), "missing");
        EXPECT_NE(exc.message().find("missing"), std::string::npos);
    }
}

TEST(Endpoint, ParamConversionFailureIsValidationError) {
    Loopback loop;
    loop.server().register_handler("add", [](std::int64_t a, std::int64_t b) { return a + b; });

    std::int64_t result = 0;
    try {
        loop.client().call("add", &result, "two", 3);
        FAIL() << "expected ApplicationError";
    } catch (const mrpc::ApplicationError& exc) {
        EXPECT_EQ(exc.kind(), mrpc::ErrorKind::validation);
    }

    loop.client().call("add", &result, 2, 3);
    EXPECT_EQ(result, 5);
}

TEST(Endpoint, MissingParamsDefaultAndSurplusParamsAreSkipped) {
    Loopback loop;
    loop.server().register_handler("combine", [](int a, int b) { return a * 10 + b; });

    int result = 0;
    loop.client().call("combine", &result, 4);
    EXPECT_EQ(result, 40);

    loop.client().call("combine", &result, 1, 2, "extra", Value::Array{Value(9)});
    EXPECT_EQ(result, 12);
}

TEST(Endpoint, HandlerExceptionsBecomeErrorResponses) {
    Loopback loop;
    loop.server().register_handler("boom", []() -> int { throw std::runtime_error("kaboom"); });
    loop.server().register_handler("reject", [](const std::string& why) {
        throw mrpc::ApplicationError(mrpc::ErrorKind::validation, why);
    });

    int result = 0;
    try {
        loop.client().call("boom", &result);
        FAIL() << "expected ApplicationError";
    } catch (const mrpc::ApplicationError& exc) {
        EXPECT_EQ(exc.kind(), mrpc::ErrorKind::exception);
        EXPECT_EQ(exc.message(), "kaboom");
        EXPECT_STREQ(exc.what(), "mrpc:boom exception: kaboom");
    }

    try {
        loop.client().call("reject", nullptr, "bad input");
        FAIL() << "expected ApplicationError";
    } catch (const mrpc::ApplicationError& exc) {
        EXPECT_EQ(exc.kind(), mrpc::ErrorKind::validation);
        EXPECT_EQ(exc.message(), "bad input");
    }
}

TEST(Endpoint, NonStandardThrowIsExceptionKind) {
    Loopback loop;
    loop.server().register_handler("odd", []() -> int { throw 42; });

    int result = 0;
    try {
        loop.client().call("odd", &result);
        FAIL() << "expected ApplicationError";
    } catch (const mrpc::ApplicationError& exc) {
        EXPECT_EQ(exc.kind(), mrpc::ErrorKind::exception);
        EXPECT_EQ(exc.message(), "unknown exception");
    }

    // The worker survived and keeps serving.
    loop.server().register_handler("one", []() { return 1; });
    loop.client().call("one", &result);
    EXPECT_EQ(result, 1);
}

TEST(Endpoint, WriteFailureEndsTheEndpoint) {
    std::unique_ptr<mrpc::transport::FdStream> ours;
    std::unique_ptr<mrpc::transport::FdStream> theirs;
    mrpc::transport::make_socket_pair(ours, theirs);
    FailingWriter writer(*ours);
    auto first_written = writer.first_write();

    Endpoint endpoint(*ours, writer, ours.get());
    std::thread serve_thread;
    serve_in_background(endpoint, serve_thread);

    auto pending = call_async(endpoint, "never_answered", 1);
    ASSERT_EQ(first_written.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    try {
        endpoint.notify("note", 2);
        FAIL() << "expected TransportError";
    } catch (const mrpc::TransportError& exc) {
        EXPECT_STREQ(exc.what(), "mrpc: write: Broken pipe");
    }
    EXPECT_TRUE(endpoint.closed());

    // The call already on the wire fails with the write error, not a hang.
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    try {
        pending.get();
        FAIL() << "expected TransportError";
    } catch (const mrpc::TransportError& exc) {
        EXPECT_STREQ(exc.what(), "mrpc: write: Broken pipe");
    }

    int result = 0;
    try {
        endpoint.call("later", &result);
        FAIL() << "expected TransportError";
    } catch (const mrpc::ClosedError&) {
        FAIL() << "expected the write error, got ClosedError";
    } catch (const mrpc::TransportError& exc) {
        EXPECT_STREQ(exc.what(), "mrpc: write: Broken pipe");
    }

    serve_thread.join();
}

TEST(Endpoint, ResultConversionFailureKeepsConnectionUsable) {
    Loopback loop;
    loop.server().register_handler("name", []() { return std::string("not a number"); });
    loop.server().register_handler("one", []() { return 1; });

    int result = 0;
    EXPECT_THROW(loop.client().call("name", &result), mrpc::ConvertError);

    loop.client().call("one", &result);
    EXPECT_EQ(result, 1);
}

TEST(Endpoint, NonStandardErrorValueIsUnknownKind) {
    FakePeer peer;
    auto call = call_async(peer.endpoint(), "m", 0);
    Request request = expect_request(peer);
    peer.write(Response{request.id, Value("plain failure"), Value()});

    try {
        call.get();
        FAIL() << "expected ApplicationError";
    } catch (const mrpc::ApplicationError& exc) {
        EXPECT_EQ(exc.kind(), mrpc::ErrorKind::unknown);
        EXPECT_EQ(exc.method(), "m");
    }
}

TEST(Endpoint, ResponseForUnknownIdIsDropped) {
    FakePeer peer;
    peer.write(Response{999, std::nullopt, Value(1)});
    peer.write_raw(encode_bytes([](mrpc::codec::Encoder& enc) { enc.pack_string("garbage"); }));

    auto call = call_async(peer.endpoint(), "f", 0);
    Request request = expect_request(peer);
    peer.write(Response{request.id, std::nullopt, Value(5)});
    EXPECT_EQ(call.get(), 5);
}

TEST(Endpoint, NotificationsRunInArrivalOrder) {
    Loopback loop;
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<int> seen;
    loop.server().register_handler("push", [&](int v) {
        if (v % 3 == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(v);
        cv.notify_all();
    });

    const int count = 50;
    for (int i = 0; i < count; ++i) {
        loop.client().notify("push", i);
    }

    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return seen.size() == static_cast<std::size_t>(count); }));
    for (int i = 0; i < count; ++i) {
        EXPECT_EQ(seen[i], i);
    }
}

TEST(Endpoint, HandlersMayCallBackIntoThePeer) {
    Loopback loop;
    loop.client().register_handler("base", []() { return 40; });
    Endpoint& server = loop.server();
    loop.server().register_handler("answer", [&server]() {
        int base = 0;
        server.call("base", &base);
        return base + 2;
    });

    int result = 0;
    loop.client().call("answer", &result);
    EXPECT_EQ(result, 42);
}

TEST(Endpoint, ReRegisteringReplacesHandler) {
    Loopback loop;
    loop.server().register_handler("v", []() { return 1; });
    loop.server().register_handler("v", []() { return 2; });

    int result = 0;
    loop.client().call("v", &result);
    EXPECT_EQ(result, 2);
}

TEST(Endpoint, SecondServeIsRejected) {
    Loopback loop;
    // Loopback already runs serve() on both endpoints.
    int result = 0;
    loop.server().register_handler("one", []() { return 1; });
    loop.client().call("one", &result);
    EXPECT_THROW(loop.client().serve(), std::logic_error);
}

TEST(HandlerRegistry, RejectsEmptyNameAndNullHandler) {
    HandlerRegistry registry;
    EXPECT_THROW(registry.add("", make_handler([]() {})), std::invalid_argument);
    EXPECT_THROW(registry.add("x", nullptr), std::invalid_argument);

    auto handler = make_handler([](int, const std::string&) {});
    EXPECT_EQ(handler->arity(), 2u);
    registry.add("x", handler);
    EXPECT_EQ(registry.find("x"), handler);
    EXPECT_EQ(registry.find("y"), nullptr);
}

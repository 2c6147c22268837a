#include "atomic.hpp"

#include "errors.hpp"

#include <optional>

namespace mrpc::rpc {

namespace {

struct Failure {
    std::size_t index = 0;
    ErrorKind kind = ErrorKind::exception;
    std::string message;
};

struct Step {
    std::string method;
    std::shared_ptr<Handler> handler;
    Invocation invocation;
};

struct Plan {
    std::vector<Step> steps;
    std::optional<Failure> failure;
};

void next_value(codec::Decoder& dec) {
    if (!dec.next()) {
        throw TransportError("mrpc: unexpected end of input");
    }
}

// Binds one [method, params] pair from its own subtree, so a bad pair
// cannot misalign the ones after it.
Step bind_step(const HandlerRegistry& registry, const msgpack::object& pair, const codec::ExtensionRegistry* extensions) {
    codec::Decoder dec(pair, extensions);
    next_value(dec);
    if (dec.array_length() != 2) {
        throw ApplicationError(ErrorKind::validation, "batch entry must be [method, params]");
    }

    Step step;
    next_value(dec);
    step.method = dec.string_value();
    step.handler = registry.find(step.method);
    if (!step.handler) {
        throw ApplicationError(ErrorKind::validation, "unknown method: " + step.method);
    }
    next_value(dec);
    std::uint32_t argc = dec.array_length();
    step.invocation = step.handler->bind(dec, argc);
    return step;
}

} // namespace

std::mutex& AtomicHandler::execution_mutex() {
    static std::mutex mutex;
    return mutex;
}

Invocation AtomicHandler::bind(codec::Decoder& dec, std::uint32_t argc) {
    if (argc != 1) {
        throw ApplicationError(ErrorKind::validation, "batch takes exactly one argument");
    }
    next_value(dec);

    auto plan = std::make_shared<Plan>();
    std::uint32_t count = dec.array_length();
    for (std::uint32_t i = 0; i < count; ++i) {
        next_value(dec);
        const msgpack::object& pair = dec.object();
        if (plan->failure) {
            continue;
        }
        try {
            plan->steps.push_back(bind_step(registry_, pair, dec.extensions()));
        } catch (const ApplicationError& exc) {
            plan->failure = Failure{i, exc.kind(), exc.message()};
        } catch (const ConvertError& exc) {
            plan->failure = Failure{i, ErrorKind::validation, exc.what()};
        }
    }

    return [plan](codec::Encoder& result) {
        codec::Encoder results(result.extensions());
        std::size_t completed = 0;
        std::optional<Failure> failure;
        {
            std::lock_guard<std::mutex> lock(execution_mutex());
            for (auto& step : plan->steps) {
                codec::Encoder value(result.extensions());
                try {
                    step.invocation(value);
                } catch (const ApplicationError& exc) {
                    failure = Failure{completed, exc.kind(), exc.message()};
                    break;
                } catch (const std::exception& exc) {
                    failure = Failure{completed, ErrorKind::exception, exc.what()};
                    break;
                }
                results.pack_raw(value.bytes());
                ++completed;
            }
        }
        if (!failure) {
            failure = plan->failure;
        }

        result.pack_array_len(2);
        result.pack_array_len(completed);
        result.pack_raw(results.bytes());
        if (failure) {
            result.pack_array_len(3);
            result.pack_uint(failure->index);
            result.pack_int(static_cast<int>(failure->kind));
            result.pack_string(failure->message);
        } else {
            result.pack_nil();
        }
    };
}

} // namespace mrpc::rpc

#include "batch.hpp"

#include <algorithm>
#include <functional>

namespace mrpc::rpc {

namespace {

class ResetGuard {
public:
    explicit ResetGuard(std::function<void()> reset) : reset_(std::move(reset)) {}
    ~ResetGuard() { reset_(); }

private:
    std::function<void()> reset_;
};

void next_value(codec::Decoder& dec) {
    if (!dec.next()) {
        throw TransportError("mrpc: unexpected end of input");
    }
}

} // namespace

Batch::Batch(Endpoint& endpoint) : endpoint_(endpoint), buffer_(endpoint.extensions()) {}

void Batch::append(const std::string& method, ResultDecoder decode) {
    methods_.push_back(method);
    results_.push_back(std::move(decode));
    buffer_.pack_array_len(2);
    buffer_.pack_string(method);
}

void Batch::reset() {
    buffer_.clear();
    methods_.clear();
    results_.clear();
    error_ = nullptr;
}

void Batch::execute() {
    ResetGuard guard([this] { reset(); });

    if (error_) {
        std::rethrow_exception(error_);
    }

    codec::Encoder params(endpoint_.extensions());
    params.pack_array_len(1);
    params.pack_array_len(methods_.size());
    params.pack_raw(buffer_.bytes());

    Failure failure;
    bool failed = false;
    endpoint_.invoke(endpoint_.options().atomic_method, params,
                     [this, &failure, &failed](codec::Decoder& dec) { decode_reply(dec, failure, failed); });
    if (!failed) {
        return;
    }

    if (failure.index < 0 || failure.index >= static_cast<std::int64_t>(methods_.size()) ||
        (failure.kind != static_cast<int>(ErrorKind::exception) &&
         failure.kind != static_cast<int>(ErrorKind::validation))) {
        throw ApplicationError(endpoint_.options().atomic_method, ErrorKind::unknown,
                               std::to_string(failure.index) + " " + std::to_string(failure.kind) + " " +
                                   failure.message);
    }

    auto index = static_cast<std::size_t>(failure.index);
    throw BatchError(index, ApplicationError(methods_[index], static_cast<ErrorKind>(failure.kind), failure.message));
}

// Runs on the read loop while the reply is still buffered.
void Batch::decode_reply(codec::Decoder& dec, Failure& failure, bool& failed) {
    if (dec.array_length() != 2) {
        throw ProtocolError("mrpc: batch reply must be [results, error]");
    }

    next_value(dec);
    std::uint32_t count = dec.array_length();
    std::vector<const msgpack::object*> values;
    values.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        next_value(dec);
        values.push_back(&dec.object());
    }

    next_value(dec);
    if (dec.type() != codec::Type::nil) {
        if (dec.array_length() != 3) {
            throw ProtocolError("mrpc: batch error must be [index, kind, message]");
        }
        codec::decode(dec, failure.index);
        codec::decode(dec, failure.kind);
        codec::decode(dec, failure.message);
        failed = true;
    }

    std::size_t limit = std::min(values.size(), results_.size());
    if (failed && failure.index >= 0) {
        limit = std::min(limit, static_cast<std::size_t>(failure.index));
    }
    for (std::size_t i = 0; i < limit; ++i) {
        codec::Decoder value(*values[i], dec.extensions());
        next_value(value);
        results_[i](value);
    }
}

} // namespace mrpc::rpc

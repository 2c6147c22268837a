#pragma once

#include "codec/binding.hpp"
#include "endpoint.hpp"

#include <cstddef>
#include <exception>
#include <string>
#include <vector>

namespace mrpc::rpc {

/**
 * Collects calls and sends them as one atomic request.
 *
 *   auto b = endpoint.new_batch();
 *   b.call("set", nullptr, "key", 1);
 *   b.call("get", &value, "key");
 *   b.execute();
 *
 * Result targets are written only by execute(). A batch is reusable: it is
 * empty again after every execute(), whether or not it failed.
 */
class Batch {
public:
    explicit Batch(Endpoint& endpoint);

    template <typename Result, typename... Args>
    void call(const std::string& method, Result* result, const Args&... args) {
        if (error_) {
            return;
        }
        append(method, [result](codec::Decoder& dec) { codec::unpack(dec, *result); });
        try {
            codec::pack_params(buffer_, args...);
        } catch (const EncodeError&) {
            error_ = std::current_exception();
        }
    }

    template <typename... Args>
    void call(const std::string& method, std::nullptr_t, const Args&... args) {
        if (error_) {
            return;
        }
        append(method, [](codec::Decoder& dec) { dec.skip(); });
        try {
            codec::pack_params(buffer_, args...);
        } catch (const EncodeError&) {
            error_ = std::current_exception();
        }
    }

    /**
     * Runs the collected calls.
     *
     * @throws EncodeError if a call could not be encoded (nothing is sent)
     * @throws BatchError when call `index` failed; earlier results are set
     */
    void execute();

    std::size_t size() const { return methods_.size(); }

private:
    struct Failure {
        std::int64_t index = 0;
        std::int64_t kind = 0;
        std::string message;
    };

    void append(const std::string& method, ResultDecoder decode);
    void decode_reply(codec::Decoder& dec, Failure& failure, bool& failed);
    void reset();

    Endpoint& endpoint_;
    codec::Encoder buffer_;
    std::vector<std::string> methods_;
    std::vector<ResultDecoder> results_;
    std::exception_ptr error_;
};

} // namespace mrpc::rpc

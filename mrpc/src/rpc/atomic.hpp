#pragma once

#include "handler.hpp"

#include <mutex>

namespace mrpc::rpc {

/**
 * Server side of the atomic batch verb.
 *
 * The single argument is an array of [method, params] pairs. Every pair is
 * bound up front; the calls then run in order while holding a process-wide
 * lock, so batches arriving on different connections never interleave.
 * Execution stops at the first failure. The reply is
 * [results, nil] or [results, [index, kind, message]], where results holds
 * one entry per call that completed.
 */
class AtomicHandler final : public Handler {
public:
    explicit AtomicHandler(const HandlerRegistry& registry) : registry_(registry) {}

    std::size_t arity() const override { return 1; }
    Invocation bind(codec::Decoder& dec, std::uint32_t argc) override;

    /// Lock held while a batch runs.
    static std::mutex& execution_mutex();

private:
    const HandlerRegistry& registry_;
};

} // namespace mrpc::rpc

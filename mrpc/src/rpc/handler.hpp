#pragma once

#include "codec/binding.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mrpc::rpc {

/// Prepared call of a handler: runs it and packs exactly one result value.
using Invocation = std::function<void(codec::Encoder& result)>;

class Handler {
public:
    virtual ~Handler() = default;

    /// Number of declared parameters.
    virtual std::size_t arity() const = 0;

    /// Decodes `argc` params (the decoder sits on the params array header)
    /// and returns the deferred call. Runs on the read loop; the returned
    /// invocation runs on a dispatcher thread.
    virtual Invocation bind(codec::Decoder& dec, std::uint32_t argc) = 0;
};

namespace detail {

template <typename T>
struct function_traits : function_traits<decltype(&T::operator())> {};

template <typename R, typename... A>
struct function_traits<R (*)(A...)> {
    using result_type = R;
    using args_type = std::tuple<std::decay_t<A>...>;
};

template <typename R, typename... A>
struct function_traits<R(A...)> : function_traits<R (*)(A...)> {};

template <typename C, typename R, typename... A>
struct function_traits<R (C::*)(A...)> : function_traits<R (*)(A...)> {};

template <typename C, typename R, typename... A>
struct function_traits<R (C::*)(A...) const> : function_traits<R (*)(A...)> {};

template <typename R, typename... A>
struct function_traits<std::function<R(A...)>> : function_traits<R (*)(A...)> {};

template <typename Tuple>
struct params_supported;

template <typename... A>
struct params_supported<std::tuple<A...>>
    : std::bool_constant<(... && (std::is_default_constructible_v<A> && !std::is_pointer_v<A>))> {};

} // namespace detail

/**
 * Handler built from any callable.
 *
 * Parameters are decoded positionally. Missing trailing params keep their
 * default-constructed value and surplus params are skipped. A void return
 * packs nil. Failures are reported by throwing.
 */
template <typename Fn>
class FunctionHandler final : public Handler {
    using traits = detail::function_traits<Fn>;
    using Args = typename traits::args_type;
    using Result = std::decay_t<typename traits::result_type>;

    static_assert(detail::params_supported<Args>::value,
                  "handler parameters must be default-constructible values");

public:
    explicit FunctionHandler(Fn fn) : fn_(std::move(fn)) {}

    std::size_t arity() const override { return std::tuple_size_v<Args>; }

    Invocation bind(codec::Decoder& dec, std::uint32_t argc) override {
        auto args = std::make_shared<Args>();
        bind_args(dec, argc, *args, std::make_index_sequence<std::tuple_size_v<Args>>{});
        return [this, args](codec::Encoder& result) {
            if constexpr (std::is_void_v<Result>) {
                std::apply(fn_, std::move(*args));
                result.pack_nil();
            } else {
                Result value = std::apply(fn_, std::move(*args));
                codec::pack(result, value);
            }
        };
    }

private:
    template <std::size_t... I>
    static void bind_args(codec::Decoder& dec, std::uint32_t argc, Args& args, std::index_sequence<I...>) {
        std::uint32_t index = 0;
        auto bind_one = [&](auto& arg) {
            if (index++ < argc) {
                codec::decode(dec, arg);
            }
        };
        (bind_one(std::get<I>(args)), ...);
        for (codec::Nil surplus; index < argc; ++index) {
            codec::decode(dec, surplus);
        }
    }

    Fn fn_;
};

/**
 * Method name -> handler. Registering a method again replaces the previous
 * handler; invocations already bound to it still complete.
 */
class HandlerRegistry {
public:
    void add(const std::string& method, std::shared_ptr<Handler> handler);
    std::shared_ptr<Handler> find(const std::string& method) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Handler>> handlers_;
};

template <typename Fn>
std::shared_ptr<Handler> make_handler(Fn&& fn) {
    return std::make_shared<FunctionHandler<std::decay_t<Fn>>>(std::forward<Fn>(fn));
}

} // namespace mrpc::rpc

#pragma once

#include "mockforge/failure.h"
#include "mockforge/matchers.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <fmt/core.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace mockforge {

// Per-instance configuration for generated mocks.
// - strict: report unstubbed calls through the fail handler before returning the default value
// - fail_handler: overrides the process-wide handler for this mock only
struct MockOptions {
    bool        strict = false;
    FailHandler fail_handler;
};

class MockState {
  public:
    MockState() = default;
    explicit MockState(MockOptions options) : options_(std::move(options)) {}

    MockState(const MockState &)            = delete;
    MockState &operator=(const MockState &) = delete;

    bool strict() const { return options_.strict; }

    void report(const std::string &message) const {
        if (options_.fail_handler) {
            options_.fail_handler(message);
            return;
        }
        ::mockforge::fail(message);
    }

  private:
    MockOptions options_;
};

class InvocationCountMatcher {
  public:
    InvocationCountMatcher(std::function<bool(std::size_t)> test, std::string description)
        : test_(std::move(test)), description_(std::move(description)) {}

    bool               matches(std::size_t observed) const { return test_(observed); }
    const std::string &description() const { return description_; }

  private:
    std::function<bool(std::size_t)> test_;
    std::string                      description_;
};

inline InvocationCountMatcher times(std::size_t n) {
    return {[n](std::size_t c) { return c == n; }, fmt::format("exactly {}", n)};
}
inline InvocationCountMatcher once() { return times(1); }
inline InvocationCountMatcher never() { return times(0); }
inline InvocationCountMatcher at_least(std::size_t n) {
    return {[n](std::size_t c) { return c >= n; }, fmt::format("at least {}", n)};
}
inline InvocationCountMatcher at_most(std::size_t n) {
    return {[n](std::size_t c) { return c <= n; }, fmt::format("at most {}", n)};
}

// Tracks the last verified invocation across mocks for verify_in_order().
struct InOrderContext {
    std::uint64_t last_ordinal = 0;
};

template <typename Signature> class MethodMock;

// Recorder and stub table for one mocked method. `Args` are the stored (decayed)
// argument types; a variadic parameter is stored as a single std::vector.
template <typename R, typename... Args> class MethodMock<R(Args...)> {
  public:
    using Arguments  = std::tuple<Args...>;
    using Answer     = std::function<R(const Args &...)>;
    using Predicates = std::tuple<match::ArgPredicate<Args>...>;

    class Stubbing {
      public:
        // Several values build the aggregate result (std::tuple / std::pair).
        template <typename... V> Stubbing &then_return(V &&...values) {
            static_assert(!std::is_void_v<R>, "then_return() is not available for void methods");
            static_assert(sizeof...(V) >= 1, "then_return() needs a value");
            if constexpr (std::is_reference_v<R>) {
                static_assert(sizeof...(V) == 1, "a reference result takes exactly one value");
                if constexpr ((std::is_lvalue_reference_v<V> && ...)) {
                    // Refers to the caller's object, which must outlive the stub.
                    auto *target = std::addressof(values...);
                    answers_.push_back([target](const Args &...) -> R { return static_cast<R>(*target); });
                } else {
                    // A temporary is kept alive by the answer itself.
                    auto owned = std::make_shared<std::remove_cvref_t<R>>(std::forward<V>(values)...);
                    answers_.push_back([owned](const Args &...) -> R { return static_cast<R>(*owned); });
                }
            } else if constexpr (sizeof...(V) == 1) {
                answers_.push_back([captured = std::make_tuple(std::forward<V>(values)...)](const Args &...) -> R {
                    return R(std::get<0>(captured));
                });
            } else {
                answers_.push_back([captured = std::make_tuple(std::forward<V>(values)...)](const Args &...) -> R {
                    return std::make_from_tuple<R>(captured);
                });
            }
            return *this;
        }

        template <typename Callable> Stubbing &then(Callable &&callable) {
            answers_.push_back(Answer{std::forward<Callable>(callable)});
            return *this;
        }

        template <typename E> Stubbing &then_throw(E error) {
            answers_.push_back([error](const Args &...) -> R { throw error; });
            return *this;
        }

      private:
        friend class MethodMock;

        std::optional<Predicates> predicates_;
        std::vector<Answer>       answers_;
        std::size_t               next_answer_ = 0;
    };

    MethodMock(const MockState &state, std::string name) : state_(&state), name_(std::move(name)) {}

    MethodMock(const MethodMock &)            = delete;
    MethodMock &operator=(const MethodMock &) = delete;

    const std::string &name() const { return name_; }

    // Register a stub. No matchers means "any arguments".
    template <typename... M> Stubbing &when(M &&...matchers) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                       &stub = stubs_.emplace_back();
        stub.predicates_                 = make_predicates(std::forward<M>(matchers)...);
        return stub;
    }

    // Called by the generated override: record the call, then answer from the newest matching stub.
    R invoke(Args... args) {
        std::unique_lock<std::mutex> lock(mutex_);
        // Shared so the arguments outlive a concurrent reset() while the answer runs.
        const auto call = std::make_shared<const Call>(Call{detail::next_invocation_ordinal(), Arguments(std::move(args)...)});
        calls_.push_back(call);
        Answer                       answer;
        bool                         stubbed = false;
        for (auto it = stubs_.rbegin(); it != stubs_.rend(); ++it) {
            if (!matches(it->predicates_, call->arguments)) {
                continue;
            }
            stubbed = true;
            if (!it->answers_.empty()) {
                const std::size_t idx = std::min(it->next_answer_, it->answers_.size() - 1);
                answer                = it->answers_[idx];
                ++it->next_answer_;
            }
            break;
        }
        const Arguments &recorded = call->arguments;
        lock.unlock();

        if (answer) {
            return std::apply(answer, recorded);
        }
        if (!stubbed && state_->strict()) {
            state_->report(fmt::format("unstubbed call to {}({})", name_, describe(recorded)));
        }
        return default_result();
    }

    template <typename... M> std::size_t count(M &&...matchers) const {
        const auto                  preds = make_predicates(std::forward<M>(matchers)...);
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t                 n = 0;
        for (const auto &call : calls_) {
            if (matches(preds, call->arguments))
                ++n;
        }
        return n;
    }

    template <typename... M> std::size_t verify(const InvocationCountMatcher &expected, M &&...matchers) const {
        const std::size_t observed = count(std::forward<M>(matchers)...);
        if (!expected.matches(observed)) {
            state_->report(fmt::format("Mock invocation count for {} does not match expectation.\n\n\tExpected: {}; but got: {}\n{}",
                                       name_, expected.description(), observed, describe_calls()));
        }
        return observed;
    }

    // Like verify(), and additionally require every matching call to come after the
    // previous call verified through `context`.
    template <typename... M>
    std::size_t verify_in_order(InOrderContext &context, const InvocationCountMatcher &expected, M &&...matchers) const {
        const auto                 preds = make_predicates(std::forward<M>(matchers)...);
        std::vector<std::uint64_t> ordinals;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &call : calls_) {
                if (matches(preds, call->arguments))
                    ordinals.push_back(call->ordinal);
            }
        }
        if (!expected.matches(ordinals.size())) {
            state_->report(fmt::format("Mock invocation count for {} does not match expectation.\n\n\tExpected: {}; but got: {}\n{}",
                                       name_, expected.description(), ordinals.size(), describe_calls()));
            return ordinals.size();
        }
        for (const auto ordinal : ordinals) {
            if (ordinal < context.last_ordinal) {
                state_->report(fmt::format("Expected call to {} after the previously verified call, but it happened before it", name_));
                return ordinals.size();
            }
            context.last_ordinal = ordinal;
        }
        return ordinals.size();
    }

    // Arguments of the most recent call.
    Arguments captured() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (calls_.empty()) {
            state_->report(fmt::format("{} was never called; no arguments captured", name_));
            throw VerificationError(fmt::format("{} was never called", name_));
        }
        return calls_.back()->arguments;
    }

    std::vector<Arguments> all_captured() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Arguments>      out;
        out.reserve(calls_.size());
        for (const auto &call : calls_) {
            out.push_back(call->arguments);
        }
        return out;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stubs_.clear();
        calls_.clear();
    }

  private:
    struct Call {
        std::uint64_t ordinal;
        Arguments     arguments;
    };

    template <typename... M> static std::optional<Predicates> make_predicates(M &&...matchers) {
        static_assert(sizeof...(M) == 0 || sizeof...(M) == sizeof...(Args), "matcher count must be zero or match the method arity");
        if constexpr (sizeof...(M) == 0) {
            return std::nullopt;
        } else {
            return Predicates(match::to_arg_predicate<Args>(std::forward<M>(matchers))...);
        }
    }

    static bool matches(const std::optional<Predicates> &preds, const Arguments &arguments) {
        if (!preds)
            return true;
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            return (std::get<I>(*preds).test(std::get<I>(arguments)) && ...);
        }(std::index_sequence_for<Args...>{});
    }

    static std::string describe(const Arguments &arguments) {
        std::string out;
        std::apply(
            [&](const auto &...a) {
                bool first = true;
                ((out += (first ? "" : ", ") + detail::to_string_fallback(a), first = false), ...);
            },
            arguments);
        return out;
    }

    std::string describe_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (calls_.empty()) {
            return "\tno recorded calls\n";
        }
        std::string out = "\trecorded calls:\n";
        for (const auto &call : calls_) {
            out += fmt::format("\t\t{}({})\n", name_, describe(call->arguments));
        }
        return out;
    }

    R default_result() {
        if constexpr (std::is_void_v<R>) {
            return;
        } else {
            using Value = std::remove_cvref_t<R>;
            if constexpr (!std::is_default_constructible_v<Value>) {
                state_->report(fmt::format("{} has no stub and its result type cannot be value-initialized", name_));
                throw VerificationError(fmt::format("no result for {}", name_));
            } else if constexpr (std::is_reference_v<R>) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!default_slot_) {
                    default_slot_.emplace();
                }
                return *default_slot_;
            } else {
                return Value{};
            }
        }
    }

    using DefaultSlot = std::conditional_t<std::is_reference_v<R>, std::optional<std::remove_cvref_t<R>>, std::nullptr_t>;

    const MockState     *state_;
    std::string          name_;
    mutable std::mutex   mutex_;
    std::deque<Stubbing> stubs_;
    std::deque<std::shared_ptr<const Call>> calls_;
    DefaultSlot          default_slot_{};
};

} // namespace mockforge

#pragma once

#include <cmath>
#include <concepts>
#include <cstddef>
#include <fmt/core.h>
#include <functional>
#include <iterator>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace mockforge {

namespace detail {

template <typename T>
concept Ostreamable = requires(std::ostream &os, const T &v) {
    os << v;
};

template <typename T>
concept Iterable = requires(const T &v) {
    std::begin(v);
    std::end(v);
};

template <typename T> std::string to_string_fallback(const T &v) {
    if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
        return fmt::format("\"{}\"", v);
    } else if constexpr (std::is_same_v<T, const char *> || std::is_same_v<T, char *>) {
        return v == nullptr ? std::string("nullptr") : fmt::format("\"{}\"", v);
    } else if constexpr (std::is_same_v<T, bool>) {
        return v ? "true" : "false";
    } else if constexpr (std::is_pointer_v<T>) {
        return v == nullptr ? std::string("nullptr") : fmt::format("{}", static_cast<const void *>(v));
    } else if constexpr (Ostreamable<T>) {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    } else if constexpr (Iterable<T>) {
        std::string out = "[";
        bool        first = true;
        for (const auto &element : v) {
            if (!first)
                out += ", ";
            first = false;
            out += to_string_fallback(element);
        }
        out += ']';
        return out;
    } else {
        return std::string(typeid(T).name());
    }
}

} // namespace detail

namespace match {

// Type-erased argument predicate; `describe` explains a mismatch and may be empty.
template <typename T> struct ArgPredicate {
    std::function<bool(const T &)>        test;
    std::function<std::string(const T &)> describe;
};

template <typename T, typename P>
concept HasMakeFor = requires(const P &p) {
    { p.template make<T>() } -> std::same_as<ArgPredicate<T>>;
};

template <typename T, typename V>
concept EqualityComparableWith = requires(const T &a, const V &b) {
    { a == b } -> std::convertible_to<bool>;
};

// Convert whatever the caller passed for one argument position into a predicate:
// a matcher factory, a callable predicate, or a plain value compared with ==.
template <typename T, typename P> ArgPredicate<T> to_arg_predicate(P &&p) {
    using D = std::decay_t<P>;
    if constexpr (HasMakeFor<T, D>) {
        return p.template make<T>();
    } else if constexpr (std::is_invocable_r_v<bool, const D &, const T &> && !std::is_convertible_v<D, T>) {
        ArgPredicate<T> out;
        out.test     = std::function<bool(const T &)>{std::forward<P>(p)};
        out.describe = [](const T &a) { return fmt::format("predicate rejected {}", detail::to_string_fallback(a)); };
        return out;
    } else {
        static_assert(EqualityComparableWith<T, D>, "argument matcher is neither a matcher, a predicate, nor a comparable value");
        ArgPredicate<T> out;
        D               expected(std::forward<P>(p));
        out.test     = [expected](const T &a) { return a == expected; };
        out.describe = [expected](const T &a) {
            return fmt::format("expected {}, got {}", detail::to_string_fallback(expected), detail::to_string_fallback(a));
        };
        return out;
    }
}

// A matcher bound to one concrete argument type. Generated matcher headers return these.
template <typename T> struct Typed {
    ArgPredicate<T> predicate;

    template <typename U> ArgPredicate<U> make() const {
        static_assert(std::is_same_v<U, T>, "typed matcher used for an argument of a different type");
        return predicate;
    }
};

template <typename T, typename P> Typed<T> typed(P &&p) { return Typed<T>{to_arg_predicate<T>(std::forward<P>(p))}; }

struct AnyFactory {
    template <typename T> ArgPredicate<T> make() const {
        ArgPredicate<T> ap;
        ap.test = [](const T &) noexcept { return true; };
        return ap;
    }
};
inline auto Any() { return AnyFactory{}; }

template <typename V> struct EqFactory {
    using Value = std::decay_t<V>;
    Value expected;
    template <typename T> ArgPredicate<T> make() const { return to_arg_predicate<T>(expected); }
};
template <typename V> inline auto Eq(V &&v) { return EqFactory<V>{std::forward<V>(v)}; }

template <typename P> struct NotFactory {
    P inner;
    template <typename T> ArgPredicate<T> make() const {
        ArgPredicate<T> ip = to_arg_predicate<T>(inner);
        ArgPredicate<T> ap;
        ap.test     = [ip](const T &a) { return !ip.test(a); };
        ap.describe = [](const T &a) { return fmt::format("not(...) rejected {}", detail::to_string_fallback(a)); };
        return ap;
    }
};
template <typename P> inline auto Not(P &&p) { return NotFactory<std::decay_t<P>>{std::forward<P>(p)}; }

template <typename V> inline auto NotEq(V &&v) { return Not(Eq(std::forward<V>(v))); }

#define MOCKFORGE_DETAIL_COMPARISON_FACTORY(factory, fn, op)                                                                               \
    template <typename V> struct factory {                                                                                                 \
        using Value = std::decay_t<V>;                                                                                                     \
        Value bound;                                                                                                                       \
        template <typename T> ArgPredicate<T> make() const {                                                                               \
            ArgPredicate<T> ap;                                                                                                            \
            const Value     b = bound;                                                                                                     \
            ap.test           = [b](const T &a) { return a op b; };                                                                        \
            ap.describe       = [b](const T &a) {                                                                                          \
                return fmt::format("expected " #op " {}, got {}", detail::to_string_fallback(b), detail::to_string_fallback(a));           \
            };                                                                                                                             \
            return ap;                                                                                                                     \
        }                                                                                                                                  \
    };                                                                                                                                     \
    template <typename V> inline auto fn(V &&v) { return factory<V>{std::forward<V>(v)}; }

MOCKFORGE_DETAIL_COMPARISON_FACTORY(LtFactory, Lt, <)
MOCKFORGE_DETAIL_COMPARISON_FACTORY(LeFactory, Le, <=)
MOCKFORGE_DETAIL_COMPARISON_FACTORY(GtFactory, Gt, >)
MOCKFORGE_DETAIL_COMPARISON_FACTORY(GeFactory, Ge, >=)

#undef MOCKFORGE_DETAIL_COMPARISON_FACTORY

template <typename A, typename B> struct InRangeFactory {
    std::decay_t<A> lo;
    std::decay_t<B> hi;
    template <typename T> ArgPredicate<T> make() const {
        ArgPredicate<T> ap;
        const auto      l = lo;
        const auto      h = hi;
        ap.test           = [l, h](const T &a) { return (a >= l) && (a <= h); };
        ap.describe       = [l, h](const T &a) {
            return fmt::format("expected in [{}, {}], got {}", detail::to_string_fallback(l), detail::to_string_fallback(h),
                               detail::to_string_fallback(a));
        };
        return ap;
    }
};
template <typename A, typename B> inline auto InRange(A &&lo, B &&hi) {
    return InRangeFactory<A, B>{std::forward<A>(lo), std::forward<B>(hi)};
}

// Matches containers (e.g. a recorded variadic argument) by element count.
struct SizeIsFactory {
    std::size_t expected;
    template <typename T> ArgPredicate<T> make() const {
        ArgPredicate<T>   ap;
        const std::size_t n = expected;
        ap.test             = [n](const T &a) { return static_cast<std::size_t>(std::size(a)) == n; };
        ap.describe         = [n](const T &a) { return fmt::format("expected size {}, got {}", n, std::size(a)); };
        return ap;
    }
};
inline auto SizeIs(std::size_t n) { return SizeIsFactory{n}; }

enum class StringMatchKind { Contains, Prefix, Suffix };

template <StringMatchKind Kind> struct StringFactory {
    std::string needle;
    template <typename T> ArgPredicate<T> make() const {
        ArgPredicate<T>   ap;
        const std::string nd = needle;
        ap.test              = [nd](const T &a) {
            std::string_view s(a);
            if constexpr (Kind == StringMatchKind::Contains) {
                return s.find(nd) != std::string_view::npos;
            } else if constexpr (Kind == StringMatchKind::Prefix) {
                return s.substr(0, nd.size()) == nd;
            } else {
                return s.size() >= nd.size() && s.substr(s.size() - nd.size()) == nd;
            }
        };
        ap.describe = [nd](const T &a) {
            constexpr std::string_view what = Kind == StringMatchKind::Contains ? "substring"
                                              : Kind == StringMatchKind::Prefix ? "prefix"
                                                                                : "suffix";
            return fmt::format("expected {} '{}', got '{}'", what, nd, std::string_view(a));
        };
        return ap;
    }
};
inline auto StrContains(std::string needle) { return StringFactory<StringMatchKind::Contains>{std::move(needle)}; }
inline auto StartsWith(std::string prefix) { return StringFactory<StringMatchKind::Prefix>{std::move(prefix)}; }
inline auto EndsWith(std::string suffix) { return StringFactory<StringMatchKind::Suffix>{std::move(suffix)}; }

template <bool All, typename... M> struct CombinedFactory {
    std::tuple<M...> subs;
    template <typename T> ArgPredicate<T> make() const {
        auto            preds = std::apply([](const auto &...m) { return std::tuple{to_arg_predicate<T>(m)...}; }, subs);
        ArgPredicate<T> ap;
        ap.test = [preds](const T &a) {
            return std::apply(
                [&](const auto &...p) {
                    if constexpr (All) {
                        return (p.test(a) && ...);
                    } else {
                        return (p.test(a) || ...);
                    }
                },
                preds);
        };
        ap.describe = [](const T &a) {
            return fmt::format("expected {} of the matchers to accept {}", All ? "all" : "any", detail::to_string_fallback(a));
        };
        return ap;
    }
};
template <typename... M> inline auto AnyOf(M &&...m) {
    return CombinedFactory<false, std::decay_t<M>...>{std::tuple<std::decay_t<M>...>(std::forward<M>(m)...)};
}
template <typename... M> inline auto AllOf(M &&...m) {
    return CombinedFactory<true, std::decay_t<M>...>{std::tuple<std::decay_t<M>...>(std::forward<M>(m)...)};
}

} // namespace match

} // namespace mockforge

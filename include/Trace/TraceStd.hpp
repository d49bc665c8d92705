#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "Trace/Trace.hpp"

// ============================================================================
// 标准库类型的 Trace 实现
// 每种容器形状一个偏特化，isTypeTracked() 由元素类型组合而来。
// ============================================================================

template <class Ch, class Tr, class A>
struct Trace<std::basic_string<Ch, Tr, A>> : TraceAcyclic {};

template <class Ch, class Tr>
struct Trace<std::basic_string_view<Ch, Tr>> : TraceAcyclic {};

// shared_ptr/weak_ptr 的引用计数不归回收器管理，不追踪。
// 经由 shared_ptr 构成的环不会被回收。
template <class T>
struct Trace<std::shared_ptr<T>> : TraceAcyclic {};

template <class T>
struct Trace<std::weak_ptr<T>> : TraceAcyclic {};

namespace detail {

// 顺序容器：逐个元素 trace
template <class Seq, class T>
struct TraceSequence {
    static void trace(const Seq& seq, Tracer& tracer) {
        for (const auto& item : seq) {
            Trace<T>::trace(item, tracer);
        }
    }

    static bool isTypeTracked() { return Trace<T>::isTypeTracked(); }
};

// 关联容器：键和值都要 trace
template <class Map, class K, class V>
struct TraceAssociative {
    static void trace(const Map& map, Tracer& tracer) {
        for (const auto& kv : map) {
            Trace<K>::trace(kv.first, tracer);
            Trace<V>::trace(kv.second, tracer);
        }
    }

    static bool isTypeTracked() {
        return Trace<K>::isTypeTracked() || Trace<V>::isTypeTracked();
    }
};

template <class... Ts>
bool anyTypeTracked() {
    return (false || ... || Trace<Ts>::isTypeTracked());
}

} // namespace detail

template <class T>
struct Trace<std::optional<T>> {
    static void trace(const std::optional<T>& value, Tracer& tracer) {
        if (value) {
            Trace<T>::trace(*value, tracer);
        }
    }

    static bool isTypeTracked() { return Trace<T>::isTypeTracked(); }
};

template <class T, class A>
struct Trace<std::vector<T, A>> : detail::TraceSequence<std::vector<T, A>, T> {};

template <class T, class A>
struct Trace<std::deque<T, A>> : detail::TraceSequence<std::deque<T, A>, T> {};

template <class T, class A>
struct Trace<std::list<T, A>> : detail::TraceSequence<std::list<T, A>, T> {};

template <class T, std::size_t N>
struct Trace<std::array<T, N>> : detail::TraceSequence<std::array<T, N>, T> {};

template <class T, class C, class A>
struct Trace<std::set<T, C, A>> : detail::TraceSequence<std::set<T, C, A>, T> {};

template <class T, class H, class E, class A>
struct Trace<std::unordered_set<T, H, E, A>> : detail::TraceSequence<std::unordered_set<T, H, E, A>, T> {};

template <class K, class V, class C, class A>
struct Trace<std::map<K, V, C, A>> : detail::TraceAssociative<std::map<K, V, C, A>, K, V> {};

template <class K, class V, class H, class E, class A>
struct Trace<std::unordered_map<K, V, H, E, A>>
    : detail::TraceAssociative<std::unordered_map<K, V, H, E, A>, K, V> {};

template <class A, class B>
struct Trace<std::pair<A, B>> {
    static void trace(const std::pair<A, B>& value, Tracer& tracer) {
        Trace<A>::trace(value.first, tracer);
        Trace<B>::trace(value.second, tracer);
    }

    static bool isTypeTracked() { return detail::anyTypeTracked<A, B>(); }
};

template <class... Ts>
struct Trace<std::tuple<Ts...>> {
    static void trace(const std::tuple<Ts...>& value, Tracer& tracer) {
        std::apply([&tracer](const Ts&... items) { (Trace<Ts>::trace(items, tracer), ...); }, value);
    }

    static bool isTypeTracked() { return detail::anyTypeTracked<Ts...>(); }
};

// variant 对应“结果”形状：只 trace 当前持有的备选项
template <class... Ts>
struct Trace<std::variant<Ts...>> {
    static void trace(const std::variant<Ts...>& value, Tracer& tracer) {
        if (value.valueless_by_exception()) {
            return;
        }
        std::visit([&tracer](const auto& item) {
            Trace<std::decay_t<decltype(item)>>::trace(item, tracer);
        }, value);
    }

    static bool isTypeTracked() { return detail::anyTypeTracked<Ts...>(); }
};

template <>
struct Trace<std::monostate> : TraceAcyclic {};

// unique_ptr 指向多态类型时，运行期的具体类型未知，保守地视为可能参与循环
template <class T, class D>
struct Trace<std::unique_ptr<T, D>> {
    static void trace(const std::unique_ptr<T, D>& value, Tracer& tracer) {
        if (value) {
            Trace<T>::trace(*value, tracer);
        }
    }

    static bool isTypeTracked() {
        if constexpr (std::is_polymorphic_v<T>) {
            return true;
        } else {
            return Trace<T>::isTypeTracked();
        }
    }
};

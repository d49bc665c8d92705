#pragma once

#include <type_traits>
#include <utility>

#include "Trace/Tracer.hpp"

/**
 * Trace<T>：让回收器在不知道具体类型的情况下找到值的出边。
 *
 *   static void trace(const T& value, Tracer& tracer);
 *       对 value 持有的每一个被跟踪对象的强引用调用 tracer.visit()。
 *   static bool isTypeTracked();
 *       T 的值是否可能参与循环。只取决于类型，与具体的值无关。
 *       返回 false 的类型在创建时不进入对象链表，不产生任何回收开销。
 *
 * 满足方式：
 *   - 成员函数 `void trace(Tracer&) const`，可选 `static bool isTypeTracked()`
 *     （缺省为 true）；
 *   - CYCLECC_TRACE_ACYCLIC(Type) 声明叶子类型；
 *   - 直接特化 Trace<T>；
 *   - 标准类型的通用实现见 Trace/TraceStd.hpp。
 *
 * 自引用类型（值里持有指向同类型的 Cc）必须让 isTypeTracked() 直接返回 true，
 * 否则沿容器组合会无限递归。
 */
template <class T, class Enable = void>
struct Trace;

// 叶子类型：没有出边，不参与循环
struct TraceAcyclic {
    template <class U>
    static void trace(const U&, Tracer&) noexcept {}

    static bool isTypeTracked() noexcept { return false; }
};

namespace detail {

template <class T, class = void>
struct HasMemberTrace : std::false_type {};

template <class T>
struct HasMemberTrace<T, std::void_t<decltype(std::declval<const T&>().trace(std::declval<Tracer&>()))>>
    : std::true_type {};

template <class T, class = void>
struct HasMemberIsTypeTracked : std::false_type {};

template <class T>
struct HasMemberIsTypeTracked<T, std::void_t<decltype(T::isTypeTracked())>> : std::true_type {};

} // namespace detail

// 带成员 trace() 的用户类型
template <class T>
struct Trace<T, std::enable_if_t<detail::HasMemberTrace<T>::value>> {
    static void trace(const T& value, Tracer& tracer) { value.trace(tracer); }

    static bool isTypeTracked() {
        if constexpr (detail::HasMemberIsTypeTracked<T>::value) {
            return T::isTypeTracked();
        } else {
            return true;
        }
    }
};

template <class T>
struct Trace<T, std::enable_if_t<std::is_arithmetic_v<T> || std::is_enum_v<T>>> : TraceAcyclic {};

template <>
struct Trace<std::nullptr_t> : TraceAcyclic {};

// 函数指针不持有任何对象
template <class T>
struct Trace<T*, std::enable_if_t<std::is_function_v<T>>> : TraceAcyclic {};

template <class T>
void traceValue(const T& value, Tracer& tracer) {
    Trace<T>::trace(value, tracer);
}

template <class T>
bool isTypeTracked() {
    return Trace<T>::isTypeTracked();
}

// 声明叶子类型，必须在全局作用域使用
#define CYCLECC_TRACE_ACYCLIC(...) \
    template <>                    \
    struct Trace<__VA_ARGS__> : TraceAcyclic {}

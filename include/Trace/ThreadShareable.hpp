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

/**
 * ThreadShareable<T>：编译期线程安全标记。
 *
 * 多线程对象空间的回收器可能在任意线程上 trace/析构对象，所以
 * ThreadedObjectSpace::create<T>() 要求 ThreadShareable<T>::value 为 true。
 *
 * 判定规则：
 *   - 算术类型、枚举、nullptr_t 为 true；
 *   - 下方列出的标准容器/包装按元素类型做逻辑与；
 *   - 其余类型（包括所有用户类型）缺省为 false，需要显式声明：
 *       static constexpr bool kThreadShareable = true;
 *     或者直接特化 ThreadShareable<T>。
 *   - LocalCc<T> 恒为 false（见 Collector/ObjectSpace.hpp）。
 */
namespace detail {

template <class T, class = void>
struct HasThreadShareableFlag : std::false_type {};

template <class T>
struct HasThreadShareableFlag<T, std::void_t<decltype(T::kThreadShareable)>> : std::true_type {};

template <class T>
struct DefaultThreadShareable
    : std::bool_constant<std::is_arithmetic_v<T> || std::is_enum_v<T> ||
                         std::is_same_v<T, std::nullptr_t>> {};

} // namespace detail

template <class T, class Enable = void>
struct ThreadShareable : detail::DefaultThreadShareable<T> {};

// 用户类型自行声明
template <class T>
struct ThreadShareable<T, std::enable_if_t<detail::HasThreadShareableFlag<T>::value>>
    : std::bool_constant<T::kThreadShareable> {};

template <class... Ts>
struct AllThreadShareable : std::conjunction<ThreadShareable<Ts>...> {};

template <class T>
struct ThreadShareable<std::optional<T>> : ThreadShareable<T> {};

template <class T, class A>
struct ThreadShareable<std::vector<T, A>> : ThreadShareable<T> {};

template <class T, class A>
struct ThreadShareable<std::deque<T, A>> : ThreadShareable<T> {};

template <class T, class A>
struct ThreadShareable<std::list<T, A>> : ThreadShareable<T> {};

template <class T, std::size_t N>
struct ThreadShareable<std::array<T, N>> : ThreadShareable<T> {};

template <class T, class C, class A>
struct ThreadShareable<std::set<T, C, A>> : ThreadShareable<T> {};

template <class T, class H, class E, class A>
struct ThreadShareable<std::unordered_set<T, H, E, A>> : ThreadShareable<T> {};

template <class K, class V, class C, class A>
struct ThreadShareable<std::map<K, V, C, A>> : AllThreadShareable<K, V> {};

template <class K, class V, class H, class E, class A>
struct ThreadShareable<std::unordered_map<K, V, H, E, A>> : AllThreadShareable<K, V> {};

template <class A, class B>
struct ThreadShareable<std::pair<A, B>> : AllThreadShareable<A, B> {};

template <class... Ts>
struct ThreadShareable<std::tuple<Ts...>> : AllThreadShareable<Ts...> {};

template <class... Ts>
struct ThreadShareable<std::variant<Ts...>> : AllThreadShareable<Ts...> {};

template <class T, class D>
struct ThreadShareable<std::unique_ptr<T, D>> : ThreadShareable<T> {};

template <class T>
struct ThreadShareable<std::shared_ptr<T>> : ThreadShareable<T> {};

template <class C, class Tr, class A>
struct ThreadShareable<std::basic_string<C, Tr, A>> : std::true_type {};

template <class C, class Tr>
struct ThreadShareable<std::basic_string_view<C, Tr>> : std::true_type {};

template <>
struct ThreadShareable<std::monostate> : std::true_type {};

template <class T>
struct ThreadShareable<std::weak_ptr<T>> : ThreadShareable<T> {};

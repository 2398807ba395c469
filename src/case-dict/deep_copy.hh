#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace cd
{
// Copies a value such that the copy shares no mutable state with the original.
//
// Strategy (in order):
//   - v.deep_copy() if available (cd::basic_dicti and user types)
//   - std::shared_ptr: fresh pointee, deep-copied as its static type (null stays null)
//   - std::unique_ptr: same, for completeness
//   - std::optional, std::variant, std::pair: element-wise
//   - std::basic_string: plain copy
//   - containers with insert(pos, value): rebuilt element-wise
//   - everything else: copy constructor
//
// Raw pointers are copied as pointers.
template <class T>
[[nodiscard]] T deep_copy(T const& v);

//
// Implementation
//

namespace impl
{
template <class T>
inline constexpr bool is_shared_ptr = false;
template <class T>
inline constexpr bool is_shared_ptr<std::shared_ptr<T>> = true;

template <class T>
inline constexpr bool is_unique_ptr = false;
template <class T>
inline constexpr bool is_unique_ptr<std::unique_ptr<T>> = true;

template <class T>
inline constexpr bool is_optional = false;
template <class T>
inline constexpr bool is_optional<std::optional<T>> = true;

template <class T>
inline constexpr bool is_variant = false;
template <class... Ts>
inline constexpr bool is_variant<std::variant<Ts...>> = true;

template <class T>
inline constexpr bool is_pair = false;
template <class A, class B>
inline constexpr bool is_pair<std::pair<A, B>> = true;

template <class T>
inline constexpr bool is_string = false;
template <class C, class Tr, class A>
inline constexpr bool is_string<std::basic_string<C, Tr, A>> = true;
} // namespace impl

template <class T>
[[nodiscard]] T deep_copy(T const& v)
{
    if constexpr (requires { { v.deep_copy() } -> std::convertible_to<T>; })
    {
        return v.deep_copy();
    }
    else if constexpr (impl::is_shared_ptr<T>)
    {
        using element_t = std::remove_const_t<typename T::element_type>;
        if (!v)
            return nullptr;
        return std::make_shared<element_t>(cd::deep_copy(static_cast<element_t const&>(*v)));
    }
    else if constexpr (impl::is_unique_ptr<T>)
    {
        using element_t = std::remove_const_t<typename T::element_type>;
        if (!v)
            return nullptr;
        return std::make_unique<element_t>(cd::deep_copy(static_cast<element_t const&>(*v)));
    }
    else if constexpr (impl::is_optional<T>)
    {
        if (!v.has_value())
            return std::nullopt;
        return T(cd::deep_copy(*v));
    }
    else if constexpr (impl::is_variant<T>)
    {
        return std::visit([](auto const& alt) -> T { return T(cd::deep_copy(alt)); }, v);
    }
    else if constexpr (impl::is_pair<T>)
    {
        return T(cd::deep_copy(v.first), cd::deep_copy(v.second));
    }
    else if constexpr (impl::is_string<T>)
    {
        return v;
    }
    else if constexpr (requires(T& r) {
                           v.begin();
                           v.end();
                           r.insert(r.end(), *v.begin());
                       })
    {
        T r;
        for (auto const& e : v)
            r.insert(r.end(), cd::deep_copy(e));
        return r;
    }
    else
    {
        return v;
    }
}
} // namespace cd

#pragma once

#include <case-dict/fwd.hh>

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

/// A single mapping entry: original key, normalized key and value.
///
/// The normalized key is fixed at construction and always equals normalize(key()).
/// Only the mapping and its storage see it, callers get key() and value().
///
/// Supports structured bindings with a read-only key:
///   for (auto& [key, value] : m)
///       value += 1; // key is K const&
template <class K, class V, class NK>
struct cd::entry
{
    using key_t = K;
    using value_t = V;
    using normalized_key_t = NK;

    entry(K key, NK normalized, V value)
      : _key(std::move(key)), _normalized(std::move(normalized)), _value(std::move(value))
    {
    }

    // queries
public:
    [[nodiscard]] K const& key() const { return _key; }

    [[nodiscard]] V& value() { return _value; }
    [[nodiscard]] V const& value() const { return _value; }

    template <std::size_t I, class E>
    [[nodiscard]] friend constexpr decltype(auto) get(E&& e) noexcept
        requires(std::is_same_v<std::remove_cvref_t<E>, entry> && I < 2)
    {
        if constexpr (I == 0)
        {
            if constexpr (std::is_lvalue_reference_v<E>)
                return static_cast<K const&>(e._key);
            else
                return static_cast<K const&&>(e._key);
        }
        else
            return (std::forward<E>(e)._value);
    }

private:
    [[nodiscard]] NK const& normalized_key() const { return _normalized; }

    template <class, class, class, class>
    friend struct cd::basic_dicti;
    template <class, class>
    friend struct cd::hashed_storage;
    template <class, class>
    friend struct cd::ordered_storage;

    K _key;
    NK _normalized;
    V _value;
};

namespace std
{
template <class K, class V, class NK>
struct tuple_size<cd::entry<K, V, NK>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class K, class V, class NK>
struct tuple_element<I, cd::entry<K, V, NK>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, K const, V>;
};
} // namespace std

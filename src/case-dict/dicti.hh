#pragma once

#include <case-dict/assert.hh>
#include <case-dict/deep_copy.hh>
#include <case-dict/entry.hh>
#include <case-dict/errors.hh>
#include <case-dict/fwd.hh>
#include <case-dict/normalize.hh>
#include <case-dict/storage.hh>
#include <case-dict/to_debug_string.hh>
#include <case-dict/type_registry.hh>

#include <concepts>
#include <deque>
#include <initializer_list>
#include <limits>
#include <list>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

// =========================================================================================================
// Case-insensitive mappings
// =========================================================================================================
//
// cd::basic_dicti<K, V, Base, Normalizer> is a key-value mapping where every key-based operation
// normalizes the key first. The original spelling of the first insertion is kept for iteration,
// display and serialization:
//
//   auto m = cd::odicti<int>();
//   m.set("Hello", 1);
//   m.set("HELLO", 2);      // same entry, only the value changes
//   m.at("hello");          // 2
//   m.keys();               // ["Hello"]
//
// Canonical types:
//   cd::dicti<V>   - hashed, unspecified order   (registry name "dicti")
//   cd::odicti<V>  - insertion ordered            (registry name "odicti")
//
// Other combinations are named with cd::build_t<Base, Normalizer, K, V>.
// See storage.hh for base kinds, normalize.hh for normalizers and type_registry.hh for runtime identity.
//
// Equality (operator==) compares normalized keys and values, never the original spelling.
// It is order-sensitive iff both operands are insertion ordered, which makes it non-transitive:
//
//   auto oi  = cd::odicti<int>{{"Hello", 1}, {"beautiful", 2}, {"world!", 3}};
//   auto i   = cd::dicti<int>(oi);
//   auto roi = cd::odicti<int>(oi | std::views::reverse);
//   // roi == i, i == oi, but oi != roi
//
// Plain mappings (std::map, std::unordered_map, vectors of pairs) compare after cd::wrap.

namespace cd
{
template <class V>
using dicti = basic_dicti<std::string, V, hashed_base, case_fold_normalizer>;

template <class V>
using odicti = basic_dicti<std::string, V, ordered_base, case_fold_normalizer>;

template <class T>
inline constexpr bool is_basic_dicti = false;
template <class K, class V, class Base, class Normalizer>
inline constexpr bool is_basic_dicti<basic_dicti<K, V, Base, Normalizer>> = true;

namespace impl
{
template <class P>
decltype(auto) pair_key(P&& p)
{
    using std::get;
    return get<0>(std::forward<P>(p));
}
template <class P>
decltype(auto) pair_value(P&& p)
{
    using std::get;
    return get<1>(std::forward<P>(p));
}

template <class Base, class Normalizer, class K, class V>
struct build_type
{
    static_assert(cd::base_kind<Base>, "Base does not provide lookup, insert, remove, iteration, size and clear");
    static_assert(cd::normalizer<Normalizer>, "Normalizer must map std::string_view to std::string and provide info()");

    using type = basic_dicti<K, V, Base, Normalizer>;
};
} // namespace impl

/// A range whose elements are key-value tuple-likes: std::pair, cd::entry, ...
template <class R>
concept pair_range = std::ranges::input_range<R> && requires(std::ranges::range_reference_t<R> e) {
    impl::pair_key(e);
    impl::pair_value(e);
};

/// Names the mapping type for (Base, Normalizer) with key K and value V.
/// Fails with a static_assert if Base or Normalizer do not provide the required capabilities.
template <class Base, class Normalizer, class K, class V>
using build_t = typename impl::build_type<Base, Normalizer, K, V>::type;

/// Runtime descriptor of (Base, Normalizer), shared by all build_t<Base, Normalizer, K, V>.
/// A non-empty name is registered as name or alias, see cd::build(base_kind_info const&, ...).
template <class Base, class Normalizer = case_fold_normalizer>
[[nodiscard]] type_descriptor const& build(std::string name = {})
{
    static_assert(cd::base_kind<Base>, "Base does not provide lookup, insert, remove, iteration, size and clear");
    static_assert(cd::normalizer<Normalizer>, "Normalizer must map std::string_view to std::string and provide info()");
    return cd::build(Base::info(), Normalizer::info(), std::move(name));
}

/// Whether iterating M yields entries in insertion order.
/// Decides the base kind chosen by cd::wrap, specialize for custom containers.
template <class M>
struct preserves_insertion_order : std::false_type
{
};
template <class K, class V, class A>
struct preserves_insertion_order<std::vector<std::pair<K, V>, A>> : std::true_type
{
};
template <class K, class V, class A>
struct preserves_insertion_order<std::deque<std::pair<K, V>, A>> : std::true_type
{
};
template <class K, class V, class A>
struct preserves_insertion_order<std::list<std::pair<K, V>, A>> : std::true_type
{
};
template <class K, class V, class Base, class Normalizer>
struct preserves_insertion_order<basic_dicti<K, V, Base, Normalizer>> : std::bool_constant<Base::preserves_order>
{
};

/// Case-insensitive copy of a plain mapping.
/// Ordered base if preserves_insertion_order<M>, hashed otherwise, default normalizer.
/// String-like keys (char const*, std::string_view) become std::string.
template <pair_range M>
    requires(!is_basic_dicti<M>)
[[nodiscard]] auto wrap(M const& m);

/// A case-insensitive mapping wraps as a copy of itself.
template <class K, class V, class Base, class Normalizer>
[[nodiscard]] basic_dicti<K, V, Base, Normalizer> wrap(basic_dicti<K, V, Base, Normalizer> const& m);
} // namespace cd

template <class K, class V, class Base, class Normalizer>
struct cd::basic_dicti
{
    static_assert(cd::base_kind<Base>, "Base does not provide lookup, insert, remove, iteration, size and clear");
    static_assert(cd::normalizer<Normalizer>, "Normalizer must map std::string_view to std::string and provide info()");

    using key_type = K;
    using mapped_type = V;
    using normalized_key_type = normalized_key_t<K>;
    using entry_t = cd::entry<K, V, normalized_key_type>;
    using value_type = entry_t;
    using base_kind_t = Base;
    using normalizer_t = Normalizer;
    using storage_t = typename Base::template storage<normalized_key_type, entry_t>;
    using iterator = typename storage_t::iterator;
    using const_iterator = typename storage_t::const_iterator;

    // ctors
public:
    basic_dicti() = default;

    basic_dicti(std::initializer_list<std::pair<K, V>> init) { update(init); }

    /// Repeated set() in the iteration order of r.
    template <pair_range R>
        requires(!std::is_same_v<R, basic_dicti>)
    explicit basic_dicti(R const& r)
    {
        update(r);
    }

    // type identity
public:
    /// The registry entry of (Base, Normalizer), identical for every K and V.
    [[nodiscard]] static type_descriptor const& descriptor()
    {
        static auto const& d = cd::build(Base::info(), Normalizer::info());
        return d;
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _storage.size(); }
    [[nodiscard]] bool empty() const { return _storage.size() == 0; }

    [[nodiscard]] bool contains(K const& key) const { return _storage.find(normalize(key)) != nullptr; }

    /// Pointer to the value stored under key, nullptr if absent.
    [[nodiscard]] V* get(K const& key)
    {
        auto const e = _storage.find(normalize(key));
        return e ? &e->_value : nullptr;
    }
    [[nodiscard]] V const* get(K const& key) const
    {
        auto const e = _storage.find(normalize(key));
        return e ? &e->_value : nullptr;
    }

    [[nodiscard]] V get_or(K const& key, V fallback) const
    {
        if (auto const v = get(key))
            return *v;
        return fallback;
    }

    /// Throws cd::key_not_found if absent.
    [[nodiscard]] V& at(K const& key)
    {
        if (auto const v = get(key))
            return *v;
        impl::throw_key_not_found(cd::to_debug_string(key));
    }
    [[nodiscard]] V const& at(K const& key) const
    {
        if (auto const v = get(key))
            return *v;
        impl::throw_key_not_found(cd::to_debug_string(key));
    }

    // mutation
public:
    /// Inserts (key, value) or, if the normalized key exists, replaces the value only.
    /// The original key and the position of an existing entry never change.
    void set(K const& key, V value)
    {
        auto nk = normalize(key);
        if (auto const e = _storage.find(nk))
            e->_value = std::move(value);
        else
            _storage.emplace(entry_t(key, std::move(nk), std::move(value)));
    }

    /// Value stored under key, value-initialized and inserted first if absent.
    V& operator[](K const& key) { return setdefault(key, V()); }

    /// Value stored under key, (key, value) inserted first if absent.
    V& setdefault(K const& key, V value)
    {
        auto nk = normalize(key);
        if (auto const e = _storage.find(nk))
            return e->_value;
        return _storage.emplace(entry_t(key, std::move(nk), std::move(value)))._value;
    }

    /// Throws cd::key_not_found if absent.
    void remove(K const& key)
    {
        if (!try_remove(key))
            impl::throw_key_not_found(cd::to_debug_string(key));
    }

    bool try_remove(K const& key)
    {
        auto const nk = normalize(key);
        if (_storage.find(nk) == nullptr)
            return false;
        (void)_storage.take(nk);
        return true;
    }

    /// Removes key and returns its value. Throws cd::key_not_found if absent.
    [[nodiscard]] V pop(K const& key)
    {
        auto const nk = normalize(key);
        if (_storage.find(nk) == nullptr)
            impl::throw_key_not_found(cd::to_debug_string(key));
        return std::move(_storage.take(nk)._value);
    }

    [[nodiscard]] V pop_or(K const& key, V fallback)
    {
        auto const nk = normalize(key);
        if (_storage.find(nk) == nullptr)
            return fallback;
        return std::move(_storage.take(nk)._value);
    }

    /// Removes and returns the last inserted entry (ordered base) or some entry (hashed base).
    /// Throws cd::key_not_found if the mapping is empty.
    [[nodiscard]] std::pair<K, V> popitem()
    {
        if (empty())
            impl::throw_empty_mapping();
        auto e = _storage.take_last();
        return {std::move(e._key), std::move(e._value)};
    }

    void clear() { _storage.clear(); }

    /// Repeated set() in the iteration order of r.
    /// There is no rollback: if r throws midway, the entries applied so far stay.
    template <pair_range R>
    void update(R const& r)
    {
        for (auto&& e : r)
            set(K(impl::pair_key(e)), V(impl::pair_value(e)));
    }
    void update(std::initializer_list<std::pair<K, V>> init)
    {
        for (auto const& [key, value] : init)
            set(key, value);
    }

    // copies
public:
    /// Same type, copied entries. Values are copy-constructed, so shared_ptr values stay shared.
    [[nodiscard]] basic_dicti copy() const { return *this; }

    /// Same type, values deep-copied with cd::deep_copy.
    [[nodiscard]] basic_dicti deep_copy() const
    {
        basic_dicti r;
        for (auto const& e : _storage)
            r._storage.emplace(entry_t(e._key, e._normalized, cd::deep_copy(e._value)));
        return r;
    }

    // iteration
public:
    [[nodiscard]] iterator begin() { return _storage.begin(); }
    [[nodiscard]] iterator end() { return _storage.end(); }
    [[nodiscard]] const_iterator begin() const { return _storage.begin(); }
    [[nodiscard]] const_iterator end() const { return _storage.end(); }

    /// Original keys in iteration order.
    [[nodiscard]] auto keys() const
    {
        return std::views::transform(_storage, [](entry_t const& e) -> K const& { return e._key; });
    }

    [[nodiscard]] auto values()
    {
        return std::views::transform(_storage, [](entry_t& e) -> V& { return e._value; });
    }
    [[nodiscard]] auto values() const
    {
        return std::views::transform(_storage, [](entry_t const& e) -> V const& { return e._value; });
    }

    /// (original key, value) pairs in iteration order.
    [[nodiscard]] auto items()
    {
        return std::views::transform(_storage, [](entry_t& e) { return std::pair<K const&, V&>(e._key, e._value); });
    }
    [[nodiscard]] auto items() const
    {
        return std::views::transform(_storage,
                                     [](entry_t const& e) { return std::pair<K const&, V const&>(e._key, e._value); });
    }

    /// (normalized key, value) pairs in iteration order.
    /// The only place where normalized keys are visible.
    [[nodiscard]] auto normalized_items() const
    {
        return std::views::transform(_storage,
                                     [](entry_t const& e)
                                     { return std::pair<normalized_key_type const&, V const&>(e._normalized, e._value); });
    }

    // display
public:
    /// Like the base mapping: {"Hello": 1, "world": 2}
    [[nodiscard]] std::string to_string() const
    {
        auto s = std::string();
        impl::to_debug_string_append_mapping(s, *this, {.max_length = std::numeric_limits<isize>::max()});
        return s;
    }

    /// Named wrapper: dicti({"Hello": 1})
    [[nodiscard]] std::string to_debug_string(debug_string_config const& cfg = {}) const
    {
        auto s = descriptor().name();
        s += '(';
        impl::to_debug_string_append_mapping(s, *this, cfg);
        s += ')';
        return s;
    }

    // comparison
public:
    template <class V2, class Base2, class Normalizer2>
        requires std::equality_comparable_with<V, V2>
    [[nodiscard]] friend bool operator==(basic_dicti const& lhs, basic_dicti<K, V2, Base2, Normalizer2> const& rhs)
    {
        return lhs.equals(rhs);
    }

    template <pair_range M>
        requires(!is_basic_dicti<M>)
    [[nodiscard]] friend bool operator==(basic_dicti const& lhs, M const& rhs)
    {
        return lhs == cd::wrap(rhs);
    }

private:
    [[nodiscard]] static normalized_key_type normalize(K const& key)
    {
        return key_traits<K>::normalize(Normalizer(), key);
    }

    template <class V2, class Base2, class Normalizer2>
    [[nodiscard]] bool equals(basic_dicti<K, V2, Base2, Normalizer2> const& rhs) const
    {
        using rhs_t = basic_dicti<K, V2, Base2, Normalizer2>;
        constexpr bool same_normalizer = std::is_same_v<Normalizer, Normalizer2>;

        if (size() != rhs.size())
            return false;

        if (cd::select_comparison(Base::info(), Base2::info()) == comparison_mode::ordered)
        {
            auto it = rhs._storage.begin();
            for (auto const& e : _storage)
            {
                auto const& re = *it;
                ++it;

                if constexpr (same_normalizer)
                {
                    if (e._normalized != re._normalized)
                        return false;
                }
                else
                {
                    if (normalize(re._key) != e._normalized || rhs_t::normalize(e._key) != re._normalized)
                        return false;
                }

                if (!(e._value == re._value))
                    return false;
            }
            return true;
        }

        for (auto const& e : _storage)
        {
            auto const re = rhs._storage.find(rhs_t::normalize(e._key));
            if (re == nullptr || !(e._value == re->_value))
                return false;

            if constexpr (!same_normalizer)
                if (normalize(re->_key) != e._normalized)
                    return false;
        }

        // equal sizes and one direction suffice when both sides normalize the same way
        if constexpr (!same_normalizer)
            for (auto const& re : rhs._storage)
                if (_storage.find(normalize(re._key)) == nullptr)
                    return false;

        return true;
    }

    template <class, class, class, class>
    friend struct cd::basic_dicti;

    storage_t _storage;
};

//
// wrap
//

namespace cd
{
namespace impl
{
template <class T>
using wrapped_key_t = std::conditional_t<std::is_convertible_v<T, std::string_view> && !std::is_same_v<T, std::string>,
                                         std::string,
                                         T>;
} // namespace impl

template <pair_range M>
    requires(!is_basic_dicti<M>)
[[nodiscard]] auto wrap(M const& m)
{
    using ref_t = std::ranges::range_reference_t<M const>;
    using key_t = impl::wrapped_key_t<std::remove_cvref_t<decltype(impl::pair_key(std::declval<ref_t>()))>>;
    using value_t = std::remove_cvref_t<decltype(impl::pair_value(std::declval<ref_t>()))>;
    using base_t = std::conditional_t<preserves_insertion_order<M>::value, ordered_base, hashed_base>;

    return build_t<base_t, case_fold_normalizer, key_t, value_t>(m);
}

template <class K, class V, class Base, class Normalizer>
[[nodiscard]] basic_dicti<K, V, Base, Normalizer> wrap(basic_dicti<K, V, Base, Normalizer> const& m)
{
    return m.copy();
}
} // namespace cd

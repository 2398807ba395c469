#pragma once

#include <case-dict/assert.hh>
#include <case-dict/entry.hh>
#include <case-dict/fwd.hh>

#include <concepts>
#include <cstddef>
#include <iterator>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

// =========================================================================================================
// Base kinds and their storage
// =========================================================================================================
//
// A base kind decides how a cd::basic_dicti stores and iterates its entries.
// It is a tag type with
//
//   template <class NK, class E> using storage = ...;   // NK = normalized key, E = cd::entry<...>
//   static constexpr bool preserves_order;
//   static cd::base_kind_info const& info();            // runtime identity, see type_registry.hh
//
// The storage is indexed by the normalized key and owns the entries. Required capabilities:
//
//   E* find(NK const&)             (+ const)   lookup
//   E& emplace(E)                              insert, normalized key must be absent
//   E take(NK const&)                          remove and return, key must be present
//   E take_last()                              remove and return some entry, storage must be non-empty
//   void clear()
//   isize size() const
//   begin() / end()                (+ const)   forward iteration yielding E&
//
// Provided base kinds:
//   hashed_base  - std::unordered_map, unspecified iteration order ("dict")
//   ordered_base - insertion order, stable on value updates ("odict")

namespace cd
{
template <class S, class NK, class E>
concept storage_for = std::default_initializable<S> && std::copy_constructible<S>
                   && requires(S& s, S const& cs, NK const& nk, E e) {
                          { s.find(nk) } -> std::same_as<E*>;
                          { cs.find(nk) } -> std::same_as<E const*>;
                          { s.emplace(std::move(e)) } -> std::same_as<E&>;
                          { s.take(nk) } -> std::same_as<E>;
                          { s.take_last() } -> std::same_as<E>;
                          s.clear();
                          { cs.size() } -> std::same_as<isize>;
                          { *s.begin() } -> std::same_as<E&>;
                          { *cs.begin() } -> std::same_as<E const&>;
                          { s.begin() != s.end() } -> std::convertible_to<bool>;
                          { cs.begin() != cs.end() } -> std::convertible_to<bool>;
                      };

namespace impl
{
// representative instantiation used to check a base kind's storage
using probe_entry = entry<std::string, int, std::string>;
} // namespace impl

template <class B>
concept base_kind = requires {
    { B::preserves_order } -> std::convertible_to<bool>;
    { B::info() } -> std::same_as<base_kind_info const&>;
} && storage_for<typename B::template storage<std::string, impl::probe_entry>, std::string, impl::probe_entry>;

namespace impl
{
// iterates the mapped part of an associative container
template <class It, class E>
struct mapped_iterator
{
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::remove_const_t<E>;
    using difference_type = std::ptrdiff_t;
    using pointer = E*;
    using reference = E&;

    mapped_iterator() = default;
    explicit mapped_iterator(It it) : _it(it) {}

    // allows iterator -> const_iterator
    template <class It2, class E2>
        requires(std::is_convertible_v<It2, It> && !std::is_same_v<It2, It>)
    mapped_iterator(mapped_iterator<It2, E2> const& rhs) : _it(rhs.base())
    {
    }

    [[nodiscard]] E& operator*() const { return _it->second; }
    [[nodiscard]] E* operator->() const { return &_it->second; }

    mapped_iterator& operator++()
    {
        ++_it;
        return *this;
    }
    mapped_iterator operator++(int)
    {
        auto r = *this;
        ++_it;
        return r;
    }

    [[nodiscard]] It base() const { return _it; }

    [[nodiscard]] friend bool operator==(mapped_iterator const& a, mapped_iterator const& b) { return a._it == b._it; }

private:
    It _it{};
};
} // namespace impl
} // namespace cd

/// Unordered storage, one hash table from normalized key to entry.
template <class NK, class E>
struct cd::hashed_storage
{
    using map_t = std::unordered_map<NK, E>;
    using iterator = impl::mapped_iterator<typename map_t::iterator, E>;
    using const_iterator = impl::mapped_iterator<typename map_t::const_iterator, E const>;

    // queries
public:
    [[nodiscard]] E* find(NK const& nk)
    {
        auto it = _map.find(nk);
        return it == _map.end() ? nullptr : &it->second;
    }
    [[nodiscard]] E const* find(NK const& nk) const
    {
        auto it = _map.find(nk);
        return it == _map.end() ? nullptr : &it->second;
    }

    [[nodiscard]] isize size() const { return isize(_map.size()); }

    [[nodiscard]] iterator begin() { return iterator(_map.begin()); }
    [[nodiscard]] iterator end() { return iterator(_map.end()); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(_map.begin()); }
    [[nodiscard]] const_iterator end() const { return const_iterator(_map.end()); }

    // mutation
public:
    E& emplace(E e)
    {
        auto nk = e.normalized_key();
        auto const [it, inserted] = _map.try_emplace(std::move(nk), std::move(e));
        CD_ASSERT(inserted, "normalized key already present");
        return it->second;
    }

    E take(NK const& nk)
    {
        auto node = _map.extract(nk);
        CD_ASSERT(!node.empty(), "normalized key not present");
        return std::move(node.mapped());
    }

    E take_last()
    {
        CD_ASSERT(!_map.empty(), "storage is empty");
        auto node = _map.extract(_map.begin());
        return std::move(node.mapped());
    }

    void clear() { _map.clear(); }

private:
    map_t _map;
};

/// Insertion-ordered storage: entries in a vector, hash index from normalized key to position.
/// Updating a value keeps the position. Removing shifts the tail and reindexes it, O(n).
template <class NK, class E>
struct cd::ordered_storage
{
    using iterator = typename std::vector<E>::iterator;
    using const_iterator = typename std::vector<E>::const_iterator;

    // queries
public:
    [[nodiscard]] E* find(NK const& nk)
    {
        auto const idx = index_of(nk);
        return idx < 0 ? nullptr : &_entries[idx];
    }
    [[nodiscard]] E const* find(NK const& nk) const
    {
        auto const idx = index_of(nk);
        return idx < 0 ? nullptr : &_entries[idx];
    }

    [[nodiscard]] isize size() const { return isize(_entries.size()); }

    [[nodiscard]] iterator begin() { return _entries.begin(); }
    [[nodiscard]] iterator end() { return _entries.end(); }
    [[nodiscard]] const_iterator begin() const { return _entries.begin(); }
    [[nodiscard]] const_iterator end() const { return _entries.end(); }

    // mutation
public:
    E& emplace(E e)
    {
        CD_ASSERT(!_index.contains(e.normalized_key()), "normalized key already present");

        // index only entries that exist, a throwing emplace_back leaves both containers untouched
        auto& stored = _entries.emplace_back(std::move(e));
        try
        {
            _index.emplace(stored.normalized_key(), isize(_entries.size()) - 1);
        }
        catch (...)
        {
            _entries.pop_back();
            throw;
        }
        return stored;
    }

    E take(NK const& nk)
    {
        auto const idx = index_of(nk);
        CD_ASSERT(idx >= 0, "normalized key not present");

        auto e = std::move(_entries[idx]);
        _entries.erase(_entries.begin() + idx);
        _index.erase(nk);

        for (auto i = idx; i < isize(_entries.size()); ++i)
            _index[_entries[i].normalized_key()] = i;

        CD_ASSERT(_index.size() == _entries.size(), "index and entries out of sync");
        return e;
    }

    E take_last()
    {
        CD_ASSERT(!_entries.empty(), "storage is empty");
        auto e = std::move(_entries.back());
        _entries.pop_back();
        _index.erase(e.normalized_key());
        return e;
    }

    void clear()
    {
        _entries.clear();
        _index.clear();
    }

private:
    [[nodiscard]] isize index_of(NK const& nk) const
    {
        auto it = _index.find(nk);
        return it == _index.end() ? -1 : it->second;
    }

    std::vector<E> _entries;
    std::unordered_map<NK, isize> _index;
};

/// Hashed base kind, iteration order unspecified.
struct cd::hashed_base
{
    template <class NK, class E>
    using storage = hashed_storage<NK, E>;

    static constexpr bool preserves_order = false;

    [[nodiscard]] static base_kind_info const& info();
};

/// Insertion-ordered base kind.
struct cd::ordered_base
{
    template <class NK, class E>
    using storage = ordered_storage<NK, E>;

    static constexpr bool preserves_order = true;

    [[nodiscard]] static base_kind_info const& info();
};

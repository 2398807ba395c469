#pragma once

#include <case-dict/assert.hh>
#include <case-dict/fwd.hh>

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

// =========================================================================================================
// Key normalization
// =========================================================================================================
//
// A normalizer maps a key to the form used for hashing and comparison inside a cd::basic_dicti.
// Two string keys address the same entry iff their normalized forms are equal.
//
// Free functions:
//   fold_case(s)        - full Unicode case folding of UTF-8 text (ICU), locale independent
//   ascii_fold(s)       - lowercases 'A'..'Z', leaves every other byte untouched
//
// Normalizer types (stateless, usable as the Normalizer parameter of cd::basic_dicti):
//   case_fold_normalizer - fold_case, the default
//   ascii_normalizer     - ascii_fold
//
// Custom normalizers provide
//   std::string operator()(std::string_view) const;
//   static cd::normalizer_info const& info();
// and should be idempotent: n(n(s)) == n(s). This is not checked.
//
// Keys that are not strings are never normalized (see key_traits below).

namespace cd
{
using normalize_fn = std::string (*)(std::string_view);

/// Runtime identity of a normalization function.
/// Instances live for the whole process and are compared by address.
struct normalizer_info
{
    std::string name;
    normalize_fn fn = nullptr;
};

/// Returns the process-lifetime info object for fn.
/// Repeated calls with the same fn return the same object.
/// Throws cd::configuration_error if name is empty, fn is null,
/// or fn was already registered under a different name.
[[nodiscard]] normalizer_info const& make_normalizer_info(std::string name, normalize_fn fn);

/// Full Unicode case folding (ICU default folding, not Turkic), e.g.
///   fold_case("HeLLo")  == "hello"
///   fold_case("Straße") == fold_case("STRASSE") == "strasse"
///   fold_case("ΣΊΣΥΦΟΣ") == fold_case("σίσυφος")
/// Pure-ASCII input takes a byte-wise fast path with the same result.
/// Never fails: ill-formed UTF-8 bytes are copied unchanged, only well-formed text is folded.
[[nodiscard]] std::string fold_case(std::string_view s);

/// ASCII-only lowercasing, bytes >= 0x80 pass through unchanged.
[[nodiscard]] std::string ascii_fold(std::string_view s);

[[nodiscard]] constexpr bool is_ascii_upper(char c)
{
    return 'A' <= c && c <= 'Z';
}

[[nodiscard]] constexpr char ascii_to_lower(char c)
{
    return is_ascii_upper(c) ? char(c + ('a' - 'A')) : c;
}

template <class N>
concept normalizer = std::is_default_constructible_v<N> && requires(N const& n, std::string_view s) {
    { n(s) } -> std::same_as<std::string>;
    { N::info() } -> std::same_as<normalizer_info const&>;
};

struct case_fold_normalizer
{
    [[nodiscard]] std::string operator()(std::string_view s) const { return cd::fold_case(s); }
    [[nodiscard]] static normalizer_info const& info();
};

struct ascii_normalizer
{
    [[nodiscard]] std::string operator()(std::string_view s) const { return cd::ascii_fold(s); }
    [[nodiscard]] static normalizer_info const& info();
};

// =========================================================================================================
// key_traits
// =========================================================================================================
//
// key_traits<K>::normalized_type   - the type stored in the lookup index
// key_traits<K>::normalize(n, key) - the normalized form of key under normalizer n
//
// Default: the key is its own normalized form (ints, enums, ... compare natively).
// std::string: normalized by the normalizer.
// std::variant<Ts...>: each alternative is normalized by its own key_traits, the alternative index is kept,
//                      so a variant<std::string, int> mapping is case-insensitive for its string keys only.

template <class K>
struct key_traits
{
    using normalized_type = K;

    template <class N>
    [[nodiscard]] static normalized_type normalize(N const&, K const& key)
    {
        return key;
    }
};

template <>
struct key_traits<std::string>
{
    using normalized_type = std::string;

    template <class N>
    [[nodiscard]] static normalized_type normalize(N const& n, std::string_view key)
    {
        return n(key);
    }
};

template <class... Ts>
struct key_traits<std::variant<Ts...>>
{
    using key_type = std::variant<Ts...>;
    using normalized_type = std::variant<typename key_traits<Ts>::normalized_type...>;

    template <class N>
    [[nodiscard]] static normalized_type normalize(N const& n, key_type const& key)
    {
        CD_ASSERT(!key.valueless_by_exception(), "cannot normalize a valueless variant key");
        return normalize_alternative(n, key, std::index_sequence_for<Ts...>{});
    }

private:
    template <class N, std::size_t... I>
    static normalized_type normalize_alternative(N const& n, key_type const& key, std::index_sequence<I...>)
    {
        using fn_t = normalized_type (*)(N const&, key_type const&);
        static constexpr fn_t table[] = {+[](N const& norm, key_type const& k) -> normalized_type
                                         {
                                             using alt_t = std::variant_alternative_t<I, key_type>;
                                             return normalized_type(std::in_place_index<I>,
                                                                    key_traits<alt_t>::normalize(norm, std::get<I>(k)));
                                         }...};
        return table[key.index()](n, key);
    }
};

template <class K>
using normalized_key_t = typename key_traits<K>::normalized_type;
} // namespace cd

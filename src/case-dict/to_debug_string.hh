#pragma once

#include <case-dict/fwd.hh>

#include <charconv>
#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility> // for tuple_size
#include <variant>

namespace cd
{
struct debug_string_config
{
    // not strict, collections stop adding elements once this is exceeded
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics and error messages.
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..." (never empty output)
//   - char: wrap in single quotes '...' with escape sequences for control/non-printable chars
//   - bool: true / false
//   - arithmetic: shortest round-trip representation (std::to_chars)
//   - std::variant: the active alternative
//   - Use v.to_debug_string(cfg) if available (cd::basic_dicti renders as dicti({...}))
//   - Use to_string(v) if available (ADL)
//   - Use v.to_string() if available
//   - For mappings (key_type + mapped_type), recursively format entries as {k0: v0, k1: v1, ...}
//   - For collections, recursively format elements as [v0, v1, ...]
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Otherwise emit raw memory dump
//
// No stability, completeness, or user-facing guarantees.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
inline bool to_debug_string_separate(std::string& s, std::size_t prefix_size, debug_string_config const& cfg)
{
    // length of the rendered elements only, text before the opening bracket does not count
    if (isize(s.size() - prefix_size) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > prefix_size)
        s += ", ";

    return true;
}

template <class T>
bool to_debug_string_append_elem(std::string& s, std::size_t prefix_size, T const& v, debug_string_config const& cfg)
{
    if (!cd::impl::to_debug_string_separate(s, prefix_size, cfg))
        return false;

    s += cd::to_debug_string(v, cfg);
    return true;
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    using std::get;
    auto const prefix_size = s.size();
    (void)(cd::impl::to_debug_string_append_elem(s, prefix_size, get<I>(v), cfg) && ...);
}

/// Appends "{k0: v0, k1: v1}" for any range of key-value tuple-likes.
template <class R>
void to_debug_string_append_mapping(std::string& s, R const& r, debug_string_config const& cfg)
{
    using std::get;

    auto const prefix_size = s.size() + 1;
    s += "{";
    for (auto&& e : r)
    {
        if (!cd::impl::to_debug_string_separate(s, prefix_size, cfg))
            break;

        s += cd::to_debug_string(get<0>(e), cfg);
        s += ": ";
        s += cd::to_debug_string(get<1>(e), cfg);
    }
    s += "}";
}

template <class T>
std::string to_debug_string_number(T v)
{
    char buf[64];
    auto const res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

inline std::string to_debug_string_hex(unsigned char c, bool escaped)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), escaped ? "\\x%02X" : "%02X", unsigned(c));
    return buf;
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");

        // Escape control and non-printable characters
        if (v == '\0')
            s += "\\0";
        else if (v == '\n')
            s += "\\n";
        else if (v == '\r')
            s += "\\r";
        else if (v == '\t')
            s += "\\t";
        else if (v == '\\')
            s += "\\\\";
        else if (v == '\'')
            s += "\\'";
        else if ((v >= 0 && v < 32) || v == 127) // Other control characters
            s += impl::to_debug_string_hex(static_cast<unsigned char>(v), true);
        else // Printable characters (including space)
            s += v;

        s += '\'';
        return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return impl::to_debug_string_number(v);
    }
    else if constexpr (requires { std::variant_size<T>::value; })
    {
        if (v.valueless_by_exception())
            return "<valueless>";
        return std::visit([&](auto const& alt) { return cd::to_debug_string(alt, cfg); }, v);
    }
    else if constexpr (requires { v.to_debug_string(cfg); })
    {
        return std::string(v.to_debug_string(cfg));
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           typename T::key_type;
                           typename T::mapped_type;
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string();
        impl::to_debug_string_append_mapping(s, v, cfg);
        return s;
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!cd::impl::to_debug_string_append_elem(s, 1, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        cd::impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = reinterpret_cast<unsigned char const*>(&v);
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            s += impl::to_debug_string_hex(p_v[i], false);
        }
        return s;
    }
}
} // namespace cd

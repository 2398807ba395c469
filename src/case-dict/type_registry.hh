#pragma once

#include <case-dict/fwd.hh>

#include <string>
#include <string_view>
#include <utility>

// =========================================================================================================
// Runtime type identity
// =========================================================================================================
//
// Every (base kind, normalizer) pair has exactly one cd::type_descriptor per process.
// Descriptors are created lazily by cd::build and never destroyed, so they are compared by address:
//
//   auto const& a = cd::build(cd::hashed_base::info(), cd::case_fold_normalizer::info());
//   auto const& b = cd::dicti<int>::descriptor();
//   // &a == &b, a.name() == "dicti"
//
// The registry also maps names to descriptors. This is what deserialization uses to check
// that a tagged YAML mapping belongs to the requested C++ type.
//
// The registry is process-global and guarded by a mutex.

namespace cd
{
/// Capabilities a base kind must provide, as bit flags for runtime base kinds.
/// Compile-time base kinds are checked by the cd::base_kind concept instead.
namespace capability
{
inline constexpr u32 lookup = 1u << 0;
inline constexpr u32 insert = 1u << 1;
inline constexpr u32 remove = 1u << 2;
inline constexpr u32 iterate = 1u << 3;
inline constexpr u32 size = 1u << 4;
inline constexpr u32 clear = 1u << 5;

inline constexpr u32 required = lookup | insert | remove | iterate | size | clear;
} // namespace capability

/// Runtime identity of a base kind.
/// Must outlive every descriptor built from it (the provided kinds are static).
struct base_kind_info
{
    std::string name;
    bool preserves_order = false;

    /// the kind whose comparison logic this one extends, nullptr for root kinds
    /// e.g. "odict" refines "dict"
    base_kind_info const* refines = nullptr;

    u32 capabilities = 0;
};

/// How two mappings are compared, see select_comparison.
enum class comparison_mode
{
    unordered,
    ordered,
};

/// true iff kind == base or kind transitively refines base
[[nodiscard]] bool refines(base_kind_info const& kind, base_kind_info const& base);

/// Selects the comparison used by lhs == rhs.
/// The right-hand logic is used if its kind refines the left-hand one, otherwise the left-hand logic.
/// An insertion-ordered kind compares order-sensitively only against another insertion-ordered kind,
/// so the result is "ordered" iff both kinds preserve insertion order.
[[nodiscard]] comparison_mode select_comparison(base_kind_info const& lhs, base_kind_info const& rhs);

struct type_descriptor
{
    type_descriptor(std::string name, base_kind_info const& base, normalizer_info const& normalizer)
      : _name(std::move(name)), _base(&base), _normalizer(&normalizer)
    {
    }

    // identity, never copied
    type_descriptor(type_descriptor const&) = delete;
    type_descriptor& operator=(type_descriptor const&) = delete;

    // queries
public:
    /// registry name, e.g. "dicti", "odicti", "dictiascii"
    [[nodiscard]] std::string const& name() const { return _name; }

    [[nodiscard]] base_kind_info const& base() const { return *_base; }
    [[nodiscard]] normalizer_info const& normalizer() const { return *_normalizer; }

    [[nodiscard]] bool preserves_order() const;

private:
    std::string _name;
    base_kind_info const* _base;
    normalizer_info const* _normalizer;
};

/// Returns the unique descriptor of (base, normalizer), creating it on first use.
///
/// name:
///   empty     - the default name: base.name + "i" for the case folding normalizer,
///               base.name + "i" + normalizer.name otherwise
///   non-empty - the name for a new descriptor (the default name becomes an alias if still free),
///               or an additional alias of an existing one
///
/// Throws cd::configuration_error if
///   - base has an empty name or lacks capabilities in capability::required
///   - normalizer has an empty name or no function
///   - the resulting name is already bound to a different descriptor
[[nodiscard]] type_descriptor const& build(base_kind_info const& base,
                                           normalizer_info const& normalizer,
                                           std::string name = {});

/// Looks up a descriptor by name or alias, nullptr if unknown.
[[nodiscard]] type_descriptor const* find_type(std::string_view name);
} // namespace cd

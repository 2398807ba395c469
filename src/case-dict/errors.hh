#pragma once

#include <case-dict/macros.hh>

#include <stdexcept>
#include <string>
#include <string_view>

// =========================================================================================================
// Exceptions thrown by case-dict
// =========================================================================================================
//
//   key_not_found        - at/remove/pop/popitem on an absent key or empty mapping
//   configuration_error  - malformed runtime base kind / normalizer, registry name conflicts
//   serialization_error  - YAML input that cannot become the requested mapping type
//
// Programmer errors (broken invariants) are assertions, see <case-dict/assert.hh>.

namespace cd
{
/// Thrown when a key-based access does not find the normalized key.
/// Mirrors the absent-key behavior of std::map::at, hence derives from std::out_of_range.
/// key() is the key as passed by the caller (debug-rendered), not the normalized form.
struct key_not_found : std::out_of_range
{
    explicit key_not_found(std::string key_repr);

    [[nodiscard]] std::string const& key() const { return _key; }

private:
    std::string _key;
};

/// Thrown by the type registry when build() receives malformed input
/// or when a registry name is already bound to a different type.
struct configuration_error : std::logic_error
{
    using std::logic_error::logic_error;
};

/// Thrown when deserialized data cannot be turned into the requested mapping type.
struct serialization_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

namespace impl
{
[[noreturn]] CD_COLD_FUNC void throw_key_not_found(std::string key_repr);
[[noreturn]] CD_COLD_FUNC void throw_empty_mapping();
} // namespace impl
} // namespace cd

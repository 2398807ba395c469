#pragma once

#include <case-dict/dicti.hh>
#include <case-dict/errors.hh>
#include <case-dict/fwd.hh>

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

// =========================================================================================================
// YAML serialization
// =========================================================================================================
//
// A mapping is written as a YAML mapping tagged with its registry name, entries in iteration order
// with their original keys:
//
//   !<odicti>
//   Hello: 1
//   world: 2
//
// Reading resolves the tag through the registry (cd::find_type) and requires the same descriptor
// as the requested type, so an "odicti" document cannot silently become a cd::dicti.
// Untagged mappings are plain input and are accepted by every mapping type.
//
// Keys and values go through YAML::convert, nested case-insensitive mappings included.
// yaml-cpp exceptions (YAML::ParserException, YAML::BadConversion, ...) propagate unchanged.

namespace cd
{
template <class K, class V, class Base, class Normalizer>
[[nodiscard]] YAML::Node to_yaml(basic_dicti<K, V, Base, Normalizer> const& m);

/// Throws cd::serialization_error if node is not a mapping or is tagged as a different type.
template <class T>
[[nodiscard]] T from_yaml(YAML::Node const& node);

template <class K, class V, class Base, class Normalizer>
[[nodiscard]] std::string dump_yaml(basic_dicti<K, V, Base, Normalizer> const& m);

template <class T>
[[nodiscard]] T load_yaml(std::string_view text);

namespace impl
{
// throws if tag names a type other than expected, empty and non-specific tags pass
void check_yaml_tag(std::string const& tag, type_descriptor const& expected);
} // namespace impl
} // namespace cd

//
// Implementation
//

template <class K, class V, class Base, class Normalizer>
YAML::Node cd::to_yaml(basic_dicti<K, V, Base, Normalizer> const& m)
{
    auto node = YAML::Node(YAML::NodeType::Map);
    node.SetTag(m.descriptor().name());
    for (auto const& [key, value] : m)
        node.force_insert(key, value);
    return node;
}

template <class T>
T cd::from_yaml(YAML::Node const& node)
{
    static_assert(cd::is_basic_dicti<T>, "from_yaml creates case-insensitive mappings");

    if (!node.IsMap())
        throw serialization_error("cannot read '" + T::descriptor().name() + "' from a YAML node that is not a mapping");

    impl::check_yaml_tag(node.Tag(), T::descriptor());

    T m;
    for (auto const& kv : node)
        m.set(kv.first.as<typename T::key_type>(), kv.second.as<typename T::mapped_type>());
    return m;
}

template <class K, class V, class Base, class Normalizer>
std::string cd::dump_yaml(basic_dicti<K, V, Base, Normalizer> const& m)
{
    YAML::Emitter out;
    out << cd::to_yaml(m);
    return out.c_str();
}

template <class T>
T cd::load_yaml(std::string_view text)
{
    return cd::from_yaml<T>(YAML::Load(std::string(text)));
}

namespace YAML
{
template <class K, class V, class Base, class Normalizer>
struct convert<cd::basic_dicti<K, V, Base, Normalizer>>
{
    using mapping_t = cd::basic_dicti<K, V, Base, Normalizer>;

    static Node encode(mapping_t const& rhs) { return cd::to_yaml(rhs); }

    static bool decode(Node const& node, mapping_t& rhs)
    {
        if (!node.IsMap())
            return false;

        rhs = cd::from_yaml<mapping_t>(node);
        return true;
    }
};
} // namespace YAML

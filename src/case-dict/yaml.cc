#include "yaml.hh"

void cd::impl::check_yaml_tag(std::string const& tag, type_descriptor const& expected)
{
    // "?" and "!" are the non-specific tags of untagged plain and quoted nodes
    if (tag.empty() || tag == "?" || tag == "!")
        return;

    // local tags (!odicti) name the same types as verbatim ones (!<odicti>)
    auto name = std::string_view(tag);
    if (name.starts_with('!'))
        name.remove_prefix(1);

    auto const type = cd::find_type(name);
    if (type == nullptr)
        throw serialization_error("unknown mapping type '" + std::string(name) + "'");

    if (type != &expected)
        throw serialization_error("cannot read '" + type->name() + "' as '" + expected.name() + "'");
}

#include "type_registry.hh"

#include <case-dict/errors.hh>
#include <case-dict/normalize.hh>
#include <case-dict/storage.hh>

#include <deque>
#include <map>
#include <mutex>
#include <utility>

namespace
{
struct registry
{
    std::mutex mutex;
    std::deque<cd::type_descriptor> descriptors; // deque: stable addresses
    std::map<std::pair<cd::base_kind_info const*, cd::normalizer_info const*>, cd::type_descriptor const*> by_kinds;
    std::map<std::string, cd::type_descriptor const*, std::less<>> by_name;
};

registry& get_registry()
{
    static registry r;
    return r;
}

void validate(cd::base_kind_info const& base, cd::normalizer_info const& normalizer)
{
    if (base.name.empty())
        throw cd::configuration_error("base kind must have a name");
    if ((base.capabilities & cd::capability::required) != cd::capability::required)
        throw cd::configuration_error("base kind '" + base.name
                                      + "' does not provide lookup, insert, remove, iterate, size and clear");
    if (normalizer.name.empty())
        throw cd::configuration_error("normalizer must have a name");
    if (normalizer.fn == nullptr)
        throw cd::configuration_error("normalizer '" + normalizer.name + "' has no function");
}

std::string default_name(cd::base_kind_info const& base, cd::normalizer_info const& normalizer)
{
    if (&normalizer == &cd::case_fold_normalizer::info())
        return base.name + "i";
    return base.name + "i" + normalizer.name;
}

// binds name to desc, must be called with the registry mutex held
void bind_name(registry& r, std::string const& name, cd::type_descriptor const& desc)
{
    auto const [it, inserted] = r.by_name.try_emplace(name, &desc);
    if (!inserted && it->second != &desc)
        throw cd::configuration_error("type name '" + name + "' is already used by a different type");
}
} // namespace

bool cd::type_descriptor::preserves_order() const
{
    return _base->preserves_order;
}

bool cd::refines(base_kind_info const& kind, base_kind_info const& base)
{
    for (auto k = &kind; k != nullptr; k = k->refines)
        if (k == &base)
            return true;
    return false;
}

cd::comparison_mode cd::select_comparison(base_kind_info const& lhs, base_kind_info const& rhs)
{
    auto const& chosen = cd::refines(rhs, lhs) ? rhs : lhs;
    auto const& other = &chosen == &rhs ? lhs : rhs;

    if (chosen.preserves_order && other.preserves_order)
        return comparison_mode::ordered;
    return comparison_mode::unordered;
}

cd::type_descriptor const& cd::build(base_kind_info const& base, normalizer_info const& normalizer, std::string name)
{
    validate(base, normalizer);

    auto& r = get_registry();
    auto const lock = std::lock_guard(r.mutex);

    if (auto it = r.by_kinds.find({&base, &normalizer}); it != r.by_kinds.end())
    {
        auto const& desc = *it->second;
        if (!name.empty())
            bind_name(r, name, desc);
        return desc;
    }

    auto fallback_name = default_name(base, normalizer);
    if (name.empty())
        name = fallback_name;

    if (r.by_name.contains(name))
        throw cd::configuration_error("type name '" + name + "' is already used by a different type");

    auto const& desc = r.descriptors.emplace_back(name, base, normalizer);
    r.by_name.emplace(std::move(name), &desc);
    r.by_kinds.emplace(std::pair{&base, &normalizer}, &desc);

    // an explicitly named type stays reachable under its default name unless that one is taken
    r.by_name.try_emplace(std::move(fallback_name), &desc);
    return desc;
}

cd::type_descriptor const* cd::find_type(std::string_view name)
{
    auto& r = get_registry();
    auto const lock = std::lock_guard(r.mutex);

    auto it = r.by_name.find(name);
    return it == r.by_name.end() ? nullptr : it->second;
}

cd::base_kind_info const& cd::hashed_base::info()
{
    static base_kind_info const info{
        .name = "dict",
        .preserves_order = false,
        .refines = nullptr,
        .capabilities = capability::required,
    };
    return info;
}

cd::base_kind_info const& cd::ordered_base::info()
{
    static base_kind_info const info{
        .name = "odict",
        .preserves_order = true,
        .refines = &hashed_base::info(),
        .capabilities = capability::required,
    };
    return info;
}

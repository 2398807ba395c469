#include "errors.hh"

cd::key_not_found::key_not_found(std::string key_repr)
  : std::out_of_range("key not found: " + key_repr), _key(std::move(key_repr))
{
}

void cd::impl::throw_key_not_found(std::string key_repr)
{
    throw key_not_found(std::move(key_repr));
}

void cd::impl::throw_empty_mapping()
{
    throw key_not_found("popitem(): mapping is empty");
}

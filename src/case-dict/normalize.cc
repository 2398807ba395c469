#include "normalize.hh"

#include <case-dict/errors.hh>

#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <deque>
#include <limits>
#include <mutex>

namespace
{
struct normalizer_table
{
    std::mutex mutex;
    std::deque<cd::normalizer_info> infos; // deque: stable addresses
};

normalizer_table& get_normalizer_table()
{
    static normalizer_table table;
    return table;
}

bool is_ascii(std::string_view s)
{
    for (auto const c : s)
        if (static_cast<unsigned char>(c) >= 0x80)
            return false;
    return true;
}

// s must be well-formed UTF-8
void append_folded(std::string& out, std::string_view s)
{
    if (s.empty())
        return;

    if (is_ascii(s))
    {
        for (auto const c : s)
            out += cd::ascii_to_lower(c);
        return;
    }

    auto text = icu::UnicodeString::fromUTF8(icu::StringPiece(s.data(), int32_t(s.size())));
    text.foldCase(U_FOLD_CASE_DEFAULT);
    text.toUTF8String(out);
}
} // namespace

cd::normalizer_info const& cd::make_normalizer_info(std::string name, normalize_fn fn)
{
    if (name.empty())
        throw configuration_error("normalizer name must not be empty");
    if (fn == nullptr)
        throw configuration_error("normalizer '" + name + "' has no function");

    auto& table = get_normalizer_table();
    auto const lock = std::lock_guard(table.mutex);

    for (auto const& info : table.infos)
    {
        if (info.fn != fn)
            continue;

        if (info.name != name)
            throw configuration_error("normalize function already registered as '" + info.name + "', cannot rename to '"
                                      + name + "'");
        return info;
    }

    return table.infos.emplace_back(normalizer_info{.name = std::move(name), .fn = fn});
}

std::string cd::ascii_fold(std::string_view s)
{
    auto result = std::string(s);
    for (auto& c : result)
        c = cd::ascii_to_lower(c);
    return result;
}

std::string cd::fold_case(std::string_view s)
{
    // ASCII has no multi-character foldings, so this is exact
    if (is_ascii(s))
        return cd::ascii_fold(s);

    CD_ASSERT(s.size() <= size_t(std::numeric_limits<int32_t>::max()), "key too large for ICU");

    // ill-formed bytes are kept as they are and split the text into well-formed runs that are folded
    // one by one, so keys that differ only in invalid bytes (e.g. Latin-1 text) stay distinct
    std::string result;
    result.reserve(s.size());

    auto const length = int32_t(s.size());
    int32_t run_start = 0;
    int32_t i = 0;
    while (i < length)
    {
        auto const cp_start = i;
        UChar32 c = 0;
        U8_NEXT(s.data(), i, length, c);
        if (c >= 0)
            continue;

        append_folded(result, s.substr(run_start, cp_start - run_start));
        result.append(s.data() + cp_start, i - cp_start);
        run_start = i;
    }
    append_folded(result, s.substr(run_start));

    return result;
}

cd::normalizer_info const& cd::case_fold_normalizer::info()
{
    static auto const& info = cd::make_normalizer_info("casefold", &cd::fold_case);
    return info;
}

cd::normalizer_info const& cd::ascii_normalizer::info()
{
    static auto const& info = cd::make_normalizer_info("ascii", &cd::ascii_fold);
    return info;
}

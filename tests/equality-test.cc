#include <case-dict/dicti.hh>

#include <nexus/test.hh>

#include <map>
#include <ranges>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

TEST("equality - reflexive and case-insensitive")
{
    auto const i = cd::dicti<int>{{"Hello", 1}, {"World", 2}};
    auto const oi = cd::odicti<int>{{"Hello", 1}, {"World", 2}};

    CHECK(i == i);
    CHECK(oi == oi);
    CHECK(cd::dicti<int>() == cd::dicti<int>());

    SECTION("original casing is irrelevant")
    {
        auto const other = cd::dicti<int>{{"HELLO", 1}, {"world", 2}};
        CHECK(i == other);
        CHECK(other == i);
    }

    SECTION("values and sizes matter")
    {
        CHECK((i != cd::dicti<int>{{"Hello", 1}, {"World", 3}}));
        CHECK((i != cd::dicti<int>{{"Hello", 1}}));
        CHECK((i != cd::dicti<int>{{"Hello", 1}, {"World", 2}, {"!", 3}}));
        CHECK((i != cd::dicti<int>{{"Hello", 1}, {"Earth", 2}}));
    }

    SECTION("mixed value types")
    {
        auto const l = cd::dicti<long>{{"HELLO", 1}, {"world", 2}};
        CHECK(i == l);
    }
}

TEST("equality - order sensitivity")
{
    auto const oi = cd::odicti<int>{{"Hello", 1}, {"beautiful", 2}, {"world!", 3}};
    auto const i = cd::dicti<int>(oi);
    auto const roi = cd::odicti<int>(oi | std::views::reverse);

    SECTION("ordered vs ordered compares order")
    {
        CHECK(oi != roi);
        CHECK(roi != oi);
        CHECK((oi == cd::odicti<int>{{"HELLO", 1}, {"Beautiful", 2}, {"WORLD!", 3}}));
    }

    SECTION("hashed vs ordered ignores order")
    {
        CHECK(i == oi);
        CHECK(oi == i);
        CHECK(roi == i);
        CHECK(i == roi);
    }

    SECTION("not transitive")
    {
        CHECK(roi == i);
        CHECK(i == oi);
        CHECK(!(oi == roi));
    }
}

TEST("equality - comparison selection")
{
    auto const& dict = cd::hashed_base::info();
    auto const& odict = cd::ordered_base::info();

    CHECK(cd::refines(odict, dict));
    CHECK(cd::refines(dict, dict));
    CHECK(!cd::refines(dict, odict));

    CHECK(cd::select_comparison(dict, dict) == cd::comparison_mode::unordered);
    CHECK(cd::select_comparison(dict, odict) == cd::comparison_mode::unordered);
    CHECK(cd::select_comparison(odict, dict) == cd::comparison_mode::unordered);
    CHECK(cd::select_comparison(odict, odict) == cd::comparison_mode::ordered);
}

TEST("equality - plain mappings are wrapped")
{
    auto const oi = cd::odicti<int>{{"Hello", 1}, {"World", 2}};

    SECTION("std::map")
    {
        auto const m = std::map<std::string, int>{{"hello", 1}, {"WORLD", 2}};
        CHECK(oi == m);
        CHECK(m == oi);
        CHECK((oi != std::map<std::string, int>{{"hello", 1}}));
    }

    SECTION("std::unordered_map")
    {
        auto const m = std::unordered_map<std::string, int>{{"HELLO", 1}, {"world", 2}};
        CHECK(oi == m);
        CHECK(cd::dicti<int>(oi) == m);
    }

    SECTION("vector of pairs compares in order against ordered mappings")
    {
        using items_t = std::vector<std::pair<std::string, int>>;
        CHECK((oi == items_t{{"hello", 1}, {"world", 2}}));
        CHECK((oi != items_t{{"world", 2}, {"hello", 1}}));
        CHECK((cd::dicti<int>(oi) == items_t{{"world", 2}, {"hello", 1}}));
    }
}

TEST("equality - different normalizers")
{
    using ascii_dicti = cd::build_t<cd::hashed_base, cd::ascii_normalizer, std::string, int>;

    SECTION("equal under both")
    {
        auto const a = ascii_dicti{{"Hello", 1}};
        auto const u = cd::dicti<int>{{"HELLO", 1}};
        CHECK(a == u);
        CHECK(u == a);
    }

    SECTION("equal under only one")
    {
        auto const a = ascii_dicti{{"STRASSE", 1}};
        auto const u = cd::dicti<int>{{"Stra\xC3\x9F" "e", 1}};
        CHECK(a != u);
        CHECK(u != a);

        // folding matches, but ascii lowering does not
        CHECK((u == cd::dicti<int>{{"STRASSE", 1}}));
    }
}

#include <case-dict/yaml.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

namespace
{
template <class F>
bool throws_serialization_error(F&& f)
{
    try
    {
        f();
    }
    catch (cd::serialization_error const&)
    {
        return true;
    }
    return false;
}
} // namespace

TEST("yaml - round trip")
{
    auto const oi = cd::odicti<int>{{"Hello", 1}, {"beautiful", 2}, {"World!", 3}};

    SECTION("odicti keeps order, spelling and type")
    {
        auto const text = cd::dump_yaml(oi);
        auto const back = cd::load_yaml<cd::odicti<int>>(text);

        CHECK(back == oi);
        CHECK(&back.descriptor() == &oi.descriptor());

        auto keys = std::vector<std::string>();
        for (auto const& k : back.keys())
            keys.push_back(k);
        CHECK((keys == std::vector<std::string>{"Hello", "beautiful", "World!"}));
    }

    SECTION("dicti")
    {
        auto const i = cd::dicti<std::string>{{"Key", "value"}, {"Other", "thing"}};
        auto const back = cd::load_yaml<cd::dicti<std::string>>(cd::dump_yaml(i));
        CHECK(back == i);
        CHECK(back.at("KEY") == "value");
    }

    SECTION("node form")
    {
        auto const node = cd::to_yaml(oi);
        CHECK(node.IsMap());
        CHECK(node.Tag() == "odicti");
        CHECK(node.size() == 3);
        CHECK(node["Hello"].as<int>() == 1);

        auto const back = cd::from_yaml<cd::odicti<int>>(node);
        CHECK(back == oi);
    }

    SECTION("tag is written")
    {
        auto const text = cd::dump_yaml(oi);
        CHECK(text.find("odicti") != std::string::npos);
        CHECK(text.find("Hello: 1") != std::string::npos);
    }
}

TEST("yaml - nested mappings")
{
    auto m = cd::odicti<cd::dicti<int>>();
    m["Outer"].set("Inner", 1);
    m["Second"].set("X", 2);

    auto const back = cd::load_yaml<cd::odicti<cd::dicti<int>>>(cd::dump_yaml(m));
    CHECK(back == m);
    CHECK(back.at("OUTER").at("inner") == 1);

    SECTION("generic decoding through YAML::convert")
    {
        auto const node = YAML::Load("{Alpha: 1, ALPHA: 2, beta: 3}");
        auto const d = node.as<cd::odicti<int>>();
        CHECK(d.size() == 2);
        CHECK(d.at("alpha") == 2);
        CHECK(*d.keys().begin() == "Alpha");
    }
}

TEST("yaml - type checks")
{
    SECTION("untagged input is accepted")
    {
        auto const d = cd::load_yaml<cd::dicti<int>>("One: 1\nTWO: 2\n");
        CHECK(d.at("one") == 1);
        CHECK(d.at("two") == 2);
    }

    SECTION("local and verbatim tags")
    {
        CHECK(cd::load_yaml<cd::dicti<int>>("!<dicti> {a: 1}").at("A") == 1);
        CHECK(cd::load_yaml<cd::dicti<int>>("!dicti {a: 1}").at("A") == 1);
    }

    SECTION("aliases resolve to the same type")
    {
        (void)cd::build<cd::ordered_base>("yaml_OrderedDicti");
        auto const d = cd::load_yaml<cd::odicti<int>>("!<yaml_OrderedDicti> {b: 1, a: 2}");
        CHECK(*d.keys().begin() == "b");
    }

    SECTION("different type")
    {
        auto const text = cd::dump_yaml(cd::odicti<int>{{"a", 1}});
        CHECK(throws_serialization_error([&] { (void)cd::load_yaml<cd::dicti<int>>(text); }));
    }

    SECTION("unknown type")
    {
        CHECK(throws_serialization_error([] { (void)cd::load_yaml<cd::dicti<int>>("!<nosuchdict> {a: 1}"); }));
    }

    SECTION("not a mapping")
    {
        CHECK(throws_serialization_error([] { (void)cd::load_yaml<cd::dicti<int>>("[1, 2, 3]"); }));
        CHECK(throws_serialization_error([] { (void)cd::load_yaml<cd::dicti<int>>("just text"); }));
    }

    SECTION("yaml-cpp errors propagate")
    {
        bool thrown = false;
        try
        {
            (void)cd::load_yaml<cd::dicti<int>>("{a: not a number}");
        }
        catch (YAML::BadConversion const&)
        {
            thrown = true;
        }
        CHECK(thrown);
    }
}

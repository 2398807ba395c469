#include <case-dict/assert-handler.hh>
#include <case-dict/assert.hh>
#include <case-dict/storage.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
struct assertion_caught
{
    std::string message;
};

using test_entry = cd::entry<std::string, int, std::string>;

// runs f with a handler that turns assertion failures into assertion_caught
template <class F>
std::optional<std::string> caught_assertion(F&& f)
{
    auto handler = cd::impl::scoped_assertion_handler([](cd::impl::assertion_info const& info)
                                                      { throw assertion_caught{info.message}; });
    try
    {
        f();
    }
    catch (assertion_caught const& e)
    {
        return e.message;
    }
    return std::nullopt;
}
} // namespace

TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<cd::impl::assertion_info> captured;
    // CAREFUL: this is a bit brittle wrt. formatting but it should be fine
    int const test_line = __LINE__ + 11; // line where CD_ASSERT_ALWAYS is called

    {
        auto handler = cd::impl::scoped_assertion_handler(
            [&](cd::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });
        try
        {
            CD_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());
    CHECK(captured->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(captured->message == "arithmetic is broken");

    auto const file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));
    CHECK(int(captured->location.line()) == test_line);
}

TEST("assertions - passing assertion does not call handler")
{
    bool handler_called = false;

    {
        auto handler
            = cd::impl::scoped_assertion_handler([&](cd::impl::assertion_info const&) { handler_called = true; });
        CD_ASSERT_ALWAYS(true, "never reported");
        CD_ASSERT(2 > 1, "never reported either");
    }

    CHECK(!handler_called);
}

TEST("assertions - handler stack is LIFO")
{
    std::vector<int> events;

    auto handler_a = cd::impl::scoped_assertion_handler(
        [&](cd::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    {
        auto handler_b = cd::impl::scoped_assertion_handler(
            [&](cd::impl::assertion_info const&)
            {
                events.push_back(2);
                throw 0;
            });

        try
        {
            CD_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        CD_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2);
    CHECK(events[1] == 1);
}

#if CD_ASSERT_ENABLED

TEST("assertions - storage preconditions")
{
    SECTION("ordered storage")
    {
        auto s = cd::ordered_storage<std::string, test_entry>();
        CHECK(caught_assertion([&] { (void)s.take_last(); }) == "storage is empty");
        CHECK(caught_assertion([&] { (void)s.take("missing"); }) == "normalized key not present");

        s.emplace(test_entry("Key", "key", 1));
        CHECK(caught_assertion([&] { s.emplace(test_entry("KEY", "key", 2)); }) == "normalized key already present");
        CHECK(s.size() == 1);
        CHECK(s.find("key")->value() == 1);
    }

    SECTION("hashed storage")
    {
        auto s = cd::hashed_storage<std::string, test_entry>();
        CHECK(caught_assertion([&] { (void)s.take_last(); }) == "storage is empty");
        CHECK(caught_assertion([&] { (void)s.take("missing"); }) == "normalized key not present");

        s.emplace(test_entry("Key", "key", 1));
        CHECK(caught_assertion([&] { s.emplace(test_entry("kEy", "key", 2)); }) == "normalized key already present");
        CHECK(s.size() == 1);
        CHECK(s.find("key")->value() == 1);
    }
}

#endif

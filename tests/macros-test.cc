#include <case-dict/macros.hh>

#include <nexus/test.hh>

// =========================================================================================================
// Preprocessor-level compile-time checks
// =========================================================================================================

#if defined(CD_COMPILER_MSVC) + defined(CD_COMPILER_CLANG) + defined(CD_COMPILER_GCC) != 1
#error "Expected exactly one compiler family macro to be defined"
#endif

#if defined(CD_OS_WINDOWS) + defined(CD_OS_LINUX) + defined(CD_OS_APPLE) + defined(CD_OS_BSD) != 1
#error "Expected exactly one OS macro to be defined"
#endif

#if CD_ASSERT_ENABLED != 0 && CD_ASSERT_ENABLED != 1
#error "CD_ASSERT_ENABLED must be 0 or 1"
#endif

// only the macros the library uses are part of its surface
#if defined(CD_PRETTY_FUNC) || defined(CD_FORCE_INLINE) || defined(CD_STRINGIFY_EXPR)
#error "unused helper macros leaked into macros.hh"
#endif

namespace
{
CD_COLD_FUNC int cold_answer()
{
    return 42;
}
} // namespace

// =========================================================================================================
// Runtime tests
// =========================================================================================================

TEST("macros - build configuration")
{
#if defined(CD_DEBUG) || defined(CD_RELWITHDEBINFO) || defined(CD_ENABLE_ASSERT_IN_RELEASE)
    CHECK(CD_ASSERT_ENABLED == 1);
#endif

#if defined(CD_RELEASE) && !defined(CD_ENABLE_ASSERT_IN_RELEASE)
    CHECK(CD_ASSERT_ENABLED == 0);
#endif
}

TEST("macros - function helpers")
{
    SECTION("cold functions are callable")
    {
        CHECK(cold_answer() == 42);
    }

    SECTION("CD_UNUSED does not evaluate")
    {
        auto calls = 0;
        CD_UNUSED(++calls);
        CHECK(calls == 0);
    }
}

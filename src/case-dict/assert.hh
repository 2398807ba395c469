#pragma once

// Lean header: easy to include everywhere, only pulls in <source_location> and <string_view>.
#include <case-dict/macros.hh>

#include <source_location>
#include <string_view>

// =========================================================================================================
// CD_ASSERT - Runtime assertion with a string message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
// The message may be a literal or anything convertible to std::string_view.
//
// When assertions are active:
//   Enabled in CD_DEBUG and CD_RELWITHDEBINFO builds.
//   In CD_RELEASE builds, assertions are disabled unless CD_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS of the mapping internals,
//   e.g. "the lookup index and the entry sequence agree" or "iterator is dereferenceable".
//
// What assertions are NOT for:
//   - NOT for absent keys (cd::key_not_found is thrown instead)
//   - NOT for malformed registry input (cd::configuration_error is thrown instead)
//   - NOT for malformed serialized data (cd::serialization_error is thrown instead)
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - Exceptions      -> everything a caller can trigger with valid code and unexpected data
//
// Usage:
//   CD_ASSERT(idx >= 0, "negative entry index");
//   CD_ASSERT(_index.size() == _entries.size(), "index and entries out of sync");
//
#define CD_ASSERT(cond, msg) CD_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// CD_ASSERT_ALWAYS - Always-active assertion
//
// Like CD_ASSERT but remains active in all build configurations, including release builds.
//
#define CD_ASSERT_ALWAYS(cond, msg) CD_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// CD_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define CD_DEBUG_BREAK() CD_IMPL_DEBUG_BREAK()

// =========================================================================================================
// CD_BREAK_AND_ABORT - Debug break followed by program termination
//
#define CD_BREAK_AND_ABORT() (CD_DEBUG_BREAK(), ::cd::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace cd::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (see assert-handler.hh) or prints to stderr
// Note: does not abort, caller must follow with CD_BREAK_AND_ABORT()
CD_COLD_FUNC void handle_assert_failure(char const* expression, std::string_view message, std::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace cd::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef CD_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define CD_IMPL_DEBUG_BREAK() (::cd::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(CD_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define CD_IMPL_DEBUG_BREAK() (::cd::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define CD_IMPL_DEBUG_BREAK() void(0)

#endif

#define CD_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::cd::impl::handle_assert_failure(#cond, msg, std::source_location::current()); \
            CD_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if CD_ASSERT_ENABLED

#define CD_IMPL_ASSERT(cond, msg) CD_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the message still has to compile
#define CD_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        CD_UNUSED(cond);          \
        CD_UNUSED(msg);           \
    } while (false)

#endif

#pragma once

#include <case-dict/macros.hh>

#include <functional>
#include <source_location>
#include <string>

namespace cd::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = cd::impl::scoped_assertion_handler([](cd::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw assertion_failure_exception{info.message};
//       });
//
//       // Any assertions in this scope will use the custom handler
//       risky_operation();
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    std::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers are allowed to throw exceptions to unwind to some recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// (prefer using scoped_assertion_handler for automatic cleanup)
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace cd::impl

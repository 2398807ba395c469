#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: CD_COMPILER_MSVC, CD_COMPILER_CLANG, CD_COMPILER_GCC, CD_COMPILER_POSIX

#if defined(_MSC_VER)
#define CD_COMPILER_MSVC
#elif defined(__clang__)
#define CD_COMPILER_CLANG
#elif defined(__GNUC__)
#define CD_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(CD_COMPILER_CLANG) || defined(CD_COMPILER_GCC)
#define CD_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: CD_OS_WINDOWS, CD_OS_LINUX, CD_OS_APPLE, CD_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define CD_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define CD_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define CD_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define CD_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: CD_DEBUG, CD_RELEASE, CD_RELWITHDEBINFO
// Optional:   CD_ENABLE_ASSERT_IN_RELEASE
// Always defined (0 or 1): CD_ASSERT_ENABLED

#if defined(CD_DEBUG) || defined(CD_RELWITHDEBINFO) || defined(CD_ENABLE_ASSERT_IN_RELEASE)
#define CD_ASSERT_ENABLED 1
#elif !defined(CD_RELEASE)
// unknown configuration (e.g. a consumer not using our CMake): keep checks on
#define CD_ASSERT_ENABLED 1
#else
#define CD_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// CD_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: CD_COLD_FUNC void throw_key_not_found() { ... }
#define CD_COLD_FUNC CD_IMPL_COLD_FUNC

// CD_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked
#define CD_UNUSED(expr) (void)(sizeof((expr)))

// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(CD_COMPILER_MSVC)

#define CD_IMPL_COLD_FUNC

#elif defined(CD_COMPILER_POSIX)

#define CD_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif


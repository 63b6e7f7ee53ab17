/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Provides a single formatting entry point for log messages and error
 * strings. std::format is used where the standard library ships it; the
 * fmt library is used otherwise.
 *
 * Detection is based on the __cpp_lib_format feature test macro.
 *
 * Usage:
 *   #include <rbac/compat/format.hpp>
 *   auto s = rbac::compat::format("role {} created", role_ref);
 */

#pragma once

#include <version>  // For feature test macros

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define RBAC_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    // Apple Clang 15+ with libc++ supports std::format
    #define RBAC_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define RBAC_HAS_STD_FORMAT 1
#else
    #define RBAC_HAS_STD_FORMAT 0
#endif

#if RBAC_HAS_STD_FORMAT
    #include <format>
    namespace rbac::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    // Use fmt library as fallback
    #include <fmt/format.h>
    namespace rbac::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

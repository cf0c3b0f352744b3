/**
 * @file format.hpp
 * @brief std::format / fmt::format selection
 *
 * Usage:
 *   #include <app_access/compat/format.hpp>
 *   auto s = app_access::compat::format("Group '{}' removed", name);
 */

#pragma once

#include <version>

// libstdc++ before GCC 13 ships no <format>; the fmt library covers that case.
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define APP_ACCESS_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define APP_ACCESS_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define APP_ACCESS_HAS_STD_FORMAT 1
#else
    #define APP_ACCESS_HAS_STD_FORMAT 0
#endif

#if APP_ACCESS_HAS_STD_FORMAT
    #include <format>
    namespace app_access::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace app_access::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

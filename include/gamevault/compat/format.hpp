/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Detection is based on the __cpp_lib_format feature test macro. Toolchains
 * without std::format (e.g. libstdc++ before GCC 13) use the fmt library.
 *
 * Usage:
 *   #include <gamevault/compat/format.hpp>
 *   auto s = gamevault::compat::format("game {} moved to {}", id, name);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define GAMEVAULT_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define GAMEVAULT_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define GAMEVAULT_HAS_STD_FORMAT 1
#else
    #define GAMEVAULT_HAS_STD_FORMAT 0
#endif

#if GAMEVAULT_HAS_STD_FORMAT
    #include <format>
    namespace gamevault::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace gamevault::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

/**
 * @file format.hpp
 * @brief std::format / fmt::format selection for loadgen
 *
 * Picks std::format when the standard library provides it (detected through
 * __cpp_lib_format) and falls back to the fmt library otherwise. All loadgen
 * code formats through loadgen::compat::format.
 *
 * Usage:
 *   #include <loadgen/compat/format.hpp>
 *   auto s = loadgen::compat::format("sent {} of {}", done, total);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define LOADGEN_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define LOADGEN_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define LOADGEN_HAS_STD_FORMAT 1
#else
    #define LOADGEN_HAS_STD_FORMAT 0
#endif

#if LOADGEN_HAS_STD_FORMAT
    #include <format>
    namespace loadgen::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace loadgen::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

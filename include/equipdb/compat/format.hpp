/**
 * @file format.hpp
 * @brief Formatting entry point for equipdb log lines and error messages
 *
 * Migration log entries, backup names, Result error messages and the
 * logger_adapter templates all format through equipdb::compat. The
 * logger_adapter methods take a compat::format_string so that a format
 * string that does not match its arguments fails to compile.
 *
 * std::format is used when the standard library advertises it through
 * __cpp_lib_format; otherwise {fmt} provides the same API.
 *
 * @code
 * auto line = equipdb::compat::format("Migration {} completed", version);
 * @endcode
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define EQUIPDB_HAS_STD_FORMAT 1
#else
    #define EQUIPDB_HAS_STD_FORMAT 0
#endif

#if EQUIPDB_HAS_STD_FORMAT
    #include <format>
    namespace equipdb::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace equipdb::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif

#pragma once

/**
@file
@brief A simple logging mechanism to aid development.

Uses compile-time enable/disable flags to ensure optimal performance when these logs are disabled.
Messages are written to `stderr` so that tools streaming decoded image data through `stdout` are not disturbed.

Not meant to be used for user logs.

@section Usage

First, define groups:

```cpp
namespace grp {
    // Simple group
    struct base {
        static constexpr bool enabled = true;                         // whether the log group is enabled
        static constexpr devlog::Level level = devlog::level::debug;  // the minimum logging level to be printed
        static constexpr std::string_view name = "CHD";               // the group's name printed before the message
    };

    // Inherit rules from another group
    struct map : public base {
        static constexpr std::string_view name = "CHD-Map"; // override what you need
    };
}
```

Use groups to log messages:

```cpp
devlog::debug<grp::base>("Opening image");
devlog::info<grp::map>("Uses {{fmt}} formatting: {} {:X}", 123, 0x456);
```

If the log messages need complex calculations, use an `if constexpr` block to ensure they are completely erased from
non-devlog builds:

```cpp
if constexpr (devlog::trace_enabled<grp::base>) {
    auto result = ...; // do complex calculation
    devlog::trace<grp::base>("Complex result: {}", result);
}
```
*/

/**
@namespace devlog
@brief Development logging utilities.
*/

#include <chdview/core/types.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstdio>
#include <string_view>

namespace devlog {

/// @brief Globally enable or disable dev logging.
inline constexpr bool globalEnable = chdview_ENABLE_DEVLOG;

// -----------------------------------------------------------------------------
// Log levels

/// @brief Log level type - a simple integer type.
using Level = uint32;

/// @brief Dev log levels definitions.
namespace level {
    /// @brief The lowest log level for fine-grained details.
    ///
    /// Use cases include logging every cache lookup or decoded FLAC frame.
    inline constexpr Level trace = 1;

    /// @brief A detailed log level without being too performance-hungry.
    ///
    /// Use cases include logging hunk decode failures, cache evictions or parent hunk redirections.
    inline constexpr Level debug = 2;

    /// @brief General log level, for informational messages.
    ///
    /// Use cases include infrequent operations like opening images, attaching parents or decoding maps.
    inline constexpr Level info = 3;

    /// @brief A log level for potential issues that don't prevent images from being read.
    ///
    /// Use cases include unsupported codecs declared in the header and hunks that fail checksum verification.
    inline constexpr Level warn = 4;

    /// @brief A log level for serious issues that make an image unreadable.
    ///
    /// Use cases include corrupted maps and broken parent chains.
    inline constexpr Level error = 5;

    /// @brief Not a valid log level.
    ///
    /// This is used to completely disable logging for a particular group.
    inline constexpr Level off = 6;

    /// @brief The name for a given log level.
    /// @tparam level the log level
    template <Level level>
    inline constexpr const char *name = "unk";

    template <>
    inline constexpr const char *name<trace> = "trace";
    template <>
    inline constexpr const char *name<debug> = "debug";
    template <>
    inline constexpr const char *name<info> = "info";
    template <>
    inline constexpr const char *name<warn> = "warn";
    template <>
    inline constexpr const char *name<error> = "error";
} // namespace level

namespace detail {

    /// @brief Describes a log group.
    ///
    /// Log groups must contain three `static` fields:
    /// - `static bool enabled`: determines if the log group is enabled or not
    /// - `static devlog::Level level`: determines the minimum log level to be printed
    /// - `static std::string_view name`: the name printed before the log message
    template <typename T>
    concept Group = requires() {
        requires std::same_as<std::decay_t<decltype(T::enabled)>, bool>;
        requires std::same_as<std::decay_t<decltype(T::level)>, Level>;
        requires std::same_as<std::decay_t<decltype(T::name)>, std::string_view>;
    };

    /// @brief Determines if logging is enabled for the level `level` in the group `TGroup`.
    /// @tparam level the log level to check
    /// @tparam TGroup the group to check
    template <Level level, Group TGroup>
    inline constexpr bool enabled = globalEnable && TGroup::enabled && level >= TGroup::level;

    /// @brief Logs a message to the dev log of the specified group.
    /// @tparam level the log level
    /// @tparam TGroup the log group
    /// @tparam ...TArgs the log message's argument types
    /// @param[in] fmt the format string to pass to `fmt::print`
    /// @param[in] ...args the log message's arguments
    template <Level level, Group TGroup, typename... TArgs>
    constexpr void log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        static_assert(level < level::off);
        if constexpr (enabled<level, TGroup>) {
            fmt::print(stderr, "{:5s} | {:16s} | ", level::name<level>, TGroup::name);
            fmt::println(stderr, fmt, static_cast<TArgs &&>(args)...);
        }
    }

} // namespace detail

/// @brief Determines if trace logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool trace_enabled = detail::enabled<level::trace, TGroup>;

/// @brief Determines if debug logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool debug_enabled = detail::enabled<level::debug, TGroup>;

/// @brief Determines if info logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool info_enabled = detail::enabled<level::info, TGroup>;

/// @brief Determines if warn logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool warn_enabled = detail::enabled<level::warn, TGroup>;

/// @brief Determines if error logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool error_enabled = detail::enabled<level::error, TGroup>;

/// @brief Logs a message in the trace level with the specified group.
template <detail::Group TGroup, typename... TArgs>
constexpr void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::trace, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message in the debug level with the specified group.
template <detail::Group TGroup, typename... TArgs>
constexpr void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::debug, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message in the info level with the specified group.
template <detail::Group TGroup, typename... TArgs>
constexpr void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::info, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message in the warn level with the specified group.
template <detail::Group TGroup, typename... TArgs>
constexpr void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::warn, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message in the error level with the specified group.
template <detail::Group TGroup, typename... TArgs>
constexpr void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::error, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

} // namespace devlog

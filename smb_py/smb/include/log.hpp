//  Program:      smb-py
//  File:         log.hpp
//  Description:  Leveled development logging by group on top of fmt
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#ifndef SMB_LOG_HPP
#define SMB_LOG_HPP

#include <fmt/format.h>
#include <string>

/// Development logging utilities.
///
/// Groups are plain structs with a static `name()` function:
///
///     namespace grp {
///         struct env { static const char* name() { return "Env"; } };
///     }
///
///     devlog::debug<grp::env>("reset with seed {}", seed);
///
/// Messages below the runtime threshold are discarded before formatting.
namespace SMB {
namespace devlog {

/// Dev log levels, lowest to highest.
enum class Level : int {
    trace = 1,
    debug = 2,
    info = 3,
    warn = 4,
    error = 5,
    /// not a valid message level, disables all logging when set as threshold
    off = 6
};

/// Return the current threshold below which messages are dropped.
Level level();

/// Set the threshold below which messages are dropped.
void set_level(Level level);

/// Parse a level name ("trace", "debug", "info", "warn", "error", "off").
///
/// @param name the name of the level
/// @return the matching level
/// @throws std::invalid_argument if the name is unknown
///
Level parse_level(const std::string& name);

/// Return the printable name of a level.
const char* level_name(Level level);

namespace detail {

/// Write one formatted line to stderr.
void write(Level level, const char* group, fmt::string_view format, fmt::format_args args);

template <typename TGroup, typename... TArgs>
inline void log(Level lvl, fmt::string_view format, const TArgs&... args) {
    if (static_cast<int>(lvl) < static_cast<int>(level()))
        return;
    write(lvl, TGroup::name(), format, fmt::make_format_args(args...));
}

}  // namespace detail

template <typename TGroup, typename... TArgs>
inline void trace(fmt::string_view format, const TArgs&... args) {
    detail::log<TGroup>(Level::trace, format, args...);
}

template <typename TGroup, typename... TArgs>
inline void debug(fmt::string_view format, const TArgs&... args) {
    detail::log<TGroup>(Level::debug, format, args...);
}

template <typename TGroup, typename... TArgs>
inline void info(fmt::string_view format, const TArgs&... args) {
    detail::log<TGroup>(Level::info, format, args...);
}

template <typename TGroup, typename... TArgs>
inline void warn(fmt::string_view format, const TArgs&... args) {
    detail::log<TGroup>(Level::warn, format, args...);
}

template <typename TGroup, typename... TArgs>
inline void error(fmt::string_view format, const TArgs&... args) {
    detail::log<TGroup>(Level::error, format, args...);
}

}  // namespace devlog

/// Log groups used across the project.
namespace grp {
    struct env { static const char* name() { return "Env"; } };
    struct skip { static const char* name() { return "Skip"; } };
    struct target { static const char* name() { return "Target"; } };
    struct console { static const char* name() { return "PyConsole"; } };
}  // namespace grp

}  // namespace SMB

#endif  // SMB_LOG_HPP

/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef CLONEBOX_LEVEL_H
#define CLONEBOX_LEVEL_H

#include <clonebox/logging/cstring.h>

#include <optional>
#include <string_view>
#include <type_traits>

namespace clonebox
{
namespace logging
{

/**
 * The level of a log entry, in decreasing order of severity.
 */
enum class Level : int
{
    error = 0,   /**< An operation could not be accomplished. Rollbacks that follow are logged at this level too. */
    warning = 1, /**< Something was skipped or degraded, but the operation went on (failed probes, audit writes). */
    info = 2,    /**< Lifecycle transitions and other facts the user may want to know about */
    debug = 3,   /**< Reconciliation details and backend calls, useful for troubleshooting */
    trace = 4    /**< Per-item detection and rendering output */
};

constexpr CString as_string(const Level& l) noexcept
{
    switch (l)
    {
    case Level::debug:
        return "debug";
    case Level::error:
        return "error";
    case Level::info:
        return "info";
    case Level::warning:
        return "warning";
    case Level::trace:
        return "trace";
    }
    return "unknown";
}

constexpr auto enum_type(Level e) noexcept
{
    return static_cast<std::underlying_type_t<Level>>(e);
}

constexpr Level level_from(std::underlying_type_t<Level> in)
{
    return static_cast<Level>(in);
}

constexpr bool operator<(Level a, Level b) noexcept
{
    return enum_type(a) < enum_type(b);
}

constexpr bool operator>(Level a, Level b) noexcept
{
    return enum_type(a) > enum_type(b);
}

constexpr bool operator<=(Level a, Level b) noexcept
{
    return enum_type(a) <= enum_type(b);
}

constexpr bool operator>=(Level a, Level b) noexcept
{
    return enum_type(a) >= enum_type(b);
}

// Parses the names produced by as_string, used for the log-level setting
std::optional<Level> level_from_string(std::string_view name);
} // namespace logging
} // namespace clonebox

#endif // CLONEBOX_LEVEL_H

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

#ifndef CLONEBOX_TOP_CATCH_ALL_H
#define CLONEBOX_TOP_CATCH_ALL_H

#include <clonebox/format.h>
#include <clonebox/logging/log.h>

#include <functional>
#include <type_traits>

namespace clonebox
{
namespace detail
{
void error(const clonebox::logging::CString& log_category,
           const std::exception& e);                        // not noexcept because logging isn't
void error(const clonebox::logging::CString& log_category); // not noexcept because logging isn't
} // namespace detail

/**
 * Call a non-void function within a try-catch, catching and logging anything that it throws.
 *
 * @param log_category The category to use when logging exceptions
 * @param fallback_return The value to return value when an exception is caught
 * @param f The non-void function to protect with a catch-all
 * @param args The arguments to pass to the function f
 * @return The result of f when no exception is thrown, fallback_return otherwise
 * @note This function will call `terminate()` if logging itself throws.
 */
template <typename T, typename Fun, typename... Args> // Fun needs to return non-void
auto top_catch_all(const logging::CString& log_category, T&& fallback_return, Fun&& f, Args&&... args) noexcept
    -> std::invoke_result_t<Fun, Args...>;

/**
 * Call a void function within a try-catch, catching and logging anything that it throws.
 *
 * Used for cleanup paths (rollback guards, destructors) that must not throw.
 */
template <typename Fun, typename... Args> // Fun needs to return void
void top_catch_all(const logging::CString& log_category, Fun&& f, Args&&... args) noexcept;
} // namespace clonebox

inline void clonebox::detail::error(const clonebox::logging::CString& log_category, const std::exception& e)
{
    namespace cbl = clonebox::logging;
    cbl::log(cbl::Level::error, log_category, fmt::format("Caught an unhandled exception: {}", e.what()));
}

inline void clonebox::detail::error(const clonebox::logging::CString& log_category)
{
    namespace cbl = clonebox::logging;
    cbl::log(cbl::Level::error, log_category, "Caught an unknown exception");
}

template <typename T, typename Fun, typename... Args>
inline auto clonebox::top_catch_all(const logging::CString& log_category, T&& fallback_return, Fun&& f,
                                    Args&&... args) noexcept -> std::invoke_result_t<Fun, Args...>
{
    try
    {
        return std::invoke(std::forward<Fun>(f), std::forward<Args>(args)...);
    }
    catch (const std::exception& e)
    {
        detail::error(log_category, e);
    }
    catch (...)
    {
        detail::error(log_category);
    }

    return std::forward<decltype(fallback_return)>(fallback_return);
}

template <typename Fun, typename... Args>
inline void clonebox::top_catch_all(const logging::CString& log_category, Fun&& f, Args&&... args) noexcept
{
    try
    {
        std::invoke(std::forward<Fun>(f), std::forward<Args>(args)...);
    }
    catch (const std::exception& e)
    {
        detail::error(log_category, e);
    }
    catch (...)
    {
        detail::error(log_category);
    }
}

#endif // CLONEBOX_TOP_CATCH_ALL_H

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

#ifndef CLONEBOX_UTILS_H
#define CLONEBOX_UTILS_H

#include <clonebox/path.h>

#include <QDir>
#include <QFileDevice>
#include <QStringList>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace clonebox
{
namespace utils
{
enum class TimeoutAction
{
    retry,
    done
};

// filesystem and path helpers
std::string contents_of(const clonebox::Path& file_path);
Path make_dir(const QDir& a_dir, const QString& name,
              QFileDevice::Permissions permissions = QFileDevice::Permissions(0));
void write_file(const clonebox::Path& file_path, const std::string& contents,
                QFileDevice::Permissions permissions = QFileDevice::Permissions(0));
QString canonical_path(const QString& path); // empty when the path does not exist
bool is_strict_ancestor(const QString& ancestor, const QString& descendant);
QString clonebox_storage();

// string helpers
bool valid_hostname(const std::string& name_string);
std::string casefold(std::string s);
std::vector<std::string> split(const std::string& string, const std::string& delimiter);
bool has_only_digits(const std::string& value);
template <typename Str, typename Filter>
Str&& trim_begin(Str&& s, Filter&& filter);
template <typename Str>
Str&& trim_begin(Str&& s);
template <typename Str, typename Filter>
Str&& trim_end(Str&& s, Filter&& filter);
template <typename Str>
Str&& trim_end(Str&& s);
template <typename Str, typename Filter>
Str&& trim(Str&& s, Filter&& filter);
template <typename Str>
Str&& trim(Str&& s);

// process and randomness
void process_throw_on_error(const QString& program, const QStringList& arguments, const QString& message,
                            const QString& category = "utils", const int timeout = 30000);
std::vector<std::uint8_t> random_bytes(std::size_t len);

// Repeat try_action every poll_interval until it reports done, calling on_timeout if the deadline comes first
template <typename OnTimeoutCallable, typename TryAction>
void try_action_until(OnTimeoutCallable&& on_timeout, std::chrono::steady_clock::time_point deadline,
                      std::chrono::milliseconds poll_interval, TryAction&& try_action);
} // namespace utils
} // namespace clonebox

namespace clonebox::utils::detail
{
// see https://en.cppreference.com/w/cpp/string/byte/isspace#Notes
inline constexpr auto is_space = [](unsigned char c) { return std::isspace(c); };
} // namespace clonebox::utils::detail

template <typename Str, typename Filter>
Str&& clonebox::utils::trim_begin(Str&& s, Filter&& filter)
{
    const auto it = std::find_if_not(s.begin(), s.end(), std::forward<Filter>(filter));
    s.erase(s.begin(), it);
    return std::forward<Str>(s);
}

template <typename Str>
Str&& clonebox::utils::trim_begin(Str&& s)
{
    return trim_begin(std::forward<Str>(s), detail::is_space);
}

template <typename Str, typename Filter>
Str&& clonebox::utils::trim_end(Str&& s, Filter&& filter)
{
    auto rev_it = std::find_if_not(s.rbegin(), s.rend(), std::forward<Filter>(filter));
    s.erase(rev_it.base(), s.end());
    return std::forward<Str>(s);
}

template <typename Str>
Str&& clonebox::utils::trim_end(Str&& s)
{
    return trim_end(std::forward<Str>(s), detail::is_space);
}

template <typename Str, typename Filter>
Str&& clonebox::utils::trim(Str&& s, Filter&& filter)
{
    auto&& ret = trim_end(std::forward<Str>(s), filter);
    return trim_begin(std::forward<decltype(ret)>(ret), std::forward<Filter>(filter));
}

template <typename Str>
Str&& clonebox::utils::trim(Str&& s)
{
    return trim(std::forward<Str>(s), detail::is_space);
}

template <typename OnTimeoutCallable, typename TryAction>
void clonebox::utils::try_action_until(OnTimeoutCallable&& on_timeout, std::chrono::steady_clock::time_point deadline,
                                       std::chrono::milliseconds poll_interval, TryAction&& try_action)
{
    static_assert(std::is_same_v<decltype(try_action()), TimeoutAction>);

    while (true)
    {
        if (try_action() == TimeoutAction::done)
            return;

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;

        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(poll_interval, deadline - now));
    }

    on_timeout();
}

#endif // CLONEBOX_UTILS_H

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

#ifndef CLONEBOX_AUTO_JOIN_THREAD_H
#define CLONEBOX_AUTO_JOIN_THREAD_H

#include <memory>
#include <thread>

namespace clonebox
{

struct AutoJoinThread
{
    template <typename Callable, typename... Args>
    AutoJoinThread(Callable&& f, Args&&... args) : thread{std::forward<Callable>(f), std::forward<Args>(args)...}
    {
    }
    ~AutoJoinThread()
    {
        if (thread.joinable())
            thread.join();
    }

    std::thread thread;
};

} // namespace clonebox

#endif // CLONEBOX_AUTO_JOIN_THREAD_H

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

#include <clonebox/vm_lock_registry.h>

namespace cb = clonebox;

namespace
{
constexpr auto unbounded_wait = std::chrono::hours{24};
} // namespace

auto cb::VMLockRegistry::acquire(const std::string& name, const Deadline& deadline) -> Lock
{
    std::recursive_timed_mutex* mutex = nullptr;
    {
        std::lock_guard lock{registry_mutex};
        auto& entry = locks[name];
        if (!entry)
            entry = std::make_unique<std::recursive_timed_mutex>();
        mutex = entry.get(); // entries are never erased, so the pointer stays valid
    }

    Lock lock{*mutex, std::defer_lock};
    while (!lock.try_lock_until(deadline.bound(unbounded_wait)))
        deadline.check(name, "acquire the instance lock");

    return lock;
}

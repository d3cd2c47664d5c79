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

#ifndef CLONEBOX_VM_LOCK_REGISTRY_H
#define CLONEBOX_VM_LOCK_REGISTRY_H

#include <clonebox/deadline.h>
#include <clonebox/disabled_copy_move.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace clonebox
{
/**
 * Per-instance advisory locks for lifecycle-mutating operations.
 *
 * Locks are re-entrant, so an operation holding an instance's lock can call into another one that takes it again.
 */
class VMLockRegistry : private DisabledCopyMove
{
public:
    using Lock = std::unique_lock<std::recursive_timed_mutex>;

    VMLockRegistry() = default;

    // Throws OperationCancelled when the deadline expires first
    Lock acquire(const std::string& name, const Deadline& deadline = {});

private:
    std::mutex registry_mutex;
    std::map<std::string, std::unique_ptr<std::recursive_timed_mutex>> locks;
};
} // namespace clonebox
#endif // CLONEBOX_VM_LOCK_REGISTRY_H

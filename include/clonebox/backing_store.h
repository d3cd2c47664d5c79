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

#ifndef CLONEBOX_BACKING_STORE_H
#define CLONEBOX_BACKING_STORE_H

#include <clonebox/disabled_copy_move.h>
#include <clonebox/memory_size.h>
#include <clonebox/path.h>
#include <clonebox/provisioning_bundle.h>
#include <clonebox/session_scope.h>

#include <QDateTime>

#include <string>
#include <vector>

namespace clonebox
{
/**
 * The on-disk tree of each instance: `<root>/<scope>/<name>/` holding the disk image, the NoCloud seed under
 * `cloud-init/` and, for key authentication, the instance's private key.
 */
class BackingStore : private DisabledCopyMove
{
public:
    BackingStore(const Path& root, SessionScope scope);

    Path instance_directory(const std::string& name) const;
    Path disk_path(const std::string& name) const;
    Path seed_directory(const std::string& name) const;
    Path private_key_path(const std::string& name) const;

    bool exists(const std::string& name) const;
    QDateTime created_at(const std::string& name) const;
    std::vector<std::string> instances() const;

    Path allocate(const std::string& name, const MemorySize& disk);
    void write_provisioning(const std::string& name, const ProvisioningBundle& bundle);
    void remove_provisioning(const std::string& name);
    void release(const std::string& name);

private:
    const Path scope_root;
};
} // namespace clonebox
#endif // CLONEBOX_BACKING_STORE_H

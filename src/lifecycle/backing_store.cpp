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

#include <clonebox/backing_store.h>
#include <clonebox/format.h>
#include <clonebox/logging/log.h>
#include <clonebox/utils.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStorageInfo>

#include <stdexcept>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbu = clonebox::utils;

namespace
{
constexpr auto category = "backing-store";
constexpr auto seed_dir_name = "cloud-init";
constexpr auto disk_file_name = "disk.qcow2";
constexpr auto private_key_file_name = "id_ed25519";
} // namespace

cb::BackingStore::BackingStore(const Path& root, SessionScope scope)
    : scope_root{QDir{root}.filePath(QString::fromStdString(to_string(scope)))}
{
    // Instances come and go under the scope directory, which itself stays
    if (!QDir{}.mkpath(scope_root))
        cbl::warn(category, "Could not create {}, allocating instances will fail", scope_root);
}

cb::Path cb::BackingStore::instance_directory(const std::string& name) const
{
    return QDir{scope_root}.filePath(QString::fromStdString(name));
}

cb::Path cb::BackingStore::disk_path(const std::string& name) const
{
    return QDir{instance_directory(name)}.filePath(disk_file_name);
}

cb::Path cb::BackingStore::seed_directory(const std::string& name) const
{
    return QDir{instance_directory(name)}.filePath(seed_dir_name);
}

cb::Path cb::BackingStore::private_key_path(const std::string& name) const
{
    return QDir{instance_directory(name)}.filePath(private_key_file_name);
}

bool cb::BackingStore::exists(const std::string& name) const
{
    return QFileInfo{instance_directory(name)}.isDir();
}

QDateTime cb::BackingStore::created_at(const std::string& name) const
{
    QFileInfo info{instance_directory(name)};
    auto birth = info.birthTime();
    return birth.isValid() ? birth : info.lastModified();
}

std::vector<std::string> cb::BackingStore::instances() const
{
    std::vector<std::string> names;
    for (const auto& entry : QDir{scope_root}.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name))
        names.push_back(entry.toStdString());

    return names;
}

cb::Path cb::BackingStore::allocate(const std::string& name, const MemorySize& disk)
{
    auto dir = cbu::make_dir(QDir{scope_root}, QString::fromStdString(name), QFileDevice::ReadOwner |
                                                                               QFileDevice::WriteOwner |
                                                                               QFileDevice::ExeOwner);

    QStorageInfo storage{dir};
    if (storage.isValid() && storage.bytesAvailable() < disk.in_bytes())
        cbl::warn(category, "Only {} available under {}, the disk of \"{}\" may grow up to {}",
                  MemorySize::from_bytes(storage.bytesAvailable()).human_readable(), scope_root, name,
                  disk.human_readable());

    cbl::debug(category, "Allocated {}", dir);
    return dir;
}

void cb::BackingStore::write_provisioning(const std::string& name, const ProvisioningBundle& bundle)
{
    auto seed = cbu::make_dir(QDir{instance_directory(name)}, seed_dir_name);
    cbu::write_file(QDir{seed}.filePath("user-data"), cloud_init_user_data(bundle));
    cbu::write_file(QDir{seed}.filePath("meta-data"), cloud_init_meta_data(bundle));
    cbu::write_file(QDir{seed}.filePath("network-config"), cloud_init_network_config(bundle));

    if (!bundle.credentials.ssh_private_key.empty())
        cbu::write_file(private_key_path(name), bundle.credentials.ssh_private_key,
                        QFileDevice::ReadOwner | QFileDevice::WriteOwner);
}

void cb::BackingStore::remove_provisioning(const std::string& name)
{
    QDir{seed_directory(name)}.removeRecursively();
    QFile::remove(private_key_path(name));
}

void cb::BackingStore::release(const std::string& name)
{
    QDir dir{instance_directory(name)};
    if (dir.exists() && !dir.removeRecursively())
        throw std::runtime_error{fmt::format("Could not remove {}", dir.path())};
}

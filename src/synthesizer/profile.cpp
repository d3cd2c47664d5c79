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

#include <clonebox/exceptions/validation_error.h>
#include <clonebox/format.h>
#include <clonebox/logging/log.h>
#include <clonebox/profile.h>
#include <clonebox/yaml_node_utils.h>

#include <QDir>
#include <QFileInfo>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbu = clonebox::utils;

namespace
{
constexpr auto category = "profiles";

std::optional<cb::MemorySize> size_setting(const YAML::Node& vm, const std::string& key, const std::string& legacy_key,
                                           long long legacy_unit_bytes)
{
    if (auto value = cbu::value_or<std::string>(vm, key, ""); !value.empty())
        return cb::MemorySize{value};

    if (auto legacy = cbu::value_or<long long>(vm, legacy_key, 0); legacy > 0)
        return cb::MemorySize::from_bytes(legacy * legacy_unit_bytes);

    return std::nullopt;
}
} // namespace

cb::Profile cb::parse_profile(const std::string& name, const YAML::Node& node)
{
    if (!node.IsMap())
        throw ValidationError{"Profile \"{}\" must be a YAML mapping", name};

    Profile profile;
    profile.name = name;

    auto as_set = [&node](const std::string& key) {
        const auto list = cbu::string_list(node, key);
        return std::set<std::string>{list.begin(), list.end()};
    };
    profile.packages = as_set("packages");
    profile.snap_packages = as_set("snap_packages");
    profile.services = as_set("services");

    for (const auto* key : {"mounts", "paths"})
        if (const auto mounts = node[key]; mounts && mounts.IsMap())
            for (const auto& entry : mounts)
                profile.mounts.emplace(entry.first.as<std::string>(), entry.second.as<std::string>());

    if (const auto vm = node["vm"]; vm && vm.IsMap())
    {
        profile.ram = size_setting(vm, "ram", "ram_mb", 1024LL * 1024);
        profile.disk = size_setting(vm, "disk", "disk_size_gb", 1024LL * 1024 * 1024);
        if (auto vcpus = cbu::value_or<int>(vm, "vcpus", 0); vcpus > 0)
            profile.vcpus = vcpus;
    }

    return profile;
}

cb::ProfileLoader::ProfileLoader(QStringList search_directories) : search_directories{std::move(search_directories)}
{
}

cb::Profile cb::ProfileLoader::load(const std::string& name) const
{
    const auto file_name = QString::fromStdString(name + ".yaml");
    for (const auto& directory : search_directories)
    {
        const auto candidate = QDir{directory}.filePath(file_name);
        if (!QFileInfo::exists(candidate))
            continue;

        cbl::debug(category, "Loading profile \"{}\" from {}", name, candidate);
        try
        {
            return parse_profile(name, YAML::LoadFile(candidate.toStdString()));
        }
        catch (const YAML::Exception& e)
        {
            throw ValidationError{"Cannot read profile {}: {}", candidate, e.what()};
        }
    }

    throw ValidationError{"Profile \"{}\" not found in {}", name, search_directories.join(", ")};
}

QStringList cb::ProfileLoader::default_search_directories(const QString& home, const QString& working_directory)
{
    return {QDir{home}.filePath(".clonebox.d"), QDir{working_directory}.filePath(".clonebox.d")};
}

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

#ifndef CLONEBOX_PROFILE_H
#define CLONEBOX_PROFILE_H

#include <clonebox/memory_size.h>

#include <yaml-cpp/yaml.h>

#include <QStringList>

#include <map>
#include <optional>
#include <set>
#include <string>

namespace clonebox
{
// A reusable bundle of packages, services and mounts that can be applied to any clone
struct Profile
{
    std::string name;
    std::set<std::string> packages;
    std::set<std::string> snap_packages;
    std::set<std::string> services;
    std::map<std::string, std::string> mounts;
    std::optional<MemorySize> ram;
    std::optional<int> vcpus;
    std::optional<MemorySize> disk;
};

Profile parse_profile(const std::string& name, const YAML::Node& node);

class ProfileLoader
{
public:
    explicit ProfileLoader(QStringList search_directories);

    // Looks for <name>.yaml in each search directory, in order. Throws ValidationError if none has it.
    Profile load(const std::string& name) const;

    static QStringList default_search_directories(const QString& home, const QString& working_directory);

private:
    QStringList search_directories;
};
} // namespace clonebox
#endif // CLONEBOX_PROFILE_H

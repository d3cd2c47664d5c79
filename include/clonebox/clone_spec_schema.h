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

#ifndef CLONEBOX_CLONE_SPEC_SCHEMA_H
#define CLONEBOX_CLONE_SPEC_SCHEMA_H

#include <clonebox/clone_spec.h>
#include <clonebox/path.h>

#include <yaml-cpp/yaml.h>

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace clonebox
{
// The flat, first version of the spec file. Keys may also be nested under "vm:".
struct CloneSpecV1
{
    std::string name{"clonebox-vm"};
    long long ram_mb{4096};
    int vcpus{4};
    long long disk_size_gb{10};
    bool gui{true};
    std::string base_image;
    std::string network_mode{"auto"};
    std::string username{"ubuntu"};
    std::string password{"ubuntu"};
    std::string auth_method{"ssh_key"};
    bool user_session{true};
    std::map<std::string, std::string> paths;
    std::map<std::string, std::string> app_data_paths;
    std::vector<std::string> packages;
    std::vector<std::string> snap_packages;
    std::vector<std::string> services;
    std::vector<std::string> post_commands;

    std::vector<std::string> unknown_keys; // present in the file, with no meaning in this version
};

using VersionedCloneSpec = std::variant<CloneSpecV1, CloneSpec>;

struct MigrationReport
{
    CloneSpec spec;
    std::vector<std::string> unmapped_fields;
};

// Tagged parsing: the "version" key selects the schema. A missing version means v1.
VersionedCloneSpec parse_clone_spec(const YAML::Node& node);
VersionedCloneSpec parse_clone_spec(const std::string& yaml);

// v1 -> v2, total. Fields v2 cannot express are listed in the report, and logged.
MigrationReport migrate(const CloneSpecV1& v1);
// v2 -> v1, for tools that still read the flat format. v2-only fields are logged and left out.
CloneSpecV1 migrate_back(const CloneSpec& spec);

// Parses, migrating when needed
CloneSpec to_current(const VersionedCloneSpec& versioned);

YAML::Node to_yaml(const CloneSpec& spec);
std::string emit_clone_spec(const CloneSpec& spec);

VersionedCloneSpec load_versioned_clone_spec(const Path& file_path); // as written, without migrating
CloneSpec load_clone_spec(const Path& file_path);
void save_clone_spec(const CloneSpec& spec, const Path& file_path); // always writes the current schema

inline constexpr auto clone_spec_file_name = ".clonebox.yaml";
} // namespace clonebox
#endif // CLONEBOX_CLONE_SPEC_SCHEMA_H

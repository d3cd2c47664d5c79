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

#ifndef CLONEBOX_COMPOSE_GROUP_H
#define CLONEBOX_COMPOSE_GROUP_H

#include <clonebox/clone_spec.h>
#include <clonebox/path.h>

#include <yaml-cpp/yaml.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace clonebox
{
struct ComposeMember
{
    std::string name; // also the identity of the member's VM
    Path config;      // absolute path of the member's spec file
    std::vector<std::string> depends_on;
    std::optional<HealthCheckDeclaration> health_check;
};

struct ComposeGroup
{
    std::string name;
    bool all_or_nothing{false};
    std::map<std::string, ComposeMember> members;
};

// Config paths are resolved against base_directory. Throws ValidationError on malformed documents.
ComposeGroup parse_compose_group(const YAML::Node& node, const Path& base_directory);
ComposeGroup load_compose_group(const Path& compose_file);

// Throws ValidationError for unknown members and dependencies, CycleError for circular dependencies
void validate(const ComposeGroup& group);

// The members of `subset` plus everything they depend on. An empty subset means the whole group.
std::set<std::string> dependency_closure(const ComposeGroup& group, const std::set<std::string>& subset);

/**
 * Groups members into levels, each depending only on earlier levels.
 *
 * Members of one level may start in parallel. Names are ordered within a level.
 */
std::vector<std::vector<std::string>> start_levels(const ComposeGroup& group, const std::set<std::string>& members);
} // namespace clonebox
#endif // CLONEBOX_COMPOSE_GROUP_H

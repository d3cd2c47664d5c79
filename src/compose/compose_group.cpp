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

#include <clonebox/compose_group.h>
#include <clonebox/exceptions/validation_error.h>
#include <clonebox/format.h>
#include <clonebox/utils.h>
#include <clonebox/yaml_node_utils.h>

#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <deque>
#include <functional>
#include <map>

namespace cb = clonebox;
namespace cbu = clonebox::utils;

namespace
{
cb::HealthCheckDeclaration parse_member_health_check(const std::string& member, const YAML::Node& node)
{
    if (!node.IsMap())
        throw cb::ValidationError{"The health_check of compose member \"{}\" must be a mapping", member};

    cb::HealthCheckDeclaration check;
    check.name = member + "-health";
    check.type = cb::probe_type_from(cbu::value_or<std::string>(node, "type", "tcp"));
    const auto default_target = check.type == cb::ProbeType::tcp ? "22" : "";
    check.target = node["port"] ? cbu::value_or<std::string>(node, "port", "22")
                                : cbu::value_or<std::string>(node, "target", default_target);
    check.timeout = std::chrono::milliseconds{cbu::value_or<long long>(node, "timeout_ms", check.timeout.count())};
    check.expected_exit_status = cbu::value_or<int>(node, "expected_exit_status", 0);

    return check;
}

// Walks dependencies depth-first and returns the first cycle met, closed on its first member
std::vector<std::string> find_cycle(const cb::ComposeGroup& group)
{
    enum class Mark
    {
        unvisited,
        in_progress,
        done
    };
    std::map<std::string, Mark> marks;
    std::vector<std::string> path;

    std::function<std::vector<std::string>(const std::string&)> visit = [&](const std::string& name) {
        marks[name] = Mark::in_progress;
        path.push_back(name);

        for (const auto& dependency : group.members.at(name).depends_on)
        {
            if (marks[dependency] == Mark::in_progress)
            {
                std::vector<std::string> cycle{std::find(path.begin(), path.end(), dependency), path.end()};
                cycle.push_back(dependency);
                return cycle;
            }

            if (marks[dependency] == Mark::unvisited)
                if (auto cycle = visit(dependency); !cycle.empty())
                    return cycle;
        }

        path.pop_back();
        marks[name] = Mark::done;
        return std::vector<std::string>{};
    };

    for (const auto& [name, member] : group.members)
        if (marks[name] == Mark::unvisited)
            if (auto cycle = visit(name); !cycle.empty())
                return cycle;

    return {};
}
} // namespace

cb::ComposeGroup cb::parse_compose_group(const YAML::Node& node, const Path& base_directory)
{
    if (!node.IsMap())
        throw ValidationError{"A compose file must be a mapping"};

    ComposeGroup group;
    group.name = cbu::value_or<std::string>(node, "name", QFileInfo{base_directory}.fileName().toStdString());
    group.all_or_nothing = cbu::value_or<bool>(node, "all_or_nothing", false);

    const auto vms = node["vms"];
    if (!vms || !vms.IsMap() || vms.size() == 0)
        throw ValidationError{"Compose group \"{}\" declares no vms", group.name};

    for (const auto& entry : vms)
    {
        auto name = entry.first.as<std::string>();
        const auto& member_node = entry.second;
        if (!member_node.IsMap() || !member_node["config"])
            throw ValidationError{"Compose member \"{}\" needs a config path", name};

        ComposeMember member;
        member.name = name;
        member.config = QDir{base_directory}.absoluteFilePath(
            QString::fromStdString(member_node["config"].as<std::string>()));
        member.depends_on = cbu::string_list(member_node, "depends_on");
        if (const auto check = member_node["health_check"])
            member.health_check = parse_member_health_check(name, check);

        group.members.emplace(std::move(name), std::move(member));
    }

    return group;
}

cb::ComposeGroup cb::load_compose_group(const Path& compose_file)
{
    YAML::Node node;
    try
    {
        node = YAML::LoadFile(compose_file.toStdString());
    }
    catch (const YAML::BadFile&)
    {
        throw ValidationError{"Cannot read compose file {}", compose_file};
    }
    catch (const YAML::Exception& e)
    {
        throw ValidationError{"Malformed compose file {}: {}", compose_file, e.what()};
    }

    auto group = parse_compose_group(node, QFileInfo{compose_file}.absolutePath());
    validate(group);

    return group;
}

void cb::validate(const ComposeGroup& group)
{
    for (const auto& [name, member] : group.members)
    {
        if (!cbu::valid_hostname(name))
            throw ValidationError{"Invalid compose member name \"{}\"", name};

        for (const auto& dependency : member.depends_on)
            if (!group.members.count(dependency))
                throw ValidationError{"Compose member \"{}\" depends on unknown member \"{}\"", name, dependency};
    }

    if (auto cycle = find_cycle(group); !cycle.empty())
        throw CycleError{cycle};
}

std::set<std::string> cb::dependency_closure(const ComposeGroup& group, const std::set<std::string>& subset)
{
    std::set<std::string> closure;
    std::deque<std::string> pending;
    if (subset.empty())
        for (const auto& [name, member] : group.members)
            pending.push_back(name);
    else
        pending.assign(subset.begin(), subset.end());

    while (!pending.empty())
    {
        auto name = pending.front();
        pending.pop_front();

        auto it = group.members.find(name);
        if (it == group.members.end())
            throw ValidationError{"Compose group \"{}\" has no member \"{}\"", group.name, name};

        if (closure.insert(name).second)
            pending.insert(pending.end(), it->second.depends_on.begin(), it->second.depends_on.end());
    }

    return closure;
}

std::vector<std::vector<std::string>> cb::start_levels(const ComposeGroup& group, const std::set<std::string>& members)
{
    std::map<std::string, int> in_degree;
    std::map<std::string, std::vector<std::string>> dependents;
    for (const auto& name : members)
    {
        in_degree.emplace(name, 0);
        for (const auto& dependency : group.members.at(name).depends_on)
        {
            if (!members.count(dependency))
                continue;
            ++in_degree[name];
            dependents[dependency].push_back(name);
        }
    }

    std::vector<std::vector<std::string>> levels;
    std::vector<std::string> ready;
    for (const auto& [name, degree] : in_degree)
        if (degree == 0)
            ready.push_back(name);

    std::size_t placed = 0;
    while (!ready.empty())
    {
        std::sort(ready.begin(), ready.end());
        placed += ready.size();

        std::vector<std::string> next;
        for (const auto& name : ready)
            for (const auto& dependent : dependents[name])
                if (--in_degree[dependent] == 0)
                    next.push_back(dependent);

        levels.push_back(std::move(ready));
        ready = std::move(next);
    }

    if (placed != members.size())
        throw CycleError{find_cycle(group)};

    return levels;
}

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

#ifndef CLONEBOX_CLONE_SPEC_H
#define CLONEBOX_CLONE_SPEC_H

#include <clonebox/memory_size.h>
#include <clonebox/session_scope.h>

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace clonebox
{
enum class AuthMethod
{
    ssh_key,
    one_time_password,
    password
};

enum class NetworkMode
{
    automatic, // "auto": system scope uses the default network, user scope uses user-mode networking
    default_network,
    user
};

enum class ProbeType
{
    tcp,
    agent_ping,
    agent_exec
};

struct ResourceLimits
{
    MemorySize ram{MemorySize::from_gigabytes(4)};
    int vcpus{4};
    MemorySize disk{MemorySize::from_gigabytes(20)};

    friend bool operator==(const ResourceLimits& a, const ResourceLimits& b)
    {
        return a.ram == b.ram && a.vcpus == b.vcpus && a.disk == b.disk;
    }
};

struct AuthConfig
{
    AuthMethod method{AuthMethod::ssh_key};
    std::string password; // only meaningful for AuthMethod::password

    friend bool operator==(const AuthConfig& a, const AuthConfig& b)
    {
        return a.method == b.method && a.password == b.password;
    }
};

struct HealthCheckDeclaration
{
    std::string name;
    ProbeType type{ProbeType::tcp};
    std::string target;                           // "port" or "host:port" for tcp, the command for agent_exec
    std::chrono::milliseconds timeout{5000};
    int expected_exit_status{0};

    friend bool operator==(const HealthCheckDeclaration& a, const HealthCheckDeclaration& b)
    {
        return a.name == b.name && a.type == b.type && a.target == b.target && a.timeout == b.timeout &&
               a.expected_exit_status == b.expected_exit_status;
    }
};

/**
 * The durable description of what a cloned VM contains.
 *
 * Mount keys are canonical host paths. Instances are produced by the Synthesizer or loaded from a spec file, and are
 * only changed by explicit edits or schema migration.
 */
struct CloneSpec
{
    static constexpr int schema_version = 2;

    std::string name;
    SessionScope scope{SessionScope::user};
    ResourceLimits resources{};
    std::map<std::string, std::string> mounts{}; // host path -> guest mountpoint
    std::set<std::string> packages{};
    std::set<std::string> snap_packages{};
    std::set<std::string> services{};
    AuthConfig auth{};
    std::vector<HealthCheckDeclaration> health_checks{};
    std::string username{"ubuntu"};
    NetworkMode network{NetworkMode::automatic};
    bool graphics{true};
    std::string base_image{};
    std::vector<std::string> post_commands{};

    friend bool operator==(const CloneSpec& a, const CloneSpec& b)
    {
        return a.name == b.name && a.scope == b.scope && a.resources == b.resources && a.mounts == b.mounts &&
               a.packages == b.packages && a.snap_packages == b.snap_packages && a.services == b.services &&
               a.auth == b.auth && a.health_checks == b.health_checks && a.username == b.username &&
               a.network == b.network && a.graphics == b.graphics && a.base_image == b.base_image &&
               a.post_commands == b.post_commands;
    }
};

// Lower bounds of any VM we create
inline const MemorySize min_ram{MemorySize::from_megabytes(512)};
inline const MemorySize min_disk{MemorySize::from_gigabytes(1)};

// Structural checks that need no filesystem access: name, resource minima, absolute mount paths
void validate(const CloneSpec& spec);

// Every mount's host path must exist and be readable. Throws ValidationError otherwise.
void check_mounts_readable(const CloneSpec& spec);

std::string to_string(AuthMethod method);
std::string to_string(NetworkMode mode);
std::string to_string(ProbeType type);
AuthMethod auth_method_from(const std::string& name); // accepts both ssh-key and ssh_key spellings
NetworkMode network_mode_from(const std::string& name);
ProbeType probe_type_from(const std::string& name);
} // namespace clonebox
#endif // CLONEBOX_CLONE_SPEC_H

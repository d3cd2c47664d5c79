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

#ifndef CLONEBOX_PROVISIONING_BUNDLE_H
#define CLONEBOX_PROVISIONING_BUNDLE_H

#include <clonebox/clone_spec.h>

#include <string>
#include <vector>

namespace clonebox
{
struct MountDeclaration
{
    std::string host_path;
    std::string guest_mountpoint;
    std::string export_tag; // the 9p tag the host exports the share under

    friend bool operator==(const MountDeclaration& a, const MountDeclaration& b)
    {
        return a.host_path == b.host_path && a.guest_mountpoint == b.guest_mountpoint && a.export_tag == b.export_tag;
    }
};

struct NetworkDeclaration
{
    NetworkMode mode{NetworkMode::default_network}; // never automatic once rendered
    std::string interface_match{"en*"};
    std::string address;    // CIDR, static configurations only
    std::string gateway;    // static configurations only
    std::string nameserver; // static configurations only

    friend bool operator==(const NetworkDeclaration& a, const NetworkDeclaration& b)
    {
        return a.mode == b.mode && a.interface_match == b.interface_match && a.address == b.address &&
               a.gateway == b.gateway && a.nameserver == b.nameserver;
    }
};

// Never log any of this
struct CredentialMaterial
{
    AuthMethod method{AuthMethod::ssh_key};
    std::string username;
    std::string password;
    bool expire_on_first_login{false};
    std::string ssh_public_key;
    std::string ssh_private_key;

    friend bool operator==(const CredentialMaterial& a, const CredentialMaterial& b)
    {
        return a.method == b.method && a.username == b.username && a.password == b.password &&
               a.expire_on_first_login == b.expire_on_first_login && a.ssh_public_key == b.ssh_public_key &&
               a.ssh_private_key == b.ssh_private_key;
    }
};

struct ProvisioningBundle
{
    std::string instance_name;
    std::vector<std::string> packages;
    std::vector<std::string> snap_packages;
    std::vector<std::string> services;
    std::vector<MountDeclaration> mounts;
    NetworkDeclaration network;
    CredentialMaterial credentials;
    std::vector<std::string> post_commands;

    friend bool operator==(const ProvisioningBundle& a, const ProvisioningBundle& b)
    {
        return a.instance_name == b.instance_name && a.packages == b.packages && a.snap_packages == b.snap_packages &&
               a.services == b.services && a.mounts == b.mounts && a.network == b.network &&
               a.credentials == b.credentials && a.post_commands == b.post_commands;
    }
};

// NoCloud seed documents
std::string cloud_init_user_data(const ProvisioningBundle& bundle);
std::string cloud_init_meta_data(const ProvisioningBundle& bundle);
std::string cloud_init_network_config(const ProvisioningBundle& bundle);

inline constexpr auto guest_agent_package = "qemu-guest-agent";
} // namespace clonebox
#endif // CLONEBOX_PROVISIONING_BUNDLE_H

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

#include <clonebox/format.h>
#include <clonebox/logging/log.h>
#include <clonebox/provisioning_renderer.h>
#include <clonebox/yaml_node_utils.h>

#include <algorithm>

namespace cb = clonebox;
namespace cbl = clonebox::logging;

namespace
{
constexpr auto category = "renderer";
constexpr auto mount_options = "trans=virtio,version=9p2000.L,rw,nofail";

cb::NetworkDeclaration network_for(const cb::CloneSpec& spec)
{
    auto mode = spec.network;
    if (mode == cb::NetworkMode::automatic)
        mode = spec.scope == cb::SessionScope::user ? cb::NetworkMode::user : cb::NetworkMode::default_network;

    cb::NetworkDeclaration network;
    network.mode = mode;
    if (mode == cb::NetworkMode::user)
    {
        // QEMU's user-mode network has fixed addresses and no DHCP we can rely on
        network.address = "10.0.2.15/24";
        network.gateway = "10.0.2.2";
        network.nameserver = "10.0.2.3";
    }

    return network;
}

YAML::Node argv(std::initializer_list<std::string> args)
{
    YAML::Node node{YAML::NodeType::Sequence};
    for (const auto& arg : args)
        node.push_back(arg);
    return node;
}
} // namespace

cb::ProvisioningRenderer::ProvisioningRenderer(const CredentialGenerator& credentials) : credentials{credentials}
{
}

cb::ProvisioningBundle cb::ProvisioningRenderer::render(const CloneSpec& spec) const
{
    check_mounts_readable(spec);

    ProvisioningBundle bundle;
    bundle.instance_name = spec.name;
    bundle.packages = {spec.packages.begin(), spec.packages.end()};
    bundle.snap_packages = {spec.snap_packages.begin(), spec.snap_packages.end()};
    bundle.services = {spec.services.begin(), spec.services.end()};
    bundle.post_commands = spec.post_commands;
    bundle.network = network_for(spec);

    auto index = 0;
    for (const auto& [host, guest] : spec.mounts)
        bundle.mounts.push_back({host, guest, fmt::format("mount{}", index++)});

    auto& creds = bundle.credentials;
    creds.method = spec.auth.method;
    creds.username = spec.username;
    switch (spec.auth.method)
    {
    case AuthMethod::ssh_key:
    {
        auto keypair = credentials.ssh_keypair();
        creds.ssh_public_key = std::move(keypair.public_key);
        creds.ssh_private_key = std::move(keypair.private_key);
        break;
    }
    case AuthMethod::one_time_password:
        creds.password = credentials.one_time_password(one_time_password_length);
        creds.expire_on_first_login = true;
        break;
    case AuthMethod::password:
        creds.password = spec.auth.password;
        break;
    }

    cbl::debug(category, "Rendered \"{}\": {} package(s), {} service(s), {} mount(s), {} credentials", spec.name,
               bundle.packages.size(), bundle.services.size(), bundle.mounts.size(), to_string(creds.method));
    return bundle;
}

std::string cb::cloud_init_user_data(const ProvisioningBundle& bundle)
{
    const auto& creds = bundle.credentials;
    const auto uses_password = creds.method != AuthMethod::ssh_key;

    YAML::Node config;
    config["hostname"] = bundle.instance_name;
    config["manage_etc_hosts"] = true;

    YAML::Node user;
    user["name"] = creds.username;
    user["groups"] = "sudo";
    user["shell"] = "/bin/bash";
    user["sudo"] = "ALL=(ALL) NOPASSWD:ALL";
    user["lock_passwd"] = !uses_password;
    if (!creds.ssh_public_key.empty())
        user["ssh_authorized_keys"].push_back(creds.ssh_public_key);
    config["users"].push_back(user);

    config["ssh_pwauth"] = uses_password;
    if (uses_password)
    {
        YAML::Node entry;
        entry["name"] = creds.username;
        entry["password"] = creds.password;
        entry["type"] = "text";
        config["chpasswd"]["expire"] = creds.expire_on_first_login;
        config["chpasswd"]["users"].push_back(entry);
    }

    config["package_update"] = true;
    config["packages"] = YAML::Node{YAML::NodeType::Sequence};
    for (const auto& package : bundle.packages)
        config["packages"].push_back(package);
    if (std::find(bundle.packages.begin(), bundle.packages.end(), guest_agent_package) == bundle.packages.end())
        config["packages"].push_back(guest_agent_package);

    for (const auto& mount : bundle.mounts)
        config["mounts"].push_back(argv({mount.export_tag, mount.guest_mountpoint, "9p", mount_options, "0", "0"}));

    YAML::Node runcmd{YAML::NodeType::Sequence};
    runcmd.push_back(argv({"systemctl", "enable", "--now", guest_agent_package}));
    for (const auto& snap : bundle.snap_packages)
        runcmd.push_back(argv({"snap", "install", "--classic", snap}));
    for (const auto& service : bundle.services)
        runcmd.push_back(argv({"systemctl", "enable", "--now", service}));
    for (const auto& command : bundle.post_commands)
        runcmd.push_back(command);
    config["runcmd"] = runcmd;

    return utils::emit_cloud_config(config);
}

std::string cb::cloud_init_meta_data(const ProvisioningBundle& bundle)
{
    return utils::emit_yaml(utils::make_cloud_init_meta_config(bundle.instance_name));
}

std::string cb::cloud_init_network_config(const ProvisioningBundle& bundle)
{
    const auto& network = bundle.network;

    YAML::Node primary;
    primary["match"]["name"] = network.interface_match;
    if (network.mode == NetworkMode::user)
    {
        primary["dhcp4"] = false;
        primary["addresses"].push_back(network.address);
        YAML::Node route;
        route["to"] = "default";
        route["via"] = network.gateway;
        primary["routes"].push_back(route);
        primary["nameservers"]["addresses"].push_back(network.nameserver);
    }
    else
    {
        primary["dhcp4"] = true;
    }

    YAML::Node config;
    config["version"] = 2;
    config["ethernets"]["primary"] = primary;

    return utils::emit_yaml(config);
}

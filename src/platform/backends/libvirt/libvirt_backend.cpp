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

#include "libvirt_backend.h"

#include <clonebox/exceptions/backend_exceptions.h>
#include <clonebox/exceptions/health_check_timeout.h>
#include <clonebox/exceptions/snapshot_exceptions.h>
#include <clonebox/format.h>
#include <clonebox/logging/log.h>
#include <clonebox/utils.h>

#include <boost/json.hpp>

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>

#include <algorithm>
#include <cstdlib>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbu = clonebox::utils;

using namespace std::chrono_literals;

namespace
{
constexpr auto category = "libvirt";
constexpr auto seed_image_name = "cloud-init.iso";
constexpr auto agent_poll_interval = 200ms;

QString escaped(const std::string& value)
{
    return QString::fromStdString(value).toHtmlEscaped();
}

QString escaped(const QString& value)
{
    return value.toHtmlEscaped();
}

cb::Path seed_image_for(const cb::DomainDefinition& definition)
{
    return QFileInfo{definition.seed_directory}.dir().filePath(seed_image_name);
}

std::string interface_xml(cb::NetworkMode mode)
{
    if (mode == cb::NetworkMode::user)
        return "    <interface type=\"user\">\n"
               "      <backend type=\"passt\"/>\n"
               "      <model type=\"virtio\"/>\n"
               "    </interface>\n";

    return "    <interface type=\"network\">\n"
           "      <source network=\"default\"/>\n"
           "      <model type=\"virtio\"/>\n"
           "    </interface>\n";
}

std::string filesystems_xml(const std::vector<cb::MountDeclaration>& mounts)
{
    std::string xml;
    for (const auto& mount : mounts)
        xml += fmt::format("    <filesystem type=\"mount\" accessmode=\"passthrough\">\n"
                           "      <source dir=\"{}\"/>\n"
                           "      <target dir=\"{}\"/>\n"
                           "    </filesystem>\n",
                           escaped(mount.host_path), escaped(mount.export_tag));

    return xml;
}

std::string graphics_xml(bool graphics)
{
    if (!graphics)
        return {};

    return "    <graphics type=\"spice\" autoport=\"yes\">\n"
           "      <listen type=\"address\" address=\"127.0.0.1\"/>\n"
           "      <image compression=\"off\"/>\n"
           "    </graphics>\n"
           "    <video>\n"
           "      <model type=\"virtio\" heads=\"1\" primary=\"yes\"/>\n"
           "    </video>\n";
}

cb::DomainState state_from(int domain_state)
{
    switch (domain_state)
    {
    case VIR_DOMAIN_RUNNING:
    case VIR_DOMAIN_BLOCKED:
        return cb::DomainState::running;
    case VIR_DOMAIN_PAUSED:
    case VIR_DOMAIN_PMSUSPENDED:
        return cb::DomainState::paused;
    case VIR_DOMAIN_SHUTDOWN:
        return cb::DomainState::shutting_down;
    case VIR_DOMAIN_CRASHED:
        return cb::DomainState::crashed;
    default:
        return cb::DomainState::shut_off;
    }
}

// The first IPv4 address outside the loopback range, or empty
std::string address_from(virDomainInterfacePtr* interfaces, int count)
{
    for (auto i = 0; i < count; ++i)
    {
        const auto& interface = *interfaces[i];
        for (auto j = 0u; j < interface.naddrs; ++j)
        {
            const auto& address = interface.addrs[j];
            if (address.type == VIR_IP_ADDR_TYPE_IPV4 && address.addr &&
                !std::string{address.addr}.starts_with("127."))
                return address.addr;
        }
    }

    return {};
}

void create_disk_if_missing(const cb::DomainDefinition& definition)
{
    if (QFile::exists(definition.disk_path))
        return;

    QStringList arguments{"create", "-f", "qcow2"};
    if (!definition.base_image.isEmpty())
        arguments << "-b" << definition.base_image << "-F" << "qcow2";
    arguments << definition.disk_path << QString::number(definition.resources.disk.in_bytes());

    cbu::process_throw_on_error("qemu-img", arguments, "Could not create the disk image: {}", category);
}

void create_seed_image_if_missing(const cb::DomainDefinition& definition)
{
    const auto seed_image = seed_image_for(definition);
    if (QFile::exists(seed_image))
        return;

    const QDir seed{definition.seed_directory};
    cbu::process_throw_on_error("genisoimage",
                                {"-output", seed_image, "-volid", "cidata", "-joliet", "-rock",
                                 seed.filePath("user-data"), seed.filePath("meta-data"),
                                 seed.filePath("network-config")},
                                "Could not create the cloud-init seed image: {}", category);
}

boost::json::object agent_reply(const std::string& reply)
{
    auto parsed = boost::json::parse(reply);
    if (const auto* object = parsed.if_object())
    {
        if (const auto* value = object->if_contains("return"); value && value->is_object())
            return value->as_object();
    }

    return {};
}
} // namespace

std::string cb::domain_xml(const DomainDefinition& definition, const Path& seed_image)
{
    const auto memory = definition.resources.ram.in_bytes() / 1024;

    return fmt::format("<domain type=\"kvm\">\n"
                       "  <name>{}</name>\n"
                       "  <memory unit=\"KiB\">{}</memory>\n"
                       "  <currentMemory unit=\"KiB\">{}</currentMemory>\n"
                       "  <vcpu placement=\"static\">{}</vcpu>\n"
                       "  <os>\n"
                       "    <type arch=\"x86_64\" machine=\"q35\">hvm</type>\n"
                       "    <boot dev=\"hd\"/>\n"
                       "  </os>\n"
                       "  <features>\n"
                       "    <acpi/>\n"
                       "    <apic/>\n"
                       "    <vmport state=\"off\"/>\n"
                       "  </features>\n"
                       "  <cpu mode=\"host-passthrough\"/>\n"
                       "  <clock offset=\"utc\"/>\n"
                       "  <devices>\n"
                       "    <disk type=\"file\" device=\"disk\">\n"
                       "      <driver name=\"qemu\" type=\"qcow2\" discard=\"unmap\"/>\n"
                       "      <source file=\"{}\"/>\n"
                       "      <target dev=\"vda\" bus=\"virtio\"/>\n"
                       "    </disk>\n"
                       "    <disk type=\"file\" device=\"cdrom\">\n"
                       "      <driver name=\"qemu\" type=\"raw\"/>\n"
                       "      <source file=\"{}\"/>\n"
                       "      <target dev=\"sda\" bus=\"sata\"/>\n"
                       "      <readonly/>\n"
                       "    </disk>\n"
                       "{}"
                       "{}"
                       "    <channel type=\"unix\">\n"
                       "      <source mode=\"bind\"/>\n"
                       "      <target type=\"virtio\" name=\"org.qemu.guest_agent.0\"/>\n"
                       "    </channel>\n"
                       "    <serial type=\"pty\">\n"
                       "      <target port=\"0\"/>\n"
                       "    </serial>\n"
                       "    <console type=\"pty\">\n"
                       "      <target type=\"serial\" port=\"0\"/>\n"
                       "    </console>\n"
                       "{}"
                       "    <rng model=\"virtio\">\n"
                       "      <backend model=\"random\">/dev/urandom</backend>\n"
                       "    </rng>\n"
                       "  </devices>\n"
                       "</domain>",
                       escaped(definition.name), memory, memory, definition.resources.vcpus,
                       escaped(definition.disk_path), escaped(seed_image), interface_xml(definition.network),
                       filesystems_xml(definition.mounts), graphics_xml(definition.graphics));
}

cb::LibvirtBackend::LibvirtBackend(std::string uri, const std::string& libvirt_path, const std::string& qemu_path)
    : libvirt_wrapper{std::make_unique<LibvirtWrapper>(libvirt_path, qemu_path)}, session_uri{std::move(uri)}
{
}

auto cb::LibvirtBackend::open_connection() const -> ConnectionUPtr
{
    ConnectionUPtr connection{libvirt_wrapper->virConnectOpen(session_uri.c_str()), libvirt_wrapper->virConnectClose};

    if (!connection)
    {
        const char* message = libvirt_wrapper->virGetLastErrorMessage();
        throw BackendUnavailable{"Cannot connect to {}: {}", session_uri, message ? message : "unknown error"};
    }

    return connection;
}

auto cb::LibvirtBackend::checked_domain(virConnectPtr connection, const std::string& name) const -> DomainUPtr
{
    DomainUPtr domain{libvirt_wrapper->virDomainLookupByName(connection, name.c_str()), libvirt_wrapper->virDomainFree};
    if (!domain)
        throw_last_error(name, "look up the domain");

    return domain;
}

auto cb::LibvirtBackend::checked_snapshot(virDomainPtr domain, const std::string& name,
                                          const std::string& handle) const -> SnapshotUPtr
{
    SnapshotUPtr snapshot{libvirt_wrapper->virDomainSnapshotLookupByName(domain, handle.c_str(), 0),
                          libvirt_wrapper->virDomainSnapshotFree};
    if (!snapshot)
    {
        const auto* error = libvirt_wrapper->virGetLastError();
        if (error && error->code == VIR_ERR_NO_DOMAIN_SNAPSHOT)
            throw NoSuchSnapshotException{name, handle};

        throw_last_error(name, fmt::format("look up snapshot \"{}\"", handle));
    }

    return snapshot;
}

void cb::LibvirtBackend::throw_last_error(const std::string& name, const std::string& action) const
{
    const auto* error = libvirt_wrapper->virGetLastError();
    const auto code = error ? error->code : VIR_ERR_OK;
    const char* raw_message = libvirt_wrapper->virGetLastErrorMessage();
    const std::string message = raw_message ? raw_message : "unknown error";

    switch (code)
    {
    case VIR_ERR_NO_CONNECT:
    case VIR_ERR_RPC:
        throw BackendUnavailable{"Lost the connection to {} trying to {} for {}: {}", session_uri, action, name,
                                 message};
    case VIR_ERR_OPERATION_INVALID:
    case VIR_ERR_NO_DOMAIN:
        throw StaleStateConflict{"Could not {} for {}: {}", action, name, message};
    default:
        throw BackendError{"Could not {} for {}: {}", action, name, message};
    }
}

void cb::LibvirtBackend::define(const DomainDefinition& definition)
{
    if (definition.network == NetworkMode::automatic)
        throw BackendError{"Could not define {}: the network mode is unresolved", definition.name};

    create_disk_if_missing(definition);
    create_seed_image_if_missing(definition);

    auto connection = open_connection();
    const auto xml = domain_xml(definition, seed_image_for(definition));
    cbl::trace(definition.name, "Domain definition:\n{}", xml);

    DomainUPtr domain{libvirt_wrapper->virDomainDefineXML(connection.get(), xml.c_str()),
                      libvirt_wrapper->virDomainFree};
    if (!domain)
        throw_last_error(definition.name, "define the domain");

    cbl::debug(definition.name, "Defined in {}", session_uri);
}

void cb::LibvirtBackend::undefine(const std::string& name)
{
    auto connection = open_connection();
    auto domain = checked_domain(connection.get(), name);

    if (libvirt_wrapper->virDomainUndefineFlags(domain.get(), VIR_DOMAIN_UNDEFINE_SNAPSHOTS_METADATA |
                                                                  VIR_DOMAIN_UNDEFINE_NVRAM) == -1)
        throw_last_error(name, "undefine the domain");
}

void cb::LibvirtBackend::start(const std::string& name)
{
    auto connection = open_connection();
    auto domain = checked_domain(connection.get(), name);

    if (libvirt_wrapper->virDomainCreate(domain.get()) == -1)
        throw_last_error(name, "start the domain");
}

void cb::LibvirtBackend::shutdown(const std::string& name)
{
    auto connection = open_connection();
    auto domain = checked_domain(connection.get(), name);

    if (libvirt_wrapper->virDomainShutdown(domain.get()) == -1)
        throw_last_error(name, "shut down the domain");
}

void cb::LibvirtBackend::destroy(const std::string& name)
{
    auto connection = open_connection();
    auto domain = checked_domain(connection.get(), name);

    if (libvirt_wrapper->virDomainDestroy(domain.get()) == -1)
        throw_last_error(name, "power off the domain");
}

std::optional<cb::DomainStatus> cb::LibvirtBackend::domain_status(const std::string& name)
{
    auto connection = open_connection();
    DomainUPtr domain{libvirt_wrapper->virDomainLookupByName(connection.get(), name.c_str()),
                      libvirt_wrapper->virDomainFree};

    if (!domain)
    {
        const auto* error = libvirt_wrapper->virGetLastError();
        if (!error || error->code == VIR_ERR_NO_DOMAIN)
            return std::nullopt;

        throw_last_error(name, "look up the domain");
    }

    auto domain_state{0};
    if (libvirt_wrapper->virDomainGetState(domain.get(), &domain_state, nullptr, 0) == -1)
        throw_last_error(name, "read the domain state");

    DomainStatus status{state_from(domain_state), {}};
    if (status.state != DomainState::running)
        return status;

    for (auto source : {VIR_DOMAIN_INTERFACE_ADDRESSES_SRC_AGENT, VIR_DOMAIN_INTERFACE_ADDRESSES_SRC_LEASE})
    {
        virDomainInterfacePtr* interfaces = nullptr;
        auto count = libvirt_wrapper->virDomainInterfaceAddresses(domain.get(), &interfaces, source, 0);
        if (count < 0)
            continue;

        status.address = address_from(interfaces, count);

        for (auto i = 0; i < count; ++i)
            libvirt_wrapper->virDomainInterfaceFree(interfaces[i]);
        free(interfaces);

        if (!status.address.empty())
            break;
    }

    return status;
}

std::vector<std::string> cb::LibvirtBackend::list_domains()
{
    auto connection = open_connection();

    virDomainPtr* domains = nullptr;
    auto count = libvirt_wrapper->virConnectListAllDomains(connection.get(), &domains, 0);
    if (count < 0)
        throw_last_error(session_uri, "list the domains");

    std::vector<std::string> names;
    for (auto i = 0; i < count; ++i)
    {
        DomainUPtr domain{domains[i], libvirt_wrapper->virDomainFree};
        if (const auto* name = libvirt_wrapper->virDomainGetName(domain.get()))
            names.emplace_back(name);
    }
    free(domains);

    std::sort(names.begin(), names.end());
    return names;
}

std::string cb::LibvirtBackend::create_snapshot(const std::string& name, const std::string& snapshot_name,
                                                const std::string& description)
{
    auto connection = open_connection();
    auto domain = checked_domain(connection.get(), name);

    const auto xml = fmt::format("<domainsnapshot>\n"
                                 "  <name>{}</name>\n"
                                 "  <description>{}</description>\n"
                                 "</domainsnapshot>",
                                 escaped(snapshot_name), escaped(description));

    SnapshotUPtr snapshot{libvirt_wrapper->virDomainSnapshotCreateXML(domain.get(), xml.c_str(), 0),
                          libvirt_wrapper->virDomainSnapshotFree};
    if (!snapshot)
        throw_last_error(name, fmt::format("create snapshot \"{}\"", snapshot_name));

    const auto* handle = libvirt_wrapper->virDomainSnapshotGetName(snapshot.get());
    return handle ? handle : snapshot_name;
}

void cb::LibvirtBackend::restore_snapshot(const std::string& name, const std::string& handle)
{
    auto connection = open_connection();
    auto domain = checked_domain(connection.get(), name);
    auto snapshot = checked_snapshot(domain.get(), name, handle);

    if (libvirt_wrapper->virDomainRevertToSnapshot(snapshot.get(), 0) == -1)
        throw_last_error(name, fmt::format("revert to snapshot \"{}\"", handle));

    // Snapshots of a running guest revert to a running domain, but restored instances stay stopped
    auto domain_state{0};
    if (libvirt_wrapper->virDomainGetState(domain.get(), &domain_state, nullptr, 0) == -1)
        throw_last_error(name, "read the domain state");

    if (domain_state != VIR_DOMAIN_SHUTOFF)
    {
        cbl::debug(name, "Powering off after reverting to snapshot \"{}\"", handle);
        if (libvirt_wrapper->virDomainDestroy(domain.get()) == -1)
            throw_last_error(name, "power off the reverted domain");
    }
}

void cb::LibvirtBackend::delete_snapshot(const std::string& name, const std::string& handle)
{
    auto connection = open_connection();
    auto domain = checked_domain(connection.get(), name);
    auto snapshot = checked_snapshot(domain.get(), name, handle);

    if (libvirt_wrapper->virDomainSnapshotDelete(snapshot.get(), 0) == -1)
        throw_last_error(name, fmt::format("delete snapshot \"{}\"", handle));
}

std::string cb::LibvirtBackend::agent_command(virDomainPtr domain, const std::string& name,
                                              const std::string& command, std::chrono::milliseconds timeout) const
{
    const auto timeout_seconds =
        std::max(1, static_cast<int>(std::chrono::ceil<std::chrono::seconds>(timeout).count()));

    std::unique_ptr<char, decltype(&free)> reply{
        libvirt_wrapper->virDomainQemuAgentCommand(domain, command.c_str(), timeout_seconds, 0), &free};

    if (!reply)
    {
        const auto* error = libvirt_wrapper->virGetLastError();
        const auto code = error ? error->code : VIR_ERR_OK;
        if (code == VIR_ERR_AGENT_UNRESPONSIVE || code == VIR_ERR_OPERATION_TIMEOUT || code == VIR_ERR_AGENT_UNSYNCED)
            throw HealthCheckTimeout{"The guest agent of {} did not answer within {}ms", name, timeout.count()};

        throw_last_error(name, "talk to the guest agent");
    }

    return reply.get();
}

cb::GuestCommandResult cb::LibvirtBackend::guest_exec(const std::string& name, const std::vector<std::string>& argv,
                                                      std::chrono::milliseconds timeout)
{
    if (argv.empty())
        throw BackendError{"Could not run a command on {}: the command is empty", name};

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto connection = open_connection();
    auto domain = checked_domain(connection.get(), name);

    boost::json::array arguments;
    for (auto it = std::next(argv.begin()); it != argv.end(); ++it)
        arguments.emplace_back(*it);

    boost::json::object exec{
        {"execute", "guest-exec"},
        {"arguments", {{"path", argv.front()}, {"arg", std::move(arguments)}, {"capture-output", true}}}};
    auto started = agent_reply(agent_command(domain.get(), name, boost::json::serialize(exec), timeout));

    const auto* pid = started.if_contains("pid");
    if (!pid || !pid->is_int64())
        throw BackendError{"The guest agent of {} did not report a process for \"{}\"", name, argv.front()};

    const auto status_command = boost::json::serialize(
        boost::json::object{{"execute", "guest-exec-status"}, {"arguments", {{"pid", pid->as_int64()}}}});

    GuestCommandResult result;
    auto on_timeout = [&name, &argv, timeout] {
        throw HealthCheckTimeout{"\"{}\" did not finish on {} within {}ms", argv.front(), name, timeout.count()};
    };

    cbu::try_action_until(on_timeout, deadline, agent_poll_interval, [&] {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto status = agent_reply(agent_command(domain.get(), name, status_command, std::max(remaining, 1000ms)));

        const auto* exited = status.if_contains("exited");
        if (!exited || !exited->is_bool() || !exited->as_bool())
            return cbu::TimeoutAction::retry;

        if (const auto* code = status.if_contains("exitcode"); code && code->is_int64())
            result.exit_status = static_cast<int>(code->as_int64());
        else
            result.exit_status = -1; // terminated by a signal

        if (const auto* output = status.if_contains("out-data"); output && output->is_string())
        {
            const auto& encoded = output->as_string();
            result.output = QByteArray::fromBase64(QByteArray{encoded.data(), static_cast<int>(encoded.size())})
                                .toStdString();
        }

        return cbu::TimeoutAction::done;
    });

    cbl::debug(name, "\"{}\" exited with {}", argv.front(), result.exit_status);
    return result;
}

void cb::LibvirtBackend::guest_ping(const std::string& name, std::chrono::milliseconds timeout)
{
    auto connection = open_connection();
    auto domain = checked_domain(connection.get(), name);

    agent_command(domain.get(), name, R"({"execute":"guest-ping"})", timeout);
}

std::string cb::LibvirtBackend::uri() const
{
    return session_uri;
}

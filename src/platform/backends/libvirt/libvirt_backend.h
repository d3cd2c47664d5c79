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

#ifndef CLONEBOX_LIBVIRT_BACKEND_H
#define CLONEBOX_LIBVIRT_BACKEND_H

#include "libvirt_wrapper.h"

#include <clonebox/virtualization_backend.h>

#include <string>

namespace clonebox
{
// Drives a qemu/KVM session through libvirt. Connections are opened per call.
class LibvirtBackend final : public VirtualizationBackend
{
public:
    using ConnectionUPtr = std::unique_ptr<virConnect, decltype(virConnectClose)*>;
    using DomainUPtr = std::unique_ptr<virDomain, decltype(virDomainFree)*>;
    using SnapshotUPtr = std::unique_ptr<virDomainSnapshot, decltype(virDomainSnapshotFree)*>;

    explicit LibvirtBackend(std::string uri, const std::string& libvirt_path = "libvirt.so.0",
                            const std::string& qemu_path = "libvirt-qemu.so.0");

    void define(const DomainDefinition& definition) override;
    void undefine(const std::string& name) override;
    void start(const std::string& name) override;
    void shutdown(const std::string& name) override;
    void destroy(const std::string& name) override;

    std::optional<DomainStatus> domain_status(const std::string& name) override;
    std::vector<std::string> list_domains() override;

    std::string create_snapshot(const std::string& name, const std::string& snapshot_name,
                                const std::string& description) override;
    void restore_snapshot(const std::string& name, const std::string& handle) override;
    void delete_snapshot(const std::string& name, const std::string& handle) override;

    GuestCommandResult guest_exec(const std::string& name, const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout) override;
    void guest_ping(const std::string& name, std::chrono::milliseconds timeout) override;

    std::string uri() const override;

    LibvirtWrapper::UPtr libvirt_wrapper;

private:
    ConnectionUPtr open_connection() const;
    DomainUPtr checked_domain(virConnectPtr connection, const std::string& name) const;
    SnapshotUPtr checked_snapshot(virDomainPtr domain, const std::string& name, const std::string& handle) const;
    std::string agent_command(virDomainPtr domain, const std::string& name, const std::string& command,
                              std::chrono::milliseconds timeout) const;
    [[noreturn]] void throw_last_error(const std::string& name, const std::string& action) const;

    const std::string session_uri;
};

// The domain XML for a definition. The network mode must already be resolved.
std::string domain_xml(const DomainDefinition& definition, const Path& seed_image);
} // namespace clonebox

#endif // CLONEBOX_LIBVIRT_BACKEND_H

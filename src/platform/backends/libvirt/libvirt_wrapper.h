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

#ifndef CLONEBOX_LIBVIRT_WRAPPER_H
#define CLONEBOX_LIBVIRT_WRAPPER_H

#include <clonebox/format.h>

#include <memory>
#include <stdexcept>
#include <string>

#include <libvirt/libvirt-qemu.h>
#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>

namespace clonebox
{
class BaseLibvirtException : public std::runtime_error
{
public:
    BaseLibvirtException(const std::string& error_message) : runtime_error(error_message)
    {
    }
};

class LibvirtOpenException : public BaseLibvirtException
{
public:
    LibvirtOpenException(const std::string& library, const char* error_message)
        : BaseLibvirtException(fmt::format("Failed to open {}: {}", library.empty() ? "self" : library, error_message))
    {
    }
};

class LibvirtSymbolAddressException : public BaseLibvirtException
{
public:
    LibvirtSymbolAddressException(const std::string& symbol, const char* error_message)
        : BaseLibvirtException(fmt::format("Failed to load symbol \"{}\": {}", symbol, error_message))
    {
    }
};

// Late-bound libvirt entry points. An empty library name resolves symbols from the running executable.
class LibvirtWrapper
{
private:
    typedef virConnectPtr (*virConnectOpen_t)(const char* name);
    typedef int (*virConnectClose_t)(virConnectPtr conn);
    typedef int (*virConnectListAllDomains_t)(virConnectPtr conn, virDomainPtr** domains, unsigned int flags);
    typedef virDomainPtr (*virDomainLookupByName_t)(virConnectPtr conn, const char* name);
    typedef virDomainPtr (*virDomainDefineXML_t)(virConnectPtr conn, const char* xml);
    typedef int (*virDomainUndefineFlags_t)(virDomainPtr domain, unsigned int flags);
    typedef int (*virDomainCreate_t)(virDomainPtr domain);
    typedef int (*virDomainShutdown_t)(virDomainPtr domain);
    typedef int (*virDomainDestroy_t)(virDomainPtr domain);
    typedef int (*virDomainFree_t)(virDomainPtr domain);
    typedef int (*virDomainGetState_t)(virDomainPtr domain, int* state, int* reason, unsigned int flags);
    typedef const char* (*virDomainGetName_t)(virDomainPtr domain);
    typedef int (*virDomainInterfaceAddresses_t)(virDomainPtr domain, virDomainInterfacePtr** ifaces,
                                                 unsigned int source, unsigned int flags);
    typedef void (*virDomainInterfaceFree_t)(virDomainInterfacePtr iface);
    typedef virDomainSnapshotPtr (*virDomainSnapshotCreateXML_t)(virDomainPtr domain, const char* xml,
                                                                 unsigned int flags);
    typedef virDomainSnapshotPtr (*virDomainSnapshotLookupByName_t)(virDomainPtr domain, const char* name,
                                                                    unsigned int flags);
    typedef int (*virDomainRevertToSnapshot_t)(virDomainSnapshotPtr snapshot, unsigned int flags);
    typedef int (*virDomainSnapshotDelete_t)(virDomainSnapshotPtr snapshot, unsigned int flags);
    typedef int (*virDomainSnapshotFree_t)(virDomainSnapshotPtr snapshot);
    typedef const char* (*virDomainSnapshotGetName_t)(virDomainSnapshotPtr snapshot);
    typedef const char* (*virGetLastErrorMessage_t)();
    typedef virErrorPtr (*virGetLastError_t)();
    typedef char* (*virDomainQemuAgentCommand_t)(virDomainPtr domain, const char* cmd, int timeout,
                                                 unsigned int flags);

    void* handle{nullptr};
    void* qemu_handle{nullptr};

public:
    using UPtr = std::unique_ptr<LibvirtWrapper>;

    LibvirtWrapper(const std::string& filename = "libvirt.so.0",
                   const std::string& qemu_filename = "libvirt-qemu.so.0");
    ~LibvirtWrapper();

    virConnectOpen_t virConnectOpen;
    virConnectClose_t virConnectClose;
    virConnectListAllDomains_t virConnectListAllDomains;
    virDomainLookupByName_t virDomainLookupByName;
    virDomainDefineXML_t virDomainDefineXML;
    virDomainUndefineFlags_t virDomainUndefineFlags;
    virDomainCreate_t virDomainCreate;
    virDomainShutdown_t virDomainShutdown;
    virDomainDestroy_t virDomainDestroy;
    virDomainFree_t virDomainFree;
    virDomainGetState_t virDomainGetState;
    virDomainGetName_t virDomainGetName;
    virDomainInterfaceAddresses_t virDomainInterfaceAddresses;
    virDomainInterfaceFree_t virDomainInterfaceFree;
    virDomainSnapshotCreateXML_t virDomainSnapshotCreateXML;
    virDomainSnapshotLookupByName_t virDomainSnapshotLookupByName;
    virDomainRevertToSnapshot_t virDomainRevertToSnapshot;
    virDomainSnapshotDelete_t virDomainSnapshotDelete;
    virDomainSnapshotFree_t virDomainSnapshotFree;
    virDomainSnapshotGetName_t virDomainSnapshotGetName;
    virGetLastErrorMessage_t virGetLastErrorMessage;
    virGetLastError_t virGetLastError;
    virDomainQemuAgentCommand_t virDomainQemuAgentCommand;
};
} // namespace clonebox

#endif // CLONEBOX_LIBVIRT_WRAPPER_H

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

#include "libvirt_wrapper.h"

#include <dlfcn.h>

namespace cb = clonebox;

namespace
{
void* open_handle(const std::string& filename)
{
    // An empty filename opens the running executable, which is how the tests supply their fakes
    auto handle = dlopen(filename.empty() ? nullptr : filename.c_str(), RTLD_NOW | RTLD_GLOBAL);

    if (!handle)
        throw cb::LibvirtOpenException(filename, dlerror());

    return handle;
}

void* symbol_address(const std::string& symbol, void* handle)
{
    dlerror();
    auto address = dlsym(handle, symbol.c_str());

    if (!address)
    {
        const char* error = dlerror();
        throw cb::LibvirtSymbolAddressException(symbol, error ? error : "symbol is null");
    }

    return address;
}

template <typename T>
T resolve(const std::string& symbol, void* handle)
{
    return reinterpret_cast<T>(symbol_address(symbol, handle));
}

struct HandleCloser
{
    void operator()(void* handle) const
    {
        if (handle)
            dlclose(handle);
    }
};
} // namespace

cb::LibvirtWrapper::LibvirtWrapper(const std::string& filename, const std::string& qemu_filename)
{
    // Both handles are released again if any symbol is missing
    std::unique_ptr<void, HandleCloser> main_guard{open_handle(filename)};
    std::unique_ptr<void, HandleCloser> qemu_guard{open_handle(qemu_filename)};
    handle = main_guard.get();
    qemu_handle = qemu_guard.get();

    virConnectOpen = resolve<virConnectOpen_t>("virConnectOpen", handle);
    virConnectClose = resolve<virConnectClose_t>("virConnectClose", handle);
    virConnectListAllDomains = resolve<virConnectListAllDomains_t>("virConnectListAllDomains", handle);
    virDomainLookupByName = resolve<virDomainLookupByName_t>("virDomainLookupByName", handle);
    virDomainDefineXML = resolve<virDomainDefineXML_t>("virDomainDefineXML", handle);
    virDomainUndefineFlags = resolve<virDomainUndefineFlags_t>("virDomainUndefineFlags", handle);
    virDomainCreate = resolve<virDomainCreate_t>("virDomainCreate", handle);
    virDomainShutdown = resolve<virDomainShutdown_t>("virDomainShutdown", handle);
    virDomainDestroy = resolve<virDomainDestroy_t>("virDomainDestroy", handle);
    virDomainFree = resolve<virDomainFree_t>("virDomainFree", handle);
    virDomainGetState = resolve<virDomainGetState_t>("virDomainGetState", handle);
    virDomainGetName = resolve<virDomainGetName_t>("virDomainGetName", handle);
    virDomainInterfaceAddresses = resolve<virDomainInterfaceAddresses_t>("virDomainInterfaceAddresses", handle);
    virDomainInterfaceFree = resolve<virDomainInterfaceFree_t>("virDomainInterfaceFree", handle);
    virDomainSnapshotCreateXML = resolve<virDomainSnapshotCreateXML_t>("virDomainSnapshotCreateXML", handle);
    virDomainSnapshotLookupByName =
        resolve<virDomainSnapshotLookupByName_t>("virDomainSnapshotLookupByName", handle);
    virDomainRevertToSnapshot = resolve<virDomainRevertToSnapshot_t>("virDomainRevertToSnapshot", handle);
    virDomainSnapshotDelete = resolve<virDomainSnapshotDelete_t>("virDomainSnapshotDelete", handle);
    virDomainSnapshotFree = resolve<virDomainSnapshotFree_t>("virDomainSnapshotFree", handle);
    virDomainSnapshotGetName = resolve<virDomainSnapshotGetName_t>("virDomainSnapshotGetName", handle);
    virGetLastErrorMessage = resolve<virGetLastErrorMessage_t>("virGetLastErrorMessage", handle);
    virGetLastError = resolve<virGetLastError_t>("virGetLastError", handle);
    virDomainQemuAgentCommand = resolve<virDomainQemuAgentCommand_t>("virDomainQemuAgentCommand", qemu_handle);

    main_guard.release();
    qemu_guard.release();
}

cb::LibvirtWrapper::~LibvirtWrapper()
{
    dlclose(qemu_handle);
    dlclose(handle);
}

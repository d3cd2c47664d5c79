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

#pragma once

#include <clonebox/clone_spec.h>
#include <clonebox/disabled_copy_move.h>
#include <clonebox/path.h>
#include <clonebox/provisioning_bundle.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clonebox
{
enum class DomainState
{
    shut_off,
    running,
    shutting_down,
    paused,
    crashed
};

struct DomainStatus
{
    DomainState state{DomainState::shut_off};
    std::string address; // empty until the guest has an address
};

// Everything a backend needs to register a VM
struct DomainDefinition
{
    std::string name;
    ResourceLimits resources;
    Path disk_path;
    Path seed_directory; // NoCloud files, packed into a "cidata" seed image by the backend
    std::vector<MountDeclaration> mounts;
    NetworkMode network{NetworkMode::user};
    bool graphics{true};
    Path base_image; // optional backing image for the disk
};

struct GuestCommandResult
{
    int exit_status{0};
    std::string output;
};

/**
 * Lifecycle control over an external hypervisor session.
 *
 * One instance talks to one session (user or system, local or remote). Calls throw BackendUnavailable when the
 * session cannot be reached, StaleStateConflict when the domain changed state underneath the call and BackendError
 * for everything else.
 */
class VirtualizationBackend : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<VirtualizationBackend>;

    virtual ~VirtualizationBackend() = default;

    virtual void define(const DomainDefinition& definition) = 0;
    virtual void undefine(const std::string& name) = 0; // also drops the domain's snapshots
    virtual void start(const std::string& name) = 0;
    virtual void shutdown(const std::string& name) = 0; // asks the guest to power off, returns immediately
    virtual void destroy(const std::string& name) = 0;  // immediate power off

    virtual std::optional<DomainStatus> domain_status(const std::string& name) = 0; // nullopt when undefined
    virtual std::vector<std::string> list_domains() = 0;

    // Returns the handle to later restore or delete the snapshot with
    virtual std::string create_snapshot(const std::string& name, const std::string& snapshot_name,
                                        const std::string& description) = 0;
    // Both throw NoSuchSnapshotException when the backend no longer has the snapshot. A restored domain is shut off.
    virtual void restore_snapshot(const std::string& name, const std::string& handle) = 0;
    virtual void delete_snapshot(const std::string& name, const std::string& handle) = 0;

    // Guest agent transport. Both throw HealthCheckTimeout when the agent does not answer in time.
    virtual GuestCommandResult guest_exec(const std::string& name, const std::vector<std::string>& argv,
                                          std::chrono::milliseconds timeout) = 0;
    virtual void guest_ping(const std::string& name, std::chrono::milliseconds timeout) = 0;

    virtual std::string uri() const = 0;

protected:
    VirtualizationBackend() = default;
};

std::string to_string(DomainState state);
} // namespace clonebox

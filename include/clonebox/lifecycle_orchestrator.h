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

#ifndef CLONEBOX_LIFECYCLE_ORCHESTRATOR_H
#define CLONEBOX_LIFECYCLE_ORCHESTRATOR_H

#include <clonebox/audit_event.h>
#include <clonebox/backing_store.h>
#include <clonebox/clone_spec.h>
#include <clonebox/deadline.h>
#include <clonebox/disabled_copy_move.h>
#include <clonebox/path.h>
#include <clonebox/vm_lock_registry.h>
#include <clonebox/vm_record.h>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace clonebox
{
class AuditLog;
class ProvisioningRenderer;
class VirtualizationBackend;

struct LifecycleSettings
{
    Path storage_root;
    SessionScope scope{SessionScope::user};
    std::chrono::milliseconds stop_timeout{std::chrono::seconds{60}};
    std::chrono::milliseconds poll_interval{std::chrono::milliseconds{500}};
};

/**
 * Drives instances through Absent -> Provisioning -> Running <-> Stopped -> Absent.
 *
 * Every operation starts by reconciling its cached record with the backend, whose view always wins. Mutating
 * operations hold the instance's lock for their whole duration and record an audit event.
 */
class LifecycleOrchestrator : private DisabledCopyMove
{
public:
    LifecycleOrchestrator(VirtualizationBackend& backend, const ProvisioningRenderer& renderer, AuditLog& audit,
                          LifecycleSettings settings);

    // Either the instance ends up running or every completed step is undone and ProvisioningFailure is thrown
    VMRecord create(const CloneSpec& spec, const Deadline& deadline = {});
    VMRecord start(const std::string& name, const Deadline& deadline = {});
    VMRecord stop(const std::string& name, bool force = false, const Deadline& deadline = {});
    VMRecord restart(const std::string& name, const Deadline& deadline = {});
    void delete_vm(const std::string& name, const Deadline& deadline = {}); // succeeds when already absent

    VMRecord status(const std::string& name);
    std::vector<VMRecord> list();

    VMLockRegistry::Lock lock(const std::string& name, const Deadline& deadline = {});
    const BackingStore& storage() const;
    SessionScope scope() const;

private:
    VMRecord reconcile(const std::string& name);
    VMRecord cache_state(const std::string& name, VMState state);
    template <typename Fun>
    auto retry_once_on_stale_state(const std::string& name, Fun&& fun) -> decltype(fun());

    using Transition = std::pair<VMRecord, AuditOutcome>;
    Transition start_locked(const std::string& name, const Deadline& deadline);
    Transition stop_locked(const std::string& name, bool force, const Deadline& deadline);
    VMRecord audit_transition(AuditEventKind kind, const std::string& name, const std::function<Transition()>& fun);
    bool wait_for_shutdown(const std::string& name, const Deadline& deadline);
    void transition(const std::string& name, const std::function<void()>& backend_call);

    VirtualizationBackend& backend;
    const ProvisioningRenderer& renderer;
    AuditLog& audit;
    const LifecycleSettings settings;
    BackingStore store;
    VMLockRegistry locks;

    std::mutex cache_mutex;
    std::map<std::string, VMRecord> cache;
};
} // namespace clonebox
#endif // CLONEBOX_LIFECYCLE_ORCHESTRATOR_H

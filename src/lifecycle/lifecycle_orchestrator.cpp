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

#include <clonebox/audit_log.h>
#include <clonebox/exceptions/backend_exceptions.h>
#include <clonebox/exceptions/lifecycle_exceptions.h>
#include <clonebox/exceptions/provisioning_failure.h>
#include <clonebox/exceptions/validation_error.h>
#include <clonebox/format.h>
#include <clonebox/lifecycle_orchestrator.h>
#include <clonebox/logging/log.h>
#include <clonebox/provisioning_renderer.h>
#include <clonebox/top_catch_all.h>
#include <clonebox/utils.h>
#include <clonebox/virtualization_backend.h>

#include <scope_guard.hpp>

#include <set>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbu = clonebox::utils;

namespace
{
constexpr auto category = "lifecycle";

cb::VMState state_from(const cb::DomainStatus& status)
{
    switch (status.state)
    {
    case cb::DomainState::running:
    case cb::DomainState::shutting_down:
    case cb::DomainState::paused:
        return cb::VMState::running;
    case cb::DomainState::crashed:
        return cb::VMState::failed;
    case cb::DomainState::shut_off:
        break;
    }

    return cb::VMState::stopped;
}

cb::DomainDefinition make_definition(const cb::CloneSpec& spec, const cb::ProvisioningBundle& bundle,
                                     const cb::BackingStore& store)
{
    return {spec.name,
            spec.resources,
            store.disk_path(spec.name),
            store.seed_directory(spec.name),
            bundle.mounts,
            bundle.network.mode,
            spec.graphics,
            QString::fromStdString(spec.base_image)};
}

// Cancellation and unreachable backends surface as they are, anything else names the step that failed
template <typename Fun>
void provisioning_step(const std::string& name, const std::string& step, const cb::Deadline& deadline, Fun&& fun)
{
    deadline.check(name, step);
    cbl::debug(name, "Trying to {}", step);

    try
    {
        fun();
    }
    catch (const cb::BackendUnavailable&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw cb::ProvisioningFailure{name, step, e.what()};
    }
}
} // namespace

std::string cb::to_string(VMState state)
{
    switch (state)
    {
    case VMState::absent:
        return "absent";
    case VMState::provisioning:
        return "provisioning";
    case VMState::running:
        return "running";
    case VMState::stopped:
        return "stopped";
    case VMState::failed:
        return "failed";
    }

    return "unknown";
}

std::string cb::to_string(DomainState state)
{
    switch (state)
    {
    case DomainState::shut_off:
        return "shut off";
    case DomainState::running:
        return "running";
    case DomainState::shutting_down:
        return "shutting down";
    case DomainState::paused:
        return "paused";
    case DomainState::crashed:
        return "crashed";
    }

    return "unknown";
}

cb::LifecycleOrchestrator::LifecycleOrchestrator(VirtualizationBackend& backend, const ProvisioningRenderer& renderer,
                                                 AuditLog& audit, LifecycleSettings settings)
    : backend{backend},
      renderer{renderer},
      audit{audit},
      settings{std::move(settings)},
      store{this->settings.storage_root, this->settings.scope}
{
}

template <typename Fun>
auto cb::LifecycleOrchestrator::retry_once_on_stale_state(const std::string& name, Fun&& fun) -> decltype(fun())
{
    try
    {
        return fun();
    }
    catch (const StaleStateConflict& e)
    {
        cbl::warn(name, "Backend state changed during the operation, retrying: {}", e.what());
        reconcile(name);
        return fun();
    }
}

cb::VMRecord cb::LifecycleOrchestrator::create(const CloneSpec& spec, const Deadline& deadline)
{
    const auto& name = spec.name;

    return audited(audit, AuditEventKind::vm_create, name, [&] {
        validate(spec);
        if (spec.scope != settings.scope)
            throw ValidationError{"\"{}\" belongs to the {} session, but the {} session is in use", name,
                                  to_string(spec.scope), to_string(settings.scope)};
        check_mounts_readable(spec);

        auto lock = locks.acquire(name, deadline);
        if (reconcile(name).state != VMState::absent || store.exists(name))
            throw InstanceAlreadyExists{name};

        auto bundle = renderer.render(spec);
        audit.record(AuditEventKind::credentials_generated, name, AuditOutcome::success,
                     to_string(bundle.credentials.method));

        cache_state(name, VMState::provisioning);
        auto forget_record = sg::make_scope_guard([this, &name]() noexcept {
            top_catch_all(category, [this, &name] {
                std::lock_guard cache_lock{cache_mutex};
                cache.erase(name);
            });
        });

        provisioning_step(name, "allocate backing storage", deadline,
                          [&] { store.allocate(name, spec.resources.disk); });
        auto release_storage = sg::make_scope_guard([this, &name]() noexcept {
            top_catch_all(category, [this, &name] { store.release(name); });
        });

        provisioning_step(name, "write the provisioning bundle", deadline,
                          [&] { store.write_provisioning(name, bundle); });
        auto remove_bundle = sg::make_scope_guard([this, &name]() noexcept {
            top_catch_all(category, [this, &name] { store.remove_provisioning(name); });
        });

        provisioning_step(name, "register the instance", deadline,
                          [&] { backend.define(make_definition(spec, bundle, store)); });
        auto unregister = sg::make_scope_guard([this, &name]() noexcept {
            top_catch_all(category, [this, &name] { backend.undefine(name); });
        });

        provisioning_step(name, "start the instance", deadline, [&] { backend.start(name); });

        unregister.dismiss();
        remove_bundle.dismiss();
        release_storage.dismiss();
        forget_record.dismiss();

        cbl::info(name, "Created in the {} session", to_string(settings.scope));
        cache_state(name, VMState::running);
        return reconcile(name);
    });
}

cb::VMRecord cb::LifecycleOrchestrator::start(const std::string& name, const Deadline& deadline)
{
    return audit_transition(AuditEventKind::vm_start, name, [&] {
        auto lock = locks.acquire(name, deadline);
        return retry_once_on_stale_state(name, [&] { return start_locked(name, deadline); });
    });
}

cb::VMRecord cb::LifecycleOrchestrator::stop(const std::string& name, bool force, const Deadline& deadline)
{
    return audit_transition(AuditEventKind::vm_stop, name, [&] {
        auto lock = locks.acquire(name, deadline);
        return retry_once_on_stale_state(name, [&] { return stop_locked(name, force, deadline); });
    });
}

cb::VMRecord cb::LifecycleOrchestrator::restart(const std::string& name, const Deadline& deadline)
{
    return audit_transition(AuditEventKind::vm_restart, name, [&] {
        auto lock = locks.acquire(name, deadline);
        return retry_once_on_stale_state(name, [&] {
            stop_locked(name, false, deadline);
            return Transition{start_locked(name, deadline).first, AuditOutcome::success};
        });
    });
}

void cb::LifecycleOrchestrator::delete_vm(const std::string& name, const Deadline& deadline)
{
    audit_transition(AuditEventKind::vm_delete, name, [&] {
        auto lock = locks.acquire(name, deadline);
        return retry_once_on_stale_state(name, [&] {
            auto record = reconcile(name);
            if (record.state == VMState::provisioning)
                throw VMStateInvalidException{"Cannot delete \"{}\" while it is being provisioned", name};

            if (record.state == VMState::absent && !store.exists(name))
            {
                cbl::debug(name, "Already deleted");
                return Transition{record, AuditOutcome::skipped};
            }

            if (record.state != VMState::absent)
            {
                deadline.check(name, "delete");
                if (auto current = backend.domain_status(name); current && current->state != DomainState::shut_off)
                    backend.destroy(name);
                backend.undefine(name);
            }
            else
            {
                cbl::warn(name, "Removing storage left without a registered instance");
            }

            store.release(name);
            {
                std::lock_guard cache_lock{cache_mutex};
                cache.erase(name);
            }

            cbl::info(name, "Deleted");
            return Transition{VMRecord{name, VMState::absent, settings.scope, {}, {}}, AuditOutcome::success};
        });
    });
}

cb::VMRecord cb::LifecycleOrchestrator::status(const std::string& name)
{
    return reconcile(name);
}

std::vector<cb::VMRecord> cb::LifecycleOrchestrator::list()
{
    auto domains = backend.list_domains();
    std::set<std::string> names{domains.begin(), domains.end()};
    {
        std::lock_guard cache_lock{cache_mutex};
        for (const auto& [name, record] : cache)
            names.insert(name);
    }

    std::vector<VMRecord> records;
    for (const auto& name : names)
    {
        auto record = reconcile(name);
        if (record.state != VMState::absent)
            records.push_back(std::move(record));
    }

    return records;
}

cb::VMLockRegistry::Lock cb::LifecycleOrchestrator::lock(const std::string& name, const Deadline& deadline)
{
    return locks.acquire(name, deadline);
}

const cb::BackingStore& cb::LifecycleOrchestrator::storage() const
{
    return store;
}

cb::SessionScope cb::LifecycleOrchestrator::scope() const
{
    return settings.scope;
}

cb::VMRecord cb::LifecycleOrchestrator::reconcile(const std::string& name)
{
    auto status = backend.domain_status(name);

    std::lock_guard cache_lock{cache_mutex};
    auto it = cache.find(name);
    if (!status)
    {
        if (it != cache.end())
        {
            if (it->second.state == VMState::provisioning)
                return it->second;

            cbl::debug(category, "\"{}\" is no longer known to the backend", name);
            cache.erase(it);
        }
        return VMRecord{name, VMState::absent, settings.scope, {}, {}};
    }

    auto observed = state_from(*status);
    if (it == cache.end())
        it = cache.emplace(name, VMRecord{name, observed, settings.scope, {}, store.created_at(name)}).first;

    auto& record = it->second;
    // provisioning is ours until create returns, and a failure stays visible until the guest runs again
    if (record.state != VMState::provisioning && !(record.state == VMState::failed && observed == VMState::stopped))
        record.state = observed;
    record.address = status->address;

    return record;
}

cb::VMRecord cb::LifecycleOrchestrator::cache_state(const std::string& name, VMState state)
{
    std::lock_guard cache_lock{cache_mutex};
    auto& record = cache[name];
    record.name = name;
    record.scope = settings.scope;
    record.state = state;
    if (!record.created_at.isValid())
        record.created_at = QDateTime::currentDateTimeUtc();

    return record;
}

auto cb::LifecycleOrchestrator::start_locked(const std::string& name, const Deadline& deadline) -> Transition
{
    auto record = reconcile(name);
    switch (record.state)
    {
    case VMState::absent:
        throw InstanceNotFound{name};
    case VMState::provisioning:
        throw VMStateInvalidException{"Cannot start \"{}\" while it is being provisioned", name};
    case VMState::failed:
        throw VMStateInvalidException{"\"{}\" failed and needs to be deleted", name};
    case VMState::running:
        cbl::debug(name, "Already running");
        return {record, AuditOutcome::skipped};
    case VMState::stopped:
        break;
    }

    deadline.check(name, "start");
    transition(name, [this, &name] { backend.start(name); });
    cbl::info(name, "Started");

    return {reconcile(name), AuditOutcome::success};
}

auto cb::LifecycleOrchestrator::stop_locked(const std::string& name, bool force, const Deadline& deadline)
    -> Transition
{
    auto record = reconcile(name);
    switch (record.state)
    {
    case VMState::absent:
        throw InstanceNotFound{name};
    case VMState::provisioning:
        throw VMStateInvalidException{"Cannot stop \"{}\" while it is being provisioned", name};
    case VMState::failed:
    case VMState::stopped:
        cbl::debug(name, "Already stopped");
        return {record, AuditOutcome::skipped};
    case VMState::running:
        break;
    }

    deadline.check(name, "stop");
    if (!force)
    {
        transition(name, [this, &name] { backend.shutdown(name); });
        force = !wait_for_shutdown(name, deadline);
        if (force)
            cbl::warn(name, "Did not shut down within {}s, forcing it off", settings.stop_timeout.count() / 1000.0);
    }

    if (force)
        transition(name, [this, &name] { backend.destroy(name); });

    cbl::info(name, "Stopped");
    return {reconcile(name), AuditOutcome::success};
}

bool cb::LifecycleOrchestrator::wait_for_shutdown(const std::string& name, const Deadline& deadline)
{
    bool stopped = false;
    cbu::try_action_until([] {}, deadline.bound(settings.stop_timeout), settings.poll_interval, [&] {
        auto status = backend.domain_status(name);
        stopped = !status || status->state == DomainState::shut_off;
        return stopped ? cbu::TimeoutAction::done : cbu::TimeoutAction::retry;
    });

    if (!stopped)
        deadline.check(name, "wait for the guest to shut down"); // the VM stays as last confirmed

    return stopped;
}

void cb::LifecycleOrchestrator::transition(const std::string& name, const std::function<void()>& backend_call)
{
    try
    {
        backend_call();
    }
    catch (const BackendUnavailable&)
    {
        throw;
    }
    catch (const StaleStateConflict&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        cbl::error(name, "Backend failure: {}", e.what());
        cache_state(name, VMState::failed);
        throw;
    }
}

cb::VMRecord cb::LifecycleOrchestrator::audit_transition(AuditEventKind kind, const std::string& name,
                                                         const std::function<Transition()>& fun)
{
    try
    {
        auto [record, outcome] = fun();
        audit.record(kind, name, outcome);
        return record;
    }
    catch (const std::exception& e)
    {
        audit.record(kind, name, AuditOutcome::failure, e.what());
        throw;
    }
}

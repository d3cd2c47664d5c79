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
#include <clonebox/clone_spec_schema.h>
#include <clonebox/compose_orchestrator.h>
#include <clonebox/exceptions/backend_exceptions.h>
#include <clonebox/exceptions/validation_error.h>
#include <clonebox/format.h>
#include <clonebox/health_checker.h>
#include <clonebox/lifecycle_orchestrator.h>
#include <clonebox/logging/log.h>
#include <clonebox/virtualization_backend.h>

#include <QFuture>
#include <QFutureSynchronizer>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include <fmt/ranges.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace cb = clonebox;
namespace cbl = clonebox::logging;

namespace
{
constexpr auto category = "compose";
constexpr auto guest_command_timeout = std::chrono::seconds{30};

const cb::ComposeMember& member_of(const cb::ComposeGroup& group, const std::string& name)
{
    auto it = group.members.find(name);
    if (it == group.members.end())
        throw cb::ValidationError{"Compose group \"{}\" has no member \"{}\"", group.name, name};

    return it->second;
}

bool failed_or_skipped(const cb::MemberResult& result)
{
    return result.outcome == cb::MemberOutcome::failed || result.outcome == cb::MemberOutcome::skipped ||
           result.outcome == cb::MemberOutcome::rolled_back;
}

std::string summary(const cb::ComposeResult& result)
{
    std::vector<std::string> parts;
    for (const auto& [name, member] : result.members)
        parts.push_back(fmt::format("{}: {}", name, cb::to_string(member.outcome)));

    return fmt::format("{}", fmt::join(parts, ", "));
}

// Runs `action` for every member of a level on the pool and waits for all of them
template <typename Action>
std::map<std::string, cb::MemberResult> run_level(QThreadPool& pool, const std::vector<std::string>& names,
                                                  Action&& action)
{
    QFutureSynchronizer<cb::MemberResult> synchronizer;
    std::vector<std::pair<std::string, QFuture<cb::MemberResult>>> futures;
    for (const auto& name : names)
    {
        auto future = QtConcurrent::run(&pool, [&action, name] { return action(name); });
        synchronizer.addFuture(future);
        futures.emplace_back(name, future);
    }

    synchronizer.waitForFinished();

    std::map<std::string, cb::MemberResult> results;
    for (auto& [name, future] : futures)
        results.emplace(name, future.result());

    return results;
}
} // namespace

bool cb::ComposeResult::success() const
{
    return std::none_of(members.cbegin(), members.cend(),
                        [](const auto& entry) { return failed_or_skipped(entry.second); });
}

std::string cb::to_string(MemberOutcome outcome)
{
    switch (outcome)
    {
    case MemberOutcome::created:
        return "created";
    case MemberOutcome::started:
        return "started";
    case MemberOutcome::already_running:
        return "already running";
    case MemberOutcome::stopped:
        return "stopped";
    case MemberOutcome::already_stopped:
        return "already stopped";
    case MemberOutcome::skipped:
        return "skipped";
    case MemberOutcome::failed:
        return "failed";
    case MemberOutcome::rolled_back:
        return "rolled back";
    }

    return "unknown";
}

cb::ComposeOrchestrator::ComposeOrchestrator(LifecycleOrchestrator& lifecycle, HealthChecker& health,
                                             VirtualizationBackend& backend, AuditLog& audit, int worker_pool_size)
    : lifecycle{lifecycle}, health{health}, backend{backend}, audit{audit}, worker_pool_size{worker_pool_size}
{
    if (worker_pool_size < 1)
        throw ValidationError{"The compose worker pool needs at least one worker, got {}", worker_pool_size};
}

cb::ComposeResult cb::ComposeOrchestrator::up(const ComposeGroup& group, const std::set<std::string>& subset,
                                              const Deadline& deadline)
{
    validate(group);
    auto pending = dependency_closure(group, subset);
    const auto levels = start_levels(group, pending);

    QThreadPool pool;
    pool.setMaxThreadCount(worker_pool_size);
    QFutureSynchronizer<void> synchronizer;

    ComposeResult result;
    std::mutex mutex;
    std::condition_variable member_finished;
    std::size_t running{0};
    bool aborted = false;

    // A member is scheduled as soon as all of its own dependencies are up
    std::unique_lock lock{mutex};
    while (!pending.empty() || running > 0)
    {
        if (group.all_or_nothing && !result.success())
            aborted = true;

        for (auto it = pending.begin(); it != pending.end();)
        {
            const auto name = *it;
            if (aborted)
            {
                result.members[name] = {MemberOutcome::skipped, "the group was aborted", false};
                it = pending.erase(it);
                continue;
            }

            const auto& dependencies = group.members.at(name).depends_on;
            auto failed_dependency = std::find_if(dependencies.begin(), dependencies.end(), [&result](const auto& d) {
                return result.members.count(d) && failed_or_skipped(result.members.at(d));
            });
            if (failed_dependency != dependencies.end())
            {
                result.members[name] = {MemberOutcome::skipped,
                                        fmt::format("dependency \"{}\" is not up", *failed_dependency), false};
                it = pending.erase(it);
                continue;
            }

            if (!std::all_of(dependencies.begin(), dependencies.end(),
                             [&result](const auto& d) { return result.members.count(d) > 0; }))
            {
                ++it;
                continue;
            }

            ++running;
            synchronizer.addFuture(QtConcurrent::run(&pool, [&, name] {
                auto member_result = bring_up(group.members.at(name), deadline);

                std::lock_guard guard{mutex};
                result.members[name] = std::move(member_result);
                --running;
                member_finished.notify_one();
            }));
            it = pending.erase(it);
        }

        if (running > 0)
            member_finished.wait(lock);
    }
    lock.unlock();
    synchronizer.waitForFinished();

    if (group.all_or_nothing && !result.success())
        roll_back(levels, result, deadline);

    audit.record(AuditEventKind::compose_up, group.name,
                 result.success() ? AuditOutcome::success : AuditOutcome::failure, summary(result));
    cbl::info(category, "{} up: {}", group.name, summary(result));

    return result;
}

cb::ComposeResult cb::ComposeOrchestrator::down(const ComposeGroup& group, const std::set<std::string>& subset,
                                                bool force, const Deadline& deadline)
{
    validate(group);

    std::set<std::string> members = subset;
    if (members.empty())
        for (const auto& [name, member] : group.members)
            members.insert(name);
    for (const auto& name : members)
        member_of(group, name);

    auto levels = start_levels(group, members);
    std::reverse(levels.begin(), levels.end());

    QThreadPool pool;
    pool.setMaxThreadCount(worker_pool_size);

    ComposeResult result;
    for (const auto& level : levels)
    {
        auto level_results = run_level(pool, level, [this, &group, force, &deadline](const std::string& name) {
            return bring_down(group.members.at(name), force, deadline);
        });
        result.members.merge(level_results);
    }

    audit.record(AuditEventKind::compose_down, group.name,
                 result.success() ? AuditOutcome::success : AuditOutcome::failure, summary(result));
    cbl::info(category, "{} down: {}", group.name, summary(result));

    return result;
}

std::map<std::string, cb::VMRecord> cb::ComposeOrchestrator::status(const ComposeGroup& group)
{
    std::map<std::string, VMRecord> records;
    for (const auto& [name, member] : group.members)
        records.emplace(name, lifecycle.status(name));

    return records;
}

std::string cb::ComposeOrchestrator::logs(const ComposeGroup& group, const std::string& member, int lines)
{
    const auto& name = member_of(group, member).name;
    auto result = backend.guest_exec(name, {"journalctl", "--no-pager", "-n", std::to_string(lines)},
                                     guest_command_timeout);
    if (result.exit_status != 0)
        throw BackendError{"journalctl failed on \"{}\" with exit status {}", name, result.exit_status};

    return result.output;
}

std::string cb::ComposeOrchestrator::exec(const ComposeGroup& group, const std::string& member,
                                          const std::string& command)
{
    const auto& name = member_of(group, member).name;
    auto result = backend.guest_exec(name, {"/bin/sh", "-c", command}, guest_command_timeout);
    if (result.exit_status != 0)
        throw BackendError{"Command failed on \"{}\" with exit status {}: {}", name, result.exit_status,
                           result.output};

    return result.output;
}

cb::MemberResult cb::ComposeOrchestrator::bring_up(const ComposeMember& member, const Deadline& deadline)
{
    MemberResult result;
    try
    {
        auto record = lifecycle.status(member.name);
        switch (record.state)
        {
        case VMState::absent:
        {
            auto spec = load_clone_spec(member.config);
            spec.name = member.name;
            spec.scope = lifecycle.scope();
            lifecycle.create(spec, deadline);
            result = {MemberOutcome::created, {}, true};
            break;
        }
        case VMState::stopped:
            lifecycle.start(member.name, deadline);
            result = {MemberOutcome::started, {}, true};
            break;
        case VMState::running:
            result = {MemberOutcome::already_running, {}, false};
            break;
        case VMState::provisioning:
        case VMState::failed:
            return {MemberOutcome::failed, fmt::format("the instance is {}", to_string(record.state)), false};
        }

        if (member.health_check)
        {
            auto report = health.verify(member.name, {*member.health_check}, deadline);
            if (!report.healthy())
                return {MemberOutcome::failed, fmt::format("unhealthy: {}", report.summary()), result.started_by_call};
        }
    }
    catch (const std::exception& e)
    {
        cbl::warn(member.name, "Could not bring up: {}", e.what());
        return {MemberOutcome::failed, e.what(), false};
    }

    return result;
}

cb::MemberResult cb::ComposeOrchestrator::bring_down(const ComposeMember& member, bool force,
                                                     const Deadline& deadline)
{
    try
    {
        auto record = lifecycle.status(member.name);
        if (record.state != VMState::running)
            return {MemberOutcome::already_stopped, to_string(record.state), false};

        lifecycle.stop(member.name, force, deadline);
        return {MemberOutcome::stopped, {}, false};
    }
    catch (const std::exception& e)
    {
        cbl::warn(member.name, "Could not bring down: {}", e.what());
        return {MemberOutcome::failed, e.what(), false};
    }
}

void cb::ComposeOrchestrator::roll_back(const std::vector<std::vector<std::string>>& levels, ComposeResult& result,
                                        const Deadline& deadline)
{
    for (auto level = levels.rbegin(); level != levels.rend(); ++level)
    {
        for (auto name = level->rbegin(); name != level->rend(); ++name)
        {
            auto it = result.members.find(*name);
            if (it == result.members.end() || !it->second.started_by_call)
                continue;

            try
            {
                lifecycle.stop(*name, false, deadline);
                if (it->second.outcome == MemberOutcome::failed)
                    it->second.detail += "; stopped again";
                else
                    it->second.outcome = MemberOutcome::rolled_back;
            }
            catch (const std::exception& e)
            {
                cbl::error(*name, "Could not roll back: {}", e.what());
                it->second.detail = fmt::format("{}; rollback failed: {}", it->second.detail, e.what());
            }
        }
    }
}

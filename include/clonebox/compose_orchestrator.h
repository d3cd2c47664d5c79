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

#ifndef CLONEBOX_COMPOSE_ORCHESTRATOR_H
#define CLONEBOX_COMPOSE_ORCHESTRATOR_H

#include <clonebox/compose_group.h>
#include <clonebox/deadline.h>
#include <clonebox/disabled_copy_move.h>
#include <clonebox/vm_record.h>

#include <map>
#include <set>
#include <string>

namespace clonebox
{
class AuditLog;
class HealthChecker;
class LifecycleOrchestrator;
class VirtualizationBackend;

enum class MemberOutcome
{
    created,
    started,
    already_running,
    stopped,
    already_stopped,
    skipped, // a dependency failed
    failed,
    rolled_back
};

struct MemberResult
{
    MemberOutcome outcome{MemberOutcome::skipped};
    std::string detail;
    bool started_by_call{false};
};

struct ComposeResult
{
    std::map<std::string, MemberResult> members;

    bool success() const; // no member failed, was skipped or rolled back
};

/**
 * Brings compose groups up and down in dependency order.
 *
 * Bringing a group up starts each member as soon as its own dependencies are up, on a pool bounded by
 * worker_pool_size. Bringing it down goes level by level in reverse. Failures are reported per member, never thrown,
 * once the group itself validated.
 */
class ComposeOrchestrator : private DisabledCopyMove
{
public:
    ComposeOrchestrator(LifecycleOrchestrator& lifecycle, HealthChecker& health, VirtualizationBackend& backend,
                        AuditLog& audit, int worker_pool_size);

    ComposeResult up(const ComposeGroup& group, const std::set<std::string>& subset = {},
                     const Deadline& deadline = {});
    ComposeResult down(const ComposeGroup& group, const std::set<std::string>& subset = {}, bool force = false,
                       const Deadline& deadline = {});
    std::map<std::string, VMRecord> status(const ComposeGroup& group);
    std::string logs(const ComposeGroup& group, const std::string& member, int lines = 100);
    std::string exec(const ComposeGroup& group, const std::string& member, const std::string& command);

private:
    MemberResult bring_up(const ComposeMember& member, const Deadline& deadline);
    MemberResult bring_down(const ComposeMember& member, bool force, const Deadline& deadline);
    void roll_back(const std::vector<std::vector<std::string>>& levels, ComposeResult& result,
                   const Deadline& deadline);

    LifecycleOrchestrator& lifecycle;
    HealthChecker& health;
    VirtualizationBackend& backend;
    AuditLog& audit;
    const int worker_pool_size;
};

std::string to_string(MemberOutcome outcome);
} // namespace clonebox
#endif // CLONEBOX_COMPOSE_ORCHESTRATOR_H

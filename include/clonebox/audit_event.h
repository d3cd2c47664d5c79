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

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace clonebox
{
enum class AuditEventKind
{
    vm_create,
    vm_start,
    vm_stop,
    vm_restart,
    vm_delete,
    snapshot_create,
    snapshot_restore,
    snapshot_delete,
    compose_up,
    compose_down,
    health_check,
    credentials_generated,
    spec_saved
};

enum class AuditOutcome
{
    success,
    failure,
    skipped // idempotent no-ops
};

struct AuditEvent
{
    std::uint64_t sequence{0};
    std::chrono::system_clock::time_point timestamp{};
    std::string actor;
    AuditEventKind kind{AuditEventKind::vm_create};
    std::string target;
    AuditOutcome outcome{AuditOutcome::success};
    std::string detail;
    std::string correlation_id;
};

inline bool operator==(const AuditEvent& a, const AuditEvent& b)
{
    return a.sequence == b.sequence && a.timestamp == b.timestamp && a.actor == b.actor && a.kind == b.kind &&
           a.target == b.target && a.outcome == b.outcome && a.detail == b.detail &&
           a.correlation_id == b.correlation_id;
}

struct AuditQuery
{
    std::optional<std::chrono::system_clock::time_point> from; // inclusive
    std::optional<std::chrono::system_clock::time_point> to;   // inclusive
    std::set<AuditEventKind> kinds;                            // empty means any
    std::optional<std::string> target;
    std::optional<AuditOutcome> outcome;
    std::size_t limit{0}; // the most recent `limit` matches, 0 for all
};

std::string to_string(AuditEventKind kind); // dotted names, e.g. "vm.create"
std::string to_string(AuditOutcome outcome);
AuditEventKind audit_event_kind_from(const std::string& name);
AuditOutcome audit_outcome_from(const std::string& name);

// Stable field names: sequence, timestamp, actor, event, target, outcome, detail, correlation_id
void tag_invoke(const boost::json::value_from_tag&, boost::json::value& json, const AuditEvent& event);
AuditEvent tag_invoke(const boost::json::value_to_tag<AuditEvent>&, const boost::json::value& json);
} // namespace clonebox

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

#ifndef CLONEBOX_HEALTH_CHECKER_H
#define CLONEBOX_HEALTH_CHECKER_H

#include <clonebox/clone_spec.h>
#include <clonebox/deadline.h>

#include <chrono>
#include <string>
#include <vector>

namespace clonebox
{
class AuditLog;
class VirtualizationBackend;

enum class ProbeOutcome
{
    pass,
    fail,
    timeout
};

struct ProbeResult
{
    std::string name;
    ProbeType type{ProbeType::tcp};
    ProbeOutcome outcome{ProbeOutcome::fail};
    std::string detail;
};

struct HealthReport
{
    std::string instance;
    std::vector<ProbeResult> probes;

    bool healthy() const; // every probe passed
    std::string summary() const;
};

struct HealthSettings
{
    std::chrono::milliseconds boot_timeout{std::chrono::minutes{5}};
    std::chrono::milliseconds retry_interval{std::chrono::seconds{5}};
};

class HealthChecker
{
public:
    HealthChecker(VirtualizationBackend& backend, AuditLog& audit, HealthSettings settings);

    // Runs all probes concurrently, each bounded by its own timeout. No probes means the default ones.
    HealthReport check(const std::string& name, const std::vector<HealthCheckDeclaration>& probes,
                       bool quick = false) const;

    // Re-checks until healthy or until the boot timeout (or the deadline) passes, returning the last report
    HealthReport verify(const std::string& name, const std::vector<HealthCheckDeclaration>& probes,
                        const Deadline& deadline = {}) const;

    static std::vector<HealthCheckDeclaration> default_probes();

private:
    ProbeResult run_probe(const std::string& name, const std::string& address,
                          const HealthCheckDeclaration& probe) const;
    ProbeResult tcp_probe(const std::string& address, const HealthCheckDeclaration& probe) const;
    ProbeResult agent_ping_probe(const std::string& name, const HealthCheckDeclaration& probe) const;
    ProbeResult agent_exec_probe(const std::string& name, const HealthCheckDeclaration& probe) const;
    HealthReport run(const std::string& name, const std::vector<HealthCheckDeclaration>& probes, bool quick) const;

    VirtualizationBackend& backend;
    AuditLog& audit;
    const HealthSettings settings;
};

std::string to_string(ProbeOutcome outcome);
} // namespace clonebox
#endif // CLONEBOX_HEALTH_CHECKER_H

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
#include <clonebox/exceptions/health_check_timeout.h>
#include <clonebox/format.h>
#include <clonebox/health_checker.h>
#include <clonebox/logging/log.h>
#include <clonebox/utils.h>
#include <clonebox/virtualization_backend.h>

#include <QFuture>
#include <QFutureSynchronizer>
#include <QTcpSocket>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include <fmt/ranges.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbu = clonebox::utils;

namespace
{
constexpr auto category = "health";
constexpr auto ssh_port = "22";

std::pair<QString, quint16> tcp_endpoint(const std::string& address, const std::string& target)
{
    const auto colon = target.rfind(':');
    const auto host = colon == std::string::npos ? address : target.substr(0, colon);
    const auto port = colon == std::string::npos ? target : target.substr(colon + 1);

    bool ok = false;
    const auto number = QString::fromStdString(port).toUShort(&ok);
    if (!ok || !cbu::has_only_digits(port))
        throw std::invalid_argument{fmt::format("invalid tcp target \"{}\"", target)};

    return {QString::fromStdString(host), number};
}

cb::ProbeResult result_for(const cb::HealthCheckDeclaration& probe, cb::ProbeOutcome outcome, std::string detail = {})
{
    return {probe.name, probe.type, outcome, std::move(detail)};
}
} // namespace

bool cb::HealthReport::healthy() const
{
    return std::all_of(probes.cbegin(), probes.cend(),
                       [](const ProbeResult& result) { return result.outcome == ProbeOutcome::pass; });
}

std::string cb::HealthReport::summary() const
{
    std::vector<std::string> parts;
    for (const auto& result : probes)
        parts.push_back(fmt::format("{}: {}", result.name, to_string(result.outcome)));

    return fmt::format("{}", fmt::join(parts, ", "));
}

std::string cb::to_string(ProbeOutcome outcome)
{
    switch (outcome)
    {
    case ProbeOutcome::pass:
        return "pass";
    case ProbeOutcome::fail:
        return "fail";
    case ProbeOutcome::timeout:
        return "timeout";
    }

    return "unknown";
}

cb::HealthChecker::HealthChecker(VirtualizationBackend& backend, AuditLog& audit, HealthSettings settings)
    : backend{backend}, audit{audit}, settings{settings}
{
}

cb::HealthReport cb::HealthChecker::check(const std::string& name, const std::vector<HealthCheckDeclaration>& probes,
                                          bool quick) const
{
    auto report = run(name, probes, quick);
    audit.record(AuditEventKind::health_check, name,
                 report.healthy() ? AuditOutcome::success : AuditOutcome::failure, report.summary());

    return report;
}

cb::HealthReport cb::HealthChecker::verify(const std::string& name, const std::vector<HealthCheckDeclaration>& probes,
                                           const Deadline& deadline) const
{
    HealthReport report;
    cbu::try_action_until(
        [&name, this] { cbl::warn(name, "Not healthy after {}s", settings.boot_timeout.count() / 1000.0); },
        deadline.bound(settings.boot_timeout), settings.retry_interval, [&] {
            report = run(name, probes, false);
            cbl::debug(name, "Health: {}", report.summary());
            return report.healthy() ? cbu::TimeoutAction::done : cbu::TimeoutAction::retry;
        });

    audit.record(AuditEventKind::health_check, name,
                 report.healthy() ? AuditOutcome::success : AuditOutcome::failure, report.summary());

    return report;
}

std::vector<cb::HealthCheckDeclaration> cb::HealthChecker::default_probes()
{
    return {{"ssh", ProbeType::tcp, ssh_port, std::chrono::seconds{5}, 0},
            {"guest-agent", ProbeType::agent_ping, "", std::chrono::seconds{5}, 0}};
}

cb::HealthReport cb::HealthChecker::run(const std::string& name, const std::vector<HealthCheckDeclaration>& probes,
                                        bool quick) const
{
    auto selected = probes.empty() ? default_probes() : probes;
    if (quick)
    {
        selected.erase(std::remove_if(selected.begin(), selected.end(),
                                      [](const auto& probe) { return probe.type != ProbeType::tcp; }),
                       selected.end());
        if (selected.empty())
            selected.push_back(default_probes().front());
    }

    std::string address;
    if (auto status = backend.domain_status(name))
        address = status->address;

    // A pool of our own, so a busy global pool never delays a check past its timeout
    QThreadPool pool;
    pool.setMaxThreadCount(static_cast<int>(selected.size()));

    QFutureSynchronizer<ProbeResult> synchronizer;
    std::vector<QFuture<ProbeResult>> futures;
    for (const auto& probe : selected)
    {
        auto future = QtConcurrent::run(&pool, [this, &name, &address, &probe] {
            return run_probe(name, address, probe);
        });
        synchronizer.addFuture(future);
        futures.push_back(future);
    }

    synchronizer.waitForFinished(); // every check is bounded by its own timeout

    HealthReport report{name, {}};
    for (auto& future : futures)
        report.probes.push_back(future.result());

    return report;
}

cb::ProbeResult cb::HealthChecker::run_probe(const std::string& name, const std::string& address,
                                             const HealthCheckDeclaration& probe) const
{
    try
    {
        switch (probe.type)
        {
        case ProbeType::tcp:
            return tcp_probe(address, probe);
        case ProbeType::agent_ping:
            return agent_ping_probe(name, probe);
        case ProbeType::agent_exec:
            return agent_exec_probe(name, probe);
        }
    }
    catch (const HealthCheckTimeout& e)
    {
        return result_for(probe, ProbeOutcome::timeout, e.what());
    }
    catch (const std::exception& e)
    {
        cbl::debug(name, "Probe \"{}\" failed: {}", probe.name, e.what());
        return result_for(probe, ProbeOutcome::fail, e.what());
    }

    return result_for(probe, ProbeOutcome::fail, "unknown probe type");
}

cb::ProbeResult cb::HealthChecker::tcp_probe(const std::string& address, const HealthCheckDeclaration& probe) const
{
    const auto [host, port] = tcp_endpoint(address, probe.target);
    if (host.isEmpty())
        return result_for(probe, ProbeOutcome::fail, "the instance has no address yet");

    QTcpSocket socket;
    socket.connectToHost(host, port);
    if (socket.waitForConnected(static_cast<int>(probe.timeout.count())))
    {
        socket.disconnectFromHost();
        return result_for(probe, ProbeOutcome::pass);
    }

    auto outcome = socket.error() == QAbstractSocket::SocketTimeoutError ? ProbeOutcome::timeout : ProbeOutcome::fail;
    return result_for(probe, outcome, fmt::format("{}:{}: {}", host, port, socket.errorString()));
}

cb::ProbeResult cb::HealthChecker::agent_ping_probe(const std::string& name, const HealthCheckDeclaration& probe) const
{
    backend.guest_ping(name, probe.timeout);
    return result_for(probe, ProbeOutcome::pass);
}

cb::ProbeResult cb::HealthChecker::agent_exec_probe(const std::string& name, const HealthCheckDeclaration& probe) const
{
    auto result = backend.guest_exec(name, {"/bin/sh", "-c", probe.target}, probe.timeout);
    if (result.exit_status == probe.expected_exit_status)
        return result_for(probe, ProbeOutcome::pass);

    return result_for(probe, ProbeOutcome::fail,
                      fmt::format("exit status {}, expected {}", result.exit_status, probe.expected_exit_status));
}

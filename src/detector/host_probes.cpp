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

#include "detection_tables.h"

#include <clonebox/exceptions/detection_warning.h>
#include <clonebox/format.h>
#include <clonebox/host_probes.h>
#include <clonebox/logging/log.h>
#include <clonebox/utils.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include <set>

namespace cb = clonebox;
namespace cbd = clonebox::detection;
namespace cbl = clonebox::logging;

namespace
{
constexpr auto category = "detector";
constexpr auto tcp_listen_state = "0A";

std::string guest_mountpoint_for(const QString& host_path, const cb::HostLayout& layout)
{
    if (!layout.home.isEmpty() && cb::utils::is_strict_ancestor(layout.home, host_path))
        return QDir{layout.guest_home}.filePath(QDir{layout.home}.relativeFilePath(host_path)).toStdString();

    return QDir::cleanPath(host_path).toStdString();
}

cb::DetectedItem path_item(const QString& host_path, const std::string& marker, double confidence,
                           const cb::HostLayout& layout, cb::Evidence::Source source)
{
    return {cb::DetectedItem::Kind::path, QDir::cleanPath(host_path).toStdString(), {source, marker}, confidence,
            guest_mountpoint_for(host_path, layout)};
}

std::optional<std::string> marker_in(const QDir& dir)
{
    for (const auto& marker : cbd::project_markers())
        if (dir.exists(QString::fromStdString(marker)))
            return marker;

    return std::nullopt;
}

// Local ports in LISTEN state from one /proc/net/tcp-formatted table
std::set<int> listening_ports_in(const QString& table_path)
{
    QFile table{table_path};
    if (!table.open(QIODevice::ReadOnly | QIODevice::Text))
        throw cb::DetectionWarning{"cannot read {}: {}", table_path, table.errorString()};

    std::set<int> ports;
    QTextStream stream{&table};
    stream.readLine(); // header

    for (auto line = stream.readLine(); !line.isNull(); line = stream.readLine())
    {
        const auto fields = line.simplified().split(' ');
        if (fields.size() < 4 || fields[3] != tcp_listen_state)
            continue;

        const auto local_address = fields[1];
        bool ok{false};
        const auto port = local_address.section(':', -1).toInt(&ok, 16);
        if (ok)
            ports.insert(port);
    }

    return ports;
}
} // namespace

std::vector<std::string> cb::running_process_names(const QString& proc_root)
{
    QDir proc{proc_root};
    if (!proc.exists())
        throw DetectionWarning{"process table {} is not available", proc_root};

    std::set<std::string> names;
    for (const auto& entry : proc.entryList(QDir::Dirs | QDir::NoDotAndDotDot))
    {
        if (!utils::has_only_digits(entry.toStdString()))
            continue;

        QFile comm{proc.filePath(entry + "/comm")};
        if (!comm.open(QIODevice::ReadOnly | QIODevice::Text))
            continue; // the process went away, or belongs to someone else

        auto name = QString::fromUtf8(comm.readAll()).trimmed().toStdString();
        if (!name.empty())
            names.insert(std::move(name));
    }

    return {names.begin(), names.end()};
}

cb::ProcessProbe::ProcessProbe(const HostLayout& layout) : proc_root{layout.proc_root}
{
}

std::string cb::ProcessProbe::name() const
{
    return "processes";
}

std::vector<cb::DetectedItem> cb::ProcessProbe::run() const
{
    std::vector<DetectedItem> items;
    for (const auto& process : running_process_names(proc_root))
    {
        if (cbd::interesting_processes().count(process))
            items.push_back({DetectedItem::Kind::application, process, {Evidence::Source::process, process}, 0.6});
    }

    return items;
}

cb::ListeningSocketProbe::ListeningSocketProbe(const HostLayout& layout) : proc_root{layout.proc_root}
{
}

std::string cb::ListeningSocketProbe::name() const
{
    return "listening sockets";
}

std::vector<cb::DetectedItem> cb::ListeningSocketProbe::run() const
{
    std::set<int> ports;
    std::vector<std::string> failures;
    for (const auto* table : {"net/tcp", "net/tcp6"})
    {
        try
        {
            const auto found = listening_ports_in(QDir{proc_root}.filePath(table));
            ports.insert(found.begin(), found.end());
        }
        catch (const DetectionWarning& e)
        {
            failures.emplace_back(e.what());
        }
    }

    if (failures.size() == 2)
        throw DetectionWarning{"no socket table could be read: {}", fmt::join(failures, "; ")};

    std::vector<DetectedItem> items;
    for (const auto port : ports)
    {
        if (auto service = cbd::service_for_port(port))
            items.push_back(
                {DetectedItem::Kind::service, *service, {Evidence::Source::socket, fmt::format("tcp:{}", port)}, 0.7});
    }

    return items;
}

cb::ServiceMarkerProbe::ServiceMarkerProbe(const HostLayout& layout) : wants_directories{layout.unit_wants_directories}
{
}

std::string cb::ServiceMarkerProbe::name() const
{
    return "systemd units";
}

std::vector<cb::DetectedItem> cb::ServiceMarkerProbe::run() const
{
    std::vector<DetectedItem> items;
    for (const auto& wants : wants_directories)
    {
        QDir dir{wants};
        if (!dir.exists())
            continue;

        for (const auto& unit : dir.entryList({"*.service"}, QDir::Files | QDir::System | QDir::NoDotAndDotDot))
        {
            auto service = unit.chopped(QString{".service"}.size()).section('@', 0, 0).toStdString();
            if (cbd::vm_excluded_services().count(service))
            {
                cbl::trace(category, "Ignoring host-only service {}", service);
                continue;
            }

            if (cbd::interesting_services().count(service))
                items.push_back({DetectedItem::Kind::service, service,
                                 {Evidence::Source::unit_file, dir.filePath(unit).toStdString()}, 0.9});
        }
    }

    return items;
}

cb::ProjectDirectoryProbe::ProjectDirectoryProbe(const HostLayout& layout) : layout{layout}
{
}

std::string cb::ProjectDirectoryProbe::name() const
{
    return "project directories";
}

std::vector<cb::DetectedItem> cb::ProjectDirectoryProbe::run() const
{
    std::vector<DetectedItem> items;

    QDir cwd{layout.working_directory};
    const auto cwd_path = QDir::cleanPath(cwd.absolutePath());
    if (!layout.working_directory.isEmpty() && cwd.exists() && cwd_path != "/" &&
        cwd_path != QDir::cleanPath(layout.home))
    {
        items.push_back(path_item(cwd_path, marker_in(cwd).value_or("working directory"), 1.0, layout,
                                  Evidence::Source::directory_marker));

        for (const auto& child : cwd.entryList(QDir::Dirs | QDir::NoDotAndDotDot))
        {
            QDir child_dir{cwd.filePath(child)};
            if (auto marker = marker_in(child_dir))
                items.push_back(path_item(child_dir.absolutePath(), *marker, 0.9, layout,
                                          Evidence::Source::directory_marker));
        }
    }

    if (!layout.home.isEmpty())
    {
        QDir home{layout.home};
        for (const auto& dev_dir : cbd::home_development_dirs())
        {
            const auto path = home.filePath(QString::fromStdString(dev_dir));
            if (QFileInfo{path}.isDir())
                items.push_back(path_item(path, "home development directory", 0.6, layout,
                                          Evidence::Source::directory_marker));
        }
    }

    return items;
}

cb::AppDataProbe::AppDataProbe(const HostLayout& layout) : layout{layout}
{
}

std::string cb::AppDataProbe::name() const
{
    return "application data";
}

std::vector<cb::DetectedItem> cb::AppDataProbe::run() const
{
    if (layout.home.isEmpty())
        return {};

    std::vector<DetectedItem> items;
    QDir home{layout.home};
    for (const auto& process : running_process_names(layout.proc_root))
    {
        const auto it = cbd::app_data_dirs().find(process);
        if (it == cbd::app_data_dirs().end())
            continue;

        for (const auto& relative : it->second)
        {
            const auto path = home.filePath(QString::fromStdString(relative));
            if (QFileInfo{path}.isDir())
                items.push_back(path_item(path, process, 0.5, layout, Evidence::Source::app_data));
        }
    }

    return items;
}

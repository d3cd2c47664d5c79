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

#ifndef CLONEBOX_HOST_PROBES_H
#define CLONEBOX_HOST_PROBES_H

#include <clonebox/host_layout.h>
#include <clonebox/host_probe.h>

namespace clonebox
{
// Running processes with interesting names, reported as applications
class ProcessProbe : public HostProbe
{
public:
    explicit ProcessProbe(const HostLayout& layout);
    std::string name() const override;
    std::vector<DetectedItem> run() const override;

private:
    const QString proc_root;
};

// Listening TCP sockets on well-known ports, reported as services
class ListeningSocketProbe : public HostProbe
{
public:
    explicit ListeningSocketProbe(const HostLayout& layout);
    std::string name() const override;
    std::vector<DetectedItem> run() const override;

private:
    const QString proc_root;
};

// Enabled systemd units, reported as services unless they only make sense on the host
class ServiceMarkerProbe : public HostProbe
{
public:
    explicit ServiceMarkerProbe(const HostLayout& layout);
    std::string name() const override;
    std::vector<DetectedItem> run() const override;

private:
    const QStringList wants_directories;
};

// The working directory, its project children and the usual development directories under home
class ProjectDirectoryProbe : public HostProbe
{
public:
    explicit ProjectDirectoryProbe(const HostLayout& layout);
    std::string name() const override;
    std::vector<DetectedItem> run() const override;

private:
    const HostLayout layout;
};

// Configuration and data directories of running applications
class AppDataProbe : public HostProbe
{
public:
    explicit AppDataProbe(const HostLayout& layout);
    std::string name() const override;
    std::vector<DetectedItem> run() const override;

private:
    const HostLayout layout;
};

// Names found in <proc_root>/<pid>/comm, deduplicated and sorted. Throws DetectionWarning if proc_root is unreadable.
std::vector<std::string> running_process_names(const QString& proc_root);
} // namespace clonebox
#endif // CLONEBOX_HOST_PROBES_H

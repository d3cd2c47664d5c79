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

#ifndef CLONEBOX_SNAPSHOT_MANAGER_H
#define CLONEBOX_SNAPSHOT_MANAGER_H

#include <clonebox/deadline.h>
#include <clonebox/disabled_copy_move.h>
#include <clonebox/path.h>

#include <QDateTime>

#include <boost/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace clonebox
{
class AuditLog;
class LifecycleOrchestrator;
class VirtualizationBackend;

struct SnapshotRecord
{
    std::string name;
    std::string instance;
    QDateTime created_at;
    std::string handle; // the backend's reference to the snapshot
    std::string description;
    std::vector<std::string> tags;
    QDateTime expires_at; // invalid when the snapshot never expires

    bool expired(const QDateTime& now = QDateTime::currentDateTimeUtc()) const;
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& json, const SnapshotRecord& snapshot);
SnapshotRecord tag_invoke(const boost::json::value_to_tag<SnapshotRecord>&, const boost::json::value& json);

struct SnapshotOptions
{
    std::string description;
    std::vector<std::string> tags;
    std::optional<std::chrono::hours> expires_in;
};

/**
 * Named point-in-time states of instances.
 *
 * Metadata lives under `<data>/snapshots/<scope>/<instance>/<snapshot>.json`, outside the instance's backing store,
 * so it survives independently of the backend's own snapshot bookkeeping.
 */
class SnapshotManager : private DisabledCopyMove
{
public:
    SnapshotManager(VirtualizationBackend& backend, LifecycleOrchestrator& lifecycle, AuditLog& audit,
                    const Path& data_directory);

    SnapshotRecord create(const std::string& instance, const std::string& snapshot_name,
                          const SnapshotOptions& options = {}, const Deadline& deadline = {});
    void restore(const std::string& instance, const std::string& snapshot_name, const Deadline& deadline = {});
    std::vector<SnapshotRecord> list(const std::string& instance) const; // oldest first
    void remove(const std::string& instance, const std::string& snapshot_name, const Deadline& deadline = {});
    std::vector<std::string> cleanup_expired(const std::string& instance, const Deadline& deadline = {});

    // Drops all metadata of an instance that no longer exists
    void purge(const std::string& instance);

private:
    Path instance_directory(const std::string& instance) const;
    Path metadata_path(const std::string& instance, const std::string& snapshot_name) const;
    std::optional<SnapshotRecord> find(const std::string& instance, const std::string& snapshot_name) const;

    VirtualizationBackend& backend;
    LifecycleOrchestrator& lifecycle;
    AuditLog& audit;
    const Path root;
};
} // namespace clonebox
#endif // CLONEBOX_SNAPSHOT_MANAGER_H

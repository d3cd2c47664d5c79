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
#include <clonebox/exceptions/lifecycle_exceptions.h>
#include <clonebox/exceptions/snapshot_exceptions.h>
#include <clonebox/exceptions/validation_error.h>
#include <clonebox/format.h>
#include <clonebox/lifecycle_orchestrator.h>
#include <clonebox/logging/log.h>
#include <clonebox/snapshot_manager.h>
#include <clonebox/top_catch_all.h>
#include <clonebox/utils.h>
#include <clonebox/virtualization_backend.h>

#include <QDir>
#include <QFile>

#include <scope_guard.hpp>

#include <algorithm>
#include <tuple>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbu = clonebox::utils;

namespace
{
constexpr auto category = "snapshot";

std::string format_date(const QDateTime& date_time)
{
    return date_time.isValid() ? date_time.toUTC().toString(Qt::ISODateWithMs).toStdString() : std::string{};
}

QDateTime parse_date(const std::string& text)
{
    return text.empty() ? QDateTime{} : QDateTime::fromString(QString::fromStdString(text), Qt::ISODateWithMs);
}

void require_snapshottable(const cb::VMRecord& record)
{
    switch (record.state)
    {
    case cb::VMState::absent:
        throw cb::InstanceNotFound{record.name};
    case cb::VMState::provisioning:
    case cb::VMState::failed:
        throw cb::VMStateInvalidException{"Cannot snapshot \"{}\" while it is {}", record.name,
                                          cb::to_string(record.state)};
    case cb::VMState::running:
    case cb::VMState::stopped:
        break;
    }
}
} // namespace

bool cb::SnapshotRecord::expired(const QDateTime& now) const
{
    return expires_at.isValid() && expires_at <= now;
}

void cb::tag_invoke(const boost::json::value_from_tag&, boost::json::value& json, const SnapshotRecord& snapshot)
{
    json = {{"name", snapshot.name},
            {"instance", snapshot.instance},
            {"created_at", format_date(snapshot.created_at)},
            {"handle", snapshot.handle},
            {"description", snapshot.description},
            {"tags", boost::json::value_from(snapshot.tags)},
            {"expires_at", format_date(snapshot.expires_at)}};
}

cb::SnapshotRecord cb::tag_invoke(const boost::json::value_to_tag<SnapshotRecord>&, const boost::json::value& json)
{
    const auto& obj = json.as_object();
    SnapshotRecord snapshot{value_to<std::string>(obj.at("name")),
                            value_to<std::string>(obj.at("instance")),
                            parse_date(value_to<std::string>(obj.at("created_at"))),
                            value_to<std::string>(obj.at("handle")),
                            value_to<std::string>(obj.at("description")),
                            {},
                            {}};

    if (auto it = obj.find("tags"); it != obj.end())
        snapshot.tags = value_to<std::vector<std::string>>(it->value());
    if (auto it = obj.find("expires_at"); it != obj.end())
        snapshot.expires_at = parse_date(value_to<std::string>(it->value()));

    return snapshot;
}

cb::SnapshotManager::SnapshotManager(VirtualizationBackend& backend, LifecycleOrchestrator& lifecycle,
                                     AuditLog& audit, const Path& data_directory)
    : backend{backend},
      lifecycle{lifecycle},
      audit{audit},
      root{QDir{data_directory}.filePath(QString{"snapshots/%1"}.arg(QString::fromStdString(
          to_string(lifecycle.scope()))))}
{
}

cb::SnapshotRecord cb::SnapshotManager::create(const std::string& instance, const std::string& snapshot_name,
                                               const SnapshotOptions& options, const Deadline& deadline)
{
    return audited(audit, AuditEventKind::snapshot_create, fmt::format("{}.{}", instance, snapshot_name), [&] {
        if (!cbu::valid_hostname(snapshot_name))
            throw ValidationError{"Invalid snapshot name \"{}\": use letters, digits and dashes", snapshot_name};

        auto lock = lifecycle.lock(instance, deadline);
        require_snapshottable(lifecycle.status(instance));
        if (find(instance, snapshot_name))
            throw SnapshotNameTakenException{instance, snapshot_name};

        deadline.check(instance, "take a snapshot");
        SnapshotRecord snapshot{snapshot_name,
                                instance,
                                QDateTime::currentDateTimeUtc(),
                                backend.create_snapshot(instance, snapshot_name, options.description),
                                options.description,
                                options.tags,
                                {}};
        if (options.expires_in)
            snapshot.expires_at = snapshot.created_at.addSecs(
                std::chrono::duration_cast<std::chrono::seconds>(*options.expires_in).count());

        auto drop_snapshot = sg::make_scope_guard([this, &instance, &snapshot]() noexcept {
            top_catch_all(category, [this, &instance, &snapshot] {
                backend.delete_snapshot(instance, snapshot.handle);
            });
        });

        cbu::make_dir(QDir{root}, QString::fromStdString(instance));
        cbu::write_file(metadata_path(instance, snapshot_name),
                        boost::json::serialize(boost::json::value_from(snapshot)));

        drop_snapshot.dismiss();
        cbl::info(instance, "Took snapshot {}", snapshot_name);
        return snapshot;
    });
}

void cb::SnapshotManager::restore(const std::string& instance, const std::string& snapshot_name,
                                  const Deadline& deadline)
{
    audited(audit, AuditEventKind::snapshot_restore, fmt::format("{}.{}", instance, snapshot_name), [&] {
        auto lock = lifecycle.lock(instance, deadline);
        auto record = lifecycle.status(instance);
        require_snapshottable(record);

        auto snapshot = find(instance, snapshot_name);
        if (!snapshot)
            throw NoSuchSnapshotException{instance, snapshot_name};

        if (record.state == VMState::running)
        {
            cbl::info(instance, "Stopping before restoring snapshot {}", snapshot_name);
            lifecycle.stop(instance, false, deadline);
        }

        deadline.check(instance, "restore a snapshot");
        backend.restore_snapshot(instance, snapshot->handle);
        lifecycle.status(instance);
        cbl::info(instance, "Restored snapshot {}", snapshot_name);
    });
}

std::vector<cb::SnapshotRecord> cb::SnapshotManager::list(const std::string& instance) const
{
    std::vector<SnapshotRecord> snapshots;
    for (const auto& entry : QDir{instance_directory(instance)}.entryInfoList({"*.json"}, QDir::Files))
    {
        try
        {
            snapshots.push_back(boost::json::value_to<SnapshotRecord>(
                boost::json::parse(cbu::contents_of(entry.absoluteFilePath()))));
        }
        catch (const std::exception& e)
        {
            cbl::warn(category, "Ignoring unreadable snapshot metadata {}: {}", entry.absoluteFilePath(), e.what());
        }
    }

    std::sort(snapshots.begin(), snapshots.end(), [](const auto& a, const auto& b) {
        return std::tie(a.created_at, a.name) < std::tie(b.created_at, b.name);
    });
    return snapshots;
}

void cb::SnapshotManager::remove(const std::string& instance, const std::string& snapshot_name,
                                 const Deadline& deadline)
{
    const auto target = fmt::format("{}.{}", instance, snapshot_name);

    auto lock = lifecycle.lock(instance, deadline);
    auto snapshot = find(instance, snapshot_name);
    if (!snapshot)
    {
        audit.record(AuditEventKind::snapshot_delete, target, AuditOutcome::skipped);
        return;
    }

    audited(audit, AuditEventKind::snapshot_delete, target, [&] {
        deadline.check(instance, "delete a snapshot");
        if (lifecycle.status(instance).state != VMState::absent)
        {
            try
            {
                backend.delete_snapshot(instance, snapshot->handle);
            }
            catch (const NoSuchSnapshotException&)
            {
                cbl::warn(instance, "Snapshot {} was already gone from {}", snapshot_name, backend.uri());
            }
        }

        QFile::remove(metadata_path(instance, snapshot_name));
        cbl::info(instance, "Deleted snapshot {}", snapshot_name);
    });
}

std::vector<std::string> cb::SnapshotManager::cleanup_expired(const std::string& instance, const Deadline& deadline)
{
    std::vector<std::string> deleted;
    const auto now = QDateTime::currentDateTimeUtc();
    for (const auto& snapshot : list(instance))
    {
        if (!snapshot.expired(now))
            continue;

        try
        {
            remove(instance, snapshot.name, deadline);
            deleted.push_back(snapshot.name);
        }
        catch (const OperationCancelled&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            cbl::warn(instance, "Could not delete expired snapshot {}: {}", snapshot.name, e.what());
        }
    }

    return deleted;
}

void cb::SnapshotManager::purge(const std::string& instance)
{
    QDir dir{instance_directory(instance)};
    if (dir.exists() && !dir.removeRecursively())
        cbl::warn(category, "Could not remove the snapshot metadata of \"{}\"", instance);
}

cb::Path cb::SnapshotManager::instance_directory(const std::string& instance) const
{
    return QDir{root}.filePath(QString::fromStdString(instance));
}

cb::Path cb::SnapshotManager::metadata_path(const std::string& instance, const std::string& snapshot_name) const
{
    return QDir{instance_directory(instance)}.filePath(QString::fromStdString(snapshot_name + ".json"));
}

std::optional<cb::SnapshotRecord> cb::SnapshotManager::find(const std::string& instance,
                                                            const std::string& snapshot_name) const
{
    QFile file{metadata_path(instance, snapshot_name)};
    if (!file.exists())
        return std::nullopt;

    return boost::json::value_to<SnapshotRecord>(boost::json::parse(cbu::contents_of(file.fileName())));
}

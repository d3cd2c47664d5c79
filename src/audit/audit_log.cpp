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
#include <clonebox/exceptions/validation_error.h>
#include <clonebox/format.h>
#include <clonebox/logging/log.h>
#include <clonebox/top_catch_all.h>
#include <clonebox/utils.h>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHostInfo>
#include <QTimeZone>

#include <algorithm>
#include <limits>
#include <ostream>
#include <unordered_map>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbu = clonebox::utils;

namespace
{
constexpr auto category = "audit";

const std::unordered_map<cb::AuditEventKind, std::string> kind_names{
    {cb::AuditEventKind::vm_create, "vm.create"},
    {cb::AuditEventKind::vm_start, "vm.start"},
    {cb::AuditEventKind::vm_stop, "vm.stop"},
    {cb::AuditEventKind::vm_restart, "vm.restart"},
    {cb::AuditEventKind::vm_delete, "vm.delete"},
    {cb::AuditEventKind::snapshot_create, "snapshot.create"},
    {cb::AuditEventKind::snapshot_restore, "snapshot.restore"},
    {cb::AuditEventKind::snapshot_delete, "snapshot.delete"},
    {cb::AuditEventKind::compose_up, "compose.up"},
    {cb::AuditEventKind::compose_down, "compose.down"},
    {cb::AuditEventKind::health_check, "health.check"},
    {cb::AuditEventKind::credentials_generated, "auth.credentials_generated"},
    {cb::AuditEventKind::spec_saved, "spec.saved"}};

std::string format_timestamp(std::chrono::system_clock::time_point timestamp)
{
    const auto msecs =
        std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
    return QDateTime::fromMSecsSinceEpoch(msecs, QTimeZone::utc()).toString(Qt::ISODateWithMs).toStdString();
}

std::chrono::system_clock::time_point parse_timestamp(const std::string& text)
{
    const auto date_time = QDateTime::fromString(QString::fromStdString(text), Qt::ISODateWithMs);
    if (!date_time.isValid())
        throw cb::ValidationError{"Invalid audit timestamp: {}", text};

    return std::chrono::system_clock::time_point{std::chrono::milliseconds{date_time.toMSecsSinceEpoch()}};
}

bool matches(const cb::AuditEvent& event, const cb::AuditQuery& filters)
{
    return (filters.kinds.empty() || filters.kinds.count(event.kind)) &&
           (!filters.target || *filters.target == event.target) &&
           (!filters.outcome || *filters.outcome == event.outcome);
}

bool contains_casefolded(const std::string& haystack, const std::string& folded_needle)
{
    return cbu::casefold(haystack).find(folded_needle) != std::string::npos;
}

std::vector<cb::AuditEvent> keep_last(std::vector<cb::AuditEvent> events, std::size_t limit)
{
    if (limit && events.size() > limit)
        events.erase(events.begin(), events.end() - static_cast<std::ptrdiff_t>(limit));

    return events;
}
} // namespace

std::string cb::to_string(AuditEventKind kind)
{
    return kind_names.at(kind);
}

std::string cb::to_string(AuditOutcome outcome)
{
    switch (outcome)
    {
    case AuditOutcome::success:
        return "success";
    case AuditOutcome::failure:
        return "failure";
    case AuditOutcome::skipped:
        return "skipped";
    }

    return "unknown";
}

cb::AuditEventKind cb::audit_event_kind_from(const std::string& name)
{
    auto it = std::find_if(kind_names.cbegin(), kind_names.cend(), [&name](const auto& p) { return p.second == name; });
    if (it == kind_names.cend())
        throw ValidationError{"Unknown audit event: {}", name};

    return it->first;
}

cb::AuditOutcome cb::audit_outcome_from(const std::string& name)
{
    for (auto outcome : {AuditOutcome::success, AuditOutcome::failure, AuditOutcome::skipped})
        if (to_string(outcome) == name)
            return outcome;

    throw ValidationError{"Unknown audit outcome: {}", name};
}

void cb::tag_invoke(const boost::json::value_from_tag&, boost::json::value& json, const AuditEvent& event)
{
    json = {{"sequence", event.sequence},
            {"timestamp", format_timestamp(event.timestamp)},
            {"actor", event.actor},
            {"event", to_string(event.kind)},
            {"target", event.target},
            {"outcome", to_string(event.outcome)},
            {"detail", event.detail},
            {"correlation_id", event.correlation_id}};
}

cb::AuditEvent cb::tag_invoke(const boost::json::value_to_tag<AuditEvent>&, const boost::json::value& json)
{
    const auto& obj = json.as_object();
    return {value_to<std::uint64_t>(obj.at("sequence")),
            parse_timestamp(value_to<std::string>(obj.at("timestamp"))),
            value_to<std::string>(obj.at("actor")),
            audit_event_kind_from(value_to<std::string>(obj.at("event"))),
            value_to<std::string>(obj.at("target")),
            audit_outcome_from(value_to<std::string>(obj.at("outcome"))),
            value_to<std::string>(obj.at("detail")),
            value_to<std::string>(obj.at("correlation_id"))};
}

cb::AuditLog::AuditLog(const Path& log_file, std::string actor) : log_file{log_file}, actor{std::move(actor)}
{
    if (!log_file.isEmpty())
    {
        QDir().mkpath(QFileInfo{log_file}.absolutePath());
        load_existing();
    }

    writer = std::make_unique<AutoJoinThread>([this] { write_pending(); });
}

cb::AuditLog::~AuditLog()
{
    {
        std::lock_guard lock{queue_mutex};
        stopping = true;
    }
    queue_cv.notify_all();
    writer.reset();
}

void cb::AuditLog::record(AuditEventKind kind, const std::string& target, AuditOutcome outcome,
                          const std::string& detail, const std::string& correlation_id) noexcept
{
    top_catch_all(category, [&] {
        AuditEvent event{next_sequence.fetch_add(1),
                         std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now()),
                         actor,
                         kind,
                         target,
                         outcome,
                         detail,
                         correlation_id};

        {
            std::unique_lock lock{index_mutex};
            index.emplace(IndexKey{event.timestamp, event.sequence}, event);
        }

        {
            std::lock_guard lock{queue_mutex};
            pending.push_back(std::move(event));
        }
        queue_cv.notify_one();
    });
}

std::vector<cb::AuditEvent> cb::AuditLog::query(const AuditQuery& filters) const
{
    std::shared_lock lock{index_mutex};

    auto first = filters.from ? index.lower_bound({*filters.from, 0}) : index.cbegin();
    auto last = filters.to ? index.upper_bound({*filters.to, std::numeric_limits<std::uint64_t>::max()}) : index.cend();

    std::vector<AuditEvent> events;
    for (auto it = first; it != last && it != index.cend(); ++it)
        if (matches(it->second, filters))
            events.push_back(it->second);

    return keep_last(std::move(events), filters.limit);
}

std::vector<cb::AuditEvent> cb::AuditLog::search(const std::string& text, std::size_t limit) const
{
    const auto needle = cbu::casefold(text);

    std::shared_lock lock{index_mutex};
    std::vector<AuditEvent> events;
    for (const auto& [key, event] : index)
    {
        if (contains_casefolded(event.target, needle) || contains_casefolded(event.detail, needle) ||
            contains_casefolded(event.actor, needle) || contains_casefolded(to_string(event.kind), needle) ||
            contains_casefolded(event.correlation_id, needle))
            events.push_back(event);
    }

    return keep_last(std::move(events), limit);
}

void cb::AuditLog::export_events(const AuditQuery& filters, std::ostream& out) const
{
    for (const auto& event : query(filters))
        out << boost::json::serialize(boost::json::value_from(event)) << '\n';
}

void cb::AuditLog::flush()
{
    std::unique_lock lock{queue_mutex};
    drained_cv.wait(lock, [this] { return pending.empty() && !writing; });
}

std::string cb::AuditLog::default_actor()
{
    auto user = qEnvironmentVariable("USER", "unknown");
    return fmt::format("{}@{}", user, QHostInfo::localHostName());
}

void cb::AuditLog::load_existing()
{
    QFile file{log_file};
    if (!file.exists())
        return;

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        cbl::warn(category, "Could not read audit log {}: {}", log_file, file.errorString());
        return;
    }

    std::uint64_t max_sequence = 0;
    int line_number = 0;
    while (!file.atEnd())
    {
        ++line_number;
        const auto line = file.readLine().trimmed().toStdString();
        if (line.empty())
            continue;

        try
        {
            auto event = boost::json::value_to<AuditEvent>(boost::json::parse(line));
            max_sequence = std::max(max_sequence, event.sequence);
            index.emplace(IndexKey{event.timestamp, event.sequence}, std::move(event));
        }
        catch (const std::exception& e)
        {
            cbl::warn(category, "Skipping malformed audit record at {}:{}: {}", log_file, line_number, e.what());
        }
    }

    next_sequence = max_sequence + 1;
}

void cb::AuditLog::write_pending()
{
    std::unique_lock lock{queue_mutex};
    while (true)
    {
        queue_cv.wait(lock, [this] { return stopping || !pending.empty(); });
        if (pending.empty())
            break; // stopping, nothing left

        auto batch = std::move(pending);
        pending.clear();
        writing = true;
        lock.unlock();

        top_catch_all(category, [this, &batch] {
            if (log_file.isEmpty())
                return;

            QFile file{log_file};
            if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
            {
                cbl::warn(category, "Could not append {} audit records to {}: {}", batch.size(), log_file,
                          file.errorString());
                return;
            }

            for (const auto& event : batch)
            {
                const auto line = boost::json::serialize(boost::json::value_from(event)) + '\n';
                if (file.write(line.data(), static_cast<qint64>(line.size())) != static_cast<qint64>(line.size()))
                    cbl::warn(category, "Failed to write audit record {}: {}", event.sequence, file.errorString());
            }
        });

        lock.lock();
        writing = false;
        drained_cv.notify_all();
    }
    drained_cv.notify_all();
}

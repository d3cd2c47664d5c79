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

#ifndef CLONEBOX_AUDIT_LOG_H
#define CLONEBOX_AUDIT_LOG_H

#include <clonebox/audit_event.h>
#include <clonebox/auto_join_thread.h>
#include <clonebox/disabled_copy_move.h>
#include <clonebox/path.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace clonebox
{
/**
 * Append-only trail of lifecycle-affecting operations.
 *
 * Records are numbered from an atomic counter, indexed in memory by timestamp and appended to a JSON-lines file by a
 * background writer. Recording never throws and never waits for disk; write failures are logged as warnings.
 */
class AuditLog : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<AuditLog>;

    AuditLog(const Path& log_file, std::string actor);
    ~AuditLog();

    void record(AuditEventKind kind, const std::string& target, AuditOutcome outcome, const std::string& detail = {},
                const std::string& correlation_id = {}) noexcept;

    std::vector<AuditEvent> query(const AuditQuery& filters) const;
    std::vector<AuditEvent> search(const std::string& text, std::size_t limit = 0) const;
    void export_events(const AuditQuery& filters, std::ostream& out) const; // one JSON record per line

    // Blocks until every recorded event reached the file (or failed to)
    void flush();

    static std::string default_actor();

private:
    using Clock = std::chrono::system_clock;
    using IndexKey = std::pair<Clock::time_point, std::uint64_t>;

    void load_existing();
    void write_pending();

    const Path log_file;
    const std::string actor;
    std::atomic<std::uint64_t> next_sequence{1};

    mutable std::shared_mutex index_mutex;
    std::map<IndexKey, AuditEvent> index;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::condition_variable drained_cv;
    std::deque<AuditEvent> pending;
    bool writing{false};
    bool stopping{false};
    std::unique_ptr<AutoJoinThread> writer; // last, so it stops before the state it uses goes away
};

/**
 * Run an operation and record its outcome.
 *
 * Failures are recorded with the exception message and rethrown.
 */
template <typename Fun>
auto audited(AuditLog& audit, AuditEventKind kind, const std::string& target, Fun&& fun)
    -> std::invoke_result_t<Fun>
{
    try
    {
        if constexpr (std::is_void_v<std::invoke_result_t<Fun>>)
        {
            std::forward<Fun>(fun)();
            audit.record(kind, target, AuditOutcome::success);
        }
        else
        {
            auto result = std::forward<Fun>(fun)();
            audit.record(kind, target, AuditOutcome::success);
            return result;
        }
    }
    catch (const std::exception& e)
    {
        audit.record(kind, target, AuditOutcome::failure, e.what());
        throw;
    }
}
} // namespace clonebox
#endif // CLONEBOX_AUDIT_LOG_H

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

#ifndef CLONEBOX_DEADLINE_H
#define CLONEBOX_DEADLINE_H

#include <clonebox/exceptions/lifecycle_exceptions.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>

namespace clonebox
{
// A point in time after which an operation gives up. Default-constructed deadlines never expire.
class Deadline
{
public:
    using Clock = std::chrono::steady_clock;

    Deadline() = default;
    explicit Deadline(Clock::time_point expiry) : expiry{expiry}
    {
    }

    static Deadline after(Clock::duration duration)
    {
        return Deadline{Clock::now() + duration};
    }

    bool expired() const
    {
        return expiry && Clock::now() >= *expiry;
    }

    // The time left, capped at `cap`
    std::chrono::milliseconds remaining(std::chrono::milliseconds cap) const
    {
        if (!expiry)
            return cap;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*expiry - Clock::now());
        return std::clamp(left, std::chrono::milliseconds::zero(), cap);
    }

    // The earlier of the deadline and now + `timeout`
    Clock::time_point bound(std::chrono::milliseconds timeout) const
    {
        auto local = Clock::now() + timeout;
        return expiry ? std::min(*expiry, local) : local;
    }

    void check(const std::string& name, const std::string& step) const
    {
        if (expired())
            throw OperationCancelled{name, step};
    }

private:
    std::optional<Clock::time_point> expiry;
};
} // namespace clonebox
#endif // CLONEBOX_DEADLINE_H

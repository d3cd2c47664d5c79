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

#ifndef CLONEBOX_VALIDATION_ERROR_H
#define CLONEBOX_VALIDATION_ERROR_H

#include <clonebox/exceptions/formatted_exception_base.h>

#include <fmt/ranges.h>

#include <string>
#include <vector>

namespace clonebox
{
// Raised before any backend mutation: bad paths, exceeded caps, malformed specs, cyclic compose groups
class ValidationError : public FormattedExceptionBase<>
{
public:
    using FormattedExceptionBase<>::FormattedExceptionBase;
};

class CycleError : public ValidationError
{
public:
    explicit CycleError(const std::vector<std::string>& members)
        : ValidationError{"Circular dependency between compose members: {}", fmt::join(members, " -> ")},
          cycle_members{members}
    {
    }

    const std::vector<std::string>& members() const
    {
        return cycle_members;
    }

private:
    std::vector<std::string> cycle_members;
};
} // namespace clonebox
#endif // CLONEBOX_VALIDATION_ERROR_H

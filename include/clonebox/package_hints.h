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

#ifndef CLONEBOX_PACKAGE_HINTS_H
#define CLONEBOX_PACKAGE_HINTS_H

#include <optional>
#include <string>

namespace clonebox
{
struct PackageHint
{
    enum class Source
    {
        apt,
        snap
    };

    std::string package;
    Source source;
};

// Which guest package provides a detected application or service, if we know
std::optional<PackageHint> package_for(const std::string& application_or_service);
} // namespace clonebox
#endif // CLONEBOX_PACKAGE_HINTS_H

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

#ifndef CLONEBOX_DETECTED_ITEM_H
#define CLONEBOX_DETECTED_ITEM_H

#include <optional>
#include <string>
#include <tuple>

namespace clonebox
{
struct Evidence
{
    enum class Source
    {
        process,
        socket,
        unit_file,
        directory_marker,
        app_data
    };

    Source source;
    std::string detail; // e.g. the process name, "tcp:5432", the unit file or the marker found

    friend bool operator==(const Evidence& a, const Evidence& b)
    {
        return std::tie(a.source, a.detail) == std::tie(b.source, b.detail);
    }
};

struct DetectedItem
{
    enum class Kind
    {
        service,
        application,
        path
    };

    Kind kind;
    std::string name; // unit name, application name, or absolute host path
    Evidence evidence;
    double confidence{0.5};
    std::optional<std::string> guest_mountpoint{}; // suggested, for paths only

    friend bool operator==(const DetectedItem& a, const DetectedItem& b)
    {
        return std::tie(a.kind, a.name, a.evidence, a.confidence, a.guest_mountpoint) ==
               std::tie(b.kind, b.name, b.evidence, b.confidence, b.guest_mountpoint);
    }

    friend bool operator<(const DetectedItem& a, const DetectedItem& b)
    {
        return std::tie(a.kind, a.name, a.evidence.source, a.evidence.detail) <
               std::tie(b.kind, b.name, b.evidence.source, b.evidence.detail);
    }
};

std::string to_string(DetectedItem::Kind kind);
std::string to_string(Evidence::Source source);
} // namespace clonebox
#endif // CLONEBOX_DETECTED_ITEM_H

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

#include <clonebox/detector.h>
#include <clonebox/host_probes.h>
#include <clonebox/logging/log.h>

#include <QDir>

#include <algorithm>

namespace cb = clonebox;
namespace cbl = clonebox::logging;

namespace
{
constexpr auto category = "detector";
} // namespace

cb::Detector::Detector(std::vector<HostProbe::UPtr> probes) : probes{std::move(probes)}
{
}

std::vector<cb::DetectedItem> cb::Detector::detect() const
{
    std::vector<DetectedItem> items;
    for (const auto& probe : probes)
    {
        try
        {
            auto found = probe->run();
            cbl::debug(category, "Probe \"{}\" found {} item(s)", probe->name(), found.size());
            items.insert(items.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
        }
        catch (const std::exception& e)
        {
            cbl::warn(category, "Skipping probe \"{}\": {}", probe->name(), e.what());
        }
    }

    std::sort(items.begin(), items.end());
    items.erase(std::unique(items.begin(), items.end(),
                            [](const auto& a, const auto& b) { return !(a < b) && !(b < a); }),
                items.end());

    for (const auto& item : items)
        cbl::trace(category, "Detected {} \"{}\" ({}: {}, confidence {})", to_string(item.kind), item.name,
                   to_string(item.evidence.source), item.evidence.detail, item.confidence);

    return items;
}

std::vector<cb::HostProbe::UPtr> cb::Detector::default_probes(const HostLayout& layout)
{
    std::vector<HostProbe::UPtr> probes;
    probes.push_back(std::make_unique<ProcessProbe>(layout));
    probes.push_back(std::make_unique<ListeningSocketProbe>(layout));
    probes.push_back(std::make_unique<ServiceMarkerProbe>(layout));
    probes.push_back(std::make_unique<ProjectDirectoryProbe>(layout));
    probes.push_back(std::make_unique<AppDataProbe>(layout));
    return probes;
}

cb::HostLayout cb::HostLayout::current()
{
    HostLayout layout;
    layout.home = QDir::homePath();
    layout.working_directory = QDir::currentPath();
    return layout;
}

std::string cb::to_string(DetectedItem::Kind kind)
{
    switch (kind)
    {
    case DetectedItem::Kind::service:
        return "service";
    case DetectedItem::Kind::application:
        return "application";
    case DetectedItem::Kind::path:
        return "path";
    }
    return "unknown";
}

std::string cb::to_string(Evidence::Source source)
{
    switch (source)
    {
    case Evidence::Source::process:
        return "process";
    case Evidence::Source::socket:
        return "socket";
    case Evidence::Source::unit_file:
        return "unit file";
    case Evidence::Source::directory_marker:
        return "directory marker";
    case Evidence::Source::app_data:
        return "application data";
    }
    return "unknown";
}

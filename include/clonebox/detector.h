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

#ifndef CLONEBOX_DETECTOR_H
#define CLONEBOX_DETECTOR_H

#include <clonebox/detected_item.h>
#include <clonebox/disabled_copy_move.h>
#include <clonebox/host_layout.h>
#include <clonebox/host_probe.h>

#include <vector>

namespace clonebox
{
class Detector : private DisabledCopyMove
{
public:
    explicit Detector(std::vector<HostProbe::UPtr> probes);

    // Runs every probe. A failing probe is logged and skipped. The result is sorted and free of duplicates.
    std::vector<DetectedItem> detect() const;

    static std::vector<HostProbe::UPtr> default_probes(const HostLayout& layout);

private:
    std::vector<HostProbe::UPtr> probes;
};
} // namespace clonebox
#endif // CLONEBOX_DETECTOR_H

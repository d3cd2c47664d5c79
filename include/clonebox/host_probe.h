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

#ifndef CLONEBOX_HOST_PROBE_H
#define CLONEBOX_HOST_PROBE_H

#include <clonebox/detected_item.h>
#include <clonebox/disabled_copy_move.h>

#include <memory>
#include <string>
#include <vector>

namespace clonebox
{
/**
 * One source of host-state detection.
 *
 * Implementations read host state without modifying it and may throw (DetectionWarning preferably) when their data
 * source is unavailable. The Detector treats any such failure as non-fatal.
 */
class HostProbe : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<HostProbe>;

    virtual ~HostProbe() = default;
    virtual std::string name() const = 0;
    virtual std::vector<DetectedItem> run() const = 0;

protected:
    HostProbe() = default;
};
} // namespace clonebox
#endif // CLONEBOX_HOST_PROBE_H

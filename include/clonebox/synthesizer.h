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

#ifndef CLONEBOX_SYNTHESIZER_H
#define CLONEBOX_SYNTHESIZER_H

#include <clonebox/clone_spec.h>
#include <clonebox/clone_spec_schema.h>
#include <clonebox/detected_item.h>
#include <clonebox/profile.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clonebox
{
struct ResourceCaps
{
    MemorySize max_ram{MemorySize::from_gigabytes(128)};
    int max_vcpus{128};
    MemorySize max_disk{MemorySize::from_gigabytes(2048)};
};

// What the caller asked for explicitly. These settings win over the profile and the existing spec.
struct SynthesisOptions
{
    std::string name;
    std::optional<SessionScope> scope;
    std::optional<MemorySize> ram;
    std::optional<int> vcpus;
    std::optional<MemorySize> disk;
    std::map<std::string, std::string> extra_mounts;
    double min_confidence{0.0};
};

class Synthesizer
{
public:
    explicit Synthesizer(const ResourceCaps& caps);

    /**
     * Merges detections, a profile and a previous spec into a new, validated CloneSpec.
     *
     * Paths are keyed by their canonical form. Equal canonical paths collapse into one mount with the most specific
     * guest mountpoint, and a path whose strict ancestor is mounted under the same guest root is dropped. Packages
     * and services collapse on case-folded names. Resource limits come from the options, then the profile, then the
     * existing spec, then the defaults.
     *
     * @throws ValidationError if a requested host path is missing or unreadable, or if a resource cap is exceeded.
     */
    CloneSpec synthesize(const std::vector<DetectedItem>& detected, const std::optional<Profile>& profile,
                         const std::optional<VersionedCloneSpec>& existing,
                         const SynthesisOptions& options = {}) const;

private:
    const ResourceCaps caps;
};

// First component of a guest path, e.g. "/home" for "/home/ubuntu/app"
std::string guest_mountpoint_root(const std::string& guest_mountpoint);
} // namespace clonebox
#endif // CLONEBOX_SYNTHESIZER_H

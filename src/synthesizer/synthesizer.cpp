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

#include <clonebox/exceptions/validation_error.h>
#include <clonebox/format.h>
#include <clonebox/logging/log.h>
#include <clonebox/package_hints.h>
#include <clonebox/synthesizer.h>
#include <clonebox/utils.h>

#include <QDir>
#include <QFileInfo>

#include <algorithm>

namespace cb = clonebox;
namespace cbl = clonebox::logging;

namespace
{
constexpr auto category = "synthesizer";

struct MountCandidate
{
    std::string host; // canonical
    std::string guest;
    double confidence;
    bool requested;
};

int path_depth(const std::string& path)
{
    return static_cast<int>(QDir::cleanPath(QString::fromStdString(path)).split('/', Qt::SkipEmptyParts).size());
}

// Requested mounts beat detections. Otherwise the deeper guest mountpoint wins, then the more confident one.
bool preferred(const MountCandidate& a, const MountCandidate& b)
{
    if (a.requested != b.requested)
        return a.requested;
    if (path_depth(a.guest) != path_depth(b.guest))
        return path_depth(a.guest) > path_depth(b.guest);
    if (a.confidence != b.confidence)
        return a.confidence > b.confidence;
    return a.guest < b.guest;
}

MountCandidate requested_mount(const std::string& host, const std::string& guest)
{
    QFileInfo info{QString::fromStdString(host)};
    if (!info.exists())
        throw cb::ValidationError{"Host path \"{}\" does not exist", host};
    if (!info.isReadable())
        throw cb::ValidationError{"Host path \"{}\" is not readable", host};

    return MountCandidate{info.canonicalFilePath().toStdString(),
                          QDir::cleanPath(QString::fromStdString(guest)).toStdString(), 1.0, true};
}

std::optional<MountCandidate> detected_mount(const cb::DetectedItem& item)
{
    QFileInfo info{QString::fromStdString(item.name)};
    if (!info.exists() || !info.isReadable())
    {
        cbl::warn(category, "Skipping detected path \"{}\": it is gone or unreadable", item.name);
        return std::nullopt;
    }

    const auto canonical = info.canonicalFilePath();
    const auto guest = item.guest_mountpoint ? QString::fromStdString(*item.guest_mountpoint) : canonical;
    return MountCandidate{canonical.toStdString(), QDir::cleanPath(guest).toStdString(), item.confidence, false};
}

std::map<std::string, std::string> deduplicate_mounts(std::vector<MountCandidate> candidates)
{
    // Equal canonical paths: keep the preferred candidate
    std::map<std::string, MountCandidate> by_host;
    for (auto& candidate : candidates)
    {
        auto [it, inserted] = by_host.emplace(candidate.host, candidate);
        if (!inserted && preferred(candidate, it->second))
            it->second = candidate;
    }

    // Strict ancestors under the same guest root absorb their descendants. Map order visits ancestors first.
    std::vector<MountCandidate> kept;
    for (const auto& [host, candidate] : by_host)
    {
        const auto absorbed = std::any_of(kept.begin(), kept.end(), [&candidate](const MountCandidate& ancestor) {
            return cb::utils::is_strict_ancestor(QString::fromStdString(ancestor.host),
                                                 QString::fromStdString(candidate.host)) &&
                   cb::guest_mountpoint_root(ancestor.guest) == cb::guest_mountpoint_root(candidate.guest);
        });

        if (absorbed)
            cbl::debug(category, "\"{}\" is covered by a mount of one of its ancestors", candidate.host);
        else
            kept.push_back(candidate);
    }

    // Two host paths cannot share a guest mountpoint
    std::sort(kept.begin(), kept.end(), preferred);
    std::map<std::string, std::string> guest_owner;
    std::map<std::string, std::string> mounts;
    for (const auto& candidate : kept)
    {
        if (auto [it, inserted] = guest_owner.emplace(candidate.guest, candidate.host); !inserted)
        {
            if (candidate.requested)
                throw cb::ValidationError{"Guest mountpoint \"{}\" is requested for both \"{}\" and \"{}\"",
                                          candidate.guest, it->second, candidate.host};

            cbl::warn(category, "Skipping \"{}\": guest mountpoint \"{}\" is taken by \"{}\"", candidate.host,
                      candidate.guest, it->second);
            continue;
        }

        mounts.emplace(candidate.host, candidate.guest);
    }

    return mounts;
}

// Case-folded name -> spelling and the confidence it was seen with
class NameSet
{
public:
    void add(const std::string& name, double confidence)
    {
        auto [it, inserted] = entries.emplace(cb::utils::casefold(name), std::make_pair(name, confidence));
        if (!inserted && confidence > it->second.second)
            it->second = {name, confidence};
    }

    template <typename Container>
    void add_all(const Container& names, double confidence)
    {
        for (const auto& name : names)
            add(name, confidence);
    }

    std::set<std::string> names() const
    {
        std::set<std::string> result;
        for (const auto& [folded, entry] : entries)
            result.insert(entry.first);
        return result;
    }

private:
    std::map<std::string, std::pair<std::string, double>> entries;
};

template <typename T>
T first_of(const std::optional<T>& a, const std::optional<T>& b, const T& fallback)
{
    return a ? *a : (b ? *b : fallback);
}
} // namespace

std::string cb::guest_mountpoint_root(const std::string& guest_mountpoint)
{
    const auto parts = QDir::cleanPath(QString::fromStdString(guest_mountpoint)).split('/', Qt::SkipEmptyParts);
    return parts.isEmpty() ? "/" : "/" + parts.first().toStdString();
}

cb::Synthesizer::Synthesizer(const ResourceCaps& caps) : caps{caps}
{
}

cb::CloneSpec cb::Synthesizer::synthesize(const std::vector<DetectedItem>& detected,
                                          const std::optional<Profile>& profile,
                                          const std::optional<VersionedCloneSpec>& existing,
                                          const SynthesisOptions& options) const
{
    std::optional<CloneSpec> previous;
    if (existing)
        previous = to_current(*existing);

    auto spec = previous.value_or(CloneSpec{});
    if (!options.name.empty())
        spec.name = options.name;
    if (spec.name.empty())
        throw ValidationError{"A new clone needs a name"};
    if (options.scope)
        spec.scope = *options.scope;

    // Mounts
    std::vector<MountCandidate> candidates;
    auto add_requested = [&candidates](const std::map<std::string, std::string>& mounts) {
        for (const auto& [host, guest] : mounts)
            candidates.push_back(requested_mount(host, guest));
    };

    if (previous)
        add_requested(previous->mounts);
    if (profile)
        add_requested(profile->mounts);
    add_requested(options.extra_mounts);

    // Packages and services
    NameSet packages, snap_packages, services;
    if (previous)
    {
        packages.add_all(previous->packages, 1.0);
        snap_packages.add_all(previous->snap_packages, 1.0);
        services.add_all(previous->services, 1.0);
    }
    if (profile)
    {
        packages.add_all(profile->packages, 1.0);
        snap_packages.add_all(profile->snap_packages, 1.0);
        services.add_all(profile->services, 1.0);
    }

    for (const auto& item : detected)
    {
        if (item.confidence < options.min_confidence)
        {
            cbl::trace(category, "Ignoring low-confidence {} \"{}\"", to_string(item.kind), item.name);
            continue;
        }

        switch (item.kind)
        {
        case DetectedItem::Kind::path:
            if (auto candidate = detected_mount(item))
                candidates.push_back(*candidate);
            break;
        case DetectedItem::Kind::service:
            services.add(item.name, item.confidence);
            [[fallthrough]];
        case DetectedItem::Kind::application:
            if (auto hint = package_for(item.name))
                (hint->source == PackageHint::Source::snap ? snap_packages : packages)
                    .add(hint->package, item.confidence);
            break;
        }
    }

    spec.mounts = deduplicate_mounts(std::move(candidates));
    spec.packages = packages.names();
    spec.snap_packages = snap_packages.names();
    spec.services = services.names();

    // Resources
    const auto base = previous ? previous->resources : ResourceLimits{};
    spec.resources.ram = first_of(options.ram, profile ? profile->ram : std::nullopt, base.ram);
    spec.resources.vcpus = first_of(options.vcpus, profile ? profile->vcpus : std::nullopt, base.vcpus);
    spec.resources.disk = first_of(options.disk, profile ? profile->disk : std::nullopt, base.disk);

    if (spec.resources.ram > caps.max_ram)
        throw ValidationError{"\"{}\" asks for {} of RAM, above the configured cap of {}", spec.name,
                              spec.resources.ram.human_readable(), caps.max_ram.human_readable()};
    if (spec.resources.vcpus > caps.max_vcpus)
        throw ValidationError{"\"{}\" asks for {} vCPUs, above the configured cap of {}", spec.name,
                              spec.resources.vcpus, caps.max_vcpus};
    if (spec.resources.disk > caps.max_disk)
        throw ValidationError{"\"{}\" asks for a {} disk, above the configured cap of {}", spec.name,
                              spec.resources.disk.human_readable(), caps.max_disk.human_readable()};

    validate(spec);

    cbl::info(category, "Synthesized \"{}\": {} mount(s), {} package(s), {} snap(s), {} service(s)", spec.name,
              spec.mounts.size(), spec.packages.size(), spec.snap_packages.size(), spec.services.size());
    return spec;
}

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

#ifndef CLONEBOX_ENGINE_H
#define CLONEBOX_ENGINE_H

#include <clonebox/audit_log.h>
#include <clonebox/compose_orchestrator.h>
#include <clonebox/detector.h>
#include <clonebox/disabled_copy_move.h>
#include <clonebox/engine_config.h>
#include <clonebox/health_checker.h>
#include <clonebox/host_layout.h>
#include <clonebox/lifecycle_orchestrator.h>
#include <clonebox/profile.h>
#include <clonebox/provisioning_renderer.h>
#include <clonebox/snapshot_manager.h>
#include <clonebox/synthesizer.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clonebox
{
struct CloneOptions
{
    SynthesisOptions synthesis;
    std::optional<std::string> profile;
    Path existing_spec_file; // a previous .clonebox.yaml to start from, if any
    Path spec_file;          // where to save the result, nothing is saved when empty
    bool create{true};
    bool verify{true};
};

/**
 * Composition root of the engine: owns one of every component, built from a single EngineConfig, and serves the
 * operations a CLI or daemon exposes.
 */
class CloneEngine : private DisabledCopyMove
{
public:
    explicit CloneEngine(std::unique_ptr<const EngineConfig> config, HostLayout layout = HostLayout::current());

    std::vector<DetectedItem> detect() const;
    CloneSpec synthesize(const SynthesisOptions& options, const std::optional<std::string>& profile = std::nullopt,
                         const Path& existing_spec_file = {}) const;
    void save_spec(const CloneSpec& spec, const Path& file_path);

    // detect, synthesize, save and optionally create and verify, in one go
    CloneSpec clone(const CloneOptions& options, const Deadline& deadline = {});

    VMRecord create(const CloneSpec& spec, bool verify = true, const Deadline& deadline = {});
    VMRecord start(const std::string& name, const Deadline& deadline = {});
    VMRecord stop(const std::string& name, bool force = false, const Deadline& deadline = {});
    VMRecord restart(const std::string& name, const Deadline& deadline = {});
    void delete_vm(const std::string& name, const Deadline& deadline = {});
    VMRecord status(const std::string& name);
    std::vector<VMRecord> list();

    // Uses the health checks of the spec the instance was created from, or the default probes
    HealthReport health(const std::string& name, bool quick = false);
    std::optional<CloneSpec> instance_spec(const std::string& name) const;

    SnapshotManager& snapshots();
    ComposeOrchestrator& compose();
    AuditLog& audit();
    const EngineConfig& config() const;

private:
    Path instance_spec_path(const std::string& name) const;

    const std::unique_ptr<const EngineConfig> engine_config;
    const HostLayout layout;
    AuditLog audit_log;
    Synthesizer synthesizer;
    ProvisioningRenderer renderer;
    LifecycleOrchestrator lifecycle;
    HealthChecker health_checker;
    SnapshotManager snapshot_manager;
    ComposeOrchestrator compose_orchestrator;
};
} // namespace clonebox
#endif // CLONEBOX_ENGINE_H

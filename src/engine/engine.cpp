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

#include <clonebox/clone_spec_schema.h>
#include <clonebox/engine.h>
#include <clonebox/exceptions/lifecycle_exceptions.h>
#include <clonebox/exceptions/validation_error.h>
#include <clonebox/format.h>
#include <clonebox/logging/log.h>
#include <clonebox/utils.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbu = clonebox::utils;

namespace
{
constexpr auto category = "engine";

cb::Path specs_directory(const cb::EngineConfig& config)
{
    return QDir{config.data_directory}.filePath(QString{"specs/%1"}.arg(QString::fromStdString(
        cb::to_string(config.scope))));
}
} // namespace

cb::CloneEngine::CloneEngine(std::unique_ptr<const EngineConfig> config, HostLayout layout)
    : engine_config{std::move(config)},
      layout{std::move(layout)},
      audit_log{engine_config->audit_log_path, AuditLog::default_actor()},
      synthesizer{engine_config->caps},
      renderer{*engine_config->credential_generator},
      lifecycle{*engine_config->backend,
                renderer,
                audit_log,
                {QDir{engine_config->data_directory}.filePath("instances"), engine_config->scope,
                 engine_config->stop_timeout, engine_config->poll_interval}},
      health_checker{*engine_config->backend, audit_log,
                     {engine_config->boot_timeout, engine_config->health_retry_interval}},
      snapshot_manager{*engine_config->backend, lifecycle, audit_log, engine_config->data_directory},
      compose_orchestrator{lifecycle, health_checker, *engine_config->backend, audit_log,
                           engine_config->worker_pool_size}
{
}

std::vector<cb::DetectedItem> cb::CloneEngine::detect() const
{
    return Detector{Detector::default_probes(layout)}.detect();
}

cb::CloneSpec cb::CloneEngine::synthesize(const SynthesisOptions& options, const std::optional<std::string>& profile,
                                          const Path& existing_spec_file) const
{
    std::optional<Profile> loaded_profile;
    if (profile)
        loaded_profile = ProfileLoader{ProfileLoader::default_search_directories(layout.home,
                                                                                 layout.working_directory)}
                             .load(*profile);

    std::optional<VersionedCloneSpec> existing;
    if (!existing_spec_file.isEmpty())
        existing = load_versioned_clone_spec(existing_spec_file);

    auto effective = options;
    if (!effective.scope)
        effective.scope = engine_config->scope;

    return synthesizer.synthesize(detect(), loaded_profile, existing, effective);
}

void cb::CloneEngine::save_spec(const CloneSpec& spec, const Path& file_path)
{
    audited(audit_log, AuditEventKind::spec_saved, spec.name, [&] { save_clone_spec(spec, file_path); });
}

cb::CloneSpec cb::CloneEngine::clone(const CloneOptions& options, const Deadline& deadline)
{
    auto spec = synthesize(options.synthesis, options.profile, options.existing_spec_file);

    if (!options.spec_file.isEmpty())
        save_spec(spec, options.spec_file);

    if (options.create)
        create(spec, options.verify, deadline);

    return spec;
}

cb::VMRecord cb::CloneEngine::create(const CloneSpec& spec, bool verify, const Deadline& deadline)
{
    lifecycle.create(spec, deadline);

    // The instance exists by now, losing its spec only costs the declared health checks
    try
    {
        cbu::make_dir(QDir{specs_directory(*engine_config)}, {});
        save_clone_spec(spec, instance_spec_path(spec.name));
    }
    catch (const std::exception& e)
    {
        cbl::warn(spec.name, "Created, but could not keep its spec: {}", e.what());
    }

    if (verify)
    {
        auto report = health_checker.verify(spec.name, spec.health_checks, deadline);
        if (!report.healthy())
            cbl::warn(spec.name, "Created, but not healthy yet: {}", report.summary());
    }

    return lifecycle.status(spec.name);
}

cb::VMRecord cb::CloneEngine::start(const std::string& name, const Deadline& deadline)
{
    return lifecycle.start(name, deadline);
}

cb::VMRecord cb::CloneEngine::stop(const std::string& name, bool force, const Deadline& deadline)
{
    return lifecycle.stop(name, force, deadline);
}

cb::VMRecord cb::CloneEngine::restart(const std::string& name, const Deadline& deadline)
{
    return lifecycle.restart(name, deadline);
}

void cb::CloneEngine::delete_vm(const std::string& name, const Deadline& deadline)
{
    auto lock = lifecycle.lock(name, deadline);
    lifecycle.delete_vm(name, deadline);
    snapshot_manager.purge(name);
    QFile::remove(instance_spec_path(name));
}

cb::VMRecord cb::CloneEngine::status(const std::string& name)
{
    return lifecycle.status(name);
}

std::vector<cb::VMRecord> cb::CloneEngine::list()
{
    return lifecycle.list();
}

cb::HealthReport cb::CloneEngine::health(const std::string& name, bool quick)
{
    if (lifecycle.status(name).state == VMState::absent)
        throw InstanceNotFound{name};

    auto spec = instance_spec(name);
    return health_checker.check(name, spec ? spec->health_checks : std::vector<HealthCheckDeclaration>{}, quick);
}

std::optional<cb::CloneSpec> cb::CloneEngine::instance_spec(const std::string& name) const
{
    const auto path = instance_spec_path(name);
    if (!QFileInfo::exists(path))
        return std::nullopt;

    return load_clone_spec(path);
}

cb::SnapshotManager& cb::CloneEngine::snapshots()
{
    return snapshot_manager;
}

cb::ComposeOrchestrator& cb::CloneEngine::compose()
{
    return compose_orchestrator;
}

cb::AuditLog& cb::CloneEngine::audit()
{
    return audit_log;
}

const cb::EngineConfig& cb::CloneEngine::config() const
{
    return *engine_config;
}

cb::Path cb::CloneEngine::instance_spec_path(const std::string& name) const
{
    return QDir{specs_directory(*engine_config)}.filePath(QString::fromStdString(name + ".yaml"));
}

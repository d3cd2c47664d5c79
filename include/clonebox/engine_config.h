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

#ifndef CLONEBOX_ENGINE_CONFIG_H
#define CLONEBOX_ENGINE_CONFIG_H

#include <clonebox/credential_generator.h>
#include <clonebox/logging/level.h>
#include <clonebox/logging/logger.h>
#include <clonebox/path.h>
#include <clonebox/session_scope.h>
#include <clonebox/synthesizer.h>
#include <clonebox/virtualization_backend.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace clonebox
{
struct EngineConfig
{
    ~EngineConfig();
    const std::unique_ptr<VirtualizationBackend> backend;
    const std::unique_ptr<CredentialGenerator> credential_generator;
    const std::shared_ptr<logging::Logger> logger;
    const Path data_directory;
    const SessionScope scope;
    const std::string remote_host;
    const ResourceCaps caps;
    const int worker_pool_size;
    const std::chrono::milliseconds stop_timeout;
    const std::chrono::milliseconds poll_interval;
    const std::chrono::milliseconds boot_timeout;
    const std::chrono::milliseconds health_retry_interval;
    const Path audit_log_path;
    const logging::Level verbosity_level;
};

/**
 * Collects the engine's settings.
 *
 * Whatever is left unset is taken from the `[engine]` section of the settings file, then from built-in defaults.
 * The data directory additionally honours $CLONEBOX_DATA_DIR before the settings file.
 */
struct EngineConfigBuilder
{
    std::unique_ptr<VirtualizationBackend> backend;
    std::unique_ptr<CredentialGenerator> credential_generator;
    std::unique_ptr<logging::Logger> logger;
    Path settings_file; // defaults to clonebox/clonebox.conf under the generic config location
    Path data_directory;
    std::optional<SessionScope> scope;
    std::optional<std::string> remote_host;
    std::optional<ResourceCaps> caps;
    std::optional<int> worker_pool_size;
    std::optional<std::chrono::milliseconds> stop_timeout;
    std::optional<std::chrono::milliseconds> poll_interval;
    std::optional<std::chrono::milliseconds> boot_timeout;
    std::optional<std::chrono::milliseconds> health_retry_interval;
    Path audit_log_path;
    std::optional<logging::Level> verbosity_level;

    std::unique_ptr<const EngineConfig> build();
};

// qemu:///session, qemu:///system, or qemu+ssh://<host>/<session|system> for remote hosts
std::string backend_uri(SessionScope scope, const std::string& remote_host = {});
Path default_settings_file();
} // namespace clonebox
#endif // CLONEBOX_ENGINE_CONFIG_H

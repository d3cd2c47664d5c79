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

#include <clonebox/engine_config.h>
#include <clonebox/exceptions/validation_error.h>
#include <clonebox/format.h>
#include <clonebox/logging/log.h>
#include <clonebox/logging/standard_logger.h>
#include <clonebox/utils.h>

#include "../platform/backends/libvirt/libvirt_backend.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbu = clonebox::utils;

namespace
{
constexpr auto category = "config";
constexpr auto engine_group = "engine";
constexpr auto default_worker_pool_size = 4;
constexpr auto default_stop_timeout = std::chrono::seconds{60};
constexpr auto default_poll_interval = std::chrono::milliseconds{500};
constexpr auto default_boot_timeout = std::chrono::minutes{5};
constexpr auto default_health_retry_interval = std::chrono::seconds{5};

class EngineSettings
{
public:
    explicit EngineSettings(const cb::Path& file) : settings{file, QSettings::IniFormat}
    {
        if (settings.status() != QSettings::NoError)
            cbl::warn(category, "Could not read settings from {}", file);
        settings.beginGroup(engine_group);
    }

    std::optional<QString> string(const QString& key) const
    {
        if (!settings.contains(key))
            return std::nullopt;

        return settings.value(key).toString();
    }

    template <typename Duration>
    std::optional<std::chrono::milliseconds> milliseconds(const QString& key) const
    {
        auto value = string(key);
        if (!value)
            return std::nullopt;

        bool ok = false;
        auto count = value->toLongLong(&ok);
        if (!ok || count < 0)
            throw cb::ValidationError{"Invalid value for {}/{}: {}", engine_group, key, *value};

        return std::chrono::duration_cast<std::chrono::milliseconds>(Duration{count});
    }

    std::optional<int> positive_int(const QString& key) const
    {
        auto value = string(key);
        if (!value)
            return std::nullopt;

        bool ok = false;
        auto number = value->toInt(&ok);
        if (!ok || number < 1)
            throw cb::ValidationError{"Invalid value for {}/{}: {}", engine_group, key, *value};

        return number;
    }

    std::optional<cb::MemorySize> memory_size(const QString& key) const
    {
        auto value = string(key);
        return value ? std::make_optional(cb::MemorySize{value->toStdString()}) : std::nullopt;
    }

private:
    QSettings settings;
};

template <typename T>
T first_of(std::optional<T> explicit_value, std::optional<T> configured, T fallback)
{
    return explicit_value ? *explicit_value : configured ? *configured : fallback;
}
} // namespace

cb::EngineConfig::~EngineConfig()
{
    cbl::set_logger(nullptr);
}

std::unique_ptr<const cb::EngineConfig> cb::EngineConfigBuilder::build()
{
    if (settings_file.isEmpty())
        settings_file = default_settings_file();
    const EngineSettings settings{settings_file};

    if (!verbosity_level)
    {
        auto configured = settings.string("log_level");
        verbosity_level = configured ? cbl::level_from_string(configured->toStdString()) : std::nullopt;
        if (configured && !verbosity_level)
            throw ValidationError{"Invalid value for {}/log_level: {}", engine_group, *configured};
    }
    const auto level = verbosity_level.value_or(cbl::Level::info);

    // Install logger as early as possible
    if (logger == nullptr)
        logger = std::make_unique<cbl::StandardLogger>(level);
    std::shared_ptr<cbl::Logger> shared_logger{std::move(logger)};
    cbl::set_logger(shared_logger);

    if (data_directory.isEmpty())
        data_directory = cbu::clonebox_storage();
    if (data_directory.isEmpty())
        data_directory = settings.string("data_directory").value_or(QString{});
    if (data_directory.isEmpty())
        data_directory =
            QDir{QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)}.filePath("clonebox");
    data_directory = cbu::make_dir(QDir{data_directory}, {});

    if (!scope)
    {
        auto configured = settings.string("scope");
        scope = configured ? session_scope_from(configured->toStdString()) : SessionScope::user;
    }

    if (!remote_host)
        remote_host = settings.string("remote_host").value_or(QString{}).toStdString();

    if (!caps)
    {
        ResourceCaps defaults;
        caps = ResourceCaps{settings.memory_size("max_ram").value_or(defaults.max_ram),
                            settings.positive_int("max_vcpus").value_or(defaults.max_vcpus),
                            settings.memory_size("max_disk").value_or(defaults.max_disk)};
    }

    const auto pool_size =
        first_of(worker_pool_size, settings.positive_int("worker_pool_size"), default_worker_pool_size);
    if (pool_size < 1)
        throw ValidationError{"The compose worker pool needs at least one worker, got {}", pool_size};

    if (audit_log_path.isEmpty())
        audit_log_path = settings.string("audit_log").value_or(QDir{data_directory}.filePath("audit.jsonl"));

    if (credential_generator == nullptr)
        credential_generator = std::make_unique<SecureCredentialGenerator>();
    if (backend == nullptr)
        backend = std::make_unique<LibvirtBackend>(backend_uri(*scope, *remote_host));

    cbl::debug(category, "Using {} with data under {}", backend->uri(), data_directory);

    using std::chrono::milliseconds;
    using std::chrono::seconds;
    return std::unique_ptr<const EngineConfig>(new EngineConfig{
        std::move(backend), std::move(credential_generator), shared_logger, data_directory, *scope, *remote_host,
        *caps, pool_size,
        first_of(stop_timeout, settings.milliseconds<seconds>("stop_timeout"), milliseconds{default_stop_timeout}),
        first_of(poll_interval, settings.milliseconds<milliseconds>("poll_interval_ms"), default_poll_interval),
        first_of(boot_timeout, settings.milliseconds<seconds>("boot_timeout"), milliseconds{default_boot_timeout}),
        first_of(health_retry_interval, settings.milliseconds<seconds>("health_retry_interval"),
                 milliseconds{default_health_retry_interval}),
        audit_log_path, level});
}

std::string cb::backend_uri(SessionScope scope, const std::string& remote_host)
{
    const auto session = scope == SessionScope::system ? "system" : "session";
    if (remote_host.empty())
        return fmt::format("qemu:///{}", session);

    return fmt::format("qemu+ssh://{}/{}", remote_host, session);
}

cb::Path cb::default_settings_file()
{
    return QDir{QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)}.filePath(
        "clonebox/clonebox.conf");
}

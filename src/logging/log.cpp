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

#include <clonebox/logging/log.h>

#include <clonebox/format.h>

#include <QString>
#include <QtGlobal>

#include <shared_mutex>
#include <stdexcept>

namespace cbl = clonebox::logging;

namespace
{
std::shared_timed_mutex mutex;
std::shared_ptr<clonebox::logging::Logger> global_logger;

cbl::Level to_level(QtMsgType type)
{
    switch (type)
    {
    case QtDebugMsg:
        return cbl::Level::debug;
    case QtInfoMsg:
        return cbl::Level::info;
    case QtWarningMsg:
        return cbl::Level::warning;
    case QtCriticalMsg:
    case QtFatalMsg:
        return cbl::Level::error;
    }
    throw std::invalid_argument("Unknown Qt log message type");
}

void qt_message_handler(QtMsgType type, const QMessageLogContext&, const QString& message)
{
    auto msg = message.toLocal8Bit();
    cbl::log(to_level(type), "Qt", msg.constData());
}
} // namespace

void cbl::log(Level level, CString category, CString message)
{
    std::shared_lock<decltype(mutex)> lock{mutex};
    if (global_logger)
        global_logger->log(level, category, message);
    else if (level <= Level::warning)
        fmt::print(stderr, "[{}] [{}] {}\n", as_string(level).c_str(), category.c_str(), message.c_str());
}

cbl::Level cbl::get_logging_level()
{
    std::shared_lock<decltype(mutex)> lock{mutex};
    if (global_logger)
        return global_logger->get_logging_level();

    return Level::error;
}

void cbl::set_logger(std::shared_ptr<Logger> logger)
{
    std::lock_guard<decltype(mutex)> lock{mutex};
    global_logger = std::move(logger);
    qInstallMessageHandler(qt_message_handler);
}

auto cbl::get_logger() -> Logger* // for tests, don't rely on it lasting
{
    return global_logger.get();
}

std::optional<cbl::Level> cbl::level_from_string(std::string_view name)
{
    for (auto i = enum_type(Level::error); i <= enum_type(Level::trace); ++i)
    {
        if (name == as_string(level_from(i)).c_str())
            return level_from(i);
    }

    return std::nullopt;
}

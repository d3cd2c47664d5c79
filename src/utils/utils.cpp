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

#include <clonebox/format.h>
#include <clonebox/logging/log.h>
#include <clonebox/utils.h>

#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>
#include <QSaveFile>
#include <QStandardPaths>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace cb = clonebox;
namespace cbl = clonebox::logging;

std::string cb::utils::contents_of(const cb::Path& file_path)
{
    const std::string name{file_path.toStdString()};
    std::ifstream in(name, std::ios::in | std::ios::binary);
    if (!in)
        throw std::runtime_error(fmt::format("failed to open file '{}'", name));

    std::stringstream stream;
    stream << in.rdbuf();
    return stream.str();
}

cb::Path cb::utils::make_dir(const QDir& a_dir, const QString& name, QFileDevice::Permissions permissions)
{
    cb::Path dir_path;
    bool success{false};

    if (name.isEmpty())
    {
        success = a_dir.mkpath(".");
        dir_path = a_dir.absolutePath();
    }
    else
    {
        success = a_dir.mkpath(name);
        dir_path = a_dir.filePath(name);
    }

    if (!success)
        throw std::runtime_error(fmt::format("unable to create directory '{}'", dir_path));

    if (permissions && !QFile::setPermissions(dir_path, permissions))
        throw std::runtime_error(fmt::format("unable to set permissions on directory '{}'", dir_path));

    return dir_path;
}

void cb::utils::write_file(const cb::Path& file_path, const std::string& contents,
                           QFileDevice::Permissions permissions)
{
    QSaveFile file{file_path};
    if (!file.open(QIODevice::WriteOnly))
        throw std::runtime_error(fmt::format("failed to open '{}' for writing: {}", file_path, file.errorString()));

    if (permissions && !file.setPermissions(permissions))
        throw std::runtime_error(fmt::format("unable to set permissions on '{}'", file_path));

    const auto written = file.write(contents.data(), static_cast<qint64>(contents.size()));
    if (written != static_cast<qint64>(contents.size()) || !file.commit())
        throw std::runtime_error(fmt::format("failed to write '{}': {}", file_path, file.errorString()));
}

QString cb::utils::canonical_path(const QString& path)
{
    return QFileInfo{path}.canonicalFilePath();
}

bool cb::utils::is_strict_ancestor(const QString& ancestor, const QString& descendant)
{
    const auto prefix = ancestor.endsWith('/') ? ancestor : ancestor + '/';
    return descendant != ancestor && descendant.startsWith(prefix);
}

QString cb::utils::clonebox_storage()
{
    return qEnvironmentVariable("CLONEBOX_DATA_DIR");
}

bool cb::utils::valid_hostname(const std::string& name_string)
{
    QRegularExpression matcher{QRegularExpression::anchoredPattern("[a-zA-Z0-9][a-zA-Z0-9\\-]*")};

    return name_string.size() <= 64 && matcher.match(QString::fromStdString(name_string)).hasMatch();
}

std::string cb::utils::casefold(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::vector<std::string> cb::utils::split(const std::string& string, const std::string& delimiter)
{
    std::regex regex(delimiter);
    return {std::sregex_token_iterator{string.begin(), string.end(), regex, -1}, std::sregex_token_iterator{}};
}

bool cb::utils::has_only_digits(const std::string& value)
{
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

void cb::utils::process_throw_on_error(const QString& program, const QStringList& arguments, const QString& message,
                                       const QString& category, const int timeout)
{
    QProcess process;
    cbl::log(cbl::Level::debug, category.toStdString(),
             fmt::format("Running: {}, {}", program, arguments.join(", ")));
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program, arguments);
    auto success = process.waitForFinished(timeout);

    if (!success || process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0)
    {
        cbl::log(cbl::Level::debug, category.toStdString(),
                 fmt::format("{} failed - errorString: {}, exitCode: {}", program, process.errorString(),
                             process.exitCode()));

        auto output = process.readAllStandardOutput();
        throw std::runtime_error(fmt::format(fmt::runtime(message.toStdString()),
                                             output.isEmpty() ? process.errorString().toStdString()
                                                              : output.toStdString()));
    }
}

std::vector<std::uint8_t> cb::utils::random_bytes(std::size_t len)
{
    std::vector<std::uint8_t> bytes(len, 0);

    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
        throw std::runtime_error(
            fmt::format("failed to gather random bytes: {}", ERR_error_string(ERR_get_error(), nullptr)));

    return bytes;
}

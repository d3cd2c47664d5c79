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

#include "common.h"
#include "mock_environment_helpers.h"
#include "mock_logger.h"
#include "temp_dir.h"

#include <clonebox/utils.h>

#include <QFileInfo>

#include <string>

namespace cbt = clonebox::test;
namespace cbu = clonebox::utils;

using namespace testing;
using namespace std::chrono_literals;

TEST(Utils, hostnamesAreLettersDigitsAndInnerDashes)
{
    EXPECT_TRUE(cbu::valid_hostname("a"));
    EXPECT_TRUE(cbu::valid_hostname("web-1"));
    EXPECT_TRUE(cbu::valid_hostname("DevBox"));
    EXPECT_TRUE(cbu::valid_hostname("2024-dev"));
    EXPECT_TRUE(cbu::valid_hostname("web-"));

    EXPECT_FALSE(cbu::valid_hostname(""));
    EXPECT_FALSE(cbu::valid_hostname("-web"));
    EXPECT_FALSE(cbu::valid_hostname("web_1"));
    EXPECT_FALSE(cbu::valid_hostname("not a hostname"));
    EXPECT_TRUE(cbu::valid_hostname(std::string(64, '7')));
    EXPECT_FALSE(cbu::valid_hostname(std::string(65, 'a')));
}

TEST(Utils, casefoldLowersAscii)
{
    EXPECT_EQ(cbu::casefold("Docker.Service"), "docker.service");
    EXPECT_EQ(cbu::casefold("postgresql-16"), "postgresql-16");
}

TEST(Utils, splitKeepsEmptyFields)
{
    EXPECT_THAT(cbu::split("a,b,,c", ","), ElementsAre("a", "b", "", "c"));
    EXPECT_THAT(cbu::split("one", ","), ElementsAre("one"));
}

TEST(Utils, hasOnlyDigits)
{
    EXPECT_TRUE(cbu::has_only_digits("0123"));
    EXPECT_FALSE(cbu::has_only_digits(""));
    EXPECT_FALSE(cbu::has_only_digits("12a"));
    EXPECT_FALSE(cbu::has_only_digits("-1"));
}

TEST(Utils, trimsWhitespace)
{
    EXPECT_EQ(cbu::trim(std::string{"  a b \n"}), "a b");
    EXPECT_EQ(cbu::trim_begin(std::string{"\t a "}), "a ");
    EXPECT_EQ(cbu::trim_end(std::string{" a \r\n"}), " a");
    EXPECT_EQ(cbu::trim(std::string{"xxaxx"}, [](char c) { return c == 'x'; }), "a");
}

TEST(Utils, strictAncestorsAreWholePathComponents)
{
    EXPECT_TRUE(cbu::is_strict_ancestor("/home/dev", "/home/dev/projects"));
    EXPECT_TRUE(cbu::is_strict_ancestor("/home/dev/", "/home/dev/projects/api"));
    EXPECT_TRUE(cbu::is_strict_ancestor("/", "/etc"));

    EXPECT_FALSE(cbu::is_strict_ancestor("/home/dev", "/home/dev"));
    EXPECT_FALSE(cbu::is_strict_ancestor("/home/dev", "/home/developer"));
    EXPECT_FALSE(cbu::is_strict_ancestor("/home/dev/projects", "/home/dev"));
}

TEST(Utils, canonicalPathResolvesSymlinks)
{
    cbt::TempDir dir;
    const auto target = dir.make_dir("real");
    QFile::link(target, dir.filePath("link"));

    EXPECT_EQ(cbu::canonical_path(dir.filePath("link")), QFileInfo{target}.canonicalFilePath());
    EXPECT_EQ(cbu::canonical_path(dir.filePath("missing")), "");
}

TEST(Utils, writtenFilesReadBack)
{
    cbt::TempDir dir;
    const auto file = dir.filePath("seed/user-data");
    cbu::make_dir(QDir{dir.path()}, "seed");

    cbu::write_file(file, "#cloud-config\n", QFileDevice::ReadOwner | QFileDevice::WriteOwner);

    EXPECT_EQ(cbu::contents_of(file), "#cloud-config\n");
    EXPECT_EQ(QFileInfo{file}.permissions() & (QFileDevice::ReadGroup | QFileDevice::ReadOther),
              QFileDevice::Permissions{});
}

TEST(Utils, readingAMissingFileThrows)
{
    cbt::TempDir dir;

    EXPECT_THROW(cbu::contents_of(dir.filePath("nope")), std::runtime_error);
}

TEST(Utils, writingIntoAMissingDirectoryThrows)
{
    cbt::TempDir dir;

    EXPECT_THROW(cbu::write_file(dir.filePath("missing/file"), "data"), std::runtime_error);
}

TEST(Utils, makeDirCreatesParents)
{
    cbt::TempDir dir;

    const auto created = cbu::make_dir(QDir{dir.path()}, "instances/user/web");

    EXPECT_EQ(created, dir.filePath("instances/user/web"));
    EXPECT_TRUE(QFileInfo{created}.isDir());
}

TEST(Utils, storageFollowsTheEnvironment)
{
    {
        cbt::SetEnvScope env{"CLONEBOX_DATA_DIR", "/srv/clonebox"};
        EXPECT_EQ(cbu::clonebox_storage(), "/srv/clonebox");
    }

    cbt::UnsetEnvScope env{"CLONEBOX_DATA_DIR"};
    EXPECT_EQ(cbu::clonebox_storage(), "");
}

TEST(Utils, randomBytesHaveTheRequestedLength)
{
    const auto first = cbu::random_bytes(32);
    const auto second = cbu::random_bytes(32);

    EXPECT_THAT(first, SizeIs(32));
    EXPECT_NE(first, second);
}

TEST(Utils, processFailuresCarryTheirOutput)
{
    auto logger_scope = cbt::MockLogger::inject();

    EXPECT_NO_THROW(cbu::process_throw_on_error("true", {}, "unexpected: {}"));
    CB_EXPECT_THROW_THAT(cbu::process_throw_on_error("sh", {"-c", "echo disk full; exit 1"}, "qemu-img said: {}"),
                         std::runtime_error, cbt::match_what(HasSubstr("qemu-img said: disk full")));
}

TEST(Utils, tryActionUntilStopsWhenDone)
{
    auto attempts = 0;
    auto timed_out = false;

    const auto third_time_lucky = [&attempts] {
        return ++attempts == 3 ? cbu::TimeoutAction::done : cbu::TimeoutAction::retry;
    };

    cbu::try_action_until([&timed_out] { timed_out = true; }, std::chrono::steady_clock::now() + 1s, 1ms,
                          third_time_lucky);

    EXPECT_EQ(attempts, 3);
    EXPECT_FALSE(timed_out);
}

TEST(Utils, tryActionUntilReportsTimeouts)
{
    auto timed_out = false;

    cbu::try_action_until([&timed_out] { timed_out = true; }, std::chrono::steady_clock::now() + 20ms, 5ms,
                          [] { return cbu::TimeoutAction::retry; });

    EXPECT_TRUE(timed_out);
}

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
#include "mock_logger.h"
#include "temp_dir.h"

#include <clonebox/exceptions/validation_error.h>
#include <clonebox/package_hints.h>
#include <clonebox/profile.h>
#include <clonebox/synthesizer.h>

#include <QFileInfo>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbt = clonebox::test;

using namespace testing;

namespace
{
std::string canonical(const QString& path)
{
    return QFileInfo{path}.canonicalFilePath().toStdString();
}

cb::DetectedItem detected_path(const QString& path, const std::string& guest, double confidence = 0.7)
{
    return {cb::DetectedItem::Kind::path,
            path.toStdString(),
            {cb::Evidence::Source::directory_marker, ".git"},
            confidence,
            guest};
}

cb::DetectedItem detected_service(const std::string& name, double confidence = 0.9)
{
    return {cb::DetectedItem::Kind::service, name, {cb::Evidence::Source::unit_file, name + ".service"}, confidence};
}

cb::DetectedItem detected_application(const std::string& name, double confidence = 0.8)
{
    return {cb::DetectedItem::Kind::application, name, {cb::Evidence::Source::process, name}, confidence};
}

struct Synthesizer : public Test
{
    cb::SynthesisOptions named(const std::string& name = "box")
    {
        cb::SynthesisOptions options;
        options.name = name;
        return options;
    }

    cb::CloneSpec synthesize(const std::vector<cb::DetectedItem>& detected,
                             const std::optional<cb::Profile>& profile = std::nullopt,
                             const std::optional<cb::VersionedCloneSpec>& existing = std::nullopt)
    {
        return synthesizer.synthesize(detected, profile, existing, named());
    }

    cbt::TempDir home;
    cb::Synthesizer synthesizer{cb::ResourceCaps{}};
    cbt::MockLogger::Scope logger_scope = cbt::MockLogger::inject(cbl::Level::debug);
};
} // namespace

TEST_F(Synthesizer, ancestorAbsorbsDescendantsUnderTheSameGuestRoot)
{
    const auto projects = home.make_dir("projects");
    const auto app = home.make_dir("projects/app");

    const auto spec = synthesize({detected_path(app, "/home/ubuntu/projects/app", 0.9),
                                  detected_path(projects, "/home/ubuntu/projects", 0.6)});

    EXPECT_THAT(spec.mounts, ElementsAre(Pair(canonical(projects), "/home/ubuntu/projects")));
}

TEST_F(Synthesizer, descendantsUnderAnotherGuestRootAreKept)
{
    const auto projects = home.make_dir("projects");
    const auto cache = home.make_dir("projects/cache");

    const auto spec =
        synthesize({detected_path(projects, "/home/ubuntu/projects"), detected_path(cache, "/var/cache/app")});

    EXPECT_THAT(spec.mounts, UnorderedElementsAre(Pair(canonical(projects), "/home/ubuntu/projects"),
                                                  Pair(canonical(cache), "/var/cache/app")));
}

TEST_F(Synthesizer, requestedMountBeatsDetectionOfTheSamePath)
{
    const auto data = home.make_dir("data");
    auto options = named();
    options.extra_mounts = {{data.toStdString(), "/data"}};

    const auto spec =
        synthesizer.synthesize({detected_path(data, "/home/ubuntu/deeply/nested/data", 1.0)}, {}, {}, options);

    EXPECT_THAT(spec.mounts, ElementsAre(Pair(canonical(data), "/data")));
}

TEST_F(Synthesizer, equalPathsKeepTheDeeperThenTheMoreConfidentGuestPath)
{
    const auto src = home.make_dir("src");
    const auto lib = home.make_dir("lib");

    const auto spec = synthesize({detected_path(src, "/src", 0.9), detected_path(src, "/home/ubuntu/src", 0.4),
                                  detected_path(lib, "/opt/lib-a", 0.4), detected_path(lib, "/opt/lib-b", 0.8)});

    EXPECT_THAT(spec.mounts, UnorderedElementsAre(Pair(canonical(src), "/home/ubuntu/src"),
                                                  Pair(canonical(lib), "/opt/lib-b")));
}

TEST_F(Synthesizer, symlinkedPathsCollapseOnTheirCanonicalForm)
{
    const auto real = home.make_dir("real");
    const auto link = home.filePath("link");
    ASSERT_TRUE(QFile::link(real, link));

    const auto spec = synthesize({detected_path(real, "/work"), detected_path(link, "/work/link")});

    EXPECT_THAT(spec.mounts, ElementsAre(Pair(canonical(real), "/work/link")));
}

TEST_F(Synthesizer, vanishedDetectionsAreSkippedWithAWarning)
{
    EXPECT_CALL(*logger_scope.mock_logger, log).Times(AnyNumber());
    logger_scope.mock_logger->expect_log(cbl::Level::warning, "gone or unreadable");

    const auto spec = synthesize({detected_path(home.filePath("vanished"), "/vanished")});

    EXPECT_THAT(spec.mounts, IsEmpty());
}

TEST_F(Synthesizer, missingRequestedPathIsAnError)
{
    auto options = named();
    options.extra_mounts = {{home.filePath("absent").toStdString(), "/absent"}};

    CB_EXPECT_THROW_THAT(synthesizer.synthesize({}, {}, {}, options), cb::ValidationError,
                         cbt::match_what(HasSubstr("does not exist")));
}

TEST_F(Synthesizer, requestedMountsCannotShareAGuestMountpoint)
{
    auto options = named();
    options.extra_mounts = {{home.make_dir("a").toStdString(), "/shared"},
                            {home.make_dir("b").toStdString(), "/shared"}};

    CB_EXPECT_THROW_THAT(synthesizer.synthesize({}, {}, {}, options), cb::ValidationError,
                         cbt::match_what(HasSubstr("\"/shared\" is requested for both")));
}

TEST_F(Synthesizer, detectionLosesAGuestMountpointToARequest)
{
    EXPECT_CALL(*logger_scope.mock_logger, log).Times(AnyNumber());
    logger_scope.mock_logger->expect_log(cbl::Level::warning, "is taken by");

    const auto requested = home.make_dir("requested");
    auto options = named();
    options.extra_mounts = {{requested.toStdString(), "/srv/app"}};

    const auto spec = synthesizer.synthesize({detected_path(home.make_dir("detected"), "/srv/app")}, {}, {}, options);

    EXPECT_THAT(spec.mounts, ElementsAre(Pair(canonical(requested), "/srv/app")));
}

TEST_F(Synthesizer, namesCollapseCaseInsensitively)
{
    cb::Profile profile;
    profile.name = "web";
    profile.packages = {"docker.io"};
    profile.services = {"Nginx"};

    const auto spec = synthesize({detected_application("DOCKER"), detected_service("nginx")}, profile);

    EXPECT_THAT(spec.packages, UnorderedElementsAre("docker.io", "nginx"));
    EXPECT_THAT(spec.services, ElementsAre("Nginx"));
}

TEST_F(Synthesizer, detectedServicesBringTheirPackages)
{
    const auto spec = synthesize({detected_service("postgresql"), detected_service("docker"),
                                  detected_application("code"), detected_application("unheard-of-tool")});

    EXPECT_THAT(spec.services, UnorderedElementsAre("postgresql", "docker"));
    EXPECT_THAT(spec.packages, UnorderedElementsAre("postgresql", "docker.io"));
    EXPECT_THAT(spec.snap_packages, ElementsAre("code"));
}

TEST_F(Synthesizer, lowConfidenceDetectionsAreIgnored)
{
    auto options = named();
    options.min_confidence = 0.5;

    const auto spec =
        synthesizer.synthesize({detected_service("redis", 0.3), detected_service("nginx", 0.6)}, {}, {}, options);

    EXPECT_THAT(spec.services, ElementsAre("nginx"));
}

TEST_F(Synthesizer, resourcesComeFromOptionsThenProfileThenExistingSpec)
{
    cb::CloneSpec previous;
    previous.name = "box";
    previous.resources = {cb::MemorySize{"2G"}, 2, cb::MemorySize{"30G"}};

    cb::Profile profile;
    profile.name = "heavy";
    profile.ram = cb::MemorySize{"8G"};
    profile.vcpus = 6;

    auto options = named();
    options.ram = cb::MemorySize{"12G"};

    const auto spec = synthesizer.synthesize({}, profile, cb::VersionedCloneSpec{previous}, options);

    EXPECT_EQ(spec.resources.ram, cb::MemorySize{"12G"});
    EXPECT_EQ(spec.resources.vcpus, 6);
    EXPECT_EQ(spec.resources.disk, cb::MemorySize{"30G"});
}

TEST_F(Synthesizer, freshSpecsGetDefaultResources)
{
    const auto spec = synthesize({});

    EXPECT_EQ(spec.resources, cb::ResourceLimits{});
}

TEST_F(Synthesizer, resourceCapsAreEnforced)
{
    cb::Synthesizer capped{cb::ResourceCaps{cb::MemorySize{"8G"}, 4, cb::MemorySize{"100G"}}};

    auto options = named();
    options.ram = cb::MemorySize{"16G"};
    CB_EXPECT_THROW_THAT(capped.synthesize({}, {}, {}, options), cb::ValidationError,
                         cbt::match_what(HasSubstr("above the configured cap")));

    options = named();
    options.vcpus = 8;
    EXPECT_THROW(capped.synthesize({}, {}, {}, options), cb::ValidationError);

    options = named();
    options.disk = cb::MemorySize{"1T"};
    EXPECT_THROW(capped.synthesize({}, {}, {}, options), cb::ValidationError);
}

TEST_F(Synthesizer, existingSpecIsKeptAndExtended)
{
    const auto kept = home.make_dir("kept");

    cb::CloneSpecV1 previous;
    previous.name = "legacy";
    previous.paths = {{kept.toStdString(), "/kept"}};
    previous.packages = {"git"};
    previous.post_commands = {"echo hi"};

    cb::SynthesisOptions options;
    const auto spec =
        synthesizer.synthesize({detected_service("nginx")}, {}, cb::VersionedCloneSpec{previous}, options);

    EXPECT_EQ(spec.name, "legacy");
    EXPECT_THAT(spec.mounts, ElementsAre(Pair(canonical(kept), "/kept")));
    EXPECT_THAT(spec.packages, UnorderedElementsAre("git", "nginx"));
    EXPECT_THAT(spec.post_commands, ElementsAre("echo hi"));
}

TEST_F(Synthesizer, needsAName)
{
    EXPECT_THROW(synthesizer.synthesize({}, {}, {}, cb::SynthesisOptions{}), cb::ValidationError);
}

TEST_F(Synthesizer, guestMountpointRootIsTheFirstComponent)
{
    EXPECT_EQ(cb::guest_mountpoint_root("/home/ubuntu/app"), "/home");
    EXPECT_EQ(cb::guest_mountpoint_root("/srv//data/"), "/srv");
    EXPECT_EQ(cb::guest_mountpoint_root("/"), "/");
}

TEST(PackageHints, mapsKnownNamesCaseInsensitively)
{
    const auto docker = cb::package_for("Dockerd");
    ASSERT_TRUE(docker);
    EXPECT_EQ(docker->package, "docker.io");
    EXPECT_EQ(docker->source, cb::PackageHint::Source::apt);

    const auto code = cb::package_for("code");
    ASSERT_TRUE(code);
    EXPECT_EQ(code->source, cb::PackageHint::Source::snap);

    EXPECT_FALSE(cb::package_for("frobnicator"));
}

TEST(Profile, parsesCurrentAndLegacyResourceKeys)
{
    const auto profile = cb::parse_profile("ml", YAML::Load(R"(
packages: [python3-pip]
snap_packages: [code]
services: [jupyter]
mounts:
  /data: /data
paths:
  /models: /opt/models
vm:
  ram_mb: 8192
  disk: 64G
  vcpus: 6
)"));

    EXPECT_EQ(profile.name, "ml");
    EXPECT_THAT(profile.packages, ElementsAre("python3-pip"));
    EXPECT_THAT(profile.mounts, UnorderedElementsAre(Pair("/data", "/data"), Pair("/models", "/opt/models")));
    EXPECT_EQ(profile.ram, cb::MemorySize{"8G"});
    EXPECT_EQ(profile.disk, cb::MemorySize{"64G"});
    EXPECT_EQ(profile.vcpus, 6);
}

TEST(Profile, resourcesAreOptional)
{
    const auto profile = cb::parse_profile("tools", YAML::Load("packages: [jq]\n"));

    EXPECT_FALSE(profile.ram);
    EXPECT_FALSE(profile.vcpus);
    EXPECT_FALSE(profile.disk);
}

TEST(Profile, rejectsNonMappings)
{
    EXPECT_THROW(cb::parse_profile("bad", YAML::Load("- a\n- b\n")), cb::ValidationError);
}

TEST(ProfileLoader, firstDirectoryHavingTheProfileWins)
{
    cbt::TempDir user, project;
    project.make_file("web.yaml", "packages: [nginx]\n");
    user.make_file("web.yaml", "packages: [apache2]\n");
    user.make_file("db.yaml", "packages: [postgresql]\n");

    const cb::ProfileLoader loader{{project.path(), user.path()}};

    EXPECT_THAT(loader.load("web").packages, ElementsAre("nginx"));
    EXPECT_THAT(loader.load("db").packages, ElementsAre("postgresql"));
    CB_EXPECT_THROW_THAT(loader.load("absent"), cb::ValidationError, cbt::match_what(HasSubstr("not found")));
}

TEST(ProfileLoader, defaultSearchDirectoriesAreUnderHomeThenWorkingDirectory)
{
    EXPECT_THAT(cb::ProfileLoader::default_search_directories("/home/u", "/work"),
                ElementsAre("/home/u/.clonebox.d", "/work/.clonebox.d"));
}

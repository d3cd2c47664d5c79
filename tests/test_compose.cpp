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
#include "fake_virtualization_backend.h"
#include "mock_logger.h"
#include "stub_credential_generator.h"
#include "temp_dir.h"

#include <clonebox/audit_log.h>
#include <clonebox/compose_group.h>
#include <clonebox/compose_orchestrator.h>
#include <clonebox/exceptions/backend_exceptions.h>
#include <clonebox/exceptions/validation_error.h>
#include <clonebox/health_checker.h>
#include <clonebox/lifecycle_orchestrator.h>
#include <clonebox/provisioning_renderer.h>

#include <algorithm>
#include <thread>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbt = clonebox::test;

using namespace testing;
using namespace std::chrono_literals;

namespace
{
constexpr auto stack_yaml = R"(
name: stack
vms:
  db:
    config: db.yaml
  app:
    config: specs/app.yaml
    depends_on: [db]
    health_check:
      type: agent-exec
      target: test -f /srv/app/ready
  cache:
    config: /etc/clonebox/cache.yaml
    health_check:
      port: 6379
)";

cb::ComposeMember member(const std::string& name, std::vector<std::string> depends_on = {})
{
    return {name, QString::fromStdString("/specs/" + name + ".yaml"), std::move(depends_on), std::nullopt};
}

cb::ComposeGroup group_of(std::vector<cb::ComposeMember> members)
{
    cb::ComposeGroup group;
    group.name = "group";
    for (auto& m : members)
        group.members.emplace(m.name, std::move(m));
    return group;
}

auto outcome(cb::MemberOutcome expected)
{
    return Field(&cb::MemberResult::outcome, expected);
}
} // namespace

TEST(ComposeGroup, parsesMembersDependenciesAndHealthChecks)
{
    const auto group = cb::parse_compose_group(YAML::Load(stack_yaml), "/home/dev/stack");

    EXPECT_EQ(group.name, "stack");
    EXPECT_FALSE(group.all_or_nothing);
    ASSERT_THAT(group.members, SizeIs(3));

    const auto& app = group.members.at("app");
    EXPECT_EQ(app.config, "/home/dev/stack/specs/app.yaml");
    EXPECT_THAT(app.depends_on, ElementsAre("db"));
    ASSERT_TRUE(app.health_check);
    EXPECT_EQ(app.health_check->name, "app-health");
    EXPECT_EQ(app.health_check->type, cb::ProbeType::agent_exec);
    EXPECT_EQ(app.health_check->target, "test -f /srv/app/ready");

    const auto& cache = group.members.at("cache");
    EXPECT_EQ(cache.config, "/etc/clonebox/cache.yaml");
    ASSERT_TRUE(cache.health_check);
    EXPECT_EQ(cache.health_check->type, cb::ProbeType::tcp);
    EXPECT_EQ(cache.health_check->target, "6379");

    EXPECT_FALSE(group.members.at("db").health_check);
}

TEST(ComposeGroup, groupNameDefaultsToTheDirectory)
{
    const auto group = cb::parse_compose_group(YAML::Load("vms: {a: {config: a.yaml}}"), "/home/dev/shop");

    EXPECT_EQ(group.name, "shop");
}

TEST(ComposeGroup, rejectsMalformedDocuments)
{
    EXPECT_THROW(cb::parse_compose_group(YAML::Load("- a"), "/x"), cb::ValidationError);
    EXPECT_THROW(cb::parse_compose_group(YAML::Load("name: empty"), "/x"), cb::ValidationError);
    EXPECT_THROW(cb::parse_compose_group(YAML::Load("vms: {a: {depends_on: [b]}}"), "/x"), cb::ValidationError);
}

TEST(ComposeGroup, loadingAMissingFileIsAValidationError)
{
    cbt::TempDir dir;

    EXPECT_THROW(cb::load_compose_group(dir.filePath("clonebox-compose.yaml")), cb::ValidationError);
}

TEST(ComposeGroup, unknownDependenciesAreRejected)
{
    const auto group = group_of({member("app", {"db"})});

    CB_EXPECT_THROW_THAT(cb::validate(group), cb::ValidationError,
                         cbt::match_what(HasSubstr("depends on unknown member \"db\"")));
}

TEST(ComposeGroup, cyclesAreReportedWithTheirMembers)
{
    const auto group = group_of({member("a", {"b"}), member("b", {"c"}), member("c", {"a"}), member("d")});

    CB_EXPECT_THROW_THAT(cb::validate(group), cb::CycleError,
                         Property(&cb::CycleError::members, ElementsAre("a", "b", "c", "a")));
}

TEST(ComposeGroup, selfDependencyIsACycle)
{
    EXPECT_THROW(cb::validate(group_of({member("a", {"a"})})), cb::CycleError);
}

TEST(ComposeGroup, startLevelsFollowDependencies)
{
    const auto group = group_of({member("db"), member("cache"), member("api", {"db", "cache"}),
                                 member("web", {"api"}), member("worker", {"db"})});
    std::set<std::string> all;
    for (const auto& [name, m] : group.members)
        all.insert(name);

    EXPECT_THAT(cb::start_levels(group, all),
                ElementsAre(ElementsAre("cache", "db"), ElementsAre("api", "worker"), ElementsAre("web")));
}

TEST(ComposeGroup, dependencyClosurePullsInDependencies)
{
    const auto group = group_of({member("db"), member("api", {"db"}), member("web", {"api"}), member("other")});

    EXPECT_THAT(cb::dependency_closure(group, {"web"}), ElementsAre("api", "db", "web"));
    EXPECT_THAT(cb::dependency_closure(group, {}), SizeIs(4));
    EXPECT_THROW(cb::dependency_closure(group, {"nope"}), cb::ValidationError);
}

namespace
{
struct ComposeOrchestrator : public Test
{
    ComposeOrchestrator()
    {
        dir.make_file("db.yaml", "ram_mb: 1024\n");
        dir.make_file("app.yaml", "ram_mb: 1024\npackages: [nginx]\n");

        group = group_of({member("db"), member("app", {"db"})});
        group.members.at("db").config = dir.filePath("db.yaml");
        group.members.at("app").config = dir.filePath("app.yaml");
        group.members.at("app").health_check =
            cb::HealthCheckDeclaration{"app-health", cb::ProbeType::agent_exec, "test -f /ready", 50ms, 0};
    }

    std::vector<std::string> calls_matching(const std::string& prefix)
    {
        std::vector<std::string> result;
        for (const auto& call : backend.recorded_calls())
            if (call.rfind(prefix, 0) == 0)
                result.push_back(call);
        return result;
    }

    cbt::TempDir dir;
    cb::ComposeGroup group;
    cbt::FakeVirtualizationBackend backend;
    cbt::StubCredentialGenerator credentials;
    cb::ProvisioningRenderer renderer{credentials};
    cb::AuditLog audit{"", "tester"};
    cb::LifecycleOrchestrator lifecycle{
        backend, renderer, audit, {dir.filePath("instances"), cb::SessionScope::user, 200ms, 10ms}};
    cb::HealthChecker health{backend, audit, {100ms, 10ms}};
    cb::ComposeOrchestrator compose{lifecycle, health, backend, audit, 4};
    cbt::MockLogger::Scope logger_scope = cbt::MockLogger::inject(cbl::Level::debug);
};
} // namespace

TEST_F(ComposeOrchestrator, upCreatesDependenciesFirst)
{
    const auto result = compose.up(group);

    EXPECT_TRUE(result.success());
    EXPECT_THAT(result.members,
                UnorderedElementsAre(Pair("db", outcome(cb::MemberOutcome::created)),
                                     Pair("app", outcome(cb::MemberOutcome::created))));
    EXPECT_THAT(calls_matching("define:"), ElementsAre("define:db", "define:app"));
    EXPECT_EQ(lifecycle.status("app").state, cb::VMState::running);
}

TEST_F(ComposeOrchestrator, upIsIdempotent)
{
    compose.up(group);
    lifecycle.stop("app");

    const auto result = compose.up(group);

    EXPECT_TRUE(result.success());
    EXPECT_THAT(result.members.at("db"), outcome(cb::MemberOutcome::already_running));
    EXPECT_THAT(result.members.at("app"), outcome(cb::MemberOutcome::started));
    EXPECT_THAT(calls_matching("define:"), SizeIs(2));
}

TEST_F(ComposeOrchestrator, upOfASubsetBringsItsDependencies)
{
    group.members.emplace("extra", member("extra"));

    const auto result = compose.up(group, {"app"});

    EXPECT_THAT(result.members, UnorderedElementsAre(Pair("db", _), Pair("app", _)));
    EXPECT_FALSE(backend.has_domain("extra"));
}

TEST_F(ComposeOrchestrator, membersStartOnceTheirOwnDependenciesAreUp)
{
    dir.make_file("slow.yaml", "ram_mb: 1024\n");
    group.members.emplace("slow", member("slow"));
    group.members.at("slow").config = dir.filePath("slow.yaml");
    group.members.at("slow").health_check =
        cb::HealthCheckDeclaration{"slow-health", cb::ProbeType::agent_exec, "test -f /ready", 50ms, 0};

    // slow shares a level with db and only turns healthy once app, which waits on db alone, got defined
    backend.exec_handler = [this](const std::string& name, const std::vector<std::string>&) {
        if (name != "slow")
            return cb::GuestCommandResult{0, ""};

        const auto give_up = std::chrono::steady_clock::now() + 5s;
        while (!backend.has_domain("app") && std::chrono::steady_clock::now() < give_up)
            std::this_thread::sleep_for(5ms);

        return cb::GuestCommandResult{backend.has_domain("app") ? 0 : 1, ""};
    };

    const auto result = compose.up(group);

    EXPECT_TRUE(result.success());
    EXPECT_THAT(result.members, UnorderedElementsAre(Pair("db", outcome(cb::MemberOutcome::created)),
                                                     Pair("app", outcome(cb::MemberOutcome::created)),
                                                     Pair("slow", outcome(cb::MemberOutcome::created))));
}

TEST_F(ComposeOrchestrator, allOrNothingSkipsMembersNotYetStarted)
{
    group.all_or_nothing = true;
    group.members.at("db").config = dir.filePath("missing.yaml");

    const auto result = compose.up(group);

    EXPECT_FALSE(result.success());
    EXPECT_THAT(result.members.at("db"), outcome(cb::MemberOutcome::failed));
    EXPECT_THAT(result.members.at("app"), outcome(cb::MemberOutcome::skipped));
    EXPECT_FALSE(backend.has_domain("app"));
}

TEST_F(ComposeOrchestrator, dependentsOfAFailedMemberAreSkipped)
{
    group.members.at("db").config = dir.filePath("missing.yaml");

    const auto result = compose.up(group);

    EXPECT_FALSE(result.success());
    EXPECT_THAT(result.members.at("db"), outcome(cb::MemberOutcome::failed));
    EXPECT_THAT(result.members.at("app"), AllOf(outcome(cb::MemberOutcome::skipped),
                                                Field(&cb::MemberResult::detail, HasSubstr("\"db\""))));
    EXPECT_FALSE(backend.has_domain("app"));
}

TEST_F(ComposeOrchestrator, unhealthyMemberFailsWithoutRollingBackOthers)
{
    backend.exec_handler = [](const std::string&, const std::vector<std::string>&) {
        return cb::GuestCommandResult{1, ""};
    };

    const auto result = compose.up(group);

    EXPECT_FALSE(result.success());
    EXPECT_THAT(result.members.at("app"),
                AllOf(outcome(cb::MemberOutcome::failed), Field(&cb::MemberResult::detail, HasSubstr("unhealthy"))));
    EXPECT_THAT(result.members.at("db"), outcome(cb::MemberOutcome::created));
    EXPECT_EQ(lifecycle.status("db").state, cb::VMState::running);
}

TEST_F(ComposeOrchestrator, allOrNothingRollsBackWhatItStarted)
{
    group.all_or_nothing = true;
    backend.exec_handler = [](const std::string&, const std::vector<std::string>&) {
        return cb::GuestCommandResult{1, ""};
    };

    const auto result = compose.up(group);

    EXPECT_FALSE(result.success());
    EXPECT_THAT(result.members.at("db"), outcome(cb::MemberOutcome::rolled_back));
    EXPECT_THAT(result.members.at("app"), AllOf(outcome(cb::MemberOutcome::failed),
                                                Field(&cb::MemberResult::detail, HasSubstr("stopped again"))));
    EXPECT_EQ(lifecycle.status("db").state, cb::VMState::stopped);
    EXPECT_EQ(lifecycle.status("app").state, cb::VMState::stopped);
    EXPECT_THAT(calls_matching("shutdown:"), ElementsAre("shutdown:app", "shutdown:db"));
}

TEST_F(ComposeOrchestrator, allOrNothingLeavesAlreadyRunningMembersAlone)
{
    compose.up(group, {"db"});
    group.all_or_nothing = true;
    backend.exec_handler = [](const std::string&, const std::vector<std::string>&) {
        return cb::GuestCommandResult{1, ""};
    };

    const auto result = compose.up(group);

    EXPECT_THAT(result.members.at("db"), outcome(cb::MemberOutcome::already_running));
    EXPECT_EQ(lifecycle.status("db").state, cb::VMState::running);
}

TEST_F(ComposeOrchestrator, downStopsDependentsFirst)
{
    compose.up(group);

    const auto result = compose.down(group);

    EXPECT_TRUE(result.success());
    EXPECT_THAT(result.members, UnorderedElementsAre(Pair("db", outcome(cb::MemberOutcome::stopped)),
                                                     Pair("app", outcome(cb::MemberOutcome::stopped))));
    EXPECT_THAT(calls_matching("shutdown:"), ElementsAre("shutdown:app", "shutdown:db"));
}

TEST_F(ComposeOrchestrator, downOfASubsetStopsOnlyThatSubset)
{
    compose.up(group);

    const auto result = compose.down(group, {"db"});

    EXPECT_THAT(result.members, ElementsAre(Pair("db", outcome(cb::MemberOutcome::stopped))));
    EXPECT_EQ(lifecycle.status("app").state, cb::VMState::running);
}

TEST_F(ComposeOrchestrator, downOfStoppedMembersIsANoOp)
{
    const auto result = compose.down(group, {}, true);

    EXPECT_TRUE(result.success());
    EXPECT_THAT(result.members.at("db"), outcome(cb::MemberOutcome::already_stopped));
    EXPECT_THAT(calls_matching("destroy:"), IsEmpty());
}

TEST_F(ComposeOrchestrator, upAndDownAreAudited)
{
    compose.up(group);
    compose.down(group);

    cb::AuditQuery query;
    query.kinds = {cb::AuditEventKind::compose_up, cb::AuditEventKind::compose_down};
    EXPECT_THAT(audit.query(query), ElementsAre(Field(&cb::AuditEvent::target, "group"),
                                                Field(&cb::AuditEvent::target, "group")));
}

TEST_F(ComposeOrchestrator, statusCoversEveryMember)
{
    compose.up(group, {"db"});

    const auto records = compose.status(group);

    EXPECT_THAT(records, UnorderedElementsAre(Pair("db", Field(&cb::VMRecord::state, cb::VMState::running)),
                                              Pair("app", Field(&cb::VMRecord::state, cb::VMState::absent))));
}

TEST_F(ComposeOrchestrator, execAndLogsGoThroughTheGuestAgent)
{
    compose.up(group);
    std::vector<std::vector<std::string>> seen;
    backend.exec_handler = [&seen](const std::string&, const std::vector<std::string>& argv) {
        seen.push_back(argv);
        return cb::GuestCommandResult{0, "output"};
    };

    EXPECT_EQ(compose.exec(group, "app", "uptime"), "output");
    EXPECT_EQ(compose.logs(group, "db", 20), "output");
    EXPECT_THAT(seen, ElementsAre(ElementsAre("/bin/sh", "-c", "uptime"),
                                  ElementsAre("journalctl", "--no-pager", "-n", "20")));

    EXPECT_THROW(compose.exec(group, "nope", "uptime"), cb::ValidationError);
}

TEST_F(ComposeOrchestrator, failingCommandsAreReported)
{
    compose.up(group);
    backend.exec_handler = [](const std::string&, const std::vector<std::string>&) {
        return cb::GuestCommandResult{2, "no such file"};
    };

    CB_EXPECT_THROW_THAT(compose.exec(group, "app", "cat /nope"), cb::BackendError,
                         cbt::match_what(HasSubstr("exit status 2")));
}

TEST_F(ComposeOrchestrator, cyclicGroupsAreRejectedBeforeAnythingStarts)
{
    group.members.at("db").depends_on = {"app"};

    EXPECT_THROW(compose.up(group), cb::CycleError);
    EXPECT_THAT(backend.recorded_calls(), IsEmpty());
}

TEST_F(ComposeOrchestrator, needsAtLeastOneWorker)
{
    EXPECT_THROW((cb::ComposeOrchestrator{lifecycle, health, backend, audit, 0}), cb::ValidationError);
}

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
#include "mock_virtualization_backend.h"
#include "stub_credential_generator.h"
#include "temp_dir.h"

#include <clonebox/audit_log.h>
#include <clonebox/exceptions/backend_exceptions.h>
#include <clonebox/exceptions/lifecycle_exceptions.h>
#include <clonebox/exceptions/provisioning_failure.h>
#include <clonebox/exceptions/validation_error.h>
#include <clonebox/lifecycle_orchestrator.h>
#include <clonebox/provisioning_renderer.h>

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

#include <algorithm>
#include <climits>
#include <future>
#include <thread>

namespace cb = clonebox;
namespace cbl = clonebox::logging;
namespace cbt = clonebox::test;

using namespace testing;
using namespace std::chrono_literals;

namespace
{
struct LifecycleOrchestrator : public Test
{
    LifecycleOrchestrator()
    {
        spec.name = "web";
        spec.scope = cb::SessionScope::user;
        spec.packages = {"nginx"};
        spec.mounts = {{host.make_dir("site").toStdString(), "/srv/site"}};
    }

    cb::LifecycleSettings settings()
    {
        return {data.path(), cb::SessionScope::user, 200ms, 10ms};
    }

    long count_calls(const std::string& call)
    {
        const auto calls = backend.recorded_calls();
        return std::count(calls.begin(), calls.end(), call);
    }

    std::vector<std::string> data_listing()
    {
        std::vector<std::string> entries;
        QDirIterator it{data.path(), QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot,
                        QDirIterator::Subdirectories};
        while (it.hasNext())
            entries.push_back(QDir{data.path()}.relativeFilePath(it.next()).toStdString());

        std::sort(entries.begin(), entries.end());
        return entries;
    }

    std::vector<cb::AuditOutcome> outcomes(cb::AuditEventKind kind)
    {
        cb::AuditQuery query;
        query.kinds = {kind};

        std::vector<cb::AuditOutcome> result;
        for (const auto& event : audit.query(query))
            result.push_back(event.outcome);
        return result;
    }

    cbt::TempDir data;
    cbt::TempDir host;
    cb::CloneSpec spec;
    cbt::FakeVirtualizationBackend backend;
    cbt::StubCredentialGenerator credentials;
    cb::ProvisioningRenderer renderer{credentials};
    cb::AuditLog audit{"", "tester"};
    cb::LifecycleOrchestrator orchestrator{backend, renderer, audit, settings()};
    cbt::MockLogger::Scope logger_scope = cbt::MockLogger::inject(cbl::Level::debug);
};

struct CreateRollback : public LifecycleOrchestrator, public WithParamInterface<std::pair<std::string, std::string>>
{
};
} // namespace

TEST_F(LifecycleOrchestrator, createLeavesARunningInstance)
{
    const auto record = orchestrator.create(spec);

    EXPECT_EQ(record.name, "web");
    EXPECT_EQ(record.state, cb::VMState::running);
    EXPECT_EQ(record.scope, cb::SessionScope::user);
    EXPECT_EQ(record.address, "10.0.2.15");
    EXPECT_TRUE(record.created_at.isValid());

    const auto& store = orchestrator.storage();
    EXPECT_TRUE(store.exists("web"));
    EXPECT_TRUE(QFileInfo::exists(QDir{store.seed_directory("web")}.filePath("user-data")));
    EXPECT_TRUE(QFileInfo::exists(QDir{store.seed_directory("web")}.filePath("network-config")));
    EXPECT_TRUE(QFileInfo::exists(store.private_key_path("web")));
    EXPECT_THAT(store.instance_directory("web").toStdString(), EndsWith("/user/web"));

    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_create), ElementsAre(cb::AuditOutcome::success));
    EXPECT_THAT(outcomes(cb::AuditEventKind::credentials_generated), ElementsAre(cb::AuditOutcome::success));
}

TEST_F(LifecycleOrchestrator, createRegistersTheRenderedDefinition)
{
    orchestrator.create(spec);

    const auto calls = backend.recorded_calls();
    const auto define = std::find(calls.begin(), calls.end(), "define:web");
    const auto start = std::find(calls.begin(), calls.end(), "start:web");
    ASSERT_NE(define, calls.end());
    EXPECT_LT(define, start);
    EXPECT_EQ(orchestrator.status("web").state, cb::VMState::running);
}

TEST_F(LifecycleOrchestrator, createRejectsInvalidSpecsBeforeTouchingTheBackend)
{
    spec.resources.ram = cb::MemorySize{"128M"};

    EXPECT_THROW(orchestrator.create(spec), cb::ValidationError);
    EXPECT_THAT(backend.recorded_calls(), IsEmpty());
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_create), ElementsAre(cb::AuditOutcome::failure));
}

TEST_F(LifecycleOrchestrator, createRejectsSpecsOfTheOtherSession)
{
    spec.scope = cb::SessionScope::system;

    CB_EXPECT_THROW_THAT(orchestrator.create(spec), cb::ValidationError,
                         cbt::match_what(HasSubstr("belongs to the system session")));
    EXPECT_FALSE(orchestrator.storage().exists("web"));
}

TEST_F(LifecycleOrchestrator, createRefusesExistingInstances)
{
    orchestrator.create(spec);

    EXPECT_THROW(orchestrator.create(spec), cb::InstanceAlreadyExists);
    EXPECT_EQ(count_calls("define:web"), 1);
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_create),
                ElementsAre(cb::AuditOutcome::success, cb::AuditOutcome::failure));
}

TEST_F(LifecycleOrchestrator, createRefusesLeftoverStorage)
{
    data.make_dir("user/web");

    EXPECT_THROW(orchestrator.create(spec), cb::InstanceAlreadyExists);
}

TEST_P(CreateRollback, undoesEveryCompletedStep)
{
    const auto& [call, step] = GetParam();
    backend.fail_on(call, [] { throw cb::BackendError{"injected"}; });
    const auto before = data_listing();

    try
    {
        orchestrator.create(spec);
        FAIL() << "create should have failed";
    }
    catch (const cb::ProvisioningFailure& e)
    {
        EXPECT_EQ(e.instance_name(), "web");
        EXPECT_EQ(e.step(), step);
        EXPECT_THAT(e.what(), HasSubstr("injected"));
    }

    EXPECT_FALSE(backend.has_domain("web"));
    EXPECT_FALSE(orchestrator.storage().exists("web"));
    EXPECT_EQ(orchestrator.status("web").state, cb::VMState::absent);
    EXPECT_THAT(orchestrator.list(), IsEmpty());
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_create), ElementsAre(cb::AuditOutcome::failure));
    EXPECT_EQ(data_listing(), before);
}

INSTANTIATE_TEST_SUITE_P(LifecycleOrchestrator, CreateRollback,
                         Values(std::make_pair("define", "register the instance"),
                                std::make_pair("start", "start the instance")));

TEST_F(LifecycleOrchestrator, createRollsBackWhenStorageCannotBeAllocated)
{
    data.make_file("user/web"); // a file where the instance directory should be
    const auto before = data_listing();

    CB_EXPECT_THROW_THAT(orchestrator.create(spec), cb::ProvisioningFailure,
                         Property(&cb::ProvisioningFailure::step, "allocate backing storage"));
    EXPECT_THAT(backend.recorded_calls(), Not(Contains("define:web")));
    EXPECT_EQ(data_listing(), before);
}

TEST_F(LifecycleOrchestrator, createRollsBackWhenTheBundleCannotBeWritten)
{
    // Nest the data root so that the instance directory still fits within PATH_MAX but nothing inside it does
    auto root = data.path();
    const auto instance_suffix = QStringLiteral("/user/web").size();
    for (auto room = PATH_MAX - 1 - instance_suffix - root.size(); room > 10;
         room = PATH_MAX - 1 - instance_suffix - root.size())
        root += QStringLiteral("/") + QString(std::min<qsizetype>(room - 1, 200), QLatin1Char('d'));

    cb::LifecycleOrchestrator deep_orchestrator{backend, renderer, audit,
                                                {root, cb::SessionScope::user, 200ms, 10ms}};
    ASSERT_TRUE(QFileInfo{QDir{root}.filePath("user")}.isDir());
    const auto before = data_listing();

    CB_EXPECT_THROW_THAT(deep_orchestrator.create(spec), cb::ProvisioningFailure,
                         Property(&cb::ProvisioningFailure::step, "write the provisioning bundle"));
    EXPECT_THAT(backend.recorded_calls(), Not(Contains("define:web")));
    EXPECT_FALSE(deep_orchestrator.storage().exists("web"));
    EXPECT_EQ(data_listing(), before);
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_create), ElementsAre(cb::AuditOutcome::failure));
}

TEST_F(LifecycleOrchestrator, unreachableBackendIsNotWrappedButStillRolledBack)
{
    backend.fail_on("start", [] { throw cb::BackendUnavailable{"connection refused"}; });

    EXPECT_THROW(orchestrator.create(spec), cb::BackendUnavailable);
    EXPECT_FALSE(backend.has_domain("web"));
    EXPECT_FALSE(orchestrator.storage().exists("web"));
}

TEST_F(LifecycleOrchestrator, expiredDeadlineCancelsCreateBeforeAnyStep)
{
    const cb::Deadline expired{cb::Deadline::Clock::now() - 1s};

    EXPECT_THROW(orchestrator.create(spec, expired), cb::OperationCancelled);
    EXPECT_FALSE(orchestrator.storage().exists("web"));
    EXPECT_FALSE(backend.has_domain("web"));
}

TEST_F(LifecycleOrchestrator, startingARunningInstanceIsSkipped)
{
    orchestrator.create(spec);

    const auto record = orchestrator.start("web");

    EXPECT_EQ(record.state, cb::VMState::running);
    EXPECT_EQ(count_calls("start:web"), 1);
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_start), ElementsAre(cb::AuditOutcome::skipped));
}

TEST_F(LifecycleOrchestrator, stopAsksTheGuestFirst)
{
    orchestrator.create(spec);

    const auto record = orchestrator.stop("web");

    EXPECT_EQ(record.state, cb::VMState::stopped);
    EXPECT_TRUE(record.address.empty());
    EXPECT_EQ(count_calls("shutdown:web"), 1);
    EXPECT_EQ(count_calls("destroy:web"), 0);
}

TEST_F(LifecycleOrchestrator, stopForcesOffAGuestThatIgnoresShutdown)
{
    orchestrator.create(spec);
    backend.graceful_shutdown = false;

    const auto record = orchestrator.stop("web");

    EXPECT_EQ(record.state, cb::VMState::stopped);
    EXPECT_EQ(count_calls("shutdown:web"), 1);
    EXPECT_EQ(count_calls("destroy:web"), 1);
}

TEST_F(LifecycleOrchestrator, forcedStopSkipsShutdown)
{
    orchestrator.create(spec);

    orchestrator.stop("web", true);

    EXPECT_EQ(count_calls("shutdown:web"), 0);
    EXPECT_EQ(count_calls("destroy:web"), 1);
}

TEST_F(LifecycleOrchestrator, stoppingTwiceIsSkipped)
{
    orchestrator.create(spec);
    orchestrator.stop("web");

    EXPECT_EQ(orchestrator.stop("web").state, cb::VMState::stopped);
    EXPECT_EQ(count_calls("shutdown:web"), 1);
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_stop),
                ElementsAre(cb::AuditOutcome::success, cb::AuditOutcome::skipped));
}

TEST_F(LifecycleOrchestrator, restartStopsThenStarts)
{
    orchestrator.create(spec);

    const auto record = orchestrator.restart("web");

    EXPECT_EQ(record.state, cb::VMState::running);
    EXPECT_EQ(count_calls("shutdown:web"), 1);
    EXPECT_EQ(count_calls("start:web"), 2);
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_restart), ElementsAre(cb::AuditOutcome::success));
}

TEST_F(LifecycleOrchestrator, unknownInstancesAreNotFound)
{
    EXPECT_THROW(orchestrator.start("ghost"), cb::InstanceNotFound);
    EXPECT_THROW(orchestrator.stop("ghost"), cb::InstanceNotFound);
    EXPECT_EQ(orchestrator.status("ghost").state, cb::VMState::absent);
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_start), ElementsAre(cb::AuditOutcome::failure));
}

TEST_F(LifecycleOrchestrator, backendFailureMarksTheInstanceFailedUntilDeleted)
{
    orchestrator.create(spec);
    orchestrator.stop("web");
    backend.fail_on("start", [] { throw cb::BackendError{"no space left on device"}; });

    EXPECT_THROW(orchestrator.start("web"), cb::BackendError);
    EXPECT_EQ(orchestrator.status("web").state, cb::VMState::failed);

    CB_EXPECT_THROW_THAT(orchestrator.start("web"), cb::VMStateInvalidException,
                         cbt::match_what(HasSubstr("needs to be deleted")));
    EXPECT_EQ(orchestrator.stop("web").state, cb::VMState::failed);

    orchestrator.delete_vm("web");
    EXPECT_EQ(orchestrator.status("web").state, cb::VMState::absent);
}

TEST_F(LifecycleOrchestrator, unreachableBackendDoesNotFailTheInstance)
{
    orchestrator.create(spec);
    orchestrator.stop("web");
    backend.fail_on("start", [] { throw cb::BackendUnavailable{"connection refused"}; });

    EXPECT_THROW(orchestrator.start("web"), cb::BackendUnavailable);
    EXPECT_EQ(orchestrator.status("web").state, cb::VMState::stopped);
}

TEST_F(LifecycleOrchestrator, crashedGuestsAreFailed)
{
    orchestrator.create(spec);
    backend.set_state("web", cb::DomainState::crashed);

    EXPECT_EQ(orchestrator.status("web").state, cb::VMState::failed);
}

TEST_F(LifecycleOrchestrator, statusFollowsChangesBehindOurBack)
{
    orchestrator.create(spec);
    backend.set_state("web", cb::DomainState::shut_off);

    EXPECT_EQ(orchestrator.status("web").state, cb::VMState::stopped);
    EXPECT_THAT(orchestrator.stop("web"), Field(&cb::VMRecord::state, cb::VMState::stopped));
    EXPECT_EQ(count_calls("shutdown:web"), 0);
}

TEST_F(LifecycleOrchestrator, staleStateIsReconciledAndRetriedOnce)
{
    orchestrator.create(spec);
    backend.fail_on("shutdown", [] { throw cb::StaleStateConflict{"domain changed"}; });

    EXPECT_EQ(orchestrator.stop("web").state, cb::VMState::stopped);
    EXPECT_EQ(count_calls("shutdown:web"), 2);
}

TEST_F(LifecycleOrchestrator, repeatedStaleStateGivesUp)
{
    orchestrator.create(spec);
    backend.fail_on("shutdown", [] { throw cb::StaleStateConflict{"domain changed"}; }, 2);

    EXPECT_THROW(orchestrator.stop("web"), cb::StaleStateConflict);
    EXPECT_EQ(orchestrator.status("web").state, cb::VMState::running);
}

TEST_F(LifecycleOrchestrator, deleteRemovesEverythingAndIsIdempotent)
{
    orchestrator.create(spec);

    orchestrator.delete_vm("web");
    EXPECT_FALSE(backend.has_domain("web"));
    EXPECT_FALSE(orchestrator.storage().exists("web"));
    EXPECT_EQ(count_calls("destroy:web"), 1);

    orchestrator.delete_vm("web");
    EXPECT_EQ(count_calls("undefine:web"), 1);
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_delete),
                ElementsAre(cb::AuditOutcome::success, cb::AuditOutcome::skipped));
}

TEST_F(LifecycleOrchestrator, deleteCleansUpOrphanedStorage)
{
    EXPECT_CALL(*logger_scope.mock_logger, log).Times(AnyNumber());
    logger_scope.mock_logger->expect_log(cbl::Level::warning, "without a registered instance");
    data.make_file("user/ghost/disk.qcow2", "qcow");

    orchestrator.delete_vm("ghost");

    EXPECT_FALSE(orchestrator.storage().exists("ghost"));
    EXPECT_THAT(outcomes(cb::AuditEventKind::vm_delete), ElementsAre(cb::AuditOutcome::success));
}

TEST_F(LifecycleOrchestrator, listReportsKnownInstances)
{
    orchestrator.create(spec);
    spec.name = "db";
    spec.mounts.clear();
    orchestrator.create(spec);
    orchestrator.stop("db");

    const auto records = orchestrator.list();

    ASSERT_THAT(records, SizeIs(2));
    EXPECT_EQ(records[0].name, "db");
    EXPECT_EQ(records[0].state, cb::VMState::stopped);
    EXPECT_EQ(records[1].name, "web");
    EXPECT_EQ(records[1].state, cb::VMState::running);
}

TEST_F(LifecycleOrchestrator, operationsOnOneInstanceAreSerialized)
{
    orchestrator.create(spec);

    std::promise<void> locked, release;
    std::thread holder{[this, &locked, &release] {
        auto lock = orchestrator.lock("web");
        locked.set_value();
        release.get_future().wait();
    }};
    locked.get_future().wait();

    EXPECT_THROW(orchestrator.stop("web", false, cb::Deadline::after(50ms)), cb::OperationCancelled);

    release.set_value();
    holder.join();
    EXPECT_EQ(orchestrator.status("web").state, cb::VMState::running);
}

namespace
{
struct LifecycleWithMockBackend : public Test
{
    cbt::TempDir data;
    StrictMock<cbt::MockVirtualizationBackend> backend;
    cbt::StubCredentialGenerator credentials;
    cb::ProvisioningRenderer renderer{credentials};
    cb::AuditLog audit{"", "tester"};
    cb::LifecycleOrchestrator orchestrator{
        backend, renderer, audit, {data.path(), cb::SessionScope::user, 200ms, 10ms}};
    cbt::MockLogger::Scope logger_scope = cbt::MockLogger::inject();
};
} // namespace

TEST_F(LifecycleWithMockBackend, invalidSpecsNeverReachTheBackend)
{
    cb::CloneSpec spec;
    spec.name = "not a hostname";

    EXPECT_THROW(orchestrator.create(spec), cb::ValidationError);
}

TEST_F(LifecycleWithMockBackend, startOnlyTouchesTheNamedDomain)
{
    EXPECT_CALL(backend, domain_status("web"))
        .WillOnce(Return(cb::DomainStatus{cb::DomainState::shut_off, ""}))
        .WillRepeatedly(Return(cb::DomainStatus{cb::DomainState::running, "10.0.2.15"}));
    EXPECT_CALL(backend, start("web"));

    const auto record = orchestrator.start("web");

    EXPECT_EQ(record.state, cb::VMState::running);
    EXPECT_EQ(record.address, "10.0.2.15");
}

TEST_F(LifecycleWithMockBackend, statusSurfacesAnUnreachableBackend)
{
    EXPECT_CALL(backend, domain_status("web")).WillOnce(Throw(cb::BackendUnavailable{"libvirtd is not running"}));

    EXPECT_THROW(orchestrator.status("web"), cb::BackendUnavailable);
}

/**
 * @file process_supervisor_test.cpp
 * @brief ProcessSupervisor ownership rules with a mocked launcher
 *
 * Tests:
 * - spawn stores the handle; spawn errors are returned, nothing stored
 * - single backend instance: second spawn refused while a handle is held
 * - terminate is idempotent and only kills the owned handle
 * - release drops ownership without killing
 * - destructor kills a still-owned child
 * - concurrent terminate calls kill exactly once (run under TSAN in CI)
 */

#include "process/process_supervisor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "mocks/mock_process_launcher.hpp"

using namespace tether;
using namespace tether::process;
using namespace tether::tests;
using namespace testing;

namespace {

LaunchSpec backend_spec() {
    LaunchSpec spec;
    spec.executable = "/opt/app/backend";
    spec.env["PORT"] = "4000";
    return spec;
}

}  // namespace

TEST(ProcessSupervisorTest, SpawnStoresHandle) {
    NiceMock<MockProcessLauncher> launcher;
    launcher.succeed_spawn_with(make_handle(3, 100));

    ProcessSupervisor supervisor(launcher);
    std::string error;

    ASSERT_TRUE(supervisor.spawn(backend_spec(), error)) << error;
    ASSERT_TRUE(supervisor.handle().has_value());
    EXPECT_EQ(supervisor.handle()->id, 3u);
    EXPECT_EQ(supervisor.handle()->pid, 100);

    supervisor.terminate();
}

TEST(ProcessSupervisorTest, SpawnPassesSpecToLauncher) {
    NiceMock<MockProcessLauncher> launcher;
    EXPECT_CALL(launcher, spawn(Field(&LaunchSpec::executable, "/opt/app/backend"), _, _))
        .WillOnce(DoAll(SetArgReferee<1>(make_handle()), Return(true)));

    ProcessSupervisor supervisor(launcher);
    std::string error;
    EXPECT_TRUE(supervisor.spawn(backend_spec(), error));
}

TEST(ProcessSupervisorTest, SpawnErrorIsReportedAndNothingStored) {
    NiceMock<MockProcessLauncher> launcher;
    launcher.fail_spawn_with("Executable not found: /opt/app/backend");
    EXPECT_CALL(launcher, kill(_)).Times(0);

    ProcessSupervisor supervisor(launcher);
    std::string error;

    EXPECT_FALSE(supervisor.spawn(backend_spec(), error));
    EXPECT_NE(error.find("not found"), std::string::npos);
    EXPECT_FALSE(supervisor.handle().has_value());
}

TEST(ProcessSupervisorTest, SecondSpawnRefusedWhileHandleHeld) {
    NiceMock<MockProcessLauncher> launcher;
    launcher.succeed_spawn_with(make_handle());
    EXPECT_CALL(launcher, spawn(_, _, _)).Times(1);

    ProcessSupervisor supervisor(launcher);
    std::string error;

    ASSERT_TRUE(supervisor.spawn(backend_spec(), error));
    EXPECT_FALSE(supervisor.spawn(backend_spec(), error));
    EXPECT_NE(error.find("already running"), std::string::npos);

    supervisor.terminate();
}

TEST(ProcessSupervisorTest, TerminateKillsOnceAndIsIdempotent) {
    NiceMock<MockProcessLauncher> launcher;
    auto handle = make_handle(1, 555);
    launcher.succeed_spawn_with(handle);
    EXPECT_CALL(launcher, kill(handle)).Times(1);

    ProcessSupervisor supervisor(launcher);
    std::string error;
    ASSERT_TRUE(supervisor.spawn(backend_spec(), error));

    EXPECT_TRUE(supervisor.terminate(handle));
    EXPECT_FALSE(supervisor.terminate(handle));
    EXPECT_FALSE(supervisor.terminate());
    EXPECT_FALSE(supervisor.handle().has_value());
}

TEST(ProcessSupervisorTest, TerminateUnknownHandleIsNoOp) {
    NiceMock<MockProcessLauncher> launcher;
    launcher.succeed_spawn_with(make_handle(1));
    EXPECT_CALL(launcher, kill(make_handle(1))).Times(1);  // from the destructor only

    ProcessSupervisor supervisor(launcher);
    std::string error;
    ASSERT_TRUE(supervisor.spawn(backend_spec(), error));

    EXPECT_FALSE(supervisor.terminate(make_handle(99)));
    EXPECT_TRUE(supervisor.handle().has_value());
}

TEST(ProcessSupervisorTest, TerminateWithoutSpawnIsNoOp) {
    StrictMock<MockProcessLauncher> launcher;
    ProcessSupervisor supervisor(launcher);

    EXPECT_FALSE(supervisor.terminate());
    EXPECT_FALSE(supervisor.terminate(make_handle()));
}

TEST(ProcessSupervisorTest, ReleaseDropsOwnershipWithoutKill) {
    NiceMock<MockProcessLauncher> launcher;
    auto handle = make_handle();
    launcher.succeed_spawn_with(handle);
    EXPECT_CALL(launcher, kill(_)).Times(0);
    EXPECT_CALL(launcher, release(handle)).Times(1);

    {
        ProcessSupervisor supervisor(launcher);
        std::string error;
        ASSERT_TRUE(supervisor.spawn(backend_spec(), error));

        supervisor.release(handle);
        EXPECT_FALSE(supervisor.handle().has_value());

        // Second release and destructor do not reach the launcher again
        supervisor.release(handle);
    }
}

TEST(ProcessSupervisorTest, ReleaseOfForeignHandleIsIgnored) {
    NiceMock<MockProcessLauncher> launcher;
    launcher.succeed_spawn_with(make_handle(1));
    EXPECT_CALL(launcher, release(_)).Times(0);

    ProcessSupervisor supervisor(launcher);
    std::string error;
    ASSERT_TRUE(supervisor.spawn(backend_spec(), error));

    supervisor.release(make_handle(99));
    EXPECT_TRUE(supervisor.handle().has_value());
}

TEST(ProcessSupervisorTest, SpawnAllowedAgainAfterTerminate) {
    NiceMock<MockProcessLauncher> launcher;
    EXPECT_CALL(launcher, spawn(_, _, _))
        .WillOnce(DoAll(SetArgReferee<1>(make_handle(1)), Return(true)))
        .WillOnce(DoAll(SetArgReferee<1>(make_handle(2)), Return(true)));

    ProcessSupervisor supervisor(launcher);
    std::string error;

    ASSERT_TRUE(supervisor.spawn(backend_spec(), error));
    supervisor.terminate();
    ASSERT_TRUE(supervisor.spawn(backend_spec(), error));
    EXPECT_EQ(supervisor.handle()->id, 2u);
}

TEST(ProcessSupervisorTest, DestructorKillsOwnedChild) {
    NiceMock<MockProcessLauncher> launcher;
    auto handle = make_handle();
    launcher.succeed_spawn_with(handle);
    EXPECT_CALL(launcher, kill(handle)).Times(1);

    {
        ProcessSupervisor supervisor(launcher);
        std::string error;
        ASSERT_TRUE(supervisor.spawn(backend_spec(), error));
    }
}

TEST(ProcessSupervisorTest, IsRunningDelegatesToLauncher) {
    NiceMock<MockProcessLauncher> launcher;
    auto handle = make_handle();
    launcher.succeed_spawn_with(handle);
    EXPECT_CALL(launcher, is_running(handle)).WillOnce(Return(true)).WillOnce(Return(false));

    ProcessSupervisor supervisor(launcher);
    EXPECT_FALSE(supervisor.is_running());  // nothing owned yet, launcher not asked

    std::string error;
    ASSERT_TRUE(supervisor.spawn(backend_spec(), error));
    EXPECT_TRUE(supervisor.is_running());
    EXPECT_FALSE(supervisor.is_running());

    supervisor.terminate();
}

TEST(ProcessSupervisorTest, ConcurrentTerminateKillsExactlyOnce) {
    NiceMock<MockProcessLauncher> launcher;
    auto handle = make_handle();
    launcher.succeed_spawn_with(handle);

    std::atomic<int> kills{0};
    ON_CALL(launcher, kill(_)).WillByDefault(Invoke([&kills](const ProcessHandle &) { kills++; }));

    ProcessSupervisor supervisor(launcher);
    std::string error;
    ASSERT_TRUE(supervisor.spawn(backend_spec(), error));

    std::vector<std::thread> threads;
    std::atomic<int> successes{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (supervisor.terminate(handle)) {
                successes++;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(kills.load(), 1);
}

/**
 * process_supervisor_test.cpp - ProcessSupervisor unit tests
 *
 * Tests use small shell scripts in place of the PHD2 binary and a check-counting
 * connection factory in place of the RPC port.
 *
 * Tests:
 * - start() is a no-op when something already listens
 * - Missing executable
 * - Process exiting before the port opens
 * - Startup timeout
 * - Successful start, forced stop, graceful stop via the shutdown RPC
 * - Extra environment reaches the child
 * - Second start while the first process is alive, reachable or not
 */

#ifndef _WIN32

#include "process/process_supervisor.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "mocks/fake_connection.hpp"
#include "mocks/mock_guider_client.hpp"
#include "support/wait_helpers.hpp"

using namespace guidelink;
using namespace guidelink::process;
using namespace guidelink::tests;

namespace {

// Reports the port reachable from the Nth check onwards
class ReachableAfterChecks : public transport::IConnectionFactory {
public:
    explicit ReachableAfterChecks(int checks_until_reachable) : threshold_(checks_until_reachable) {}

    std::shared_ptr<transport::IConnection> connect(const std::string &, int, int, std::string &error) override {
        error = "not supported";
        return nullptr;
    }

    bool can_connect(const std::string &, int, int) override { return ++checks_ >= threshold_; }

private:
    int threshold_;
    std::atomic<int> checks_{0};
};

}  // namespace

class ProcessSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("guidelink_process_test_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);

        options_.startup_timeout_ms = 2000;
        options_.shutdown_timeout_ms = 2000;
        options_.poll_interval_ms = 20;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_script(const std::string &name, const std::string &body) {
        auto path = dir_ / name;
        std::ofstream script(path.string());
        script << "#!/bin/sh\n" << body << "\n";
        script.close();
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_exec | std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::add);
        return path.string();
    }

    std::string read_file(const std::string &name) {
        std::ifstream in((dir_ / name).string());
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path dir_;
    ProcessOptions options_;
};

TEST_F(ProcessSupervisorTest, AlreadyListeningSkipsSpawn) {
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->set_reachable(true);
    options_.executable_path = (dir_ / "does_not_exist").string();

    ProcessSupervisor supervisor(options_, factory);
    auto status = supervisor.start();

    EXPECT_TRUE(status.ok()) << status.message;
    EXPECT_FALSE(supervisor.has_managed_process());
}

TEST_F(ProcessSupervisorTest, MissingExecutableOverride) {
    auto factory = std::make_shared<FakeConnectionFactory>();
    std::string missing = (dir_ / "phd2_missing").string();

    ProcessSupervisor supervisor(options_, factory);
    auto status = supervisor.start(missing);

    EXPECT_EQ(status.code, ErrorCode::EXECUTABLE_NOT_FOUND);
    EXPECT_NE(status.message.find(missing), std::string::npos);
    EXPECT_FALSE(supervisor.has_managed_process());
}

TEST_F(ProcessSupervisorTest, PrematureExitReportsStatus) {
    auto factory = std::make_shared<FakeConnectionFactory>();
    options_.executable_path = write_script("phd2", "exit 3");

    ProcessSupervisor supervisor(options_, factory);
    auto status = supervisor.start();

    EXPECT_EQ(status.code, ErrorCode::PROCESS_START_FAILED);
    EXPECT_NE(status.message.find("exited prematurely with status: 3"), std::string::npos) << status.message;
    EXPECT_EQ(supervisor.last_exit_status(), 3);
    EXPECT_FALSE(supervisor.is_running());
}

TEST_F(ProcessSupervisorTest, StartupTimeoutLeavesProcessForStop) {
    auto factory = std::make_shared<FakeConnectionFactory>();
    options_.executable_path = write_script("phd2", "exec sleep 30");
    options_.startup_timeout_ms = 200;

    ProcessSupervisor supervisor(options_, factory);
    auto status = supervisor.start();

    EXPECT_EQ(status.code, ErrorCode::TIMEOUT);
    EXPECT_EQ(status.message, "PHD2 did not become ready within 200ms");
    EXPECT_TRUE(supervisor.is_running());

    EXPECT_TRUE(supervisor.stop().ok());
    EXPECT_FALSE(supervisor.is_running());
}

TEST_F(ProcessSupervisorTest, StartThenForcedStop) {
    auto factory = std::make_shared<ReachableAfterChecks>(3);
    options_.executable_path = write_script("phd2", "exec sleep 30");

    ProcessSupervisor supervisor(options_, factory);
    auto status = supervisor.start();
    ASSERT_TRUE(status.ok()) << status.message;
    EXPECT_TRUE(supervisor.has_managed_process());
    EXPECT_TRUE(supervisor.is_running());

    EXPECT_TRUE(supervisor.stop(nullptr).ok());
    EXPECT_FALSE(supervisor.is_running());
    EXPECT_FALSE(supervisor.has_managed_process());
}

TEST_F(ProcessSupervisorTest, SecondStartWhileRunningIsRejected) {
    auto factory = std::make_shared<FakeConnectionFactory>();
    options_.executable_path = write_script("phd2", "exec sleep 30");
    options_.startup_timeout_ms = 100;

    ProcessSupervisor supervisor(options_, factory);
    ASSERT_EQ(supervisor.start().code, ErrorCode::TIMEOUT);

    EXPECT_EQ(supervisor.start().code, ErrorCode::PROCESS_ALREADY_RUNNING);
    EXPECT_TRUE(supervisor.stop().ok());
}

TEST_F(ProcessSupervisorTest, SecondStartWhileReachableIsStillRejected) {
    auto factory = std::make_shared<ReachableAfterChecks>(2);
    options_.executable_path = write_script("phd2", "exec sleep 30");

    ProcessSupervisor supervisor(options_, factory);
    ASSERT_TRUE(supervisor.start().ok());
    ASSERT_TRUE(supervisor.is_reachable());

    EXPECT_EQ(supervisor.start().code, ErrorCode::PROCESS_ALREADY_RUNNING);
    EXPECT_TRUE(supervisor.stop().ok());
}

TEST_F(ProcessSupervisorTest, GracefulStopUsesShutdownRpc) {
    auto factory = std::make_shared<ReachableAfterChecks>(2);
    std::string stop_file = (dir_ / "stop_requested").string();
    options_.executable_path = write_script("phd2", "while [ ! -f \"$STOP_FILE\" ]; do sleep 0.05; done\nexit 0");
    options_.spawn_env["STOP_FILE"] = stop_file;

    ProcessSupervisor supervisor(options_, factory);
    ASSERT_TRUE(supervisor.start().ok());

    MockGuiderClient client;
    EXPECT_CALL(client, is_connected()).WillRepeatedly(Return(true));
    EXPECT_CALL(client, shutdown_application()).WillOnce(Invoke([stop_file] {
        std::ofstream(stop_file) << "1";
        return Status::success();
    }));

    EXPECT_TRUE(supervisor.stop(&client).ok());
    EXPECT_FALSE(supervisor.is_running());
    EXPECT_EQ(supervisor.last_exit_status(), 0);
}

TEST_F(ProcessSupervisorTest, FailedShutdownRpcFallsBackToKill) {
    auto factory = std::make_shared<ReachableAfterChecks>(2);
    options_.executable_path = write_script("phd2", "exec sleep 30");

    ProcessSupervisor supervisor(options_, factory);
    ASSERT_TRUE(supervisor.start().ok());

    MockGuiderClient client;
    EXPECT_CALL(client, is_connected()).WillRepeatedly(Return(true));
    EXPECT_CALL(client, shutdown_application())
        .WillOnce(Return(Status::error(ErrorCode::TIMEOUT, "Request timed out")));

    EXPECT_TRUE(supervisor.stop(&client).ok());
    EXPECT_FALSE(supervisor.is_running());
}

TEST_F(ProcessSupervisorTest, StopWithoutProcessIsNoop) {
    auto factory = std::make_shared<FakeConnectionFactory>();
    ProcessSupervisor supervisor(options_, factory);

    EXPECT_TRUE(supervisor.stop().ok());

    MockGuiderClient client;
    EXPECT_CALL(client, is_connected()).WillRepeatedly(Return(false));
    EXPECT_CALL(client, shutdown_application()).Times(0);
    EXPECT_TRUE(supervisor.stop(&client).ok());
}

TEST_F(ProcessSupervisorTest, SpawnEnvAndArgsReachChild) {
    auto factory = std::make_shared<ReachableAfterChecks>(2);
    std::string out = (dir_ / "child_env").string();
    options_.executable_path = write_script("phd2", "echo \"$GUIDELINK_TEST_VAR $1 $2\" > \"" + out + "\"\nexec sleep 30");
    options_.spawn_env["GUIDELINK_TEST_VAR"] = "camera-sim";
    options_.args = {"-i", "2"};

    ProcessSupervisor supervisor(options_, factory);
    ASSERT_TRUE(supervisor.start().ok());

    EXPECT_TRUE(wait_until([&] { return read_file("child_env") == "camera-sim -i 2\n"; }));
    EXPECT_TRUE(supervisor.stop().ok());
}

#endif

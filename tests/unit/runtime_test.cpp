/**
 * runtime_test.cpp - Interactive command handling
 *
 * Drives Runtime::handle_line() without a server: everything here runs
 * against a manager that was never connected.
 */

#include "runtime/runtime.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <future>
#include <thread>

namespace fs = std::filesystem;
using namespace tether;

class RuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "tether_runtime_test";
        fs::create_directories(temp_dir);

        config.connection.endpoint = "ws://127.0.0.1:1/";
        config.identity.store_path = (temp_dir / "identity.yaml").string();
        config.identity.client_id = "runtime-test";

        runtime = std::make_unique<runtime::Runtime>(config);
        std::string error;
        ASSERT_TRUE(runtime->initialize(error)) << error;
    }

    void TearDown() override {
        runtime.reset();
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string run_line(const std::string &line) {
        testing::internal::CaptureStdout();
        runtime->handle_line(line);
        return testing::internal::GetCapturedStdout();
    }

    fs::path temp_dir;
    runtime::CliConfig config;
    std::unique_ptr<runtime::Runtime> runtime;
};

TEST_F(RuntimeTest, UsesConfiguredClientId) { EXPECT_EQ(runtime->get_manager().client_id(), "runtime-test"); }

TEST_F(RuntimeTest, RequestWithoutConnectionReportsFailure) {
    auto output = run_line("thread/list {\"limit\": 5}");
    EXPECT_NE(output.find("< thread/list failed"), std::string::npos) << output;
}

TEST_F(RuntimeTest, InvalidJsonParamsRejected) {
    auto output = run_line("thread/start {not json");
    EXPECT_NE(output.find("! Invalid JSON"), std::string::npos) << output;
}

TEST_F(RuntimeTest, NotifyAndRespondNeedArguments) {
    EXPECT_NE(run_line(":notify").find("usage: :notify"), std::string::npos);
    EXPECT_NE(run_line(":respond").find("usage: :respond"), std::string::npos);
}

TEST_F(RuntimeTest, NotifyWithoutConnectionFails) {
    auto output = run_line(":notify initialized");
    EXPECT_NE(output.find("! notify failed"), std::string::npos) << output;
}

TEST_F(RuntimeTest, RespondWithoutConnectionFails) {
    auto output = run_line(":respond 12 {\"decision\":\"accept\"}");
    EXPECT_NE(output.find("! respond failed"), std::string::npos) << output;
}

TEST_F(RuntimeTest, UnknownCommandReported) {
    auto output = run_line(":frobnicate");
    EXPECT_NE(output.find("! unknown command: :frobnicate"), std::string::npos) << output;
}

TEST_F(RuntimeTest, NetworkCommandsFlipAvailability) {
    run_line(":offline");
    EXPECT_FALSE(runtime->get_manager().is_network_available());
    run_line(":online");
    EXPECT_TRUE(runtime->get_manager().is_network_available());
}

TEST_F(RuntimeTest, BlankLinesIgnored) {
    EXPECT_TRUE(run_line("   ").empty());
    EXPECT_TRUE(run_line("").empty());
}

TEST_F(RuntimeTest, HealthWithoutConnectionIsUnresponsive) {
    auto output = run_line(":health");
    EXPECT_NE(output.find("health: unresponsive"), std::string::npos) << output;
}

TEST_F(RuntimeTest, RunStopsOnTerminationSignal) {
    runtime::install_signal_handlers();

    auto running = std::async(std::launch::async, [this] { runtime->run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    ASSERT_EQ(std::raise(SIGTERM), 0);

    EXPECT_EQ(running.wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST_F(RuntimeTest, PendingStopRequestIsConsumedOnce) {
    runtime::request_stop(SIGINT);
    auto first = std::async(std::launch::async, [this] { runtime->run(); });
    ASSERT_EQ(first.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    // The request was used up; the next run keeps going until asked again
    auto second = std::async(std::launch::async, [this] { runtime->run(); });
    EXPECT_EQ(second.wait_for(std::chrono::milliseconds(300)), std::future_status::timeout);
    runtime::request_stop(SIGTERM);
    EXPECT_EQ(second.wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

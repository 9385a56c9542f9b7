#include "runtime/runtime.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>

#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

namespace fs = std::filesystem;
using namespace todod::runtime;

namespace {
constexpr int kRuntimeTestPort = 19998;
}  // namespace

class RuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "todod_runtime_test";
        fs::remove_all(temp_dir);

        config.http.port = kRuntimeTestPort;
        config.http.thread_pool_size = 2;
        config.store.path = (temp_dir / "todo.json").string();

        SignalHandler::reset();
    }

    void TearDown() override {
        SignalHandler::reset();
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    fs::path temp_dir;
    RuntimeConfig config;
};

TEST_F(RuntimeTest, ServesUntilShutdownRequested) {
    Runtime runtime(config);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    auto done = std::async(std::launch::async, [&runtime] { runtime.run(); });

    httplib::Client client("127.0.0.1", kRuntimeTestPort);
    client.set_connection_timeout(1, 0);
    auto res = client.Get("/todos");
    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);

    SignalHandler::request_shutdown();
    ASSERT_EQ(std::future_status::ready, done.wait_for(std::chrono::seconds(5)));

    // Server is gone after run() returns
    auto after = client.Get("/todos");
    EXPECT_FALSE(after);
}

TEST_F(RuntimeTest, StopEndsMainLoop) {
    Runtime runtime(config);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    auto done = std::async(std::launch::async, [&runtime] { runtime.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    runtime.stop();
    EXPECT_EQ(std::future_status::ready, done.wait_for(std::chrono::seconds(5)));
}

TEST_F(RuntimeTest, StopBeforeRunIsNotLost) {
    Runtime runtime(config);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    runtime.stop();

    auto done = std::async(std::launch::async, [&runtime] { runtime.run(); });
    EXPECT_EQ(std::future_status::ready, done.wait_for(std::chrono::seconds(5)));
}

TEST_F(RuntimeTest, DirectoryInPlaceOfStoreDoesNotPreventStartup) {
    fs::create_directories(temp_dir / "todo.json");

    Runtime runtime(config);
    std::string error;
    EXPECT_TRUE(runtime.initialize(error)) << error;
}

TEST_F(RuntimeTest, BindFailureFailsInitialization) {
    // TEST-NET-1 address: numeric, never assigned to a local interface
    config.http.bind = "192.0.2.1";

    Runtime runtime(config);
    std::string error;
    EXPECT_FALSE(runtime.initialize(error));
    EXPECT_NE(std::string::npos, error.find("HTTP server failed to start"));
}

TEST_F(RuntimeTest, CorruptStoreDoesNotPreventStartup) {
    fs::create_directories(temp_dir);
    std::ofstream(temp_dir / "todo.json") << "[oops";

    Runtime runtime(config);
    std::string error;
    EXPECT_TRUE(runtime.initialize(error)) << error;
}

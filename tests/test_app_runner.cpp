#include <gtest/gtest.h>
#include "app_runner.hpp"
#include <chrono>
#include <thread>
#include <csignal>
#include <future>
#include <filesystem>
#include <atomic>

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

class TestableAppRunner : public CAppRunner {
public:
    using CAppRunner::CAppRunner;
    using CAppRunner::m_cfg;
    using CAppRunner::m_ioc;
    using CAppRunner::m_keep_running;
    using CAppRunner::m_pipeline;
    using CAppRunner::m_table;
    using CAppRunner::m_generator_stats;

    std::atomic<int> config_reload_count = 0;

    bool LoadAndValidateConfig() override {
        config_reload_count++;
        return CAppRunner::LoadAndValidateConfig();
    }
};

namespace {
// Large enough that the generator is still running when the test signals it.
const char* kLongRun = "--source-num-records=2000000000";
}

TEST(AppRunnerTest, Construct) {
    const char* argv[] = {"app", "--help"};
    CAppRunner runner(2, const_cast<char**>(argv));
    SUCCEED();
}

TEST(AppRunnerTest, LoadAndValidateConfig_Valid) {
    const char* argv[] = {"app", "--config=none.json", "--output-filename=test_runner_valid.log"};
    TestableAppRunner runner(3, const_cast<char**>(argv));
    EXPECT_TRUE(runner.LoadAndValidateConfig());
    EXPECT_EQ(runner.m_cfg.output.filename, "test_runner_valid.log");
}

TEST(AppRunnerTest, LoadAndValidateConfig_Invalid) {
    const char* argv[] = {"app", "--config=none.json", "--source-num-categories=0"};
    TestableAppRunner runner(3, const_cast<char**>(argv));
    EXPECT_FALSE(runner.LoadAndValidateConfig());
    int result = runner.Run();
    EXPECT_EQ(result, 1);
}

TEST(AppRunnerTest, LoadAndValidateConfig_UnparsableOverride) {
    const char* argv[] = {"app", "--config=none.json", "--engine-shards=lots"};
    TestableAppRunner runner(3, const_cast<char**>(argv));
    EXPECT_FALSE(runner.LoadAndValidateConfig());
    EXPECT_EQ(runner.Run(), 1);
}

TEST(AppRunnerTest, SyntheticRunWritesAggregates) {
    const std::string output = "test_runner_synthetic.log";
    std::filesystem::remove(output);
    const char* argv[] = {"app", "--config=none.json",
                          "--source-num-records=20000",
                          "--source-num-categories=20",
                          "--source-batch-size=4000",
                          "--source-retract-probability=0.1",
                          "--engine-workers=2",
                          "--output-filename=test_runner_synthetic.log"};
    TestableAppRunner runner(8, const_cast<char**>(argv));
    EXPECT_EQ(runner.Run(), 0);

    EXPECT_GT(runner.m_generator_stats.inserted, 19000u);
    EXPECT_GT(runner.m_generator_stats.retracted, 0u);
    EXPECT_EQ(runner.m_pipeline->BatchesProcessed(), runner.m_generator_stats.batches);
    EXPECT_EQ(runner.m_table->Size(), runner.m_pipeline->Engine().LiveCount());
    EXPECT_GT(runner.m_table->Size(), 0u);
    ASSERT_TRUE(std::filesystem::exists(output));
    EXPECT_GT(std::filesystem::file_size(output), 0u);
    std::filesystem::remove(output);
}

TEST(AppRunnerTest, SignalInt) {
    const char* argv[] = {"app", "--config=none.json", kLongRun, "--output-filename=test_runner_sigint.log"};
    TestableAppRunner runner(4, const_cast<char**>(argv));

    std::future<int> result = std::async(std::launch::async, [&]() {
        return runner.Run();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    std::raise(SIGINT);
    int exit_code = result.get();
    EXPECT_EQ(exit_code, 0);
    EXPECT_EQ(runner.config_reload_count.load(), 1);
    EXPECT_LT(runner.m_generator_stats.inserted, 2000000000u);
    EXPECT_EQ(runner.m_table->Size(), runner.m_pipeline->Engine().LiveCount());
    std::filesystem::remove("test_runner_sigint.log");
}

TEST(AppRunnerTest, SignalPipeAndTerm) {
    const char* argv[] = {"app", "--config=none.json", kLongRun, "--output-filename=test_runner_sigterm.log"};
    CAppRunner runner(4, const_cast<char**>(argv));

    std::future<int> result = std::async(std::launch::async, [&]() {
        return runner.Run();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    std::raise(SIGPIPE);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    // Check that the program is still running (future is not ready)
    auto status = result.wait_for(std::chrono::milliseconds(0));
    EXPECT_EQ(status, std::future_status::timeout);
    std::raise(SIGTERM);
    int exit_code = result.get();
    EXPECT_EQ(exit_code, 0);
    std::filesystem::remove("test_runner_sigterm.log");
}

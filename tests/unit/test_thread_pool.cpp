/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"
#include "log_store/sample_log.hpp"
#include "supervisor/supervisor.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <set>

using namespace exec_profiler;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

// ─── Supervised executions ───────────────────

class PoolExecutionTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;
    Logger logger_{std::make_unique<NullSink>()};

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "ep_test_pool_exec";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    SupervisorOptions options() const {
        SupervisorOptions opts;
        opts.sample_interval = Microseconds{100};
        return opts;
    }
};

TEST_F(PoolExecutionTest, ParallelRunsUseSeparateLogs) {
    Supervisor supervisor(options(), logger_);
    ThreadPool pool(4);

    std::vector<std::future<Result<ExecutionResult>>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool.submit_execution(
            supervisor, Command{"sh", {"-c", "sleep 0.05; echo run" + std::to_string(i)}, {}, {}},
            make_log_path(dir_)));
    }

    std::set<std::filesystem::path> logs;
    for (int i = 0; i < 4; ++i) {
        auto result = futures[i].get();
        ASSERT_TRUE(result.has_value()) << result.error().message;
        EXPECT_EQ(result->exit_status, 0);
        EXPECT_EQ(result->stdout_text, "run" + std::to_string(i) + "\n");
        EXPECT_GT(result->summary.sample_count, 0u);
        EXPECT_TRUE(std::filesystem::exists(result->log_path));
        logs.insert(result->log_path);
    }
    EXPECT_EQ(logs.size(), 4u);
}

TEST_F(PoolExecutionTest, CancelTokenKillsQueuedRun) {
    Supervisor supervisor(options(), logger_);
    ThreadPool pool(1);
    std::stop_source cancel;

    auto future = pool.submit_execution(supervisor, Command{"sleep", {"10"}, {}, {}},
                                        make_log_path(dir_), cancel.get_token());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto start = std::chrono::steady_clock::now();
    cancel.request_stop();

    auto result = future.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->termination, Termination::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST_F(PoolExecutionTest, SpawnFailureIsReturnedNotThrown) {
    Supervisor supervisor(options(), logger_);
    ThreadPool pool(1);

    auto result = pool.submit_execution(supervisor, Command{"/nonexistent/ep-missing", {}, {}, {}},
                                        make_log_path(dir_)).get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SpawnFailure);
}

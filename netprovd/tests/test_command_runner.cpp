/**
 * Process runner tests against real short-lived children
 */

#include <unity.h>

#include "infrastructure/command_runner.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using netprov::infrastructure::CommandResult;
using netprov::infrastructure::ProcessCommandRunner;

static const std::chrono::milliseconds SHORT_TIMEOUT(5000);

void setUp() {}
void tearDown() {}

void test_captures_output_and_exit_code() {
    ProcessCommandRunner runner;

    auto result = runner.run({"sh", "-c", "echo hello; echo oops >&2; exit 3"}, SHORT_TIMEOUT);
    TEST_ASSERT_TRUE(result.launched);
    TEST_ASSERT_FALSE(result.timed_out);
    TEST_ASSERT_EQUAL_INT(3, result.exit_code);
    TEST_ASSERT_FALSE(result.ok());
    TEST_ASSERT_NOT_EQUAL(std::string::npos, result.output.find("hello\n"));
    TEST_ASSERT_NOT_EQUAL(std::string::npos, result.output.find("oops\n"));
    TEST_ASSERT_EQUAL_STRING("exit code 3: hello", result.describe().c_str());
}

void test_arguments_are_not_reparsed() {
    ProcessCommandRunner runner;

    auto result = runner.run({"echo", "Cafe & Bar; echo $HOME"}, SHORT_TIMEOUT);
    TEST_ASSERT_TRUE(result.ok());
    TEST_ASSERT_EQUAL_STRING("Cafe & Bar; echo $HOME\n", result.output.c_str());
}

void test_missing_program_is_not_launched() {
    ProcessCommandRunner runner;

    auto result = runner.run({"netprov-no-such-program"}, SHORT_TIMEOUT);
    TEST_ASSERT_FALSE(result.launched);
    TEST_ASSERT_FALSE(result.ok());
    TEST_ASSERT_NOT_EQUAL(std::string::npos, result.describe().find("could not launch"));

    auto empty = runner.run({}, SHORT_TIMEOUT);
    TEST_ASSERT_FALSE(empty.launched);
}

void test_slow_child_is_killed_at_timeout() {
    ProcessCommandRunner runner;

    auto started = std::chrono::steady_clock::now();
    auto result = runner.run({"sleep", "5"}, std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - started;

    TEST_ASSERT_TRUE(result.timed_out);
    TEST_ASSERT_FALSE(result.ok());
    TEST_ASSERT_EQUAL_STRING("timed out", result.describe().c_str());
    TEST_ASSERT_TRUE(elapsed < std::chrono::seconds(2));
}

void test_runs_from_many_threads_at_once() {
    ProcessCommandRunner runner;
    std::atomic<int> succeeded{0};

    // Other threads keep allocating while children are forked
    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&, i] {
            for (int round = 0; round < 10; ++round) {
                std::vector<std::string> argv = {"echo", "worker", std::to_string(i), std::to_string(round)};
                auto result = runner.run(argv, SHORT_TIMEOUT);
                auto expected = "worker " + std::to_string(i) + " " + std::to_string(round) + "\n";
                if (result.ok() && result.output == expected) {
                    ++succeeded;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    TEST_ASSERT_EQUAL_INT(80, succeeded.load());
}

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_captures_output_and_exit_code);
    RUN_TEST(test_arguments_are_not_reparsed);
    RUN_TEST(test_missing_program_is_not_launched);
    RUN_TEST(test_slow_child_is_killed_at_timeout);
    RUN_TEST(test_runs_from_many_threads_at_once);

    return UNITY_END();
}

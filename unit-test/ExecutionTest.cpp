#include <signal.h>
#include <thread>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "runtime/execution.hpp"
#include "test/lab_fixture.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

class ExecutionTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    execution_request shell(const string &script, double time_limit = 5) {
        execution_request request;
        request.argv = {"/bin/sh", "-c", script};
        request.work_dir = make_temp_dir("exec");
        request.time_limit = time_limit;
        return request;
    }

    /**
     * @brief 进程不存在或者已经是僵尸进程
     */
    static bool process_gone(const string &pid) {
        string stat = read_file_content(path("/proc") / pid / "stat", "");
        if (stat.empty()) return true;
        auto pos = stat.rfind(')');
        return pos == string::npos || pos + 2 >= stat.size() || stat[pos + 2] == 'Z' || stat[pos + 2] == 'X';
    }
};

TEST_F(ExecutionTest, CapturesOutputAndExitCode) {
    execution_result result = run_process(shell("echo out; echo err >&2"));
    EXPECT_EQ(result.state, run_state::COMPLETED);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
    EXPECT_FALSE(result.truncated);
}

TEST_F(ExecutionTest, TimeLimitKillsProcess) {
    elapsed_time timer;
    execution_result result = run_process(shell("sleep 5", 1));
    EXPECT_EQ(result.state, run_state::TIMED_OUT);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 3000);
}

TEST_F(ExecutionTest, OutputLimitTruncates) {
    execution_request request = shell("head -c 100000 /dev/zero");
    request.output_limit = 1000;
    execution_result result = run_process(request);
    EXPECT_EQ(result.state, run_state::OUTPUT_TRUNCATED);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.output.size(), 1000u);
}

TEST_F(ExecutionTest, NonZeroExitIsCrash) {
    execution_result result = run_process(shell("exit 3"));
    EXPECT_EQ(result.state, run_state::CRASHED);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.signal, 0);

    execution_request request = shell("exit 3");
    request.expect_clean_exit = false;
    result = run_process(request);
    EXPECT_EQ(result.state, run_state::COMPLETED);
    EXPECT_EQ(result.exit_code, 3);
}

TEST_F(ExecutionTest, SignalIsCrash) {
    execution_result result = run_process(shell("kill -SEGV $$"));
    EXPECT_EQ(result.state, run_state::CRASHED);
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.exit_code, 128 + SIGSEGV);
}

TEST_F(ExecutionTest, EnvironmentIsScrubbed) {
    set_env("LABGRADER_TEST_SECRET", "leaked");
    execution_request request = shell("echo ${LABGRADER_TEST_SECRET:-unset} $EXTRA");
    request.env["EXTRA"] = "given";
    execution_result result = run_process(request);
    EXPECT_EQ(result.output, "unset given\n");
}

TEST_F(ExecutionTest, StdinFromFile) {
    path dir = make_temp_dir("stdin");
    write_file_content(dir / "input.txt", "1 2 3\n");
    execution_request request = shell("cat");
    request.stdin_file = dir / "input.txt";
    execution_result result = run_process(request);
    EXPECT_EQ(result.output, "1 2 3\n");

    // 没有输入文件时读到 EOF，不会阻塞
    result = run_process(shell("cat", 2));
    EXPECT_EQ(result.state, run_state::COMPLETED);
    EXPECT_EQ(result.output, "");
}

TEST_F(ExecutionTest, RunsInWorkDir) {
    execution_request request = shell("pwd -P");
    execution_result result = run_process(request);
    EXPECT_EQ(result.output, weakly_canonical(request.work_dir).string() + "\n");

    request.work_dir = "/nonexistent/labgrader";
    result = run_process(request);
    EXPECT_EQ(result.state, run_state::SYSTEM_ERROR);
}

TEST_F(ExecutionTest, CommandNotFound) {
    execution_request request;
    request.argv = {"labgrader-no-such-command"};
    execution_result result = run_process(request);
    EXPECT_EQ(result.state, run_state::SYSTEM_ERROR);
    EXPECT_NE(result.system_error.find("labgrader-no-such-command"), string::npos);
}

TEST_F(ExecutionTest, CancellationKillsProcess) {
    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(200));
        token.cancel();
    });
    elapsed_time timer;
    execution_result result = run_process(shell("sleep 5"), &token);
    canceller.join();
    EXPECT_EQ(result.state, run_state::CANCELLED);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 2000);
}

TEST_F(ExecutionTest, NoOrphanedDescendants) {
    execution_result result = run_process(shell("sleep 30 & echo $!"));
    EXPECT_EQ(result.state, run_state::COMPLETED);
    string pid = result.output.substr(0, result.output.find('\n'));
    ASSERT_FALSE(pid.empty());
    this_thread::sleep_for(chrono::milliseconds(200));
    EXPECT_TRUE(process_gone(pid));

    result = run_process(shell("sleep 30 & echo $!; sleep 30", 1));
    EXPECT_EQ(result.state, run_state::TIMED_OUT);
    pid = result.output.substr(0, result.output.find('\n'));
    ASSERT_FALSE(pid.empty());
    this_thread::sleep_for(chrono::milliseconds(200));
    EXPECT_TRUE(process_gone(pid));
}

TEST_F(ExecutionTest, SpawnCounter) {
    size_t before = spawned_process_count();
    run_process(shell("true"));
    EXPECT_EQ(spawned_process_count(), before + 1);
}

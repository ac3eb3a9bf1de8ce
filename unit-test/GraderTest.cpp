#include <boost/algorithm/string.hpp>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "config.hpp"
#include "grading/grader.hpp"
#include "gtest/gtest.h"
#include "test/lab_fixture.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;
using nlohmann::json;

static const char *hello_world = "Hello, world!\n";

class GraderTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        ws = make_unique<workspace>(make_temp_dir("grader"));
        tracker = make_unique<progress_tracker>(*ws);
        engine = make_unique<lab_grader>(*ws, registry, *tracker);
    }

    void TearDown() override {
        TOOLCHAIN_PATH = "";
    }

    lab create_bash_lab(const string &script, const vector<json> &tests,
                        const map<string, string> &test_files = {},
                        lab_kind kind = lab_kind::FULL, double pass_threshold = 0.6) {
        lab_artifacts artifacts = make_artifacts("main.sh", {{"main.sh", script}}, tests, test_files);
        artifacts.pass_threshold = pass_threshold;
        return ws->create_lab({"cs101", "unit-1", ""}, kind, "bash", artifacts);
    }

    static json greeting_test(const string &id = "prints-greeting") {
        return {{"id", id}, {"expected_file", "expected.txt"}};
    }

    adapter_registry registry;
    unique_ptr<workspace> ws;
    unique_ptr<progress_tracker> tracker;
    unique_ptr<lab_grader> engine;
};

TEST_F(GraderTest, CorrectSubmissionPasses) {
    lab target = create_bash_lab("echo 'Hello, world!'\n", {greeting_test()}, {{"expected.txt", hello_world}});
    grade_result grade = engine->submit(target.context());

    EXPECT_EQ(grade.lab_id, target.id);
    EXPECT_EQ(grade.submission_hash, ws->read_submission(target).hash);
    EXPECT_DOUBLE_EQ(grade.score, 1);
    EXPECT_EQ(grade.status, lab_status::PASSED);
    EXPECT_EQ(grade.feedback, "[PASS] prints-greeting");
    ASSERT_EQ(grade.tests.size(), 1u);
    EXPECT_EQ(grade.tests[0].result, outcome::COMPLETED);
    EXPECT_EQ(grade.tests[0].exit_code, 0);

    auto stored = ws->read_grade_record(target);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, grade);
    EXPECT_EQ(tracker->get(target.context()).status, lab_status::PASSED);
}

TEST_F(GraderTest, WrongOutputRevealsExpectedInFullLab) {
    lab target = create_bash_lab("echo 'Hello world'\n", {greeting_test()}, {{"expected.txt", hello_world}});
    grade_result grade = engine->submit(target.context());

    EXPECT_DOUBLE_EQ(grade.score, 0);
    EXPECT_EQ(grade.status, lab_status::FAILED);
    EXPECT_EQ(grade.feedback,
              "[FAIL] prints-greeting (completed): line differs at 1: expected \"Hello, world!\", got \"Hello world\"");
    EXPECT_EQ(tracker->get(target.context()).status, lab_status::FAILED);
}

TEST_F(GraderTest, BugfixLabHidesExpectedOutput) {
    lab target = create_bash_lab("echo 'Hello world'\n", {greeting_test()}, {{"expected.txt", hello_world}}, lab_kind::BUGFIX);
    grade_result grade = engine->submit(target.context());

    EXPECT_EQ(grade.status, lab_status::FAILED);
    EXPECT_EQ(grade.feedback.find("Hello, world!"), string::npos);
    EXPECT_NE(grade.feedback.find("got \"Hello world\""), string::npos);

    write_submission(target, "main.sh", "echo 'Hello, world!'\n");
    grade = engine->submit(target.context());
    EXPECT_EQ(grade.status, lab_status::PASSED);
}

TEST_F(GraderTest, WeightedPartialScore) {
    string script = "case \"$1\" in\n  a) echo 1 ;;\n  b) echo 2 ;;\n  *) echo wrong ;;\nesac\n";
    lab target = create_bash_lab(script,
                                 {{{"id", "a"}, {"args", {"a"}}, {"expected_stdout", "1\n"}},
                                  {{"id", "b"}, {"args", {"b"}}, {"expected_stdout", "2\n"}, {"weight", 1}},
                                  {{"id", "c"}, {"args", {"c"}}, {"expected_stdout", "3\n"}, {"weight", 2}}});
    grade_result grade = engine->submit(target.context());

    EXPECT_DOUBLE_EQ(grade.score, 0.5);
    EXPECT_EQ(grade.status, lab_status::FAILED);
    ASSERT_EQ(grade.tests.size(), 3u);
    EXPECT_TRUE(grade.tests[0].passed);
    EXPECT_TRUE(grade.tests[1].passed);
    EXPECT_FALSE(grade.tests[2].passed);

    vector<string> lines;
    boost::split(lines, grade.feedback, boost::is_any_of("\n"));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "[PASS] a");
    EXPECT_EQ(lines[1], "[PASS] b");
    EXPECT_EQ(lines[2].rfind("[FAIL] c (completed): ", 0), 0u);
}

TEST_F(GraderTest, ThresholdDecidesStatus) {
    lab target = create_bash_lab("echo \"$1\"\n",
                                 {{{"id", "a"}, {"args", {"1"}}, {"expected_stdout", "1\n"}},
                                  {{"id", "b"}, {"args", {"2"}}, {"expected_stdout", "x\n"}}},
                                 {}, lab_kind::FILL, 0.5);
    grade_result grade = engine->submit(target.context());
    EXPECT_DOUBLE_EQ(grade.score, 0.5);
    EXPECT_EQ(grade.status, lab_status::PASSED);
}

TEST_F(GraderTest, TimeoutAndCrashAreReportedPerTest) {
    string script = "case \"$1\" in\n  slow) sleep 5 ;;\n  crash) echo boom >&2; exit 2 ;;\n  *) echo ok ;;\nesac\n";
    lab target = create_bash_lab(script,
                                 {{{"id", "slow"}, {"args", {"slow"}}, {"expected_stdout", "ok\n"}, {"time_limit", 1}},
                                  {{"id", "crash"}, {"args", {"crash"}}, {"expected_stdout", "ok\n"}},
                                  {{"id", "fine"}, {"args", {"fine"}}, {"expected_stdout", "ok\n"}}});
    auto start = chrono::steady_clock::now();
    grade_result grade = engine->submit(target.context());
    auto elapsed = chrono::steady_clock::now() - start;
    // 超时的测试点在时间限制后被终止，不等程序睡完 5 秒
    EXPECT_LT(elapsed, chrono::milliseconds(4000));

    ASSERT_EQ(grade.tests.size(), 3u);
    EXPECT_EQ(grade.tests[0].result, outcome::TIMED_OUT);
    EXPECT_EQ(grade.tests[0].feedback, "[FAIL] slow (timed-out): time limit of 1s exceeded");
    EXPECT_LT(grade.tests[0].duration_ms, 3000);
    EXPECT_EQ(grade.tests[1].result, outcome::CRASHED);
    EXPECT_EQ(grade.tests[1].exit_code, 2);
    EXPECT_EQ(grade.tests[1].feedback, "[FAIL] crash (crashed): exited with code 2: boom");
    EXPECT_TRUE(grade.tests[2].passed);
    EXPECT_DOUBLE_EQ(grade.score, 0.3333);
}

TEST_F(GraderTest, OutputLimitIsEnforced) {
    lab target = create_bash_lab("head -c 200000 /dev/zero | tr '\\0' a\n",
                                 {{{"id", "flood"}, {"expected_stdout", "a\n"}, {"output_limit", 1000}}});
    grade_result grade = engine->submit(target.context());
    ASSERT_EQ(grade.tests.size(), 1u);
    EXPECT_EQ(grade.tests[0].result, outcome::OUTPUT_TRUNCATED);
    EXPECT_FALSE(grade.tests[0].passed);
    EXPECT_NE(grade.tests[0].feedback.find("output truncated at 1000 bytes"), string::npos);
    EXPECT_LT(grade.tests[0].feedback.size(), 400u);
}

TEST_F(GraderTest, StdinAndComparisonModes) {
    lab target = create_bash_lab("read a b\necho \"$((a + b))   \"\necho 0.3333334\n",
                                 {{{"id", "inline"}, {"stdin", "2 3\n"}, {"expected_stdout", "5\n0.3333333\n"},
                                   {"compare", "tolerance"}},
                                  {{"id", "file"}, {"stdin_file", "case.in"}, {"expected_stdout", "7 \n0.3333334"},
                                   {"compare", "normalized-whitespace"}}},
                                 {{"case.in", "3 4\n"}});
    grade_result grade = engine->submit(target.context());
    EXPECT_DOUBLE_EQ(grade.score, 1) << grade.feedback;
}

TEST_F(GraderTest, CustomChecker) {
    string checker = "#!/bin/sh\ngrep -q 42 \"$2\" || { echo 'answer should be 42'; exit 1; }\n";
    lab target = create_bash_lab("echo \"the answer is $1\"\n",
                                 {{{"id", "right"}, {"args", {"42"}}, {"compare", "custom-checker"}, {"checker", "check.sh"}},
                                  {{"id", "wrong"}, {"args", {"41"}}, {"compare", "custom-checker"}, {"checker", "check.sh"}}},
                                 {{"check.sh", checker}});
    grade_result grade = engine->submit(target.context());
    ASSERT_EQ(grade.tests.size(), 2u);
    EXPECT_TRUE(grade.tests[0].passed) << grade.feedback;
    EXPECT_EQ(grade.tests[1].feedback, "[FAIL] wrong (completed): answer should be 42");
}

TEST_F(GraderTest, SubmissionCannotTamperWithExpectedOutput) {
    lab target = create_bash_lab("echo wrong > tests/expected.txt 2>/dev/null\necho wrong\n",
                                 {greeting_test()}, {{"expected.txt", hello_world}});
    grade_result grade = engine->submit(target.context());
    EXPECT_FALSE(grade.tests[0].passed);
    EXPECT_EQ(read_file_content(target.tests_dir() / "expected.txt"), hello_world);
}

TEST_F(GraderTest, SubmissionCannotReadExpectedOutput) {
    string script =
        "if [ \"$1\" = public ]; then cat tests/data.txt; exit; fi\n"
        "cat tests/expected.txt 2>/dev/null || grep -o -m1 'Hello, world!' tests/manifest.json 2>/dev/null\n";
    lab target = create_bash_lab(script,
                                 {greeting_test("from-file"),
                                  {{"id", "inline"}, {"expected_stdout", hello_world}},
                                  {{"id", "public"}, {"args", {"public"}}, {"expected_stdout", "data\n"}}},
                                 {{"expected.txt", hello_world}, {"data.txt", "data\n"}},
                                 lab_kind::BUGFIX);
    grade_result grade = engine->submit(target.context());
    ASSERT_EQ(grade.tests.size(), 3u);
    EXPECT_FALSE(grade.tests[0].passed) << grade.feedback;
    EXPECT_FALSE(grade.tests[1].passed) << grade.feedback;
    EXPECT_TRUE(grade.tests[2].passed) << grade.feedback;
    EXPECT_DOUBLE_EQ(grade.score, 0.3333);
}

TEST_F(GraderTest, NonUtf8OutputStillProducesGrade) {
    string script =
        "case \"$1\" in\n"
        "  crash) printf '\\376 boom\\n' >&2; exit 3 ;;\n"
        "  *) printf '\\377'; printf '\xc3\xb1%.0s' $(seq 100); echo ;;\n"
        "esac\n";
    lab target = create_bash_lab(script,
                                 {{{"id", "bytes"}, {"expected_stdout", "ok\n"}},
                                  {{"id", "crash"}, {"args", {"crash"}}, {"expected_stdout", "ok\n"}}});
    grade_result grade;
    ASSERT_NO_THROW(grade = engine->submit(target.context()));

    ASSERT_EQ(grade.tests.size(), 2u);
    EXPECT_EQ(grade.tests[0].result, outcome::COMPLETED);
    EXPECT_NE(grade.tests[0].feedback.find("got \"\\xff\xc3\xb1"), string::npos) << grade.tests[0].feedback;
    EXPECT_EQ(grade.tests[1].result, outcome::CRASHED);
    EXPECT_EQ(grade.tests[1].feedback, "[FAIL] crash (crashed): exited with code 3: \\xfe boom");
    EXPECT_EQ(sanitize_utf8(grade.feedback), grade.feedback);

    auto record = ws->read_grade_record(target);
    ASSERT_TRUE(record);
    EXPECT_EQ(*record, grade);
    EXPECT_EQ(tracker->get(target.context()).attempts, 1);
}

TEST_F(GraderTest, MissingToolchainSkipsExecution) {
    lab target = create_bash_lab("echo 'Hello, world!'\n", {greeting_test("a"), greeting_test("b")}, {{"expected.txt", hello_world}});
    TOOLCHAIN_PATH = make_temp_dir("empty-toolchain").string();

    size_t before = spawned_process_count();
    grade_result grade = engine->submit(target.context());
    EXPECT_EQ(spawned_process_count(), before);

    EXPECT_DOUBLE_EQ(grade.score, 0);
    EXPECT_EQ(grade.status, lab_status::FAILED);
    ASSERT_EQ(grade.tests.size(), 2u);
    for (auto &report : grade.tests)
        EXPECT_EQ(report.result, outcome::TOOLCHAIN_MISSING);
    EXPECT_EQ(grade.feedback, "[FAIL] a (toolchain-missing)\n[FAIL] b (toolchain-missing)");
    EXPECT_NE(grade.diagnostics.find("bash"), string::npos);
    EXPECT_TRUE(ws->read_grade_record(target).has_value());
}

TEST_F(GraderTest, BuildFailureRunsNoTests) {
    lab target = create_bash_lab("echo 'Hello, world!'\n", {greeting_test()}, {{"expected.txt", hello_world}});
    filesystem::remove(target.submission_dir() / "main.sh");
    write_submission(target, "other.sh", "echo 'Hello, world!'\n");

    grade_result grade = engine->submit(target.context());
    EXPECT_EQ(engine->executed_runs(), 0u);
    EXPECT_EQ(grade.tests[0].result, outcome::BUILD_FAILED);
    EXPECT_NE(grade.diagnostics.find("main.sh"), string::npos);
    EXPECT_DOUBLE_EQ(grade.score, 0);
}

TEST_F(GraderTest, ReportsFollowManifestOrder) {
    lab target = create_bash_lab("sleep \"$1\"\necho done\n",
                                 {{{"id", "t1"}, {"args", {"0.4"}}, {"expected_stdout", "done\n"}},
                                  {{"id", "t2"}, {"args", {"0"}}, {"expected_stdout", "done\n"}},
                                  {{"id", "t3"}, {"args", {"0.2"}}, {"expected_stdout", "done\n"}},
                                  {{"id", "t4"}, {"args", {"0.1"}}, {"expected_stdout", "done\n"}}});
    grade_result grade = engine->evaluate(target, ws->read_submission(target), nullptr, 4);

    ASSERT_EQ(grade.tests.size(), 4u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(grade.tests[i].id, "t" + to_string(i + 1));
        EXPECT_TRUE(grade.tests[i].passed);
    }
    EXPECT_EQ(engine->executed_runs(), 4u);
    // evaluate 不保存结果
    EXPECT_FALSE(ws->read_grade_record(target).has_value());
}

TEST_F(GraderTest, RegradingUnchangedSubmissionIsIdempotent) {
    lab target = create_bash_lab("echo \"$1\"\n",
                                 {{{"id", "a"}, {"args", {"1"}}, {"expected_stdout", "1\n"}},
                                  {{"id", "b"}, {"args", {"2"}}, {"expected_stdout", "3\n"}}});
    grade_result first = engine->submit(target.context());
    grade_result second = engine->submit(target.context());

    EXPECT_EQ(first.submission_hash, second.submission_hash);
    EXPECT_EQ(first.score, second.score);
    EXPECT_EQ(first.status, second.status);
    EXPECT_EQ(first.feedback, second.feedback);
    EXPECT_EQ(ws->grade_history(target).size(), 2u);
    EXPECT_EQ(tracker->get(target.context()).attempts, 2);
}

TEST_F(GraderTest, CancellationPersistsNothing) {
    lab target = create_bash_lab("sleep 5\n", {{{"id", "slow"}, {"expected_stdout", ""}}});
    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(300));
        token.cancel();
    });
    EXPECT_THROW(engine->submit(target.context(), &token), submission_aborted);
    canceller.join();

    EXPECT_FALSE(ws->read_grade_record(target).has_value());
    EXPECT_TRUE(ws->grade_history(target).empty());
    EXPECT_EQ(tracker->get(target.context()).status, lab_status::NOT_STARTED);
}

TEST_F(GraderTest, MissingLab) {
    EXPECT_THROW(engine->submit({"cs101", "unit-1", "missing"}), lab_not_found);
}

TEST_F(GraderTest, PythonLab) {
    if (!has_toolchain("python3")) GTEST_SKIP() << "python3 is not installed";
    lab_artifacts artifacts = make_artifacts("main.py", {{"main.py", "print('Hello, world!')\n"}},
                                             {greeting_test()}, {{"expected.txt", hello_world}});
    lab target = ws->create_lab({"cs101", "unit-1", ""}, lab_kind::FULL, "python", artifacts);
    grade_result grade = engine->submit(target.context());
    EXPECT_EQ(grade.status, lab_status::PASSED) << grade.feedback;

    write_submission(target, "main.py", "raise SystemExit('broken')\n");
    grade = engine->submit(target.context());
    EXPECT_EQ(grade.tests[0].result, outcome::CRASHED);
    EXPECT_NE(grade.tests[0].feedback.find("broken"), string::npos);
}

TEST_F(GraderTest, CppLab) {
    if (!has_toolchain("g++")) GTEST_SKIP() << "g++ is not installed";
    lab_artifacts artifacts = make_artifacts("", {{"main.cpp", "#include <iostream>\nint main() { std::cout << \"Hello, world!\\n\"; }\n"}},
                                             {greeting_test()}, {{"expected.txt", hello_world}});
    lab target = ws->create_lab({"cs101", "unit-1", ""}, lab_kind::FULL, "cpp", artifacts);
    grade_result grade = engine->submit(target.context());
    EXPECT_EQ(grade.status, lab_status::PASSED) << grade.feedback;

    write_submission(target, "main.cpp", "int main( {}\n");
    size_t runs = engine->executed_runs();
    grade = engine->submit(target.context());
    EXPECT_EQ(engine->executed_runs(), runs);
    EXPECT_EQ(grade.tests[0].result, outcome::BUILD_FAILED);
    EXPECT_FALSE(grade.diagnostics.empty());
    // 已通过的实验不会因为之后的失败提交而降级
    EXPECT_EQ(tracker->get(target.context()).status, lab_status::PASSED);
}

TEST(FeedbackTest, Format) {
    test_report report;
    report.id = "t";
    report.passed = true;
    EXPECT_EQ(format_feedback(report, "ignored"), "[PASS] t");
    report.passed = false;
    report.result = outcome::CRASHED;
    EXPECT_EQ(format_feedback(report, "exited with code 1"), "[FAIL] t (crashed): exited with code 1");
    EXPECT_EQ(format_feedback(report, ""), "[FAIL] t (crashed)");
}

#include "grading/grader.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "grading/compare.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

lab_grader::lab_grader(const workspace &ws, const adapter_registry &registry, const progress_tracker &progress)
    : ws(ws), registry(registry), progress(progress) {}

size_t lab_grader::executed_runs() const {
    return runs.load();
}

string format_feedback(const test_report &report, const string &detail) {
    if (report.passed)
        return fmt::format("[PASS] {}", report.id);
    if (detail.empty())
        return fmt::format("[FAIL] {} ({})", report.id, get_display_message(report.result));
    return fmt::format("[FAIL] {} ({}): {}", report.id, get_display_message(report.result), sanitize_utf8(detail));
}

/**
 * @brief stderr 的第一行非空内容，用于说明程序崩溃的原因
 */
static string first_error_line(const string &error) {
    for (auto &line : split_lines(error)) {
        string trimmed = boost::trim_copy(line);
        if (!trimmed.empty()) return escape_output(trimmed, FEEDBACK_LINE_LIMIT);
    }
    return "";
}

static fs::path run_root() {
    fs::path root = RUN_DIR.empty() ? fs::temp_directory_path() / "lab-grader" : RUN_DIR;
    return fs::absolute(root);
}

void lab_grader::short_circuit(const lab &lab, grade_result &grade, outcome result, const string &diagnostics) const {
    grade.diagnostics = truncate(sanitize_utf8(diagnostics), DIAGNOSTICS_LIMIT);
    grade.tests.clear();
    for (auto &test : lab.test_cases) {
        test_report report;
        report.id = test.id;
        report.result = result;
        report.passed = false;
        report.feedback = format_feedback(report, "");
        grade.tests.push_back(report);
    }
}

void lab_grader::summarize(const lab &lab, grade_result &grade) const {
    weight_t passed = 0;
    for (size_t i = 0; i < lab.test_cases.size(); ++i)
        if (grade.tests[i].passed)
            passed += lab.test_cases[i].weight;

    grade.score = round_score(passed / lab.total_weight());
    grade.status = grade.score >= lab.pass_threshold ? lab_status::PASSED : lab_status::FAILED;

    vector<string> lines;
    for (auto &report : grade.tests)
        lines.push_back(report.feedback);
    grade.feedback = boost::algorithm::join(lines, "\n");
}

test_report lab_grader::run_test(const lab &lab, const language_adapter &adapter, const staged_program &program,
                                 const test_case &test, const fs::path &submission_dir,
                                 const cancellation_token *token) const {
    test_report report;
    report.id = test.id;

    // 每个测试点使用独立的运行目录，互不干扰
    string name = "run-" + random_uuid();
    fs::path run_dir = submission_dir / name;
    defer {
        if (!DEBUG) {
            error_code ec;
            fs::remove_all(run_dir, ec);
            fs::remove_all(submission_dir / (name + "-check"), ec);
        }
    };
    copy_directory(program.dir, run_dir);

    execution_request request = adapter.build_command(program, test, run_dir);
    if (test.stdin_text) {
        fs::path stdin_file = submission_dir / (name + ".in");
        write_file_content(stdin_file, *test.stdin_text);
        request.stdin_file = stdin_file;
    }

    execution_result result = run_process(request, token);
    ++runs;
    report.exit_code = result.exit_code;
    report.duration_ms = result.duration.count();

    string detail;
    switch (result.state) {
        case run_state::SYSTEM_ERROR:
            report.result = outcome::SYSTEM_ERROR;
            detail = result.system_error;
            break;
        case run_state::CANCELLED:
            report.result = outcome::SYSTEM_ERROR;
            detail = "cancelled";
            break;
        case run_state::TIMED_OUT:
            report.result = outcome::TIMED_OUT;
            detail = fmt::format("time limit of {}s exceeded", test.time_limit);
            break;
        case run_state::CRASHED: {
            report.result = outcome::CRASHED;
            detail = result.signal ? fmt::format("killed by signal {}", result.signal)
                                   : fmt::format("exited with code {}", result.exit_code);
            string error = first_error_line(result.error);
            if (!error.empty()) detail += ": " + error;
            break;
        }
        default: {
            report.result = to_outcome(result.state);
            // 预期输出从只读的实验目录读取，学生程序无法修改
            string expected = test.expected_stdout ? *test.expected_stdout
                              : test.expected_file.empty() ? string()
                                                           : read_file_content(lab.tests_dir() / test.expected_file);

            if (test.compare == compare_mode::CUSTOM_CHECKER) {
                fs::path check_dir = submission_dir / (name + "-check");
                copy_directory(lab.tests_dir(), check_dir / "tests");
                fs::permissions(check_dir / "tests" / test.checker, fs::perms::owner_exec | fs::perms::owner_read, fs::perm_options::add);
                write_file_content(check_dir / "expected", expected);
                write_file_content(check_dir / "actual", result.output);

                execution_request check = adapter.checker_command(program, test, check_dir / "expected", check_dir / "actual", check_dir);
                execution_result verdict = run_process(check, token);
                report.passed = verdict.state == run_state::COMPLETED && verdict.exit_code == 0;
                if (!report.passed) {
                    if (verdict.state == run_state::TIMED_OUT)
                        detail = "checker timed out";
                    else if (verdict.state == run_state::SYSTEM_ERROR)
                        detail = "checker failed: " + verdict.system_error;
                    else
                        detail = first_error_line(verdict.output + "\n" + verdict.error);
                    if (detail.empty()) detail = "rejected by checker";
                }
            } else {
                compare_result comparison = compare_output(test, expected, result.output);
                report.passed = comparison.passed;
                // bugfix、fill 实验不泄露预期输出
                detail = describe_mismatch(comparison, lab.kind == lab_kind::FULL, FEEDBACK_LINE_LIMIT);
            }
            if (result.truncated && !report.passed)
                detail += fmt::format(" (output truncated at {} bytes)", test.output_limit);
            break;
        }
    }

    report.feedback = format_feedback(report, detail);
    LOG(INFO) << "Lab " << lab.id << " test " << test.id << ": " << (report.passed ? "passed" : "failed")
              << " (" << get_display_message(report.result) << ", " << report.duration_ms << "ms)";
    return report;
}

grade_result lab_grader::evaluate(const lab &lab, const submission_snapshot &snapshot,
                                  const cancellation_token *token, unsigned workers) const {
    grade_result grade;
    grade.lab_id = lab.id;
    grade.submission_hash = snapshot.hash;
    grade.timestamp = current_timestamp();

    fs::path submission_dir = run_root() / lab.course_id / lab.unit_id / lab.id / ("sub-" + random_uuid());
    defer {
        if (!DEBUG) {
            error_code ec;
            fs::remove_all(submission_dir, ec);
            if (ec) LOG(WARNING) << "Unable to remove " << submission_dir << ": " << ec.message();
        }
    };

    staged_program program;
    const language_adapter *adapter = nullptr;
    try {
        adapter = &registry.find(lab.language);
        program = adapter->prepare(lab, snapshot, submission_dir / "compile", token);
    } catch (toolchain_missing &e) {
        LOG(WARNING) << "Lab " << lab.id << ": " << e.what();
        short_circuit(lab, grade, outcome::TOOLCHAIN_MISSING, e.what());
        summarize(lab, grade);
        return grade;
    } catch (build_failed &e) {
        LOG(INFO) << "Lab " << lab.id << ": build failed, " << e.what();
        short_circuit(lab, grade, outcome::BUILD_FAILED, e.diagnostics);
        summarize(lab, grade);
        return grade;
    }
    grade.diagnostics = truncate(sanitize_utf8(program.diagnostics), DIAGNOSTICS_LIMIT);

    if (workers == 0) workers = WORKER_COUNT;
    if (workers == 0) workers = max(1u, thread::hardware_concurrency());
    workers = min<unsigned>(workers, lab.test_cases.size());

    concurrent_queue<size_t> queue;
    for (size_t i = 0; i < lab.test_cases.size(); ++i)
        queue.push(i);

    // 结果按测试计划的顺序保存，与完成顺序无关
    vector<test_report> reports(lab.test_cases.size());
    vector<thread> pool;
    for (unsigned w = 0; w < workers; ++w) {
        pool.emplace_back([&] {
            while (auto next = queue.try_pop()) {
                if (token && token->cancelled()) break;
                size_t index = *next;
                const test_case &test = lab.test_cases[index];
                try {
                    reports[index] = run_test(lab, *adapter, program, test, submission_dir, token);
                } catch (exception &e) {
                    LOG(ERROR) << "Lab " << lab.id << " test " << test.id << ": " << e.what();
                    test_report &report = reports[index];
                    report.id = test.id;
                    report.result = outcome::SYSTEM_ERROR;
                    report.passed = false;
                    report.feedback = format_feedback(report, e.what());
                }
            }
        });
    }
    for (auto &worker : pool)
        worker.join();

    adapter->cleanup(program);

    if (token && token->cancelled())
        throw submission_aborted(fmt::format("grading of lab {} was cancelled", lab.id));

    grade.tests = move(reports);
    summarize(lab, grade);
    return grade;
}

grade_result lab_grader::submit(const lab_context &ctx, const cancellation_token *token, const submit_options &options) const {
    lab target = ws.load_lab(ctx);
    submission_snapshot snapshot = ws.read_submission(target);

    try {
        auto previous = ws.read_grade_record(target);
        if (previous && previous->submission_hash == snapshot.hash)
            LOG(INFO) << "Regrading unchanged submission " << snapshot.hash << " of lab " << target.id;
    } catch (lab_corrupt &e) {
        LOG(WARNING) << "Previous grade record is unreadable and will be replaced: " << e.what();
    }

    LOG(INFO) << "Grading lab " << target.id << " (" << target.language << ", "
              << target.test_cases.size() << " test cases), submission " << snapshot.hash;
    grade_result grade = evaluate(target, snapshot, token, options.workers);

    ws.write_grade_record(target, grade);
    progress.record_grade(ctx, grade, options.resubmit);

    LOG(INFO) << "Lab " << target.id << " graded: score " << grade.score << ", " << get_display_message(grade.status);
    return grade;
}

}  // namespace grader

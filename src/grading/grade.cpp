#include "grading/grade.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

bool operator==(const test_report &a, const test_report &b) {
    return a.id == b.id && a.result == b.result && a.passed == b.passed &&
           a.duration_ms == b.duration_ms && a.exit_code == b.exit_code &&
           a.feedback == b.feedback;
}

bool operator!=(const test_report &a, const test_report &b) {
    return !(a == b);
}

bool operator==(const grade_result &a, const grade_result &b) {
    return a.lab_id == b.lab_id && a.submission_hash == b.submission_hash &&
           a.timestamp == b.timestamp && a.score == b.score && a.status == b.status &&
           a.feedback == b.feedback && a.diagnostics == b.diagnostics && a.tests == b.tests;
}

bool operator!=(const grade_result &a, const grade_result &b) {
    return !(a == b);
}

double round_score(const weight_t &ratio) {
    // round(ratio * 10000) 使用整数运算，ratio 非负时等价于四舍五入
    weight_t scaled = ratio * 10000;
    int64_t rounded = (scaled.numerator() * 2 + scaled.denominator()) / (scaled.denominator() * 2);
    return rounded / 10000.0;
}

void to_json(json &j, const test_report &report) {
    j = {{"id", report.id},
         {"outcome", get_display_message(report.result)},
         {"passed", report.passed},
         {"durationMs", report.duration_ms},
         {"exitCode", report.exit_code},
         {"feedback", report.feedback}};
}

void from_json(const json &j, test_report &report) {
    report.id = get_value<string>(j, "id");
    report.result = parse_outcome(get_value<string>(j, "outcome"));
    report.passed = get_value<bool>(j, "passed");
    report.duration_ms = get_value<int64_t>(j, "durationMs");
    assign_optional(j, report.exit_code, "exitCode");
    assign_optional(j, report.feedback, "feedback");
}

void to_json(json &j, const grade_result &grade) {
    j = {{"labId", grade.lab_id},
         {"submissionHash", grade.submission_hash},
         {"timestamp", grade.timestamp},
         {"score", grade.score},
         {"status", get_display_message(grade.status)},
         {"feedback", grade.feedback},
         {"diagnostics", grade.diagnostics},
         {"tests", grade.tests}};
}

void from_json(const json &j, grade_result &grade) {
    grade.lab_id = get_value<string>(j, "labId");
    grade.submission_hash = get_value<string>(j, "submissionHash");
    grade.timestamp = get_value<string>(j, "timestamp");
    grade.score = get_value<double>(j, "score");
    grade.status = parse_lab_status(get_value<string>(j, "status"));
    assign_optional(j, grade.feedback, "feedback");
    assign_optional(j, grade.diagnostics, "diagnostics");
    grade.tests = get_value<vector<test_report>>(j, "tests");
}

}  // namespace grader

#include "lab/lab.hpp"
#include <fmt/core.h>
#include <boost/assign.hpp>
#include <cmath>
#include <set>
#include <unordered_map>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

// clang-format off
static const unordered_map<lab_kind, const char *> kind_string = boost::assign::map_list_of
    (lab_kind::FULL, "full")
    (lab_kind::BUGFIX, "bugfix")
    (lab_kind::FILL, "fill");

static const unordered_map<compare_mode, const char *> compare_string = boost::assign::map_list_of
    (compare_mode::EXACT, "exact")
    (compare_mode::NORMALIZED_WHITESPACE, "normalized-whitespace")
    (compare_mode::TOLERANCE, "tolerance")
    (compare_mode::CUSTOM_CHECKER, "custom-checker");
// clang-format on

const char *get_display_message(lab_kind kind) {
    return kind_string.at(kind);
}

const char *get_display_message(compare_mode mode) {
    return compare_string.at(mode);
}

lab_kind parse_lab_kind(const string &kind) {
    for (auto &[key, value] : kind_string)
        if (kind == value) return key;
    throw invalid_argument("unknown lab kind " + kind);
}

compare_mode parse_compare_mode(const string &mode) {
    for (auto &[key, value] : compare_string)
        if (mode == value) return key;
    throw invalid_argument("unknown compare mode " + mode);
}

test_case::test_case()
    : time_limit(DEFAULT_TIME_LIMIT), output_limit(DEFAULT_OUTPUT_LIMIT) {}

lab::lab()
    : pass_threshold(DEFAULT_PASS_THRESHOLD) {}

lab_context lab::context() const {
    return {course_id, unit_id, id};
}

fs::path lab::statement_file() const { return root / "README.md"; }
fs::path lab::metadata_file() const { return root / "lab.json"; }
fs::path lab::starter_dir() const { return root / "starter"; }
fs::path lab::submission_dir() const { return root / "submission"; }
fs::path lab::tests_dir() const { return root / "tests"; }
fs::path lab::manifest_file() const { return tests_dir() / "manifest.json"; }
fs::path lab::grade_file() const { return root / "grade.json"; }
fs::path lab::history_dir() const { return root / "grades"; }

weight_t lab::total_weight() const {
    weight_t total = 0;
    for (auto &test : test_cases) total += test.weight;
    return total;
}

set<fs::path> lab::public_fixtures() const {
    set<fs::path> hidden = {"manifest.json"}, inputs;
    for (auto &test : test_cases) {
        if (!test.expected_file.empty()) hidden.insert(fs::path(test.expected_file).lexically_normal());
        if (!test.checker.empty()) hidden.insert(fs::path(test.checker).lexically_normal());
        if (!test.stdin_file.empty()) inputs.insert(fs::path(test.stdin_file).lexically_normal());
        // sqlite3 通过 .read 读取参数指定的脚本
        if (language == "sql")
            for (auto &arg : test.args)
                inputs.insert(fs::path(arg).lexically_normal());
    }

    set<fs::path> fixtures;
    for (auto &file : list_files(tests_dir())) {
        fs::path normal = file.lexically_normal();
        if (!hidden.count(normal) || inputs.count(normal))
            fixtures.insert(normal);
    }
    return fixtures;
}

bool submission_snapshot::empty() const {
    return files.empty();
}

weight_t parse_weight(const json &weight) {
    if (weight.is_number_unsigned() || weight.is_number_integer()) {
        int64_t value = weight.get<int64_t>();
        if (value < 0) throw invalid_argument("weight must not be negative");
        if (value > MAX_TEST_WEIGHT) throw invalid_argument(fmt::format("weight must not exceed {}", MAX_TEST_WEIGHT));
        return weight_t(value);
    } else if (weight.is_number_float()) {
        double value = weight.get<double>();
        if (!isfinite(value) || value < 0) throw invalid_argument("weight must be a finite non-negative number");
        if (value > MAX_TEST_WEIGHT) throw invalid_argument(fmt::format("weight must not exceed {}", MAX_TEST_WEIGHT));
        // 小数权重按 1e-6 精度转换为有理数
        return weight_t(llround(value * 1000000), 1000000);
    }
    throw invalid_argument("weight must be a number: " + weight.dump());
}

double weight_to_double(const weight_t &weight) {
    return boost::rational_cast<double>(weight);
}

vector<test_case> parse_manifest(const json &manifest) {
    if (!manifest.is_object() || !exists(manifest, "tests") || !manifest.at("tests").is_array())
        throw invalid_argument("manifest must be an object with a \"tests\" array");

    vector<test_case> tests;
    set<string> ids;
    for (auto &item : manifest.at("tests")) {
        test_case test = item.get<test_case>();
        if (!ids.insert(test.id).second)
            throw invalid_argument("duplicated test case id " + test.id);
        tests.push_back(move(test));
    }
    return tests;
}

void to_json(json &j, const test_case &test) {
    j = {{"id", test.id},
         {"compare", get_display_message(test.compare)},
         {"time_limit", test.time_limit},
         {"output_limit", test.output_limit},
         {"expect_clean_exit", test.expect_clean_exit}};
    if (test.weight.denominator() == 1)
        j["weight"] = test.weight.numerator();
    else
        j["weight"] = weight_to_double(test.weight);
    if (!test.command.empty()) j["command"] = test.command;
    if (!test.args.empty()) j["args"] = test.args;
    if (test.stdin_text) j["stdin"] = *test.stdin_text;
    if (!test.stdin_file.empty()) j["stdin_file"] = test.stdin_file;
    if (test.expected_stdout) j["expected_stdout"] = *test.expected_stdout;
    if (!test.expected_file.empty()) j["expected_file"] = test.expected_file;
    if (test.compare == compare_mode::TOLERANCE) j["epsilon"] = test.epsilon;
    if (!test.checker.empty()) j["checker"] = test.checker;
}

void from_json(const json &j, test_case &test) {
    test.id = get_value<string>(j, "id");
    if (test.id.empty()) throw invalid_argument("test case id must not be empty");
    assign_optional(j, test.command, "command");
    assign_optional(j, test.args, "args");
    if (exists(j, "stdin")) test.stdin_text = get_value<string>(j, "stdin");
    if (exists(j, "stdin_file")) test.stdin_file = assert_safe_path(get_value<string>(j, "stdin_file"));
    if (exists(j, "expected_stdout")) test.expected_stdout = get_value<string>(j, "expected_stdout");
    if (exists(j, "expected_file")) test.expected_file = assert_safe_path(get_value<string>(j, "expected_file"));
    test.compare = parse_compare_mode(get_value_def<string>(j, "exact", "compare"));
    assign_optional(j, test.epsilon, "epsilon");
    if (exists(j, "checker")) test.checker = assert_safe_path(get_value<string>(j, "checker"));
    if (exists(j, "weight")) test.weight = parse_weight(j.at("weight"));
    assign_optional(j, test.time_limit, "time_limit");
    assign_optional(j, test.output_limit, "output_limit");
    assign_optional(j, test.expect_clean_exit, "expect_clean_exit");

    if (!(test.time_limit > 0) || test.time_limit > MAX_TIME_LIMIT)
        throw invalid_argument(fmt::format("time limit of test case {} must be within (0, {}]", test.id, MAX_TIME_LIMIT));
    if (test.compare == compare_mode::CUSTOM_CHECKER && test.checker.empty())
        throw invalid_argument("test case " + test.id + " uses custom-checker without a checker");
    if (test.compare != compare_mode::CUSTOM_CHECKER && !test.expected_stdout && test.expected_file.empty())
        throw invalid_argument("test case " + test.id + " has no expected output");
}

void to_json(json &j, const lab &lab) {
    j = {{"id", lab.id},
         {"course", lab.course_id},
         {"unit", lab.unit_id},
         {"language", lab.language},
         {"kind", get_display_message(lab.kind)},
         {"title", lab.title},
         {"entry_point", lab.entry_point},
         {"pass_threshold", lab.pass_threshold},
         {"created_at", lab.created_at}};
}

void from_json(const json &j, lab &lab) {
    lab.id = get_value<string>(j, "id");
    lab.course_id = get_value<string>(j, "course");
    lab.unit_id = get_value<string>(j, "unit");
    lab.language = get_value<string>(j, "language");
    lab.kind = parse_lab_kind(get_value_def<string>(j, "full", "kind"));
    assign_optional(j, lab.title, "title");
    assign_optional(j, lab.entry_point, "entry_point");
    assign_optional(j, lab.pass_threshold, "pass_threshold");
    assign_optional(j, lab.created_at, "created_at");
    if (lab.pass_threshold < 0 || lab.pass_threshold > 1)
        throw invalid_argument("pass threshold must be within [0, 1]");
}

}  // namespace grader

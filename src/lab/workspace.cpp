#include "lab/workspace.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

/**
 * @brief 课程、单元、实验 id 会直接作为文件夹名，不允许包含路径分隔符
 */
static bool is_valid_component(const string &id) {
    return !id.empty() && id != "." && id != ".." && id.find('/') == string::npos && id[0] != '.';
}

workspace::workspace(fs::path data_dir) : root(move(data_dir)) {}

const fs::path &workspace::data_dir() const {
    return root;
}

fs::path workspace::course_dir(const string &course_id) const {
    if (!is_valid_component(course_id))
        throw invalid_argument("invalid course id " + course_id);
    return root / course_id;
}

fs::path workspace::unit_dir(const string &course_id, const string &unit_id) const {
    if (!is_valid_component(unit_id))
        throw invalid_argument("invalid unit id " + unit_id);
    return course_dir(course_id) / unit_id;
}

fs::path workspace::lab_dir(const lab_context &ctx) const {
    if (!is_valid_component(ctx.lab_id))
        throw invalid_argument("invalid lab id " + ctx.lab_id);
    return unit_dir(ctx.course_id, ctx.unit_id) / "labs" / ctx.lab_id;
}

static void write_files(const fs::path &dir, const map<string, string> &files) {
    fs::create_directories(dir);
    for (auto &[name, content] : files)
        write_file_content(dir / name, content);
}

/**
 * @brief 检查测试计划引用的文件都在 test_files 中
 */
static void check_references(const vector<test_case> &tests, const function<bool(const string &)> &has_file) {
    for (auto &test : tests) {
        for (const string *name : {&test.stdin_file, &test.expected_file, &test.checker})
            if (!name->empty() && !has_file(*name))
                throw invalid_argument(fmt::format("test case {} references missing file {}", test.id, *name));
    }
}

lab workspace::create_lab(const lab_context &unit, lab_kind kind, const string &language, const lab_artifacts &artifacts) const {
    fs::path labs_dir = unit_dir(unit.course_id, unit.unit_id) / "labs";

    if (boost::trim_copy(artifacts.statement).empty())
        throw artifact_incomplete("lab statement is empty");
    if (language.empty())
        throw artifact_incomplete("lab language is empty");

    vector<test_case> tests;
    try {
        for (auto &files : {artifacts.starter_files, artifacts.test_files})
            for (auto &[name, content] : files)
                assert_safe_path(name);
        tests = parse_manifest(artifacts.manifest);
        check_references(tests, [&](const string &name) { return artifacts.test_files.count(name) > 0; });
    } catch (invalid_argument &e) {
        throw artifact_incomplete(e.what());
    } catch (json::exception &e) {
        throw artifact_incomplete(e.what());
    }
    if (tests.empty())
        throw artifact_incomplete("lab has no test cases");
    if (artifacts.test_files.count("manifest.json"))
        throw artifact_incomplete("manifest.json is reserved for the test plan");

    lab result;
    result.course_id = unit.course_id;
    result.unit_id = unit.unit_id;
    result.language = language;
    result.kind = kind;
    result.title = artifacts.title.empty() ? fmt::format("{} {} lab", language, get_display_message(kind)) : artifacts.title;
    result.entry_point = artifacts.entry_point;
    if (artifacts.pass_threshold) result.pass_threshold = *artifacts.pass_threshold;
    if (result.pass_threshold < 0 || result.pass_threshold > 1)
        throw artifact_incomplete("pass threshold must be within [0, 1]");
    result.created_at = current_timestamp();
    result.test_cases = tests;
    if (result.total_weight() == 0)
        throw artifact_incomplete("total weight of test cases is zero");

    // 随机后缀保证重新生成的实验不会覆盖旧的实验
    do {
        result.id = slugify(result.title) + "-" + random_uuid().substr(0, 8);
    } while (fs::exists(labs_dir / result.id));
    result.root = labs_dir / result.id;

    // 先写入临时文件夹，完成后再重命名，避免留下不完整的实验
    fs::path staging = labs_dir / ("." + result.id + ".tmp");
    fs::create_directories(staging);
    bool committed = false;
    defer {
        if (!committed) {
            error_code ec;
            make_writable(staging);
            fs::remove_all(staging, ec);
        }
    };

    write_file_content(staging / "README.md", artifacts.statement);
    write_files(staging / "starter", artifacts.starter_files);
    write_files(staging / "submission", artifacts.starter_files);
    write_files(staging / "tests", artifacts.test_files);

    json manifest = artifacts.manifest;
    write_file_content(staging / "tests" / "manifest.json", manifest.dump(2));
    write_file_content(staging / "lab.json", json(result).dump(2));
    fs::create_directories(staging / "grades");

    make_read_only(staging / "starter");
    make_read_only(staging / "tests");

    fs::rename(staging, result.root);
    committed = true;

    LOG(INFO) << "Created " << get_display_message(kind) << " lab " << result.id
              << " (" << language << ", " << tests.size() << " test cases) in "
              << unit.course_id << "/" << unit.unit_id;
    return result;
}

lab workspace::load_lab(const lab_context &ctx) const {
    fs::path dir;
    try {
        dir = lab_dir(ctx);
    } catch (invalid_argument &e) {
        throw lab_not_found(e.what());
    }

    lab result;
    result.root = dir;
    if (!fs::is_directory(dir) || !fs::exists(result.metadata_file()))
        throw lab_not_found(fmt::format("lab {}/{}/{} does not exist", ctx.course_id, ctx.unit_id, ctx.lab_id));

    try {
        json metadata = json::parse(read_file_content(result.metadata_file()));
        metadata.get_to(result);
        result.root = dir;
    } catch (json::exception &e) {
        throw lab_corrupt(fmt::format("lab.json of {} is malformed: {}", ctx.lab_id, e.what()));
    } catch (invalid_argument &e) {
        throw lab_corrupt(fmt::format("lab.json of {} is invalid: {}", ctx.lab_id, e.what()));
    } catch (system_error &e) {
        throw lab_corrupt(fmt::format("lab.json of {} is unreadable: {}", ctx.lab_id, e.what()));
    }

    if (result.id != ctx.lab_id || result.course_id != ctx.course_id || result.unit_id != ctx.unit_id)
        throw lab_corrupt(fmt::format("lab.json of {} does not match its location", ctx.lab_id));

    if (!fs::exists(result.manifest_file()))
        throw lab_corrupt(fmt::format("test plan of {} is missing", ctx.lab_id));

    try {
        result.test_cases = parse_manifest(json::parse(read_file_content(result.manifest_file())));
        check_references(result.test_cases, [&](const string &name) { return fs::is_regular_file(result.tests_dir() / name); });
    } catch (json::exception &e) {
        throw lab_corrupt(fmt::format("test plan of {} is malformed: {}", ctx.lab_id, e.what()));
    } catch (invalid_argument &e) {
        throw lab_corrupt(fmt::format("test plan of {} is invalid: {}", ctx.lab_id, e.what()));
    } catch (system_error &e) {
        throw lab_corrupt(fmt::format("test plan of {} is unreadable: {}", ctx.lab_id, e.what()));
    }

    if (result.test_cases.empty())
        throw lab_corrupt(fmt::format("test plan of {} has no test cases", ctx.lab_id));
    if (result.total_weight() == 0)
        throw lab_corrupt(fmt::format("total weight of test cases of {} is zero", ctx.lab_id));

    return result;
}

vector<lab_context> workspace::list_labs(const string &course_id) const {
    vector<lab_context> labs;
    fs::path course = course_dir(course_id);
    if (!fs::is_directory(course)) return labs;

    for (auto &unit : fs::directory_iterator(course)) {
        if (!unit.is_directory() || !fs::is_directory(unit.path() / "labs")) continue;
        for (auto &lab : fs::directory_iterator(unit.path() / "labs")) {
            string name = lab.path().filename().string();
            if (!lab.is_directory() || !is_valid_component(name)) continue;
            if (!fs::exists(lab.path() / "lab.json")) continue;
            labs.push_back({course_id, unit.path().filename().string(), name});
        }
    }
    sort(labs.begin(), labs.end(), [](const lab_context &a, const lab_context &b) {
        return tie(a.unit_id, a.lab_id) < tie(b.unit_id, b.lab_id);
    });
    return labs;
}

string hash_submission(const vector<pair<fs::path, string>> &files) {
    if (files.empty()) return "";
    md5_digest digest;
    for (auto &[path, content] : files)
        digest.update(path.generic_string()).update(content);
    return digest.hex().substr(0, 16);
}

submission_snapshot workspace::read_submission(const lab &lab) const {
    submission_snapshot snapshot;
    for (auto &file : list_files(lab.submission_dir()))
        snapshot.files.emplace_back(file, read_file_content(lab.submission_dir() / file));
    snapshot.hash = hash_submission(snapshot.files);
    return snapshot;
}

void workspace::reset_submission(const lab &lab) const {
    fs::remove_all(lab.submission_dir());
    copy_directory(lab.starter_dir(), lab.submission_dir());
    LOG(INFO) << "Reset submission of lab " << lab.id << " to starter files";
}

void workspace::write_grade_record(const lab &lab, const grade_result &grade) const {
    auto lock = lock_directory(lab.root, false, chrono::milliseconds((long long)(GRADE_LOCK_TIMEOUT * 1000)));
    if (!lock)
        throw grade_record_write_conflict(fmt::format("timed out waiting for grade record lock of lab {}", lab.id));

    // 编译器、学生程序的输出不一定是合法的 UTF-8
    string content = json(grade).dump(2, ' ', false, json::error_handler_t::replace);
    string name = boost::replace_all_copy(grade.timestamp, ":", "") + "-" +
                  (grade.submission_hash.empty() ? "empty" : grade.submission_hash.substr(0, 8)) + "-" +
                  random_uuid().substr(0, 4) + ".json";
    try {
        write_file_atomic(lab.history_dir() / name, content);
        write_file_atomic(lab.grade_file(), content);
    } catch (system_error &e) {
        throw grade_record_write_conflict(fmt::format("unable to write grade record of lab {}: {}", lab.id, e.what()));
    }
}

static grade_result parse_grade_record(const fs::path &path) {
    try {
        return json::parse(read_file_content(path)).get<grade_result>();
    } catch (json::exception &e) {
        throw lab_corrupt(fmt::format("grade record {} is malformed: {}", path.string(), e.what()));
    } catch (invalid_argument &e) {
        throw lab_corrupt(fmt::format("grade record {} is invalid: {}", path.string(), e.what()));
    }
}

optional<grade_result> workspace::read_grade_record(const lab &lab) const {
    if (!fs::exists(lab.grade_file())) return {};
    return parse_grade_record(lab.grade_file());
}

vector<grade_result> workspace::grade_history(const lab &lab) const {
    vector<grade_result> history;
    for (auto &file : list_files(lab.history_dir())) {
        if (file.extension() != ".json" || file.filename().string()[0] == '.') continue;
        try {
            history.push_back(parse_grade_record(lab.history_dir() / file));
        } catch (lab_corrupt &e) {
            LOG(WARNING) << "Skipping unreadable grade history entry: " << e.what();
        }
    }
    return history;
}

}  // namespace grader

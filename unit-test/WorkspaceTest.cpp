#include <unistd.h>
#include <nlohmann/json.hpp>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "lab/workspace.hpp"
#include "test/lab_fixture.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;
using nlohmann::json;

class WorkspaceTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        ws = make_unique<workspace>(make_temp_dir("workspace"));
    }

    lab_artifacts greeting_artifacts() {
        return make_artifacts("main.sh", {{"main.sh", "echo hello\n"}},
                              {{{"id", "greets"}, {"expected_file", "expected.txt"}, {"weight", 2}},
                               {{"id", "inline"}, {"expected_stdout", "hello\n"}, {"compare", "normalized-whitespace"}}},
                              {{"expected.txt", "hello\n"}});
    }

    grade_result make_grade(const lab &lab, const string &hash, double score) {
        grade_result grade;
        grade.lab_id = lab.id;
        grade.submission_hash = hash;
        grade.timestamp = current_timestamp();
        grade.score = score;
        grade.status = score >= 0.6 ? lab_status::PASSED : lab_status::FAILED;
        grade.feedback = "[PASS] greets";
        test_report report;
        report.id = "greets";
        report.passed = true;
        report.duration_ms = 12;
        report.exit_code = 0;
        report.feedback = "[PASS] greets";
        grade.tests.push_back(report);
        return grade;
    }

    lab_context unit{"cs101", "unit-1", ""};
    unique_ptr<workspace> ws;
};

TEST_F(WorkspaceTest, CreateAndLoadLab) {
    lab created = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    EXPECT_EQ(created.id.rfind("test-lab-", 0), 0u);
    EXPECT_EQ(created.root, ws->data_dir() / "cs101" / "unit-1" / "labs" / created.id);

    EXPECT_TRUE(is_regular_file(created.statement_file()));
    EXPECT_TRUE(is_regular_file(created.starter_dir() / "main.sh"));
    EXPECT_TRUE(is_regular_file(created.submission_dir() / "main.sh"));
    EXPECT_TRUE(is_regular_file(created.manifest_file()));
    EXPECT_TRUE(is_directory(created.history_dir()));

    lab loaded = ws->load_lab(created.context());
    EXPECT_EQ(loaded.id, created.id);
    EXPECT_EQ(loaded.language, "bash");
    EXPECT_EQ(loaded.kind, lab_kind::FULL);
    EXPECT_EQ(loaded.entry_point, "main.sh");
    ASSERT_EQ(loaded.test_cases.size(), 2u);
    EXPECT_EQ(loaded.test_cases[0].id, "greets");
    EXPECT_EQ(loaded.test_cases[0].weight, weight_t(2));
    EXPECT_EQ(loaded.test_cases[1].compare, compare_mode::NORMALIZED_WHITESPACE);
    EXPECT_EQ(loaded.total_weight(), weight_t(3));

    auto labs = ws->list_labs("cs101");
    ASSERT_EQ(labs.size(), 1u);
    EXPECT_EQ(labs[0].unit_id, "unit-1");
    EXPECT_EQ(labs[0].lab_id, created.id);
}

TEST_F(WorkspaceTest, RegeneratedLabsDoNotCollide) {
    lab first = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    lab second = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(ws->list_labs("cs101").size(), 2u);
}

TEST_F(WorkspaceTest, IncompleteArtifactsAreRejected) {
    lab_artifacts artifacts = greeting_artifacts();
    artifacts.statement = "  \n";
    EXPECT_THROW(ws->create_lab(unit, lab_kind::FULL, "bash", artifacts), artifact_incomplete);

    artifacts = greeting_artifacts();
    artifacts.manifest = {{"tests", json::array()}};
    EXPECT_THROW(ws->create_lab(unit, lab_kind::FULL, "bash", artifacts), artifact_incomplete);

    artifacts = greeting_artifacts();
    artifacts.test_files.clear();
    EXPECT_THROW(ws->create_lab(unit, lab_kind::FULL, "bash", artifacts), artifact_incomplete);

    artifacts = greeting_artifacts();
    artifacts.starter_files["../outside.sh"] = "echo";
    EXPECT_THROW(ws->create_lab(unit, lab_kind::FULL, "bash", artifacts), artifact_incomplete);

    artifacts = greeting_artifacts();
    artifacts.pass_threshold = 1.5;
    EXPECT_THROW(ws->create_lab(unit, lab_kind::FULL, "bash", artifacts), artifact_incomplete);

    artifacts = make_artifacts("main.sh", {{"main.sh", ""}}, {{{"id", "a"}, {"expected_stdout", ""}, {"weight", 0}}});
    EXPECT_THROW(ws->create_lab(unit, lab_kind::FULL, "bash", artifacts), artifact_incomplete);

    artifacts = make_artifacts("main.sh", {{"main.sh", ""}}, {{{"id", "a"}, {"expected_stdout", ""}, {"time_limit", 1e300}}});
    EXPECT_THROW(ws->create_lab(unit, lab_kind::FULL, "bash", artifacts), artifact_incomplete);

    // 失败时不留下任何实验
    EXPECT_TRUE(ws->list_labs("cs101").empty());
}

TEST_F(WorkspaceTest, ManifestLimitsAreBounded) {
    auto manifest = [](json test) {
        test["id"] = "a";
        test["expected_stdout"] = "";
        return json{{"tests", json::array({test})}};
    };
    EXPECT_EQ(parse_manifest(manifest({{"time_limit", 3600}}))[0].time_limit, 3600);
    EXPECT_THROW(parse_manifest(manifest({{"time_limit", 3601}})), invalid_argument);
    EXPECT_THROW(parse_manifest(manifest({{"time_limit", 1e300}})), invalid_argument);
    EXPECT_THROW(parse_manifest(manifest({{"time_limit", 0}})), invalid_argument);

    EXPECT_EQ(parse_manifest(manifest({{"weight", 1000000000000LL}}))[0].weight, weight_t(1000000000000LL));
    EXPECT_EQ(parse_manifest(manifest({{"weight", 0.5}}))[0].weight, weight_t(1, 2));
    EXPECT_THROW(parse_manifest(manifest({{"weight", 1e300}})), invalid_argument);
    EXPECT_THROW(parse_manifest(manifest({{"weight", 2000000000000LL}})), invalid_argument);
}

TEST_F(WorkspaceTest, MissingLabIsNotFound) {
    EXPECT_THROW(ws->load_lab({"cs101", "unit-1", "nope"}), lab_not_found);
    EXPECT_THROW(ws->load_lab({"cs101", "unit-1", "../etc"}), lab_not_found);
}

TEST_F(WorkspaceTest, CorruptLabIsReported) {
    lab created = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    write_file_content(created.metadata_file(), "{ not json");
    EXPECT_THROW(ws->load_lab(created.context()), lab_corrupt);

    lab other = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    make_writable(other.tests_dir());
    filesystem::remove(other.tests_dir() / "expected.txt");
    EXPECT_THROW(ws->load_lab(other.context()), lab_corrupt);
}

TEST_F(WorkspaceTest, StarterAndTestsAreReadOnly) {
    lab created = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    auto perms = filesystem::status(created.starter_dir() / "main.sh").permissions();
    EXPECT_EQ(perms & filesystem::perms::owner_write, filesystem::perms::none);
    perms = filesystem::status(created.tests_dir() / "expected.txt").permissions();
    EXPECT_EQ(perms & filesystem::perms::owner_write, filesystem::perms::none);
    perms = filesystem::status(created.submission_dir() / "main.sh").permissions();
    EXPECT_NE(perms & filesystem::perms::owner_write, filesystem::perms::none);
}

TEST_F(WorkspaceTest, SubmissionHashTracksContent) {
    lab created = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    submission_snapshot first = ws->read_submission(created);
    ASSERT_EQ(first.files.size(), 1u);
    EXPECT_EQ(first.hash.size(), 16u);
    EXPECT_EQ(ws->read_submission(created).hash, first.hash);

    write_submission(created, "main.sh", "echo hello world\n");
    submission_snapshot second = ws->read_submission(created);
    EXPECT_NE(second.hash, first.hash);

    ws->reset_submission(created);
    EXPECT_EQ(ws->read_submission(created).hash, first.hash);

    EXPECT_EQ(hash_submission({}), "");
}

TEST_F(WorkspaceTest, FailedGradeWriteKeepsLastRecord) {
    lab created = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    grade_result grade = make_grade(created, "abcdef0123456789", 1);
    ws->write_grade_record(created, grade);

    // grades 被普通文件占用，历史记录无法写入
    remove_all(created.history_dir());
    write_file_content(created.history_dir(), "occupied");
    EXPECT_THROW(ws->write_grade_record(created, make_grade(created, "0123456789abcdef", 0)), grade_record_write_conflict);
    EXPECT_EQ(*ws->read_grade_record(created), grade);
}

TEST_F(WorkspaceTest, InvalidUtf8FeedbackIsReplacedOnWrite) {
    lab created = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    grade_result grade = make_grade(created, "abcdef0123456789", 0);
    grade.diagnostics = "bad byte \xff";
    ASSERT_NO_THROW(ws->write_grade_record(created, grade));
    EXPECT_EQ(ws->read_grade_record(created)->diagnostics, "bad byte \xef\xbf\xbd");
}

TEST_F(WorkspaceTest, GradeRecordRoundTrip) {
    lab created = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    EXPECT_FALSE(ws->read_grade_record(created).has_value());

    grade_result grade = make_grade(created, "abcdef0123456789", 1);
    ws->write_grade_record(created, grade);
    auto stored = ws->read_grade_record(created);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, grade);

    json j = json::parse(read_file_content(created.grade_file()));
    EXPECT_EQ(j.at("labId"), created.id);
    EXPECT_EQ(j.at("status"), "passed");
    EXPECT_EQ(j.at("tests")[0].at("durationMs"), 12);

    ws->write_grade_record(created, make_grade(created, "abcdef0123456789", 0.5));
    auto history = ws->grade_history(created);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(ws->read_grade_record(created)->score, 0.5);
}

TEST_F(WorkspaceTest, ConcurrentGradeWritesKeepRecordConsistent) {
    lab created = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    vector<thread> writers;
    for (int i = 0; i < 4; ++i)
        writers.emplace_back([&, i] {
            for (int k = 0; k < 5; ++k)
                ws->write_grade_record(created, make_grade(created, "hash" + to_string(i), i / 4.0));
        });
    for (auto &writer : writers)
        writer.join();

    auto stored = ws->read_grade_record(created);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->lab_id, created.id);
    EXPECT_EQ(ws->grade_history(created).size(), 20u);
}

TEST_F(WorkspaceTest, CorruptHistoryEntriesAreSkipped) {
    lab created = ws->create_lab(unit, lab_kind::FULL, "bash", greeting_artifacts());
    ws->write_grade_record(created, make_grade(created, "abc", 1));
    write_file_content(created.history_dir() / "broken.json", "{");
    EXPECT_EQ(ws->grade_history(created).size(), 1u);

    write_file_content(created.grade_file(), "[]");
    EXPECT_THROW(ws->read_grade_record(created), lab_corrupt);
}

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "progress/progress.hpp"
#include "test/lab_fixture.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

class ProgressTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        ws = make_unique<workspace>(make_temp_dir("progress"));
        tracker = make_unique<progress_tracker>(*ws);
        lab_artifacts artifacts = make_artifacts("main.sh", {{"main.sh", "echo hi\n"}},
                                                 {{{"id", "t"}, {"expected_stdout", "hi\n"}}});
        target = ws->create_lab({"cs101", "unit-1", ""}, lab_kind::FULL, "bash", artifacts);
    }

    grade_result graded(lab_status status, double score, const string &hash = "0123456789abcdef") {
        grade_result grade;
        grade.lab_id = target.id;
        grade.submission_hash = hash;
        grade.score = score;
        grade.status = status;
        return grade;
    }

    unique_ptr<workspace> ws;
    unique_ptr<progress_tracker> tracker;
    lab target;
};

TEST(ProgressTransitionTest, Transitions) {
    EXPECT_EQ(on_touch(lab_status::NOT_STARTED), lab_status::IN_PROGRESS);
    EXPECT_EQ(on_touch(lab_status::FAILED), lab_status::FAILED);
    EXPECT_EQ(on_touch(lab_status::PASSED), lab_status::PASSED);

    EXPECT_EQ(on_submit(lab_status::NOT_STARTED, false), lab_status::SUBMITTED);
    EXPECT_EQ(on_submit(lab_status::IN_PROGRESS, false), lab_status::SUBMITTED);
    EXPECT_EQ(on_submit(lab_status::FAILED, false), lab_status::SUBMITTED);
    EXPECT_EQ(on_submit(lab_status::PASSED, false), lab_status::PASSED);
    EXPECT_EQ(on_submit(lab_status::PASSED, true), lab_status::SUBMITTED);

    EXPECT_EQ(on_graded(lab_status::SUBMITTED, lab_status::PASSED), lab_status::PASSED);
    EXPECT_EQ(on_graded(lab_status::SUBMITTED, lab_status::FAILED), lab_status::FAILED);
    EXPECT_EQ(on_graded(lab_status::PASSED, lab_status::FAILED), lab_status::PASSED);
    EXPECT_THROW(on_graded(lab_status::SUBMITTED, lab_status::IN_PROGRESS), invalid_argument);
}

TEST_F(ProgressTest, UnknownLabIsNotStarted) {
    progress_record record = tracker->get(target.context());
    EXPECT_EQ(record.status, lab_status::NOT_STARTED);
    EXPECT_EQ(record.attempts, 0);

    auto progress = tracker->get_progress("cs101");
    EXPECT_EQ(progress.at("unit-1").at(target.id), lab_status::NOT_STARTED);
    EXPECT_TRUE(tracker->get_progress("empty-course").empty());
}

TEST_F(ProgressTest, TouchStartsLab) {
    EXPECT_EQ(tracker->touch(target.context()).status, lab_status::IN_PROGRESS);
    EXPECT_EQ(tracker->touch(target.context()).status, lab_status::IN_PROGRESS);
    EXPECT_EQ(tracker->get(target.context()).status, lab_status::IN_PROGRESS);
}

TEST_F(ProgressTest, PassedLabIsNeverDowngraded) {
    tracker->touch(target.context());
    progress_record record = tracker->record_grade(target.context(), graded(lab_status::FAILED, 0.25), false);
    EXPECT_EQ(record.status, lab_status::FAILED);
    EXPECT_EQ(record.attempts, 1);

    record = tracker->record_grade(target.context(), graded(lab_status::PASSED, 1), false);
    EXPECT_EQ(record.status, lab_status::PASSED);
    EXPECT_DOUBLE_EQ(record.best_score, 1);

    record = tracker->record_grade(target.context(), graded(lab_status::FAILED, 0), false);
    EXPECT_EQ(record.status, lab_status::PASSED);
    EXPECT_DOUBLE_EQ(record.best_score, 1);
    EXPECT_DOUBLE_EQ(record.last_score, 0);
    EXPECT_EQ(record.attempts, 3);

    tracker->touch(target.context());
    EXPECT_EQ(tracker->get(target.context()).status, lab_status::PASSED);
}

TEST_F(ProgressTest, ExplicitResubmitCanFail) {
    tracker->record_grade(target.context(), graded(lab_status::PASSED, 1), false);
    progress_record record = tracker->record_grade(target.context(), graded(lab_status::FAILED, 0.5), true);
    EXPECT_EQ(record.status, lab_status::FAILED);
    EXPECT_DOUBLE_EQ(record.best_score, 1);
}

TEST_F(ProgressTest, ProgressIsPersisted) {
    tracker->record_grade(target.context(), graded(lab_status::PASSED, 0.75, "feedfacefeedface"), false);

    progress_tracker reopened(*ws);
    progress_record record = reopened.get(target.context());
    EXPECT_EQ(record.status, lab_status::PASSED);
    EXPECT_DOUBLE_EQ(record.last_score, 0.75);
    EXPECT_EQ(record.last_submission_hash, "feedfacefeedface");
    EXPECT_FALSE(record.updated_at.empty());
    EXPECT_TRUE(is_regular_file(ws->course_dir("cs101") / "progress.json"));
}

TEST_F(ProgressTest, CorruptProgressFileIsReported) {
    write_file_content(ws->course_dir("cs101") / "progress.json", R"({"unit-1": {"x": {"status": "bogus"}}})");
    EXPECT_THROW(tracker->get(target.context()), lab_corrupt);
    EXPECT_THROW(tracker->touch(target.context()), lab_corrupt);
}

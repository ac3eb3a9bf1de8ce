#include "progress/progress.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

lab_status on_touch(lab_status current) {
    return current == lab_status::NOT_STARTED ? lab_status::IN_PROGRESS : current;
}

lab_status on_submit(lab_status current, bool resubmit) {
    if (current == lab_status::PASSED && !resubmit)
        return lab_status::PASSED;
    return lab_status::SUBMITTED;
}

lab_status on_graded(lab_status current, lab_status graded) {
    if (graded != lab_status::PASSED && graded != lab_status::FAILED)
        throw invalid_argument(string("grade status must be passed or failed, got ") + get_display_message(graded));
    // 已通过的实验不会被自动降级
    if (current == lab_status::PASSED)
        return lab_status::PASSED;
    return graded;
}

void to_json(json &j, const progress_record &record) {
    j = {{"status", get_display_message(record.status)},
         {"best_score", record.best_score},
         {"last_score", record.last_score},
         {"attempts", record.attempts},
         {"last_submission_hash", record.last_submission_hash},
         {"updated_at", record.updated_at}};
}

void from_json(const json &j, progress_record &record) {
    record.status = parse_lab_status(get_value<string>(j, "status"));
    assign_optional(j, record.best_score, "best_score");
    assign_optional(j, record.last_score, "last_score");
    assign_optional(j, record.attempts, "attempts");
    assign_optional(j, record.last_submission_hash, "last_submission_hash");
    assign_optional(j, record.updated_at, "updated_at");
}

progress_tracker::progress_tracker(const workspace &ws) : ws(ws) {}

fs::path progress_tracker::progress_file(const string &course_id) const {
    return ws.course_dir(course_id) / "progress.json";
}

json progress_tracker::read(const string &course_id) const {
    fs::path file = progress_file(course_id);
    if (!fs::exists(file)) return json::object();
    try {
        json j = json::parse(read_file_content(file));
        if (!j.is_object()) throw invalid_argument("progress file must be a JSON object");
        for (auto &[unit, labs] : j.items()) {
            if (!labs.is_object()) throw invalid_argument("progress of unit " + unit + " must be a JSON object");
            progress_record parsed;
            for (auto &[lab, record] : labs.items())
                record.get_to(parsed);
        }
        return j;
    } catch (json::exception &e) {
        throw lab_corrupt(fmt::format("progress file {} is malformed: {}", file.string(), e.what()));
    } catch (invalid_argument &e) {
        throw lab_corrupt(fmt::format("progress file {} is invalid: {}", file.string(), e.what()));
    }
}

template <typename Fn>
progress_record progress_tracker::update(const lab_context &ctx, Fn &&fn) const {
    fs::path course = ws.course_dir(ctx.course_id);
    auto lock = lock_directory(course, false, chrono::milliseconds((long long)(GRADE_LOCK_TIMEOUT * 1000)));
    if (!lock)
        throw grade_record_write_conflict(fmt::format("timed out waiting for progress lock of course {}", ctx.course_id));

    json data = read(ctx.course_id);
    progress_record record;
    if (exists(data, ctx.unit_id, ctx.lab_id))
        record = data[ctx.unit_id][ctx.lab_id].get<progress_record>();

    lab_status before = record.status;
    fn(record);
    record.updated_at = current_timestamp();
    data[ctx.unit_id][ctx.lab_id] = record;

    try {
        write_file_atomic(progress_file(ctx.course_id), data.dump(2, ' ', false, json::error_handler_t::replace));
    } catch (system_error &e) {
        throw grade_record_write_conflict(fmt::format("unable to write progress of course {}: {}", ctx.course_id, e.what()));
    }

    if (before != record.status)
        LOG(INFO) << "Lab " << ctx.lab_id << ": " << get_display_message(before) << " -> " << get_display_message(record.status);
    return record;
}

progress_record progress_tracker::touch(const lab_context &ctx) const {
    return update(ctx, [](progress_record &record) {
        record.status = on_touch(record.status);
    });
}

progress_record progress_tracker::record_grade(const lab_context &ctx, const grade_result &grade, bool resubmit) const {
    return update(ctx, [&](progress_record &record) {
        record.status = on_graded(on_submit(record.status, resubmit), grade.status);
        record.best_score = record.attempts == 0 ? grade.score : max(record.best_score, grade.score);
        record.last_score = grade.score;
        record.last_submission_hash = grade.submission_hash;
        ++record.attempts;
    });
}

progress_record progress_tracker::get(const lab_context &ctx) const {
    json data = read(ctx.course_id);
    if (exists(data, ctx.unit_id, ctx.lab_id))
        return data[ctx.unit_id][ctx.lab_id].get<progress_record>();
    return progress_record();
}

map<string, map<string, progress_record>> progress_tracker::records(const string &course_id) const {
    map<string, map<string, progress_record>> result;
    for (auto &ctx : ws.list_labs(course_id))
        result[ctx.unit_id][ctx.lab_id] = progress_record();

    json data = read(course_id);
    for (auto &[unit, labs] : data.items())
        for (auto &[lab, record] : labs.items())
            result[unit][lab] = record.get<progress_record>();
    return result;
}

map<string, map<string, lab_status>> progress_tracker::get_progress(const string &course_id) const {
    map<string, map<string, lab_status>> result;
    for (auto &[unit, labs] : records(course_id))
        for (auto &[lab, record] : labs)
            result[unit][lab] = record.status;
    return result;
}

}  // namespace grader

#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"
#include "grading/grade.hpp"
#include "lab/lab.hpp"
#include "lab/workspace.hpp"

namespace grader {

/**
 * @brief 一个实验的进度
 */
struct progress_record {
    lab_status status = lab_status::NOT_STARTED;

    /**
     * @brief 历次评分的最高分
     */
    double best_score = 0;

    double last_score = 0;

    /**
     * @brief 评分次数
     */
    int attempts = 0;

    std::string last_submission_hash;

    std::string updated_at;
};

/**
 * @brief 打开编辑器或者修改提交：NOT_STARTED -> IN_PROGRESS，其他状态不变
 */
lab_status on_touch(lab_status current);

/**
 * @brief 提交评分
 * NOT_STARTED、IN_PROGRESS、FAILED -> SUBMITTED；PASSED 只有显式重新提交时才变为 SUBMITTED
 * @param resubmit 是否为用户显式的重新提交
 */
lab_status on_submit(lab_status current, bool resubmit);

/**
 * @brief 评分完成
 * SUBMITTED -> PASSED 或 FAILED；PASSED 不会被自动降级
 * @param graded 评分结果的状态，PASSED 或 FAILED
 */
lab_status on_graded(lab_status current, lab_status graded);

void to_json(nlohmann::json &j, const progress_record &record);
void from_json(const nlohmann::json &j, progress_record &record);

/**
 * @brief 课程进度，保存在 <data_dir>/<course>/progress.json
 * 写入时对课程目录加锁，并原子替换文件
 */
struct progress_tracker {
    explicit progress_tracker(const workspace &ws);

    /**
     * @brief 记录学生开始编辑实验
     * @throw grade_record_write_conflict 等待锁超时或者写入失败
     */
    progress_record touch(const lab_context &ctx) const;

    /**
     * @brief 记录一次完成的评分，依次执行提交和评分完成两个状态转移
     * @param resubmit 是否为用户显式的重新提交，允许已通过的实验重新评定
     * @throw grade_record_write_conflict 等待锁超时或者写入失败
     */
    progress_record record_grade(const lab_context &ctx, const grade_result &grade, bool resubmit) const;

    /**
     * @brief 读取一个实验的进度，没有记录时为 NOT_STARTED
     */
    progress_record get(const lab_context &ctx) const;

    /**
     * @brief 课程中所有实验的进度，unit -> lab -> record
     * 包括课程目录中还没有任何记录的实验
     */
    std::map<std::string, std::map<std::string, progress_record>> records(const std::string &course_id) const;

    /**
     * @brief 课程中所有实验的状态，unit -> lab -> status
     */
    std::map<std::string, std::map<std::string, lab_status>> get_progress(const std::string &course_id) const;

private:
    std::filesystem::path progress_file(const std::string &course_id) const;

    nlohmann::json read(const std::string &course_id) const;

    template <typename Fn>
    progress_record update(const lab_context &ctx, Fn &&fn) const;

    const workspace &ws;
};

}  // namespace grader

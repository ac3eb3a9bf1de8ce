#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "lab/lab.hpp"

namespace grader {

/**
 * @brief 评分记录中一个测试点的结果
 */
struct test_report {
    std::string id;

    outcome result = outcome::COMPLETED;

    bool passed = false;

    std::int64_t duration_ms = 0;

    /**
     * @brief 程序的返回值，因信号退出时为 128 + 信号值，没有运行时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 该测试点的一行反馈
     */
    std::string feedback;
};

/**
 * @brief 一次提交的评分结果，计算完成后不再修改
 */
struct grade_result {
    std::string lab_id;
    std::string submission_hash;

    /**
     * @brief ISO 8601 格式的评分时间
     */
    std::string timestamp;

    /**
     * @brief 总分，[0, 1]，保留 4 位小数
     */
    double score = 0;

    /**
     * @brief PASSED 或 FAILED
     */
    lab_status status = lab_status::FAILED;

    /**
     * @brief 所有测试点反馈按测试计划顺序拼接
     */
    std::string feedback;

    /**
     * @brief 编译器输出或者缺失的工具链，已截断
     */
    std::string diagnostics;

    /**
     * @brief 按测试计划的顺序排列
     */
    std::vector<test_report> tests;
};

bool operator==(const test_report &a, const test_report &b);
bool operator!=(const test_report &a, const test_report &b);
bool operator==(const grade_result &a, const grade_result &b);
bool operator!=(const grade_result &a, const grade_result &b);

/**
 * @brief 将 [0, 1] 的有理数分数四舍五入到 4 位小数
 */
double round_score(const weight_t &ratio);

void to_json(nlohmann::json &j, const test_report &report);
void from_json(const nlohmann::json &j, test_report &report);

void to_json(nlohmann::json &j, const grade_result &grade);
void from_json(const nlohmann::json &j, grade_result &grade);

}  // namespace grader

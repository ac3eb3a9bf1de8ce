#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "grading/grade.hpp"
#include "lab/lab.hpp"

namespace grader {

/**
 * @brief 管理课程数据目录中的实验
 *
 * 实验目录结构：
 * <data_dir>/<course>/<unit>/labs/<lab-id>
 * ├── lab.json
 * ├── README.md
 * ├── starter/
 * ├── submission/
 * ├── tests/manifest.json
 * ├── grade.json
 * └── grades/<timestamp>-<hash>.json
 *
 * starter 和 tests 在创建后只读，不需要加锁；
 * grade.json 的写入通过实验目录下的 .lock 文件串行化。
 */
struct workspace {
    explicit workspace(std::filesystem::path data_dir);

    const std::filesystem::path &data_dir() const;

    std::filesystem::path course_dir(const std::string &course_id) const;

    std::filesystem::path unit_dir(const std::string &course_id, const std::string &unit_id) const;

    std::filesystem::path lab_dir(const lab_context &ctx) const;

    /**
     * @brief 根据生成的内容创建新实验
     * 实验 id 由标题和随机串组成，因此重新生成的实验总是得到新的 id。
     * submission 文件夹从 starter 初始化。
     * @param unit 课程和单元，lab_id 被忽略
     * @throw artifact_incomplete 内容不完整或者文件名不安全
     */
    lab create_lab(const lab_context &unit, lab_kind kind, const std::string &language, const lab_artifacts &artifacts) const;

    /**
     * @brief 读取实验
     * @throw lab_not_found 实验目录或 lab.json 不存在
     * @throw lab_corrupt lab.json 或测试计划无法解析
     */
    lab load_lab(const lab_context &ctx) const;

    /**
     * @brief 列出课程中所有实验，按单元和实验 id 排序
     */
    std::vector<lab_context> list_labs(const std::string &course_id) const;

    /**
     * @brief 读取当前提交内容的快照
     */
    submission_snapshot read_submission(const lab &lab) const;

    /**
     * @brief 用 starter 覆盖 submission
     */
    void reset_submission(const lab &lab) const;

    /**
     * @brief 保存评分记录，同时追加到历史记录
     * @throw grade_record_write_conflict 等待锁超时或者替换文件失败，原记录保持不变
     */
    void write_grade_record(const lab &lab, const grade_result &grade) const;

    /**
     * @brief 读取最近一次评分记录
     * @return 没有评分过时为空
     * @throw lab_corrupt grade.json 无法解析
     */
    std::optional<grade_result> read_grade_record(const lab &lab) const;

    /**
     * @brief 读取所有历史评分记录，按时间顺序排列
     */
    std::vector<grade_result> grade_history(const lab &lab) const;

private:
    std::filesystem::path root;
};

/**
 * @brief 计算提交快照的哈希
 * 对每个文件依次输入相对路径和内容，取 MD5 的前 16 个十六进制字符
 */
std::string hash_submission(const std::vector<std::pair<std::filesystem::path, std::string>> &files);

}  // namespace grader

#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "lab/lab.hpp"
#include "lab/workspace.hpp"

/**
 * 测试用的实验工具
 * 用法：
 * 1. setup_test_environment() 创建临时的 DATA_DIR、RUN_DIR
 * 2. make_artifacts(...) 构造实验内容，create_lab 写入工作区
 * 3. write_submission(lab, file, content) 修改学生提交
 */
namespace grader {

void setup_test_environment();

void teardown_test_environment();

/**
 * @brief 每个测试用例独立的临时文件夹
 */
std::filesystem::path make_temp_dir(const std::string &name);

/**
 * @brief toolchain 中是否存在这个可执行文件，不存在时相关测试跳过
 */
bool has_toolchain(const std::string &binary);

lab_artifacts make_artifacts(const std::string &entry_point,
                             const std::map<std::string, std::string> &starter_files,
                             const std::vector<nlohmann::json> &tests,
                             const std::map<std::string, std::string> &test_files = {});

void write_submission(const lab &lab, const std::string &file, const std::string &content);

}  // namespace grader

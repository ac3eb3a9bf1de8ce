#pragma once

#include <boost/rational.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 实验类型
 * FULL 实验的初始代码只有框架，BUGFIX 实验的初始代码包含错误，
 * FILL 实验的初始代码包含待填写的 TODO。
 * 后两种实验的反馈不能泄露预期输出。
 */
enum class lab_kind {
    FULL,
    BUGFIX,
    FILL
};

/**
 * @brief 测试点输出的比较方式
 */
enum class compare_mode {
    /**
     * @brief 逐字节比较，忽略文末的一个换行
     */
    EXACT,

    /**
     * @brief 连续的空白字符视为一个空格，忽略首尾空白
     */
    NORMALIZED_WHITESPACE,

    /**
     * @brief 按空白切分为 token，数值 token 允许 epsilon 的误差
     */
    TOLERANCE,

    /**
     * @brief 调用 tests/ 中的检查程序，返回 0 表示通过
     */
    CUSTOM_CHECKER
};

const char *get_display_message(lab_kind);

const char *get_display_message(compare_mode);

lab_kind parse_lab_kind(const std::string &kind);

compare_mode parse_compare_mode(const std::string &mode);

/**
 * @brief 定位一个实验所需的全部信息
 * 所有核心操作都显式传入，不存在全局的“当前实验”
 */
struct lab_context {
    std::string course_id;
    std::string unit_id;
    std::string lab_id;
};

/**
 * @brief 测试点的权重，采用有理数保证分数计算精确
 */
typedef boost::rational<std::int64_t> weight_t;

/**
 * @brief 测试计划中的一个测试点
 */
struct test_case {
    std::string id;

    /**
     * @brief 替换默认的运行命令，为空时使用语言适配器的运行命令
     * 第一个元素会在 toolchain 的 PATH 或运行目录中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 追加到运行命令之后的参数
     */
    std::vector<std::string> args;

    /**
     * @brief 内联的标准输入
     */
    std::optional<std::string> stdin_text;

    /**
     * @brief 标准输入文件，相对于 tests/ 文件夹
     */
    std::string stdin_file;

    /**
     * @brief 内联的预期输出
     */
    std::optional<std::string> expected_stdout;

    /**
     * @brief 预期输出文件，相对于 tests/ 文件夹
     */
    std::string expected_file;

    compare_mode compare = compare_mode::EXACT;

    /**
     * @brief TOLERANCE 模式下允许的误差
     */
    double epsilon = 1e-6;

    /**
     * @brief CUSTOM_CHECKER 模式下的检查程序，相对于 tests/ 文件夹
     * 检查程序以 <expected> <actual> 为参数运行，返回 0 表示通过
     */
    std::string checker;

    weight_t weight = 1;

    /**
     * @brief 时间限制，单位为秒
     */
    double time_limit;

    /**
     * @brief stdout、stderr 的大小限制，单位为字节
     */
    std::size_t output_limit;

    /**
     * @brief 是否要求程序返回 0，否则非零返回值视为崩溃
     */
    bool expect_clean_exit = true;

    test_case();
};

/**
 * @brief 已经保存到磁盘上的实验
 * 测试计划和初始代码在创建后不再修改
 */
struct lab {
    std::string id;
    std::string course_id;
    std::string unit_id;
    std::string language;
    lab_kind kind = lab_kind::FULL;
    std::string title;

    /**
     * @brief 程序入口文件，比如 main.py，编译型语言可以为空
     */
    std::string entry_point;

    double pass_threshold;
    std::string created_at;

    /**
     * @brief 实验根目录
     */
    std::filesystem::path root;

    std::vector<test_case> test_cases;

    lab();

    lab_context context() const;

    std::filesystem::path statement_file() const;
    std::filesystem::path metadata_file() const;
    std::filesystem::path starter_dir() const;
    std::filesystem::path submission_dir() const;
    std::filesystem::path tests_dir() const;
    std::filesystem::path manifest_file() const;
    std::filesystem::path grade_file() const;
    std::filesystem::path history_dir() const;

    /**
     * @brief 所有测试点权重之和
     */
    weight_t total_weight() const;

    /**
     * @brief 学生程序运行时可以读取的测试数据，相对于 tests_dir()
     * 不包含 manifest.json、预期输出文件和检查程序，除非它们同时是某个测试点的输入
     */
    std::set<std::filesystem::path> public_fixtures() const;
};

/**
 * @brief 生成实验所需的全部内容
 */
struct lab_artifacts {
    std::string title;

    /**
     * @brief 题面，保存为 README.md
     */
    std::string statement;

    std::string entry_point;

    std::optional<double> pass_threshold;

    std::map<std::string, std::string> starter_files;

    /**
     * @brief 测试用的输入输出文件、检查程序
     */
    std::map<std::string, std::string> test_files;

    /**
     * @brief 测试计划，保存为 tests/manifest.json
     */
    nlohmann::json manifest;
};

/**
 * @brief 提交内容的快照，评分和哈希都基于同一份快照
 */
struct submission_snapshot {
    /**
     * @brief 相对路径及内容，按路径排序
     */
    std::vector<std::pair<std::filesystem::path, std::string>> files;

    /**
     * @brief 内容哈希，没有文件时为空字符串
     */
    std::string hash;

    bool empty() const;
};

/**
 * @brief 读取测试计划
 * @throw std::invalid_argument 测试计划格式错误
 */
std::vector<test_case> parse_manifest(const nlohmann::json &manifest);

weight_t parse_weight(const nlohmann::json &weight);

double weight_to_double(const weight_t &weight);

void to_json(nlohmann::json &j, const test_case &test);
void from_json(const nlohmann::json &j, test_case &test);

/**
 * @brief lab.json 的内容，不包含测试计划
 */
void to_json(nlohmann::json &j, const lab &lab);
void from_json(const nlohmann::json &j, lab &lab);

}  // namespace grader

#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "lab/lab.hpp"
#include "lab/workspace.hpp"

namespace grader {

/**
 * @brief 实验内容的来源
 */
struct content_gateway {
    virtual ~content_gateway();

    /**
     * @brief 为单元生成一个实验
     * @param unit 课程和单元，lab_id 被忽略
     * @throw generation_unavailable 无法生成
     */
    virtual lab_artifacts generate_lab(const lab_context &unit, const std::string &language, lab_kind kind) = 0;
};

/**
 * @brief 调用外部生成程序，从其 stdout 读取 JSON 格式的实验内容
 *
 * 生成程序的参数为 command... --course <id> --unit <id> --language <lang> --kind <kind>，
 * 输出格式：
 * @code{.json}
 * {
 *   "title": "...",
 *   "readme": "...",
 *   "entry_point": "main.py",
 *   "pass_threshold": 0.6,
 *   "starter_files": {"main.py": "..."},
 *   "test_files": {"input1.txt": "..."},
 *   "manifest": {"tests": [...]}
 * }
 * @endcode
 * JSON 可以被包在 markdown 的 ```json 代码块中。
 */
struct command_gateway : content_gateway {
    /**
     * @param command 生成程序及其固定参数
     * @param env 传给生成程序的额外环境变量（比如访问令牌）
     */
    explicit command_gateway(std::vector<std::string> command, std::map<std::string, std::string> env = {});

    lab_artifacts generate_lab(const lab_context &unit, const std::string &language, lab_kind kind) override;

private:
    std::vector<std::string> command;
    std::map<std::string, std::string> env;
};

/**
 * @brief 内置的最小实验模板：输出 "Hello, world!"
 * 生成服务不可用时作为回退
 */
struct static_template_gateway : content_gateway {
    lab_artifacts generate_lab(const lab_context &unit, const std::string &language, lab_kind kind) override;
};

/**
 * @brief 从文本中提取 JSON，支持 markdown 代码块
 * @throw generation_unavailable 找不到合法的 JSON
 */
nlohmann::json extract_json(const std::string &text);

/**
 * @brief 解析生成程序输出的实验内容
 * @throw generation_unavailable 格式错误
 */
lab_artifacts parse_artifacts(const nlohmann::json &j);

/**
 * @brief 生成并保存实验，gateway 不可用时回退到静态模板
 * @throw artifact_incomplete 生成的内容不完整
 */
lab generate_lab(const workspace &ws, const lab_context &unit, const std::string &language, lab_kind kind, content_gateway &gateway);

}  // namespace grader

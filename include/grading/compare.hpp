#pragma once

#include <cstddef>
#include <string>
#include "lab/lab.hpp"

namespace grader {

/**
 * @brief 输出比较的结果
 */
struct compare_result {
    bool passed = false;

    /**
     * @brief 第一处不同所在的行（从 1 开始），TOLERANCE 模式下为 token 序号
     * 0 表示没有具体位置
     */
    std::size_t position = 0;

    /**
     * @brief 第一处不同的预期内容，可能为空
     */
    std::string expected;

    /**
     * @brief 第一处不同的实际内容，可能为空
     */
    std::string actual;

    /**
     * @brief 不同的原因
     */
    std::string reason;
};

/**
 * @brief 去掉文末的一个换行
 */
std::string trim_trailing_newline(const std::string &text);

/**
 * @brief 将连续的空白字符替换为一个空格，并去掉首尾空白
 */
std::string collapse_whitespace(const std::string &text);

/**
 * @brief 逐字节比较，忽略文末的一个换行
 */
compare_result compare_exact(const std::string &expected, const std::string &actual);

/**
 * @brief 连续的空白字符视为一个空格后逐字节比较
 */
compare_result compare_normalized_whitespace(const std::string &expected, const std::string &actual);

/**
 * @brief 将两边输出解析为数值序列，每一对的差的绝对值都小于 epsilon 时通过
 * 任何一个 token 无法解析为数值时比较失败
 */
compare_result compare_tolerance(const std::string &expected, const std::string &actual, double epsilon);

/**
 * @brief 按比较方式比较输出，CUSTOM_CHECKER 需要运行检查程序，不能使用此函数
 * @throw std::invalid_argument mode 为 CUSTOM_CHECKER
 */
compare_result compare_output(const test_case &test, const std::string &expected, const std::string &actual);

/**
 * @brief 转义控制字符和不合法的 UTF-8 字节（\xNN），保证结果只有一行且可以写入 JSON
 * @param limit 转义后的最大字节数
 */
std::string escape_output(const std::string &text, std::size_t limit);

/**
 * @brief 生成不同之处的一行描述
 * @param reveal_expected 为假时不包含预期输出的任何内容
 * @param limit 预期、实际内容的最大字符数
 */
std::string describe_mismatch(const compare_result &result, bool reveal_expected, std::size_t limit);

}  // namespace grader

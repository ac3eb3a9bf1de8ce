#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 生成的实验内容不完整
 * 缺少题面、测试计划为空、测试权重之和为 0，或者文件名不安全
 */
struct artifact_incomplete : public grader_exception {
    explicit artifact_incomplete(const std::string &message);
};

/**
 * @brief 实验目录或 lab.json 不存在
 */
struct lab_not_found : public grader_exception {
    explicit lab_not_found(const std::string &message);
};

/**
 * @brief 实验存在但元数据或测试计划无法读取、无法解析
 */
struct lab_corrupt : public grader_exception {
    explicit lab_corrupt(const std::string &message);
};

/**
 * @brief 学生程序编译失败
 */
struct build_failed : public grader_exception {
    build_failed(const std::string &message, const std::string &diagnostics);

    /**
     * @brief 编译器输出（可能被截断）
     */
    std::string diagnostics;
};

/**
 * @brief 找不到实验语言所需的编译器或解释器
 */
struct toolchain_missing : public grader_exception {
    toolchain_missing(const std::string &language, const std::string &binary);

    std::string language;
    std::string binary;
};

/**
 * @brief 实验内容生成服务不可用，调用方应该回退到静态模板
 */
struct generation_unavailable : public grader_exception {
    explicit generation_unavailable(const std::string &message);
};

/**
 * @brief 评分记录或进度记录写入冲突（等待文件锁超时或者替换文件失败）
 * 此时原有的记录保持不变
 */
struct grade_record_write_conflict : public grader_exception {
    explicit grade_record_write_conflict(const std::string &message);
};

/**
 * @brief 评分过程被用户中断，所有子进程已经结束，结果没有保存
 */
struct submission_aborted : public grader_exception {
    explicit submission_aborted(const std::string &message);
};

}  // namespace grader

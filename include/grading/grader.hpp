#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include "grading/grade.hpp"
#include "lab/lab.hpp"
#include "lab/workspace.hpp"
#include "progress/progress.hpp"
#include "runtime/adapters.hpp"
#include "runtime/execution.hpp"
#include "runtime/registry.hpp"

namespace grader {

/**
 * @brief 一次提交的选项
 */
struct submit_options {
    /**
     * @brief 用户显式的重新提交，允许已通过的实验被重新评定
     */
    bool resubmit = false;

    /**
     * @brief 同时运行的测试点数量，0 表示使用 WORKER_COUNT
     */
    unsigned workers = 0;
};

/**
 * @brief 评分流程：读取实验和提交快照、暂存编译、并发运行测试点、
 * 比较输出、计算分数、保存评分记录、推进进度
 */
struct lab_grader {
    lab_grader(const workspace &ws, const adapter_registry &registry, const progress_tracker &progress);

    /**
     * @brief 评分一次提交并保存结果
     *
     * 编译失败、找不到工具链时所有测试点都标记为对应的结果，分数为 0，
     * 这种情况不会抛出异常，评分记录照常保存。
     *
     * @param ctx 要评分的实验
     * @param token 中断标记，被取消时所有子进程都会被杀死，不保存任何结果
     * @throw lab_not_found 实验不存在
     * @throw lab_corrupt 实验元数据或测试计划损坏
     * @throw grade_record_write_conflict 评分记录写入冲突，原记录保持不变
     * @throw submission_aborted 评分被中断
     */
    grade_result submit(const lab_context &ctx, const cancellation_token *token = nullptr,
                        const submit_options &options = submit_options()) const;

    /**
     * @brief 对一份提交快照评分，不保存结果
     * @throw submission_aborted 评分被中断
     */
    grade_result evaluate(const lab &lab, const submission_snapshot &snapshot,
                          const cancellation_token *token = nullptr, unsigned workers = 0) const;

    /**
     * @brief 已经运行的测试点程序数量（不包括编译器和检查程序）
     */
    std::size_t executed_runs() const;

private:
    test_report run_test(const lab &lab, const language_adapter &adapter, const staged_program &program,
                         const test_case &test, const std::filesystem::path &submission_dir,
                         const cancellation_token *token) const;

    /**
     * @brief 编译失败或者找不到工具链时，所有测试点都标记为 result
     */
    void short_circuit(const lab &lab, grade_result &grade, outcome result, const std::string &diagnostics) const;

    void summarize(const lab &lab, grade_result &grade) const;

    const workspace &ws;
    const adapter_registry &registry;
    const progress_tracker &progress;
    mutable std::atomic<std::size_t> runs{0};
};

/**
 * @brief 评分结果中的一行反馈
 */
std::string format_feedback(const test_report &report, const std::string &detail);

}  // namespace grader

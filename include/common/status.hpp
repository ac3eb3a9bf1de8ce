#pragma once

#include <string>

namespace grader {

/**
 * @brief 一次子进程运行的状态
 * PENDING -> RUNNING -> {COMPLETED, TIMED_OUT, OUTPUT_TRUNCATED, CRASHED}
 * 另外两个终止状态只在无法启动子进程或者用户中断时出现。
 */
enum class run_state {
    /**
     * @brief 还没有启动子进程
     */
    PENDING = 0,

    /**
     * @brief 子进程正在运行
     */
    RUNNING = 1,

    /**
     * @brief 子进程在时间限制内正常退出
     * 如果要求子进程返回 0，则退出码必须为 0，否则为 CRASHED
     */
    COMPLETED = 2,

    /**
     * @brief 子进程超出时间限制，整个进程组已经被杀死
     */
    TIMED_OUT = 3,

    /**
     * @brief 子进程的 stdout 或 stderr 超出大小限制，超出部分已被丢弃
     * 被截断的输出仍然会参与比较
     */
    OUTPUT_TRUNCATED = 4,

    /**
     * @brief 子进程因为信号退出，或者以非零返回值退出
     */
    CRASHED = 5,

    /**
     * @brief 评分被用户中断，子进程已经被杀死
     */
    CANCELLED = 6,

    /**
     * @brief 无法创建子进程（fork、pipe、exec 失败）
     */
    SYSTEM_ERROR = 7
};

/**
 * @brief 评分记录中每个测试点的结果标签
 */
enum class outcome {
    COMPLETED = 0,
    TIMED_OUT = 1,
    OUTPUT_TRUNCATED = 2,
    CRASHED = 3,

    /**
     * @brief 学生程序编译失败，所有测试点都不会运行
     */
    BUILD_FAILED = 4,

    /**
     * @brief 找不到编译器或解释器，所有测试点都不会运行
     */
    TOOLCHAIN_MISSING = 5,

    /**
     * @brief 评分程序本身出错（无法启动子进程、无法复制运行目录等）
     */
    SYSTEM_ERROR = 6
};

/**
 * @brief 实验的进度状态
 * NOT_STARTED -> IN_PROGRESS -> SUBMITTED -> {PASSED, FAILED}
 * FAILED 的实验可以重新提交，PASSED 不会被自动降级
 */
enum class lab_status {
    NOT_STARTED = 0,
    IN_PROGRESS = 1,
    SUBMITTED = 2,
    PASSED = 3,
    FAILED = 4
};

const char *get_display_message(run_state);

const char *get_display_message(outcome);

const char *get_display_message(lab_status);

/**
 * @brief 将终止的运行状态转换为评分记录中的结果标签
 */
outcome to_outcome(run_state state);

/**
 * @brief 解析评分记录中的结果标签
 * @throw std::invalid_argument 如果标签不存在
 */
outcome parse_outcome(const std::string &tag);

/**
 * @brief 解析进度记录中的状态
 * @throw std::invalid_argument 如果状态不存在
 */
lab_status parse_lab_status(const std::string &tag);

}  // namespace grader

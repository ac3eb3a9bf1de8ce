#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 用户中断评分时使用的标记，可以跨线程共享
 * 运行中的子进程会在下一次轮询时被杀死
 */
struct cancellation_token {
    void cancel() noexcept;

    bool cancelled() const noexcept;

private:
    std::atomic<bool> flag{false};
};

/**
 * @brief 一次子进程运行的参数
 */
struct execution_request {
    /**
     * @brief argv[0] 为程序路径，不包含 '/' 时在 PATH 中查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 子进程的工作目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 标准输入文件，为空时使用 /dev/null
     */
    std::filesystem::path stdin_file;

    /**
     * @brief 额外的环境变量，覆盖白名单中的同名变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 墙上时钟时间限制，单位为秒
     */
    double time_limit;

    /**
     * @brief stdout、stderr 各自的大小限制，单位为字节
     */
    std::size_t output_limit;

    /**
     * @brief 为真时非零返回值视为崩溃
     */
    bool expect_clean_exit = true;

    execution_request();
};

/**
 * @brief 一次子进程运行的结果
 */
struct execution_result {
    run_state state = run_state::PENDING;

    /**
     * @brief 返回值，因信号退出时为 128 + 信号值，未运行时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 导致子进程退出的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 截断后的 stdout
     */
    std::string output;

    /**
     * @brief 截断后的 stderr
     */
    std::string error;

    /**
     * @brief stdout 或 stderr 是否超出大小限制
     */
    bool truncated = false;

    std::chrono::milliseconds duration{0};

    /**
     * @brief 无法启动子进程时的错误信息
     */
    std::string system_error;
};

/**
 * @brief 在独立的进程组中运行子进程并监督它直到结束
 *
 * 子进程在 work_dir 中运行，环境变量只保留 ENV_ALLOW_LIST 中的变量，
 * 禁止生成 core 文件，写文件大小受 FILE_SIZE_LIMIT 限制。
 * 超过时间限制或者 token 被取消时，先向整个进程组发送 SIGTERM，
 * 等待 KILL_DELAY 后发送 SIGKILL。子进程正常退出后也会杀死进程组
 * 中残留的进程，不会留下孤儿进程。
 *
 * 超出输出限制的部分会被读出并丢弃，避免子进程阻塞在写管道上。
 *
 * 这个函数不会因为子进程的问题抛出异常，无法启动子进程时返回 SYSTEM_ERROR。
 * @param request 运行参数
 * @param token 可选的中断标记
 */
execution_result run_process(const execution_request &request, const cancellation_token *token = nullptr);

/**
 * @brief 构造子进程的环境变量
 * 只保留 ENV_ALLOW_LIST 中的变量，PATH 被替换为 toolchain 的 PATH
 */
std::map<std::string, std::string> scrubbed_environment(const std::map<std::string, std::string> &extra);

/**
 * @brief 进程启动以来成功创建的子进程数量
 */
std::size_t spawned_process_count();

}  // namespace grader

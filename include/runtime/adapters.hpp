#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include "lab/lab.hpp"
#include "runtime/execution.hpp"

namespace grader {

/**
 * @brief 已经暂存（并编译）好的学生程序
 *
 * dir 的结构：
 * dir
 * ├── main.cpp // 学生提交的文件
 * ├── program // 编译产物（编译型语言）
 * └── tests // 学生程序可以读取的测试输入，不含预期输出和检查程序
 */
struct staged_program {
    std::string language;

    /**
     * @brief 暂存及编译目录，每个测试点运行时复制一份
     */
    std::filesystem::path dir;

    /**
     * @brief 程序入口，相对于 dir
     */
    std::string entry_point;

    /**
     * @brief 运行命令，相对路径相对于运行目录
     */
    std::vector<std::string> run_command;

    /**
     * @brief 运行时额外的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 已找到的编译器、解释器
     */
    std::map<std::string, std::filesystem::path> tools;

    /**
     * @brief 编译器输出（警告等），可能为空
     */
    std::string diagnostics;
};

/**
 * @brief 编译阶段的上下文
 */
struct compile_context {
    const lab &target;
    std::filesystem::path dir;
    std::string entry_point;
    std::map<std::string, std::filesystem::path> tools;
    std::map<std::string, std::string> env;
    const cancellation_token *token;

    /**
     * @brief 编译器输出的警告
     */
    std::string diagnostics;

    /**
     * @brief 在 dir 中以编译时间限制运行编译命令
     * @return 编译器的输出
     * @throw build_failed 编译器返回非零值、超时或者无法启动
     * @throw submission_aborted 编译过程中用户中断
     */
    std::string run_compiler(const std::vector<std::string> &argv) const;

    /**
     * @brief dir 中（不递归）扩展名为 extension 的文件，按文件名排序
     * @throw build_failed 没有找到这种源文件
     */
    std::vector<std::string> sources(const std::string &extension) const;

    /**
     * @brief 检查入口文件存在
     * @throw build_failed 入口文件不存在
     */
    void require_entry_point() const;
};

/**
 * @brief 解释型语言的默认实现：不需要编译，只检查入口文件存在
 */
struct interpreted_adapter {
    void compile(compile_context &ctx) const;

    std::map<std::string, std::string> environment(const std::filesystem::path &dir) const;
};

struct python_adapter : interpreted_adapter {
    const char *name() const { return "python"; }
    std::vector<std::string> toolchain() const { return {"python3"}; }
    std::string default_entry_point() const { return "main.py"; }
    std::vector<std::string> run_command(const compile_context &ctx) const;
    std::map<std::string, std::string> environment(const std::filesystem::path &dir) const;
};

struct javascript_adapter : interpreted_adapter {
    const char *name() const { return "javascript"; }
    std::vector<std::string> toolchain() const { return {"node"}; }
    std::string default_entry_point() const { return "main.js"; }
    std::vector<std::string> run_command(const compile_context &ctx) const;
};

struct typescript_adapter {
    const char *name() const { return "typescript"; }
    std::vector<std::string> toolchain() const { return {"tsc", "node"}; }
    std::string default_entry_point() const { return "main.ts"; }
    void compile(compile_context &ctx) const;
    std::vector<std::string> run_command(const compile_context &ctx) const;
    std::map<std::string, std::string> environment(const std::filesystem::path &dir) const;
};

struct c_adapter {
    const char *name() const { return "c"; }
    std::vector<std::string> toolchain() const { return {"gcc"}; }
    std::string default_entry_point() const { return ""; }
    void compile(compile_context &ctx) const;
    std::vector<std::string> run_command(const compile_context &ctx) const;
    std::map<std::string, std::string> environment(const std::filesystem::path &dir) const;
};

struct cpp_adapter {
    const char *name() const { return "cpp"; }
    std::vector<std::string> toolchain() const { return {"g++"}; }
    std::string default_entry_point() const { return ""; }
    void compile(compile_context &ctx) const;
    std::vector<std::string> run_command(const compile_context &ctx) const;
    std::map<std::string, std::string> environment(const std::filesystem::path &dir) const;
};

struct go_adapter {
    const char *name() const { return "go"; }
    std::vector<std::string> toolchain() const { return {"go"}; }
    std::string default_entry_point() const { return ""; }
    void compile(compile_context &ctx) const;
    std::vector<std::string> run_command(const compile_context &ctx) const;

    /**
     * @brief go 需要可写的缓存目录，HOME 可能不存在
     */
    std::map<std::string, std::string> environment(const std::filesystem::path &dir) const;
};

struct java_adapter {
    const char *name() const { return "java"; }
    std::vector<std::string> toolchain() const { return {"javac", "java"}; }
    std::string default_entry_point() const { return "Main.java"; }
    void compile(compile_context &ctx) const;
    std::vector<std::string> run_command(const compile_context &ctx) const;
    std::map<std::string, std::string> environment(const std::filesystem::path &dir) const;
};

/**
 * @brief SQL 实验在内存数据库中执行
 * 测试点的 args 是依次执行的建表、数据脚本（相对于 tests 文件夹），最后执行学生的脚本
 */
struct sql_adapter : interpreted_adapter {
    const char *name() const { return "sql"; }
    std::vector<std::string> toolchain() const { return {"sqlite3"}; }
    std::string default_entry_point() const { return "solution.sql"; }
    std::vector<std::string> run_command(const compile_context &ctx) const;
};

struct bash_adapter : interpreted_adapter {
    const char *name() const { return "bash"; }
    std::vector<std::string> toolchain() const { return {"bash"}; }
    std::string default_entry_point() const { return "main.sh"; }
    std::vector<std::string> run_command(const compile_context &ctx) const;
};

typedef std::variant<python_adapter, javascript_adapter, typescript_adapter,
                     c_adapter, cpp_adapter, go_adapter, java_adapter,
                     sql_adapter, bash_adapter>
    adapter_variant;

/**
 * @brief 一种语言的运行时适配器
 * 负责暂存提交、编译、为每个测试点构造运行命令，以及清理
 */
struct language_adapter {
    explicit language_adapter(adapter_variant impl);

    std::string name() const;

    /**
     * @brief 运行该语言需要的可执行文件
     */
    std::vector<std::string> toolchain() const;

    /**
     * @brief 在 toolchain 的 PATH 中查找所需的可执行文件
     * 测试点中自定义命令使用的程序也会被检查
     * @throw toolchain_missing 任何一个找不到
     */
    std::map<std::string, std::filesystem::path> resolve_toolchain(const lab &lab) const;

    /**
     * @brief 将提交快照和测试文件暂存到 dir 并编译
     * @throw toolchain_missing 找不到编译器或解释器，此时不会启动任何进程
     * @throw build_failed 编译失败或入口文件不存在
     * @throw submission_aborted 编译过程中用户中断
     */
    staged_program prepare(const lab &lab, const submission_snapshot &snapshot,
                           const std::filesystem::path &dir, const cancellation_token *token = nullptr) const;

    /**
     * @brief 构造一个测试点的运行参数
     * @param run_dir 该测试点独立的运行目录（program.dir 的拷贝）
     */
    execution_request build_command(const staged_program &program, const test_case &test,
                                    const std::filesystem::path &run_dir) const;

    /**
     * @brief 构造自定义检查程序的运行参数
     * 检查程序以 <expected> <actual> [<input>] 为参数，返回 0 表示通过，输出作为反馈
     */
    execution_request checker_command(const staged_program &program, const test_case &test,
                                      const std::filesystem::path &expected, const std::filesystem::path &actual,
                                      const std::filesystem::path &run_dir) const;

    /**
     * @brief 删除暂存目录，DEBUG 模式下保留
     */
    void cleanup(const staged_program &program) const;

private:
    adapter_variant impl;
};

}  // namespace grader

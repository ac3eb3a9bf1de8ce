#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>

namespace grader {

/**
 * @brief 课程数据的根目录，所有课程、单元、实验都保存在这里
 *
 * DATA_DIR
 * ├── cpp-basics // course id
 * │   ├── progress.json // 该课程所有实验的进度记录
 * │   └── 01-pointers // unit id
 * │       └── labs
 * │           └── swap-values-1a2b3c4d // lab id
 * │               ├── lab.json // 实验元数据（语言、类型、及格线）
 * │               ├── README.md // 题面
 * │               ├── starter // 初始代码（只读）
 * │               ├── submission // 学生的工作目录
 * │               ├── tests // 测试计划 manifest.json 及输入输出文件（只读）
 * │               ├── grade.json // 最近一次评分记录
 * │               └── grades // 历史评分记录
 * └── ...
 */
extern std::filesystem::path DATA_DIR;

/**
 * @brief 学生程序编译及运行的根目录，评分完成后除非开启 DEBUG 否则会被删除
 *
 * RUN_DIR
 * └── cpp-basics // course id
 *     └── 01-pointers // unit id
 *         └── swap-values-1a2b3c4d // lab id
 *             └── sub-[uuid] // 一次提交
 *                 ├── compile // 学生代码与测试文件的暂存及编译目录
 *                 ├── run-[uuid] // 每个测试点独立的运行目录（compile 的拷贝）
 *                 └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 查找编译器、解释器时使用的 PATH
 * 为空时使用评分程序自身的 PATH 环境变量
 */
extern std::string TOOLCHAIN_PATH;

/**
 * @brief 运行学生程序时允许保留的环境变量
 * 其他环境变量在启动子进程前全部清除
 */
extern std::set<std::string> ENV_ALLOW_LIST;

/**
 * @brief 默认及格线，实验可以在 lab.json 中单独配置
 */
extern double DEFAULT_PASS_THRESHOLD;

/**
 * @brief 测试点的默认时间限制，单位为秒
 */
extern double DEFAULT_TIME_LIMIT;

/**
 * @brief 测试点时间限制的上限，单位为秒
 */
extern double MAX_TIME_LIMIT;

/**
 * @brief 单个测试点权重的上限，保证权重之和不会溢出
 */
extern double MAX_TEST_WEIGHT;

/**
 * @brief 测试点 stdout/stderr 的默认大小限制，单位为字节
 */
extern std::size_t DEFAULT_OUTPUT_LIMIT;

/**
 * @brief 子进程可以写入的单个文件大小上限（RLIMIT_FSIZE），单位为字节
 */
extern std::size_t FILE_SIZE_LIMIT;

/**
 * @brief 超时或中断时，SIGTERM 之后等待多久再发送 SIGKILL，单位为秒
 */
extern double KILL_DELAY;

/**
 * @brief 编译学生程序的时间限制，单位为秒
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief 编译器输出的大小限制，单位为字节
 */
extern std::size_t COMPILE_OUTPUT_LIMIT;

/**
 * @brief 生成实验内容的外部命令的时间限制，单位为秒
 */
extern double GENERATOR_TIME_LIMIT;

/**
 * @brief 一次提交同时运行的测试点数量上限，0 表示 CPU 核心数
 */
extern unsigned WORKER_COUNT;

/**
 * @brief 等待评分记录文件锁的最长时间，单位为秒
 */
extern double GRADE_LOCK_TIMEOUT;

/**
 * @brief 反馈信息中单行预期、实际输出的最大字符数
 */
extern std::size_t FEEDBACK_LINE_LIMIT;

/**
 * @brief 编译诊断信息保存到评分记录时的最大字符数
 */
extern std::size_t DIAGNOSTICS_LIMIT;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评分程序不会删除 RUN_DIR 中的提交目录，
 * 以便手动检查编译和运行产生的文件。
 */
extern bool DEBUG;

}  // namespace grader

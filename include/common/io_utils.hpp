#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 如果文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 写入文件，会创建不存在的父目录
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 原子地替换文件内容
 * 先写入同目录下的临时文件并 fsync，再 rename 到目标路径。
 * 任何一步失败时目标文件保持原样，临时文件被删除。
 * @throw std::system_error 写入或替换失败
 */
void write_file_atomic(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 是一个不会逃出父目录的相对路径
 * 实验内容由外部生成，如果文件名包含 ".." 或者是绝对路径，
 * 写入时可能覆盖课程目录以外的文件。
 * @param subpath 被检查的文件名
 * @throw std::invalid_argument 如果路径不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 递归列出文件夹下的所有普通文件
 * @return 相对于 dir 的路径，按字典序排序
 */
std::vector<std::filesystem::path> list_files(const std::filesystem::path &dir);

/**
 * @brief 递归复制文件夹，目标文件夹已有的同名文件会被覆盖
 */
void copy_directory(const std::filesystem::path &from, const std::filesystem::path &to);

/**
 * @brief 递归去掉文件夹下所有文件的写权限
 */
void make_read_only(const std::filesystem::path &dir);

/**
 * @brief 递归恢复文件夹下所有文件的写权限，以便删除
 */
void make_writable(const std::filesystem::path &dir);

struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(scoped_file_lock &&);
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    /**
     * @brief 尝试在 timeout 内获得文件锁
     * @return 获得锁时返回文件锁，超时返回空
     */
    static std::optional<scoped_file_lock> try_lock(const std::filesystem::path &path, bool shared, std::chrono::milliseconds timeout);

    void release();

private:
    int fd = -1;
    bool valid = false;
    std::filesystem::path lock_file;
};

/**
 * @brief 锁文件夹
 * 通过创建文件夹，并对文件夹根目录下的 .lock 文件加锁实现
 * @param dir 要被加锁的文件夹
 * @param shared 是否是共享锁，真为共享锁（读锁），假为独占锁（写锁）
 * @param timeout 等待锁的最长时间
 * @return 获得锁时返回文件锁，超时返回空
 */
std::optional<scoped_file_lock> lock_directory(const std::filesystem::path &dir, bool shared, std::chrono::milliseconds timeout);

}  // namespace grader

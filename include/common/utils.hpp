#pragma once

#include <boost/uuid/detail/md5.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 查找编译器、解释器时使用的 PATH
 * @return TOOLCHAIN_PATH，如果没有配置则为当前进程的 PATH
 */
std::string toolchain_search_path();

/**
 * @brief 在 search_path 中查找可执行文件，类似 which
 * @param name 可执行文件名，如果包含 '/' 则直接检查该路径
 * @param search_path 以 ':' 分隔的目录列表
 * @return 可执行文件的绝对路径，找不到时为空
 */
std::optional<std::filesystem::path> find_executable(const std::string &name, const std::string &search_path);

/**
 * @brief 当前 UTC 时间，ISO 8601 格式，精确到毫秒
 */
std::string current_timestamp();

/**
 * @brief 生成随机 uuid 的字符串形式
 */
std::string random_uuid();

/**
 * @brief 将标题转换为只包含小写字母、数字和 '-' 的字符串
 */
std::string slugify(const std::string &title);

/**
 * @brief 增量计算 MD5 摘要
 */
struct md5_digest {
    md5_digest &update(const std::string &data);

    /**
     * @brief 32 个十六进制字符的摘要
     */
    std::string hex();

private:
    boost::uuids::detail::md5 md5;
};

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader

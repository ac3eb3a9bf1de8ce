#pragma once

#include <string>
#include <vector>

namespace grader {

template <typename ContainerT>
void append(ContainerT &a, const ContainerT &b) {
    a.insert(a.end(), b.begin(), b.end());
}

/**
 * @brief 将字符串按 '\n' 切分为行，"\r\n" 视为一个换行
 * 末尾的换行不会产生额外的空行
 */
std::vector<std::string> split_lines(const std::string &text);

/**
 * @brief 以 text[pos] 开头的 UTF-8 字符占用的字节数
 * @return 字符不是合法的 UTF-8 编码时返回 0
 */
std::size_t utf8_char_length(const std::string &text, std::size_t pos);

/**
 * @brief 将不合法的 UTF-8 字节替换为 U+FFFD
 */
std::string sanitize_utf8(const std::string &text);

/**
 * @brief 截断字符串，超出部分用 "..." 代替
 * 截断位置落在多字节字符中间时前移到字符开头
 */
std::string truncate(const std::string &text, std::size_t limit);

}  // namespace grader

#pragma once

#include <map>
#include <string>
#include <vector>
#include "runtime/adapters.hpp"

namespace grader {

/**
 * @brief 语言名到运行时适配器的映射
 * 集合在构造时确定，运行期间只读，可以被多个线程共享
 */
struct adapter_registry {
    /**
     * @brief 包含所有支持的语言及其别名
     */
    adapter_registry();

    /**
     * @brief 查找语言的适配器，语言名不区分大小写，支持别名（如 py、c++、js）
     * @throw toolchain_missing 不支持该语言
     */
    const language_adapter &find(const std::string &language) const;

    bool supports(const std::string &language) const;

    /**
     * @brief 所有语言的规范名称
     */
    std::vector<std::string> languages() const;

    /**
     * @brief 将别名转换为规范名称，不支持的语言原样返回
     */
    std::string canonical_name(const std::string &language) const;

private:
    std::map<std::string, language_adapter> adapters;
    std::map<std::string, std::string> aliases;
};

}  // namespace grader

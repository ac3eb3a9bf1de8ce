#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 离开作用域时执行代码块
 * @code{.cpp}
 *     int fd = open(...);
 *     defer { close(fd); };
 * @endcode
 */
#define defer auto DEFER_0(_deferred_action) = ::grader::scoped_guard() + [&]

namespace grader {

struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> action);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(std::function<void()> action) const;

private:
    std::function<void()> action;
};

}  // namespace grader

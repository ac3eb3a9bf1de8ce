#include "common/defer.hpp"
#include <utility>

namespace grader {

scoped_guard::scoped_guard() : action() {}

scoped_guard::scoped_guard(std::function<void()> action) : action(std::move(action)) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : action(std::move(other.action)) {
    other.action = nullptr;
}

scoped_guard::~scoped_guard() {
    if (action) action();
}

scoped_guard scoped_guard::operator+(std::function<void()> action) const {
    return scoped_guard(std::move(action));
}

}  // namespace grader

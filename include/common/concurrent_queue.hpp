#pragma once

#include <deque>
#include <mutex>
#include <optional>

namespace grader {

/**
 * @brief 评测工作线程共享的任务队列
 *
 * 评测开始前放入全部测试点的序号，之后只会被取出，不再放入新任务。
 * 工作线程不断调用 try_pop，队列为空即表示没有剩余的测试点，线程退出，
 * 因此不需要阻塞等待的 pop。
 * @param <T> 任务类型，一般为测试点在测试计划中的序号
 */
template <typename T>
class concurrent_queue {
public:
    /**
     * @brief 按放入顺序取出一个任务
     * @return 队列已空时返回 std::nullopt
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> guard(mut);
        if (tasks.empty()) return std::nullopt;
        T task = std::move(tasks.front());
        tasks.pop_front();
        return task;
    }

    void push(T task) {
        std::lock_guard<std::mutex> guard(mut);
        tasks.push_back(std::move(task));
    }

private:
    std::deque<T> tasks;
    std::mutex mut;
};

}  // namespace grader

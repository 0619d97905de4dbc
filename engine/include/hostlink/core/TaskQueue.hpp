#pragma once

#include <cstddef>
#include <functional>
#include <queue>

#include <hostlink/util/NonCopyable.hpp>
#include <hostlink/util/SpinLock.hpp>

namespace hostlink::core
{

/// 다른 스레드 -> 루프 스레드로 작업을 넘기는 MPSC 큐입니다.
class TaskQueue : private hostlink::util::NonCopyable
{
  public:
    using Task = std::function<void()>;

    TaskQueue() = default;
    ~TaskQueue() = default;

    TaskQueue(TaskQueue &&) = delete;
    TaskQueue &operator=(TaskQueue &&) = delete;

    void push(Task &&task);
    bool tryPop(Task &outTask);

    [[nodiscard]] std::size_t size() const;

  private:
    mutable hostlink::util::SpinLock lock_;
    std::queue<Task> queue_;
};

} // namespace hostlink::core

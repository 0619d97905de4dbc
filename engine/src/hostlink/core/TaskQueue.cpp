#include <hostlink/core/TaskQueue.hpp>

namespace hostlink::core
{

void TaskQueue::push(Task &&task)
{
    hostlink::util::SpinLockGuard guard(lock_);
    queue_.push(std::move(task));
}

bool TaskQueue::tryPop(Task &outTask)
{
    hostlink::util::SpinLockGuard guard(lock_);

    if (queue_.empty())
    {
        return false;
    }

    outTask = std::move(queue_.front());
    queue_.pop();
    return true;
}

std::size_t TaskQueue::size() const
{
    hostlink::util::SpinLockGuard guard(lock_);
    return queue_.size();
}

} // namespace hostlink::core

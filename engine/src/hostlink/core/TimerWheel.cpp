#include <hostlink/core/TimerWheel.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace hostlink::core
{

TimerWheel::TimerWheel(Duration tickResolution, std::size_t slotCount)
    : tickResolution_(tickResolution), slotCount_(slotCount), slots_(slotCount),
      lastTickTime_(Clock::now())
{
    if (tickResolution_ <= Duration::zero())
    {
        throw std::invalid_argument("TimerWheel tickResolution must be > 0");
    }
    if (slotCount_ == 0)
    {
        throw std::invalid_argument("TimerWheel slotCount must be > 0");
    }
}

TimerWheel::TimerId TimerWheel::addTimer(Duration delay, Callback callback)
{
    if (!callback)
    {
        throw std::invalid_argument("TimerWheel::addTimer requires a valid callback");
    }

    const auto ticks = durationToTicks(delay);
    const std::uint64_t delayTicks = (ticks == 0) ? 1 : ticks;

    const auto expirationTick = currentTick_ + delayTicks;
    const auto slotIndex = static_cast<std::size_t>(expirationTick % slotCount_);

    const TimerId id = nextTimerId();
    slots_[slotIndex].push_back(Timer{id, expirationTick, std::move(callback)});
    slotOf_.emplace(id, slotIndex);

    return id;
}

bool TimerWheel::cancelTimer(TimerId id) noexcept
{
    auto it = slotOf_.find(id);
    if (it == slotOf_.end())
    {
        return false;
    }

    auto &bucket = slots_[it->second];
    slotOf_.erase(it);

    // processCurrentTick() 도중(콜백 안)의 취소라면 대상은 scratch_에 있다.
    // slotOf_에서 빠졌으므로 scratch_ 순회 시 건너뛴다.
    auto pos = std::find_if(bucket.begin(), bucket.end(),
                            [id](const Timer &t) { return t.id == id; });
    if (pos != bucket.end())
    {
        bucket.erase(pos);
    }
    return true;
}

void TimerWheel::tick()
{
    ++currentTick_;
    processCurrentTick();
}

void TimerWheel::tick(Clock::time_point now)
{
    if (now <= lastTickTime_)
    {
        return;
    }

    const auto elapsedMs = std::chrono::duration_cast<Duration>(now - lastTickTime_);
    if (elapsedMs < tickResolution_)
    {
        return;
    }

    const auto totalMs = static_cast<std::uint64_t>(elapsedMs.count());
    const auto tickMs = static_cast<std::uint64_t>(tickResolution_.count());
    const auto ticksToAdvance = totalMs / tickMs;

    for (std::uint64_t i = 0; i < ticksToAdvance; ++i)
    {
        tick();
    }

    // 누적 오차를 줄이기 위해 now가 아니라 tick 배수만큼만 전진
    lastTickTime_ += tickResolution_ * static_cast<std::int64_t>(ticksToAdvance);
}

std::uint64_t TimerWheel::durationToTicks(Duration delay) const noexcept
{
    if (delay <= Duration::zero())
    {
        return 0;
    }

    const auto delayMs = static_cast<std::uint64_t>(delay.count());
    const auto tickMs = static_cast<std::uint64_t>(tickResolution_.count());
    return (delayMs + tickMs - 1) / tickMs;
}

TimerWheel::TimerId TimerWheel::nextTimerId() noexcept
{
    TimerId id = nextId_;
    ++nextId_;
    if (nextId_ == kInvalidTimerId)
    {
        nextId_ = 1;
    }
    return id;
}

void TimerWheel::processCurrentTick()
{
    const auto slotIndex = static_cast<std::size_t>(currentTick_ % slotCount_);
    auto &bucket = slots_[slotIndex];

    if (bucket.empty())
    {
        return;
    }

    scratch_.clear();
    scratch_.swap(bucket);

    // 콜백이 addTimer()로 scratch_를 건드리지 않도록 로컬로 옮긴다.
    std::vector<Timer> current;
    current.swap(scratch_);

    for (auto &timer : current)
    {
        if (slotOf_.find(timer.id) == slotOf_.end())
        {
            continue; // 순회 중 취소됨
        }

        if (timer.expirationTick <= currentTick_)
        {
            slotOf_.erase(timer.id);
            timer.callback();
        }
        else
        {
            // wrap-around: 아직 만료 전이면 같은 슬롯으로 되돌린다.
            slots_[slotIndex].push_back(std::move(timer));
        }
    }

    current.clear();
    scratch_.swap(current); // 버퍼 용량 재사용
}

} // namespace hostlink::core

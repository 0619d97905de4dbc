#pragma once

#include <hostlink/core/TaskQueue.hpp>
#include <hostlink/core/TimerWheel.hpp>
#include <hostlink/net/EpollReactor.hpp>
#include <hostlink/net/FdContext.hpp>
#include <hostlink/net/FdHandler.hpp>
#include <hostlink/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <unordered_map>
#include <vector>

namespace hostlink::net
{

/// 단일 스레드 readiness 루프 (epoll + timer wheel + cross-thread task queue)
///
/// - fd/타이머 API는 owner thread 전용이다. 다른 스레드는 post()만 쓸 수 있다.
/// - owner thread는 run() 또는 bindToCurrentThread()를 처음 호출한 스레드로 고정된다.
class EventLoop : private hostlink::util::NonCopyable
{
  public:
    using Duration = core::TimerWheel::Duration;

    EventLoop(Duration tickResolution, std::size_t timerSlots, int maxEpollEvents = 64);
    ~EventLoop();

    void bindToCurrentThread() noexcept;
    [[nodiscard]] bool isInOwnerThread() const noexcept;

    bool addFd(int fd, std::uint32_t events, IFdHandler *handler) noexcept;
    bool updateFd(int fd, std::uint32_t events) noexcept;
    bool removeFd(int fd) noexcept;

    [[nodiscard]] std::size_t registeredFdCount() const noexcept { return fdContexts_.size(); }

    /// 어느 스레드에서나 호출 가능. 다른 스레드면 eventfd로 루프를 깨운다.
    void post(core::TaskQueue::Task task);

    /// 콜백 예외는 잡아서 로그만 남긴다.
    core::TimerWheel::TimerId addTimer(Duration delay, core::TimerWheel::Callback cb);
    bool cancelTimer(core::TimerWheel::TimerId id) noexcept;

    void runOnce() noexcept;
    void run(const std::atomic_bool &runningFlag) noexcept;

    [[nodiscard]] core::TimerWheel &timerWheel() noexcept { return timerWheel_; }

  private:
    EpollReactor reactor_;
    core::TaskQueue taskQueue_;
    core::TimerWheel timerWheel_;

    std::vector<EpollReactor::ReadyEvent> readyEvents_;
    std::unordered_map<int, FdContext> fdContexts_;

    std::atomic_bool ownerBound_{false};
    std::thread::id ownerThread_{};

    void assertInOwnerThread_(const char *apiName) const noexcept;

    void drainTasks_() noexcept;
    [[nodiscard]] int computePollTimeoutMs_() const noexcept;

    // ===== wakeup(eventfd) =====
    struct WakeupHandler;
    int wakeupFd_{-1};
    std::unique_ptr<WakeupHandler> wakeupHandler_;
    bool wakeupRegistered_{false};

    void installWakeupFd_() noexcept;
    void signalWakeup_() noexcept;
    void drainWakeupFd_() noexcept;
};

} // namespace hostlink::net

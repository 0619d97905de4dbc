#include <hostlink/net/EventLoop.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/core/ThreadContext.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <system_error>
#include <thread>

#include <sys/eventfd.h>
#include <unistd.h>

namespace hostlink::net
{

struct EventLoop::WakeupHandler final : IFdHandler
{
    explicit WakeupHandler(EventLoop *owner) noexcept : owner_(owner) {}

    [[nodiscard]] const char *fdTag() const noexcept override { return "eventfd"; }

    [[nodiscard]] std::uint64_t fdDebugId() const noexcept override
    {
        return static_cast<std::uint64_t>(owner_->wakeupFd_);
    }

    void handleEvent(EventLoop &, const EpollReactor::ReadyEvent &ev) override
    {
        if (ev.events & (EPOLLERR | EPOLLHUP))
        {
            SLOG_ERROR("EventLoop", "WakeupFdError", "fd={} events=0x{:x}", ev.fd, ev.events);
        }
        if (ev.events & EPOLLIN)
        {
            owner_->drainWakeupFd_();
        }
    }

  private:
    EventLoop *owner_;
};

EventLoop::EventLoop(Duration tickResolution, std::size_t timerSlots, int maxEpollEvents)
    : reactor_(maxEpollEvents), timerWheel_(tickResolution, timerSlots)
{
    if (maxEpollEvents <= 0)
    {
        maxEpollEvents = 64;
    }
    readyEvents_.resize(static_cast<std::size_t>(maxEpollEvents));

    wakeupFd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeupFd_ < 0)
    {
        throw std::system_error(errno, std::generic_category(), "EventLoop: eventfd failed");
    }
    wakeupHandler_ = std::make_unique<WakeupHandler>(this);

    SLOG_DEBUG("EventLoop", "Created", "tick_ms={} timer_slots={} max_epoll_events={} wakeup_fd={}",
               timerWheel_.tickResolution().count(), timerWheel_.slotCount(), maxEpollEvents,
               wakeupFd_);
}

EventLoop::~EventLoop()
{
    if (wakeupFd_ >= 0)
    {
        ::close(wakeupFd_);
        wakeupFd_ = -1;
    }
}

void EventLoop::bindToCurrentThread() noexcept
{
    const auto thisThread = std::this_thread::get_id();

    if (ownerBound_.load(std::memory_order_acquire))
    {
        if (thisThread != ownerThread_)
        {
            SLOG_FATAL("EventLoop", "BindWrongThread", "reason=AlreadyBound");
            std::abort();
        }
        return;
    }

    ownerThread_ = thisThread;
    ownerBound_.store(true, std::memory_order_release);
    installWakeupFd_();
}

bool EventLoop::isInOwnerThread() const noexcept
{
    if (!ownerBound_.load(std::memory_order_acquire))
    {
        return false;
    }
    return std::this_thread::get_id() == ownerThread_;
}

void EventLoop::assertInOwnerThread_(const char *apiName) const noexcept
{
    if (!isInOwnerThread())
    {
        // 스레드 규약 위반은 복구 불가능한 버그로 취급한다.
        SLOG_FATAL("EventLoop", "ApiWrongThread", "api='{}' bound={} thread={} tid={}", apiName,
                   ownerBound_.load() ? 1 : 0, core::ttag(), core::tid());
        core::shutdownLogger();
        std::abort();
    }
}

void EventLoop::installWakeupFd_() noexcept
{
    if (wakeupRegistered_)
    {
        return;
    }

    const auto mask = EpollReactor::makeEventMask({
        EpollReactor::Event::Read,
        EpollReactor::Event::EdgeTriggered,
    });

    if (!addFd(wakeupFd_, mask, wakeupHandler_.get()))
    {
        SLOG_FATAL("EventLoop", "WakeupRegisterFailed", "fd={}", wakeupFd_);
        core::shutdownLogger();
        std::abort();
    }
    wakeupRegistered_ = true;
}

void EventLoop::signalWakeup_() noexcept
{
    const std::uint64_t one = 1;
    for (;;)
    {
        const ::ssize_t n = ::write(wakeupFd_, &one, sizeof(one));
        if (n == static_cast<::ssize_t>(sizeof(one)))
        {
            return;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        // EAGAIN: 카운터가 포화 상태 = 이미 깨울 예정
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            return;
        }
        SLOG_ERROR("EventLoop", "WakeupWriteFailed", "fd={} errno={} msg='{}'", wakeupFd_, errno,
                   std::strerror(errno));
        return;
    }
}

void EventLoop::drainWakeupFd_() noexcept
{
    for (;;)
    {
        std::uint64_t value = 0;
        const ::ssize_t n = ::read(wakeupFd_, &value, sizeof(value));
        if (n == static_cast<::ssize_t>(sizeof(value)))
        {
            continue;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0 && (errno != EAGAIN && errno != EWOULDBLOCK))
        {
            SLOG_ERROR("EventLoop", "WakeupReadFailed", "fd={} errno={} msg='{}'", wakeupFd_,
                       errno, std::strerror(errno));
        }
        break;
    }
}

bool EventLoop::addFd(int fd, std::uint32_t events, IFdHandler *handler) noexcept
{
    assertInOwnerThread_("addFd");

    if (fd < 0 || !handler)
    {
        errno = (fd < 0) ? EBADF : EINVAL;
        SLOG_ERROR("EventLoop", "AddFdInvalid", "fd={} handler_null={}", fd, handler ? 0 : 1);
        return false;
    }

    if (!reactor_.registerFd(fd, events))
    {
        return false;
    }

    FdContext ctx{fd, handler, handler->fdTag(), handler->fdDebugId(), events};
    auto [it, inserted] = fdContexts_.insert_or_assign(fd, ctx);
    (void)it;
    if (!inserted)
    {
        SLOG_WARN("EventLoop", "FdContextOverwrite", "fd={} tag={} id={}", fd, ctx.tag,
                  ctx.debugId);
    }

    SLOG_DEBUG("EventLoop", "FdRegistered", "fd={} tag={} id={} events=0x{:x}", fd, ctx.tag,
               ctx.debugId, events);
    return true;
}

bool EventLoop::updateFd(int fd, std::uint32_t events) noexcept
{
    assertInOwnerThread_("updateFd");

    auto it = fdContexts_.find(fd);
    if (it == fdContexts_.end())
    {
        errno = ENOENT;
        SLOG_ERROR("EventLoop", "UpdateFdMissingContext", "fd={}", fd);
        return false;
    }

    if (it->second.registeredEvents == events)
    {
        return true;
    }

    if (!reactor_.modifyFd(fd, events))
    {
        return false;
    }

    it->second.registeredEvents = events;
    return true;
}

bool EventLoop::removeFd(int fd) noexcept
{
    assertInOwnerThread_("removeFd");

    auto it = fdContexts_.find(fd);
    if (it == fdContexts_.end())
    {
        SLOG_WARN("EventLoop", "RemoveFdMissingContext", "fd={}", fd);
        return false;
    }

    const FdContext ctx = it->second;
    fdContexts_.erase(it);

    const bool ok = reactor_.unregisterFd(fd);
    SLOG_DEBUG("EventLoop", "FdUnregistered", "fd={} tag={} id={} ok={}", fd, ctx.tag,
               ctx.debugId, ok ? 1 : 0);
    return ok;
}

void EventLoop::post(core::TaskQueue::Task task)
{
    taskQueue_.push(std::move(task));

    if (!isInOwnerThread())
    {
        signalWakeup_();
    }
}

core::TimerWheel::TimerId EventLoop::addTimer(Duration delay, core::TimerWheel::Callback cb)
{
    assertInOwnerThread_("addTimer");

    return timerWheel_.addTimer(delay, [cb = std::move(cb)]() {
        try
        {
            cb();
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("EventLoop", "TimerException", "what='{}'", e.what());
        }
    });
}

bool EventLoop::cancelTimer(core::TimerWheel::TimerId id) noexcept
{
    assertInOwnerThread_("cancelTimer");
    return timerWheel_.cancelTimer(id);
}

int EventLoop::computePollTimeoutMs_() const noexcept
{
    const auto ms64 = timerWheel_.tickResolution().count();
    if (ms64 <= 0)
    {
        return 1;
    }
    if (ms64 > static_cast<long long>(std::numeric_limits<int>::max()))
    {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms64);
}

void EventLoop::drainTasks_() noexcept
{
    core::TaskQueue::Task task;
    while (taskQueue_.tryPop(task))
    {
        if (!task)
        {
            continue;
        }
        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("EventLoop", "TaskException", "what='{}'", e.what());
        }
    }
}

void EventLoop::runOnce() noexcept
{
    drainTasks_();
    timerWheel_.tick(core::TimerWheel::Clock::now());

    const int n = reactor_.wait(readyEvents_, computePollTimeoutMs_());
    if (n > 0)
    {
        for (int i = 0; i < n; ++i)
        {
            const auto ev = readyEvents_[static_cast<std::size_t>(i)];

            // 같은 배치 안에서 앞선 handler가 이 fd를 제거했을 수 있다.
            auto it = fdContexts_.find(ev.fd);
            if (it == fdContexts_.end())
            {
                SLOG_TRACE("EventLoop", "EventWithoutContext", "fd={} events=0x{:x}", ev.fd,
                           ev.events);
                continue;
            }

            const FdContext ctx = it->second;
            try
            {
                ctx.handler->handleEvent(*this, ev);
            }
            catch (const std::exception &e)
            {
                SLOG_ERROR("EventLoop", "HandlerException", "fd={} tag={} id={} what='{}'", ev.fd,
                           ctx.tag, ctx.debugId, e.what());
            }
        }
    }
    else if (n < 0 && errno != EINTR)
    {
        SLOG_WARN("EventLoop", "PollError", "errno={} msg='{}'", errno, std::strerror(errno));
    }

    timerWheel_.tick(core::TimerWheel::Clock::now());
    drainTasks_();
}

void EventLoop::run(const std::atomic_bool &runningFlag) noexcept
{
    bindToCurrentThread();

    while (runningFlag.load(std::memory_order_acquire))
    {
        runOnce();
    }
}

} // namespace hostlink::net

#include <hostlink/net/EpollReactor.hpp>

#include <hostlink/core/Logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <unistd.h>

namespace hostlink::net
{

EpollReactor::EpollReactor(int maxEvents)
{
    if (maxEvents <= 0)
    {
        maxEvents = 64;
    }

    epollFd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                "EpollReactor: epoll_create1 failed");
    }

    eventBuffer_.resize(static_cast<std::size_t>(maxEvents));
    SLOG_DEBUG("EpollReactor", "Created", "fd={} max_events={}", epollFd_, maxEvents);
}

EpollReactor::~EpollReactor() noexcept
{
    if (epollFd_ >= 0)
    {
        ::close(epollFd_);
        SLOG_DEBUG("EpollReactor", "Closed", "fd={}", epollFd_);
        epollFd_ = -1;
    }
}

bool EpollReactor::ctl_(int op, const char *opName, Fd fd, std::uint32_t events) noexcept
{
    if (epollFd_ < 0 || fd < 0)
    {
        errno = EBADF;
        SLOG_ERROR("EpollReactor", "CtlInvalidFd", "op={} epoll_fd={} fd={}", opName, epollFd_,
                   fd);
        return false;
    }

    ::epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;

    if (::epoll_ctl(epollFd_, op, fd, op == EPOLL_CTL_DEL ? nullptr : &ev) == -1)
    {
        const int e = errno;
        // DEL 시 ENOENT/EBADF는 이미 정리된 fd라서 경고로만 남긴다.
        if (op == EPOLL_CTL_DEL && (e == ENOENT || e == EBADF))
        {
            SLOG_WARN("EpollReactor", "CtlFailed", "op={} fd={} errno={} msg='{}'", opName, fd, e,
                      std::strerror(e));
        }
        else
        {
            SLOG_ERROR("EpollReactor", "CtlFailed", "op={} fd={} errno={} msg='{}'", opName, fd,
                       e, std::strerror(e));
        }
        errno = e;
        return false;
    }

    SLOG_TRACE("EpollReactor", "Ctl", "op={} fd={} events=0x{:x}", opName, fd, events);
    return true;
}

bool EpollReactor::registerFd(Fd fd, std::uint32_t events) noexcept
{
    return ctl_(EPOLL_CTL_ADD, "add", fd, events);
}

bool EpollReactor::modifyFd(Fd fd, std::uint32_t events) noexcept
{
    return ctl_(EPOLL_CTL_MOD, "mod", fd, events);
}

bool EpollReactor::unregisterFd(Fd fd) noexcept
{
    return ctl_(EPOLL_CTL_DEL, "del", fd, 0);
}

int EpollReactor::wait(std::span<ReadyEvent> outEvents, int timeoutMs) noexcept
{
    if (epollFd_ < 0)
    {
        errno = EBADF;
        return -1;
    }
    if (outEvents.empty())
    {
        return 0;
    }

    const int maxPoll =
        static_cast<int>(std::min(outEvents.size(), eventBuffer_.size()));

    const int n = ::epoll_wait(epollFd_, eventBuffer_.data(), maxPoll, timeoutMs);
    if (n < 0)
    {
        if (errno != EINTR)
        {
            SLOG_ERROR("EpollReactor", "WaitFailed", "errno={} msg='{}'", errno,
                       std::strerror(errno));
        }
        return -1;
    }

    for (int i = 0; i < n; ++i)
    {
        outEvents[static_cast<std::size_t>(i)].fd = eventBuffer_[static_cast<std::size_t>(i)].data.fd;
        outEvents[static_cast<std::size_t>(i)].events =
            eventBuffer_[static_cast<std::size_t>(i)].events;
    }
    return n;
}

} // namespace hostlink::net

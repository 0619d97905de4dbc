#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

#include <sys/epoll.h>

#include <hostlink/util/NonCopyable.hpp>

namespace hostlink::net
{

/// epoll_create1/epoll_ctl/epoll_wait thin wrapper 입니다.
class EpollReactor : private hostlink::util::NonCopyable
{
  public:
    using Fd = int;

    enum class Event : std::uint32_t
    {
        None = 0,
        Read = EPOLLIN,
        Write = EPOLLOUT,
        ReadHangup = EPOLLRDHUP,
        Error = EPOLLERR,
        Hangup = EPOLLHUP,
        EdgeTriggered = EPOLLET,
    };

    struct ReadyEvent
    {
        Fd fd{-1};
        std::uint32_t events{0}; ///< EPOLLIN | EPOLLOUT | ... 의 비트 OR
    };

    explicit EpollReactor(int maxEvents = 64);
    ~EpollReactor() noexcept;

    // 같은 epoll fd를 두 번 close 하지 않도록 이동도 금지
    EpollReactor(EpollReactor &&) = delete;
    EpollReactor &operator=(EpollReactor &&) = delete;

    static constexpr std::uint32_t makeEventMask(std::initializer_list<Event> events) noexcept
    {
        std::uint32_t mask = 0;
        for (auto e : events)
        {
            mask |= static_cast<std::uint32_t>(e);
        }
        return mask;
    }

    bool registerFd(Fd fd, std::uint32_t events) noexcept;
    bool modifyFd(Fd fd, std::uint32_t events) noexcept;
    bool unregisterFd(Fd fd) noexcept;

    /// @return 준비된 이벤트 수(0 = 타임아웃), 오류면 -1 (errno 확인, EINTR 포함)
    int wait(std::span<ReadyEvent> outEvents, int timeoutMs) noexcept;

    [[nodiscard]] Fd nativeHandle() const noexcept { return epollFd_; }

  private:
    Fd epollFd_{-1};
    std::vector<::epoll_event> eventBuffer_;

    bool ctl_(int op, const char *opName, Fd fd, std::uint32_t events) noexcept;
};

} // namespace hostlink::net

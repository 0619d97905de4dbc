#pragma once

#include <cstdint>

#include <hostlink/net/EpollReactor.hpp>

namespace hostlink::net {

class EventLoop;

/// EventLoop에 등록되는 모든 fd의 이벤트 수신자입니다.
///
/// - fd 하나당 handler 하나. 이벤트는 해당 handler의 handleEvent()로만 전달된다.
/// - handleEvent()는 EventLoop owner thread에서만 호출된다.
/// - handler 수명은 fd가 등록되어 있는 동안 유효해야 한다.
/// - handleEvent()에서 던진 예외는 EventLoop가 잡아서 로그만 남긴다.
///   연결 단위 실패 처리는 handler가 직접 해야 한다.
class IFdHandler {
  public:
    virtual ~IFdHandler() = default;

    /// "acceptor", "connection", "eventfd" 같은 고정 문자열
    [[nodiscard]] virtual const char *fdTag() const noexcept = 0;

    /// 추적용 id (연결 id 등). 없으면 0.
    [[nodiscard]] virtual std::uint64_t fdDebugId() const noexcept = 0;

    virtual void handleEvent(EventLoop &loop, const EpollReactor::ReadyEvent &ev) = 0;
};

} // namespace hostlink::net

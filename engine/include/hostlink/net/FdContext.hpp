#pragma once

#include <cstdint>

namespace hostlink::net {

class IFdHandler;

/// EventLoop가 fd마다 들고 있는 라우팅/디버깅 정보입니다.
///
/// - dispatch 때마다 fd로 다시 조회하므로, removeFd 이후 같은 배치에 남아 있던
///   지연 이벤트는 handler를 건드리지 않고 버려진다.
struct FdContext {
    int fd{-1};
    IFdHandler *handler{nullptr}; ///< non-owning
    const char *tag{"unknown"};
    std::uint64_t debugId{0};
    std::uint32_t registeredEvents{0};
};

} // namespace hostlink::net

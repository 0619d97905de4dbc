#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <netinet/in.h>  // sockaddr_in
#include <sys/socket.h> // sockaddr, socklen_t, MSG_NOSIGNAL
#include <sys/types.h>  // ssize_t

#include <hostlink/util/NonCopyable.hpp>

namespace hostlink::net {

/// POSIX 소켓 fd를 RAII로 감싸는 move-only 래퍼입니다.
///
/// - 프로토콜/연결 상태는 모릅니다. 순수 OS 레벨 래퍼입니다.
/// - 실패는 false / -1 / invalid Socket 으로 돌려주고, 원인은 errno에 남습니다.
class Socket : private hostlink::util::NonCopyable {
  public:
    using Handle = int;

    Socket() noexcept = default;
    explicit Socket(Handle fd) noexcept;
    ~Socket() noexcept;

    Socket(Socket &&other) noexcept;
    Socket &operator=(Socket &&other) noexcept;

    [[nodiscard]] bool isValid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] Handle nativeHandle() const noexcept { return fd_; }

    /// TCP/IPv4 스트림 소켓 (SOCK_CLOEXEC)
    [[nodiscard]] static Socket createTcpIPv4() noexcept;

    /// idempotent
    void close() noexcept;

    [[nodiscard]] bool setNonBlocking(bool enable) noexcept;
    [[nodiscard]] bool setReuseAddr(bool enable) noexcept;
    [[nodiscard]] bool setNoDelay(bool enable) noexcept;

    /// SO_RCVTIMEO / SO_SNDTIMEO. 0이면 무한 대기. (블로킹 소켓 전용)
    [[nodiscard]] bool setRecvTimeout(std::chrono::milliseconds timeout) noexcept;
    [[nodiscard]] bool setSendTimeout(std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] bool bind(const std::string &ip, std::uint16_t port) noexcept;
    [[nodiscard]] bool listen(int backlog) noexcept;

    /// accept4(SOCK_NONBLOCK | SOCK_CLOEXEC). 실패 시 invalid Socket.
    [[nodiscard]] Socket accept(::sockaddr *addr, ::socklen_t *len) noexcept;

    /// host는 숫자 IPv4 또는 호스트 이름. 논블로킹이면 false + errno=EINPROGRESS 가 정상 경로입니다.
    [[nodiscard]] bool connect(const std::string &host, std::uint16_t port) noexcept;

    /// 이미 해석된 주소로 connect. EINTR은 재시도하지 않는다.
    /// - 논블로킹: EINPROGRESS로 돌려준다. (결과는 쓰기 readiness + SO_ERROR)
    /// - 블로킹: poll로 완료를 기다린 뒤 SO_ERROR를 본다.
    [[nodiscard]] bool connect(const ::sockaddr_in &addr) noexcept;

    /// 쓰기 방향만 닫습니다(FIN). 상대는 EOF를 보고, 읽기는 계속 가능합니다.
    [[nodiscard]] bool shutdownWrite() noexcept;

    /// 양방향 shutdown. 다른 스레드에서 블로킹 recv/send를 깨울 때 씁니다.
    void shutdownBoth() noexcept;

    /// getsockopt(SO_ERROR). 조회 자체가 실패하면 errno 값을 그대로 돌려줍니다.
    [[nodiscard]] int pendingError() noexcept;

    /// getsockname으로 확인한 로컬 포트. 실패 시 0.
    [[nodiscard]] std::uint16_t localPort() const noexcept;

    /// send(2). 기본으로 MSG_NOSIGNAL을 붙여 SIGPIPE 대신 EPIPE를 받습니다.
    [[nodiscard]] ::ssize_t send(const void *data, std::size_t len,
                                 int flags = MSG_NOSIGNAL) noexcept;

    [[nodiscard]] ::ssize_t recv(void *buffer, std::size_t len, int flags = 0) noexcept;

  private:
    Handle fd_{-1};
};

/// 숫자 IPv4 -> 실패 시 getaddrinfo(AF_INET) 순서로 해석합니다.
[[nodiscard]] bool resolveIPv4(const std::string &host, std::uint16_t port,
                               ::sockaddr_in &out) noexcept;

/// 기본 라우트가 가리키는 로컬 IPv4 주소. 알 수 없으면 "127.0.0.1".
///
/// UDP 소켓을 connect만 해서(패킷은 나가지 않음) getsockname으로 확인합니다.
[[nodiscard]] std::string primaryLocalIPv4();

} // namespace hostlink::net

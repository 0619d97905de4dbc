#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <hostlink/net/FdHandler.hpp>
#include <hostlink/net/Socket.hpp>
#include <hostlink/util/NonCopyable.hpp>

namespace hostlink::net {

struct PeerEndpoint {
    std::string ip;
    std::uint16_t port{0};
};

/// 리스닝 소켓을 소유하고 accept 이벤트를 처리합니다.
///
/// - 생성자에서 socket/SO_REUSEADDR/bind/listen 까지 끝낸다. 실패하면 std::system_error.
/// - EventLoop 등록은 소유자(Server)가 루프 스레드에서 한다.
/// - ET 규약: readable 이벤트마다 EAGAIN까지 accept를 반복한다.
class Acceptor final : private hostlink::util::NonCopyable, public IFdHandler {
  public:
    using AcceptCallback = std::function<void(Socket &&client, const PeerEndpoint &peer)>;

    Acceptor(std::string listenAddress, std::uint16_t listenPort, int backlog);
    ~Acceptor() override = default;

    void close() noexcept { listenSocket_.close(); }
    [[nodiscard]] bool isValid() const noexcept { return listenSocket_.isValid(); }

    [[nodiscard]] std::string_view listenAddress() const noexcept { return listenAddress_; }

    /// port 0으로 만들었다면 커널이 배정한 실제 포트
    [[nodiscard]] std::uint16_t listenPort() const noexcept { return listenPort_; }
    [[nodiscard]] int nativeHandle() const noexcept { return listenSocket_.nativeHandle(); }

    /// 콜백은 루프 스레드에서 동기 호출된다. 던진 예외는 로그 후 무시된다.
    void setAcceptCallback(AcceptCallback cb) noexcept { onAccept_ = std::move(cb); }

    // ===== IFdHandler =====
    [[nodiscard]] const char *fdTag() const noexcept override { return "acceptor"; }
    [[nodiscard]] std::uint64_t fdDebugId() const noexcept override { return listenPort_; }
    void handleEvent(EventLoop &loop, const EpollReactor::ReadyEvent &ev) override;

  private:
    Socket listenSocket_;
    std::string listenAddress_;
    std::uint16_t listenPort_{0};

    AcceptCallback onAccept_;

    static void fillPeerEndpoint(const ::sockaddr_storage &ss, PeerEndpoint &out) noexcept;

    void onReadable_();
    void onError_(EventLoop &loop, const EpollReactor::ReadyEvent &ev) noexcept;
};

} // namespace hostlink::net

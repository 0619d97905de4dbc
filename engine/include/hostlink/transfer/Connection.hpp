#pragma once

#include <hostlink/core/TimerWheel.hpp>
#include <hostlink/net/Acceptor.hpp>
#include <hostlink/net/FdHandler.hpp>
#include <hostlink/net/Socket.hpp>
#include <hostlink/protocol/FrameDecoder.hpp>
#include <hostlink/protocol/PayloadProtocol.hpp>
#include <hostlink/util/NonCopyable.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace hostlink::protocol
{
class ProtocolRegistry;
}

namespace hostlink::transfer
{

class ConnectionManager;

/// 연결 상태머신
///
/// 수신(accept) 측:  AwaitingLengthPrefix -> AwaitingHeader -> AwaitingPayload -> AwaitingWrite -> Done
/// 송신(dial) 측:    Connecting -> Sending -> AwaitingResponse -> Done
enum class ConnectionState : std::uint8_t
{
    Connecting = 0,
    AwaitingLengthPrefix,
    AwaitingHeader,
    AwaitingPayload,
    AwaitingWrite,
    Sending,
    AwaitingResponse,
    Done,
};

[[nodiscard]] const char *toString(ConnectionState state) noexcept;

enum class ConnectionRole : std::uint8_t
{
    Inbound = 0,
    Outbound,
};

/// 소켓 1개 + 프레임 1개 교환을 소유합니다.
///
/// - 루프 스레드 전용. 처리 중 나온 예외는 handleEvent() 경계에서 fail()로 바뀐다.
/// - Done 전이는 정확히 한 번. 그 뒤 이벤트/타이머는 무시된다.
class Connection final : private hostlink::util::NonCopyable,
                         public net::IFdHandler,
                         public std::enable_shared_from_this<Connection>
{
  public:
    using Id = std::uint64_t;

  private:
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    Connection(PrivateTag, Id id, ConnectionRole role, net::Socket &&socket,
               net::PeerEndpoint peer, ConnectionManager &owner);
    ~Connection() override;

    /// accept된 소켓. 헤더를 받은 뒤 registry로 프로토콜을 만든다.
    [[nodiscard]] static std::shared_ptr<Connection>
    accepted(Id id, net::Socket &&socket, net::PeerEndpoint peer,
             const protocol::ProtocolRegistry &registry, ConnectionManager &owner);

    /// 논블로킹 connect를 시작한 소켓. protocol의 read()를 먼저 모두 보낸다.
    [[nodiscard]] static std::shared_ptr<Connection>
    dialing(Id id, net::Socket &&socket, net::PeerEndpoint peer,
            std::shared_ptr<protocol::PayloadProtocol> protocol, ConnectionManager &owner);

    /// fd 등록 + idle deadline 시작. 실패하면 fail() 처리 후 false.
    bool open() noexcept;

    /// 프로토콜 failure 리스너 + manager 리스너에 알리고 닫는다. 이미 Done이면 무시.
    void fail(const protocol::TransferError &error) noexcept;

    [[nodiscard]] Id id() const noexcept { return id_; }
    [[nodiscard]] ConnectionRole role() const noexcept { return role_; }
    [[nodiscard]] ConnectionState state() const noexcept;
    [[nodiscard]] const net::PeerEndpoint &peer() const noexcept { return peer_; }
    [[nodiscard]] const std::shared_ptr<protocol::PayloadProtocol> &protocol() const noexcept
    {
        return protocol_;
    }

    [[nodiscard]] std::uint64_t bytesReceived() const noexcept { return bytesReceived_; }
    [[nodiscard]] std::uint64_t bytesSent() const noexcept { return bytesSent_; }

    // ===== IFdHandler =====
    [[nodiscard]] const char *fdTag() const noexcept override { return "connection"; }
    [[nodiscard]] std::uint64_t fdDebugId() const noexcept override { return id_; }
    void handleEvent(net::EventLoop &loop, const net::EpollReactor::ReadyEvent &ev) override;

  private:
    Id id_;
    ConnectionRole role_;
    ConnectionState state_;
    net::Socket socket_;
    int fd_{-1};
    bool registered_{false};
    net::PeerEndpoint peer_;
    ConnectionManager &owner_;

    std::unique_ptr<protocol::FrameDecoder> decoder_; // Inbound 전용
    std::shared_ptr<protocol::PayloadProtocol> protocol_;

    protocol::Bytes recvBuffer_;
    protocol::Bytes outbound_;
    std::size_t outOffset_{0};

    std::uint64_t bytesReceived_{0};
    std::uint64_t bytesSent_{0};

    // ===== idle deadline =====
    std::chrono::steady_clock::time_point lastActivity_{};
    core::TimerWheel::TimerId idleTimerId_{core::TimerWheel::kInvalidTimerId};

    void armIdleTimer_(std::chrono::milliseconds delay) noexcept;
    void onIdleTimer_() noexcept;

    void dispatch_(const net::EpollReactor::ReadyEvent &ev);

    void onConnectResult_();
    void onInboundReadable_();
    void onInboundWritable_();
    void onOutboundWritable_();
    void onOutboundReadable_();

    /// @return true면 protocol의 read() 출력까지 모두 보냄
    bool flushOutbound_();
    void setInterest_(std::uint32_t events);

    void finish_(const char *reason);
    void close_(const char *reason) noexcept;
};

} // namespace hostlink::transfer

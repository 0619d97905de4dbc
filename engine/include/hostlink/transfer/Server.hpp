#pragma once

#include <hostlink/core/Defaults.hpp>
#include <hostlink/net/Acceptor.hpp>
#include <hostlink/protocol/ProtocolRegistry.hpp>
#include <hostlink/transfer/ConnectionManager.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace hostlink::transfer
{

/// 다중화 서버: 리스닝 소켓 1개 + 루프 스레드 1개
///
/// - (host, port)당 인스턴스는 최대 하나. create()는 get-or-create.
/// - port 0은 항상 새 인스턴스를 만들고, 실제 포트는 port()로 얻는다.
/// - 받은 프레임은 registry로 프로토콜을 만들어 처리한다.
class Server final : public ConnectionManager
{
  private:
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    /// 바인드/리슨까지 끝낸다. @throws std::system_error
    Server(PrivateTag, const std::string &host, std::uint16_t port,
           std::shared_ptr<const protocol::ProtocolRegistry> registry, ManagerOptions options);
    ~Server() override;

    /// registry가 nullptr이면 ProtocolRegistry::withDefaults(".", 4096)
    ///
    /// 이미 같은 (host, port) 서버가 살아 있으면 그것을 돌려주고 registry/options는 무시한다.
    /// @throws std::system_error 바인드 실패 등
    [[nodiscard]] static std::shared_ptr<Server>
    create(const std::string &host, std::uint16_t port = core::defaults::kListenPort,
           std::shared_ptr<const protocol::ProtocolRegistry> registry = nullptr,
           ManagerOptions options = {});

    /// 이 호스트의 기본 IPv4 주소로 만든다.
    [[nodiscard]] static std::shared_ptr<Server> create(std::uint16_t port = core::defaults::kListenPort);

    /// 루프 스레드를 띄운다. 두 번째 호출부터는 무시.
    void start();

    /// 어느 스레드에서나 호출 가능. 진행 중 연결은 TransferCancelledError로 끝난다.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] const std::string &host() const noexcept { return host_; }
    [[nodiscard]] std::uint16_t port() const noexcept { return acceptor_.listenPort(); }
    [[nodiscard]] const protocol::ProtocolRegistry &registry() const noexcept { return *registry_; }

  private:
    std::string host_;
    std::shared_ptr<const protocol::ProtocolRegistry> registry_;
    net::Acceptor acceptor_;

    std::mutex lifecycleMutex_;
    std::atomic_bool running_{false};
    bool started_{false};
    std::thread thread_;

    void runLoop_() noexcept;
    void onAccepted_(net::Socket &&socket, const net::PeerEndpoint &peer);
};

} // namespace hostlink::transfer

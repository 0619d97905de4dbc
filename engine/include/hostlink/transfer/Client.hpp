#pragma once

#include <hostlink/protocol/PayloadProtocol.hpp>
#include <hostlink/transfer/ConnectionManager.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <netinet/in.h>

namespace hostlink::transfer
{

/// 다중화 클라이언트: 여러 송신 연결을 루프 스레드 1개로 처리한다.
///
/// - connect()는 어느 스레드에서나, start() 전후 모두 호출 가능하다.
/// - 남은 연결이 0이 되면 루프가 끝난다. 끝난 Client는 다시 쓸 수 없다.
/// - 호스트 이름 해석은 connect()를 부른 스레드에서 한다. 루프 스레드는 블로킹하지 않는다.
/// - dial 전에 루프가 끝나면(stop, 소멸) 그 protocol은 TransferCancelledError로 끝난다.
class Client final : public ConnectionManager
{
  public:
    explicit Client(ManagerOptions options = {});
    ~Client() override;

    /// 논블로킹 connect를 시작하고 연결 id를 돌려준다. (cancel()용)
    ///
    /// 연결 실패는 protocol의 failure 리스너에 TransferIoError로 전달된다.
    /// 호스트 이름을 해석하지 못하면 이 호출 안에서 바로 전달된다.
    /// @throws std::logic_error 루프가 이미 끝남
    Connection::Id connect(const std::string &host, std::uint16_t port,
                           std::shared_ptr<protocol::PayloadProtocol> proto);

    /// 전용 스레드에서 run()
    void start();

    /// 호출 스레드에서 루프를 돈다. 연결이 모두 끝나거나 stop()되면 돌아온다.
    void run();

    void join();

    /// 남은 연결은 TransferCancelledError로 끝난다.
    void stop();

    [[nodiscard]] bool isFinished() const;

  protected:
    void onConnectionClosed_(Connection::Id id) noexcept override;

  private:
    mutable std::mutex mutex_;
    std::size_t outstanding_{0};
    bool dialed_{false};
    bool finished_{false};
    std::atomic_bool stopRequested_{false};

    // connect() 이후 아직 dial_()이 가져가지 않은 protocol
    std::unordered_map<Connection::Id, std::shared_ptr<protocol::PayloadProtocol>> pending_;

    std::thread thread_;

    void dial_(Connection::Id id, const net::PeerEndpoint &peer, const ::sockaddr_in &addr) noexcept;
    [[nodiscard]] std::shared_ptr<protocol::PayloadProtocol> takePending_(Connection::Id id);
    void cancelPending_() noexcept;
    void release_() noexcept;
    [[nodiscard]] bool shouldContinue_() noexcept;
};

} // namespace hostlink::transfer

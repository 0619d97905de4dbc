#pragma once

#include <hostlink/net/Acceptor.hpp>
#include <hostlink/net/EventLoop.hpp>
#include <hostlink/protocol/Errors.hpp>
#include <hostlink/transfer/Connection.hpp>
#include <hostlink/transfer/ManagerOptions.hpp>
#include <hostlink/util/NonCopyable.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>

namespace hostlink::transfer
{

/// 루프 1개와 그 루프가 소유하는 연결들 (Server/Client 공통 부분)
///
/// - connections_ 는 루프 스레드 전용이다.
/// - 연결 실패는 연결 안에서 끝난다. 여기서는 리스너에 알리고 맵에서 지운다.
class ConnectionManager : private hostlink::util::NonCopyable
{
  public:
    using ConnectionErrorListener =
        std::function<void(const net::PeerEndpoint &peer, const protocol::TransferError &error)>;

    explicit ConnectionManager(ManagerOptions options);
    virtual ~ConnectionManager();

    /// 어느 스레드에서나 호출 가능. 루프에 post되어 TransferCancelledError로 끝난다.
    /// 이미 끝난 id면 아무 일도 없다.
    void cancel(Connection::Id id);

    /// 루프 시작 전에 설정한다. 루프 스레드에서 호출된다.
    void setConnectionErrorListener(ConnectionErrorListener listener)
    {
        onConnectionError_ = std::move(listener);
    }

    /// 어느 스레드에서나 읽을 수 있는 근사값
    [[nodiscard]] std::size_t activeConnections() const noexcept
    {
        return activeConnections_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const ManagerOptions &options() const noexcept { return options_; }
    [[nodiscard]] net::EventLoop &loop() noexcept { return loop_; }

  protected:
    friend class Connection;

    ManagerOptions options_;
    net::EventLoop loop_;

    [[nodiscard]] Connection::Id nextConnectionId_() noexcept
    {
        return nextId_.fetch_add(1, std::memory_order_relaxed);
    }

    /// 맵에 넣고 fd를 등록한다. 실패하면 연결은 스스로 fail 처리된다.
    void adopt_(const std::shared_ptr<Connection> &conn);

    /// 남은 연결을 모두 TransferCancelledError로 정리한다. (루프 종료 직전)
    void cancelAll_() noexcept;

    // ===== Connection 콜백 (루프 스레드) =====
    virtual void onConnectionClosed_(Connection::Id id) noexcept;
    void notifyConnectionError_(const net::PeerEndpoint &peer,
                                const protocol::TransferError &error) noexcept;

  private:
    std::unordered_map<Connection::Id, std::shared_ptr<Connection>> connections_;
    std::atomic<std::size_t> activeConnections_{0};
    std::atomic<Connection::Id> nextId_{1};

    ConnectionErrorListener onConnectionError_;
};

} // namespace hostlink::transfer

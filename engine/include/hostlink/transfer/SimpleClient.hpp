#pragma once

#include <hostlink/core/Defaults.hpp>
#include <hostlink/net/Socket.hpp>
#include <hostlink/protocol/PayloadProtocol.hpp>
#include <hostlink/util/NonCopyable.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace hostlink::transfer
{

struct SimpleClientOptions
{
    /// 0이면 무한 대기
    std::chrono::milliseconds idleTimeout{core::defaults::kIdleTimeoutMs};
    std::size_t recvChunkSize = core::defaults::kRecvChunkSize;
};

/// 연결 1개짜리 블로킹 클라이언트 (전용 스레드, epoll 없음)
///
/// connect -> read() 출력을 모두 send -> shutdown(SHUT_WR) -> EOF까지 recv -> complete()
///
/// - idle deadline은 SO_RCVTIMEO/SO_SNDTIMEO로 건다. 만료되면 TransferTimeoutError.
/// - 실패는 protocol의 failure 리스너로 전달된다. 스레드를 죽이지 않는다.
class SimpleClient : private hostlink::util::NonCopyable,
                     public std::enable_shared_from_this<SimpleClient>
{
  public:
    using Options = SimpleClientOptions;

    SimpleClient(std::string host, std::uint16_t port,
                 std::shared_ptr<protocol::PayloadProtocol> protocol, Options options = {});
    ~SimpleClient();

    /// 스레드가 SimpleClient의 shared 소유권을 가진 채로 돌고, 끝나면 스스로 정리된다.
    static std::shared_ptr<SimpleClient> runDetached(std::string host, std::uint16_t port,
                                                     std::shared_ptr<protocol::PayloadProtocol> protocol,
                                                     Options options = {});

    /// 전용 스레드에서 run(). 두 번째 호출부터는 무시.
    void start();
    void join();

    /// 호출 스레드에서 한 사이클. 성공하면 true, 실패(리스너에 전달됨)면 false.
    bool run() noexcept;

    /// 다른 스레드에서 호출 가능. 블로킹 중인 send/recv를 깨워 TransferCancelledError로 끝낸다.
    void cancel() noexcept;

    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }
    [[nodiscard]] const std::shared_ptr<protocol::PayloadProtocol> &protocol() const noexcept
    {
        return protocol_;
    }

  private:
    std::string host_;
    std::uint16_t port_;
    std::shared_ptr<protocol::PayloadProtocol> protocol_;
    Options options_;

    std::mutex socketMutex_;
    net::Socket socket_;
    std::atomic_bool cancelled_{false};
    std::atomic_bool ran_{false};

    std::thread thread_;

    void exchange_();
    void connect_();
    void sendAll_(const protocol::Bytes &bytes);
    [[noreturn]] void throwIo_(const char *op, int err) const;
};

} // namespace hostlink::transfer

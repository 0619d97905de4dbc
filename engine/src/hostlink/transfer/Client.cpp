#include <hostlink/transfer/Client.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/core/ThreadContext.hpp>
#include <hostlink/net/Socket.hpp>

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <utility>

namespace hostlink::transfer
{

namespace
{
std::atomic<unsigned> &clientIndex()
{
    static std::atomic<unsigned> index{0};
    return index;
}
} // namespace

Client::Client(ManagerOptions options) : ConnectionManager(options) {}

Client::~Client()
{
    stop();
    join();

    // start()/run() 없이 버려진 경우에도 connect()한 protocol은 끝을 통보받아야 한다.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cancelPending_();
}

Connection::Id Client::connect(const std::string &host, std::uint16_t port,
                               std::shared_ptr<protocol::PayloadProtocol> proto)
{
    if (!proto)
    {
        throw std::invalid_argument("Client::connect: protocol is null");
    }

    const Connection::Id id = nextConnectionId_();
    const net::PeerEndpoint peer{host, port};

    // getaddrinfo는 블로킹이므로 루프 스레드가 아닌 여기서 끝낸다.
    ::sockaddr_in addr{};
    const bool resolved = net::resolveIPv4(host, port, addr);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_)
        {
            throw std::logic_error("Client::connect: loop already finished");
        }
        dialed_ = true;
        if (resolved)
        {
            ++outstanding_;
            pending_.emplace(id, proto);
        }
    }

    if (!resolved)
    {
        const protocol::TransferIoError error("resolve " + host, EHOSTUNREACH);
        SLOG_ERROR("Client", "ResolveFailed", "cid={} peer={}:{} protocol={}", id, host, port,
                   proto->name());
        proto->fail(error);
        notifyConnectionError_(peer, error);

        // 루프가 첫 요청을 기다리는 중이면 깨워서 종료 조건을 다시 보게 한다.
        loop_.post([] {});
        return id;
    }

    loop_.post([this, id, peer, addr]() { dial_(id, peer, addr); });
    return id;
}

std::shared_ptr<protocol::PayloadProtocol> Client::takePending_(Connection::Id id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end())
    {
        return nullptr;
    }
    auto proto = std::move(it->second);
    pending_.erase(it);
    return proto;
}

void Client::cancelPending_() noexcept
{
    std::unordered_map<Connection::Id, std::shared_ptr<protocol::PayloadProtocol>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
        outstanding_ -= std::min(outstanding_, pending.size());
    }
    if (pending.empty())
    {
        return;
    }

    SLOG_INFO("Client", "CancelPending", "count={}", pending.size());
    for (auto &[id, proto] : pending)
    {
        proto->fail(protocol::TransferCancelledError());
    }
}

void Client::dial_(Connection::Id id, const net::PeerEndpoint &peer,
                   const ::sockaddr_in &addr) noexcept
{
    // 루프 종료 경로에서 이미 취소됐으면 없다.
    auto proto = takePending_(id);
    if (!proto)
    {
        return;
    }

    auto failDial = [&](const char *op, int err)
    {
        const protocol::TransferIoError error(op, err);
        SLOG_ERROR("Client", "DialFailed", "cid={} peer={}:{} op={} errno={} what='{}'", id,
                   peer.ip, peer.port, op, err, error.what());
        proto->fail(error);
        notifyConnectionError_(peer, error);
        release_();
    };

    net::Socket socket = net::Socket::createTcpIPv4();
    if (!socket.isValid())
    {
        failDial("socket", errno);
        return;
    }
    if (!socket.setNonBlocking(true))
    {
        failDial("fcntl(O_NONBLOCK)", errno);
        return;
    }
    (void)socket.setNoDelay(true);

    // 루프백은 바로 성공하기도 한다. 그 경우에도 Write readiness로 결과를 확인한다.
    if (!socket.connect(addr) && errno != EINPROGRESS)
    {
        failDial("connect", errno);
        return;
    }

    SLOG_DEBUG("Client", "DialStarted", "cid={} fd={} peer={}:{} protocol={}", id,
               socket.nativeHandle(), peer.ip, peer.port, proto->name());

    try
    {
        adopt_(Connection::dialing(id, std::move(socket), peer, proto, *this));
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("Client", "AdoptFailed", "cid={} what='{}'", id, e.what());
        const protocol::TransferIoError error("adopt", std::string(e.what()));
        proto->fail(error);
        notifyConnectionError_(peer, error);
        release_();
    }
}

void Client::onConnectionClosed_(Connection::Id id) noexcept
{
    ConnectionManager::onConnectionClosed_(id);
    release_();
}

void Client::release_() noexcept
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (outstanding_ > 0)
    {
        --outstanding_;
    }
}

bool Client::shouldContinue_() noexcept
{
    std::lock_guard<std::mutex> lock(mutex_);
    // 아직 connect()가 한 번도 없었다면 첫 요청을 기다린다.
    if (stopRequested_.load(std::memory_order_acquire) || (dialed_ && outstanding_ == 0))
    {
        finished_ = true;
        return false;
    }
    return true;
}

void Client::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable() || finished_)
    {
        return;
    }
    thread_ = std::thread(
        [this]()
        {
            core::ThreadContext::setCurrentThreadTag("cli", clientIndex().fetch_add(1));
            run();
        });
}

void Client::run()
{
    loop_.bindToCurrentThread();
    SLOG_DEBUG("Client", "LoopStarted", "");

    // connect()로 쌓인 dial 작업은 첫 runOnce()에서 실행된다.
    while (shouldContinue_())
    {
        loop_.runOnce();
    }

    cancelAll_();
    cancelPending_();
    SLOG_DEBUG("Client", "LoopFinished", "");
}

void Client::join()
{
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
    {
        thread_.join();
    }
}

void Client::stop()
{
    stopRequested_.store(true, std::memory_order_release);
    loop_.post([] {});
}

bool Client::isFinished() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

} // namespace hostlink::transfer

#include <hostlink/transfer/SimpleClient.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/core/ThreadContext.hpp>

#include <cerrno>
#include <stdexcept>
#include <utility>

namespace hostlink::transfer
{

SimpleClient::SimpleClient(std::string host, std::uint16_t port,
                           std::shared_ptr<protocol::PayloadProtocol> protocol, Options options)
    : host_(std::move(host)), port_(port), protocol_(std::move(protocol)), options_(options)
{
    if (!protocol_)
    {
        throw std::invalid_argument("SimpleClient: protocol is null");
    }
    if (options_.recvChunkSize == 0)
    {
        options_.recvChunkSize = core::defaults::kRecvChunkSize;
    }
}

SimpleClient::~SimpleClient()
{
    if (thread_.joinable())
    {
        cancel();
        join();
    }
}

std::shared_ptr<SimpleClient>
SimpleClient::runDetached(std::string host, std::uint16_t port,
                          std::shared_ptr<protocol::PayloadProtocol> protocol, Options options)
{
    auto client =
        std::make_shared<SimpleClient>(std::move(host), port, std::move(protocol), options);

    std::thread(
        [client]()
        {
            core::ThreadContext::setCurrentThreadTag("simple");
            (void)client->run();
        })
        .detach();
    return client;
}

void SimpleClient::start()
{
    if (thread_.joinable() || ran_.load(std::memory_order_acquire))
    {
        return;
    }
    thread_ = std::thread(
        [this]()
        {
            core::ThreadContext::setCurrentThreadTag("simple");
            (void)run();
        });
}

void SimpleClient::join()
{
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
    {
        thread_.join();
    }
}

void SimpleClient::cancel() noexcept
{
    std::lock_guard<std::mutex> lock(socketMutex_);
    cancelled_.store(true, std::memory_order_release);
    if (socket_.isValid())
    {
        socket_.shutdownBoth();
    }
}

bool SimpleClient::run() noexcept
{
    if (ran_.exchange(true, std::memory_order_acq_rel))
    {
        return false;
    }

    bool ok = false;
    try
    {
        exchange_();
        ok = true;
    }
    catch (const protocol::TransferError &e)
    {
        SLOG_ERROR("SimpleClient", "ExchangeFailed", "peer={}:{} protocol={} kind={} what='{}'",
                   host_, port_, protocol_->name(), protocol::toString(e.kind()), e.what());
        protocol_->fail(e);
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("SimpleClient", "ExchangeFailed", "peer={}:{} protocol={} what='{}'", host_,
                   port_, protocol_->name(), e.what());
        protocol_->fail(protocol::TransferIoError("exchange", std::string(e.what())));
    }

    std::lock_guard<std::mutex> lock(socketMutex_);
    socket_.close();
    return ok;
}

void SimpleClient::exchange_()
{
    connect_();

    std::uint64_t sent = 0;
    for (;;)
    {
        const protocol::Bytes chunk = protocol_->read();
        if (chunk.empty())
        {
            break;
        }
        sendAll_(chunk);
        sent += chunk.size();
    }

    if (!socket_.shutdownWrite())
    {
        throwIo_("shutdown", errno);
    }
    SLOG_DEBUG("SimpleClient", "RequestSent", "peer={}:{} bytes={}", host_, port_, sent);

    protocol::Bytes buffer(options_.recvChunkSize);
    std::uint64_t received = 0;
    for (;;)
    {
        const ::ssize_t n = socket_.recv(buffer.data(), buffer.size());
        if (n > 0)
        {
            received += static_cast<std::uint64_t>(n);
            protocol_->receive(
                std::span<const std::uint8_t>(buffer.data(), static_cast<std::size_t>(n)));
            continue;
        }
        if (n == 0)
        {
            break;
        }
        if (errno == EINTR && !isCancelled())
        {
            continue;
        }
        throwIo_("recv", errno);
    }

    // shutdownBoth()로 깨어난 recv는 0을 돌려줄 수 있다.
    if (isCancelled())
    {
        throw protocol::TransferCancelledError();
    }

    protocol_->complete();

    SLOG_INFO("SimpleClient", "Completed", "peer={}:{} protocol={} tx={} rx={}", host_, port_,
              protocol_->name(), sent, received);
}

void SimpleClient::connect_()
{
    net::Socket socket = net::Socket::createTcpIPv4();
    if (!socket.isValid())
    {
        throwIo_("socket", errno);
    }
    (void)socket.setNoDelay(true);

    if (options_.idleTimeout.count() > 0)
    {
        if (!socket.setRecvTimeout(options_.idleTimeout) ||
            !socket.setSendTimeout(options_.idleTimeout))
        {
            throwIo_("setsockopt", errno);
        }
    }

    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        if (isCancelled())
        {
            throw protocol::TransferCancelledError();
        }
        socket_ = std::move(socket);
    }

    // connect도 SO_SNDTIMEO를 따른다. (만료 시 EINPROGRESS)
    if (!socket_.connect(host_, port_))
    {
        throwIo_("connect", errno == EINPROGRESS ? EAGAIN : errno);
    }

    SLOG_DEBUG("SimpleClient", "Connected", "peer={}:{} fd={}", host_, port_,
               socket_.nativeHandle());
}

void SimpleClient::sendAll_(const protocol::Bytes &bytes)
{
    std::size_t offset = 0;
    while (offset < bytes.size())
    {
        const ::ssize_t n = socket_.send(bytes.data() + offset, bytes.size() - offset);
        if (n > 0)
        {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR && !isCancelled())
        {
            continue;
        }
        throwIo_("send", n < 0 ? errno : EIO);
    }
}

void SimpleClient::throwIo_(const char *op, int err) const
{
    if (isCancelled())
    {
        throw protocol::TransferCancelledError();
    }
    if (err == EAGAIN || err == EWOULDBLOCK)
    {
        throw protocol::TransferTimeoutError(options_.idleTimeout);
    }
    throw protocol::TransferIoError(op, err);
}

} // namespace hostlink::transfer

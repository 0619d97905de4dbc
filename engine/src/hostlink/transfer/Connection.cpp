#include <hostlink/transfer/Connection.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/net/EventLoop.hpp>
#include <hostlink/protocol/ProtocolRegistry.hpp>
#include <hostlink/transfer/ConnectionManager.hpp>

#include <cerrno>
#include <span>
#include <utility>

namespace hostlink::transfer
{

namespace
{
using Event = net::EpollReactor::Event;
using protocol::TransferIoError;

// 레벨 트리거라 남은 데이터는 다음 wait에서 다시 보고된다. 한 연결이 루프를 독점하지 않게 끊는다.
constexpr int kMaxReadsPerEvent = 16;

constexpr std::uint32_t kReadMask = net::EpollReactor::makeEventMask({Event::Read});
constexpr std::uint32_t kWriteMask = net::EpollReactor::makeEventMask({Event::Write});
} // namespace

const char *toString(ConnectionState state) noexcept
{
    switch (state)
    {
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::AwaitingLengthPrefix:
        return "AwaitingLengthPrefix";
    case ConnectionState::AwaitingHeader:
        return "AwaitingHeader";
    case ConnectionState::AwaitingPayload:
        return "AwaitingPayload";
    case ConnectionState::AwaitingWrite:
        return "AwaitingWrite";
    case ConnectionState::Sending:
        return "Sending";
    case ConnectionState::AwaitingResponse:
        return "AwaitingResponse";
    case ConnectionState::Done:
        return "Done";
    }
    return "Unknown";
}

Connection::Connection(PrivateTag, Id id, ConnectionRole role, net::Socket &&socket,
                       net::PeerEndpoint peer, ConnectionManager &owner)
    : id_(id), role_(role),
      state_(role == ConnectionRole::Inbound ? ConnectionState::AwaitingLengthPrefix
                                             : ConnectionState::Connecting),
      socket_(std::move(socket)), fd_(socket_.nativeHandle()), peer_(std::move(peer)),
      owner_(owner), recvBuffer_(owner.options().recvChunkSize)
{
}

Connection::~Connection() = default;

std::shared_ptr<Connection> Connection::accepted(Id id, net::Socket &&socket,
                                                 net::PeerEndpoint peer,
                                                 const protocol::ProtocolRegistry &registry,
                                                 ConnectionManager &owner)
{
    auto conn = std::make_shared<Connection>(PrivateTag{}, id, ConnectionRole::Inbound,
                                             std::move(socket), std::move(peer), owner);
    conn->decoder_ = std::make_unique<protocol::FrameDecoder>(registry);
    return conn;
}

std::shared_ptr<Connection> Connection::dialing(Id id, net::Socket &&socket,
                                                net::PeerEndpoint peer,
                                                std::shared_ptr<protocol::PayloadProtocol> proto,
                                                ConnectionManager &owner)
{
    auto conn = std::make_shared<Connection>(PrivateTag{}, id, ConnectionRole::Outbound,
                                             std::move(socket), std::move(peer), owner);
    conn->protocol_ = std::move(proto);
    return conn;
}

ConnectionState Connection::state() const noexcept
{
    if (state_ != ConnectionState::AwaitingLengthPrefix || !decoder_)
    {
        return state_;
    }

    switch (decoder_->stage())
    {
    case protocol::DecodeStage::AwaitingHeader:
        return ConnectionState::AwaitingHeader;
    case protocol::DecodeStage::AwaitingPayload:
        return ConnectionState::AwaitingPayload;
    default:
        return state_;
    }
}

bool Connection::open() noexcept
{
    const std::uint32_t mask = role_ == ConnectionRole::Inbound ? kReadMask : kWriteMask;
    if (!owner_.loop().addFd(fd_, mask, this))
    {
        fail(TransferIoError("epoll_ctl(ADD)", errno));
        return false;
    }
    registered_ = true;

    lastActivity_ = std::chrono::steady_clock::now();
    if (owner_.options().idleTimeout.count() > 0)
    {
        armIdleTimer_(owner_.options().idleTimeout);
    }
    return true;
}

// ===== idle deadline =====

void Connection::armIdleTimer_(std::chrono::milliseconds delay) noexcept
{
    std::weak_ptr<Connection> weak = weak_from_this();
    try
    {
        idleTimerId_ = owner_.loop().addTimer(delay,
                                              [weak]()
                                              {
                                                  if (auto self = weak.lock())
                                                  {
                                                      self->onIdleTimer_();
                                                  }
                                              });
    }
    catch (const std::exception &e)
    {
        // 타이머를 못 걸면 deadline 없이 계속 진행한다.
        idleTimerId_ = core::TimerWheel::kInvalidTimerId;
        SLOG_ERROR("Connection", "IdleTimerArmFailed", "cid={} what='{}'", id_, e.what());
    }
}

void Connection::onIdleTimer_() noexcept
{
    idleTimerId_ = core::TimerWheel::kInvalidTimerId;
    if (state_ == ConnectionState::Done)
    {
        return;
    }

    const auto idle = owner_.options().idleTimeout;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - lastActivity_);

    if (elapsed >= idle)
    {
        fail(protocol::TransferTimeoutError(elapsed));
        return;
    }

    // 활동이 있었으면 남은 시간만큼만 다시 건다.
    auto remaining = idle - elapsed;
    if (remaining.count() <= 0)
    {
        remaining = std::chrono::milliseconds(1);
    }
    armIdleTimer_(remaining);
}

// ===== events =====

void Connection::handleEvent(net::EventLoop &, const net::EpollReactor::ReadyEvent &ev)
{
    // close_()가 manager 맵에서 자신을 지워도 이 함수가 끝날 때까지는 살아 있어야 한다.
    auto self = shared_from_this();

    if (state_ == ConnectionState::Done)
    {
        return;
    }
    lastActivity_ = std::chrono::steady_clock::now();

    try
    {
        dispatch_(ev);
    }
    catch (const protocol::TransferError &e)
    {
        fail(e);
    }
    catch (const std::exception &e)
    {
        fail(TransferIoError("handle_event", std::string(e.what())));
    }
}

void Connection::dispatch_(const net::EpollReactor::ReadyEvent &ev)
{
    const bool error = (ev.events & EPOLLERR) != 0;
    const bool hangup = (ev.events & EPOLLHUP) != 0;
    const bool readable = (ev.events & EPOLLIN) != 0 || hangup;
    const bool writable = (ev.events & EPOLLOUT) != 0 || hangup;

    if (state_ == ConnectionState::Connecting)
    {
        if (error || writable)
        {
            onConnectResult_();
        }
        return;
    }

    if (error)
    {
        const int err = socket_.pendingError();
        throw TransferIoError("socket", err != 0 ? err : EIO);
    }

    switch (state_)
    {
    case ConnectionState::AwaitingLengthPrefix:
        if (readable)
        {
            onInboundReadable_();
        }
        break;
    case ConnectionState::AwaitingWrite:
        if (writable)
        {
            onInboundWritable_();
        }
        break;
    case ConnectionState::Sending:
        if (writable)
        {
            onOutboundWritable_();
        }
        break;
    case ConnectionState::AwaitingResponse:
        if (readable)
        {
            onOutboundReadable_();
        }
        break;
    default:
        break;
    }
}

void Connection::onConnectResult_()
{
    const int err = socket_.pendingError();
    if (err != 0)
    {
        throw TransferIoError("connect", err);
    }

    SLOG_INFO("Connection", "Connected", "cid={} fd={} peer={}:{} protocol={}", id_, fd_,
              peer_.ip, peer_.port, protocol_->name());

    state_ = ConnectionState::Sending;
    onOutboundWritable_();
}

void Connection::onInboundReadable_()
{
    for (int i = 0; i < kMaxReadsPerEvent; ++i)
    {
        const ::ssize_t n = socket_.recv(recvBuffer_.data(), recvBuffer_.size());
        if (n > 0)
        {
            bytesReceived_ += static_cast<std::uint64_t>(n);

            const auto stage = decoder_->feed(
                std::span<const std::uint8_t>(recvBuffer_.data(), static_cast<std::size_t>(n)));

            if (!protocol_ && decoder_->protocol())
            {
                protocol_ = decoder_->protocol();
                SLOG_INFO("Connection", "HeaderDecoded", "cid={} fd={} peer={}:{} protocol={} size={}",
                          id_, fd_, peer_.ip, peer_.port, protocol_->name(), decoder_->expected());
            }

            if (stage == protocol::DecodeStage::PayloadComplete)
            {
                SLOG_INFO("Connection", "PayloadComplete", "cid={} bytes={} respond={}", id_,
                          decoder_->received(), protocol_->hasResponse() ? 1 : 0);

                // 응답이 필요할 수 있으므로 complete()는 쓰기 경로에서 부른다.
                state_ = ConnectionState::AwaitingWrite;
                setInterest_(kWriteMask);
                return;
            }
            continue;
        }

        if (n == 0)
        {
            if (bytesReceived_ == 0)
            {
                close_("peer_closed_empty");
                return;
            }
            throw protocol::TransferIncompleteError(decoder_->received(), decoder_->expected());
        }

        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            return;
        }
        throw TransferIoError("recv", errno);
    }
}

void Connection::onInboundWritable_()
{
    if (!protocol_->hasResponse())
    {
        finish_("completed");
        return;
    }

    if (flushOutbound_())
    {
        SLOG_INFO("Connection", "ResponseSent", "cid={} bytes={}", id_, bytesSent_);
        finish_("response_sent");
    }
}

void Connection::onOutboundWritable_()
{
    if (!flushOutbound_())
    {
        return;
    }

    // 요청을 다 보냈음을 FIN으로 알리고 응답을 EOF까지 읽는다.
    if (!socket_.shutdownWrite())
    {
        throw TransferIoError("shutdown", errno);
    }

    SLOG_DEBUG("Connection", "RequestSent", "cid={} bytes={}", id_, bytesSent_);

    state_ = ConnectionState::AwaitingResponse;
    setInterest_(kReadMask);
}

void Connection::onOutboundReadable_()
{
    for (int i = 0; i < kMaxReadsPerEvent; ++i)
    {
        const ::ssize_t n = socket_.recv(recvBuffer_.data(), recvBuffer_.size());
        if (n > 0)
        {
            bytesReceived_ += static_cast<std::uint64_t>(n);
            protocol_->receive(
                std::span<const std::uint8_t>(recvBuffer_.data(), static_cast<std::size_t>(n)));
            continue;
        }

        if (n == 0)
        {
            finish_("completed");
            return;
        }

        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            return;
        }
        throw TransferIoError("recv", errno);
    }
}

bool Connection::flushOutbound_()
{
    for (;;)
    {
        if (outOffset_ == outbound_.size())
        {
            outbound_ = protocol_->read();
            outOffset_ = 0;
            if (outbound_.empty())
            {
                return true;
            }
        }

        const ::ssize_t n =
            socket_.send(outbound_.data() + outOffset_, outbound_.size() - outOffset_);
        if (n > 0)
        {
            outOffset_ += static_cast<std::size_t>(n);
            bytesSent_ += static_cast<std::uint64_t>(n);
            continue;
        }

        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            return false;
        }
        throw TransferIoError("send", n < 0 ? errno : EIO);
    }
}

void Connection::setInterest_(std::uint32_t events)
{
    if (!owner_.loop().updateFd(fd_, events))
    {
        throw TransferIoError("epoll_ctl(MOD)", errno);
    }
}

// ===== termination =====

void Connection::finish_(const char *reason)
{
    // complete()가 던지면 handleEvent 경계에서 fail()로 이어진다.
    protocol_->complete();
    close_(reason);
}

void Connection::fail(const protocol::TransferError &error) noexcept
{
    if (state_ == ConnectionState::Done)
    {
        return;
    }
    auto self = shared_from_this();

    SLOG_ERROR("Connection", "Failed", "cid={} fd={} peer={}:{} state={} kind={} what='{}'", id_,
               fd_, peer_.ip, peer_.port, toString(state()), protocol::toString(error.kind()),
               error.what());

    if (protocol_)
    {
        protocol_->fail(error);
    }
    owner_.notifyConnectionError_(peer_, error);

    close_(protocol::toString(error.kind()));
}

void Connection::close_(const char *reason) noexcept
{
    if (state_ == ConnectionState::Done)
    {
        return;
    }
    state_ = ConnectionState::Done;

    if (idleTimerId_ != core::TimerWheel::kInvalidTimerId)
    {
        (void)owner_.loop().cancelTimer(idleTimerId_);
        idleTimerId_ = core::TimerWheel::kInvalidTimerId;
    }

    if (registered_)
    {
        (void)owner_.loop().removeFd(fd_);
        registered_ = false;
    }
    socket_.close();

    SLOG_INFO("Connection", "Closed", "cid={} fd={} peer={}:{} reason={} rx={} tx={}", id_, fd_,
              peer_.ip, peer_.port, reason, bytesReceived_, bytesSent_);

    owner_.onConnectionClosed_(id_);
}

} // namespace hostlink::transfer

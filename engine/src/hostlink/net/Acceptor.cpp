#include <hostlink/net/Acceptor.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/net/EventLoop.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <system_error>
#include <utility>

namespace hostlink::net
{

namespace
{
[[noreturn]] void throwSysError(const char *what)
{
    throw std::system_error(errno, std::generic_category(), what);
}
} // namespace

Acceptor::Acceptor(std::string listenAddress, std::uint16_t listenPort, int backlog)
    : listenAddress_(std::move(listenAddress)), listenPort_(listenPort)
{
    listenSocket_ = Socket::createTcpIPv4();
    if (!listenSocket_.isValid())
    {
        throwSysError("Acceptor: socket(AF_INET, SOCK_STREAM) failed");
    }

    // 재시작 직후 TIME_WAIT 포트에 다시 bind 할 수 있도록
    if (!listenSocket_.setReuseAddr(true))
    {
        throwSysError("Acceptor: setsockopt(SO_REUSEADDR) failed");
    }

    if (!listenSocket_.bind(listenAddress_, listenPort_))
    {
        throwSysError("Acceptor: bind() failed");
    }

    if (!listenSocket_.listen(backlog))
    {
        throwSysError("Acceptor: listen() failed");
    }

    if (!listenSocket_.setNonBlocking(true))
    {
        throwSysError("Acceptor: fcntl(O_NONBLOCK) failed");
    }

    if (const auto bound = listenSocket_.localPort(); bound != 0)
    {
        listenPort_ = bound;
    }

    SLOG_INFO("Acceptor", "Listening", "addr={} port={} backlog={}", listenAddress_, listenPort_,
              backlog);
}

void Acceptor::handleEvent(EventLoop &loop, const EpollReactor::ReadyEvent &ev)
{
    if (ev.events & (EPOLLERR | EPOLLHUP))
    {
        onError_(loop, ev);
        return;
    }

    if (ev.events & EPOLLIN)
    {
        onReadable_();
    }
}

void Acceptor::onReadable_()
{
    for (;;)
    {
        ::sockaddr_storage ss{};
        ::socklen_t slen = sizeof(ss);

        Socket client = listenSocket_.accept(reinterpret_cast<::sockaddr *>(&ss), &slen);
        if (!client.isValid())
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED)
            {
                continue;
            }

            // EMFILE/ENFILE 등: 이번 이벤트는 포기하고 다음 readable을 기다린다.
            SLOG_ERROR("Acceptor", "AcceptFailed", "errno={} msg='{}'", errno,
                       std::strerror(errno));
            break;
        }

        PeerEndpoint peer{};
        fillPeerEndpoint(ss, peer);

        SLOG_DEBUG("Acceptor", "Accepted", "peer_ip={} peer_port={} fd={}", peer.ip, peer.port,
                   client.nativeHandle());

        if (!onAccept_)
        {
            continue; // 소유자가 없으면 그냥 닫힌다
        }

        try
        {
            onAccept_(std::move(client), peer);
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("Acceptor", "OnAcceptException", "peer_ip={} peer_port={} what='{}'",
                       peer.ip, peer.port, e.what());
        }
    }
}

void Acceptor::onError_(EventLoop &loop, const EpollReactor::ReadyEvent &ev) noexcept
{
    SLOG_ERROR("Acceptor", "ListenSocketError", "fd={} events=0x{:x} action=removing_listener",
               ev.fd, ev.events);

    (void)loop.removeFd(ev.fd);
    close();
}

void Acceptor::fillPeerEndpoint(const ::sockaddr_storage &ss, PeerEndpoint &out) noexcept
{
    out.ip = "unknown";
    out.port = 0;

    if (ss.ss_family != AF_INET)
    {
        return;
    }

    const auto *in = reinterpret_cast<const ::sockaddr_in *>(&ss);
    char buf[INET_ADDRSTRLEN] = {};
    if (::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf)) != nullptr)
    {
        out.ip = buf;
    }
    out.port = ntohs(in->sin_port);
}

} // namespace hostlink::net

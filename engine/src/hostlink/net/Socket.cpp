#include <hostlink/net/Socket.hpp>

#include <arpa/inet.h>   // inet_pton, inet_ntop
#include <cerrno>
#include <cstring>
#include <fcntl.h>       // fcntl, O_NONBLOCK
#include <netdb.h>       // getaddrinfo
#include <netinet/tcp.h> // TCP_NODELAY
#include <poll.h>        // poll
#include <sys/time.h>    // timeval
#include <unistd.h>      // close

namespace hostlink::net
{

namespace
{
bool setTimeoutOption(int fd, int option, std::chrono::milliseconds timeout) noexcept
{
    ::timeval tv{};
    if (timeout.count() > 0)
    {
        tv.tv_sec = static_cast<::time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<::suseconds_t>((timeout.count() % 1000) * 1000);
    }
    return ::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
}
} // namespace

Socket::Socket(Handle fd) noexcept : fd_(fd) {}

Socket::~Socket() noexcept
{
    close();
}

Socket::Socket(Socket &&other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

Socket &Socket::operator=(Socket &&other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::createTcpIPv4() noexcept
{
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return Socket{};
    }
    return Socket{fd};
}

void Socket::close() noexcept
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

bool Socket::setNonBlocking(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags == -1)
    {
        return false;
    }

    const int newFlags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd_, F_SETFL, newFlags) != -1;
}

bool Socket::setReuseAddr(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != -1;
}

bool Socket::setNoDelay(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) != -1;
}

bool Socket::setRecvTimeout(std::chrono::milliseconds timeout) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return setTimeoutOption(fd_, SO_RCVTIMEO, timeout);
}

bool Socket::setSendTimeout(std::chrono::milliseconds timeout) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return setTimeoutOption(fd_, SO_SNDTIMEO, timeout);
}

bool Socket::bind(const std::string &ip, std::uint16_t port) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    ::sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
    {
        errno = EINVAL;
        return false;
    }

    return ::bind(fd_, reinterpret_cast<::sockaddr *>(&addr), sizeof(addr)) != -1;
}

bool Socket::listen(int backlog) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return ::listen(fd_, backlog) != -1;
}

Socket Socket::accept(::sockaddr *addr, ::socklen_t *len) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return Socket{};
    }

    const int newFd = ::accept4(fd_, addr, len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (newFd < 0)
    {
        return Socket{};
    }
    return Socket{newFd};
}

bool Socket::connect(const std::string &host, std::uint16_t port) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    ::sockaddr_in addr{};
    if (!resolveIPv4(host, port, addr))
    {
        errno = EHOSTUNREACH;
        return false;
    }
    return connect(addr);
}

bool Socket::connect(const ::sockaddr_in &addr) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    if (::connect(fd_, reinterpret_cast<const ::sockaddr *>(&addr), sizeof(addr)) == 0)
    {
        return true;
    }
    if (errno != EINTR)
    {
        return false;
    }

    // 시그널로 끊겨도 커널은 연결을 계속 진행한다. 다시 connect하면 EALREADY가 난다.
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags != -1 && (flags & O_NONBLOCK) != 0)
    {
        errno = EINPROGRESS;
        return false;
    }

    ::pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLOUT;
    for (;;)
    {
        const int rc = ::poll(&pfd, 1, -1);
        if (rc > 0)
        {
            break;
        }
        if (rc < 0 && errno != EINTR)
        {
            return false;
        }
    }

    const int err = pendingError();
    if (err != 0)
    {
        errno = err;
        return false;
    }
    return true;
}

bool Socket::shutdownWrite() noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return ::shutdown(fd_, SHUT_WR) != -1;
}

void Socket::shutdownBoth() noexcept
{
    if (isValid())
    {
        (void)::shutdown(fd_, SHUT_RDWR);
    }
}

int Socket::pendingError() noexcept
{
    int soErr = 0;
    ::socklen_t slen = sizeof(soErr);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &soErr, &slen) == -1)
    {
        return errno;
    }
    return soErr;
}

std::uint16_t Socket::localPort() const noexcept
{
    if (!isValid())
    {
        return 0;
    }

    ::sockaddr_in addr{};
    ::socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<::sockaddr *>(&addr), &len) == -1 ||
        addr.sin_family != AF_INET)
    {
        return 0;
    }
    return ntohs(addr.sin_port);
}

::ssize_t Socket::send(const void *data, std::size_t len, int flags) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::send(fd_, data, len, flags);
}

::ssize_t Socket::recv(void *buffer, std::size_t len, int flags) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::recv(fd_, buffer, len, flags);
}

bool resolveIPv4(const std::string &host, std::uint16_t port, ::sockaddr_in &out) noexcept
{
    out = ::sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);

    if (::inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1)
    {
        return true;
    }

    ::addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    ::addrinfo *res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res)
    {
        return false;
    }

    const auto *in = reinterpret_cast<const ::sockaddr_in *>(res->ai_addr);
    out.sin_addr = in->sin_addr;
    ::freeaddrinfo(res);
    return true;
}

std::string primaryLocalIPv4()
{
    const int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return "127.0.0.1";
    }
    Socket udp{fd};

    ::sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(1);
    (void)::inet_pton(AF_INET, "10.255.255.255", &remote.sin_addr);

    if (::connect(fd, reinterpret_cast<::sockaddr *>(&remote), sizeof(remote)) == -1)
    {
        return "127.0.0.1";
    }

    ::sockaddr_in local{};
    ::socklen_t len = sizeof(local);
    char buf[INET_ADDRSTRLEN] = {};
    if (::getsockname(fd, reinterpret_cast<::sockaddr *>(&local), &len) == -1 ||
        ::inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) == nullptr)
    {
        return "127.0.0.1";
    }
    return std::string(buf);
}

} // namespace hostlink::net

#include <hostlink/net/Socket.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>

using hostlink::net::Socket;

namespace {

/// close() 이후 fd 가 실제로 닫히고, move 가 소유권을 옮기는지 확인합니다.
bool test_raii_and_move() {
    Socket a = Socket::createTcpIPv4();
    if (!a.isValid()) {
        std::cerr << "[raii] createTcpIPv4 failed errno=" << errno << "\n";
        return false;
    }
    const int fd = a.nativeHandle();

    // SOCK_CLOEXEC 가 붙어 있어야 한다.
    if ((::fcntl(fd, F_GETFD) & FD_CLOEXEC) == 0) {
        std::cerr << "[raii] FD_CLOEXEC not set\n";
        return false;
    }

    Socket b = std::move(a);
    if (a.isValid() || b.nativeHandle() != fd) {
        std::cerr << "[raii] move did not transfer ownership\n";
        return false;
    }

    b.close();
    b.close(); // idempotent
    if (b.isValid() || ::fcntl(fd, F_GETFD) != -1) {
        std::cerr << "[raii] fd still open after close()\n";
        return false;
    }
    return true;
}

bool test_resolve_ipv4() {
    ::sockaddr_in addr{};
    if (!hostlink::net::resolveIPv4("127.0.0.1", 8080, addr)) {
        std::cerr << "[resolve] numeric address failed\n";
        return false;
    }
    if (addr.sin_addr.s_addr != htonl(INADDR_LOOPBACK) || ntohs(addr.sin_port) != 8080) {
        std::cerr << "[resolve] numeric address mismatch\n";
        return false;
    }

    if (!hostlink::net::resolveIPv4("localhost", 1, addr)) {
        std::cerr << "[resolve] 'localhost' did not resolve\n";
        return false;
    }

    const std::string primary = hostlink::net::primaryLocalIPv4();
    ::in_addr tmp{};
    if (::inet_pton(AF_INET, primary.c_str(), &tmp) != 1) {
        std::cerr << "[resolve] primaryLocalIPv4 returned '" << primary << "'\n";
        return false;
    }
    return true;
}

/// 요청 -> shutdownWrite(FIN) -> 상대는 EOF 확인 -> 응답 -> EOF. SimpleClient 사이클과 같은 순서.
bool test_half_close_exchange() {
    Socket server = Socket::createTcpIPv4();
    if (!server.setReuseAddr(true) || !server.bind("127.0.0.1", 0) || !server.listen(4)) {
        std::cerr << "[half] listen setup failed errno=" << errno << "\n";
        return false;
    }
    const std::uint16_t port = server.localPort();
    if (port == 0) {
        std::cerr << "[half] localPort() == 0\n";
        return false;
    }

    Socket client = Socket::createTcpIPv4();
    if (!client.connect("127.0.0.1", port)) {
        std::cerr << "[half] connect failed errno=" << errno << "\n";
        return false;
    }

    ::sockaddr_storage ss{};
    ::socklen_t len = sizeof(ss);
    Socket accepted = server.accept(reinterpret_cast<::sockaddr *>(&ss), &len);
    if (!accepted.isValid()) {
        std::cerr << "[half] accept failed errno=" << errno << "\n";
        return false;
    }
    // accept4(SOCK_NONBLOCK) 이므로 테스트에서는 다시 블로킹으로 돌린다.
    if (!accepted.setNonBlocking(false)) {
        std::cerr << "[half] setNonBlocking(false) failed\n";
        return false;
    }

    const char req[] = "ping";
    if (client.send(req, 4) != 4 || !client.shutdownWrite()) {
        std::cerr << "[half] client send/shutdownWrite failed errno=" << errno << "\n";
        return false;
    }

    char buf[16] = {};
    if (accepted.recv(buf, sizeof(buf)) != 4 || std::memcmp(buf, "ping", 4) != 0) {
        std::cerr << "[half] server did not receive request\n";
        return false;
    }
    if (accepted.recv(buf, sizeof(buf)) != 0) {
        std::cerr << "[half] server did not observe EOF after shutdownWrite\n";
        return false;
    }

    if (accepted.send("pong", 4) != 4) {
        std::cerr << "[half] server could not answer after peer FIN\n";
        return false;
    }
    accepted.close();

    if (client.recv(buf, sizeof(buf)) != 4 || std::memcmp(buf, "pong", 4) != 0) {
        std::cerr << "[half] client did not receive response\n";
        return false;
    }
    if (client.recv(buf, sizeof(buf)) != 0) {
        std::cerr << "[half] client did not observe EOF\n";
        return false;
    }
    return true;
}

/// SO_RCVTIMEO 가 걸린 블로킹 recv 는 EAGAIN 으로 돌아와야 한다.
bool test_recv_timeout() {
    using namespace std::chrono_literals;

    Socket server = Socket::createTcpIPv4();
    if (!server.setReuseAddr(true) || !server.bind("127.0.0.1", 0) || !server.listen(1)) {
        std::cerr << "[timeout] listen setup failed\n";
        return false;
    }

    Socket client = Socket::createTcpIPv4();
    if (!client.setRecvTimeout(50ms) || !client.connect("127.0.0.1", server.localPort())) {
        std::cerr << "[timeout] client setup failed errno=" << errno << "\n";
        return false;
    }

    const auto start = std::chrono::steady_clock::now();
    char buf[4];
    const ::ssize_t n = client.recv(buf, sizeof(buf));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    if (n != -1 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
        std::cerr << "[timeout] recv n=" << n << " errno=" << errno << "\n";
        return false;
    }
    if (elapsed < 40ms) {
        std::cerr << "[timeout] returned too early\n";
        return false;
    }
    return true;
}

/// 미리 해석한 주소로 connect. 논블로킹이면 EINPROGRESS 후 쓰기 가능 + SO_ERROR 0.
bool test_connect_resolved_address() {
    Socket server = Socket::createTcpIPv4();
    if (!server.setReuseAddr(true) || !server.bind("127.0.0.1", 0) || !server.listen(4)) {
        std::cerr << "[addr] listen setup failed\n";
        return false;
    }

    ::sockaddr_in addr{};
    if (!hostlink::net::resolveIPv4("127.0.0.1", server.localPort(), addr)) {
        return false;
    }

    Socket blocking = Socket::createTcpIPv4();
    if (!blocking.connect(addr)) {
        std::cerr << "[addr] blocking connect failed errno=" << errno << "\n";
        return false;
    }

    Socket nonBlocking = Socket::createTcpIPv4();
    if (!nonBlocking.setNonBlocking(true)) {
        return false;
    }
    if (!nonBlocking.connect(addr)) {
        if (errno != EINPROGRESS) {
            std::cerr << "[addr] non-blocking connect errno=" << errno << "\n";
            return false;
        }
        ::pollfd pfd{nonBlocking.nativeHandle(), POLLOUT, 0};
        if (::poll(&pfd, 1, 2000) != 1 || (pfd.revents & POLLOUT) == 0) {
            std::cerr << "[addr] connect never became writable\n";
            return false;
        }
    }
    if (nonBlocking.pendingError() != 0) {
        std::cerr << "[addr] SO_ERROR set after connect\n";
        return false;
    }

    Socket invalid;
    if (invalid.connect(addr) || errno != EBADF) {
        std::cerr << "[addr] invalid socket did not report EBADF\n";
        return false;
    }
    return true;
}

bool test_connect_refused() {
    // 방금 닫은 ephemeral 포트는 대개 비어 있다.
    std::uint16_t port = 0;
    {
        Socket scratch = Socket::createTcpIPv4();
        if (!scratch.bind("127.0.0.1", 0)) {
            std::cerr << "[refused] bind failed\n";
            return false;
        }
        port = scratch.localPort();
    }

    Socket client = Socket::createTcpIPv4();
    if (client.connect("127.0.0.1", port)) {
        std::cerr << "[refused] connect unexpectedly succeeded\n";
        return false;
    }
    if (errno != ECONNREFUSED) {
        std::cerr << "[refused] errno=" << errno << " expected ECONNREFUSED\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_raii_and_move();
    ok = ok && test_resolve_ipv4();
    ok = ok && test_half_close_exchange();
    ok = ok && test_recv_timeout();
    ok = ok && test_connect_refused();
    ok = ok && test_connect_resolved_address();

    if (!ok) {
        std::cerr << "Socket tests FAILED\n";
        return 1;
    }

    std::cout << "Socket tests PASSED\n";
    return 0;
}

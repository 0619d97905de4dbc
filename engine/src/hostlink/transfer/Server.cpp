#include <hostlink/transfer/Server.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/core/ThreadContext.hpp>
#include <hostlink/net/Socket.hpp>

#include <map>
#include <utility>

namespace hostlink::transfer
{

namespace
{
using ServerKey = std::pair<std::string, std::uint16_t>;

std::mutex &registryMutex()
{
    static std::mutex m;
    return m;
}

// 살아 있는 서버만 의미가 있으므로 weak_ptr로 둔다.
std::map<ServerKey, std::weak_ptr<Server>> &liveServers()
{
    static std::map<ServerKey, std::weak_ptr<Server>> servers;
    return servers;
}

std::atomic<unsigned> &serverIndex()
{
    static std::atomic<unsigned> index{0};
    return index;
}
} // namespace

Server::Server(PrivateTag, const std::string &host, std::uint16_t port,
               std::shared_ptr<const protocol::ProtocolRegistry> registry, ManagerOptions options)
    : ConnectionManager(options), host_(host), registry_(std::move(registry)),
      acceptor_(host, port, options.listenBacklog)
{
    acceptor_.setAcceptCallback([this](net::Socket &&socket, const net::PeerEndpoint &peer)
                                { onAccepted_(std::move(socket), peer); });

    SLOG_INFO("Server", "Listening", "host={} port={} protocols={} idle_ms={}", host_, port(),
              registry_->size(), options_.idleTimeout.count());
}

Server::~Server()
{
    stop();

    std::lock_guard<std::mutex> lock(registryMutex());
    auto &servers = liveServers();
    auto it = servers.find(ServerKey{host_, port()});
    if (it != servers.end() && it->second.expired())
    {
        servers.erase(it);
    }
}

std::shared_ptr<Server> Server::create(const std::string &host, std::uint16_t port,
                                       std::shared_ptr<const protocol::ProtocolRegistry> registry,
                                       ManagerOptions options)
{
    std::lock_guard<std::mutex> lock(registryMutex());
    auto &servers = liveServers();

    if (port != 0)
    {
        auto it = servers.find(ServerKey{host, port});
        if (it != servers.end())
        {
            if (auto existing = it->second.lock())
            {
                SLOG_DEBUG("Server", "Reused", "host={} port={}", host, port);
                return existing;
            }
        }
    }

    if (!registry)
    {
        registry = std::make_shared<const protocol::ProtocolRegistry>(
            protocol::ProtocolRegistry::withDefaults(std::string(core::defaults::kReceiveDir),
                                                     core::defaults::kFileChunkSize));
    }

    auto server = std::make_shared<Server>(PrivateTag{}, host, port, std::move(registry), options);
    servers.insert_or_assign(ServerKey{host, server->port()}, server);
    return server;
}

std::shared_ptr<Server> Server::create(std::uint16_t port)
{
    return create(net::primaryLocalIPv4(), port);
}

void Server::start()
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (started_)
    {
        return;
    }
    started_ = true;
    running_.store(true, std::memory_order_release);

    thread_ = std::thread([this]() { runLoop_(); });
}

void Server::stop()
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_.exchange(false, std::memory_order_acq_rel))
    {
        // run()은 tick마다 플래그를 보지만, 대기 중인 epoll_wait를 바로 깨운다.
        loop_.post([] {});
    }

    // 루프 스레드 자신이 부른 경우에는 run()이 돌아온 뒤 소유자가 join한다.
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
    {
        thread_.join();
    }
}

void Server::runLoop_() noexcept
{
    core::ThreadContext::setCurrentThreadTag("srv", serverIndex().fetch_add(1));
    loop_.bindToCurrentThread();

    const auto mask = net::EpollReactor::makeEventMask({net::EpollReactor::Event::Read});
    if (!loop_.addFd(acceptor_.nativeHandle(), mask, &acceptor_))
    {
        SLOG_ERROR("Server", "AcceptorRegisterFailed", "host={} port={} errno={}", host_, port(),
                   errno);
        running_.store(false, std::memory_order_release);
        return;
    }

    SLOG_INFO("Server", "Started", "host={} port={}", host_, port());

    loop_.run(running_);

    cancelAll_();
    if (acceptor_.isValid())
    {
        (void)loop_.removeFd(acceptor_.nativeHandle());
    }

    SLOG_INFO("Server", "Stopped", "host={} port={}", host_, port());
}

void Server::onAccepted_(net::Socket &&socket, const net::PeerEndpoint &peer)
{
    const Connection::Id id = nextConnectionId_();
    (void)socket.setNoDelay(true);

    SLOG_INFO("Server", "Accepted", "cid={} fd={} peer={}:{}", id, socket.nativeHandle(), peer.ip,
              peer.port);

    adopt_(Connection::accepted(id, std::move(socket), peer, *registry_, *this));
}

} // namespace hostlink::transfer

#include <hostlink/transfer/ConnectionManager.hpp>

#include <hostlink/core/Logger.hpp>

#include <vector>

namespace hostlink::transfer
{

ConnectionManager::ConnectionManager(ManagerOptions options)
    : options_(options),
      loop_(options_.tickResolution, options_.timerSlots, options_.maxEpollEvents)
{
}

ConnectionManager::~ConnectionManager() = default;

void ConnectionManager::cancel(Connection::Id id)
{
    loop_.post(
        [this, id]()
        {
            auto it = connections_.find(id);
            if (it == connections_.end())
            {
                SLOG_DEBUG("ConnectionManager", "CancelUnknown", "cid={}", id);
                return;
            }
            auto conn = it->second;
            conn->fail(protocol::TransferCancelledError());
        });
}

void ConnectionManager::adopt_(const std::shared_ptr<Connection> &conn)
{
    connections_.emplace(conn->id(), conn);
    activeConnections_.store(connections_.size(), std::memory_order_relaxed);

    (void)conn->open();
}

void ConnectionManager::cancelAll_() noexcept
{
    if (connections_.empty())
    {
        return;
    }

    SLOG_INFO("ConnectionManager", "CancelAll", "count={}", connections_.size());

    std::vector<std::shared_ptr<Connection>> snapshot;
    snapshot.reserve(connections_.size());
    for (auto &[id, conn] : connections_)
    {
        snapshot.push_back(conn);
    }

    for (auto &conn : snapshot)
    {
        conn->fail(protocol::TransferCancelledError());
    }
}

void ConnectionManager::onConnectionClosed_(Connection::Id id) noexcept
{
    connections_.erase(id);
    activeConnections_.store(connections_.size(), std::memory_order_relaxed);
}

void ConnectionManager::notifyConnectionError_(const net::PeerEndpoint &peer,
                                               const protocol::TransferError &error) noexcept
{
    if (!onConnectionError_)
    {
        return;
    }

    try
    {
        onConnectionError_(peer, error);
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("ConnectionManager", "ErrorListenerThrew", "peer={}:{} what='{}'", peer.ip,
                   peer.port, e.what());
    }
}

} // namespace hostlink::transfer

#include <hostlink/core/Logger.hpp>
#include <hostlink/protocol/HostIdentityProtocol.hpp>
#include <hostlink/protocol/ProtocolRegistry.hpp>
#include <hostlink/transfer/Client.hpp>
#include <hostlink/transfer/Server.hpp>
#include <hostlink/transfer/SimpleClient.hpp>

#include "../common/TestSupport.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>

using namespace hostlink;
using protocol::HostIdentity;
using protocol::HostIdentityProtocol;

namespace {

constexpr const char *kLoopback = "127.0.0.1";

std::shared_ptr<transfer::Server> startServer(const test::TempDir &dir) {
    auto registry = std::make_shared<const protocol::ProtocolRegistry>(
        protocol::ProtocolRegistry::withDefaults(dir.path(), 4096));
    auto server = transfer::Server::create(kLoopback, 0, registry);
    server->start();
    return server;
}

/// 같은 프로세스의 서버가 응답하므로 받은 정보는 systemIdentity()와 같아야 한다.
bool test_multiplexed_client_learns_peer() {
    test::TempDir dir("id_mux");
    auto server = startServer(dir);

    auto proto = HostIdentityProtocol::forRequest(protocol::systemIdentity());
    int calls = 0;
    proto->setIdentityListener([&](const HostIdentity &) { ++calls; });

    transfer::Client client;
    (void)client.connect(kLoopback, server->port(), proto);
    client.run();

    if (!proto->isCompleted() || calls != 1) {
        std::cerr << "[mux] exchange did not complete (calls=" << calls << ")\n";
        return false;
    }
    if (proto->peer() != std::optional<HostIdentity>(protocol::systemIdentity())) {
        std::cerr << "[mux] peer identity mismatch\n";
        return false;
    }

    server->stop();
    return true;
}

bool test_blocking_client_learns_peer() {
    test::TempDir dir("id_simple");
    auto server = startServer(dir);

    HostIdentity self = protocol::systemIdentity();
    self.extras["client-tag"] = "simple";
    auto proto = HostIdentityProtocol::forRequest(self);

    transfer::SimpleClient client(kLoopback, server->port(), proto);
    if (!client.run()) {
        std::cerr << "[simple] run failed\n";
        return false;
    }
    if (!proto->peer() || *proto->peer() != protocol::systemIdentity()) {
        std::cerr << "[simple] peer identity mismatch\n";
        return false;
    }

    server->stop();
    return true;
}

bool test_detached_request() {
    test::TempDir dir("id_detached");
    auto server = startServer(dir);

    std::mutex m;
    std::optional<HostIdentity> seen;
    std::atomic_bool failed{false};

    auto proto = HostIdentityProtocol::request(
        kLoopback, server->port(),
        [&](const HostIdentity &peer) {
            std::lock_guard<std::mutex> lock(m);
            seen = peer;
        },
        [&](const protocol::TransferError &) { failed = true; });

    const bool finished = test::waitUntil([&] {
        std::lock_guard<std::mutex> lock(m);
        return seen.has_value() || failed.load();
    });
    if (!finished || failed.load()) {
        std::cerr << "[detached] request did not succeed\n";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m);
        if (*seen != protocol::systemIdentity()) {
            std::cerr << "[detached] peer identity mismatch\n";
            return false;
        }
    }

    server->stop();
    return proto != nullptr;
}

} // namespace

int main() {
    core::detail::fastMinLevel().store(static_cast<int>(core::LogLevel::Warn));

    bool ok = true;

    ok = ok && test_multiplexed_client_learns_peer();
    ok = ok && test_blocking_client_learns_peer();
    ok = ok && test_detached_request();

    core::shutdownLogger();

    if (!ok) {
        std::cerr << "HostIdentity E2E tests FAILED\n";
        return 1;
    }

    std::cout << "HostIdentity E2E tests PASSED\n";
    return 0;
}

#include <hostlink/core/ConfigLoader.hpp>
#include <hostlink/core/Logger.hpp>
#include <hostlink/core/LoggingConfig.hpp>
#include <hostlink/protocol/FileTransferProtocol.hpp>
#include <hostlink/protocol/HostIdentityProtocol.hpp>
#include <hostlink/protocol/ProtocolRegistry.hpp>
#include <hostlink/transfer/Client.hpp>
#include <hostlink/transfer/Server.hpp>
#include <hostlink/transfer/SimpleClient.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <csignal>
#include <pthread.h>

namespace
{

void printUsage(std::ostream &os)
{
    os << "usage:\n"
          "  hostlink [--config <file.toml>] serve\n"
          "  hostlink [--config <file.toml>] send <file> <host> <port>\n"
          "  hostlink [--config <file.toml>] identify <host> <port>\n";
}

std::uint16_t parsePort(const std::string &text)
{
    unsigned value = 0;
    const auto *first = text.data();
    const auto *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value == 0 || value > 65535)
    {
        throw std::invalid_argument("invalid port '" + text + "'");
    }
    return static_cast<std::uint16_t>(value);
}

/// 이후 만들어지는 스레드가 SIGINT/SIGTERM을 받지 않도록 막고, 메인에서 sigwait로 받는다.
sigset_t blockShutdownSignals()
{
    sigset_t set;
    ::sigemptyset(&set);
    ::sigaddset(&set, SIGINT);
    ::sigaddset(&set, SIGTERM);

    const int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0)
    {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask failed");
    }
    return set;
}

int runServe(const hostlink::core::GlobalConfig &cfg)
{
    const sigset_t signals = blockShutdownSignals();

    auto registry = std::make_shared<const hostlink::protocol::ProtocolRegistry>(
        hostlink::protocol::ProtocolRegistry::withDefaults(cfg.transfer.receiveDir,
                                                           cfg.transfer.chunkSize));

    auto server = hostlink::transfer::Server::create(
        cfg.engine.listenAddress, cfg.engine.listenPort, registry,
        hostlink::transfer::ManagerOptions::fromConfig(cfg.engine));

    server->setConnectionErrorListener(
        [](const hostlink::net::PeerEndpoint &peer, const hostlink::protocol::TransferError &e)
        {
            SLOG_WARN("App", "TransferFailed", "peer={}:{} kind={} what='{}'", peer.ip, peer.port,
                      hostlink::protocol::toString(e.kind()), e.what());
        });

    server->start();
    std::cout << "listening on " << server->host() << ":" << server->port() << " (receive_dir='"
              << cfg.transfer.receiveDir << "')" << std::endl;

    int signo = 0;
    const int rc = ::sigwait(&signals, &signo);
    if (rc != 0)
    {
        SLOG_ERROR("App", "SigwaitFailed", "rc={}", rc);
    }
    else
    {
        SLOG_INFO("App", "ShutdownSignal", "signo={}", signo);
    }

    server->stop();
    return 0;
}

int runSend(const hostlink::core::GlobalConfig &cfg, const std::vector<std::string> &args)
{
    if (args.size() != 4)
    {
        printUsage(std::cerr);
        return 2;
    }

    const std::string &path = args[1];
    const std::string &host = args[2];
    const std::uint16_t port = parsePort(args[3]);

    auto proto = hostlink::protocol::FileTransferProtocol::forFile(path, cfg.transfer.chunkSize);

    int lastPercent = -1;
    proto->setProgressListener(
        [&lastPercent](double fraction)
        {
            const int percent = static_cast<int>(fraction * 100.0);
            if (percent != lastPercent)
            {
                lastPercent = percent;
                std::cout << "\rprogress " << percent << "%" << std::flush;
            }
        });

    std::optional<std::string> failure;
    proto->setFailureListener([&failure](const hostlink::protocol::TransferError &e)
                              { failure = e.what(); });

    hostlink::transfer::SimpleClientOptions options;
    options.idleTimeout = std::chrono::milliseconds(cfg.engine.idleTimeoutMs);

    hostlink::transfer::SimpleClient client(host, port, proto, options);
    const bool ok = client.run();
    std::cout << std::endl;

    if (!ok)
    {
        std::cerr << "send failed: " << failure.value_or("unknown error") << "\n";
        return 1;
    }
    std::cout << "sent " << proto->fileName() << " (" << proto->fileSize() << " bytes) to "
              << host << ":" << port << "\n";
    return 0;
}

int runIdentify(const hostlink::core::GlobalConfig &cfg, const std::vector<std::string> &args)
{
    if (args.size() != 3)
    {
        printUsage(std::cerr);
        return 2;
    }

    const std::string &host = args[1];
    const std::uint16_t port = parsePort(args[2]);

    auto proto = hostlink::protocol::HostIdentityProtocol::forRequest(
        hostlink::protocol::systemIdentity());

    std::optional<std::string> failure;
    proto->setFailureListener([&failure](const hostlink::protocol::TransferError &e)
                              { failure = e.what(); });

    hostlink::transfer::Client client(hostlink::transfer::ManagerOptions::fromConfig(cfg.engine));
    (void)client.connect(host, port, proto);
    client.run();

    if (!proto->peer())
    {
        std::cerr << "identify failed: " << failure.value_or("peer sent no identity") << "\n";
        return 1;
    }
    std::cout << proto->peer()->toJson().dump(2) << "\n";
    return 0;
}

int dispatch(int argc, char **argv)
{
    const auto cmd = hostlink::core::ConfigLoader::parseCommandLine(argc, argv);
    if (cmd.helpRequested)
    {
        printUsage(std::cout);
        return 0;
    }
    if (cmd.positional.empty())
    {
        printUsage(std::cerr);
        return 2;
    }

    const auto cfg = hostlink::core::ConfigLoader::load(argc, argv);
    hostlink::core::applyLoggingConfig(cfg.engine);

    const std::string &command = cmd.positional.front();
    if (command == "serve")
    {
        return runServe(cfg);
    }
    if (command == "send")
    {
        return runSend(cfg, cmd.positional);
    }
    if (command == "identify")
    {
        return runIdentify(cfg, cmd.positional);
    }

    std::cerr << "unknown command '" << command << "'\n";
    printUsage(std::cerr);
    return 2;
}

} // namespace

int main(int argc, char **argv)
{
    int rc = 1;
    try
    {
        // 어느 경로로 끝나든 아래 shutdownLogger()까지 내려간다.
        rc = dispatch(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        rc = 1;
    }

    hostlink::core::shutdownLogger();
    return rc;
}

#include <hostlink/protocol/ProtocolRegistry.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/protocol/FileTransferProtocol.hpp>
#include <hostlink/protocol/HostIdentity.hpp>
#include <hostlink/protocol/HostIdentityProtocol.hpp>

#include <stdexcept>
#include <utility>

namespace hostlink::protocol
{

void ProtocolRegistry::registerProtocol(std::string name, Factory factory)
{
    if (!factory)
    {
        throw std::invalid_argument("ProtocolRegistry: empty factory for '" + name + "'");
    }

    auto [it, inserted] = factories_.insert_or_assign(std::move(name), std::move(factory));
    if (!inserted)
    {
        SLOG_WARN("ProtocolRegistry", "Replaced", "name={}", it->first);
    }
    else
    {
        SLOG_DEBUG("ProtocolRegistry", "Registered", "name={}", it->first);
    }
}

const ProtocolRegistry::Factory &ProtocolRegistry::resolve(const std::string &name) const
{
    auto it = factories_.find(name);
    if (it == factories_.end())
    {
        throw UnknownProtocolError(name);
    }
    return it->second;
}

bool ProtocolRegistry::contains(const std::string &name) const noexcept
{
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> ProtocolRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto &[name, factory] : factories_)
    {
        out.push_back(name);
    }
    return out;
}

std::shared_ptr<PayloadProtocol> ProtocolRegistry::create(const Header &header) const
{
    const Factory &factory = resolve(contentProtocol(header));
    auto protocol = factory(header);
    if (!protocol)
    {
        throw MalformedHeaderError("factory for '" + contentProtocol(header) +
                                   "' returned no protocol");
    }
    return protocol;
}

ProtocolRegistry ProtocolRegistry::withDefaults(std::filesystem::path receiveDir,
                                                std::size_t chunkSize)
{
    ProtocolRegistry registry;

    registry.registerProtocol(
        std::string(FileTransferProtocol::kName),
        [dir = std::move(receiveDir), chunkSize](const Header &header)
        { return FileTransferProtocol::fromHeader(header, dir, chunkSize); });

    // identity는 요청마다 새로 조회한다. (호스트 이름/사용자가 바뀔 수 있음)
    registry.registerProtocol(std::string(HostIdentityProtocol::kName),
                              [](const Header &header)
                              { return HostIdentityProtocol::fromHeader(header, systemIdentity()); });

    return registry;
}

} // namespace hostlink::protocol

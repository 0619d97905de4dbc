#include <hostlink/protocol/HostIdentityProtocol.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/transfer/Client.hpp>

#include <string_view>
#include <thread>

namespace hostlink::protocol
{

Bytes encodeIdentity(const HostIdentity &identity)
{
    const std::string text =
        identity.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return Bytes(text.begin(), text.end());
}

HostIdentity decodeIdentity(std::span<const std::uint8_t> bytes)
{
    const std::string_view text(reinterpret_cast<const char *>(bytes.data()), bytes.size());

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw MalformedPayloadError(std::string("identity payload is not JSON: ") + e.what());
    }
    return HostIdentity::fromJson(j);
}

HostIdentityProtocol::HostIdentityProtocol(PrivateTag, Bytes outbound)
    : outbound_(std::move(outbound))
{
}

std::shared_ptr<HostIdentityProtocol> HostIdentityProtocol::forRequest(const HostIdentity &self)
{
    Bytes payload = encodeIdentity(self);

    Header header = {
        {header_keys::kContentProtocol, std::string(kName)},
        {header_keys::kContentSize, payload.size()},
    };
    Bytes frame = encodeHeader(std::move(header));
    frame.insert(frame.end(), payload.begin(), payload.end());

    return std::make_shared<HostIdentityProtocol>(PrivateTag{}, std::move(frame));
}

std::shared_ptr<HostIdentityProtocol> HostIdentityProtocol::fromHeader(const Header &,
                                                                       const HostIdentity &self)
{
    return std::make_shared<HostIdentityProtocol>(PrivateTag{}, encodeIdentity(self));
}

std::shared_ptr<HostIdentityProtocol>
HostIdentityProtocol::request(const std::string &host, std::uint16_t port,
                              IdentityListener onIdentity, FailureListener onFailure)
{
    auto self = forRequest(systemIdentity());
    self->setIdentityListener(std::move(onIdentity));
    self->setFailureListener(std::move(onFailure));

    auto client = std::make_shared<transfer::Client>();
    client->connect(host, port, self);

    // 스레드가 client를 소유한다. 연결이 끝나면 run()이 돌아오고 client도 해제된다.
    std::thread([client] { client->run(); }).detach();
    return self;
}

Bytes HostIdentityProtocol::read()
{
    Bytes out;
    out.swap(outbound_);
    return out;
}

void HostIdentityProtocol::receive(std::span<const std::uint8_t> data)
{
    inbound_.insert(inbound_.end(), data.begin(), data.end());
}

void HostIdentityProtocol::finish_()
{
    if (inbound_.empty())
    {
        return;
    }

    peer_ = decodeIdentity(inbound_);
    inbound_.clear();

    SLOG_INFO("HostIdentity", "PeerIdentified", "computer={} user={} os={}", peer_->computerName,
              peer_->userName, peer_->osName);

    if (onIdentity_)
    {
        onIdentity_(*peer_);
    }
}

} // namespace hostlink::protocol

#include <hostlink/protocol/FrameDecoder.hpp>

#include <hostlink/core/Logger.hpp>
#include <hostlink/protocol/Endian.hpp>
#include <hostlink/protocol/ProtocolRegistry.hpp>

#include <algorithm>

namespace hostlink::protocol
{

const char *toString(DecodeStage stage) noexcept
{
    switch (stage)
    {
    case DecodeStage::AwaitingLengthPrefix:
        return "AwaitingLengthPrefix";
    case DecodeStage::AwaitingHeader:
        return "AwaitingHeader";
    case DecodeStage::AwaitingPayload:
        return "AwaitingPayload";
    case DecodeStage::PayloadComplete:
        return "PayloadComplete";
    }
    return "Unknown";
}

FrameDecoder::FrameDecoder(const ProtocolRegistry &registry) noexcept : registry_(registry) {}

DecodeStage FrameDecoder::feed(std::span<const std::uint8_t> data)
{
    while (!data.empty())
    {
        switch (stage_)
        {
        case DecodeStage::AwaitingLengthPrefix:
        {
            const std::size_t need = kLengthPrefixSize - inbound_.size();
            const std::size_t take = std::min(need, data.size());
            inbound_.insert(inbound_.end(), data.begin(), data.begin() + take);
            data = data.subspan(take);

            if (inbound_.size() == kLengthPrefixSize)
            {
                headerLength_ = loadU16Be(inbound_.data());
                inbound_.clear();
                stage_ = DecodeStage::AwaitingHeader;

                // 길이 0이면 빈 바이트가 디코드되며 MalformedHeaderError가 된다.
                if (headerLength_ == 0)
                {
                    onHeaderBytes_({});
                }
            }
            break;
        }
        case DecodeStage::AwaitingHeader:
        {
            const std::size_t need = headerLength_ - inbound_.size();
            const std::size_t take = std::min(need, data.size());
            inbound_.insert(inbound_.end(), data.begin(), data.begin() + take);
            data = data.subspan(take);

            if (inbound_.size() == headerLength_)
            {
                Bytes headerBytes;
                headerBytes.swap(inbound_);
                onHeaderBytes_(headerBytes);
            }
            break;
        }
        case DecodeStage::AwaitingPayload:
        {
            const std::uint64_t remaining = expected_ - received_;
            const std::size_t take =
                static_cast<std::size_t>(std::min<std::uint64_t>(remaining, data.size()));
            deliver_(data.first(take));
            data = data.subspan(take);
            break;
        }
        case DecodeStage::PayloadComplete:
            surplus_ += data.size();
            SLOG_WARN("FrameDecoder", "SurplusBytes", "bytes={} totalSurplus={}", data.size(),
                      surplus_);
            data = {};
            break;
        }
    }
    return stage_;
}

void FrameDecoder::onHeaderBytes_(std::span<const std::uint8_t> headerBytes)
{
    // content-encoding은 헤더 안에 있으므로 헤더 자체는 기본 인코딩으로 읽는다.
    Header header = decodeHeader(headerBytes, kDefaultContentEncoding);
    requireHeaderFields(header);

    const std::string encoding = header[header_keys::kContentEncoding].is_string()
                                     ? header[header_keys::kContentEncoding].get<std::string>()
                                     : std::string{};
    if (!isSupportedEncoding(encoding))
    {
        throw EncodingError("unsupported content-encoding '" + encoding + "'");
    }

    expected_ = contentSize(header);
    protocol_ = registry_.create(header);
    header_ = std::move(header);

    SLOG_DEBUG("FrameDecoder", "HeaderDecoded", "protocol={} contentSize={} headerLen={}",
               protocol_->name(), expected_, headerLength_);

    stage_ = expected_ == 0 ? DecodeStage::PayloadComplete : DecodeStage::AwaitingPayload;
}

void FrameDecoder::deliver_(std::span<const std::uint8_t> payload)
{
    if (payload.empty())
    {
        return;
    }
    protocol_->receive(payload);
    received_ += payload.size();
    if (received_ == expected_)
    {
        stage_ = DecodeStage::PayloadComplete;
    }
}

} // namespace hostlink::protocol

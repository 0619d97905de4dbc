#pragma once

#include <hostlink/protocol/FrameCodec.hpp>
#include <hostlink/protocol/PayloadProtocol.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace hostlink::protocol
{

class ProtocolRegistry;

enum class DecodeStage : std::uint8_t
{
    AwaitingLengthPrefix = 0,
    AwaitingHeader,
    AwaitingPayload,
    PayloadComplete,
};

[[nodiscard]] const char *toString(DecodeStage stage) noexcept;

/// 수신 방향 프레임 상태머신 (소켓과 무관)
///
/// - 어떤 크기로 잘라 feed()하든 protocol->receive()에 전달되는 바이트 열은 같다.
/// - content-size를 채우는 순간 PayloadComplete. 이후 바이트는 surplus로 세기만 한다.
/// - 헤더 검사/프로토콜 해석이 실패하면 protocol은 만들어지지 않는다.
///
/// @note complete()는 부르지 않는다. 응답 송신 후 Connection이 호출한다.
class FrameDecoder
{
  public:
    explicit FrameDecoder(const ProtocolRegistry &registry) noexcept;

    /// @throws TransferError 파생 (MalformedHeader / MissingHeaderField / UnknownProtocol ...)
    ///         protocol->receive()가 던진 TransferError도 그대로 전파된다.
    DecodeStage feed(std::span<const std::uint8_t> data);

    [[nodiscard]] DecodeStage stage() const noexcept { return stage_; }
    [[nodiscard]] bool isComplete() const noexcept { return stage_ == DecodeStage::PayloadComplete; }

    [[nodiscard]] const std::optional<Header> &header() const noexcept { return header_; }
    [[nodiscard]] const std::shared_ptr<PayloadProtocol> &protocol() const noexcept
    {
        return protocol_;
    }

    [[nodiscard]] std::uint64_t received() const noexcept { return received_; }
    [[nodiscard]] std::uint64_t expected() const noexcept { return expected_; }
    [[nodiscard]] std::uint64_t surplus() const noexcept { return surplus_; }

  private:
    const ProtocolRegistry &registry_;

    DecodeStage stage_{DecodeStage::AwaitingLengthPrefix};
    Bytes inbound_;
    std::size_t headerLength_{0};

    std::optional<Header> header_;
    std::shared_ptr<PayloadProtocol> protocol_;

    std::uint64_t received_{0};
    std::uint64_t expected_{0};
    std::uint64_t surplus_{0};

    void onHeaderBytes_(std::span<const std::uint8_t> headerBytes);
    void deliver_(std::span<const std::uint8_t> payload);
};

} // namespace hostlink::protocol

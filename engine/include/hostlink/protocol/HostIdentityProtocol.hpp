#pragma once

#include <hostlink/protocol/HostIdentity.hpp>
#include <hostlink/protocol/PayloadProtocol.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hostlink::protocol
{

/// 양쪽이 서로의 HostIdentity(JSON 객체)를 교환합니다.
///
/// - 요청 모드: read()가 [프레임 헤더 + 내 identity]를 한 번에 돌려준다.
/// - 응답 모드: 헤더는 이미 소비되었으므로 read()는 내 identity JSON만 돌려준다.
/// - 양쪽 모두 완료 시 받은 바이트가 있으면 디코드해서 identity 리스너를 부른다.
class HostIdentityProtocol final : public PayloadProtocol
{
  public:
    static constexpr std::string_view kName = "HostIdentity";

    using IdentityListener = std::function<void(const HostIdentity &peer)>;

  private:
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    HostIdentityProtocol(PrivateTag, Bytes outbound);

    [[nodiscard]] static std::shared_ptr<HostIdentityProtocol> forRequest(const HostIdentity &self);

    [[nodiscard]] static std::shared_ptr<HostIdentityProtocol> fromHeader(const Header &header,
                                                                          const HostIdentity &self);

    /// 다중화 Client(분리된 스레드)로 요청하고 바로 돌려준다. 리스너는 그 루프 스레드에서 호출된다.
    [[nodiscard]] static std::shared_ptr<HostIdentityProtocol>
    request(const std::string &host, std::uint16_t port, IdentityListener onIdentity,
            FailureListener onFailure = {});

    void setIdentityListener(IdentityListener listener) { onIdentity_ = std::move(listener); }

    /// 완료 후 받은 상대 정보 (받은 바이트가 없었으면 nullopt)
    [[nodiscard]] const std::optional<HostIdentity> &peer() const noexcept { return peer_; }

    // ===== PayloadProtocol =====
    [[nodiscard]] std::string_view name() const noexcept override { return kName; }
    [[nodiscard]] Bytes read() override;
    void receive(std::span<const std::uint8_t> data) override;
    [[nodiscard]] bool hasResponse() const noexcept override { return true; }

  protected:
    void finish_() override;

  private:
    Bytes outbound_;
    Bytes inbound_;
    std::optional<HostIdentity> peer_;
    IdentityListener onIdentity_;
};

/// identity JSON 직렬화 (잘못된 UTF-8은 U+FFFD로 치환)
[[nodiscard]] Bytes encodeIdentity(const HostIdentity &identity);

/// @throws MalformedPayloadError
[[nodiscard]] HostIdentity decodeIdentity(std::span<const std::uint8_t> bytes);

} // namespace hostlink::protocol

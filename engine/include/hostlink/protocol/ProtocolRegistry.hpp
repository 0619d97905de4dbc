#pragma once

#include <hostlink/protocol/FrameCodec.hpp>
#include <hostlink/protocol/PayloadProtocol.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace hostlink::protocol
{

/// content-protocol 이름 -> 수신 측 PayloadProtocol 생성 함수
///
/// - 프로세스 전역이 아닌 명시적 객체입니다. Server가 시작 전에 받아서 보관합니다.
/// - 시작 후에는 읽기 전용으로 취급합니다. (동기화 없음)
class ProtocolRegistry
{
  public:
    /// 디코드된 헤더(필수 필드 검사 통과)를 받아 수신 모드 인스턴스를 만든다.
    using Factory = std::function<std::shared_ptr<PayloadProtocol>(const Header &)>;

    /// 같은 이름이 이미 있으면 교체하고 경고 로그를 남긴다.
    void registerProtocol(std::string name, Factory factory);

    /// @throws UnknownProtocolError
    [[nodiscard]] const Factory &resolve(const std::string &name) const;

    [[nodiscard]] bool contains(const std::string &name) const noexcept;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const noexcept { return factories_.size(); }

    /// resolve(contentProtocol(header))(header)
    [[nodiscard]] std::shared_ptr<PayloadProtocol> create(const Header &header) const;

    /// "FileTransfer"(receiveDir에 저장) + "HostIdentity"(이 호스트 정보로 응답)
    [[nodiscard]] static ProtocolRegistry withDefaults(std::filesystem::path receiveDir,
                                                      std::size_t chunkSize);

  private:
    std::map<std::string, Factory, std::less<>> factories_;
};

} // namespace hostlink::protocol

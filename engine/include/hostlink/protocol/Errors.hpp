#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostlink::protocol
{

enum class ErrorKind : std::uint8_t
{
    Encoding = 0,
    MalformedHeader,
    MissingHeaderField,
    UnknownProtocol,
    MalformedPayload,
    Timeout,
    Cancelled,
    Incomplete,
    Io,
};

[[nodiscard]] const char *toString(ErrorKind kind) noexcept;

/// 한 연결(한 번의 교환)에 국한된 실패의 공통 베이스입니다.
///
/// - 연결 경계에서 잡혀 로그 + close 후 failure listener로 전달됩니다.
/// - 다른 연결이나 루프 자체에는 영향을 주지 않습니다.
class TransferError : public std::runtime_error
{
  public:
    TransferError(ErrorKind kind, const std::string &what);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

/// 헤더를 JSON으로 직렬화할 수 없음 (잘못된 UTF-8, 65535 바이트 초과, 미지원 인코딩)
class EncodingError final : public TransferError
{
  public:
    explicit EncodingError(const std::string &detail);
};

/// 헤더 바이트가 JSON 객체가 아니거나 필드 타입이 맞지 않음
class MalformedHeaderError final : public TransferError
{
  public:
    explicit MalformedHeaderError(const std::string &detail);
};

class MissingHeaderFieldError final : public TransferError
{
  public:
    explicit MissingHeaderFieldError(std::vector<std::string> fields);

    [[nodiscard]] const std::vector<std::string> &fields() const noexcept { return fields_; }

  private:
    std::vector<std::string> fields_;
};

class UnknownProtocolError final : public TransferError
{
  public:
    explicit UnknownProtocolError(std::string protocolName);

    [[nodiscard]] const std::string &protocolName() const noexcept { return protocolName_; }

  private:
    std::string protocolName_;
};

/// payload 자체를 해석할 수 없음 (예: identity 응답이 JSON 객체가 아님)
class MalformedPayloadError final : public TransferError
{
  public:
    explicit MalformedPayloadError(const std::string &detail);
};

class TransferTimeoutError final : public TransferError
{
  public:
    explicit TransferTimeoutError(std::chrono::milliseconds idleFor);

    [[nodiscard]] std::chrono::milliseconds idleFor() const noexcept { return idleFor_; }

  private:
    std::chrono::milliseconds idleFor_;
};

class TransferCancelledError final : public TransferError
{
  public:
    TransferCancelledError();
};

/// content-size 만큼 받기 전에 상대가 연결을 닫음
class TransferIncompleteError final : public TransferError
{
  public:
    TransferIncompleteError(std::uint64_t received, std::uint64_t expected);

    [[nodiscard]] std::uint64_t received() const noexcept { return received_; }
    [[nodiscard]] std::uint64_t expected() const noexcept { return expected_; }

  private:
    std::uint64_t received_;
    std::uint64_t expected_;
};

/// 소켓/파일 I/O 실패. errorCode()는 errno (알 수 없으면 0)
class TransferIoError final : public TransferError
{
  public:
    TransferIoError(std::string operation, int errorCode);
    TransferIoError(std::string operation, const std::string &detail);

    [[nodiscard]] const std::string &operation() const noexcept { return operation_; }
    [[nodiscard]] int errorCode() const noexcept { return errorCode_; }

  private:
    std::string operation_;
    int errorCode_{0};
};

} // namespace hostlink::protocol

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace hostlink::protocol
{

// =============================================================================
// Wire frame
//   [u16 BE header_len][header_len bytes: JSON object][content-size bytes: payload]
//   - 연결당 프레임 1개. 버전 협상/keep-alive 없음.
// =============================================================================

using Header = nlohmann::json;
using Bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t kLengthPrefixSize = 2;
inline constexpr std::size_t kMaxHeaderLength = 0xFFFF;
inline constexpr std::string_view kDefaultContentEncoding = "utf-8";

namespace header_keys
{
inline constexpr const char *kByteOrder = "byteorder";
inline constexpr const char *kContentEncoding = "content-encoding";
inline constexpr const char *kContentProtocol = "content-protocol";
inline constexpr const char *kContentSize = "content-size";
inline constexpr const char *kFileName = "file-name";
inline constexpr const char *kFileSize = "file-size";
} // namespace header_keys

/// 송신 측 네이티브 바이트 오더 ("little" / "big"). 수신 측에서는 참고용입니다.
[[nodiscard]] std::string_view nativeByteOrder() noexcept;

/// "utf-8" / "utf8" (대소문자 무시)만 지원합니다.
[[nodiscard]] bool isSupportedEncoding(std::string_view encoding) noexcept;

/// byteorder / content-encoding(없을 때만 기본값)을 채운 뒤
/// [u16 BE 길이][JSON] 바이트를 만듭니다.
///
/// @throws EncodingError 객체가 아님, 잘못된 UTF-8 문자열, 미지원 인코딩, 65535 바이트 초과
[[nodiscard]] Bytes encodeHeader(Header header);

/// 헤더 JSON 바이트(길이 prefix 제외)를 객체로 되돌립니다.
///
/// - 필수 필드 검사는 하지 않습니다. (requireHeaderFields 참고)
/// @throws MalformedHeaderError JSON이 아니거나 객체가 아님
/// @throws EncodingError encoding이 지원되지 않음
[[nodiscard]] Header decodeHeader(std::span<const std::uint8_t> bytes,
                                  std::string_view encoding = kDefaultContentEncoding);

/// 빠진 필수 필드 이름 목록 (순서: byteorder, content-encoding, content-protocol, content-size)
[[nodiscard]] std::vector<std::string> missingHeaderFields(const Header &header);

/// 필수 필드가 모두 있고 타입이 맞는지 검사합니다.
///
/// @throws MissingHeaderFieldError 하나 이상 빠짐
/// @throws MalformedHeaderError content-size가 음이 아닌 정수가 아님 / content-protocol이 문자열이 아님
void requireHeaderFields(const Header &header);

// requireHeaderFields 통과 후에만 호출
[[nodiscard]] std::uint64_t contentSize(const Header &header);
[[nodiscard]] std::string contentProtocol(const Header &header);

} // namespace hostlink::protocol

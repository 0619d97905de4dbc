#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace hostlink::protocol
{

/// HostIdentity payload로 오가는 호스트 정보 (모두 참고용)
///
/// JSON 키: computer-name, user-name, os-name, os-platform(선택), os-release(선택)
/// 그 밖의 키는 extras에 그대로 보관한다. (다른 플랫폼 peer가 보낸 windows-build 등)
struct HostIdentity
{
    std::string computerName;
    std::string userName;
    std::string osName;
    std::optional<std::string> osPlatform;
    std::optional<std::string> osRelease;
    nlohmann::json extras = nlohmann::json::object();

    bool operator==(const HostIdentity &) const = default;

    [[nodiscard]] nlohmann::json toJson() const;

    /// @throws MalformedPayloadError 객체가 아니거나 문자열이어야 할 필드가 문자열이 아님
    [[nodiscard]] static HostIdentity fromJson(const nlohmann::json &j);
};

/// 현재 호스트 정보 (gethostname / USER, getpwuid / uname / WSL_DISTRO_NAME)
[[nodiscard]] HostIdentity systemIdentity();

} // namespace hostlink::protocol

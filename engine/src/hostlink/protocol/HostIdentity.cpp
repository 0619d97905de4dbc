#include <hostlink/protocol/HostIdentity.hpp>

#include <hostlink/protocol/Errors.hpp>

#include <cstdlib>
#include <string_view>

#include <limits.h>
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace hostlink::protocol
{

namespace
{
constexpr const char *kComputerName = "computer-name";
constexpr const char *kUserName = "user-name";
constexpr const char *kOsName = "os-name";
constexpr const char *kOsPlatform = "os-platform";
constexpr const char *kOsRelease = "os-release";

std::string requireString(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end())
    {
        return {};
    }
    if (!it->is_string())
    {
        throw MalformedPayloadError(std::string("identity field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (!it->is_string())
    {
        throw MalformedPayloadError(std::string("identity field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

bool isKnownKey(std::string_view key) noexcept
{
    return key == kComputerName || key == kUserName || key == kOsName || key == kOsPlatform ||
           key == kOsRelease;
}

std::string currentUserName()
{
    if (const char *user = std::getenv("USER"); user != nullptr && *user != '\0')
    {
        return user;
    }

    // getpwuid는 재진입 불가라 getpwuid_r을 쓴다.
    ::passwd pw{};
    ::passwd *result = nullptr;
    char buf[1024];
    if (::getpwuid_r(::getuid(), &pw, buf, sizeof(buf), &result) == 0 && result != nullptr &&
        result->pw_name != nullptr)
    {
        return result->pw_name;
    }
    return {};
}
} // namespace

nlohmann::json HostIdentity::toJson() const
{
    nlohmann::json j = extras.is_object() ? extras : nlohmann::json::object();
    j[kComputerName] = computerName;
    j[kUserName] = userName;
    j[kOsName] = osName;
    if (osPlatform)
    {
        j[kOsPlatform] = *osPlatform;
    }
    if (osRelease)
    {
        j[kOsRelease] = *osRelease;
    }
    return j;
}

HostIdentity HostIdentity::fromJson(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw MalformedPayloadError("identity payload is not a JSON object");
    }

    HostIdentity id;
    id.computerName = requireString(j, kComputerName);
    id.userName = requireString(j, kUserName);
    id.osName = requireString(j, kOsName);
    id.osPlatform = optionalString(j, kOsPlatform);
    id.osRelease = optionalString(j, kOsRelease);

    for (auto it = j.begin(); it != j.end(); ++it)
    {
        if (!isKnownKey(it.key()))
        {
            id.extras[it.key()] = it.value();
        }
    }
    return id;
}

HostIdentity systemIdentity()
{
    HostIdentity id;

    char host[HOST_NAME_MAX + 1] = {};
    if (::gethostname(host, sizeof(host) - 1) == 0)
    {
        id.computerName = host;
    }

    id.userName = currentUserName();

    if (const char *distro = std::getenv("WSL_DISTRO_NAME"); distro != nullptr && *distro != '\0')
    {
        id.osName = distro;
    }
    else
    {
        id.osName = "Linux";
    }
    id.osPlatform = "linux";

    ::utsname uts{};
    if (::uname(&uts) == 0)
    {
        id.osRelease = uts.release;
    }

    return id;
}

} // namespace hostlink::protocol

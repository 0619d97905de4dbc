#include <hostlink/protocol/FrameCodec.hpp>

#include <hostlink/protocol/Endian.hpp>
#include <hostlink/protocol/Errors.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <cctype>
#include <format>

namespace hostlink::protocol
{

namespace
{
constexpr std::array<const char *, 4> kRequiredFields = {
    header_keys::kByteOrder,
    header_keys::kContentEncoding,
    header_keys::kContentProtocol,
    header_keys::kContentSize,
};
} // namespace

std::string_view nativeByteOrder() noexcept
{
    if constexpr (std::endian::native == std::endian::big)
        return "big";
    else
        return "little";
}

bool isSupportedEncoding(std::string_view encoding) noexcept
{
    std::string lowered;
    lowered.reserve(encoding.size());
    for (char c : encoding)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return lowered == "utf-8" || lowered == "utf8";
}

Bytes encodeHeader(Header header)
{
    if (!header.is_object())
    {
        throw EncodingError("header must be a JSON object");
    }

    header[header_keys::kByteOrder] = std::string(nativeByteOrder());
    if (!header.contains(header_keys::kContentEncoding))
    {
        header[header_keys::kContentEncoding] = std::string(kDefaultContentEncoding);
    }

    const auto &enc = header[header_keys::kContentEncoding];
    if (!enc.is_string() || !isSupportedEncoding(enc.get_ref<const std::string &>()))
    {
        throw EncodingError(std::format("unsupported content-encoding {}", enc.dump()));
    }

    std::string json;
    try
    {
        // ensure_ascii=false: 비 ASCII 파일명을 그대로 UTF-8로 싣는다.
        json = header.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    }
    catch (const nlohmann::json::type_error &e)
    {
        throw EncodingError(e.what());
    }

    if (json.size() > kMaxHeaderLength)
    {
        throw EncodingError(
            std::format("header is {} bytes (max {})", json.size(), kMaxHeaderLength));
    }

    Bytes out(kLengthPrefixSize + json.size());
    storeU16Be(static_cast<std::uint16_t>(json.size()), out.data());
    std::copy(json.begin(), json.end(), out.begin() + kLengthPrefixSize);
    return out;
}

Header decodeHeader(std::span<const std::uint8_t> bytes, std::string_view encoding)
{
    if (!isSupportedEncoding(encoding))
    {
        throw EncodingError(std::format("unsupported content-encoding '{}'", encoding));
    }

    Header header;
    try
    {
        const std::string_view text(reinterpret_cast<const char *>(bytes.data()), bytes.size());
        header = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw MalformedHeaderError(e.what());
    }

    if (!header.is_object())
    {
        throw MalformedHeaderError(std::format("expected a JSON object, got {}", header.type_name()));
    }
    return header;
}

std::vector<std::string> missingHeaderFields(const Header &header)
{
    std::vector<std::string> missing;
    for (const char *key : kRequiredFields)
    {
        if (!header.is_object() || !header.contains(key))
        {
            missing.emplace_back(key);
        }
    }
    return missing;
}

void requireHeaderFields(const Header &header)
{
    auto missing = missingHeaderFields(header);
    if (!missing.empty())
    {
        throw MissingHeaderFieldError(std::move(missing));
    }

    const auto &size = header[header_keys::kContentSize];
    if (!size.is_number_unsigned() && !(size.is_number_integer() && size.get<std::int64_t>() >= 0))
    {
        throw MalformedHeaderError(
            std::format("content-size must be a non-negative integer, got {}", size.dump()));
    }

    if (!header[header_keys::kContentProtocol].is_string())
    {
        throw MalformedHeaderError("content-protocol must be a string");
    }
}

std::uint64_t contentSize(const Header &header)
{
    return header.at(header_keys::kContentSize).get<std::uint64_t>();
}

std::string contentProtocol(const Header &header)
{
    return header.at(header_keys::kContentProtocol).get<std::string>();
}

} // namespace hostlink::protocol

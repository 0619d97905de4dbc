#pragma once

#include <cstdint>

namespace hostlink::protocol
{

// 프레임 길이 prefix는 항상 big-endian (네트워크 바이트 오더)
inline void storeU16Be(std::uint16_t v, std::uint8_t out[2]) noexcept
{
    out[0] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    out[1] = static_cast<std::uint8_t>((v >> 0) & 0xFF);
}

inline std::uint16_t loadU16Be(const std::uint8_t *p) noexcept
{
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) |
                                      (static_cast<std::uint16_t>(p[1]) << 0));
}

} // namespace hostlink::protocol

#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace hostlink::core::defaults
{

// ===== Loop timer / epoll =====
inline constexpr std::uint32_t kTickResolutionMs = 10;
inline constexpr std::size_t kTimerSlots = 1024;
inline constexpr int kMaxEpollEvents = 64;

// ===== Listener =====
inline constexpr std::string_view kListenAddress = "0.0.0.0";
inline constexpr std::uint16_t kListenPort = 65432;
inline constexpr int kListenBacklog = 128;

// ===== Connection =====
inline constexpr std::uint32_t kIdleTimeoutMs = 30'000;
inline constexpr std::size_t kRecvChunkSize = 4096; // recv(2) 1회 버퍼

// ===== Transfer =====
inline constexpr std::size_t kFileChunkSize = 4096;
inline constexpr std::string_view kReceiveDir = ".";

} // namespace hostlink::core::defaults

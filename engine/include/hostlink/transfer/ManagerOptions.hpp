#pragma once

#include <hostlink/EngineConfig.hpp>
#include <hostlink/core/Defaults.hpp>

#include <chrono>
#include <cstddef>

namespace hostlink::transfer
{

/// ConnectionManager(Server/Client) 한 개의 루프/연결 튜닝 값
struct ManagerOptions
{
    std::chrono::milliseconds tickResolution{core::defaults::kTickResolutionMs};
    std::size_t timerSlots = core::defaults::kTimerSlots;
    int maxEpollEvents = core::defaults::kMaxEpollEvents;

    /// 0이면 idle deadline 없음
    std::chrono::milliseconds idleTimeout{core::defaults::kIdleTimeoutMs};

    int listenBacklog = core::defaults::kListenBacklog;
    std::size_t recvChunkSize = core::defaults::kRecvChunkSize;

    [[nodiscard]] static ManagerOptions fromConfig(const EngineConfig &config) noexcept
    {
        ManagerOptions o;
        o.tickResolution = std::chrono::milliseconds(effectiveTickResolutionMs(config));
        o.timerSlots = effectiveTimerSlots(config);
        o.maxEpollEvents = effectiveMaxEpollEvents(config);
        o.idleTimeout = std::chrono::milliseconds(config.idleTimeoutMs);
        o.listenBacklog = effectiveListenBacklog(config);
        return o;
    }
};

} // namespace hostlink::transfer

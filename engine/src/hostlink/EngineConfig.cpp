#include <hostlink/EngineConfig.hpp>

#include <limits>
#include <stdexcept>
#include <string>

namespace hostlink
{

namespace
{
[[noreturn]] void throwConfigError(const char *section, const std::string &detail)
{
    auto msg = std::string("[") + section + "] " + detail;
    SLOG_ERROR("Config", "ValidationError", "msg='{}'", msg);
    throw std::invalid_argument{msg};
}
} // namespace

void validateEngineConfig(const EngineConfig &config)
{
    if (config.listenAddress.empty())
    {
        throwConfigError("engine", "listen_address must not be empty");
    }

    if (config.listenBacklog > static_cast<std::uint32_t>(std::numeric_limits<int>::max()))
    {
        throwConfigError("engine", "listen_backlog is too large");
    }

    if (config.maxEpollEvents > 4096)
    {
        throwConfigError("engine", "max_epoll_events must be <= 4096");
    }

    // idle deadline이 tick보다 짧으면 사실상 tick 한 번에 끊긴다.
    const auto tickMs = effectiveTickResolutionMs(config);
    if (config.idleTimeoutMs != 0 && config.idleTimeoutMs < tickMs)
    {
        throwConfigError("engine", "idle_timeout_ms must be 0 or >= tick_resolution_ms (" +
                                       std::to_string(tickMs) + ")");
    }
}

void validateTransferConfig(const TransferConfig &config)
{
    if (config.receiveDir.empty())
    {
        throwConfigError("transfer", "receive_dir must not be empty");
    }
    if (config.chunkSize == 0)
    {
        throwConfigError("transfer", "chunk_size must be > 0");
    }
}

std::uint32_t effectiveTickResolutionMs(const EngineConfig &config) noexcept
{
    return config.tickResolutionMs != 0 ? config.tickResolutionMs
                                        : core::defaults::kTickResolutionMs;
}

std::size_t effectiveTimerSlots(const EngineConfig &config) noexcept
{
    return config.timerSlots != 0 ? config.timerSlots : core::defaults::kTimerSlots;
}

int effectiveMaxEpollEvents(const EngineConfig &config) noexcept
{
    return config.maxEpollEvents != 0 ? static_cast<int>(config.maxEpollEvents)
                                      : core::defaults::kMaxEpollEvents;
}

int effectiveListenBacklog(const EngineConfig &config) noexcept
{
    return config.listenBacklog != 0 ? static_cast<int>(config.listenBacklog)
                                     : core::defaults::kListenBacklog;
}

} // namespace hostlink

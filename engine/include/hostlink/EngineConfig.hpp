#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <hostlink/core/Defaults.hpp>
#include <hostlink/core/Logger.hpp>

namespace hostlink
{

/// 루프/리스너/로깅 설정입니다. TOML [engine] 섹션에 대응합니다.
struct EngineConfig
{
    /// 리스닝 소켓을 바인딩할 IPv4 주소 (예: "0.0.0.0")
    std::string listenAddress{core::defaults::kListenAddress};

    /// 0이면 ephemeral 포트를 받는다.
    std::uint16_t listenPort = core::defaults::kListenPort;

    /// listen(2) backlog. 0이면 defaults::kListenBacklog.
    std::uint32_t listenBacklog = 0;

    /// 비어 있으면 std::clog로 출력합니다.
    std::string logFilePath;

    core::LogLevel logLevel = core::LogLevel::Info;

    /// 연결별 idle deadline(ms). 0이면 비활성화합니다.
    std::uint32_t idleTimeoutMs = core::defaults::kIdleTimeoutMs;

    // ===== Advanced tuning (0이면 기본값 사용) =====

    /// 루프 타이머 tick 해상도(ms)
    std::uint32_t tickResolutionMs = 0;

    /// 타이머 슬롯 수(휠 크기)
    std::size_t timerSlots = 0;

    /// epoll_wait 1회당 최대 이벤트 수
    std::uint32_t maxEpollEvents = 0;
};

/// 파일 전송 수신 측 설정입니다. TOML [transfer] 섹션에 대응합니다.
struct TransferConfig
{
    /// 수신한 파일을 쓰는 디렉터리
    std::string receiveDir{core::defaults::kReceiveDir};

    /// 송신 시 read() 1회가 돌려주는 최대 바이트 수
    std::size_t chunkSize = core::defaults::kFileChunkSize;
};

/// 잘못된 값이면 std::invalid_argument를 던집니다.
void validateEngineConfig(const EngineConfig &config);
void validateTransferConfig(const TransferConfig &config);

[[nodiscard]] std::uint32_t effectiveTickResolutionMs(const EngineConfig &config) noexcept;
[[nodiscard]] std::size_t effectiveTimerSlots(const EngineConfig &config) noexcept;
[[nodiscard]] int effectiveMaxEpollEvents(const EngineConfig &config) noexcept;
[[nodiscard]] int effectiveListenBacklog(const EngineConfig &config) noexcept;

} // namespace hostlink

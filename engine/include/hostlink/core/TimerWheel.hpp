#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

#include <hostlink/util/NonCopyable.hpp>

namespace hostlink::core {

/// coarse-grained one-shot 타이머 휠입니다.
///
/// - 단일 스레드 전용입니다. (EventLoop owner thread가 tick()을 호출)
/// - delay는 tick 단위로 올림(ceil)되어 스케줄됩니다.
///   실제 실행 시점은 (delay) ~ (delay + tickResolution) 사이입니다.
/// - 연결 idle deadline처럼 "대부분 취소되는" 타이머를 위해 cancelTimer()를 제공합니다.
class TimerWheel : private hostlink::util::NonCopyable {
  public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;

    /// 유효하지 않은 TimerId. addTimer()는 절대 0을 반환하지 않습니다.
    static constexpr TimerId kInvalidTimerId = 0;

    /// @param tickResolution 0보다 커야 합니다.
    /// @param slotCount 0이면 std::invalid_argument.
    explicit TimerWheel(Duration tickResolution, std::size_t slotCount);

    ~TimerWheel() = default;

    [[nodiscard]] Duration tickResolution() const noexcept { return tickResolution_; }
    [[nodiscard]] std::size_t slotCount() const noexcept { return slotCount_; }
    [[nodiscard]] std::uint64_t currentTick() const noexcept { return currentTick_; }

    /// 아직 실행/취소되지 않은 타이머 개수
    [[nodiscard]] std::size_t pendingTimers() const noexcept { return slotOf_.size(); }

    /// delay 이후 한 번 실행될 타이머를 등록합니다. (최소 1 tick 뒤)
    ///
    /// - 콜백은 tick()을 호출한 스레드에서 실행됩니다.
    /// - 콜백 안에서 addTimer()/cancelTimer()를 호출해도 됩니다.
    TimerId addTimer(Duration delay, Callback callback);

    /// 예약된 타이머를 취소합니다.
    ///
    /// @return 취소했으면 true. 이미 실행됐거나 존재하지 않는 id면 false.
    bool cancelTimer(TimerId id) noexcept;

    /// 논리 tick 하나를 진행하고 만료된 타이머를 실행합니다. (테스트용)
    void tick();

    /// 마지막 tick 이후 경과한 실제 시간만큼 tick을 몰아서 진행합니다.
    void tick(Clock::time_point now);

  private:
    struct Timer {
        TimerId id{};
        std::uint64_t expirationTick{};
        Callback callback;
    };

    Duration tickResolution_;
    std::size_t slotCount_{0};
    std::vector<std::vector<Timer>> slots_;

    // id -> 슬롯 인덱스. 재배치 시에도 (expirationTick % slotCount)라서 슬롯은 바뀌지 않는다.
    std::unordered_map<TimerId, std::size_t> slotOf_;

    Clock::time_point lastTickTime_{};
    std::uint64_t currentTick_{0};
    TimerId nextId_{1};

    // 콜백 실행 중 같은 슬롯에 addTimer()가 들어와도 순회가 깨지지 않게 분리해 둔 버퍼
    std::vector<Timer> scratch_;

    [[nodiscard]] std::uint64_t durationToTicks(Duration delay) const noexcept;
    [[nodiscard]] TimerId nextTimerId() noexcept;
    void processCurrentTick();
};

} // namespace hostlink::core

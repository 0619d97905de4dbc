#include <hostlink/core/TimerWheel.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <vector>

using hostlink::core::TimerWheel;

namespace {

/// 25ms 타이머는 10ms tick 기준 3번째 tick 에서 정확히 한 번 실행되어야 한다.
bool test_fires_once_at_ceiled_tick() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);

    int fired = 0;
    const auto id = wheel.addTimer(25ms, [&]() { ++fired; });
    if (id == TimerWheel::kInvalidTimerId) {
        std::cerr << "[once] addTimer returned invalid id\n";
        return false;
    }

    wheel.tick();
    wheel.tick();
    if (fired != 0) {
        std::cerr << "[once] fired too early\n";
        return false;
    }

    wheel.tick();
    wheel.tick();
    if (fired != 1) {
        std::cerr << "[once] fired=" << fired << " expected 1\n";
        return false;
    }

    if (wheel.pendingTimers() != 0) {
        std::cerr << "[once] pendingTimers=" << wheel.pendingTimers() << " expected 0\n";
        return false;
    }
    return true;
}

/// 취소된 타이머는 실행되지 않고, 같은 슬롯의 다른 타이머는 영향이 없어야 한다.
bool test_cancel_skips_only_cancelled() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 4);

    int firedA = 0;
    int firedB = 0;
    const auto a = wheel.addTimer(20ms, [&]() { ++firedA; });
    (void)wheel.addTimer(20ms, [&]() { ++firedB; });

    if (!wheel.cancelTimer(a)) {
        std::cerr << "[cancel] cancelTimer returned false for pending timer\n";
        return false;
    }
    if (wheel.cancelTimer(a)) {
        std::cerr << "[cancel] second cancel should return false\n";
        return false;
    }
    if (wheel.pendingTimers() != 1) {
        std::cerr << "[cancel] pendingTimers=" << wheel.pendingTimers() << " expected 1\n";
        return false;
    }

    for (int i = 0; i < 4; ++i) {
        wheel.tick();
    }

    if (firedA != 0 || firedB != 1) {
        std::cerr << "[cancel] firedA=" << firedA << " firedB=" << firedB << "\n";
        return false;
    }

    // 실행이 끝난 id 취소는 false
    if (wheel.cancelTimer(TimerWheel::kInvalidTimerId)) {
        std::cerr << "[cancel] invalid id cancel should return false\n";
        return false;
    }
    return true;
}

/// 슬롯 수보다 긴 delay 도 wrap-around 뒤 제 tick 에서 실행되어야 한다.
bool test_wrap_around_long_delay() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 4);

    std::uint64_t tickNo = 0;
    std::uint64_t firedAt = 0;
    (void)wheel.addTimer(90ms, [&]() { firedAt = tickNo; });

    for (int i = 0; i < 12; ++i) {
        ++tickNo;
        wheel.tick();
    }

    if (firedAt != 9) {
        std::cerr << "[wrap] fired at tick " << firedAt << " expected 9\n";
        return false;
    }
    return true;
}

/// idle deadline 재예약처럼 콜백 안에서 다시 addTimer 해도 안전해야 한다.
bool test_rearm_from_callback() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);

    std::vector<std::uint64_t> firedTicks;
    std::uint64_t tickNo = 0;
    int remaining = 3;

    std::function<void()> rearm;
    rearm = [&]() {
        firedTicks.push_back(tickNo);
        if (--remaining > 0) {
            (void)wheel.addTimer(10ms, rearm);
        }
    };
    (void)wheel.addTimer(10ms, rearm);

    for (int i = 0; i < 6; ++i) {
        ++tickNo;
        wheel.tick();
    }

    if (firedTicks != std::vector<std::uint64_t>{1, 2, 3}) {
        std::cerr << "[rearm] unexpected fire ticks (count=" << firedTicks.size() << ")\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_fires_once_at_ceiled_tick();
    ok = ok && test_cancel_skips_only_cancelled();
    ok = ok && test_wrap_around_long_delay();
    ok = ok && test_rearm_from_callback();

    if (!ok) {
        std::cerr << "TimerWheel tests FAILED\n";
        return 1;
    }

    std::cout << "TimerWheel tests PASSED\n";
    return 0;
}

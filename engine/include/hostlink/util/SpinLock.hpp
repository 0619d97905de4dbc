#pragma once

#include <atomic>
#include <thread>

namespace hostlink::util {

/// 아주 짧은 크리티컬 섹션(큐 push/pop 등)용 스핀락입니다.
///
/// - 잠금 구간 안에서는 I/O, syscall, 긴 연산을 하지 않습니다.
class SpinLock {
  public:
    SpinLock() noexcept = default;

    SpinLock(const SpinLock &) = delete;
    SpinLock &operator=(const SpinLock &) = delete;

    void lock() noexcept {
        while (flag_.test_and_set(std::memory_order_acquire)) {
            std::this_thread::yield();
        }
    }

    bool try_lock() noexcept { return !flag_.test_and_set(std::memory_order_acquire); }

    void unlock() noexcept { flag_.clear(std::memory_order_release); }

  private:
    std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

/// 생성 시 lock(), 소멸 시 unlock().
class SpinLockGuard {
  public:
    explicit SpinLockGuard(SpinLock &lock) noexcept : lock_(lock) { lock_.lock(); }
    ~SpinLockGuard() { lock_.unlock(); }

    SpinLockGuard(const SpinLockGuard &) = delete;
    SpinLockGuard &operator=(const SpinLockGuard &) = delete;

  private:
    SpinLock &lock_;
};

} // namespace hostlink::util

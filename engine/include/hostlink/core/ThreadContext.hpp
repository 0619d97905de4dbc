#pragma once

#include <array>
#include <cstdio>
#include <string_view>

#if defined(__linux__)
#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>      // syscall
#endif

namespace hostlink::core
{

/// 스레드별 로그 태그/tid 캐시입니다.
///
/// - 루프 스레드는 시작 시 setCurrentThreadTag("srv0") 처럼 한 번 태그를 찍는다.
/// - 태그를 지정하지 않은 스레드는 "main"으로 표시된다.
class ThreadContext
{
  public:
    /// 역할 + 번호로 태그를 만든다. (예: role="srv", index=2 -> "srv2")
    static void setCurrentThreadTag(std::string_view role, unsigned index) noexcept
    {
        auto &buf = tagBuf_();
        std::snprintf(buf.data(), buf.size(), "%.*s%u", static_cast<int>(role.size()),
                      role.data(), index);
        (void)currentTid();
    }

    static void setCurrentThreadTag(std::string_view tag) noexcept
    {
        auto &buf = tagBuf_();
        std::snprintf(buf.data(), buf.size(), "%.*s", static_cast<int>(tag.size()), tag.data());
        (void)currentTid();
    }

    // syscall 매번 호출하지 않도록 thread_local 캐시
    [[nodiscard]] static long currentTid() noexcept { return cachedTid_(); }

    [[nodiscard]] static std::string_view currentThreadTag() noexcept
    {
        auto &buf = tagBuf_();
        if (buf[0] == '\0')
        {
            std::snprintf(buf.data(), buf.size(), "main");
        }
        return std::string_view{buf.data()};
    }

  private:
    static long computeTid_() noexcept
    {
#if defined(__linux__)
        return static_cast<long>(::syscall(SYS_gettid));
#else
        return 0;
#endif
    }

    static long &cachedTid_() noexcept
    {
        thread_local long tid = computeTid_();
        return tid;
    }

    static std::array<char, 16> &tagBuf_() noexcept
    {
        thread_local std::array<char, 16> buf{};
        return buf;
    }
};

[[nodiscard]] inline long tid() noexcept
{
    return ThreadContext::currentTid();
}
[[nodiscard]] inline std::string_view ttag() noexcept
{
    return ThreadContext::currentThreadTag();
}

} // namespace hostlink::core

#pragma once

#include <hostlink/util/NonCopyable.hpp>

#include <atomic>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace hostlink::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

/// "TRACE" ... "FATAL"
[[nodiscard]] const char *toString(LogLevel level) noexcept;

/// 대소문자 무시. "warning"도 Warn으로 받는다. 모르는 이름이면 std::invalid_argument.
[[nodiscard]] LogLevel parseLogLevel(std::string_view name);

namespace detail
{
// 포맷팅 전에 레벨을 거르기 위한 전역 atomic (Logger.cpp에서 정의)
std::atomic<int> &fastMinLevel();
} // namespace detail

inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

class ILogger : private hostlink::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    // message는 이미 "comp | evt | key=value..." 형태로 조립되어 들어온다.
    virtual void log(LogLevel level, std::string_view message) = 0;
};

/// 기본 비동기 Logger (ostream 기반)
///
/// - log() 호출 스레드는 큐에 넣기만 하고, 포맷/출력은 전용 스레드가 한다.
/// - 호출 시점의 시간/스레드 태그를 캡처하므로 출력 순서가 밀려도 타임스탬프는 정확하다.
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    // 잔여 로그를 모두 flush하고 워커 스레드를 join한다. (두 번 호출해도 안전)
    void stopAndJoin();
    void shutdown() noexcept override { stopAndJoin(); }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

// =============================================================================
// Structured Logging Frontend
//   최종 라인: "HH:MM:SS.uuuuuu | srv0 tid=123 | INFO  | comp | evt | k=v ..."
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return std::format("{} | {}", comp, evt);
    return std::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 std::format_string<Args...> fmt, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    std::string details = std::format(fmt, std::forward<Args>(args)...);
    getLogger().log(lvl, build(comp, evt, details));
}
} // namespace slog

#define SLOG_TRACE(comp, evt, ...)                                                                 \
    ::hostlink::core::slog::emit(::hostlink::core::LogLevel::Trace, (comp),                        \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_DEBUG(comp, evt, ...)                                                                 \
    ::hostlink::core::slog::emit(::hostlink::core::LogLevel::Debug, (comp),                        \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_INFO(comp, evt, ...)                                                                  \
    ::hostlink::core::slog::emit(::hostlink::core::LogLevel::Info, (comp),                         \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_WARN(comp, evt, ...)                                                                  \
    ::hostlink::core::slog::emit(::hostlink::core::LogLevel::Warn, (comp),                         \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_ERROR(comp, evt, ...)                                                                 \
    ::hostlink::core::slog::emit(::hostlink::core::LogLevel::Error, (comp),                        \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_FATAL(comp, evt, ...)                                                                 \
    ::hostlink::core::slog::emit(::hostlink::core::LogLevel::Fatal, (comp),                        \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)

} // namespace hostlink::core

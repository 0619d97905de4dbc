#include <hostlink/core/Logger.hpp>
#include <hostlink/core/ThreadContext.hpp>

#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <unistd.h> // isatty, fileno
#include <vector>

namespace hostlink::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

const char *toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

LogLevel parseLogLevel(std::string_view name)
{
    std::string v(name);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (v == "trace")
        return LogLevel::Trace;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "info")
        return LogLevel::Info;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    if (v == "fatal")
        return LogLevel::Fatal;

    throw std::invalid_argument("Invalid log_level: " + std::string(name));
}

namespace
{
struct LogEvent
{
    LogLevel level{};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string threadTag; // "main", "srv0", "xfer3" ...
    long threadId{};
};

// tty일 때 레벨 컬럼에만 색을 입힌다.
const char *levelColor(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "\x1b[90m";
    case LogLevel::Debug:
        return "\x1b[36m";
    case LogLevel::Info:
        return "\x1b[32m";
    case LogLevel::Warn:
        return "\x1b[33m";
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\x1b[31m";
    }
    return "";
}
} // namespace

class Logger::Impl
{
  public:
    explicit Impl(std::ostream &os) : os_(os)
    {
        if (&os == &std::cout || &os == &std::clog || &os == &std::cerr)
        {
            useColor_ = (::isatty(::fileno(stderr)) != 0);
        }
        worker_ = std::thread([this]() { processQueue(); });
    }

    ~Impl() { stop(); }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void log(LogLevel level, std::string_view msg)
    {
        auto now = std::chrono::system_clock::now();
        std::string tag(hostlink::core::ttag());
        long tid = hostlink::core::tid();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_)
                return; // 종료 이후 로그는 버린다
            queue_.push(LogEvent{level, std::string(msg), now, std::move(tag), tid});
        }
        cv_.notify_one();
    }

    void setMinLevel(LogLevel level) noexcept
    {
        minLevel_.store(level, std::memory_order_relaxed);
        detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel minLevel() const noexcept { return minLevel_.load(std::memory_order_relaxed); }

  private:
    void processQueue()
    {
        while (true)
        {
            std::vector<LogEvent> batch;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stop_ || !queue_.empty(); });

                if (stop_ && queue_.empty())
                    return;

                while (!queue_.empty())
                {
                    batch.push_back(std::move(queue_.front()));
                    queue_.pop();
                }
            }

            const LogLevel min = minLevel();
            for (const auto &ev : batch)
            {
                if (ev.level < min)
                    continue;
                writeLog(ev);
            }
            os_.flush();
        }
    }

    void writeLog(const LogEvent &ev)
    {
        using namespace std::chrono;

        const auto t = system_clock::to_time_t(ev.timestamp);
        std::tm tm{};
        localtime_r(&t, &tm);
        const auto us = duration_cast<microseconds>(ev.timestamp.time_since_epoch()) % seconds(1);

        const char *c1 = useColor_ ? levelColor(ev.level) : "";
        const char *c2 = useColor_ ? "\x1b[0m" : "";

        os_ << std::format("{:02d}:{:02d}:{:02d}.{:06d} | {} tid={} | {}{:<5}{} | {}\n",
                           tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(us.count()),
                           ev.threadTag, ev.threadId, c1, toString(ev.level), c2, ev.message);
    }

    std::ostream &os_;
    std::thread worker_;
    std::queue<LogEvent> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_{false};
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    bool useColor_{false};
};

Logger::Logger(std::ostream &os) : impl_(std::make_unique<Impl>(os)) {}
Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->log(level, message);
}

void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->setMinLevel(level);
}

LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}

void Logger::stopAndJoin()
{
    impl_->stop();
}

// ===== Global Instance Management =====

static std::shared_ptr<ILogger> &globalLoggerStorage()
{
    static std::shared_ptr<ILogger> logger = std::make_shared<Logger>();
    return logger;
}

ILogger &getLogger()
{
    auto &instance = globalLoggerStorage();
    if (!instance)
    {
        instance = std::make_shared<Logger>();
    }
    return *instance;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    const LogLevel lvl = logger ? logger->minLevel() : LogLevel::Info;
    auto previous = std::exchange(globalLoggerStorage(), std::move(logger));
    detail::fastMinLevel().store(static_cast<int>(lvl), std::memory_order_relaxed);

    // 교체된 로거의 잔여 로그는 여기서 흘려보낸다.
    if (previous)
    {
        previous->shutdown();
    }
}

void shutdownLogger() noexcept
{
    auto &instance = globalLoggerStorage();
    if (!instance)
        return;

    instance->shutdown();
    instance.reset();
}

} // namespace hostlink::core

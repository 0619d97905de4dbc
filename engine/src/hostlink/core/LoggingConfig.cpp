#include <hostlink/core/LoggingConfig.hpp>
#include <hostlink/core/Logger.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace hostlink::core
{
namespace
{

// 스트림 수명을 함께 소유하는 Logger 래퍼 (파일 출력용)
class OwningOstreamLogger final : public ILogger
{
  public:
    OwningOstreamLogger(std::shared_ptr<std::ostream> os, LogLevel lvl)
        : os_(std::move(os)), logger_(*os_)
    {
        logger_.setMinLevel(lvl);
    }

    void log(LogLevel level, std::string_view message) override { logger_.log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_.minLevel(); }
    void shutdown() noexcept override { logger_.stopAndJoin(); }

  private:
    std::shared_ptr<std::ostream> os_;
    Logger logger_;
};

} // namespace

void applyLoggingConfig(const hostlink::EngineConfig &cfg)
{
    if (cfg.logFilePath.empty())
    {
        auto os = std::shared_ptr<std::ostream>(&std::clog, [](std::ostream *) {});
        setLogger(std::make_shared<OwningOstreamLogger>(std::move(os), cfg.logLevel));
        return;
    }

    auto file = std::make_shared<std::ofstream>(cfg.logFilePath, std::ios::app);
    if (!file->is_open())
    {
        throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.logFilePath);
    }

    setLogger(std::make_shared<OwningOstreamLogger>(std::move(file), cfg.logLevel));
}

} // namespace hostlink::core

#include <zerowire/core/LoggingConfig.hpp>
#include <zerowire/core/Logger.hpp>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

namespace zerowire::core
{

void applyLoggingConfig(const zerowire::EngineConfig &cfg)
{
    std::shared_ptr<Logger> logger;
    if (cfg.logFilePath.empty())
    {
        logger = std::make_shared<Logger>(std::clog);
    }
    else
    {
        auto file = std::make_shared<std::ofstream>(cfg.logFilePath, std::ios::app);
        if (!file->is_open())
            throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.logFilePath);
        logger = std::make_shared<Logger>(std::shared_ptr<std::ostream>(std::move(file)));
    }
    logger->setMinLevel(cfg.logLevel);

    // 이전 전역 Logger 는 남은 레코드를 비우고 교체
    shutdownLogger();
    setLogger(logger);

    SLOG_DEBUG("LoggingConfig", "Applied", "level={} file={}", toString(cfg.logLevel),
               cfg.logFilePath.empty() ? std::string("<clog>") : cfg.logFilePath);
}

} // namespace zerowire::core

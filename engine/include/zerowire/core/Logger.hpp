#pragma once

#include <zerowire/util/NonCopyable.hpp>

#include <atomic>
#include <cstddef>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zerowire::core
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

[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

/// 현재 스레드의 로그 태그 (최대 15자, 기본 "main")
void setThreadTag(std::string_view tag) noexcept;
[[nodiscard]] std::string_view threadTag() noexcept;

namespace detail
{
// 전역 Logger 의 최소 레벨 사본. 포맷 전에 걸러내기 위해 쓴다.
std::atomic<int> &gateLevel() noexcept;
} // namespace detail

[[nodiscard]] inline bool logEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::gateLevel().load(std::memory_order_relaxed);
}

/// 로그 싱크 인터페이스. record 는 "comp | evt | k=v ..." 까지 조립된 상태로 들어온다.
class ILogger : private zerowire::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    virtual void log(LogLevel level, std::string_view record) = 0;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}
};

/**
 * ostream 으로 내보내는 비동기 Logger.
 *
 * - 호출 스레드는 시각/태그/tid 를 잡아 큐에 넣기만 한다.
 * - 백그라운드 스레드 1개가 배치로 꺼내 "HH:MM:SS.uuuuuu | tag tid=N | LEVEL | record" 로 쓴다.
 * - shared_ptr 로 받은 스트림은 writer 스레드가 join 된 뒤에 놓는다.
 */
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog);
    explicit Logger(std::shared_ptr<std::ostream> owned);
    ~Logger() override;

    void log(LogLevel level, std::string_view record) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    // 큐를 비우고 writer 스레드를 join
    void shutdown() noexcept override;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// 동기식으로 record 를 모아 두는 Logger. 거부 경로가 로그를 남기는지 테스트에서 확인한다.
class CaptureLogger final : public ILogger
{
  public:
    explicit CaptureLogger(LogLevel min = LogLevel::Trace) noexcept : min_(min) {}

    void log(LogLevel level, std::string_view record) override
    {
        if (level < min_)
            return;
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::string(toString(level)) + " | " + std::string(record));
    }

    [[nodiscard]] LogLevel minLevel() const noexcept override { return min_; }

    [[nodiscard]] std::vector<std::string> records() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] std::size_t count(std::string_view needle) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto &r : records_)
            n += r.find(needle) != std::string::npos ? 1 : 0;
        return n;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

  private:
    LogLevel min_;
    mutable std::mutex mutex_;
    std::vector<std::string> records_;
};

ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

// -----------------------------------------------------------------------------
// Structured logging: SLOG_xxx(comp, evt [, fmt, args...])
//   record = "comp | evt" 또는 "comp | evt | <fmt 결과>"
//   cold path 전용 (설정, framer 거부, CLI). 코덱 본체는 로그를 남기지 않는다.
// -----------------------------------------------------------------------------
namespace slog
{
inline void emit(LogLevel level, std::string_view comp, std::string_view evt)
{
    if (!logEnabled(level))
        return;
    getLogger().log(level, std::format("{} | {}", comp, evt));
}

template <typename... Args>
void emit(LogLevel level, std::string_view comp, std::string_view evt,
          std::format_string<Args...> fmt, Args &&...args)
{
    if (!logEnabled(level))
        return;
    std::string record = std::format("{} | {} | ", comp, evt);
    std::format_to(std::back_inserter(record), fmt, std::forward<Args>(args)...);
    getLogger().log(level, record);
}
} // namespace slog

#define ZW_SLOG(level, comp, evt, ...)                                                             \
    ::zerowire::core::slog::emit(::zerowire::core::LogLevel::level, (comp),                        \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)

#define SLOG_TRACE(comp, evt, ...) ZW_SLOG(Trace, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_DEBUG(comp, evt, ...) ZW_SLOG(Debug, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_INFO(comp, evt, ...) ZW_SLOG(Info, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_WARN(comp, evt, ...) ZW_SLOG(Warn, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_ERROR(comp, evt, ...) ZW_SLOG(Error, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_FATAL(comp, evt, ...) ZW_SLOG(Fatal, comp, evt __VA_OPT__(, ) __VA_ARGS__)

} // namespace zerowire::core

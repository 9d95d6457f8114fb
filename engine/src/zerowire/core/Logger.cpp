#include <zerowire/core/Logger.hpp>

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <deque>
#include <format>
#include <iostream>
#include <mutex>
#include <thread>
#include <unistd.h> // isatty, fileno

#if defined(__linux__)
#include <sys/syscall.h> // SYS_gettid
#endif

namespace zerowire::core
{

namespace detail
{
std::atomic<int> &gateLevel() noexcept
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

namespace
{

constexpr std::array<std::string_view, 6> kLevelNames{"TRACE", "DEBUG", "INFO",
                                                      "WARN",  "ERROR", "FATAL"};

// TRACE..FATAL: gray, cyan, green, yellow, red, red
constexpr std::array<std::string_view, 6> kLevelColors{"\x1b[90m", "\x1b[36m", "\x1b[32m",
                                                       "\x1b[33m", "\x1b[31m", "\x1b[31m"};
constexpr std::string_view kColorReset = "\x1b[0m";

// ---- 스레드 메타데이터 (thread_local) ----

std::array<char, 16> &tagStorage() noexcept
{
    thread_local std::array<char, 16> tag{'m', 'a', 'i', 'n', '\0'};
    return tag;
}

long currentTid() noexcept
{
#if defined(__linux__)
    thread_local const long tid = static_cast<long>(::syscall(SYS_gettid));
    return tid;
#else
    return 0;
#endif
}

struct Entry
{
    LogLevel level{};
    std::chrono::system_clock::time_point at;
    std::string tag;
    long tid{};
    std::string record;
};

bool isStdStream(const std::ostream &os) noexcept
{
    return &os == &std::cout || &os == &std::clog || &os == &std::cerr;
}

} // namespace

std::string_view toString(LogLevel level) noexcept
{
    const auto i = static_cast<std::size_t>(level);
    return i < kLevelNames.size() ? kLevelNames[i] : "INFO";
}

void setThreadTag(std::string_view tag) noexcept
{
    auto &buf = tagStorage();
    const std::size_t n = tag.size() < buf.size() - 1 ? tag.size() : buf.size() - 1;
    tag.copy(buf.data(), n);
    buf[n] = '\0';
}

std::string_view threadTag() noexcept
{
    return std::string_view{tagStorage().data()};
}

class Logger::Impl : private zerowire::util::Pinned
{
  public:
    Impl(std::ostream &os, std::shared_ptr<std::ostream> owned)
        : owned_(std::move(owned)), os_(os),
          color_(isStdStream(os) && ::isatty(::fileno(stderr)) != 0)
    {
        writer_ = std::thread([this] { drainLoop(); });
    }

    ~Impl() { stop(); }

    void push(LogLevel level, std::string_view record)
    {
        Entry e{level, std::chrono::system_clock::now(), std::string(threadTag()), currentTid(),
                std::string(record)};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back(std::move(e));
        }
        cv_.notify_one();
    }

    void stop() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (writer_.joinable())
            writer_.join();
    }

    std::atomic<LogLevel> minLevel{LogLevel::Info};

  private:
    void drainLoop()
    {
        std::deque<Entry> batch;
        for (;;)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
                if (pending_.empty())
                    return; // stopping_ 이고 남은 게 없음
                batch.swap(pending_);
            }

            const LogLevel min = minLevel.load(std::memory_order_relaxed);
            for (const Entry &e : batch)
            {
                if (e.level >= min)
                    write(e);
            }
            batch.clear();
            os_.flush();
        }
    }

    void write(const Entry &e)
    {
        using namespace std::chrono;

        const std::time_t t = system_clock::to_time_t(e.at);
        std::tm tm{};
        localtime_r(&t, &tm);
        const auto us = duration_cast<microseconds>(e.at.time_since_epoch()) % seconds(1);

        const auto idx = static_cast<std::size_t>(e.level);
        os_ << std::format("{:02d}:{:02d}:{:02d}.{:06d} | {} tid={} | {}{:<5}{} | {}\n", tm.tm_hour,
                           tm.tm_min, tm.tm_sec, static_cast<int>(us.count()), e.tag, e.tid,
                           color_ ? kLevelColors[idx] : "", toString(e.level),
                           color_ ? kColorReset : "", e.record);
    }

    // 선언 순서: owned_ 는 writer_ join 이후에 해제된다
    std::shared_ptr<std::ostream> owned_;
    std::ostream &os_;
    const bool color_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Entry> pending_;
    bool stopping_{false};
    std::thread writer_;
};

Logger::Logger(std::ostream &os) : impl_(std::make_unique<Impl>(os, nullptr)) {}

Logger::Logger(std::shared_ptr<std::ostream> owned)
    : impl_(std::make_unique<Impl>(*owned, owned))
{
}

Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view record)
{
    impl_->push(level, record);
}

void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->minLevel.store(level, std::memory_order_relaxed);
    detail::gateLevel().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel.load(std::memory_order_relaxed);
}

void Logger::shutdown() noexcept
{
    impl_->stop();
}

// ---- 전역 인스턴스 ----

namespace
{
std::shared_ptr<ILogger> &globalSlot()
{
    static std::shared_ptr<ILogger> slot = std::make_shared<Logger>();
    return slot;
}
} // namespace

ILogger &getLogger()
{
    auto &slot = globalSlot();
    if (!slot)
        slot = std::make_shared<Logger>();
    return *slot;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    const LogLevel gate = logger ? logger->minLevel() : LogLevel::Info;
    detail::gateLevel().store(static_cast<int>(gate), std::memory_order_relaxed);
    globalSlot() = std::move(logger);
}

void shutdownLogger() noexcept
{
    auto &slot = globalSlot();
    if (!slot)
        return;
    slot->shutdown();
    slot.reset();
}

} // namespace zerowire::core

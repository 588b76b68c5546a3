/**
 * @file Log.cpp
 * @brief Default stderr sink and tick stamping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#include "rwd/core/Log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace rwd::core {

namespace {

// Values above u16 range mean "no tick stamped yet".
constexpr u32 kNoTick = 0x10000u;

class StderrSink final : public ILogSink {
public:
    void write(const LogRecord &record) override
    {
        static constexpr const char *kLevelNames[] = {"D", "I", "W", "E"};
        const char *level = kLevelNames[static_cast<unsigned>(record.level)];

        std::lock_guard<std::mutex> lock{_mutex};
        if (record.tick)
            std::fprintf(stderr, "%s t=%-5u [%.*s] %.*s\n", level, static_cast<unsigned>(*record.tick),
                         static_cast<int>(record.tag.size()), record.tag.data(),
                         static_cast<int>(record.message.size()), record.message.data());
        else
            std::fprintf(stderr, "%s t=-     [%.*s] %.*s\n", level,
                         static_cast<int>(record.tag.size()), record.tag.data(),
                         static_cast<int>(record.message.size()), record.message.data());
    }

private:
    std::mutex _mutex;
};

StderrSink              gStderrSink;
std::atomic<ILogSink *> gSink{&gStderrSink};
std::atomic<LogLevel>   gMinLevel{LogLevel::kInfo};
std::atomic<u32>        gTick{kNoTick};

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel.load(std::memory_order_relaxed))
        return;

    LogRecord record{level, tag, msg, std::nullopt};
    const u32 tick = gTick.load(std::memory_order_relaxed);
    if (tick != kNoTick)
        record.tick = static_cast<u16>(tick);
    gSink.load(std::memory_order_acquire)->write(record);
}

} // namespace

void Log::setSink(ILogSink *sink)
{
    gSink.store(sink ? sink : &gStderrSink, std::memory_order_release);
}

void     Log::setMinLevel(LogLevel level) { gMinLevel.store(level, std::memory_order_relaxed); }
LogLevel Log::minLevel()                  { return gMinLevel.load(std::memory_order_relaxed); }

void Log::stampTick(u16 tick) { gTick.store(tick, std::memory_order_relaxed); }
void Log::clearTick()         { gTick.store(kNoTick, std::memory_order_relaxed); }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }

} // namespace rwd::core

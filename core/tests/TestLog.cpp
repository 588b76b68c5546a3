/**
 * @file TestLog.cpp
 * @brief Unit tests for core::Log.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/core/Log.hpp"

#include <string>
#include <vector>

namespace rwd::core {

namespace {

struct CapturingSink final : ILogSink
{
    struct Entry
    {
        LogLevel           level;
        std::string        tag;
        std::string        message;
        std::optional<u16> tick;
    };

    void write(const LogRecord &record) override
    {
        entries.push_back({record.level, std::string{record.tag}, std::string{record.message}, record.tick});
    }

    std::vector<Entry> entries;
};

struct SinkScope
{
    explicit SinkScope(ILogSink &sink) : previousLevel{Log::minLevel()}
    {
        Log::setSink(&sink);
        Log::clearTick();
    }
    ~SinkScope()
    {
        Log::setSink(nullptr);
        Log::setMinLevel(previousLevel);
        Log::clearTick();
    }
    LogLevel previousLevel;
};

} // namespace

TEST_CASE("Log forwards tag and message to the active sink", "[core][log]")
{
    CapturingSink sink;
    SinkScope scope{sink};
    Log::setMinLevel(LogLevel::kDebug);

    Log::warn("rollback", "late update");

    REQUIRE(sink.entries.size() == 1);
    CHECK(sink.entries[0].level == LogLevel::kWarn);
    CHECK(sink.entries[0].tag == "rollback");
    CHECK(sink.entries[0].message == "late update");
    CHECK_FALSE(sink.entries[0].tick.has_value());
}

TEST_CASE("Log stamps records with the current simulation tick", "[core][log]")
{
    CapturingSink sink;
    SinkScope scope{sink};

    Log::stampTick(41);
    Log::info("prediction", "replaying");
    Log::stampTick(42);
    Log::info("prediction", "replaying");
    Log::clearTick();
    Log::info("prediction", "idle");

    REQUIRE(sink.entries.size() == 3);
    CHECK(sink.entries[0].tick == std::optional<u16>{41});
    CHECK(sink.entries[1].tick == std::optional<u16>{42});
    CHECK_FALSE(sink.entries[2].tick.has_value());
}

TEST_CASE("Log drops entries below the minimum level", "[core][log]")
{
    CapturingSink sink;
    SinkScope scope{sink};
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("ecs", "hidden");
    Log::info("ecs", "hidden");
    Log::warn("ecs", "shown");
    Log::error("ecs", "shown");

    REQUIRE(sink.entries.size() == 2);
    CHECK(sink.entries[0].level == LogLevel::kWarn);
    CHECK(sink.entries[1].level == LogLevel::kError);
}

TEST_CASE("Log falls back to the stderr sink on null", "[core][log]")
{
    CapturingSink sink;
    Log::setSink(&sink);
    Log::setSink(nullptr);

    Log::error("core", "goes to stderr");
    CHECK(sink.entries.empty());
}

} // namespace rwd::core

/**
 * @file TestSystemScheduler.cpp
 * @brief Unit tests for ecs::SystemScheduler.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/ecs/SystemScheduler.hpp"
#include "rwd/concurrency/ThreadPool.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rwd::ecs {

namespace {

struct Position {};
struct Velocity {};

std::unique_ptr<ISystem> makeSystem(std::string name, SchedulePhase phase,
                                    std::vector<ComponentAccess> accesses,
                                    std::function<void(core::f32)> body = [](core::f32) {})
{
    return std::make_unique<FunctionSystem>(std::move(name), phase, std::move(accesses), std::move(body));
}

} // namespace

TEST_CASE("SystemScheduler rejects null systems", "[ecs][scheduler]")
{
    concurrency::ThreadPool pool{1};
    SystemScheduler schedule{pool};
    auto result = schedule.registerSystem(nullptr);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("SystemScheduler groups independent readers into one wave", "[ecs][scheduler]")
{
    concurrency::ThreadPool pool{2};
    SystemScheduler schedule{pool};

    REQUIRE(schedule.registerSystem(makeSystem("a", SchedulePhase::Simulation, {reads<Position>()})));
    REQUIRE(schedule.registerSystem(makeSystem("b", SchedulePhase::Simulation, {reads<Position>()})));
    REQUIRE(schedule.buildGraph());

    REQUIRE(schedule.isBuilt());
    REQUIRE(schedule.waveCount() == 1);
}

TEST_CASE("SystemScheduler serialises writers and orders phases", "[ecs][scheduler]")
{
    concurrency::ThreadPool pool{2};
    SystemScheduler schedule{pool};

    std::mutex               mutex;
    std::vector<std::string> order;
    auto record = [&](std::string name) {
        return [&, name](core::f32) {
            std::lock_guard<std::mutex> lock{mutex};
            order.push_back(name);
        };
    };

    REQUIRE(schedule.registerSystem(makeSystem("history", SchedulePhase::History, {}, record("history"))));
    REQUIRE(schedule.registerSystem(makeSystem("move", SchedulePhase::Simulation,
                                               {writes<Position>(), reads<Velocity>()}, record("move"))));
    REQUIRE(schedule.registerSystem(makeSystem("clamp", SchedulePhase::Simulation,
                                               {writes<Position>()}, record("clamp"))));
    REQUIRE(schedule.registerSystem(makeSystem("input", SchedulePhase::Input,
                                               {writes<Velocity>()}, record("input"))));
    REQUIRE(schedule.buildGraph());
    REQUIRE(schedule.systemCount() == 4);

    schedule.tick(1.0f / 64.0f);

    REQUIRE(order == std::vector<std::string>{"input", "move", "clamp", "history"});
}

TEST_CASE("SystemScheduler needs a rebuild after registration", "[ecs][scheduler]")
{
    concurrency::ThreadPool pool{1};
    SystemScheduler schedule{pool};
    REQUIRE(schedule.buildGraph());
    REQUIRE(schedule.isBuilt());

    REQUIRE(schedule.registerSystem(makeSystem("late", SchedulePhase::Input, {})));
    REQUIRE_FALSE(schedule.isBuilt());
}

} // namespace rwd::ecs

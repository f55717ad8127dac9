#include <catch2/catch_all.hpp>
#include "OverrideGateway.hpp"
#include "ManualClock.hpp"

using namespace greenwave;
using greenwave::testing::ManualClock;
using greenwave::testing::makeCounts;

TEST_CASE("setManual accepts any letter case", "[override]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    OverrideGateway gateway(state);

    clock.advance(3.0);
    OverrideResult result = gateway.setManual("EaSt");
    REQUIRE(result.ok);
    REQUIRE(result.error.empty());
    REQUIRE(result.state.active == Direction::East);
    REQUIRE(result.state.manual_override);
    REQUIRE(result.state.phase_start == clock.now());
    REQUIRE(state.snapshot().signal == result.state);
}

TEST_CASE("setManual rejects unknown directions without touching state", "[override]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    OverrideGateway gateway(state);
    state.updateCounts(makeCounts(3, 1, 4, 1));
    state.switchActive(Direction::West);
    const TrafficSnapshot before = state.snapshot();

    clock.advance(9.0);
    for (const char *bad : {"northeast", "", " north", "n", "NORTHWEST"})
    {
        OverrideResult result = gateway.setManual(bad);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.valid_directions == std::vector<std::string>{"north", "south", "east", "west"});
        REQUIRE(result.error.find("north, south, east, west") != std::string::npos);
    }

    const TrafficSnapshot after = state.snapshot();
    REQUIRE(after.signal == before.signal);
    REQUIRE(after.counts == before.counts);
    REQUIRE(after.revision == before.revision);
}

TEST_CASE("setManual error names the offending value", "[override]")
{
    TrafficState state;
    OverrideGateway gateway(state);

    OverrideResult result = gateway.setManual("northeast");
    REQUIRE(result.error.find("northeast") != std::string::npos);
}

TEST_CASE("clearManual is idempotent", "[override]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    OverrideGateway gateway(state);
    REQUIRE(gateway.setManual("south").ok);

    clock.advance(4.0);
    SignalState first = gateway.clearManual();
    TrafficSnapshot once = state.snapshot();
    SignalState second = gateway.clearManual();
    TrafficSnapshot twice = state.snapshot();

    REQUIRE_FALSE(first.manual_override);
    REQUIRE(first == second);
    REQUIRE(once.signal == twice.signal);
    REQUIRE(once.revision == twice.revision);
    REQUIRE(twice.signal.active == Direction::South);
}

TEST_CASE("clearManual without an override is a legal no-op", "[override]")
{
    TrafficState state;
    OverrideGateway gateway(state);
    const TrafficSnapshot before = state.snapshot();

    SignalState signal = gateway.clearManual();
    REQUIRE(signal == before.signal);
    REQUIRE(state.snapshot().revision == before.revision);
}

TEST_CASE("A new manual direction replaces the previous override", "[override]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    OverrideGateway gateway(state);

    REQUIRE(gateway.setManual("north").ok);
    clock.advance(2.0);
    OverrideResult result = gateway.setManual("west");
    REQUIRE(result.ok);
    REQUIRE(result.state.active == Direction::West);
    REQUIRE(result.state.phase_start == clock.now());
}

#include <catch2/catch_all.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "ControlLoop.hpp"
#include "OverrideGateway.hpp"
#include "ManualClock.hpp"

using namespace greenwave;
using greenwave::testing::ManualClock;
using greenwave::testing::makeCounts;

namespace
{
    struct DetectorProbe
    {
        std::atomic<int> open_calls{0};
        std::atomic<int> close_calls{0};
        std::atomic<int> detect_calls{0};
        std::atomic<int> failed_opens_remaining{0};
    };

    // Replays a fixed script of detection results, then repeats the fallback forever
    class ScriptedDetector : public IVehicleDetector
    {
    public:
        ScriptedDetector(std::shared_ptr<DetectorProbe> probe, RawCounts fallback)
            : probe(std::move(probe)), fallback(fallback)
        {
        }

        void pushCounts(const RawCounts &counts)
        {
            DetectionResult result;
            result.ok = true;
            result.counts = counts;
            script.push_back(result);
        }

        void pushFailure(const std::string &error)
        {
            DetectionResult result;
            result.error = error;
            script.push_back(result);
        }

        void throwNext() { throw_next = true; }

        bool open(std::string *error) override
        {
            probe->open_calls++;
            if (probe->failed_opens_remaining > 0)
            {
                probe->failed_opens_remaining--;
                if (error)
                {
                    *error = "camera not ready";
                }
                return false;
            }
            return true;
        }

        DetectionResult detect() override
        {
            probe->detect_calls++;
            if (throw_next)
            {
                throw_next = false;
                throw std::runtime_error("capture device lost");
            }
            if (script.empty())
            {
                DetectionResult result;
                result.ok = true;
                result.counts = fallback;
                return result;
            }
            DetectionResult next = script.front();
            script.pop_front();
            return next;
        }

        void close() override
        {
            probe->close_calls++;
        }

    private:
        std::shared_ptr<DetectorProbe> probe;
        RawCounts fallback;
        std::deque<DetectionResult> script;
        bool throw_next = false;
    };

    ControllerConfig fastConfig()
    {
        ControllerConfig config;
        config.cycle_period_seconds = 0.005;
        config.detection_backoff_seconds = 0.005;
        return config;
    }

    template <typename Predicate>
    bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return predicate();
    }
}

TEST_CASE("A cycle smooths raw counts into the shared state", "[loop]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    auto probe = std::make_shared<DetectorProbe>();
    auto detector = std::make_unique<ScriptedDetector>(probe, RawCounts{});
    detector->pushCounts(makeCounts(10, 0, 20, 5));
    ControlLoop loop(state, std::move(detector), fastConfig());

    REQUIRE(loop.openSession());
    REQUIRE(loop.isDetectionActive());

    REQUIRE(loop.runCycle() == CycleOutcome::Committed);
    REQUIRE(state.snapshot().counts == makeCounts(3, 0, 6, 1));

    // Fallback script is all zeros; the average decays
    REQUIRE(loop.runCycle() == CycleOutcome::Committed);
    REQUIRE(state.snapshot().counts == makeCounts(2, 0, 4, 0));
    REQUIRE(state.snapshot().signal.active == Direction::North);
}

TEST_CASE("Detection failures leave the state unchanged", "[loop][detection]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    state.updateCounts(makeCounts(4, 4, 4, 4));
    auto probe = std::make_shared<DetectorProbe>();
    auto detector = std::make_unique<ScriptedDetector>(probe, makeCounts(4, 4, 4, 4));
    ScriptedDetector *script = detector.get();
    script->pushFailure("no frame available");
    script->pushCounts(makeCounts(0, -2, 0, 0));
    ControlLoop loop(state, std::move(detector), fastConfig());
    REQUIRE(loop.openSession());

    const TrafficSnapshot before = state.snapshot();

    REQUIRE(loop.runCycle() == CycleOutcome::DetectionFailed);
    REQUIRE(loop.runCycle() == CycleOutcome::DetectionFailed);
    script->throwNext();
    REQUIRE(loop.runCycle() == CycleOutcome::DetectionFailed);

    const TrafficSnapshot after = state.snapshot();
    REQUIRE(after.revision == before.revision);
    REQUIRE(after.counts == before.counts);

    REQUIRE(loop.runCycle() == CycleOutcome::Committed);
    REQUIRE(probe->detect_calls.load() == 4);
}

TEST_CASE("runCycle without an open session reports a detection failure", "[loop][detection]")
{
    TrafficState state;
    auto probe = std::make_shared<DetectorProbe>();
    ControlLoop loop(state, std::make_unique<ScriptedDetector>(probe, makeCounts(1, 1, 1, 1)), fastConfig());

    REQUIRE(loop.runCycle() == CycleOutcome::DetectionFailed);
    REQUIRE(probe->detect_calls.load() == 0);
    REQUIRE(state.snapshot().revision == 0);
}

TEST_CASE("A cycle applies the controller decision and restarts the phase", "[loop][controller]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    state.updateCounts(makeCounts(1, 30, 0, 0));
    auto probe = std::make_shared<DetectorProbe>();
    ControlLoop loop(state, std::make_unique<ScriptedDetector>(probe, makeCounts(1, 30, 0, 0)), fastConfig());
    REQUIRE(loop.openSession());

    clock.advance(5.0);
    REQUIRE(loop.runCycle() == CycleOutcome::Committed);

    clock.advance(4.0);
    REQUIRE(loop.runCycle() == CycleOutcome::Switched);

    TrafficSnapshot snap = state.snapshot();
    REQUIRE(snap.signal.active == Direction::South);
    REQUIRE(snap.signal.phase_start == clock.now());
    REQUIRE_FALSE(snap.signal.manual_override);

    REQUIRE(loop.runCycle() == CycleOutcome::Committed);
}

TEST_CASE("Override keeps the loop from switching but counts still update", "[loop][override]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    OverrideGateway gateway(state);
    auto probe = std::make_shared<DetectorProbe>();
    ControlLoop loop(state, std::make_unique<ScriptedDetector>(probe, makeCounts(0, 0, 0, 100)), fastConfig());
    REQUIRE(loop.openSession());

    REQUIRE(gateway.setManual("north").ok);
    const TimePoint override_start = clock.now();

    for (int i = 0; i < 5; ++i)
    {
        clock.advance(60.0);
        REQUIRE(loop.runCycle() == CycleOutcome::OverrideActive);
    }

    TrafficSnapshot snap = state.snapshot();
    REQUIRE(snap.signal.active == Direction::North);
    REQUIRE(snap.signal.phase_start == override_start);
    REQUIRE(snap.counts.get(Direction::West) > 0);

    gateway.clearManual();
    REQUIRE(loop.runCycle() == CycleOutcome::Switched);
    REQUIRE(state.snapshot().signal.active == Direction::West);
}

TEST_CASE("Switch decided before an override lands is discarded", "[loop][override]")
{
    ManualClock clock;
    std::function<void()> hook;
    int calls_until_hook = -1;
    ClockFn hooked_clock = [&]()
    {
        if (calls_until_hook > 0 && --calls_until_hook == 0 && hook)
        {
            auto fire = std::move(hook);
            hook = nullptr;
            fire();
        }
        return clock.now();
    };

    TrafficState state(hooked_clock);
    OverrideGateway gateway(state);
    auto probe = std::make_shared<DetectorProbe>();
    ControlLoop loop(state, std::make_unique<ScriptedDetector>(probe, makeCounts(0, 0, 40, 0)), fastConfig());
    REQUIRE(loop.openSession());

    clock.advance(31.0);

    // First clock read feeds the controller, the second belongs to the switch commit
    hook = [&]()
    { REQUIRE(gateway.setManual("south").ok); };
    calls_until_hook = 2;

    REQUIRE(loop.runCycle() == CycleOutcome::SwitchDiscarded);

    TrafficSnapshot snap = state.snapshot();
    REQUIRE(snap.signal.active == Direction::South);
    REQUIRE(snap.signal.manual_override);
}

TEST_CASE("Contract violations abort the cycle and escalate when repeated", "[loop][contract]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    ControllerConfig config = fastConfig();
    config.max_consecutive_contract_violations = 3;
    auto probe = std::make_shared<DetectorProbe>();
    ControlLoop loop(state, std::make_unique<ScriptedDetector>(probe, makeCounts(0, 20, 0, 0)), config);
    REQUIRE(loop.openSession());

    // A clock that runs backwards puts the phase start in the future
    state.switchActive(Direction::North);
    clock.rewind(10.0);

    REQUIRE(loop.runCycle() == CycleOutcome::ContractViolation);
    REQUIRE(loop.runCycle() == CycleOutcome::ContractViolation);
    REQUIRE(loop.getConsecutiveContractViolations() == 2);
    REQUIRE_FALSE(loop.hasFailed());
    REQUIRE(state.snapshot().signal.active == Direction::North);

    // A clean cycle resets the streak
    clock.advance(12.0);
    REQUIRE(loop.runCycle() == CycleOutcome::Committed);
    REQUIRE(loop.getConsecutiveContractViolations() == 0);

    state.switchActive(Direction::North);
    clock.rewind(10.0);
    REQUIRE(loop.runCycle() == CycleOutcome::ContractViolation);
    REQUIRE(loop.runCycle() == CycleOutcome::ContractViolation);
    REQUIRE_FALSE(loop.hasFailed());
    REQUIRE(loop.runCycle() == CycleOutcome::ContractViolation);
    REQUIRE(loop.hasFailed());
}

TEST_CASE("Loop thread runs cycles until stopped and releases the detector", "[loop][thread]")
{
    TrafficState state;
    auto probe = std::make_shared<DetectorProbe>();
    ControlLoop loop(state, std::make_unique<ScriptedDetector>(probe, makeCounts(10, 0, 0, 0)), fastConfig());

    REQUIRE(loop.start());
    REQUIRE_FALSE(loop.start());
    REQUIRE(waitFor([&]()
                    { return state.snapshot().revision >= 5; }));
    REQUIRE(loop.isDetectionActive());
    REQUIRE(loop.isRunning());

    loop.stop();
    REQUIRE_FALSE(loop.isRunning());
    REQUIRE_FALSE(loop.isDetectionActive());
    REQUIRE(probe->open_calls.load() == 1);
    REQUIRE(probe->close_calls.load() == 1);
    REQUIRE(state.snapshot().counts.get(Direction::North) > 0);
}

TEST_CASE("Loop retries a detector that fails to open", "[loop][thread][detection]")
{
    TrafficState state;
    auto probe = std::make_shared<DetectorProbe>();
    probe->failed_opens_remaining = 2;
    ControlLoop loop(state, std::make_unique<ScriptedDetector>(probe, makeCounts(1, 1, 1, 1)), fastConfig());

    REQUIRE(loop.start());
    REQUIRE(waitFor([&]()
                    { return loop.isDetectionActive(); }));
    loop.stop();

    REQUIRE(probe->open_calls.load() == 3);
    REQUIRE(probe->close_calls.load() == 1);
}

TEST_CASE("Loop stops itself and closes the detector after escalation", "[loop][thread][contract]")
{
    ManualClock clock;
    TrafficState state(clock.fn());
    auto probe = std::make_shared<DetectorProbe>();
    ControlLoop loop(state, std::make_unique<ScriptedDetector>(probe, makeCounts(0, 0, 0, 0)), fastConfig());

    state.switchActive(Direction::East);
    clock.rewind(5.0);

    REQUIRE(loop.start());
    REQUIRE(waitFor([&]()
                    { return loop.hasFailed() && !loop.isDetectionActive(); }));
    REQUIRE_FALSE(loop.isRunning());
    REQUIRE(probe->close_calls.load() == 1);
    loop.stop();
    REQUIRE(probe->close_calls.load() == 1);
}

TEST_CASE("Stopping a loop that never started is harmless", "[loop]")
{
    TrafficState state;
    auto probe = std::make_shared<DetectorProbe>();
    ControlLoop loop(state, std::make_unique<ScriptedDetector>(probe, RawCounts{}), fastConfig());
    loop.stop();
    REQUIRE_FALSE(loop.isRunning());
    REQUIRE(probe->open_calls.load() == 0);
}

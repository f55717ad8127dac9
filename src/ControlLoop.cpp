#include "ControlLoop.hpp"

#include "CountSmoother.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace greenwave
{
    const char *cycleOutcomeToString(CycleOutcome outcome)
    {
        switch (outcome)
        {
        case CycleOutcome::Committed:
            return "committed";
        case CycleOutcome::Switched:
            return "switched";
        case CycleOutcome::OverrideActive:
            return "override_active";
        case CycleOutcome::SwitchDiscarded:
            return "switch_discarded";
        case CycleOutcome::DetectionFailed:
            return "detection_failed";
        case CycleOutcome::ContractViolation:
            return "contract_violation";
        }
        return "unknown";
    }

    ControlLoop::ControlLoop(TrafficState &state,
                             std::unique_ptr<IVehicleDetector> detector,
                             const ControllerConfig &config)
        : state(state),
          detector(std::move(detector)),
          controller(config.policy),
          cycle_period(config.cycle_period_seconds),
          detection_backoff(config.detection_backoff_seconds),
          max_consecutive_violations(config.max_consecutive_contract_violations),
          consecutive_violations(0),
          running(false),
          detection_active(false),
          failed(false)
    {
    }

    ControlLoop::~ControlLoop()
    {
        stop();
        closeSession();
    }

    bool ControlLoop::start()
    {
        if (running || loop_thread.joinable())
        {
            return false;
        }

        running = true;
        loop_thread = std::thread(&ControlLoop::run, this);
        return true;
    }

    void ControlLoop::stop()
    {
        {
            std::lock_guard<std::mutex> lock(wait_mutex);
            running = false;
        }
        wake.notify_all();

        if (loop_thread.joinable())
        {
            loop_thread.join();
        }
    }

    bool ControlLoop::openSession(std::string *error)
    {
        if (detection_active)
        {
            return true;
        }

        bool opened = false;
        try
        {
            opened = detector->open(error);
        }
        catch (const std::exception &e)
        {
            if (error)
            {
                *error = e.what();
            }
            opened = false;
        }

        if (opened)
        {
            detection_active = true;
            std::cout << "Control loop: detector session opened" << std::endl;
        }
        return opened;
    }

    void ControlLoop::closeSession()
    {
        if (!detection_active)
        {
            return;
        }
        detector->close();
        detection_active = false;
        std::cout << "Control loop: detector session closed" << std::endl;
    }

    CycleOutcome ControlLoop::runCycle()
    {
        if (!detection_active)
        {
            std::cerr << "Control loop: cycle skipped, detector session not open" << std::endl;
            return CycleOutcome::DetectionFailed;
        }

        RawCounts raw;
        if (!readCounts(raw))
        {
            return CycleOutcome::DetectionFailed;
        }

        // This loop is the only writer of counts, so read-smooth-commit cannot lose an update
        const TrafficSnapshot previous = state.snapshot();
        state.updateCounts(smoothCounts(previous.counts, raw));

        const TrafficSnapshot current = state.snapshot();
        if (current.signal.manual_override)
        {
            return CycleOutcome::OverrideActive;
        }

        std::optional<SwitchDecision> decision;
        try
        {
            decision = controller.evaluate(current, state.now());
        }
        catch (const ContractViolation &e)
        {
            const int count = ++consecutive_violations;
            std::cerr << "Control loop: contract violation (" << count << "/" << max_consecutive_violations
                      << "), cycle aborted: " << e.what() << std::endl;
            if (count >= max_consecutive_violations)
            {
                std::cerr << "Control loop: repeated contract violations, traffic state is corrupt; stopping" << std::endl;
                failed = true;
                {
                    std::lock_guard<std::mutex> lock(wait_mutex);
                    running = false;
                }
                wake.notify_all();
            }
            return CycleOutcome::ContractViolation;
        }
        consecutive_violations = 0;

        if (!decision)
        {
            return CycleOutcome::Committed;
        }

        if (!state.switchIfAutomatic(decision->next))
        {
            std::cout << "Control loop: manual override arrived first, discarding "
                      << switchRuleToString(decision->rule) << " switch to " << directionToString(decision->next)
                      << std::endl;
            return CycleOutcome::SwitchDiscarded;
        }

        std::cout << "Control loop: " << switchRuleToString(decision->rule) << " switch "
                  << directionToString(current.signal.active) << "(" << decision->current_count << ") -> "
                  << directionToString(decision->next) << "(" << decision->busiest_count << ") after "
                  << decision->elapsed_seconds << "s" << std::endl;
        return CycleOutcome::Switched;
    }

    bool ControlLoop::readCounts(RawCounts &raw)
    {
        DetectionResult result;
        try
        {
            result = detector->detect();
        }
        catch (const std::exception &e)
        {
            result.ok = false;
            result.error = e.what();
        }

        if (!result.ok)
        {
            std::cerr << "Control loop: detection error: " << result.error << ", retrying in "
                      << detection_backoff << "s" << std::endl;
            return false;
        }

        for (Direction dir : kAllDirections)
        {
            if (result.counts.get(dir) < 0)
            {
                std::cerr << "Control loop: detector reported negative count for " << directionToString(dir)
                          << ", retrying in " << detection_backoff << "s" << std::endl;
                return false;
            }
        }

        raw = result.counts;
        return true;
    }

    void ControlLoop::run()
    {
        std::cout << "Control loop: starting, period " << cycle_period << "s" << std::endl;

        while (running)
        {
            std::string error;
            if (openSession(&error))
            {
                break;
            }
            std::cerr << "Control loop: detector unavailable: " << error << ", retrying in "
                      << detection_backoff << "s" << std::endl;
            pause(detection_backoff);
        }

        if (!detection_active)
        {
            std::cout << "Control loop: stopped before a detector session opened" << std::endl;
            return;
        }

        struct SessionGuard
        {
            ControlLoop &loop;
            ~SessionGuard() { loop.closeSession(); }
        } guard{*this};

        while (running)
        {
            CycleOutcome outcome = runCycle();
            pause(outcome == CycleOutcome::DetectionFailed ? detection_backoff : cycle_period);
        }

        std::cout << "Control loop: stopped" << (failed ? " after failure" : "") << std::endl;
    }

    void ControlLoop::pause(double seconds)
    {
        std::unique_lock<std::mutex> lock(wait_mutex);
        wake.wait_for(lock, std::chrono::duration<double>(seconds), [this]
                      { return !running; });
    }
} // namespace greenwave

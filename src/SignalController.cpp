#include "SignalController.hpp"

#include <string>
#include <utility>

namespace greenwave
{
    const char *switchRuleToString(SwitchRule rule)
    {
        switch (rule)
        {
        case SwitchRule::Timeout:
            return "timeout";
        case SwitchRule::Starvation:
            return "starvation";
        case SwitchRule::Emergency:
            return "emergency";
        }
        return "unknown";
    }

    const std::array<SignalController::Rule, 3> SignalController::kRules = {{
        {SwitchRule::Timeout, &SignalController::timeoutApplies},
        {SwitchRule::Starvation, &SignalController::starvationApplies},
        {SwitchRule::Emergency, &SignalController::emergencyApplies},
    }};

    SignalController::SignalController(SignalPolicy policy)
        : policy(std::move(policy))
    {
    }

    std::optional<Direction> SignalController::decide(const TrafficSnapshot &snapshot, TimePoint now) const
    {
        std::optional<SwitchDecision> decision = evaluate(snapshot, now);
        if (!decision)
        {
            return std::nullopt;
        }
        return decision->next;
    }

    std::optional<SwitchDecision> SignalController::evaluate(const TrafficSnapshot &snapshot, TimePoint now) const
    {
        checkSnapshot(snapshot, now);

        if (snapshot.signal.manual_override)
        {
            return std::nullopt;
        }

        DecisionContext ctx;
        ctx.elapsed_seconds = std::chrono::duration<double>(now - snapshot.signal.phase_start).count();
        ctx.active = snapshot.signal.active;
        ctx.current_count = snapshot.counts.get(ctx.active);
        findBusiest(snapshot.counts, ctx.busiest, ctx.busiest_count);

        for (const Rule &rule : kRules)
        {
            if ((this->*rule.applies)(ctx))
            {
                SwitchDecision decision;
                decision.next = ctx.busiest;
                decision.rule = rule.id;
                decision.current_count = ctx.current_count;
                decision.busiest_count = ctx.busiest_count;
                decision.elapsed_seconds = ctx.elapsed_seconds;
                return decision;
            }
        }
        return std::nullopt;
    }

    void SignalController::findBusiest(const TrafficCounts &counts, Direction &busiest, int &busiest_count)
    {
        busiest = kAllDirections[0];
        busiest_count = counts.get(busiest);
        for (Direction dir : kAllDirections)
        {
            if (counts.get(dir) > busiest_count)
            {
                busiest = dir;
                busiest_count = counts.get(dir);
            }
        }
    }

    // Restarts the phase even when the busiest direction is already green
    bool SignalController::timeoutApplies(const DecisionContext &ctx) const
    {
        return ctx.elapsed_seconds > policy.max_green_seconds;
    }

    bool SignalController::starvationApplies(const DecisionContext &ctx) const
    {
        return ctx.elapsed_seconds > policy.min_green_seconds &&
               ctx.current_count < policy.low_traffic_threshold &&
               ctx.busiest_count > policy.high_traffic_threshold &&
               ctx.busiest != ctx.active;
    }

    // Pre-empts the minimum green; the floor is half of it, rounded down
    bool SignalController::emergencyApplies(const DecisionContext &ctx) const
    {
        return ctx.busiest_count > 2 * policy.high_traffic_threshold &&
               ctx.busiest != ctx.active &&
               ctx.elapsed_seconds > policy.min_green_seconds / 2;
    }

    void SignalController::checkSnapshot(const TrafficSnapshot &snapshot, TimePoint now) const
    {
        if (!isValidDirection(snapshot.signal.active))
        {
            throw ContractViolation("snapshot active direction out of range: " +
                                    std::to_string(static_cast<int>(snapshot.signal.active)));
        }

        for (Direction dir : kAllDirections)
        {
            if (snapshot.counts.get(dir) < 0)
            {
                throw ContractViolation(std::string("snapshot count for ") + directionToString(dir) +
                                        " is negative: " + std::to_string(snapshot.counts.get(dir)));
            }
        }

        if (snapshot.signal.phase_start > now)
        {
            throw ContractViolation("snapshot phase start lies in the future");
        }
    }
} // namespace greenwave

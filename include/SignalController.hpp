#pragma once

#include "ControllerConfig.hpp"
#include "TrafficState.hpp"

#include <array>
#include <optional>
#include <stdexcept>

namespace greenwave
{
    // A snapshot broke a TrafficState invariant; evaluating it would be meaningless
    class ContractViolation : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };

    enum class SwitchRule
    {
        Timeout,
        Starvation,
        Emergency
    };

    const char *switchRuleToString(SwitchRule rule);

    struct SwitchDecision
    {
        Direction next{Direction::North};
        SwitchRule rule{SwitchRule::Timeout};
        int current_count = 0;
        int busiest_count = 0;
        double elapsed_seconds = 0.0;
    };

    // Inputs shared by every rule, derived once per evaluation
    struct DecisionContext
    {
        double elapsed_seconds = 0.0;
        Direction active{Direction::North};
        int current_count = 0;
        Direction busiest{Direction::North};
        int busiest_count = 0;
    };

    // Pure decision function over a TrafficState snapshot. Performs no I/O and holds no state
    // besides the policy constants.
    class SignalController
    {
    public:
        explicit SignalController(SignalPolicy policy = SignalPolicy{});

        // Direction to switch to, or nothing. Never switches while manual override is active.
        // Throws ContractViolation on a malformed snapshot.
        std::optional<Direction> decide(const TrafficSnapshot &snapshot, TimePoint now) const;

        // Same as decide(), with the rule that fired and the values it saw
        std::optional<SwitchDecision> evaluate(const TrafficSnapshot &snapshot, TimePoint now) const;

        const SignalPolicy &getPolicy() const { return policy; }

        // First-seen maximum over kAllDirections; a later equal count never replaces it
        static void findBusiest(const TrafficCounts &counts, Direction &busiest, int &busiest_count);

    private:
        struct Rule
        {
            SwitchRule id;
            bool (SignalController::*applies)(const DecisionContext &) const;
        };

        // Evaluated in order, first match wins
        static const std::array<Rule, 3> kRules;

        bool timeoutApplies(const DecisionContext &ctx) const;
        bool starvationApplies(const DecisionContext &ctx) const;
        bool emergencyApplies(const DecisionContext &ctx) const;

        void checkSnapshot(const TrafficSnapshot &snapshot, TimePoint now) const;

        SignalPolicy policy;
    };

} // namespace greenwave

#pragma once

#include "ControllerConfig.hpp"
#include "SignalController.hpp"
#include "TrafficState.hpp"
#include "VehicleDetector.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace greenwave
{
    enum class CycleOutcome
    {
        Committed,         // counts updated, no switch
        Switched,          // counts updated, active direction changed (or phase restarted)
        OverrideActive,    // counts updated, controller not consulted
        SwitchDiscarded,   // a switch was decided but an override landed before it could be applied
        DetectionFailed,   // no counts this cycle, state untouched
        ContractViolation  // snapshot rejected by the controller, cycle aborted
    };

    const char *cycleOutcomeToString(CycleOutcome outcome);

    // Owns the detector for its whole lifetime and is the only automatic writer of
    // TrafficState. Runs on its own thread between start() and stop().
    class ControlLoop
    {
    public:
        ControlLoop(TrafficState &state,
                    std::unique_ptr<IVehicleDetector> detector,
                    const ControllerConfig &config);
        ~ControlLoop();

        ControlLoop(const ControlLoop &) = delete;
        ControlLoop &operator=(const ControlLoop &) = delete;

        bool start();
        void stop();

        // One detect -> smooth -> commit -> decide -> switch pass. Requires an open session.
        CycleOutcome runCycle();

        bool openSession(std::string *error = nullptr);
        void closeSession();

        bool isRunning() const { return running; }
        bool isDetectionActive() const { return detection_active; }

        // True once repeated contract violations stopped the loop
        bool hasFailed() const { return failed; }

        int getConsecutiveContractViolations() const { return consecutive_violations; }
        const SignalController &getController() const { return controller; }

    private:
        void run();
        void pause(double seconds);
        bool readCounts(RawCounts &raw);

        TrafficState &state;
        std::unique_ptr<IVehicleDetector> detector;
        SignalController controller;
        double cycle_period;
        double detection_backoff;
        int max_consecutive_violations;

        std::atomic<int> consecutive_violations;
        std::atomic<bool> running;
        std::atomic<bool> detection_active;
        std::atomic<bool> failed;
        std::thread loop_thread;
        std::mutex wait_mutex;
        std::condition_variable wake;
    };

} // namespace greenwave

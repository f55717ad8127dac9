#pragma once

#include "ControllerConfig.hpp"
#include "VehicleDetector.hpp"

#include <array>
#include <deque>
#include <random>

namespace greenwave
{
    // Stand-in for the camera pipeline: vehicles enter each direction's region as a
    // Poisson process and stay visible for a fixed dwell time. Every detect() call
    // advances simulated time by one frame interval.
    class SimulatedDetector : public IVehicleDetector
    {
    public:
        SimulatedDetector(const DetectorConfig &config, double frame_interval_seconds);

        bool open(std::string *error) override;
        DetectionResult detect() override;
        void close() override;

        bool isOpen() const { return is_open; }
        double getSimulatedTime() const { return sim_time; }

    private:
        double drawArrivalInterval(Direction dir);
        void advance(double dt_seconds);
        void reset();

        DetectorConfig config;
        double frame_interval;
        bool is_open = false;
        double sim_time = 0.0;
        std::mt19937 rng;

        // Simulated time at which the next vehicle enters each region
        std::array<double, 4> next_arrival{};
        // Exit times of the vehicles currently visible in each region, oldest first
        std::array<std::deque<double>, 4> visible;
    };

} // namespace greenwave

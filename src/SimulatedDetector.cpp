#include "SimulatedDetector.hpp"

namespace greenwave
{
    SimulatedDetector::SimulatedDetector(const DetectorConfig &config, double frame_interval_seconds)
        : config(config),
          frame_interval(frame_interval_seconds),
          rng(config.seed)
    {
    }

    bool SimulatedDetector::open(std::string *error)
    {
        if (!(frame_interval > 0.0))
        {
            if (error)
            {
                *error = "frame interval must be positive";
            }
            return false;
        }

        reset();
        is_open = true;
        return true;
    }

    DetectionResult SimulatedDetector::detect()
    {
        DetectionResult result;
        if (!is_open)
        {
            result.error = "detector session is not open";
            return result;
        }

        advance(frame_interval);

        if (config.frame_drop_probability > 0.0)
        {
            std::uniform_real_distribution<double> drop(0.0, 1.0);
            if (drop(rng) < config.frame_drop_probability)
            {
                result.error = "no frame available";
                return result;
            }
        }

        for (Direction dir : kAllDirections)
        {
            result.counts.set(dir, static_cast<int>(visible[directionIndex(dir)].size()));
        }
        result.ok = true;
        return result;
    }

    void SimulatedDetector::close()
    {
        is_open = false;
    }

    double SimulatedDetector::drawArrivalInterval(Direction dir)
    {
        const double rate = config.arrival_rates[directionIndex(dir)];
        if (rate <= 0.0)
            return 1000000.0;
        std::exponential_distribution<double> interval(rate);
        return interval(rng);
    }

    void SimulatedDetector::advance(double dt_seconds)
    {
        sim_time += dt_seconds;

        for (Direction dir : kAllDirections)
        {
            const std::size_t idx = directionIndex(dir);
            auto &region = visible[idx];

            while (next_arrival[idx] <= sim_time)
            {
                region.push_back(next_arrival[idx] + config.dwell_seconds);
                next_arrival[idx] += drawArrivalInterval(dir);
            }

            // Exit times are pushed in arrival order, so the front leaves first
            while (!region.empty() && region.front() <= sim_time)
            {
                region.pop_front();
            }
        }
    }

    void SimulatedDetector::reset()
    {
        sim_time = 0.0;
        rng.seed(config.seed);
        for (Direction dir : kAllDirections)
        {
            const std::size_t idx = directionIndex(dir);
            visible[idx].clear();
            next_arrival[idx] = drawArrivalInterval(dir);
        }
    }
} // namespace greenwave

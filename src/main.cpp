#include <iostream>
#include <atomic>
#include <csignal>
#include <chrono>
#include <memory>
#include <thread>
#include "ApiService.hpp"
#include "ControlLoop.hpp"
#include "ControllerConfigJson.hpp"
#include "HttpApiServer.hpp"
#include "OverrideGateway.hpp"
#include "SimulatedDetector.hpp"
#include "TrafficState.hpp"

namespace
{
    std::atomic<bool> g_keep_running{true};

    void handleSignal(int)
    {
        g_keep_running = false;
    }
}

int main(int argc, char **argv)
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "=== Greenwave Adaptive Signal Controller ===" << std::endl;
    std::cout << std::endl;

    greenwave::ControllerConfig config = greenwave::makeDefaultControllerConfig();
    if (argc > 1)
    {
        greenwave::ConfigParseResult parsed = greenwave::loadControllerConfigFile(argv[1]);
        if (!parsed.ok)
        {
            std::cerr << "Invalid configuration in " << argv[1] << ":" << std::endl;
            for (const auto &error : parsed.errors)
            {
                std::cerr << "  - " << error << std::endl;
            }
            return 1;
        }
        config = parsed.config;
        std::cout << "Loaded configuration from " << argv[1] << std::endl;
    }

    std::cout << "Policy: max_green=" << config.policy.max_green_seconds
              << "s min_green=" << config.policy.min_green_seconds
              << "s high=" << config.policy.high_traffic_threshold
              << " low=" << config.policy.low_traffic_threshold
              << " period=" << config.cycle_period_seconds << "s" << std::endl;

    greenwave::TrafficState state;
    greenwave::OverrideGateway gateway(state);
    greenwave::ControlLoop loop(state,
                                std::make_unique<greenwave::SimulatedDetector>(config.detector, config.cycle_period_seconds),
                                config);

    greenwave::ApiService service(
        state,
        gateway,
        [&loop]()
        { return loop.isDetectionActive(); },
        config);
    greenwave::HttpApiServer server(config.http_port, service);

    if (!loop.start())
    {
        std::cerr << "Failed to start control loop" << std::endl;
        return 1;
    }

    if (!server.start())
    {
        std::cerr << "Failed to start API server on port " << config.http_port << std::endl;
        loop.stop();
        return 1;
    }

    std::cout << "API at: http://localhost:" << config.http_port << std::endl;
    std::cout << "Press Ctrl+C to stop..." << std::endl;

    while (g_keep_running && !loop.hasFailed())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    loop.stop();

    if (loop.hasFailed())
    {
        std::cerr << "Control loop failed; exiting." << std::endl;
        return 1;
    }

    std::cout << "Controller stopped." << std::endl;
    return 0;
}

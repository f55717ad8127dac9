#pragma once

#include "TrafficCounts.hpp"

#include <string>

namespace greenwave
{
    struct DetectionResult
    {
        bool ok = false;
        RawCounts counts{};
        std::string error; // "no frame available" and similar transient causes
    };

    // Source of per-frame vehicle counts. A detector session runs from open() to close().
    class IVehicleDetector
    {
    public:
        virtual ~IVehicleDetector() = default;
        virtual bool open(std::string *error) = 0;
        virtual DetectionResult detect() = 0;
        virtual void close() = 0;
    };

} // namespace greenwave

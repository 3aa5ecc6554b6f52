#pragma once

#include <string>

namespace fleet_ops::common
{
    class StopToken;

    // A long-running background loop. Start() spawns its thread and returns;
    // Stop() joins it. Loops watch the shared StopToken handed to Start().
    class Service
    {
    public:
        virtual ~Service() = default;
        virtual void Start(StopToken &token) = 0;
        virtual void Stop() = 0;
        virtual std::string Name() const = 0;
    };
}

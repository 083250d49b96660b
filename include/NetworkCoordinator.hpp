#pragma once

#include "Network.hpp"
#include "NetworkConfig.hpp"

namespace signalnet
{
    struct CoordinationReport
    {
        std::size_t green_wave_extensions = 0;
        std::size_t corridor_overrides = 0;
    };

    // Cross-intersection adjustments of the per-intersection decisions.
    class NetworkCoordinator
    {
    public:
        explicit NetworkCoordinator(const SimulationConfig &config);

        CoordinationReport coordinate(NetworkState &state) const;

        // For each road A->B whose ends propose the same phase, extends A's
        // plan when the gap between their remaining phase times is close to
        // the travel time between them. Each intersection is extended at most
        // once per call.
        std::size_t applyGreenWave(NetworkState &state) const;

        // Forces the axis whose corridor pressure exceeds the threshold (the
        // heavier one when both do, NS on a tie) and floors the plan duration. Always records the corridor
        // pressure as the decision's pressure analysis.
        std::size_t applyCorridorPressure(NetworkState &state) const;

        // 0.5 per vehicle plus 0.1 per second waited, over vehicles queued at or
        // approaching the intersection, by the axis of the road they leave on.
        static PressurePair corridorPressure(const NetworkState &state, const Intersection &intersection);

    private:
        const SimulationConfig &config;
    };

} // namespace signalnet

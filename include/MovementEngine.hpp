#pragma once

#include "Network.hpp"
#include "NetworkConfig.hpp"
#include "QueueManager.hpp"
#include "RoutePlanner.hpp"

#include <map>
#include <vector>

namespace signalnet
{
    struct MovementReport
    {
        std::vector<VehicleId> arrived;
        std::vector<VehicleId> removed_stalled;
        std::vector<VehicleId> rerouted;
        std::vector<VehicleId> skipped; // referenced a missing road or intersection
        std::map<IntersectionId, std::size_t> crossings;
    };

    // Advances every vehicle by one tick: road travel, approach-zone stops,
    // queueing at red signals and crossing into the next road.
    class MovementEngine
    {
    public:
        MovementEngine(QueueManager &queues, const RoutePlanner &planner, const SimulationConfig &config);

        MovementReport advance(NetworkState &state, double dt_seconds);

        // True when the vehicle may leave the intersection towards its next
        // road. Arriving vehicles and emergency vehicles always may.
        static bool isAdmissible(const NetworkState &state, const Vehicle &vehicle, const Intersection &intersection);

        // Recomputes flow (vehicles on the road) and travel time of every road.
        static void updateRoadOccupancy(NetworkState &state);

    private:
        void advanceAtIntersection(NetworkState &state, Vehicle &vehicle, double dt, MovementReport &report);
        void advanceOnRoad(NetworkState &state, Vehicle &vehicle, double dt, MovementReport &report);
        void handleStalled(NetworkState &state, Vehicle &vehicle, double dt, MovementReport &report);
        bool enterNextRoad(NetworkState &state, Vehicle &vehicle, const Intersection &intersection);
        void removeVehicle(NetworkState &state, VehicleId id);

        QueueManager &queues;
        const RoutePlanner &planner;
        const SimulationConfig &config;
    };

} // namespace signalnet

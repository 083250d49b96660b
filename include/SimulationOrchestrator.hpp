#pragma once

#include "MetricsAggregator.hpp"
#include "MovementEngine.hpp"
#include "Network.hpp"
#include "NetworkConfig.hpp"
#include "NetworkCoordinator.hpp"
#include "QueueManager.hpp"
#include "RoutePlanner.hpp"
#include "SignalController.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace signalnet
{
    // Owns the live network state and drives it one tick at a time.
    class SimulationOrchestrator
    {
    public:
        enum class Command
        {
            Start,
            Stop,
            Reset,
            Step
        };

        using StateCallback = std::function<void(const NetworkState &)>;

        explicit SimulationOrchestrator(NetworkConfig config,
                                        uint32_t seed = 42,
                                        StateCallback on_state_update = {});

        SimulationOrchestrator(const SimulationOrchestrator &) = delete;
        SimulationOrchestrator &operator=(const SimulationOrchestrator &) = delete;

        // Resumes with the current state.
        void start();
        // Replaces the live state with initial_state and runs it.
        void start(NetworkState initial_state);
        // Pauses and discards every signal controller.
        void stop();
        bool isRunning() const;

        // Rejects non-positive and non-finite multipliers.
        bool setSpeed(double multiplier);
        double getSpeed() const;
        // Wall-clock cadence of the tick loop: base interval / speed.
        double getTickIntervalMs() const;

        // One tick when running, nothing otherwise.
        void tick();
        // One tick regardless of the run flag.
        void step();
        // Rebuilds the network from the configuration, stopped.
        void reset();
        void handleCommand(Command command);

        // Random endpoints when not given. Returns nullopt when an endpoint is
        // unknown, both are equal or no route exists.
        std::optional<VehicleId> spawnVehicle(const std::optional<IntersectionId> &from = std::nullopt,
                                              const std::optional<IntersectionId> &to = std::nullopt);

        bool addIntersection(const IntersectionConfig &intersection, std::string *error = nullptr);
        bool addRoad(const RoadConfig &road, std::string *error = nullptr);
        bool removeIntersection(const IntersectionId &id);

        // Appends an externally reported event to the capped log. Empty
        // messages are rejected.
        bool recordEvent(EventLevel level, const std::string &message);

        const NetworkState &getState() const;
        NetworkState getSnapshot() const;
        std::string getSnapshotJson() const;
        const NetworkConfig &getConfig() const;

        void setSystemHealth(bool healthy);
        bool getSystemHealth() const;
        std::size_t getSafetyViolations() const;

        const QueueManager &getQueueManager() const;
        SignalController *getController(const IntersectionId &id);

    private:
        void runTick();
        void ensureControllers();
        void rebuildQueues();
        void spawnCycle(double dt);
        void applySignals(double dt);
        void emitEvents();
        void logEvent(EventLevel level, std::string message);

        NetworkConfig config;
        std::mt19937 rng;
        NetworkState state;
        QueueManager queues;
        RoutePlanner planner;
        MovementEngine movement;
        NetworkCoordinator coordinator;
        MetricsAggregator metrics;
        std::vector<std::unique_ptr<SignalController>> controllers; // by Intersection::index
        StateCallback on_state_update;
        bool system_healthy = true;
        double spawn_timer = 0.0;
        std::size_t safety_violations = 0;
    };

} // namespace signalnet

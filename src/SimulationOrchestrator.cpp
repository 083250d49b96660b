#include "SimulationOrchestrator.hpp"
#include "SnapshotJson.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace signalnet
{
    SimulationOrchestrator::SimulationOrchestrator(NetworkConfig config, uint32_t seed, StateCallback on_state_update)
        : config(std::move(config)),
          rng(seed),
          planner(this->config.simulation.route_penalty_factor),
          movement(queues, planner, this->config.simulation),
          coordinator(this->config.simulation),
          metrics(queues),
          on_state_update(std::move(on_state_update))
    {
        reset();
    }

    void SimulationOrchestrator::start()
    {
        rebuildQueues();
        ensureControllers();
        state.running = true;
    }

    void SimulationOrchestrator::start(NetworkState initial_state)
    {
        controllers.clear();
        state = std::move(initial_state);
        spawn_timer = 0.0;
        start();
    }

    void SimulationOrchestrator::stop()
    {
        state.running = false;
        controllers.clear();
    }

    bool SimulationOrchestrator::isRunning() const
    {
        return state.running;
    }

    bool SimulationOrchestrator::setSpeed(double multiplier)
    {
        if (!std::isfinite(multiplier) || multiplier <= 0.0)
        {
            return false;
        }
        state.simulation_speed = multiplier;
        return true;
    }

    double SimulationOrchestrator::getSpeed() const
    {
        return state.simulation_speed;
    }

    double SimulationOrchestrator::getTickIntervalMs() const
    {
        return config.simulation.base_tick_interval_ms / state.simulation_speed;
    }

    void SimulationOrchestrator::tick()
    {
        if (!state.running)
        {
            return;
        }
        runTick();
    }

    void SimulationOrchestrator::step()
    {
        if (!state.running)
        {
            rebuildQueues();
        }
        runTick();
    }

    void SimulationOrchestrator::reset()
    {
        std::vector<std::string> errors;
        const double speed = state.simulation_speed;
        state = buildNetworkState(config, &errors);
        state.simulation_speed = speed;
        queues.clear();
        controllers.clear();
        spawn_timer = 0.0;
        safety_violations = 0;

        for (auto &error : errors)
        {
            logEvent(EventLevel::Warn, "configuration: " + error);
        }
    }

    void SimulationOrchestrator::handleCommand(Command command)
    {
        switch (command)
        {
        case Command::Start:
            start();
            break;
        case Command::Stop:
            stop();
            break;
        case Command::Reset:
            reset();
            break;
        case Command::Step:
            step();
            break;
        }
    }

    void SimulationOrchestrator::runTick()
    {
        const double dt = config.simulation.tick_seconds;
        ensureControllers();

        state.tick++;
        state.timestamp = static_cast<double>(state.tick) * dt;

        if (config.simulation.auto_spawn)
        {
            spawnCycle(dt);
        }

        MovementReport report = movement.advance(state, dt);
        for (VehicleId id : report.removed_stalled)
        {
            std::ostringstream message;
            message << "Vehicle " << id << " removed after " << config.simulation.max_reroute_attempts
                    << " failed reroute attempts";
            logEvent(EventLevel::Warn, message.str());
        }

        const double now = state.timestamp;
        for (auto &entry : state.intersections)
        {
            Intersection &intersection = entry.second;
            SignalController &controller = *controllers[intersection.index];
            intersection.incoming_platoons = collectIncomingPlatoons(state, intersection);
            intersection.ai_decision = controller.decide(intersection.incoming_platoons,
                                                         intersection.signal_state,
                                                         now,
                                                         system_healthy);
        }

        coordinator.coordinate(state);
        applySignals(dt);
        metrics.update(state, report.crossings);
        emitEvents();

        if (on_state_update)
        {
            on_state_update(state);
        }
    }

    void SimulationOrchestrator::applySignals(double dt)
    {
        const double now = state.timestamp;
        for (auto &entry : state.intersections)
        {
            Intersection &intersection = entry.second;
            SignalController &controller = *controllers[intersection.index];
            SignalState &signal = intersection.signal_state;

            if (controller.applyDecision(signal, intersection.ai_decision, now, system_healthy))
            {
                logEvent(EventLevel::Info, intersection.id + ": switching to " +
                                               toString(signal.pending_phase) + " for " +
                                               std::to_string(static_cast<int>(signal.pending_duration)) + "s");
            }

            if (controller.advance(signal, dt))
            {
                auto directions = directionsForPhase(signal.current_phase);
                queues.release(intersection, std::vector<CompassDirection>(directions.begin(), directions.end()));
            }

            if (!controller.getGuardian().isSafe(signal))
            {
                safety_violations++;
                logEvent(EventLevel::Error, intersection.id + ": conflicting greens detected");
            }
        }
    }

    void SimulationOrchestrator::emitEvents()
    {
        const SimulationConfig &sim = config.simulation;

        for (auto &entry : state.vehicles)
        {
            Vehicle &vehicle = entry.second;
            if (!vehicle.wait_warning_issued && vehicle.wait_time > sim.wait_warning_seconds)
            {
                vehicle.wait_warning_issued = true;
                std::ostringstream message;
                message << "Vehicle " << vehicle.id << " has waited more than "
                        << static_cast<int>(sim.wait_warning_seconds) << "s";
                if (vehicle.isAtIntersection())
                {
                    message << " at " << vehicle.current_intersection_id;
                }
                logEvent(EventLevel::Warn, message.str());
            }
        }

        for (auto &entry : state.intersections)
        {
            Intersection &intersection = entry.second;
            const PressurePair &pressure = intersection.ai_decision.pressure_analysis;
            const bool high = std::max(pressure.north_south, pressure.east_west) > sim.high_pressure_event_threshold;
            if (high && !intersection.high_pressure_reported)
            {
                std::ostringstream message;
                message << intersection.id << ": high corridor pressure (NS " << pressure.north_south
                        << ", EW " << pressure.east_west << ")";
                logEvent(EventLevel::Warn, message.str());
            }
            intersection.high_pressure_reported = high;
        }

        const bool low_efficiency = state.network_metrics.efficiency < sim.efficiency_alarm_threshold;
        if (low_efficiency && !state.efficiency_alarm)
        {
            std::ostringstream message;
            message << "Network efficiency dropped to " << static_cast<int>(state.network_metrics.efficiency) << "%";
            logEvent(EventLevel::Error, message.str());
        }
        state.efficiency_alarm = low_efficiency;
    }

    void SimulationOrchestrator::spawnCycle(double dt)
    {
        spawn_timer += dt;
        const double interval = config.simulation.spawn_interval_seconds;
        // Small epsilon against accumulated rounding of the tick length
        if (interval <= 0.0 || spawn_timer + 1e-9 < interval)
        {
            return;
        }
        spawn_timer = 0.0;

        const uint32_t max_count = std::max<uint32_t>(config.simulation.max_spawn_per_cycle, 1);
        std::uniform_int_distribution<uint32_t> count_dist(1, max_count);
        const uint32_t count = count_dist(rng);
        for (uint32_t i = 0; i < count; ++i)
        {
            if (!spawnVehicle().has_value())
            {
                break;
            }
        }
    }

    std::optional<VehicleId> SimulationOrchestrator::spawnVehicle(const std::optional<IntersectionId> &from,
                                                                  const std::optional<IntersectionId> &to)
    {
        std::vector<IntersectionId> ids;
        for (const auto &entry : state.intersections)
        {
            ids.push_back(entry.first);
        }

        auto pick = [this, &ids](const IntersectionId &exclude) -> std::optional<IntersectionId>
        {
            std::vector<IntersectionId> candidates;
            for (const auto &id : ids)
            {
                if (id != exclude)
                {
                    candidates.push_back(id);
                }
            }
            if (candidates.empty())
            {
                return std::nullopt;
            }
            std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
            return candidates[dist(rng)];
        };

        std::optional<IntersectionId> origin = from.has_value() ? from : pick(to.value_or(""));
        if (!origin.has_value() || !findIntersection(state, *origin))
        {
            return std::nullopt;
        }
        std::optional<IntersectionId> destination = to.has_value() ? to : pick(*origin);
        if (!destination.has_value() || !findIntersection(state, *destination) || *origin == *destination)
        {
            return std::nullopt;
        }

        PlannedRoute route = planner.plan(state, *origin, *destination);
        if (route.empty())
        {
            logEvent(EventLevel::Info, "Spawn failed: no route from " + *origin + " to " + *destination);
            return std::nullopt;
        }

        const Intersection &origin_node = state.intersections.at(*origin);

        Vehicle vehicle;
        vehicle.id = state.next_vehicle_id++;
        vehicle.current_intersection_id = origin_node.id;
        vehicle.last_intersection_id = origin_node.id;
        vehicle.destination_intersection_id = *destination;
        vehicle.route = std::move(route.segments);
        vehicle.position = origin_node.position;

        std::uniform_real_distribution<double> speed_dist(40.0, 60.0);
        vehicle.speed = speed_dist(rng);

        std::uniform_int_distribution<int> percent(0, 99);
        const int roll = percent(rng);
        if (roll < 5)
        {
            vehicle.priority = VehiclePriority::Emergency;
        }
        else if (roll < 20)
        {
            vehicle.priority = VehiclePriority::PublicTransport;
        }
        else
        {
            vehicle.priority = VehiclePriority::Normal;
        }

        std::uniform_int_distribution<int> class_dist(0, 3);
        vehicle.vehicle_class = static_cast<VehicleClass>(class_dist(rng));

        const VehicleId id = vehicle.id;
        state.vehicles.emplace(id, std::move(vehicle));
        return id;
    }

    bool SimulationOrchestrator::addIntersection(const IntersectionConfig &intersection, std::string *error)
    {
        if (!signalnet::addIntersection(state, intersection.id, intersection.name, intersection.position, error))
        {
            return false;
        }
        SignalState &signal = state.intersections.at(intersection.id).signal_state;
        signal.phase_time_remaining = config.simulation.initial_phase_seconds;
        signal.next_phase_time = config.simulation.initial_phase_seconds;
        logEvent(EventLevel::Info, "Intersection " + intersection.id + " added");
        return true;
    }

    bool SimulationOrchestrator::addRoad(const RoadConfig &road, std::string *error)
    {
        const Intersection *from = findIntersection(state, road.from);
        const Intersection *to = findIntersection(state, road.to);
        if (!from || !to)
        {
            if (error)
            {
                *error = "road " + road.id + " references an unknown intersection";
            }
            return false;
        }

        Road entry;
        entry.id = road.id;
        entry.from_intersection_id = road.from;
        entry.to_intersection_id = road.to;
        entry.lanes = road.lanes;
        entry.length = road.length;
        entry.speed_limit = road.speed_limit;
        entry.direction = road.direction.value_or(directionBetween(from->position, to->position));
        entry.capacity = road.capacity;
        if (!signalnet::addRoad(state, std::move(entry), error))
        {
            return false;
        }
        logEvent(EventLevel::Info, "Road " + road.id + " added");
        return true;
    }

    bool SimulationOrchestrator::removeIntersection(const IntersectionId &id)
    {
        const Intersection *intersection = findIntersection(state, id);
        if (!intersection)
        {
            return false;
        }

        const std::size_t index = intersection->index;
        for (VehicleId vehicle_id : signalnet::removeIntersection(state, id))
        {
            queues.purgeVehicle(vehicle_id);
        }
        queues.purgeIntersection(index);
        if (index < controllers.size())
        {
            controllers[index].reset();
        }
        MovementEngine::updateRoadOccupancy(state);
        logEvent(EventLevel::Info, "Intersection " + id + " removed");
        return true;
    }

    const NetworkState &SimulationOrchestrator::getState() const
    {
        return state;
    }

    NetworkState SimulationOrchestrator::getSnapshot() const
    {
        return state;
    }

    std::string SimulationOrchestrator::getSnapshotJson() const
    {
        return networkStateToJson(state);
    }

    const NetworkConfig &SimulationOrchestrator::getConfig() const
    {
        return config;
    }

    void SimulationOrchestrator::setSystemHealth(bool healthy)
    {
        system_healthy = healthy;
    }

    bool SimulationOrchestrator::getSystemHealth() const
    {
        return system_healthy;
    }

    std::size_t SimulationOrchestrator::getSafetyViolations() const
    {
        return safety_violations;
    }

    const QueueManager &SimulationOrchestrator::getQueueManager() const
    {
        return queues;
    }

    SignalController *SimulationOrchestrator::getController(const IntersectionId &id)
    {
        const Intersection *intersection = findIntersection(state, id);
        if (!intersection || intersection->index >= controllers.size())
        {
            return nullptr;
        }
        return controllers[intersection->index].get();
    }

    void SimulationOrchestrator::ensureControllers()
    {
        for (const auto &entry : state.intersections)
        {
            const std::size_t index = entry.second.index;
            if (index >= controllers.size())
            {
                controllers.resize(index + 1);
            }
            if (!controllers[index])
            {
                controllers[index] = std::make_unique<SignalController>(config.simulation, rng);
                controllers[index]->getGuardian().recordPhaseChange(state.timestamp);
            }
        }
    }

    void SimulationOrchestrator::rebuildQueues()
    {
        queues.clear();
        for (const auto &entry : state.vehicles)
        {
            const Vehicle &vehicle = entry.second;
            const Intersection *intersection = findIntersection(state, vehicle.current_intersection_id);
            if (intersection && !MovementEngine::isAdmissible(state, vehicle, *intersection) &&
                !queues.enqueue(state, vehicle, *intersection))
            {
                logEvent(EventLevel::Warn, "Vehicle " + std::to_string(vehicle.id) + " could not be queued at " +
                                               intersection->id);
            }
        }
    }

    bool SimulationOrchestrator::recordEvent(EventLevel level, const std::string &message)
    {
        if (message.empty())
        {
            return false;
        }
        logEvent(level, message);
        return true;
    }

    void SimulationOrchestrator::logEvent(EventLevel level, std::string message)
    {
        pushEvent(state, level, std::move(message), config.simulation.event_log_capacity);
    }

} // namespace signalnet

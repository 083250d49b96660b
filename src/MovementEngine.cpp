#include "MovementEngine.hpp"

#include <algorithm>

namespace signalnet
{
    namespace
    {
        Position interpolate(const Position &from, const Position &to, double fraction)
        {
            return Position{from.x + (to.x - from.x) * fraction, from.y + (to.y - from.y) * fraction};
        }
    }

    MovementEngine::MovementEngine(QueueManager &queues, const RoutePlanner &planner, const SimulationConfig &config)
        : queues(queues), planner(planner), config(config)
    {
    }

    bool MovementEngine::isAdmissible(const NetworkState &state, const Vehicle &vehicle, const Intersection &intersection)
    {
        if (vehicle.priority == VehiclePriority::Emergency)
        {
            return true;
        }

        const RouteSegment *next = departingSegment(vehicle, intersection.id);
        if (!next)
        {
            return true;
        }
        const Road *road = findRoad(state, next->road_id);
        if (!road)
        {
            return false;
        }

        const SignalState &signal = intersection.signal_state;
        if (signal.anyYellow())
        {
            return false;
        }
        const Phase wanted = phaseForDirection(road->direction);
        return signal.current_phase == wanted && signal.colorFor(wanted) == LightColor::Green;
    }

    void MovementEngine::updateRoadOccupancy(NetworkState &state)
    {
        for (auto &entry : state.roads)
        {
            entry.second.current_flow = 0;
        }
        for (const auto &entry : state.vehicles)
        {
            if (Road *road = findRoad(state, entry.second.current_road_id))
            {
                road->current_flow++;
            }
        }
        for (auto &entry : state.roads)
        {
            recomputeTravelTime(entry.second);
        }
    }

    MovementReport MovementEngine::advance(NetworkState &state, double dt_seconds)
    {
        MovementReport report;

        std::vector<VehicleId> ids;
        ids.reserve(state.vehicles.size());
        for (const auto &entry : state.vehicles)
        {
            ids.push_back(entry.first);
        }

        for (VehicleId id : ids)
        {
            auto it = state.vehicles.find(id);
            if (it == state.vehicles.end())
            {
                continue;
            }
            Vehicle &vehicle = it->second;

            if (vehicle.route.empty())
            {
                if (vehicle.hasArrived())
                {
                    report.arrived.push_back(id);
                    removeVehicle(state, id);
                }
                else
                {
                    handleStalled(state, vehicle, dt_seconds, report);
                }
                continue;
            }

            if (vehicle.isAtIntersection())
            {
                advanceAtIntersection(state, vehicle, dt_seconds, report);
            }
            else if (vehicle.isOnRoad())
            {
                advanceOnRoad(state, vehicle, dt_seconds, report);
            }
            else if (Intersection *intersection = findIntersection(state, vehicle.route.front().from_intersection_id))
            {
                // Between roads: settle at the node the next segment starts from.
                vehicle.current_intersection_id = intersection->id;
                vehicle.position = intersection->position;
            }
            else
            {
                report.skipped.push_back(id);
            }
        }

        updateRoadOccupancy(state);
        return report;
    }

    void MovementEngine::advanceAtIntersection(NetworkState &state, Vehicle &vehicle, double dt, MovementReport &report)
    {
        Intersection *intersection = findIntersection(state, vehicle.current_intersection_id);
        const RouteSegment *next = intersection ? departingSegment(vehicle, intersection->id) : nullptr;
        if (!intersection || !next || !findRoad(state, next->road_id))
        {
            report.skipped.push_back(vehicle.id);
            return;
        }

        if (!isAdmissible(state, vehicle, *intersection))
        {
            vehicle.wait_time += dt;
            if (!queues.enqueue(state, vehicle, *intersection))
            {
                report.skipped.push_back(vehicle.id);
            }
            return;
        }

        queues.dequeue(vehicle.id, *intersection);
        if (enterNextRoad(state, vehicle, *intersection))
        {
            report.crossings[intersection->id]++;
        }
        else
        {
            report.skipped.push_back(vehicle.id);
        }
    }

    void MovementEngine::advanceOnRoad(NetworkState &state, Vehicle &vehicle, double dt, MovementReport &report)
    {
        const Road *road = findRoad(state, vehicle.current_road_id);
        RouteSegment &segment = vehicle.route.front();
        const Intersection *origin = findIntersection(state, segment.from_intersection_id);
        Intersection *downstream = findIntersection(state, segment.to_intersection_id);
        if (!road || !origin || !downstream || segment.road_id != vehicle.current_road_id)
        {
            report.skipped.push_back(vehicle.id);
            return;
        }

        const double step = vehicle.speed / 3.6 * dt;
        const bool admissible = isAdmissible(state, vehicle, *downstream);

        if (segment.distance_remaining <= 2.0 * step && !admissible)
        {
            vehicle.wait_time += dt;
            return;
        }

        segment.distance_remaining -= step;
        const double fraction = road->length > 0.0
                                    ? std::clamp(1.0 - segment.distance_remaining / road->length, 0.0, 1.0)
                                    : 1.0;
        vehicle.route_progress = fraction;
        vehicle.position = interpolate(origin->position, downstream->position, fraction);

        if (segment.distance_remaining > 0.0)
        {
            return;
        }

        vehicle.route.pop_front();
        vehicle.current_road_id.clear();
        vehicle.last_intersection_id = downstream->id;
        vehicle.position = downstream->position;

        if (!admissible)
        {
            vehicle.current_intersection_id = downstream->id;
            vehicle.wait_time += dt;
            if (!queues.enqueue(state, vehicle, *downstream))
            {
                report.skipped.push_back(vehicle.id);
            }
            return;
        }

        report.crossings[downstream->id]++;
        if (vehicle.route.empty())
        {
            if (vehicle.hasArrived())
            {
                report.arrived.push_back(vehicle.id);
                removeVehicle(state, vehicle.id);
            }
            else
            {
                vehicle.current_intersection_id = downstream->id;
            }
            return;
        }

        if (!enterNextRoad(state, vehicle, *downstream))
        {
            vehicle.current_intersection_id = downstream->id;
            report.skipped.push_back(vehicle.id);
        }
    }

    void MovementEngine::handleStalled(NetworkState &state, Vehicle &vehicle, double dt, MovementReport &report)
    {
        if (!vehicle.isAtIntersection() && !vehicle.isOnRoad())
        {
            vehicle.current_intersection_id = vehicle.last_intersection_id;
        }
        const Intersection *node = findIntersection(state, vehicle.current_intersection_id);
        if (!node)
        {
            report.skipped.push_back(vehicle.id);
            return;
        }

        vehicle.wait_time += dt;
        vehicle.stalled_ticks++;
        const uint32_t interval = std::max<uint32_t>(config.reroute_interval_ticks, 1);
        if (vehicle.stalled_ticks % interval != 0)
        {
            return;
        }

        PlannedRoute route = planner.plan(state, node->id, vehicle.destination_intersection_id);
        if (!route.empty())
        {
            vehicle.route = std::move(route.segments);
            vehicle.route_progress = 0.0;
            vehicle.stalled_ticks = 0;
            vehicle.reroute_attempts = 0;
            report.rerouted.push_back(vehicle.id);
            return;
        }

        vehicle.reroute_attempts++;
        if (vehicle.reroute_attempts >= config.max_reroute_attempts)
        {
            report.removed_stalled.push_back(vehicle.id);
            removeVehicle(state, vehicle.id);
        }
    }

    bool MovementEngine::enterNextRoad(NetworkState &state, Vehicle &vehicle, const Intersection &intersection)
    {
        // Drop segments that end before this node, left over from a reroute.
        while (!vehicle.route.empty() && vehicle.route.front().from_intersection_id != intersection.id)
        {
            vehicle.route.pop_front();
        }
        if (vehicle.route.empty() || !findRoad(state, vehicle.route.front().road_id))
        {
            return false;
        }

        vehicle.current_intersection_id.clear();
        vehicle.current_road_id = vehicle.route.front().road_id;
        vehicle.last_intersection_id = intersection.id;
        vehicle.route_progress = 0.0;
        vehicle.position = intersection.position;
        return true;
    }

    void MovementEngine::removeVehicle(NetworkState &state, VehicleId id)
    {
        queues.purgeVehicle(id);
        state.vehicles.erase(id);
    }

} // namespace signalnet

#include "NetworkCoordinator.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace signalnet
{
    NetworkCoordinator::NetworkCoordinator(const SimulationConfig &config)
        : config(config)
    {
    }

    CoordinationReport NetworkCoordinator::coordinate(NetworkState &state) const
    {
        CoordinationReport report;
        report.green_wave_extensions = applyGreenWave(state);
        report.corridor_overrides = applyCorridorPressure(state);
        return report;
    }

    std::size_t NetworkCoordinator::applyGreenWave(NetworkState &state) const
    {
        const double speed = config.coordination_speed_kmh / 3.6;
        if (speed <= 0.0)
        {
            return 0;
        }

        std::set<IntersectionId> extended;
        for (const auto &entry : state.roads)
        {
            const Road &road = entry.second;
            Intersection *upstream = findIntersection(state, road.from_intersection_id);
            const Intersection *downstream = findIntersection(state, road.to_intersection_id);
            if (!upstream || !downstream || extended.count(upstream->id) != 0)
            {
                continue;
            }

            const PhaseAction action = upstream->ai_decision.recommended_action;
            if (action == PhaseAction::Hold || action != downstream->ai_decision.recommended_action)
            {
                continue;
            }

            const double travel_time = distanceBetween(upstream->position, downstream->position) / speed;
            const double offset = std::abs(upstream->signal_state.phase_time_remaining -
                                           downstream->signal_state.phase_time_remaining);
            if (offset > travel_time * (1.0 - config.green_wave_tolerance) &&
                offset < travel_time * (1.0 + config.green_wave_tolerance))
            {
                TimingPlan &plan = upstream->ai_decision.timing_plan;
                plan.duration += config.green_wave_extension_seconds;
                plan.end_time = plan.start_time + plan.duration;
                extended.insert(upstream->id);
            }
        }
        return extended.size();
    }

    std::size_t NetworkCoordinator::applyCorridorPressure(NetworkState &state) const
    {
        std::size_t overrides = 0;
        for (auto &entry : state.intersections)
        {
            Intersection &intersection = entry.second;
            const PressurePair pressure = corridorPressure(state, intersection);
            AIDecision &decision = intersection.ai_decision;
            decision.pressure_analysis = pressure;

            const bool ns_loaded = pressure.north_south > config.corridor_pressure_threshold;
            const bool ew_loaded = pressure.east_west > config.corridor_pressure_threshold;
            PhaseAction forced = PhaseAction::Hold;
            if (ns_loaded && (!ew_loaded || pressure.north_south >= pressure.east_west))
            {
                forced = PhaseAction::NorthSouth;
            }
            else if (ew_loaded)
            {
                forced = PhaseAction::EastWest;
            }
            if (forced == PhaseAction::Hold)
            {
                continue;
            }

            decision.recommended_action = forced;
            decision.timing_plan.duration = std::max(decision.timing_plan.duration, config.corridor_min_duration);
            decision.timing_plan.end_time = decision.timing_plan.start_time + decision.timing_plan.duration;
            overrides++;
        }
        return overrides;
    }

    PressurePair NetworkCoordinator::corridorPressure(const NetworkState &state, const Intersection &intersection)
    {
        PressurePair pressure;
        for (const auto &entry : state.vehicles)
        {
            const Vehicle &vehicle = entry.second;
            const bool resident = vehicle.current_intersection_id == intersection.id;
            const bool approaching = vehicle.isOnRoad() && !vehicle.route.empty() &&
                                     vehicle.route.front().to_intersection_id == intersection.id;
            if (!resident && !approaching)
            {
                continue;
            }

            const RouteSegment *next = departingSegment(vehicle, intersection.id);
            const Road *road = next ? findRoad(state, next->road_id) : nullptr;
            if (!road)
            {
                continue;
            }

            const double contribution = 0.5 + 0.1 * vehicle.wait_time;
            if (phaseForDirection(road->direction) == Phase::NorthSouth)
            {
                pressure.north_south += contribution;
            }
            else
            {
                pressure.east_west += contribution;
            }
        }
        return pressure;
    }

} // namespace signalnet

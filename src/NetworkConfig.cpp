#include "NetworkConfig.hpp"

#include <cmath>
#include <unordered_set>

namespace signalnet
{
    std::optional<NetworkConfig> makeNetworkConfig(const std::string &layout)
    {
        if (layout == "grid-2x2")
        {
            return makeGrid2x2NetworkConfig();
        }
        if (layout == "custom")
        {
            NetworkConfig config;
            config.layout = "custom";
            return config;
        }
        return std::nullopt;
    }

    std::vector<std::string> validateNetworkConfig(const NetworkConfig &config)
    {
        std::vector<std::string> errors;
        std::unordered_set<IntersectionId> seen_intersections;
        std::unordered_set<RoadId> seen_roads;

        for (const auto &intersection : config.intersections)
        {
            if (intersection.id.empty())
            {
                errors.push_back("intersection id must not be empty");
                continue;
            }
            if (!seen_intersections.insert(intersection.id).second)
            {
                errors.push_back("duplicate intersection id: " + intersection.id);
            }
            if (!std::isfinite(intersection.position.x) || !std::isfinite(intersection.position.y))
            {
                errors.push_back("intersection " + intersection.id + " has a non-finite position");
            }
        }

        for (const auto &road : config.roads)
        {
            if (road.id.empty())
            {
                errors.push_back("road id must not be empty");
                continue;
            }
            if (!seen_roads.insert(road.id).second)
            {
                errors.push_back("duplicate road id: " + road.id);
            }
            if (seen_intersections.find(road.from) == seen_intersections.end() ||
                seen_intersections.find(road.to) == seen_intersections.end())
            {
                errors.push_back("road " + road.id + " references an unknown intersection");
            }
            if (road.from == road.to)
            {
                errors.push_back("road " + road.id + " must connect two different intersections");
            }
            if (!(road.length > 0.0) || !(road.speed_limit > 0.0))
            {
                errors.push_back("road " + road.id + " needs positive length and speed limit");
            }
            if (road.capacity == 0)
            {
                errors.push_back("road " + road.id + " needs a positive capacity");
            }
            if (road.lanes == 0)
            {
                errors.push_back("road " + road.id + " needs at least one lane");
            }
        }

        const SimulationConfig &sim = config.simulation;
        if (!(sim.tick_seconds > 0.0) || !(sim.base_tick_interval_ms > 0.0))
        {
            errors.push_back("simulation tick must be positive");
        }
        if (sim.min_green_seconds < 0.0 || sim.max_green_seconds < sim.min_green_seconds)
        {
            errors.push_back("simulation green limits must satisfy 0 <= min <= max");
        }
        if (sim.yellow_seconds < 0.0)
        {
            errors.push_back("simulation yellow time must not be negative");
        }
        if (!(sim.saturation_flow_rate > 0.0))
        {
            errors.push_back("simulation saturation flow rate must be positive");
        }
        if (sim.min_plan_duration > sim.max_plan_duration)
        {
            errors.push_back("simulation plan duration limits are inverted");
        }
        if (!(sim.coordination_speed_kmh > 0.0))
        {
            errors.push_back("simulation coordination speed must be positive");
        }
        if (sim.event_log_capacity == 0)
        {
            errors.push_back("simulation event log capacity must be positive");
        }

        return errors;
    }

    NetworkState buildNetworkState(const NetworkConfig &config, std::vector<std::string> *errors)
    {
        NetworkState state;
        std::string error;
        for (const auto &entry : config.intersections)
        {
            if (!addIntersection(state, entry.id, entry.name, entry.position, &error))
            {
                if (errors)
                {
                    errors->push_back(error);
                }
                continue;
            }
            Intersection &intersection = state.intersections.at(entry.id);
            intersection.signal_state.phase_time_remaining = config.simulation.initial_phase_seconds;
            intersection.signal_state.next_phase_time = config.simulation.initial_phase_seconds;
        }

        for (const auto &entry : config.roads)
        {
            const Intersection *from = findIntersection(state, entry.from);
            const Intersection *to = findIntersection(state, entry.to);
            if (!from || !to)
            {
                if (errors)
                {
                    errors->push_back("road " + entry.id + " references an unknown intersection");
                }
                continue;
            }

            Road road;
            road.id = entry.id;
            road.from_intersection_id = entry.from;
            road.to_intersection_id = entry.to;
            road.lanes = entry.lanes;
            road.length = entry.length;
            road.speed_limit = entry.speed_limit;
            road.direction = entry.direction.value_or(directionBetween(from->position, to->position));
            road.capacity = entry.capacity;
            if (!addRoad(state, std::move(road), &error) && errors)
            {
                errors->push_back(error);
            }
        }
        return state;
    }

} // namespace signalnet

#include "Network.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <utility>

namespace signalnet
{
    double distanceBetween(const Position &a, const Position &b)
    {
        const double dx = b.x - a.x;
        const double dy = b.y - a.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    CompassDirection directionBetween(const Position &from, const Position &to)
    {
        const double dx = to.x - from.x;
        const double dy = to.y - from.y;
        if (std::abs(dx) >= std::abs(dy))
        {
            return dx >= 0.0 ? CompassDirection::East : CompassDirection::West;
        }
        return dy > 0.0 ? CompassDirection::South : CompassDirection::North;
    }

    Intersection *findIntersection(NetworkState &state, const IntersectionId &id)
    {
        auto it = state.intersections.find(id);
        return it == state.intersections.end() ? nullptr : &it->second;
    }

    const Intersection *findIntersection(const NetworkState &state, const IntersectionId &id)
    {
        auto it = state.intersections.find(id);
        return it == state.intersections.end() ? nullptr : &it->second;
    }

    Road *findRoad(NetworkState &state, const RoadId &id)
    {
        auto it = state.roads.find(id);
        return it == state.roads.end() ? nullptr : &it->second;
    }

    const Road *findRoad(const NetworkState &state, const RoadId &id)
    {
        auto it = state.roads.find(id);
        return it == state.roads.end() ? nullptr : &it->second;
    }

    const RouteSegment *departingSegment(const Vehicle &vehicle, const IntersectionId &intersection_id)
    {
        for (std::size_t i = 0; i < vehicle.route.size() && i < 2; ++i)
        {
            if (vehicle.route[i].from_intersection_id == intersection_id)
            {
                return &vehicle.route[i];
            }
        }
        return nullptr;
    }

    double baseTravelTime(const Road &road)
    {
        if (road.speed_limit <= 0.0 || road.length <= 0.0)
        {
            return 0.0;
        }
        return road.length / (road.speed_limit / 3.6);
    }

    void recomputeTravelTime(Road &road)
    {
        const std::size_t capacity = std::max<std::size_t>(road.capacity, 1);
        road.current_flow = std::min(road.current_flow, capacity);
        const double congestion = static_cast<double>(road.current_flow) / static_cast<double>(capacity);
        road.travel_time = std::max(0.0, baseTravelTime(road) * (1.0 + congestion * 2.0));
    }

    bool addIntersection(NetworkState &state,
                         const IntersectionId &id,
                         const std::string &name,
                         Position position,
                         std::string *error)
    {
        if (id.empty())
        {
            if (error)
            {
                *error = "intersection id must not be empty";
            }
            return false;
        }
        if (state.intersections.count(id) != 0)
        {
            if (error)
            {
                *error = "duplicate intersection id: " + id;
            }
            return false;
        }

        Intersection intersection;
        intersection.id = id;
        intersection.index = state.next_intersection_index++;
        intersection.name = name.empty() ? id : name;
        intersection.position = position;
        state.intersections.emplace(id, std::move(intersection));
        return true;
    }

    bool addRoad(NetworkState &state, Road road, std::string *error)
    {
        auto fail = [error](const std::string &message)
        {
            if (error)
            {
                *error = message;
            }
            return false;
        };

        if (road.id.empty())
        {
            return fail("road id must not be empty");
        }
        if (state.roads.count(road.id) != 0)
        {
            return fail("duplicate road id: " + road.id);
        }
        if (!findIntersection(state, road.from_intersection_id) || !findIntersection(state, road.to_intersection_id))
        {
            return fail("road " + road.id + " references an unknown intersection");
        }
        if (road.from_intersection_id == road.to_intersection_id)
        {
            return fail("road " + road.id + " must connect two different intersections");
        }
        if (road.length <= 0.0 || road.speed_limit <= 0.0 || road.capacity == 0)
        {
            return fail("road " + road.id + " needs positive length, speed limit and capacity");
        }

        road.current_flow = 0;
        recomputeTravelTime(road);
        state.roads.emplace(road.id, std::move(road));
        return true;
    }

    std::vector<VehicleId> removeIntersection(NetworkState &state, const IntersectionId &id)
    {
        std::vector<VehicleId> removed;
        if (state.intersections.erase(id) == 0)
        {
            return removed;
        }

        std::vector<RoadId> incident;
        for (const auto &entry : state.roads)
        {
            if (entry.second.from_intersection_id == id || entry.second.to_intersection_id == id)
            {
                incident.push_back(entry.first);
            }
        }
        for (const auto &road_id : incident)
        {
            state.roads.erase(road_id);
        }

        for (auto it = state.vehicles.begin(); it != state.vehicles.end();)
        {
            const Vehicle &vehicle = it->second;
            bool affected = vehicle.current_intersection_id == id || vehicle.destination_intersection_id == id;
            affected = affected || std::find(incident.begin(), incident.end(), vehicle.current_road_id) != incident.end();
            for (const auto &segment : vehicle.route)
            {
                if (affected)
                {
                    break;
                }
                affected = std::find(incident.begin(), incident.end(), segment.road_id) != incident.end();
            }

            if (affected)
            {
                removed.push_back(it->first);
                it = state.vehicles.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    void pushEvent(NetworkState &state, EventLevel level, std::string message, std::size_t capacity)
    {
        SystemEvent event;
        event.id = state.next_event_id++;
        event.timestamp = state.timestamp;
        event.level = level;
        event.message = std::move(message);
        state.events.push_front(std::move(event));
        while (state.events.size() > capacity)
        {
            state.events.pop_back();
        }
    }

    const char *toString(CompassDirection direction)
    {
        switch (direction)
        {
        case CompassDirection::North:
            return "north";
        case CompassDirection::East:
            return "east";
        case CompassDirection::South:
            return "south";
        case CompassDirection::West:
            return "west";
        }
        return "north";
    }

    const char *toString(Phase phase)
    {
        return phase == Phase::NorthSouth ? "NS" : "EW";
    }

    const char *toString(PhaseAction action)
    {
        switch (action)
        {
        case PhaseAction::NorthSouth:
            return "NS";
        case PhaseAction::EastWest:
            return "EW";
        case PhaseAction::Hold:
            return "HOLD";
        }
        return "HOLD";
    }

    const char *toString(LightColor color)
    {
        switch (color)
        {
        case LightColor::Red:
            return "red";
        case LightColor::Yellow:
            return "yellow";
        case LightColor::Green:
            return "green";
        }
        return "red";
    }

    const char *toString(VehiclePriority priority)
    {
        switch (priority)
        {
        case VehiclePriority::Normal:
            return "normal";
        case VehiclePriority::PublicTransport:
            return "public_transport";
        case VehiclePriority::Emergency:
            return "emergency";
        }
        return "normal";
    }

    const char *toString(VehicleClass vehicle_class)
    {
        switch (vehicle_class)
        {
        case VehicleClass::Car:
            return "car";
        case VehicleClass::Truck:
            return "truck";
        case VehicleClass::Bus:
            return "bus";
        case VehicleClass::Motorcycle:
            return "motorcycle";
        }
        return "car";
    }

    const char *toString(CongestionLevel level)
    {
        switch (level)
        {
        case CongestionLevel::Low:
            return "low";
        case CongestionLevel::Medium:
            return "medium";
        case CongestionLevel::High:
            return "high";
        case CongestionLevel::Critical:
            return "critical";
        }
        return "low";
    }

    const char *toString(EventLevel level)
    {
        switch (level)
        {
        case EventLevel::Debug:
            return "DEBUG";
        case EventLevel::Info:
            return "INFO";
        case EventLevel::Warn:
            return "WARN";
        case EventLevel::Error:
            return "ERROR";
        }
        return "INFO";
    }

    bool directionFromString(const std::string &value, CompassDirection &direction)
    {
        if (value == "north")
        {
            direction = CompassDirection::North;
            return true;
        }
        if (value == "east")
        {
            direction = CompassDirection::East;
            return true;
        }
        if (value == "south")
        {
            direction = CompassDirection::South;
            return true;
        }
        if (value == "west")
        {
            direction = CompassDirection::West;
            return true;
        }
        return false;
    }

    bool eventLevelFromString(const std::string &value, EventLevel &level)
    {
        for (EventLevel candidate : {EventLevel::Debug, EventLevel::Info, EventLevel::Warn, EventLevel::Error})
        {
            if (value == toString(candidate))
            {
                level = candidate;
                return true;
            }
        }
        return false;
    }

} // namespace signalnet

#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace signalnet
{
    using IntersectionId = std::string;
    using RoadId = std::string;
    using VehicleId = uint32_t;

    // Order: North, East, South, West
    enum class CompassDirection : uint8_t
    {
        North = 0,
        East = 1,
        South = 2,
        West = 3
    };

    enum class Phase : uint8_t
    {
        NorthSouth,
        EastWest
    };

    enum class PhaseAction : uint8_t
    {
        NorthSouth,
        EastWest,
        Hold
    };

    enum class LightColor : uint8_t
    {
        Red,
        Yellow,
        Green
    };

    enum class VehiclePriority : uint8_t
    {
        Normal,
        PublicTransport,
        Emergency
    };

    enum class VehicleClass : uint8_t
    {
        Car,
        Truck,
        Bus,
        Motorcycle
    };

    enum class CongestionLevel : uint8_t
    {
        Low,
        Medium,
        High,
        Critical
    };

    enum class EventLevel : uint8_t
    {
        Debug,
        Info,
        Warn,
        Error
    };

    constexpr std::array<CompassDirection, 4> kAllDirections = {
        CompassDirection::North, CompassDirection::East, CompassDirection::South, CompassDirection::West};

    inline std::size_t directionIndex(CompassDirection direction)
    {
        return static_cast<std::size_t>(static_cast<uint8_t>(direction));
    }

    inline Phase phaseForDirection(CompassDirection direction)
    {
        return (direction == CompassDirection::North || direction == CompassDirection::South)
                   ? Phase::NorthSouth
                   : Phase::EastWest;
    }

    inline std::array<CompassDirection, 2> directionsForPhase(Phase phase)
    {
        if (phase == Phase::NorthSouth)
        {
            return {CompassDirection::North, CompassDirection::South};
        }
        return {CompassDirection::East, CompassDirection::West};
    }

    inline Phase oppositePhase(Phase phase)
    {
        return phase == Phase::NorthSouth ? Phase::EastWest : Phase::NorthSouth;
    }

    inline PhaseAction actionForPhase(Phase phase)
    {
        return phase == Phase::NorthSouth ? PhaseAction::NorthSouth : PhaseAction::EastWest;
    }

    inline bool actionMatchesPhase(PhaseAction action, Phase phase)
    {
        return action != PhaseAction::Hold && action == actionForPhase(phase);
    }

    struct Position
    {
        double x = 0.0; // east is +x
        double y = 0.0; // south is +y
    };

    double distanceBetween(const Position &a, const Position &b);

    // Dominant compass heading of the segment a -> b.
    CompassDirection directionBetween(const Position &from, const Position &to);

    struct SignalState
    {
        Phase current_phase{Phase::NorthSouth};
        LightColor north_south{LightColor::Green};
        LightColor east_west{LightColor::Red};
        double phase_time_remaining = 0.0;
        double next_phase_time = 0.0;

        // Yellow clearance bookkeeping while a phase change is in flight
        bool transition_pending = false;
        Phase pending_phase{Phase::NorthSouth};
        double yellow_time_remaining = 0.0;
        double pending_duration = 0.0;
        double pending_next_phase_time = 0.0;

        LightColor colorFor(Phase phase) const
        {
            return phase == Phase::NorthSouth ? north_south : east_west;
        }

        bool anyYellow() const
        {
            return north_south == LightColor::Yellow || east_west == LightColor::Yellow;
        }
    };

    struct Platoon
    {
        CompassDirection direction{CompassDirection::North};
        std::size_t vehicle_count = 0;
        double eta = 0.0;   // seconds
        double speed = 0.0; // km/h
    };

    struct PressurePair
    {
        double north_south = 0.0;
        double east_west = 0.0;

        double forPhase(Phase phase) const
        {
            return phase == Phase::NorthSouth ? north_south : east_west;
        }
    };

    struct GuardianChecks
    {
        bool min_green_time = false;
        bool safe_transition = false;
        bool system_health = false;

        bool allPassed() const
        {
            return min_green_time && safe_transition && system_health;
        }
    };

    struct TimingPlan
    {
        double start_time = 0.0;
        double duration = 0.0;
        double end_time = 0.0;
    };

    struct AIDecision
    {
        PressurePair q_values;
        PhaseAction recommended_action{PhaseAction::Hold};
        GuardianChecks guardian_checks;
        TimingPlan timing_plan;
        PressurePair pressure_analysis;
    };

    struct IntersectionMetrics
    {
        std::array<std::size_t, 4> queue_lengths{}; // North, East, South, West
        std::size_t total_queue_length = 0;
        double average_wait_time = 0.0;
        double throughput = 0.0;
        double efficiency = 100.0;
    };

    struct Intersection
    {
        IntersectionId id;
        std::size_t index = 0; // stable slot for per-intersection arenas
        std::string name;
        Position position;
        SignalState signal_state;
        IntersectionMetrics metrics;
        std::vector<Platoon> incoming_platoons;
        AIDecision ai_decision;
        bool active = true;
        bool high_pressure_reported = false;
    };

    struct Road
    {
        RoadId id;
        IntersectionId from_intersection_id;
        IntersectionId to_intersection_id;
        uint16_t lanes = 1;
        double length = 0.0;       // meters
        double speed_limit = 50.0; // km/h
        CompassDirection direction{CompassDirection::North};
        std::size_t capacity = 1;
        std::size_t current_flow = 0;
        double travel_time = 0.0; // seconds
    };

    struct RouteSegment
    {
        RoadId road_id;
        IntersectionId from_intersection_id;
        IntersectionId to_intersection_id;
        double distance_remaining = 0.0; // meters
    };

    struct Vehicle
    {
        VehicleId id = 0;
        RoadId current_road_id;                 // empty when not on a road
        IntersectionId current_intersection_id; // empty when not resident at an intersection
        IntersectionId destination_intersection_id;
        IntersectionId last_intersection_id;
        std::deque<RouteSegment> route;
        double route_progress = 0.0;
        double speed = 50.0; // km/h
        Position position;
        double wait_time = 0.0;
        VehiclePriority priority{VehiclePriority::Normal};
        VehicleClass vehicle_class{VehicleClass::Car};
        uint32_t reroute_attempts = 0;
        uint32_t stalled_ticks = 0;
        bool wait_warning_issued = false;

        bool isOnRoad() const { return !current_road_id.empty(); }
        bool isAtIntersection() const { return !current_intersection_id.empty(); }
        bool hasArrived() const { return route.empty() && last_intersection_id == destination_intersection_id; }
    };

    struct NetworkMetrics
    {
        std::size_t total_vehicles = 0;
        double average_wait_time = 0.0;
        double average_speed = 0.0;
        std::size_t total_queue_length = 0;
        double network_throughput = 0.0;
        CongestionLevel congestion_level{CongestionLevel::Low};
        double efficiency = 100.0;
    };

    struct SystemEvent
    {
        uint64_t id = 0;
        double timestamp = 0.0; // simulation seconds
        EventLevel level{EventLevel::Info};
        std::string message;
    };

    struct NetworkState
    {
        std::map<IntersectionId, Intersection> intersections;
        std::map<RoadId, Road> roads;
        std::map<VehicleId, Vehicle> vehicles;
        NetworkMetrics network_metrics;
        std::deque<SystemEvent> events; // newest first
        bool running = false;
        double simulation_speed = 1.0;
        double timestamp = 0.0; // simulation seconds
        uint64_t tick = 0;
        bool efficiency_alarm = false;

        std::size_t next_intersection_index = 0;
        VehicleId next_vehicle_id = 1;
        uint64_t next_event_id = 1;
    };

    Intersection *findIntersection(NetworkState &state, const IntersectionId &id);
    const Intersection *findIntersection(const NetworkState &state, const IntersectionId &id);
    Road *findRoad(NetworkState &state, const RoadId &id);
    const Road *findRoad(const NetworkState &state, const RoadId &id);

    // The segment a vehicle will take when leaving the given intersection, or
    // nullptr when that intersection ends its trip.
    const RouteSegment *departingSegment(const Vehicle &vehicle, const IntersectionId &intersection_id);

    double baseTravelTime(const Road &road);
    void recomputeTravelTime(Road &road);

    bool addIntersection(NetworkState &state,
                         const IntersectionId &id,
                         const std::string &name,
                         Position position,
                         std::string *error = nullptr);
    bool addRoad(NetworkState &state, Road road, std::string *error = nullptr);

    // Removes the intersection, its incident roads and every vehicle that is
    // resident at it, travelling an incident road or routed over one.
    // Returns the ids of the removed vehicles.
    std::vector<VehicleId> removeIntersection(NetworkState &state, const IntersectionId &id);

    void pushEvent(NetworkState &state, EventLevel level, std::string message, std::size_t capacity = 50);

    const char *toString(CompassDirection direction);
    const char *toString(Phase phase);
    const char *toString(PhaseAction action);
    const char *toString(LightColor color);
    const char *toString(VehiclePriority priority);
    const char *toString(VehicleClass vehicle_class);
    const char *toString(CongestionLevel level);
    const char *toString(EventLevel level);

    bool directionFromString(const std::string &value, CompassDirection &direction);
    bool eventLevelFromString(const std::string &value, EventLevel &level);

} // namespace signalnet

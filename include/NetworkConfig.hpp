#pragma once

#include "Network.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace signalnet
{
    // Tuning knobs shared by every component. Times are seconds, speeds km/h.
    struct SimulationConfig
    {
        double tick_seconds = 0.1;
        double base_tick_interval_ms = 100.0;

        // Guardian
        double min_green_seconds = 5.0;
        double max_green_seconds = 45.0;
        double yellow_seconds = 2.0;

        // Timing plan
        double saturation_flow_rate = 2.5; // vehicles per second
        double min_plan_duration = 8.0;
        double max_plan_duration = 35.0;
        double plan_buffer_seconds = 2.0;
        double plan_lead_seconds = 3.0;
        double initial_phase_seconds = 10.0;

        // Predictor
        double exploration_rate = 0.2;
        double learning_rate = 0.1;

        // Routing and spawning
        double route_penalty_factor = 10.0;
        bool auto_spawn = true;
        double spawn_interval_seconds = 5.0;
        uint32_t max_spawn_per_cycle = 3;
        uint32_t reroute_interval_ticks = 10;
        uint32_t max_reroute_attempts = 5;

        // Coordination
        double coordination_speed_kmh = 50.0;
        double green_wave_tolerance = 0.2;
        double green_wave_extension_seconds = 5.0;
        double corridor_pressure_threshold = 2.0;
        double corridor_min_duration = 30.0;

        // Events
        double wait_warning_seconds = 30.0;
        double high_pressure_event_threshold = 3.0;
        double efficiency_alarm_threshold = 60.0;
        std::size_t event_log_capacity = 50;
    };

    struct IntersectionConfig
    {
        IntersectionId id;
        std::string name;
        Position position;
    };

    struct RoadConfig
    {
        RoadId id;
        IntersectionId from;
        IntersectionId to;
        uint16_t lanes = 2;
        double length = 400.0;
        double speed_limit = 50.0;
        std::optional<CompassDirection> direction; // derived from positions when unset
        std::size_t capacity = 20;
    };

    struct NetworkConfig
    {
        std::string layout = "grid-2x2";
        std::vector<IntersectionConfig> intersections;
        std::vector<RoadConfig> roads;
        SimulationConfig simulation;
    };

    inline NetworkConfig makeGrid2x2NetworkConfig()
    {
        NetworkConfig config;
        config.layout = "grid-2x2";

        // A - B
        // |   |
        // C - D
        config.intersections = {
            {"A", "North-West", {100.0, 100.0}},
            {"B", "North-East", {500.0, 100.0}},
            {"C", "South-West", {100.0, 500.0}},
            {"D", "South-East", {500.0, 500.0}}};

        config.roads = {
            {"A-B", "A", "B", 2, 400.0, 50.0, CompassDirection::East, 20},
            {"B-A", "B", "A", 2, 400.0, 50.0, CompassDirection::West, 20},
            {"C-D", "C", "D", 2, 400.0, 50.0, CompassDirection::East, 20},
            {"D-C", "D", "C", 2, 400.0, 50.0, CompassDirection::West, 20},
            {"A-C", "A", "C", 2, 400.0, 50.0, CompassDirection::South, 20},
            {"C-A", "C", "A", 2, 400.0, 50.0, CompassDirection::North, 20},
            {"B-D", "B", "D", 2, 400.0, 50.0, CompassDirection::South, 20},
            {"D-B", "D", "B", 2, 400.0, 50.0, CompassDirection::North, 20}};

        return config;
    }

    // "grid-2x2" yields the fixed demo grid, "custom" an empty topology to be
    // filled by the caller. Unknown names yield nullopt.
    std::optional<NetworkConfig> makeNetworkConfig(const std::string &layout);

    std::vector<std::string> validateNetworkConfig(const NetworkConfig &config);

    // Instantiates a live network. Invalid entries are skipped and reported
    // through errors when given.
    NetworkState buildNetworkState(const NetworkConfig &config, std::vector<std::string> *errors = nullptr);

} // namespace signalnet

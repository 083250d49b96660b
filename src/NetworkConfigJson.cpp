#include "NetworkConfigJson.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>

namespace signalnet
{
    namespace
    {
        using nlohmann::json;

        json simulationToJson(const SimulationConfig &sim)
        {
            json out;
            out["tick_seconds"] = sim.tick_seconds;
            out["base_tick_interval_ms"] = sim.base_tick_interval_ms;
            out["min_green_seconds"] = sim.min_green_seconds;
            out["max_green_seconds"] = sim.max_green_seconds;
            out["yellow_seconds"] = sim.yellow_seconds;
            out["saturation_flow_rate"] = sim.saturation_flow_rate;
            out["min_plan_duration"] = sim.min_plan_duration;
            out["max_plan_duration"] = sim.max_plan_duration;
            out["plan_buffer_seconds"] = sim.plan_buffer_seconds;
            out["plan_lead_seconds"] = sim.plan_lead_seconds;
            out["initial_phase_seconds"] = sim.initial_phase_seconds;
            out["exploration_rate"] = sim.exploration_rate;
            out["learning_rate"] = sim.learning_rate;
            out["route_penalty_factor"] = sim.route_penalty_factor;
            out["auto_spawn"] = sim.auto_spawn;
            out["spawn_interval_seconds"] = sim.spawn_interval_seconds;
            out["max_spawn_per_cycle"] = sim.max_spawn_per_cycle;
            out["reroute_interval_ticks"] = sim.reroute_interval_ticks;
            out["max_reroute_attempts"] = sim.max_reroute_attempts;
            out["coordination_speed_kmh"] = sim.coordination_speed_kmh;
            out["green_wave_tolerance"] = sim.green_wave_tolerance;
            out["green_wave_extension_seconds"] = sim.green_wave_extension_seconds;
            out["corridor_pressure_threshold"] = sim.corridor_pressure_threshold;
            out["corridor_min_duration"] = sim.corridor_min_duration;
            out["wait_warning_seconds"] = sim.wait_warning_seconds;
            out["high_pressure_event_threshold"] = sim.high_pressure_event_threshold;
            out["efficiency_alarm_threshold"] = sim.efficiency_alarm_threshold;
            out["event_log_capacity"] = sim.event_log_capacity;
            return out;
        }

        // Unknown keys are ignored, mistyped known keys are reported.
        void simulationFromJson(const json &in, SimulationConfig &sim, std::vector<std::string> &errors)
        {
            auto readNumber = [&](const char *key, double &target)
            {
                if (!in.contains(key))
                {
                    return;
                }
                if (!in[key].is_number())
                {
                    errors.push_back(std::string("simulation.") + key + " must be a number");
                    return;
                }
                target = in[key].get<double>();
            };

            auto readCount = [&](const char *key, auto &target)
            {
                if (!in.contains(key))
                {
                    return;
                }
                if (!in[key].is_number_unsigned())
                {
                    errors.push_back(std::string("simulation.") + key + " must be an unsigned number");
                    return;
                }
                target = in[key].get<std::remove_reference_t<decltype(target)>>();
            };

            readNumber("tick_seconds", sim.tick_seconds);
            readNumber("base_tick_interval_ms", sim.base_tick_interval_ms);
            readNumber("min_green_seconds", sim.min_green_seconds);
            readNumber("max_green_seconds", sim.max_green_seconds);
            readNumber("yellow_seconds", sim.yellow_seconds);
            readNumber("saturation_flow_rate", sim.saturation_flow_rate);
            readNumber("min_plan_duration", sim.min_plan_duration);
            readNumber("max_plan_duration", sim.max_plan_duration);
            readNumber("plan_buffer_seconds", sim.plan_buffer_seconds);
            readNumber("plan_lead_seconds", sim.plan_lead_seconds);
            readNumber("initial_phase_seconds", sim.initial_phase_seconds);
            readNumber("exploration_rate", sim.exploration_rate);
            readNumber("learning_rate", sim.learning_rate);
            readNumber("route_penalty_factor", sim.route_penalty_factor);
            readNumber("spawn_interval_seconds", sim.spawn_interval_seconds);
            readCount("max_spawn_per_cycle", sim.max_spawn_per_cycle);
            readCount("reroute_interval_ticks", sim.reroute_interval_ticks);
            readCount("max_reroute_attempts", sim.max_reroute_attempts);
            readNumber("coordination_speed_kmh", sim.coordination_speed_kmh);
            readNumber("green_wave_tolerance", sim.green_wave_tolerance);
            readNumber("green_wave_extension_seconds", sim.green_wave_extension_seconds);
            readNumber("corridor_pressure_threshold", sim.corridor_pressure_threshold);
            readNumber("corridor_min_duration", sim.corridor_min_duration);
            readNumber("wait_warning_seconds", sim.wait_warning_seconds);
            readNumber("high_pressure_event_threshold", sim.high_pressure_event_threshold);
            readNumber("efficiency_alarm_threshold", sim.efficiency_alarm_threshold);
            readCount("event_log_capacity", sim.event_log_capacity);

            if (in.contains("auto_spawn"))
            {
                if (in["auto_spawn"].is_boolean())
                {
                    sim.auto_spawn = in["auto_spawn"].get<bool>();
                }
                else
                {
                    errors.push_back("simulation.auto_spawn must be a boolean");
                }
            }
        }
    }

    std::string networkConfigToJson(const NetworkConfig &config)
    {
        json root;
        root["layout"] = config.layout;

        root["intersections"] = json::array();
        for (const auto &intersection : config.intersections)
        {
            json intersection_json;
            intersection_json["id"] = intersection.id;
            intersection_json["name"] = intersection.name;
            intersection_json["x"] = intersection.position.x;
            intersection_json["y"] = intersection.position.y;
            root["intersections"].push_back(intersection_json);
        }

        root["roads"] = json::array();
        for (const auto &road : config.roads)
        {
            json road_json;
            road_json["id"] = road.id;
            road_json["from"] = road.from;
            road_json["to"] = road.to;
            road_json["lanes"] = road.lanes;
            road_json["length"] = road.length;
            road_json["speed_limit"] = road.speed_limit;
            road_json["capacity"] = road.capacity;
            if (road.direction.has_value())
            {
                road_json["direction"] = toString(*road.direction);
            }
            root["roads"].push_back(road_json);
        }

        root["simulation"] = simulationToJson(config.simulation);
        return root.dump();
    }

    ConfigParseResult networkConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        const std::string layout = root.value("layout", std::string("custom"));
        if (layout == "grid-2x2" && !root.contains("intersections") && !root.contains("roads"))
        {
            result.config = makeGrid2x2NetworkConfig();
        }
        else
        {
            result.config.layout = layout;
            result.config.intersections.clear();
            result.config.roads.clear();

            if (!root.contains("intersections") || !root["intersections"].is_array())
            {
                result.errors.push_back("intersections must be an array");
                return result;
            }

            for (const auto &intersection_json : root["intersections"])
            {
                if (!intersection_json.is_object())
                {
                    result.errors.push_back("each intersection entry must be an object");
                    continue;
                }
                if (!intersection_json.contains("id") || !intersection_json["id"].is_string())
                {
                    result.errors.push_back("intersection.id must be a string");
                    continue;
                }

                IntersectionConfig intersection;
                intersection.id = intersection_json["id"].get<std::string>();
                intersection.name = intersection_json.value("name", intersection.id);
                if (!intersection_json.contains("x") || !intersection_json["x"].is_number() ||
                    !intersection_json.contains("y") || !intersection_json["y"].is_number())
                {
                    result.errors.push_back("intersection " + intersection.id + " needs numeric x and y");
                    continue;
                }
                intersection.position.x = intersection_json["x"].get<double>();
                intersection.position.y = intersection_json["y"].get<double>();
                result.config.intersections.push_back(intersection);
            }

            if (root.contains("roads"))
            {
                if (!root["roads"].is_array())
                {
                    result.errors.push_back("roads must be an array");
                }
                else
                {
                    for (const auto &road_json : root["roads"])
                    {
                        if (!road_json.is_object())
                        {
                            result.errors.push_back("road entries must be objects");
                            continue;
                        }
                        if (!road_json.contains("id") || !road_json["id"].is_string())
                        {
                            result.errors.push_back("road.id must be a string");
                            continue;
                        }

                        RoadConfig road;
                        road.id = road_json["id"].get<std::string>();
                        if (!road_json.contains("from") || !road_json["from"].is_string() ||
                            !road_json.contains("to") || !road_json["to"].is_string())
                        {
                            result.errors.push_back("road " + road.id + " needs string from and to");
                            continue;
                        }
                        road.from = road_json["from"].get<std::string>();
                        road.to = road_json["to"].get<std::string>();
                        road.length = road_json.value("length", road.length);
                        road.speed_limit = road_json.value("speed_limit", road.speed_limit);

                        if (road_json.contains("lanes"))
                        {
                            if (road_json["lanes"].is_number_unsigned())
                            {
                                road.lanes = std::min<uint16_t>(road_json["lanes"].get<uint16_t>(), 16);
                            }
                            else
                            {
                                result.errors.push_back("road " + road.id + " lanes must be an unsigned number");
                            }
                        }
                        if (road_json.contains("capacity"))
                        {
                            if (road_json["capacity"].is_number_unsigned())
                            {
                                road.capacity = road_json["capacity"].get<std::size_t>();
                            }
                            else
                            {
                                result.errors.push_back("road " + road.id + " capacity must be an unsigned number");
                            }
                        }
                        if (road_json.contains("direction"))
                        {
                            CompassDirection direction;
                            if (road_json["direction"].is_string() &&
                                directionFromString(road_json["direction"].get<std::string>(), direction))
                            {
                                road.direction = direction;
                            }
                            else
                            {
                                result.errors.push_back("road " + road.id + " has an unknown direction");
                            }
                        }

                        result.config.roads.push_back(road);
                    }
                }
            }
        }

        if (root.contains("simulation"))
        {
            if (root["simulation"].is_object())
            {
                simulationFromJson(root["simulation"], result.config.simulation, result.errors);
            }
            else
            {
                result.errors.push_back("simulation must be an object");
            }
        }

        for (auto &error : validateNetworkConfig(result.config))
        {
            result.errors.push_back(std::move(error));
        }

        result.ok = result.errors.empty();
        return result;
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        nlohmann::json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump();
    }
} // namespace signalnet

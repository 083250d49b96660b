#include "SnapshotJson.hpp"

#include <nlohmann/json.hpp>

namespace signalnet
{
    namespace
    {
        using nlohmann::json;

        json pairToJson(const PressurePair &pair)
        {
            return json{{"ns", pair.north_south}, {"ew", pair.east_west}};
        }

        json eventToJson(const SystemEvent &event)
        {
            return json{{"id", event.id},
                        {"timestamp", event.timestamp},
                        {"level", toString(event.level)},
                        {"message", event.message}};
        }

        json intersectionToJson(const Intersection &intersection)
        {
            const SignalState &signal = intersection.signal_state;
            const IntersectionMetrics &metrics = intersection.metrics;
            const AIDecision &decision = intersection.ai_decision;

            json out;
            out["id"] = intersection.id;
            out["name"] = intersection.name;
            out["position"] = {{"x", intersection.position.x}, {"y", intersection.position.y}};
            out["active"] = intersection.active;
            out["signal_state"] = {
                {"current_phase", toString(signal.current_phase)},
                {"north_south", toString(signal.north_south)},
                {"east_west", toString(signal.east_west)},
                {"phase_time_remaining", signal.phase_time_remaining},
                {"next_phase_time", signal.next_phase_time}};

            out["metrics"] = {
                {"queue_lengths",
                 {{"north", metrics.queue_lengths[0]},
                  {"east", metrics.queue_lengths[1]},
                  {"south", metrics.queue_lengths[2]},
                  {"west", metrics.queue_lengths[3]}}},
                {"total_queue_length", metrics.total_queue_length},
                {"average_wait_time", metrics.average_wait_time},
                {"throughput", metrics.throughput},
                {"efficiency", metrics.efficiency}};

            out["incoming_platoons"] = json::array();
            for (const auto &platoon : intersection.incoming_platoons)
            {
                out["incoming_platoons"].push_back({{"direction", toString(platoon.direction)},
                                                    {"vehicle_count", platoon.vehicle_count},
                                                    {"eta", platoon.eta},
                                                    {"speed", platoon.speed}});
            }

            out["ai_decision"] = {
                {"q_values", pairToJson(decision.q_values)},
                {"recommended_action", toString(decision.recommended_action)},
                {"guardian_checks",
                 {{"min_green_time", decision.guardian_checks.min_green_time},
                  {"safe_transition", decision.guardian_checks.safe_transition},
                  {"system_health", decision.guardian_checks.system_health}}},
                {"timing_plan",
                 {{"start_time", decision.timing_plan.start_time},
                  {"duration", decision.timing_plan.duration},
                  {"end_time", decision.timing_plan.end_time}}},
                {"pressure_analysis", pairToJson(decision.pressure_analysis)}};
            return out;
        }

        json roadToJson(const Road &road)
        {
            return json{{"id", road.id},
                        {"from", road.from_intersection_id},
                        {"to", road.to_intersection_id},
                        {"lanes", road.lanes},
                        {"length", road.length},
                        {"speed_limit", road.speed_limit},
                        {"direction", toString(road.direction)},
                        {"capacity", road.capacity},
                        {"current_flow", road.current_flow},
                        {"travel_time", road.travel_time}};
        }

        json optionalId(const std::string &id)
        {
            return id.empty() ? json(nullptr) : json(id);
        }

        json vehicleToJson(const Vehicle &vehicle)
        {
            json out;
            out["id"] = vehicle.id;
            out["current_road_id"] = optionalId(vehicle.current_road_id);
            out["current_intersection_id"] = optionalId(vehicle.current_intersection_id);
            out["destination_intersection_id"] = vehicle.destination_intersection_id;
            out["route"] = json::array();
            for (const auto &segment : vehicle.route)
            {
                out["route"].push_back({{"road_id", segment.road_id},
                                        {"from", segment.from_intersection_id},
                                        {"to", segment.to_intersection_id},
                                        {"distance_remaining", segment.distance_remaining}});
            }
            out["route_progress"] = vehicle.route_progress;
            out["speed"] = vehicle.speed;
            out["position"] = {{"x", vehicle.position.x}, {"y", vehicle.position.y}};
            out["wait_time"] = vehicle.wait_time;
            out["priority"] = toString(vehicle.priority);
            out["type"] = toString(vehicle.vehicle_class);
            return out;
        }
    }

    std::string networkStateToJson(const NetworkState &state)
    {
        json root;
        root["timestamp"] = state.timestamp;
        root["tick"] = state.tick;
        root["running"] = state.running;
        root["simulation_speed"] = state.simulation_speed;

        root["intersections"] = json::array();
        for (const auto &entry : state.intersections)
        {
            root["intersections"].push_back(intersectionToJson(entry.second));
        }

        root["roads"] = json::array();
        for (const auto &entry : state.roads)
        {
            root["roads"].push_back(roadToJson(entry.second));
        }

        root["vehicles"] = json::array();
        for (const auto &entry : state.vehicles)
        {
            root["vehicles"].push_back(vehicleToJson(entry.second));
        }

        const NetworkMetrics &metrics = state.network_metrics;
        root["network_metrics"] = {
            {"total_vehicles", metrics.total_vehicles},
            {"average_wait_time", metrics.average_wait_time},
            {"average_speed", metrics.average_speed},
            {"total_queue_length", metrics.total_queue_length},
            {"network_throughput", metrics.network_throughput},
            {"congestion_level", toString(metrics.congestion_level)},
            {"efficiency", metrics.efficiency}};

        root["events"] = json::array();
        for (const auto &event : state.events)
        {
            root["events"].push_back(eventToJson(event));
        }

        return root.dump();
    }

    std::string eventsToJson(const NetworkState &state, std::size_t limit)
    {
        json events = json::array();
        for (const auto &event : state.events)
        {
            if (events.size() >= limit)
            {
                break;
            }
            events.push_back(eventToJson(event));
        }
        return events.dump();
    }
} // namespace signalnet

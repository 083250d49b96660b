#include <catch2/catch_all.hpp>
#include "SimulationOrchestrator.hpp"
#include "NetworkConfigJson.hpp"
#include "SnapshotJson.hpp"
#include "db/Database.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <limits>

using namespace signalnet;
using namespace signalnet::testing;

namespace
{
    NetworkConfig quietGrid()
    {
        NetworkConfig config = makeGrid2x2NetworkConfig();
        config.simulation.auto_spawn = false;
        return config;
    }

    std::size_t countEvents(const NetworkState &state, const std::string &needle)
    {
        std::size_t count = 0;
        for (const auto &event : state.events)
        {
            if (event.message.find(needle) != std::string::npos)
            {
                count++;
            }
        }
        return count;
    }

    void stepTimes(SimulationOrchestrator &sim, int ticks)
    {
        for (int i = 0; i < ticks; ++i)
        {
            sim.step();
        }
    }
}

TEST_CASE("Speed multiplier must be positive and finite", "[orchestrator]")
{
    SimulationOrchestrator sim(quietGrid());
    REQUIRE(sim.getTickIntervalMs() == Catch::Approx(100.0));

    REQUIRE_FALSE(sim.setSpeed(0.0));
    REQUIRE_FALSE(sim.setSpeed(-2.0));
    REQUIRE_FALSE(sim.setSpeed(std::numeric_limits<double>::quiet_NaN()));
    REQUIRE_FALSE(sim.setSpeed(std::numeric_limits<double>::infinity()));
    REQUIRE(sim.getSpeed() == Catch::Approx(1.0));

    REQUIRE(sim.setSpeed(2.0));
    REQUIRE(sim.getTickIntervalMs() == Catch::Approx(50.0));
}

TEST_CASE("Ticks only run while started, steps always do", "[orchestrator]")
{
    int published = 0;
    SimulationOrchestrator sim(quietGrid(), 42, [&published](const NetworkState &) { published++; });

    sim.tick();
    REQUIRE(sim.getState().tick == 0);
    REQUIRE(published == 0);

    sim.handleCommand(SimulationOrchestrator::Command::Step);
    REQUIRE(sim.getState().tick == 1);
    REQUIRE(sim.getState().timestamp == Catch::Approx(0.1));
    REQUIRE_FALSE(sim.isRunning());

    sim.handleCommand(SimulationOrchestrator::Command::Start);
    REQUIRE(sim.isRunning());
    sim.tick();
    sim.tick();
    REQUIRE(sim.getState().tick == 3);
    REQUIRE(published == 3);

    sim.handleCommand(SimulationOrchestrator::Command::Stop);
    sim.tick();
    REQUIRE(sim.getState().tick == 3);
}

TEST_CASE("Stopping discards the signal controllers", "[orchestrator]")
{
    SimulationOrchestrator sim(quietGrid());
    sim.step();
    REQUIRE(sim.getController("A") != nullptr);
    REQUIRE(sim.getController("Q") == nullptr);

    sim.stop();
    REQUIRE(sim.getController("A") == nullptr);
    sim.start();
    REQUIRE(sim.getController("A") != nullptr);
}

TEST_CASE("Spawned vehicles start at their origin with a planned route", "[orchestrator]")
{
    SimulationOrchestrator sim(quietGrid());

    auto id = sim.spawnVehicle(std::string("A"), std::string("D"));
    REQUIRE(id.has_value());
    const Vehicle &vehicle = sim.getState().vehicles.at(*id);
    REQUIRE(vehicle.current_intersection_id == "A");
    REQUIRE(vehicle.current_road_id.empty());
    REQUIRE(vehicle.destination_intersection_id == "D");
    REQUIRE(vehicle.route.size() == 2);
    REQUIRE(vehicle.speed >= 40.0);
    REQUIRE(vehicle.speed <= 60.0);

    REQUIRE_FALSE(sim.spawnVehicle(std::string("A"), std::string("A")).has_value());
    REQUIRE_FALSE(sim.spawnVehicle(std::string("A"), std::string("Q")).has_value());
    REQUIRE_FALSE(sim.spawnVehicle(std::string("Q"), std::nullopt).has_value());

    auto random_id = sim.spawnVehicle();
    REQUIRE(random_id.has_value());
    REQUIRE(*random_id == *id + 1);
    REQUIRE(sim.getState().vehicles.size() == 2);
}

TEST_CASE("Signals keep the minimum green, then follow the recommendation", "[orchestrator]")
{
    SimulationOrchestrator sim(quietGrid());

    stepTimes(sim, 50);
    for (const auto &entry : sim.getState().intersections)
    {
        REQUIRE(entry.second.signal_state.current_phase == Phase::NorthSouth);
        REQUIRE(entry.second.signal_state.north_south == LightColor::Green);
        REQUIRE_FALSE(entry.second.signal_state.transition_pending);
    }

    // An empty network scores east-west higher once the initial green runs out
    stepTimes(sim, 110);
    for (const auto &entry : sim.getState().intersections)
    {
        REQUIRE(entry.second.signal_state.current_phase == Phase::EastWest);
        REQUIRE(entry.second.signal_state.east_west == LightColor::Green);
    }
    REQUIRE(countEvents(sim.getState(), "switching to EW") == 4);
    REQUIRE(sim.getSafetyViolations() == 0);
}

TEST_CASE("An unhealthy system never switches phases", "[orchestrator]")
{
    SimulationOrchestrator sim(quietGrid());
    sim.setSystemHealth(false);
    REQUIRE_FALSE(sim.getSystemHealth());

    stepTimes(sim, 200);
    for (const auto &entry : sim.getState().intersections)
    {
        REQUIRE(entry.second.signal_state.current_phase == Phase::NorthSouth);
        REQUIRE(entry.second.ai_decision.guardian_checks.system_health == false);
        REQUIRE(entry.second.ai_decision.recommended_action == PhaseAction::Hold);
    }
    REQUIRE(countEvents(sim.getState(), "switching") == 0);
}

TEST_CASE("Queued vehicles are released by the next green", "[orchestrator]")
{
    NetworkConfig config = quietGrid();
    config.simulation.wait_warning_seconds = 0.5;
    SimulationOrchestrator sim(config);

    NetworkState initial = buildNetworkState(config);
    placeAtIntersection(initial, 1, "A", {"A-B"});
    initial.next_vehicle_id = 2;
    sim.start(initial);

    for (int i = 0; i < 20; ++i)
    {
        sim.tick();
    }
    const NetworkState &state = sim.getState();
    REQUIRE(sim.getQueueManager().isQueued(1));
    REQUIRE(state.vehicles.at(1).wait_time == Catch::Approx(2.0));
    REQUIRE(state.intersections.at("A").metrics.queue_lengths[directionIndex(CompassDirection::East)] == 1);
    REQUIRE(state.network_metrics.total_queue_length == 1);
    REQUIRE(countEvents(state, "Vehicle 1 has waited") == 1);

    for (int i = 0; i < 140; ++i)
    {
        sim.tick();
    }
    const Vehicle &vehicle = state.vehicles.at(1);
    REQUIRE_FALSE(sim.getQueueManager().isQueued(1));
    REQUIRE(vehicle.current_road_id == "A-B");
    REQUIRE(vehicle.wait_time < 14.0);
    REQUIRE(countEvents(state, "A: switching to EW") == 1);
    // Edge-triggered: one warning for the whole wait
    REQUIRE(countEvents(state, "Vehicle 1 has waited") == 1);
}

TEST_CASE("A heavier east-west corridor takes the green from north-south", "[orchestrator]")
{
    NetworkConfig config = quietGrid();
    SimulationOrchestrator sim(config);

    NetworkState initial = buildNetworkState(config);
    for (VehicleId id = 1; id <= 6; ++id)
    {
        placeOnRoad(initial, id, {"B-A", "A-C"}, 300.0, 5.0);
    }
    for (VehicleId id = 7; id <= 12; ++id)
    {
        placeAtIntersection(initial, id, "A", {"A-B"});
    }
    initial.next_vehicle_id = 13;
    sim.start(initial);

    bool east_west_green = false;
    for (int i = 0; i < 200; ++i)
    {
        sim.tick();
        east_west_green = east_west_green || sim.getState().intersections.at("A").signal_state.east_west == LightColor::Green;
    }

    const NetworkState &state = sim.getState();
    REQUIRE(east_west_green);
    for (VehicleId id = 7; id <= 12; ++id)
    {
        REQUIRE_FALSE(sim.getQueueManager().isQueued(id));
        REQUIRE(state.vehicles.at(id).current_intersection_id != "A");
    }
    REQUIRE(sim.getSafetyViolations() == 0);
}

TEST_CASE("A loaded corridor yields to a waiting axis at max green", "[orchestrator]")
{
    NetworkConfig config = quietGrid();
    SimulationOrchestrator sim(config);

    // 30 slow vehicles keep north-south pressure far above the one waiting car
    NetworkState initial = buildNetworkState(config);
    for (VehicleId id = 1; id <= 30; ++id)
    {
        placeOnRoad(initial, id, {"B-A", "A-C"}, 300.0, 5.0);
    }
    placeAtIntersection(initial, 31, "A", {"A-B"});
    initial.next_vehicle_id = 32;
    sim.start(initial);

    for (int i = 0; i < 400; ++i)
    {
        sim.tick();
    }
    const NetworkState &early = sim.getState();
    REQUIRE(early.intersections.at("A").signal_state.current_phase == Phase::NorthSouth);
    REQUIRE(early.intersections.at("A").ai_decision.recommended_action == PhaseAction::NorthSouth);
    REQUIRE(sim.getQueueManager().isQueued(31));

    // Max green is 45 s, then 2 s of yellow
    for (int i = 0; i < 200; ++i)
    {
        sim.tick();
    }
    const NetworkState &state = sim.getState();
    const SignalState &signal = state.intersections.at("A").signal_state;
    REQUIRE(signal.current_phase == Phase::EastWest);
    REQUIRE(signal.east_west == LightColor::Green);
    REQUIRE(countEvents(state, "A: switching to EW") == 1);
    REQUIRE_FALSE(sim.getQueueManager().isQueued(31));
    REQUIRE(state.vehicles.at(31).current_road_id == "A-B");
    REQUIRE(sim.getSafetyViolations() == 0);
}

TEST_CASE("Unroutable vehicles are removed with a warning", "[orchestrator]")
{
    NetworkConfig config = quietGrid();
    config.simulation.reroute_interval_ticks = 1;
    config.simulation.max_reroute_attempts = 2;
    SimulationOrchestrator sim(config);

    NetworkState initial = buildNetworkState(config);
    REQUIRE(addIntersection(initial, "Z", "Island", {900.0, 900.0}));
    placeAtIntersection(initial, 1, "A", {}).destination_intersection_id = "Z";
    sim.start(initial);

    sim.tick();
    REQUIRE(sim.getState().vehicles.count(1) == 1);
    sim.tick();
    REQUIRE(sim.getState().vehicles.count(1) == 0);
    REQUIRE(countEvents(sim.getState(), "Vehicle 1 removed after 2 failed reroute attempts") == 1);
    REQUIRE(sim.getState().events.front().level == EventLevel::Warn);
}

TEST_CASE("Long runs keep every network invariant", "[orchestrator]")
{
    NetworkConfig config = makeGrid2x2NetworkConfig();
    config.simulation.spawn_interval_seconds = 1.0;
    SimulationOrchestrator sim(config, 7);
    sim.start();

    for (int tick = 0; tick < 1500; ++tick)
    {
        sim.tick();
        const NetworkState &state = sim.getState();
        const QueueManager &queues = sim.getQueueManager();

        for (const auto &entry : state.vehicles)
        {
            const Vehicle &vehicle = entry.second;
            REQUIRE_FALSE((vehicle.isOnRoad() && vehicle.isAtIntersection()));
        }

        std::size_t queued = 0;
        for (const auto &entry : state.intersections)
        {
            const Intersection &intersection = entry.second;
            for (VehicleId id : queues.queuedVehicles(intersection))
            {
                REQUIRE(state.vehicles.count(id) == 1);
                REQUIRE(state.vehicles.at(id).current_intersection_id == intersection.id);
            }
            queued += intersection.metrics.total_queue_length;

            const SignalState &signal = intersection.signal_state;
            REQUIRE_FALSE((signal.north_south == LightColor::Green && signal.east_west == LightColor::Green));
        }
        REQUIRE(state.network_metrics.total_queue_length == queued);
        REQUIRE(queues.totalQueued() == queued);
    }

    const NetworkState &state = sim.getState();
    REQUIRE(state.next_vehicle_id > 20);
    REQUIRE(sim.getSafetyViolations() == 0);
    REQUIRE(state.events.size() <= config.simulation.event_log_capacity);
    for (std::size_t i = 1; i < state.events.size(); ++i)
    {
        REQUIRE(state.events[i - 1].id > state.events[i].id);
    }
}

TEST_CASE("Reset rebuilds the configured network", "[orchestrator]")
{
    SimulationOrchestrator sim(quietGrid());
    REQUIRE(sim.setSpeed(4.0));
    REQUIRE(sim.spawnVehicle(std::string("A"), std::string("B")).has_value());
    REQUIRE(sim.addIntersection({"E", "Extra", {900.0, 100.0}}));
    sim.start();
    sim.tick();

    sim.handleCommand(SimulationOrchestrator::Command::Reset);
    const NetworkState &state = sim.getState();
    REQUIRE_FALSE(sim.isRunning());
    REQUIRE(state.tick == 0);
    REQUIRE(state.vehicles.empty());
    REQUIRE(state.intersections.size() == 4);
    REQUIRE(sim.getQueueManager().totalQueued() == 0);
    REQUIRE(sim.getSpeed() == Catch::Approx(4.0));
}

TEST_CASE("Topology can be edited while the network is live", "[orchestrator]")
{
    SimulationOrchestrator sim(quietGrid());
    std::string error;

    REQUIRE(sim.addIntersection({"E", "Extra", {900.0, 100.0}}, &error));
    REQUIRE_FALSE(sim.addIntersection({"E", "Again", {0.0, 0.0}}, &error));
    REQUIRE(error.find("duplicate") != std::string::npos);

    REQUIRE_FALSE(sim.spawnVehicle(std::string("A"), std::string("E")).has_value());
    REQUIRE(countEvents(sim.getState(), "Spawn failed: no route from A to E") == 1);

    RoadConfig road;
    road.id = "B-E";
    road.from = "B";
    road.to = "E";
    REQUIRE(sim.addRoad(road, &error));
    REQUIRE(sim.getState().roads.at("B-E").direction == CompassDirection::East);

    road.id = "E-Q";
    road.from = "E";
    road.to = "Q";
    REQUIRE_FALSE(sim.addRoad(road, &error));
    REQUIRE(error.find("unknown intersection") != std::string::npos);

    auto id = sim.spawnVehicle(std::string("A"), std::string("E"));
    REQUIRE(id.has_value());
    REQUIRE(sim.getState().vehicles.at(*id).route.size() == 2);

    sim.step();
    REQUIRE(sim.getController("E") != nullptr);

    REQUIRE(sim.removeIntersection("E"));
    REQUIRE_FALSE(sim.removeIntersection("E"));
    REQUIRE(sim.getState().vehicles.count(*id) == 0);
    REQUIRE(sim.getState().roads.count("B-E") == 0);
    REQUIRE(sim.getController("E") == nullptr);
    REQUIRE_FALSE(sim.getQueueManager().isQueued(*id));

    // The configuration itself is untouched
    REQUIRE(sim.getConfig().intersections.size() == 4);
}

TEST_CASE("Snapshot JSON mirrors the live state", "[orchestrator]")
{
    SimulationOrchestrator sim(quietGrid());
    auto id = sim.spawnVehicle(std::string("C"), std::string("B"));
    REQUIRE(id.has_value());
    sim.step();

    nlohmann::json snapshot = nlohmann::json::parse(sim.getSnapshotJson());
    REQUIRE(snapshot["tick"].get<int>() == 1);
    REQUIRE(snapshot["intersections"].size() == 4);
    REQUIRE(snapshot["roads"].size() == 8);
    REQUIRE(snapshot["vehicles"].size() == 1);
    REQUIRE(snapshot["intersections"][0]["id"].get<std::string>() == "A");
    REQUIRE(snapshot["intersections"][0]["signal_state"]["current_phase"].get<std::string>() == "NS");
    REQUIRE(snapshot["network_metrics"]["total_vehicles"].get<int>() == 1);
    REQUIRE(snapshot["network_metrics"].contains("congestion_level"));

    const nlohmann::json &vehicle = snapshot["vehicles"][0];
    REQUIRE(vehicle["destination_intersection_id"].get<std::string>() == "B");
    const bool one_location = vehicle["current_road_id"].is_null() != vehicle["current_intersection_id"].is_null();
    REQUIRE(one_location);
}

TEST_CASE("Reported events join the log and can be listed with a limit", "[orchestrator]")
{
    SimulationOrchestrator sim(quietGrid());
    REQUIRE(sim.recordEvent(EventLevel::Warn, "camera offline at B"));
    REQUIRE(sim.recordEvent(EventLevel::Info, "maintenance window closed"));
    REQUIRE_FALSE(sim.recordEvent(EventLevel::Error, ""));
    REQUIRE(sim.getState().events.size() == 2);

    nlohmann::json newest = nlohmann::json::parse(eventsToJson(sim.getState(), 1));
    REQUIRE(newest.size() == 1);
    REQUIRE(newest[0]["message"].get<std::string>() == "maintenance window closed");
    REQUIRE(newest[0]["level"].get<std::string>() == "INFO");

    nlohmann::json all = nlohmann::json::parse(eventsToJson(sim.getState(), 50));
    REQUIRE(all.size() == 2);
    REQUIRE(all[1]["level"].get<std::string>() == "WARN");
    REQUIRE(all[0]["id"].get<int>() > all[1]["id"].get<int>());

    REQUIRE(nlohmann::json::parse(eventsToJson(sim.getState(), 0)).empty());
}

TEST_CASE("Network config is stored and read back", "[storage]")
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "signalnet_storage_test.db";
    const std::string file = path.string();
    std::remove(file.c_str());
    std::remove((file + "." + db::Database::ACTIVE_NETWORK_CONFIG_KEY).c_str());

    db::Database database(file);
    std::string error;
    REQUIRE(database.initialize(&error));

    auto missing = database.loadActiveNetworkConfigJson(&error);
    REQUIRE_FALSE(missing.has_value());

    NetworkConfig config = makeGrid2x2NetworkConfig();
    config.simulation.max_green_seconds = 50.0;
    REQUIRE(database.saveActiveNetworkConfigJson(networkConfigToJson(config), &error));
    // Saving twice replaces the value
    REQUIRE(database.saveActiveNetworkConfigJson(networkConfigToJson(config), &error));

    auto stored = database.loadActiveNetworkConfigJson(&error);
    REQUIRE(stored.has_value());
    ConfigParseResult parsed = networkConfigFromJson(*stored);
    REQUIRE(parsed.ok);
    REQUIRE(parsed.config.simulation.max_green_seconds == Catch::Approx(50.0));

    REQUIRE(database.saveValue("theme", "dark", &error));
    REQUIRE(database.loadValue("theme", &error) == std::optional<std::string>("dark"));
    REQUIRE(database.removeValue("theme", &error));
    REQUIRE_FALSE(database.loadValue("theme", &error).has_value());

    std::remove(file.c_str());
    std::remove((file + "." + db::Database::ACTIVE_NETWORK_CONFIG_KEY).c_str());
    std::remove((file + ".theme").c_str());
}

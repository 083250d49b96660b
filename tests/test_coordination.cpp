#include <catch2/catch_all.hpp>
#include "NetworkCoordinator.hpp"
#include "test_helpers.hpp"

using namespace signalnet;
using namespace signalnet::testing;

namespace
{
    void propose(Intersection &intersection, PhaseAction action, double remaining, double duration = 20.0)
    {
        intersection.ai_decision.recommended_action = action;
        intersection.ai_decision.timing_plan = {0.0, duration, duration};
        intersection.signal_state.phase_time_remaining = remaining;
    }
}

TEST_CASE("Green wave extends upstream plans whose offset matches travel time", "[coordination]")
{
    NetworkState state = makeGridState();
    SimulationConfig config;
    NetworkCoordinator coordinator(config);

    // 400 m at 50 km/h is 28.8 s between neighbours
    propose(state.intersections.at("A"), PhaseAction::EastWest, 40.0);
    propose(state.intersections.at("B"), PhaseAction::EastWest, 11.2);
    propose(state.intersections.at("C"), PhaseAction::EastWest, 11.2);
    propose(state.intersections.at("D"), PhaseAction::EastWest, 40.0);

    REQUIRE(coordinator.applyGreenWave(state) == 4);

    // A has two qualifying roads but is extended once
    const TimingPlan &plan = state.intersections.at("A").ai_decision.timing_plan;
    REQUIRE(plan.duration == Catch::Approx(25.0));
    REQUIRE(plan.end_time == Catch::Approx(25.0));
    REQUIRE(state.intersections.at("B").ai_decision.timing_plan.duration == Catch::Approx(25.0));
}

TEST_CASE("Green wave needs matching proposals and offsets", "[coordination]")
{
    NetworkState state = makeGridState();
    SimulationConfig config;
    NetworkCoordinator coordinator(config);

    SECTION("offset outside the tolerance band")
    {
        for (auto &entry : state.intersections)
        {
            propose(entry.second, PhaseAction::EastWest, 10.0);
        }
        REQUIRE(coordinator.applyGreenWave(state) == 0);
    }

    SECTION("neighbours propose different phases")
    {
        propose(state.intersections.at("A"), PhaseAction::EastWest, 40.0);
        propose(state.intersections.at("B"), PhaseAction::NorthSouth, 11.2);
        propose(state.intersections.at("C"), PhaseAction::NorthSouth, 11.2);
        propose(state.intersections.at("D"), PhaseAction::Hold, 40.0);
        REQUIRE(coordinator.applyGreenWave(state) == 0);
        REQUIRE(state.intersections.at("A").ai_decision.timing_plan.duration == Catch::Approx(20.0));
    }

    SECTION("HOLD never coordinates")
    {
        propose(state.intersections.at("A"), PhaseAction::Hold, 40.0);
        propose(state.intersections.at("B"), PhaseAction::Hold, 11.2);
        propose(state.intersections.at("C"), PhaseAction::Hold, 11.2);
        propose(state.intersections.at("D"), PhaseAction::Hold, 40.0);
        REQUIRE(coordinator.applyGreenWave(state) == 0);
    }
}

TEST_CASE("Corridor pressure counts queued and approaching vehicles", "[coordination]")
{
    NetworkState state = makeGridState();
    placeAtIntersection(state, 1, "A", {"A-C"}).wait_time = 10.0;
    placeAtIntersection(state, 2, "A", {"A-C"}).wait_time = 5.0;
    placeOnRoad(state, 3, {"C-A", "A-B"}, 200.0);
    placeOnRoad(state, 4, {"B-A"}, 50.0);

    PressurePair pressure = NetworkCoordinator::corridorPressure(state, state.intersections.at("A"));
    REQUIRE(pressure.north_south == Catch::Approx(2.5));
    REQUIRE(pressure.east_west == Catch::Approx(0.5));

    PressurePair quiet = NetworkCoordinator::corridorPressure(state, state.intersections.at("D"));
    REQUIRE(quiet.north_south == Catch::Approx(0.0));
    REQUIRE(quiet.east_west == Catch::Approx(0.0));
}

TEST_CASE("High corridor pressure overrides the local proposal", "[coordination]")
{
    NetworkState state = makeGridState();
    SimulationConfig config;
    NetworkCoordinator coordinator(config);

    for (VehicleId id = 1; id <= 3; ++id)
    {
        placeAtIntersection(state, id, "A", {"A-C"}).wait_time = 10.0;
    }
    propose(state.intersections.at("A"), PhaseAction::EastWest, 0.0, 12.0);
    propose(state.intersections.at("B"), PhaseAction::EastWest, 0.0, 12.0);
    state.intersections.at("B").ai_decision.pressure_analysis = {9.0, 9.0};

    REQUIRE(coordinator.applyCorridorPressure(state) == 1);

    const AIDecision &a = state.intersections.at("A").ai_decision;
    REQUIRE(a.recommended_action == PhaseAction::NorthSouth);
    REQUIRE(a.timing_plan.duration == Catch::Approx(30.0));
    REQUIRE(a.timing_plan.end_time == Catch::Approx(30.0));
    REQUIRE(a.pressure_analysis.north_south == Catch::Approx(4.5));

    const AIDecision &b = state.intersections.at("B").ai_decision;
    REQUIRE(b.recommended_action == PhaseAction::EastWest);
    REQUIRE(b.timing_plan.duration == Catch::Approx(12.0));
    REQUIRE(b.pressure_analysis.north_south == Catch::Approx(0.0));
}

TEST_CASE("The heavier corridor wins when both axes are loaded", "[coordination]")
{
    NetworkState state = makeGridState();
    SimulationConfig config;
    NetworkCoordinator coordinator(config);

    for (VehicleId id = 1; id <= 5; ++id)
    {
        placeAtIntersection(state, id, "A", {"A-C"});
    }

    SECTION("east-west carries more pressure")
    {
        for (VehicleId id = 6; id <= 15; ++id)
        {
            placeAtIntersection(state, id, "A", {"A-B"});
        }
        propose(state.intersections.at("A"), PhaseAction::NorthSouth, 0.0, 40.0);

        REQUIRE(coordinator.applyCorridorPressure(state) == 1);
        const AIDecision &a = state.intersections.at("A").ai_decision;
        REQUIRE(a.recommended_action == PhaseAction::EastWest);
        // Longer plans are kept
        REQUIRE(a.timing_plan.duration == Catch::Approx(40.0));
    }

    SECTION("equal pressure goes to north-south")
    {
        for (VehicleId id = 6; id <= 10; ++id)
        {
            placeAtIntersection(state, id, "A", {"A-B"});
        }
        propose(state.intersections.at("A"), PhaseAction::EastWest, 0.0, 12.0);

        REQUIRE(coordinator.applyCorridorPressure(state) == 1);
        const AIDecision &a = state.intersections.at("A").ai_decision;
        REQUIRE(a.recommended_action == PhaseAction::NorthSouth);
        REQUIRE(a.timing_plan.duration == Catch::Approx(30.0));
    }
}

TEST_CASE("East-west corridor is forced when only it is loaded", "[coordination]")
{
    NetworkState state = makeGridState();
    SimulationConfig config;
    NetworkCoordinator coordinator(config);

    for (VehicleId id = 1; id <= 5; ++id)
    {
        placeAtIntersection(state, id, "B", {"B-A"});
    }
    propose(state.intersections.at("B"), PhaseAction::Hold, 0.0, 10.0);

    CoordinationReport report = coordinator.coordinate(state);
    REQUIRE(report.corridor_overrides == 1);
    REQUIRE(state.intersections.at("B").ai_decision.recommended_action == PhaseAction::EastWest);
    REQUIRE(state.intersections.at("B").ai_decision.timing_plan.duration == Catch::Approx(30.0));
}

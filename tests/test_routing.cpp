#include <catch2/catch_all.hpp>
#include "RoutePlanner.hpp"
#include "test_helpers.hpp"

using namespace signalnet;
using namespace signalnet::testing;

TEST_CASE("Edge weight is free-flow time plus a congestion penalty", "[routing]")
{
    NetworkState state = makeGridState();
    RoutePlanner planner;
    Road &road = state.roads.at("A-B");
    REQUIRE(planner.edgeWeight(road) == Catch::Approx(8.0));

    road.current_flow = 5;
    REQUIRE(planner.edgeWeight(road) == Catch::Approx(10.5));

    RoutePlanner gentle(2.0);
    REQUIRE(gentle.edgeWeight(road) == Catch::Approx(8.5));
}

TEST_CASE("Diagonal corner is reached in two hops", "[routing]")
{
    NetworkState state = makeGridState();
    RoutePlanner planner;

    PlannedRoute route = planner.plan(state, "A", "D");
    REQUIRE(route.segments.size() == 2);
    REQUIRE(route.total_distance == Catch::Approx(800.0));
    REQUIRE(route.total_cost == Catch::Approx(16.0));

    REQUIRE(route.segments.front().from_intersection_id == "A");
    REQUIRE(route.segments.back().to_intersection_id == "D");
    REQUIRE(route.segments[0].to_intersection_id == route.segments[1].from_intersection_id);
    for (const auto &segment : route.segments)
    {
        REQUIRE(segment.distance_remaining == Catch::Approx(400.0));
    }
}

TEST_CASE("Neighbouring intersections are one hop apart", "[routing]")
{
    NetworkState state = makeGridState();
    RoutePlanner planner;

    PlannedRoute route = planner.plan(state, "B", "A");
    REQUIRE(route.segments.size() == 1);
    REQUIRE(route.segments.front().road_id == "B-A");
}

TEST_CASE("Planning is idempotent on an unchanged network", "[routing]")
{
    NetworkState state = makeGridState();
    state.roads.at("A-B").current_flow = 3;
    state.roads.at("C-D").current_flow = 7;
    RoutePlanner planner;

    PlannedRoute first = planner.plan(state, "A", "D");
    PlannedRoute second = planner.plan(state, "A", "D");
    REQUIRE(first.total_cost == second.total_cost);
    REQUIRE(first.segments.front().road_id == second.segments.front().road_id);
    REQUIRE(planner.routeCost(state, first.segments) == Catch::Approx(first.total_cost));
}

TEST_CASE("Congested roads are avoided", "[routing]")
{
    NetworkState state = makeGridState();
    state.roads.at("A-B").current_flow = 20;
    RoutePlanner planner;

    PlannedRoute route = planner.plan(state, "A", "D");
    REQUIRE(route.segments.size() == 2);
    REQUIRE(route.segments[0].road_id == "A-C");
    REQUIRE(route.segments[1].road_id == "C-D");
    REQUIRE(route.total_cost == Catch::Approx(16.0));
}

TEST_CASE("No route for unknown, identical or disconnected endpoints", "[routing]")
{
    NetworkState state = makeGridState();
    REQUIRE(addIntersection(state, "Z", "Island", {900.0, 900.0}));
    RoutePlanner planner;

    REQUIRE(planner.plan(state, "A", "A").empty());
    REQUIRE(planner.plan(state, "A", "Q").empty());
    REQUIRE(planner.plan(state, "Q", "A").empty());
    REQUIRE(planner.plan(state, "A", "Z").empty());
    REQUIRE(planner.plan(state, "Z", "A").empty());
}

TEST_CASE("One-way roads are only followed forwards", "[routing]")
{
    NetworkState state;
    REQUIRE(addIntersection(state, "X", "X", {0.0, 0.0}));
    REQUIRE(addIntersection(state, "Y", "Y", {300.0, 0.0}));
    Road road;
    road.id = "X-Y";
    road.from_intersection_id = "X";
    road.to_intersection_id = "Y";
    road.length = 300.0;
    road.capacity = 10;
    REQUIRE(addRoad(state, road));

    RoutePlanner planner;
    REQUIRE(planner.plan(state, "X", "Y").segments.size() == 1);
    REQUIRE(planner.plan(state, "Y", "X").empty());
}

TEST_CASE("routeCost skips roads that no longer exist", "[routing]")
{
    NetworkState state = makeGridState();
    RoutePlanner planner;
    PlannedRoute route = planner.plan(state, "A", "B");
    REQUIRE_FALSE(route.empty());

    state.roads.erase("A-B");
    REQUIRE(planner.routeCost(state, route.segments) == Catch::Approx(0.0));
}

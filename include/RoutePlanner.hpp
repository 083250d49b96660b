#pragma once

#include "Network.hpp"

#include <deque>

namespace signalnet
{
    struct PlannedRoute
    {
        std::deque<RouteSegment> segments;
        double total_cost = 0.0;
        double total_distance = 0.0; // meters

        bool empty() const { return segments.empty(); }
    };

    // Shortest path over the directed road graph. Weights are taken from the
    // road state at the time of the call, so a planned route is congestion
    // aware but never revised once the vehicle is moving.
    class RoutePlanner
    {
    public:
        explicit RoutePlanner(double penalty_factor = 10.0);

        // Empty result when either id is unknown, when from == to or when the
        // destination is unreachable. Roads are explored in id order, which
        // decides between equal-cost paths.
        PlannedRoute plan(const NetworkState &state, const IntersectionId &from, const IntersectionId &to) const;

        double edgeWeight(const Road &road) const;

        // Sum of edge weights of an existing route; segments whose road is gone
        // are skipped.
        double routeCost(const NetworkState &state, const std::deque<RouteSegment> &route) const;

    private:
        double penalty_factor;
    };

} // namespace signalnet

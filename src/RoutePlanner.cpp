#include "RoutePlanner.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <queue>
#include <utility>
#include <vector>

namespace signalnet
{
    RoutePlanner::RoutePlanner(double penalty_factor)
        : penalty_factor(penalty_factor)
    {
    }

    double RoutePlanner::edgeWeight(const Road &road) const
    {
        const double capacity = static_cast<double>(std::max<std::size_t>(road.capacity, 1));
        const double speed = road.speed_limit > 0.0 ? road.speed_limit : 1.0;
        return road.length / speed + (static_cast<double>(road.current_flow) / capacity) * penalty_factor;
    }

    double RoutePlanner::routeCost(const NetworkState &state, const std::deque<RouteSegment> &route) const
    {
        double cost = 0.0;
        for (const auto &segment : route)
        {
            if (const Road *road = findRoad(state, segment.road_id))
            {
                cost += edgeWeight(*road);
            }
        }
        return cost;
    }

    PlannedRoute RoutePlanner::plan(const NetworkState &state, const IntersectionId &from, const IntersectionId &to) const
    {
        PlannedRoute result;
        if (from == to || !findIntersection(state, from) || !findIntersection(state, to))
        {
            return result;
        }

        // state.roads is ordered by id, so every adjacency list is too
        std::map<IntersectionId, std::vector<const Road *>> graph;
        for (const auto &entry : state.roads)
        {
            const Road &road = entry.second;
            if (findIntersection(state, road.to_intersection_id))
            {
                graph[road.from_intersection_id].push_back(&road);
            }
        }

        const double INF = std::numeric_limits<double>::infinity();
        std::map<IntersectionId, double> dist;
        std::map<IntersectionId, const Road *> prev_road;
        for (const auto &entry : state.intersections)
        {
            dist[entry.first] = INF;
        }

        using QueueEntry = std::pair<double, IntersectionId>;
        auto cmp = [](const QueueEntry &a, const QueueEntry &b)
        {
            return a.first > b.first;
        };
        std::priority_queue<QueueEntry, std::vector<QueueEntry>, decltype(cmp)> pq(cmp);

        dist[from] = 0.0;
        pq.push({0.0, from});

        while (!pq.empty())
        {
            auto [d, u] = pq.top();
            pq.pop();

            if (d > dist[u])
                continue;
            if (u == to)
                break;

            auto it = graph.find(u);
            if (it == graph.end())
                continue;

            for (const Road *road : it->second)
            {
                const double nd = d + edgeWeight(*road);
                auto dist_it = dist.find(road->to_intersection_id);
                if (dist_it == dist.end())
                    continue;

                if (nd < dist_it->second)
                {
                    dist_it->second = nd;
                    prev_road[road->to_intersection_id] = road;
                    pq.push({nd, road->to_intersection_id});
                }
            }
        }

        if (dist[to] == INF)
        {
            return result;
        }

        std::vector<const Road *> reversed;
        IntersectionId current = to;
        while (current != from)
        {
            auto it = prev_road.find(current);
            if (it == prev_road.end())
            {
                return result;
            }
            reversed.push_back(it->second);
            current = it->second->from_intersection_id;
        }

        for (auto it = reversed.rbegin(); it != reversed.rend(); ++it)
        {
            const Road *road = *it;
            RouteSegment segment;
            segment.road_id = road->id;
            segment.from_intersection_id = road->from_intersection_id;
            segment.to_intersection_id = road->to_intersection_id;
            segment.distance_remaining = road->length;
            result.segments.push_back(segment);
            result.total_distance += road->length;
        }
        result.total_cost = dist[to];
        return result;
    }

} // namespace signalnet

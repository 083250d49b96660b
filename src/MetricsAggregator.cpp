#include "MetricsAggregator.hpp"

#include <algorithm>
#include <cmath>

namespace signalnet
{
    MetricsAggregator::MetricsAggregator(const QueueManager &queues)
        : queues(queues)
    {
    }

    CongestionLevel MetricsAggregator::classifyCongestion(double mean_wait_seconds)
    {
        if (mean_wait_seconds > 60.0)
            return CongestionLevel::Critical;
        if (mean_wait_seconds > 30.0)
            return CongestionLevel::High;
        if (mean_wait_seconds > 15.0)
            return CongestionLevel::Medium;
        return CongestionLevel::Low;
    }

    double MetricsAggregator::intersectionEfficiency(std::size_t total_queue, double average_wait)
    {
        // 10 queued vehicles or a 60 s mean wait are taken as the reference maxima
        const double queue_score = std::max(0.0, 100.0 - static_cast<double>(total_queue) / 10.0 * 25.0);
        const double wait_score = std::max(0.0, 100.0 - average_wait / 60.0 * 50.0);
        return std::round((queue_score + wait_score) / 2.0);
    }

    void MetricsAggregator::updateIntersection(const NetworkState &state, Intersection &intersection, std::size_t crossings) const
    {
        IntersectionMetrics &metrics = intersection.metrics;
        metrics.total_queue_length = 0;
        for (CompassDirection direction : kAllDirections)
        {
            const std::size_t length = queues.queueLength(intersection, direction);
            metrics.queue_lengths[directionIndex(direction)] = length;
            metrics.total_queue_length += length;
        }

        double wait_sum = 0.0;
        std::size_t counted = 0;
        for (VehicleId id : queues.queuedVehicles(intersection))
        {
            auto it = state.vehicles.find(id);
            if (it != state.vehicles.end())
            {
                wait_sum += it->second.wait_time;
                counted++;
            }
        }
        metrics.average_wait_time = counted > 0 ? wait_sum / static_cast<double>(counted) : 0.0;

        metrics.throughput = metrics.throughput * THROUGHPUT_DECAY + static_cast<double>(crossings);
        metrics.efficiency = intersectionEfficiency(metrics.total_queue_length, metrics.average_wait_time);
    }

    NetworkMetrics MetricsAggregator::computeNetwork(const NetworkState &state) const
    {
        NetworkMetrics metrics;
        metrics.total_vehicles = state.vehicles.size();

        double wait_sum = 0.0;
        double speed_sum = 0.0;
        for (const auto &entry : state.vehicles)
        {
            wait_sum += entry.second.wait_time;
            speed_sum += entry.second.speed;
        }
        if (metrics.total_vehicles > 0)
        {
            metrics.average_wait_time = wait_sum / static_cast<double>(metrics.total_vehicles);
            metrics.average_speed = speed_sum / static_cast<double>(metrics.total_vehicles);
        }

        for (const auto &entry : state.intersections)
        {
            metrics.total_queue_length += entry.second.metrics.total_queue_length;
            metrics.network_throughput += entry.second.metrics.throughput;
        }

        metrics.congestion_level = classifyCongestion(metrics.average_wait_time);
        metrics.efficiency = std::clamp(100.0 - metrics.average_wait_time * 2.0 -
                                            static_cast<double>(metrics.total_queue_length) * 0.5,
                                        0.0, 100.0);
        return metrics;
    }

    void MetricsAggregator::update(NetworkState &state, const std::map<IntersectionId, std::size_t> &crossings) const
    {
        for (auto &entry : state.intersections)
        {
            auto it = crossings.find(entry.first);
            updateIntersection(state, entry.second, it == crossings.end() ? 0 : it->second);
        }
        state.network_metrics = computeNetwork(state);
    }

} // namespace signalnet

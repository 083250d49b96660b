#pragma once

#include "Network.hpp"
#include "QueueManager.hpp"

#include <map>

namespace signalnet
{
    class MetricsAggregator
    {
    public:
        explicit MetricsAggregator(const QueueManager &queues);

        // Refreshes every intersection's metrics, then the network metrics.
        void update(NetworkState &state, const std::map<IntersectionId, std::size_t> &crossings) const;

        void updateIntersection(const NetworkState &state, Intersection &intersection, std::size_t crossings) const;
        NetworkMetrics computeNetwork(const NetworkState &state) const;

        static CongestionLevel classifyCongestion(double mean_wait_seconds);
        static double intersectionEfficiency(std::size_t total_queue, double average_wait);

        static constexpr double THROUGHPUT_DECAY = 0.95;

    private:
        const QueueManager &queues;
    };

} // namespace signalnet

#pragma once

#include "Network.hpp"

#include <array>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

namespace signalnet
{
    // Four FIFO lists of vehicle ids, one per approach direction.
    struct IntersectionQueues
    {
        std::array<std::deque<VehicleId>, 4> by_direction; // North, East, South, West

        std::size_t total() const
        {
            return by_direction[0].size() + by_direction[1].size() + by_direction[2].size() + by_direction[3].size();
        }
    };

    struct QueuePosition
    {
        std::size_t slot = 0; // intersection index
        CompassDirection direction{CompassDirection::North};
    };

    // Per-intersection queues kept in an arena indexed by Intersection::index.
    // A vehicle id is held by at most one direction queue of one intersection.
    class QueueManager
    {
    public:
        QueueManager() = default;

        // Appends the vehicle to the queue of the direction of the road it will
        // take out of this intersection. Returns false when it has no such road
        // or the road is unknown. Already-queued vehicles keep their place.
        bool enqueue(const NetworkState &state, const Vehicle &vehicle, const Intersection &intersection);

        // Removes the vehicle from whatever queue of this intersection holds it.
        bool dequeue(VehicleId vehicle_id, const Intersection &intersection);

        // Empties the queues of the given directions and returns the ids in
        // FIFO order, direction by direction.
        std::vector<VehicleId> release(const Intersection &intersection, const std::vector<CompassDirection> &allowed);

        // Forget a vehicle wherever it is queued.
        void purgeVehicle(VehicleId vehicle_id);
        // Drops the queues of a removed intersection.
        void purgeIntersection(std::size_t index);

        std::size_t queueLength(const Intersection &intersection, CompassDirection direction) const;
        std::size_t totalQueued(const Intersection &intersection) const;
        std::size_t totalQueued() const;
        std::vector<VehicleId> queuedVehicles(const Intersection &intersection) const;
        std::optional<QueuePosition> queueOf(VehicleId vehicle_id) const;
        bool isQueued(VehicleId vehicle_id) const;

        void clear();

    private:
        IntersectionQueues &slotFor(std::size_t index);
        const IntersectionQueues *findSlot(std::size_t index) const;

        std::vector<IntersectionQueues> slots;
        std::unordered_map<VehicleId, QueuePosition> membership;
    };

} // namespace signalnet

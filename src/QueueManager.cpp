#include "QueueManager.hpp"

#include <algorithm>

namespace signalnet
{
    IntersectionQueues &QueueManager::slotFor(std::size_t index)
    {
        if (index >= slots.size())
        {
            slots.resize(index + 1);
        }
        return slots[index];
    }

    const IntersectionQueues *QueueManager::findSlot(std::size_t index) const
    {
        return index < slots.size() ? &slots[index] : nullptr;
    }

    bool QueueManager::enqueue(const NetworkState &state, const Vehicle &vehicle, const Intersection &intersection)
    {
        auto existing = membership.find(vehicle.id);
        if (existing != membership.end() && existing->second.slot == intersection.index)
        {
            return true;
        }

        const RouteSegment *next = departingSegment(vehicle, intersection.id);
        if (!next)
        {
            return false;
        }
        const Road *road = findRoad(state, next->road_id);
        if (!road)
        {
            return false;
        }

        // Still listed elsewhere: a stale entry from an intersection it left.
        if (existing != membership.end())
        {
            purgeVehicle(vehicle.id);
        }

        slotFor(intersection.index).by_direction[directionIndex(road->direction)].push_back(vehicle.id);
        membership[vehicle.id] = QueuePosition{intersection.index, road->direction};
        return true;
    }

    bool QueueManager::dequeue(VehicleId vehicle_id, const Intersection &intersection)
    {
        auto it = membership.find(vehicle_id);
        if (it == membership.end() || it->second.slot != intersection.index)
        {
            return false;
        }

        auto &queue = slotFor(intersection.index).by_direction[directionIndex(it->second.direction)];
        queue.erase(std::remove(queue.begin(), queue.end(), vehicle_id), queue.end());
        membership.erase(it);
        return true;
    }

    std::vector<VehicleId> QueueManager::release(const Intersection &intersection,
                                                 const std::vector<CompassDirection> &allowed)
    {
        std::vector<VehicleId> released;
        if (intersection.index >= slots.size())
        {
            return released;
        }

        IntersectionQueues &queues = slots[intersection.index];
        for (CompassDirection direction : allowed)
        {
            auto &queue = queues.by_direction[directionIndex(direction)];
            while (!queue.empty())
            {
                released.push_back(queue.front());
                membership.erase(queue.front());
                queue.pop_front();
            }
        }
        return released;
    }

    void QueueManager::purgeVehicle(VehicleId vehicle_id)
    {
        auto it = membership.find(vehicle_id);
        if (it == membership.end())
        {
            return;
        }

        if (it->second.slot < slots.size())
        {
            auto &queue = slots[it->second.slot].by_direction[directionIndex(it->second.direction)];
            queue.erase(std::remove(queue.begin(), queue.end(), vehicle_id), queue.end());
        }
        membership.erase(it);
    }

    void QueueManager::purgeIntersection(std::size_t index)
    {
        if (index >= slots.size())
        {
            return;
        }

        for (auto &queue : slots[index].by_direction)
        {
            for (VehicleId id : queue)
            {
                membership.erase(id);
            }
            queue.clear();
        }
    }

    std::size_t QueueManager::queueLength(const Intersection &intersection, CompassDirection direction) const
    {
        const IntersectionQueues *queues = findSlot(intersection.index);
        return queues ? queues->by_direction[directionIndex(direction)].size() : 0;
    }

    std::size_t QueueManager::totalQueued(const Intersection &intersection) const
    {
        const IntersectionQueues *queues = findSlot(intersection.index);
        return queues ? queues->total() : 0;
    }

    std::size_t QueueManager::totalQueued() const
    {
        return membership.size();
    }

    std::vector<VehicleId> QueueManager::queuedVehicles(const Intersection &intersection) const
    {
        std::vector<VehicleId> ids;
        if (const IntersectionQueues *queues = findSlot(intersection.index))
        {
            for (const auto &queue : queues->by_direction)
            {
                ids.insert(ids.end(), queue.begin(), queue.end());
            }
        }
        return ids;
    }

    std::optional<QueuePosition> QueueManager::queueOf(VehicleId vehicle_id) const
    {
        auto it = membership.find(vehicle_id);
        if (it == membership.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool QueueManager::isQueued(VehicleId vehicle_id) const
    {
        return membership.count(vehicle_id) != 0;
    }

    void QueueManager::clear()
    {
        slots.clear();
        membership.clear();
    }

} // namespace signalnet

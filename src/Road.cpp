#include "greenwave/Road.hpp"

#include <utility>

namespace greenwave
{
    Road::Road(RoadId id, Point2 start, Point2 end)
        : road_id(id), start_point(start), end_point(end), road_length(distance(start, end))
    {
    }

    void Road::enqueue(Vehicle vehicle)
    {
        vehicle.position = positionAt(vehicle.x);
        queue.push_back(std::move(vehicle));
    }

    Vehicle Road::dequeueFront()
    {
        Vehicle lead = std::move(queue.front());
        queue.pop_front();
        return lead;
    }

    Point2 Road::positionAt(double offset) const
    {
        return pointAlong(start_point, end_point, offset);
    }

    void Road::syncPositions()
    {
        for (auto &vehicle : queue)
        {
            vehicle.position = positionAt(vehicle.x);
        }
    }

} // namespace greenwave

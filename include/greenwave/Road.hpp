#pragma once

#include "Geometry.hpp"
#include "Vehicle.hpp"

#include <cstddef>
#include <deque>
#include <optional>

namespace greenwave
{
    // Which controller and which of its groups gives this road right-of-way.
    struct SignalBinding
    {
        std::size_t signal_index = 0;
        std::size_t group_index = 0;
    };

    class Road
    {
    public:
        Road(RoadId id, Point2 start, Point2 end);

        RoadId id() const { return road_id; }
        const Point2 &start() const { return start_point; }
        const Point2 &end() const { return end_point; }
        double length() const { return road_length; }

        // Front of the queue is the vehicle nearest to the road end.
        std::deque<Vehicle> &vehicles() { return queue; }
        const std::deque<Vehicle> &vehicles() const { return queue; }
        bool empty() const { return queue.empty(); }

        void enqueue(Vehicle vehicle);
        Vehicle dequeueFront();

        Point2 positionAt(double offset) const;
        void syncPositions();

        const std::optional<SignalBinding> &signal() const { return signal_binding; }
        void bindSignal(SignalBinding binding) { signal_binding = binding; }

    private:
        RoadId road_id;
        Point2 start_point;
        Point2 end_point;
        double road_length;
        std::deque<Vehicle> queue;
        std::optional<SignalBinding> signal_binding;
    };

} // namespace greenwave

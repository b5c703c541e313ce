#pragma once

#include "Geometry.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace greenwave
{
    struct DriverProfile
    {
        double length = 4.0;        // m
        double min_gap = 4.0;       // m, bumper-to-bumper at standstill
        double time_headway = 1.0;  // s
        double max_speed = 16.6;    // m/s
        double max_accel = 1.44;    // m/s²
        double comfort_decel = 4.61; // m/s²
    };

    struct Vehicle
    {
        uint32_t id = 0;
        std::vector<RoadId> path;
        std::size_t current_road_index = 0;

        double x = 0.0; // progress along the current road, meters from its start
        double v = 0.0;
        double a = 0.0;
        Point2 position;

        DriverProfile profile;
        double speed_cap;
        bool stopped = false;
        bool slowed = false;

        Vehicle(uint32_t vid, std::vector<RoadId> route, DriverProfile driver = DriverProfile{})
            : id(vid), path(std::move(route)), profile(driver), speed_cap(driver.max_speed) {}

        RoadId currentRoad() const { return path[current_road_index]; }
        bool hasNextRoad() const { return current_road_index + 1 < path.size(); }

        void stop(double now)
        {
            if (stopped)
                return;
            stopped = true;
            stop_started_at = now;
        }

        void unstop(double now)
        {
            if (!stopped)
                return;
            stopped = false;
            accumulated_wait += std::max(0.0, now - stop_started_at);
        }

        void slow(double factor)
        {
            slowed = true;
            speed_cap = profile.max_speed * factor;
        }

        void unslow()
        {
            slowed = false;
            speed_cap = profile.max_speed;
        }

        // Total time spent held at a stop line, including the current stop.
        double waitTime(double now) const
        {
            if (stopped)
                return accumulated_wait + std::max(0.0, now - stop_started_at);
            return accumulated_wait;
        }

    private:
        double stop_started_at = 0.0;
        double accumulated_wait = 0.0;
    };

} // namespace greenwave

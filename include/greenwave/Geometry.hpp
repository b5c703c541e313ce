#pragma once

#include <cmath>
#include <cstdint>

namespace greenwave
{
    using RoadId = uint32_t;

    struct Point2
    {
        double x = 0.0;
        double y = 0.0;
    };

    inline double distance(const Point2 &a, const Point2 &b)
    {
        return std::hypot(a.x - b.x, a.y - b.y);
    }

    // Point at `offset` along the segment from `start` towards `end`.
    inline Point2 pointAlong(const Point2 &start, const Point2 &end, double offset)
    {
        double length = distance(start, end);
        if (length <= 0.0)
        {
            return start;
        }
        double t = offset / length;
        return {start.x + (end.x - start.x) * t, start.y + (end.y - start.y) * t};
    }

} // namespace greenwave

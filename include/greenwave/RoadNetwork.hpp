#pragma once

#include "Road.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace greenwave
{
    // road id -> ids of roads whose vehicle paths cross it inside a junction
    using ConflictGraph = std::map<RoadId, std::set<RoadId>>;

    struct RoadSegment
    {
        Point2 start;
        Point2 end;
    };

    class RoadNetwork
    {
    public:
        RoadNetwork() = default;

        // Ids are assigned sequentially in insertion order.
        RoadId addRoad(Point2 start, Point2 end);
        void addRoads(const std::vector<RoadSegment> &segments);

        // Registers conflict sets. Every edge is stored in both directions.
        // Throws std::out_of_range on an unknown road id.
        void addIntersections(const ConflictGraph &intersections);

        std::size_t size() const { return road_list.size(); }
        Road &road(RoadId id);
        const Road &road(RoadId id) const;
        std::vector<Road> &roads() { return road_list; }
        const std::vector<Road> &roads() const { return road_list; }

        const ConflictGraph &conflicts() const { return conflict_graph; }

        // Conflict graph restricted to the given non-empty roads; roads left
        // without any non-empty partner are dropped.
        ConflictGraph activeConflicts(const std::set<RoadId> &non_empty) const;

        bool isValid(RoadId id) const { return id < road_list.size(); }
        void requireValid(RoadId id, const std::string &context) const;

    private:
        std::vector<Road> road_list;
        ConflictGraph conflict_graph;
    };

} // namespace greenwave

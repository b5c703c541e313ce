#include "greenwave/RoadNetwork.hpp"

#include <stdexcept>

namespace greenwave
{
    RoadId RoadNetwork::addRoad(Point2 start, Point2 end)
    {
        RoadId id = static_cast<RoadId>(road_list.size());
        road_list.emplace_back(id, start, end);
        return id;
    }

    void RoadNetwork::addRoads(const std::vector<RoadSegment> &segments)
    {
        for (const auto &segment : segments)
        {
            addRoad(segment.start, segment.end);
        }
    }

    void RoadNetwork::addIntersections(const ConflictGraph &intersections)
    {
        // Validate everything first so a bad table leaves the graph untouched.
        for (const auto &entry : intersections)
        {
            requireValid(entry.first, "intersection");
            for (RoadId other : entry.second)
            {
                requireValid(other, "intersection");
            }
        }

        for (const auto &entry : intersections)
        {
            for (RoadId other : entry.second)
            {
                if (other == entry.first)
                {
                    continue;
                }
                conflict_graph[entry.first].insert(other);
                conflict_graph[other].insert(entry.first);
            }
        }
    }

    Road &RoadNetwork::road(RoadId id)
    {
        requireValid(id, "road lookup");
        return road_list[id];
    }

    const Road &RoadNetwork::road(RoadId id) const
    {
        requireValid(id, "road lookup");
        return road_list[id];
    }

    ConflictGraph RoadNetwork::activeConflicts(const std::set<RoadId> &non_empty) const
    {
        ConflictGraph active;
        for (RoadId id : non_empty)
        {
            auto it = conflict_graph.find(id);
            if (it == conflict_graph.end())
            {
                continue;
            }

            std::set<RoadId> partners;
            for (RoadId other : it->second)
            {
                if (non_empty.count(other) > 0)
                {
                    partners.insert(other);
                }
            }
            if (!partners.empty())
            {
                active.emplace(id, std::move(partners));
            }
        }
        return active;
    }

    void RoadNetwork::requireValid(RoadId id, const std::string &context) const
    {
        if (!isValid(id))
        {
            throw std::out_of_range(context + ": road " + std::to_string(id) +
                                    " out of range (network has " + std::to_string(road_list.size()) + " roads)");
        }
    }

} // namespace greenwave

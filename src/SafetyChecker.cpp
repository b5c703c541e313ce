#include "greenwave/SafetyChecker.hpp"

namespace greenwave
{

    SafetyChecker::SafetyChecker(double safety_radius)
        : safety_radius(safety_radius)
    {
    }

    bool SafetyChecker::detectCollision(const RoadNetwork &network, const std::set<RoadId> &non_empty) const
    {
        return findCollision(network, non_empty).has_value();
    }

    std::optional<std::pair<uint32_t, uint32_t>> SafetyChecker::findCollision(const RoadNetwork &network,
                                                                            const std::set<RoadId> &non_empty) const
    {
        // Vehicles sharing a road are kept apart by the car-following model and
        // are not compared here.
        for (const auto &entry : network.activeConflicts(non_empty))
        {
            const Road &main_road = network.road(entry.first);
            for (const auto &vehicle : main_road.vehicles())
            {
                for (RoadId other_id : entry.second)
                {
                    for (const auto &other : network.road(other_id).vehicles())
                    {
                        if (distance(vehicle.position, other.position) < safety_radius)
                        {
                            return std::make_pair(vehicle.id, other.id);
                        }
                    }
                }
            }
        }
        return std::nullopt;
    }

} // namespace greenwave
